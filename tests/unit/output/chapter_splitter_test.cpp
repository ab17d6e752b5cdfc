#include <gtest/gtest.h>

#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "ChapterDetector.h"
#include "ChapterSplitter.h"
#include "common/epub_fixture.hpp"
#include "common/fake_sources.hpp"

namespace chapters_tests {

namespace {

SplitOptions OptionsInto(const QString &dir) {
  SplitOptions options;
  options.outputDir = dir.toStdString();
  options.pattern = "{index:02d}_{title}";
  return options;
}

DetectionResult ManifestChapters(const DocumentSource &source) {
  DetectorOptions detector;
  detector.strategy = Strategy::Manifest;
  return ChapterDetector(detector).Detect(source);
}

} // namespace

TEST(ChapterSplitterTest, OutputDirDefaultsBesideInput) {
  ChapterSplitter splitter(SplitOptions{});

  EXPECT_EQ(splitter.OutputDirFor("/books/sample.epub"), "/books/sample_chapters");
}

TEST(ChapterSplitterTest, WritesChaptersInOrder) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString outDir = dir.filePath("nested/out");
  const auto book = SampleEpub();

  ChapterSplitter splitter(OptionsInto(outDir));
  QStringList lines;
  QObject::connect(&splitter, &ChapterSplitter::log, [&](const QString &line) { lines << line; });

  const SplitReport report = splitter.Split(*book, ManifestChapters(*book));

  ASSERT_TRUE(report.success) << report.error;
  ASSERT_EQ(report.written.size(), 3u);
  EXPECT_EQ(report.written[0].index, 1);
  EXPECT_EQ(report.written[0].title, "The Beginning");
  EXPECT_EQ(QDir(outDir).entryList({"*.epub"}, QDir::Files, QDir::Name),
            (QStringList{"01_The_Beginning.epub", "02_The_Middle.epub", "03_The_End.epub"}));
  ASSERT_EQ(lines.size(), 3);
  EXPECT_TRUE(lines[0].endsWith("✅ Done."));
}

TEST(ChapterSplitterTest, StopsAtFirstWriteFailure) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString outDir = dir.filePath("out");
  // a directory where the second chapter file should go
  ASSERT_TRUE(QDir().mkpath(QDir(outDir).filePath("02_The_Middle.epub")));
  const auto book = SampleEpub();

  ChapterSplitter splitter(OptionsInto(outDir));
  const SplitReport report = splitter.Split(*book, ManifestChapters(*book));

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.failedIndex, 2);
  EXPECT_FALSE(report.error.empty());
  ASSERT_EQ(report.written.size(), 1u);
  EXPECT_FALSE(QFileInfo::exists(QDir(outDir).filePath("03_The_End.epub")));
}

TEST(ChapterSplitterTest, FailedWriteLeavesNoPartialFile) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString outDir = dir.filePath("out");
  ASSERT_TRUE(QDir().mkpath(QDir(outDir).filePath("02_The_Middle.epub")));
  const auto book = SampleEpub();

  ChapterSplitter splitter(OptionsInto(outDir));
  const SplitReport report = splitter.Split(*book, ManifestChapters(*book));

  ASSERT_FALSE(report.success);
  EXPECT_EQ(QDir(outDir).entryList(QDir::Files | QDir::Hidden | QDir::System),
            QStringList{"01_The_Beginning.epub"});
  EXPECT_TRUE(QFileInfo(QDir(outDir).filePath("02_The_Middle.epub")).isDir());
}

TEST(ChapterSplitterTest, ReplacesExistingFileWhole) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString outDir = dir.filePath("out");
  ASSERT_TRUE(QDir().mkpath(outDir));
  const QString stale = QDir(outDir).filePath("01_The_Beginning.epub");
  {
    QFile file(stale);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(QByteArray(1 << 20, 'x'));
  }
  const auto book = SampleEpub();

  ChapterSplitter splitter(OptionsInto(outDir));
  const SplitReport report = splitter.Split(*book, ManifestChapters(*book));

  ASSERT_TRUE(report.success) << report.error;
  const auto chapter = chapters::epub::EpubArchive::Open(stale.toStdString());
  EXPECT_GE(chapter->TotalUnits(), 1);
  EXPECT_LT(QFileInfo(stale).size(), 1 << 20);
}

TEST(ChapterSplitterTest, BadPatternFailsBeforeWriting) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString outDir = dir.filePath("out");
  const auto book = SampleEpub();

  SplitOptions options = OptionsInto(outDir);
  options.pattern = "{chapter}";
  ChapterSplitter splitter(options);

  EXPECT_THROW(splitter.Split(*book, ManifestChapters(*book)), std::invalid_argument);
  EXPECT_FALSE(QDir(outDir).exists());
}

} // namespace chapters_tests
