#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include "ZipIo.h"
#include "common/epub_fixture.hpp"
#include "splitapp.h"

namespace chapters_tests {

using chapters::SplitApp;

namespace {

struct AppRun {
  int code = -1;
  QString out;
  QString err;
};

AppRun Run(const QStringList &args, QString input = {}) {
  AppRun run;
  QTextStream out(&run.out);
  QTextStream err(&run.err);
  QTextStream in(&input);
  SplitApp app(out, err, in);
  run.code = app.run(QStringList{"chaptersplitter"} + args);
  out.flush();
  err.flush();
  return run;
}

// A book written to disk as a real .epub file.
QString WriteSampleEpub(const QTemporaryDir &dir,
                        const std::vector<chapters::epub::ZipEntry> &entries = SampleEpubEntries()) {
  const QString path = dir.filePath("sample.epub");
  const auto bytes = chapters::epub::WriteZip(entries);
  QFile file(path);
  if (file.open(QIODevice::WriteOnly))
    file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<qint64>(bytes.size()));
  return path;
}

} // namespace

TEST(SplitAppTest, HelpSucceeds) {
  const AppRun run = Run({"--help"});

  EXPECT_EQ(run.code, chapters::ExitSuccess);
  EXPECT_TRUE(run.out.contains("preview"));
}

TEST(SplitAppTest, UsageErrors) {
  EXPECT_EQ(Run({}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"split"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"merge", "book.pdf"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"split", "a.pdf", "b.pdf"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"split", "book.pdf", "--bogus"}).code, chapters::ExitUsage);
}

TEST(SplitAppTest, InvalidOptionValuesAreUsageErrors) {
  EXPECT_EQ(Run({"preview", "book.pdf", "--strategy", "smart"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"preview", "book.pdf", "--sensitivity", "max"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"preview", "book.pdf", "--level", "two"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"preview", "book.pdf", "--format", "docx"}).code, chapters::ExitUsage);
  EXPECT_EQ(Run({"preview", "book.pdf", "--config", "/nonexistent/chapters.ini"}).code, chapters::ExitUsage);
}

TEST(SplitAppTest, MissingInputFails) {
  const AppRun run = Run({"preview", "/nonexistent/book.pdf"});

  EXPECT_EQ(run.code, chapters::ExitFailure);
  EXPECT_TRUE(run.err.contains("file not found"));
}

TEST(SplitAppTest, PreviewPrintsDetection) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString book = WriteSampleEpub(dir);

  const AppRun run = Run({"preview", book});

  EXPECT_EQ(run.code, chapters::ExitSuccess) << run.err.toStdString();
  EXPECT_TRUE(run.out.contains("Detection Strategy: native"));
  EXPECT_TRUE(run.out.contains("Total Content Files: 3"));
  EXPECT_TRUE(run.out.contains("Has TOC: Yes"));
  EXPECT_TRUE(run.out.contains("The Middle"));
  EXPECT_FALSE(QDir(dir.filePath("sample_chapters")).exists());
}

TEST(SplitAppTest, SplitWritesChapterFiles) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString book = WriteSampleEpub(dir);
  const QString outDir = dir.filePath("out");

  const AppRun run = Run({"split", book, "-o", outDir, "--strategy", "manifest"});

  EXPECT_EQ(run.code, chapters::ExitSuccess) << run.err.toStdString();
  EXPECT_TRUE(run.out.contains("✅ Wrote"));

  const QStringList files = QDir(outDir).entryList({"*.epub"}, QDir::Files, QDir::Name);
  EXPECT_EQ(files.size(), 3);
  for (const auto &file: files)
    EXPECT_TRUE(chapters::epub::EpubArchive::Open(QDir(outDir).filePath(file).toStdString())->TotalUnits() >= 1);
}

TEST(SplitAppTest, OversizedPatternWidthIsUsageError) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString book = WriteSampleEpub(dir);
  const QString outDir = dir.filePath("out");

  const AppRun run = Run({"split", book, "-o", outDir, "--strategy", "manifest", "--pattern",
                          "{index:99999999999d}_{title}"});

  EXPECT_EQ(run.code, chapters::ExitUsage);
  EXPECT_TRUE(run.err.contains("Field width"));
  EXPECT_FALSE(QDir(outDir).exists());
}

TEST(SplitAppTest, DeclinedPromptWritesNothing) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  // Without a usable table of contents native detection falls back to the
  // whole document, which asks before writing.
  auto entries = SampleEpubEntries();
  for (auto &entry: entries) {
    if (entry.name == "OEBPS/nav.xhtml")
      entry = Entry(entry.name, "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body/></html>");
    if (entry.name == "OEBPS/toc.ncx")
      entry = Entry(entry.name, "<ncx xmlns=\"http://www.daisy.org/z3986/2005/ncx/\"><navMap/></ncx>");
  }
  const QString book = WriteSampleEpub(dir, entries);
  const QString outDir = dir.filePath("out");

  const AppRun run = Run({"split", book, "-o", outDir, "--strategy", "native"}, "n\n");

  EXPECT_EQ(run.code, chapters::ExitAborted);
  EXPECT_TRUE(run.out.contains("Proceed with split?"));
  EXPECT_FALSE(QDir(outDir).exists());
}

} // namespace chapters_tests
