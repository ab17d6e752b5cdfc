#include <gtest/gtest.h>

#include <stdexcept>

#include "FilenameGenerator.h"
#include "textutils.h"

namespace chapters_tests {

using namespace chapters;

namespace {

Chapter PageChapter(const std::string &title, const int start, const int end) {
  Chapter chapter;
  chapter.title = title;
  chapter.position.startUnit = start;
  chapter.position.endUnit = end;
  return chapter;
}

Chapter UnitChapter(const std::string &title, const int ordinal, const std::string &unitPath) {
  Chapter chapter;
  chapter.title = title;
  chapter.position.startUnit = ordinal;
  chapter.position.endUnit = ordinal;
  chapter.position.unitPath = unitPath;
  chapter.method = DetectionMethod::Manifest;
  return chapter;
}

} // namespace

TEST(SanitizeFilenameTest, RemovesPathAndDriveSeparators) {
  const std::string name = SanitizeFilename("Chapter 1: Intro/Overview");

  EXPECT_EQ(name.find('/'), std::string::npos);
  EXPECT_EQ(name.find(':'), std::string::npos);
  EXPECT_EQ(name, "Chapter_1_Intro_Overview");
}

TEST(SanitizeFilenameTest, TruncatesLongTitles) {
  EXPECT_LE(SanitizeFilename(std::string(150, 'A'), 100).size(), 100u);
  EXPECT_EQ(SanitizeFilename(std::string(150, 'A'), 100), std::string(100, 'A'));
}

TEST(SanitizeFilenameTest, TruncatesByCodePoint) {
  std::string title;
  for (int i = 0; i < 20; ++i)
    title += "第一章";

  const std::string name = SanitizeFilename(title, 10);
  EXPECT_EQ(count_code_points(name), 10u);
  EXPECT_EQ(name.substr(0, 9), "第一章");
}

TEST(SanitizeFilenameTest, IsIdempotent) {
  for (const std::string title: {"Chapter 1: Intro/Overview", "  a  <b>  c  ", "Part_II__*Notes*", "???"}) {
    const std::string once = SanitizeFilename(title);
    EXPECT_EQ(SanitizeFilename(once), once) << title;
  }
}

TEST(SanitizeFilenameTest, NeverEmpty) {
  EXPECT_EQ(SanitizeFilename(""), "untitled");
  EXPECT_EQ(SanitizeFilename("  ??  "), "untitled");
  EXPECT_EQ(SanitizeFilename("___"), "untitled");
}

TEST(SanitizeFilenameTest, TrimsCutAtUnderscore) {
  EXPECT_EQ(SanitizeFilename("abcd efgh", 5), "abcd");
}

TEST(EnforceExtensionTest, ReplacesKnownExtensions) {
  EXPECT_EQ(EnforceExtension("intro.PDF", ".epub"), "intro.epub");
  EXPECT_EQ(EnforceExtension("intro.epub", ".pdf"), "intro.pdf");
  EXPECT_EQ(EnforceExtension("intro", ".pdf"), "intro.pdf");
  EXPECT_EQ(EnforceExtension("v1.2", ".pdf"), "v1.2.pdf");
}

TEST(FilenameGeneratorTest, DefaultPattern) {
  FilenameGenerator gen(kDefaultFilenamePattern, SourceKind::Paginated, ".pdf");

  EXPECT_EQ(gen.Generate(PageChapter("Introduction", 1, 9), 1), "01_Introduction.pdf");
  EXPECT_EQ(gen.Generate(PageChapter("Chapter 1: Methods", 10, 30), 12), "12_Chapter_1_Methods.pdf");
}

TEST(FilenameGeneratorTest, PageFields) {
  FilenameGenerator gen("{title}_p{start:03d}-{end}_{pages:4d}", SourceKind::Paginated, ".pdf");

  EXPECT_EQ(gen.Generate(PageChapter("Intro", 5, 12), 1), "Intro_p005-12_   8.pdf");
}

TEST(FilenameGeneratorTest, FileFieldUsesUnitStem) {
  FilenameGenerator gen("{index}-{file}", SourceKind::Archive, ".epub", "sample");

  EXPECT_EQ(gen.Generate(UnitChapter("Two", 2, "OEBPS/text/chapter_two.xhtml"), 2), "2-chapter_two.epub");

  Chapter whole = UnitChapter("Complete Document", 1, "OEBPS/text/ch1.xhtml");
  whole.method = DetectionMethod::Fallback;
  EXPECT_EQ(gen.Generate(whole, 1), "1-sample.epub");
}

TEST(FilenameGeneratorTest, BraceEscapes) {
  FilenameGenerator gen("{{{index}}}_{title}", SourceKind::Paginated, ".pdf");

  EXPECT_EQ(gen.Generate(PageChapter("A", 1, 1), 3), "{3}_A.pdf");
}

TEST(FilenameGeneratorTest, ReplacesExtensionTypedInPattern) {
  FilenameGenerator gen("{title}.pdf", SourceKind::Archive, ".epub");

  EXPECT_EQ(gen.Generate(UnitChapter("Intro", 1, "OEBPS/a.xhtml"), 1), "Intro.epub");
}

TEST(FilenameGeneratorTest, CollisionsGetNumericSuffix) {
  FilenameGenerator gen("{title}", SourceKind::Paginated, ".pdf");

  EXPECT_EQ(gen.Generate(PageChapter("Notes", 1, 2), 1), "Notes.pdf");
  EXPECT_EQ(gen.Generate(PageChapter("Notes", 3, 4), 2), "Notes_2.pdf");
  EXPECT_EQ(gen.Generate(PageChapter("Notes", 5, 6), 3), "Notes_3.pdf");
  EXPECT_EQ(gen.Generate(PageChapter("Notes_2", 7, 8), 4), "Notes_2_2.pdf");
}

TEST(FilenameGeneratorTest, RejectsUnknownPlaceholders) {
  EXPECT_THROW(FilenameGenerator("{chapter}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{file}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{start}", SourceKind::Archive, ".epub"), std::invalid_argument);
}

TEST(FilenameGeneratorTest, RejectsMalformedPatterns) {
  EXPECT_THROW(FilenameGenerator("{index", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("index}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{index:x}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{title:02d}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{index:99999999999d}_{title}", SourceKind::Paginated, ".pdf"),
               std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{index:2000000000d}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
  EXPECT_THROW(FilenameGenerator("{index:0256d}", SourceKind::Paginated, ".pdf"), std::invalid_argument);
}

TEST(FilenameGeneratorTest, AcceptsWidestField) {
  FilenameGenerator gen("{index:0255d}", SourceKind::Paginated, ".pdf");

  EXPECT_EQ(gen.Generate(PageChapter("A", 1, 1), 7), std::string(254, '0') + "7.pdf");
}

} // namespace chapters_tests
