#include <gtest/gtest.h>

#include "ManifestFallback.h"
#include "common/fake_sources.hpp"

namespace chapters_tests {

TEST(UnitTitleTest, PrefersTitleThenHeadings) {
  EXPECT_EQ(UnitTitle("x.xhtml", Xhtml("Real Title", "<h1>Heading</h1>")), "Real Title");
  EXPECT_EQ(UnitTitle("x.xhtml", Xhtml("", "<h2>Second</h2><h1>First</h1>")), "First");
  EXPECT_EQ(UnitTitle("x.xhtml", Xhtml("  ", "<h2>  Only   h2 </h2>")), "Only h2");
}

TEST(UnitTitleTest, FallsBackToTheFileStem) {
  EXPECT_EQ(UnitTitle("OEBPS/text/chapter-03_the_end.xhtml", Xhtml("", "<p>x</p>")), "Chapter 03 The End");
  EXPECT_EQ(UnitTitle("OEBPS/text/appendix_b.xhtml", "<not xml"), "Appendix B");
}

TEST(ManifestFallbackTest, OneChapterPerSpineUnit) {
  FakeArchiveSource epub;
  epub.AddUnit("a", "OEBPS/a.xhtml", Xhtml("Alpha", "<p/>"));
  epub.AddUnit("b", "OEBPS/b.xhtml", Xhtml("Beta", "<p/>"));

  const auto chapters = DetectFromManifest(epub);

  ASSERT_EQ(chapters.size(), 2u);
  EXPECT_EQ(chapters[0].title, "Alpha");
  EXPECT_EQ(chapters[1].position.startUnit, 2);
  EXPECT_EQ(chapters[1].position.unitPath, "OEBPS/b.xhtml");
  EXPECT_EQ(chapters[1].method, DetectionMethod::Manifest);
  EXPECT_DOUBLE_EQ(chapters[1].confidence, 0.6);
  EXPECT_EQ(chapters[1].level, 1);
}

TEST(ManifestFallbackTest, PaginatedSourcesHaveNoManifest) {
  FakePaginatedSource pdf(3);
  EXPECT_TRUE(DetectFromManifest(pdf).empty());
}

} // namespace chapters_tests
