#include <gtest/gtest.h>

#include <algorithm>

#include "EpubArchive.h"
#include "SplitErrors.hpp"
#include "common/epub_fixture.hpp"

namespace chapters_tests {

using chapters::MalformedSourceError;
using chapters::OutlineLeaf;
using chapters::OutlineSection;
using chapters::epub::EpubArchive;
using chapters::epub::ZipEntry;

namespace {

std::vector<ZipEntry> Without(std::vector<ZipEntry> entries, const std::string &name) {
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const ZipEntry &e) { return e.name == name; }),
                entries.end());
  return entries;
}

std::vector<ZipEntry> Replacing(std::vector<ZipEntry> entries, const std::string &name, const std::string &text) {
  for (auto &entry: entries) {
    if (entry.name == name)
      entry = Entry(name, text);
  }
  return entries;
}

} // namespace

TEST(EpubArchiveTest, ParsesPackageDocument) {
  const auto book = SampleEpub();

  EXPECT_EQ(book->PackagePath(), "OEBPS/content.opf");
  EXPECT_EQ(book->PackageDir(), "OEBPS");
  EXPECT_EQ(book->Version(), "3.0");
  EXPECT_EQ(book->Title(), "Sample Book");
  EXPECT_EQ(book->UniqueIdentifierId(), "uid");
  EXPECT_EQ(book->NavPath(), "OEBPS/nav.xhtml");
  EXPECT_EQ(book->NcxPath(), "OEBPS/toc.ncx");
  EXPECT_EQ(book->TotalUnits(), 3);
  EXPECT_EQ(book->SpineUnits().front(), "OEBPS/text/ch1.xhtml");
  EXPECT_EQ(book->SpineOrdinal("OEBPS/text/ch3.xhtml"), 3);
  EXPECT_EQ(book->SpineOrdinal("OEBPS/nav.xhtml"), 0);
}

TEST(EpubArchiveTest, KeepsMetadataAsWritten) {
  const auto book = SampleEpub();
  const auto &metadata = book->Metadata();

  const auto creator = std::find_if(metadata.begin(), metadata.end(),
                                    [](const auto &m) { return m.IsDc("creator"); });
  ASSERT_NE(creator, metadata.end());
  EXPECT_EQ(creator->qualifiedName, "dc:creator");
  EXPECT_EQ(creator->text, "Jane Writer");
  EXPECT_EQ(creator->Attribute("id"), "author");
  EXPECT_EQ(book->MetadataNamespaces().at("dc"), "http://purl.org/dc/elements/1.1/");
}

TEST(EpubArchiveTest, FindsItemsByPathOrHref) {
  const auto book = SampleEpub();

  const auto *css = book->FindItem("styles/main.css");
  ASSERT_NE(css, nullptr);
  EXPECT_EQ(css->path, "OEBPS/styles/main.css");
  EXPECT_EQ(css->mediaType, "text/css");

  const auto *pic = book->FindItem("OEBPS/images/pic.png");
  ASSERT_NE(pic, nullptr);
  EXPECT_EQ(pic->id, "pic");

  EXPECT_EQ(book->FindItem("images/missing.png"), nullptr);
  EXPECT_EQ(book->ReadItem("OEBPS/fonts/body.ttf"), std::optional<std::string>("FONTDATA"));
  EXPECT_FALSE(book->ReadItem("OEBPS/nothing").has_value());
}

TEST(EpubArchiveTest, ReadsTheTocNavNotLandmarks) {
  const auto book = SampleEpub();
  const auto outline = book->ReadOutline();

  ASSERT_TRUE(outline.has_value());
  ASSERT_EQ(outline->size(), 3u);

  const auto *first = std::get_if<OutlineSection>(&(*outline)[0]);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->title, "The Beginning");
  EXPECT_EQ(first->dest.href, "OEBPS/text/ch1.xhtml");
  ASSERT_EQ(first->children.size(), 2u);
  EXPECT_EQ(std::get<OutlineLeaf>(first->children[1]).dest.href, "OEBPS/text/ch1.xhtml#s2");

  EXPECT_EQ(std::get<OutlineLeaf>((*outline)[2]).title, "The End");
}

TEST(EpubArchiveTest, FallsBackToNcxWithoutNav) {
  auto entries = Without(SampleEpubEntries(), "OEBPS/nav.xhtml");
  const auto book = EpubArchive::FromEntries(std::move(entries), "ncx.epub");

  const auto outline = book->ReadOutline();
  ASSERT_TRUE(outline.has_value());
  ASSERT_EQ(outline->size(), 2u);
  EXPECT_EQ(std::get<OutlineLeaf>((*outline)[1]).title, "NCX Two");
  EXPECT_EQ(std::get<OutlineLeaf>((*outline)[1]).dest.href, "OEBPS/text/ch2.xhtml");
}

TEST(EpubArchiveTest, FindsPackageWithoutContainer) {
  const auto book = EpubArchive::FromEntries(Without(SampleEpubEntries(), "META-INF/container.xml"), "x.epub");
  EXPECT_EQ(book->PackagePath(), "OEBPS/content.opf");
  EXPECT_EQ(book->TotalUnits(), 3);
}

TEST(EpubArchiveTest, RejectsUnusableArchives) {
  EXPECT_THROW(EpubArchive::FromEntries(Without(Without(SampleEpubEntries(), "META-INF/container.xml"),
                                                "OEBPS/content.opf"), "x.epub"),
               MalformedSourceError);

  const std::string emptySpine =
      "<?xml version=\"1.0\"?><package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\">"
      "<metadata/><manifest/><spine/></package>";
  EXPECT_THROW(EpubArchive::FromEntries(Replacing(SampleEpubEntries(), "OEBPS/content.opf", emptySpine), "x.epub"),
               MalformedSourceError);

  EXPECT_THROW(EpubArchive::FromBytes({'n', 'o', 't', 'z', 'i', 'p'}, "x.epub"), MalformedSourceError);
}

TEST(EpubArchiveTest, SurvivesAZipRoundTrip) {
  const auto bytes = chapters::epub::WriteZip(SampleEpubEntries());

  const auto entries = chapters::epub::ReadZip(bytes);
  ASSERT_FALSE(entries.empty());
  EXPECT_EQ(entries.front().name, "mimetype");

  const auto book = EpubArchive::FromBytes(bytes, "roundtrip.epub");
  EXPECT_EQ(book->Title(), "Sample Book");
  EXPECT_EQ(book->ReadItem("OEBPS/images/pic.png"), std::optional<std::string>("PNGDATA"));
}

} // namespace chapters_tests
