#include <gtest/gtest.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "ChapterMaterializer.h"
#include "PdfInfo.h"
#include "PdfSource.h"
#include "PdfTextFlow.h"
#include "PdfiumHelper.hpp"
#include "SplitErrors.hpp"
#include "common/epub_fixture.hpp"
#include "common/fake_sources.hpp"

namespace chapters_tests {

namespace {

QString WriteBytes(const QTemporaryDir &dir, const QString &name, const std::vector<std::uint8_t> &bytes) {
  const QString path = dir.filePath(name);
  QFile file(path);
  if (file.open(QIODevice::WriteOnly))
    file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<qint64>(bytes.size()));
  return path;
}

// Blank Letter-size pages with an Info dictionary carrying a title and an author.
std::vector<std::uint8_t> BlankPdf(const int pageCount) {
  pdfium::Document doc;
  doc.CreateNew();
  for (int i = 0; i < pageCount; ++i) {
    pdfium::Page page;
    page.Create(doc.Get(), i, 612.0, 792.0);
  }
  return RewritePdfInfo(pdfium::SaveToBytes(doc), {{"Title", "Whole Book"}, {"Author", "Ada Author"}});
}

// Output bytes reopened through PDFium from a file beside the source.
struct OpenedPdf {
  int pages = 0;
  std::string title;
  std::string author;
};

OpenedPdf Reopen(const QTemporaryDir &dir, const QString &name, const std::vector<std::uint8_t> &bytes) {
  const pdfium::Document doc(WriteBytes(dir, name, bytes).toStdString());
  return {doc.GetPageCount(), pdfium::GetMetaText(doc, "Title"), pdfium::GetMetaText(doc, "Author")};
}

Chapter PageChapter(const std::string &title, const int start, const int end) {
  Chapter chapter;
  chapter.title = title;
  chapter.position.startUnit = start;
  chapter.position.endUnit = end;
  chapter.method = DetectionMethod::Native;
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

TEST(PdfMaterializeTest, SourceReadsBackTheBuiltDocument) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const PdfSource source(WriteBytes(dir, "book.pdf", BlankPdf(5)).toStdString());

  EXPECT_EQ(source.TotalUnits(), 5);
  EXPECT_EQ(source.Metadata().at("Title"), "Whole Book");
  EXPECT_EQ(source.Metadata().at("Author"), "Ada Author");
}

TEST(PdfMaterializeTest, ChapterPageCountsSumToSource) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const PdfSource source(WriteBytes(dir, "book.pdf", BlankPdf(10)).toStdString());
  const auto materializer = CreateMaterializer(source, OutputFormat::Same);
  ASSERT_EQ(materializer->Extension(), ".pdf");

  const std::vector<Chapter> chapters{
    PageChapter("Front", 1, 2), PageChapter("Middle", 3, 7), PageChapter("Back", 8, 10)
  };

  int total = 0;
  for (size_t i = 0; i < chapters.size(); ++i) {
    const OpenedPdf out = Reopen(dir, QString("part%1.pdf").arg(i), materializer->Materialize(chapters[i]));
    EXPECT_EQ(out.pages, chapters[i].PageCount()) << chapters[i].title;
    total += out.pages;
  }
  EXPECT_EQ(total, source.TotalUnits());
}

TEST(PdfMaterializeTest, PreservedInfoNamesTheChapter) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const PdfSource source(WriteBytes(dir, "book.pdf", BlankPdf(4)).toStdString());

  const OpenedPdf out = Reopen(dir, "intro.pdf",
                               CreateMaterializer(source, OutputFormat::Pdf)
                               ->Materialize(PageChapter("Introduction", 2, 3)));

  EXPECT_EQ(out.pages, 2);
  EXPECT_EQ(out.title, "Introduction");
  EXPECT_EQ(out.author, "Ada Author");
}

TEST(PdfMaterializeTest, DroppedInfoCarriesNothingOver) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const PdfSource source(WriteBytes(dir, "book.pdf", BlankPdf(3)).toStdString());
  MaterializeOptions options;
  options.preserveMetadata = false;

  const OpenedPdf out = Reopen(dir, "one.pdf",
                               CreateMaterializer(source, OutputFormat::Same, options)
                               ->Materialize(PageChapter("One", 1, 1)));

  EXPECT_EQ(out.pages, 1);
  EXPECT_TRUE(out.author.empty());
  EXPECT_NE(out.title, "Whole Book");
}

TEST(PdfMaterializeTest, RangeOutsideDocumentFails) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const PdfSource source(WriteBytes(dir, "book.pdf", BlankPdf(3)).toStdString());
  const auto materializer = CreateMaterializer(source, OutputFormat::Same);

  EXPECT_THROW(materializer->Materialize(PageChapter("Past the end", 3, 4)), OutputWriteError);
  EXPECT_THROW(materializer->Materialize(PageChapter("Before the start", 0, 1)), OutputWriteError);
  EXPECT_THROW(CreateMaterializer(source, OutputFormat::Epub), std::invalid_argument);
}

TEST(PdfMaterializeTest, UnreadableFileIsMalformed) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const std::string junk = "%PDF-1.7 not really";
  const QString path = WriteBytes(dir, "junk.pdf", std::vector<std::uint8_t>(junk.begin(), junk.end()));

  EXPECT_THROW(PdfSource(path.toStdString()), MalformedSourceError);
}

TEST(PdfMaterializeTest, EpubChapterFlowsIntoPdf) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const auto book = SampleEpub();
  const auto materializer = CreateMaterializer(*book, OutputFormat::Pdf);

  const OpenedPdf out = Reopen(dir, "middle.pdf",
                               materializer->Materialize(UnitChapter("The Middle", 2, "OEBPS/text/ch2.xhtml")));

  EXPECT_GE(out.pages, 1);
  EXPECT_EQ(out.title, "The Middle");
  EXPECT_EQ(out.author, "Jane Writer");
}

TEST(PdfMaterializeTest, RenderedTextSpillsOntoMorePages) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  std::string body;
  for (int i = 0; i < 200; ++i)
    body += "Paragraph " + std::to_string(i) + "\n";

  EXPECT_EQ(Reopen(dir, "short.pdf", RenderTextPdf("Short", "One line.")).pages, 1);
  EXPECT_GT(Reopen(dir, "long.pdf", RenderTextPdf("Long", body)).pages, 1);
}

TEST(PdfMaterializeTest, RenderedTextIsExtractable) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = WriteBytes(dir, "text.pdf", RenderTextPdf("Heading", "Body words here."));

  const pdfium::Document doc(path.toStdString());
  const pdfium::Page page(doc.Get(), 0);
  const pdfium::TextPage text(page.Get());
  int chars = 0;
  {
    std::lock_guard lock(pdfium::PdfiumLibrary::Instance().Mutex());
    chars = FPDFText_CountChars(text.Get());
  }
  // title and body glyphs, plus whatever separators PDFium infers between lines
  EXPECT_GE(chars, static_cast<int>(std::string("Heading").size() + std::string("Body words here.").size()));
}

TEST(PdfInfoTest, RewritesOnlyNamedFields) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const auto rewritten = RewritePdfInfo(BlankPdf(1), {{"Title", "第一章 Renamed"}});

  const OpenedPdf out = Reopen(dir, "info.pdf", rewritten);
  EXPECT_EQ(out.pages, 1);
  EXPECT_EQ(out.title, "第一章 Renamed");
  EXPECT_EQ(out.author, "Ada Author");
}

TEST(PdfInfoTest, EmptyFieldsLeaveBytesAlone) {
  const auto bytes = BlankPdf(1);

  EXPECT_EQ(RewritePdfInfo(bytes, {}), bytes);
}

TEST(PdfInfoTest, RejectsNonPdfBuffers) {
  const std::string junk = "plain text";

  EXPECT_THROW(RewritePdfInfo(std::vector<std::uint8_t>(junk.begin(), junk.end()), {{"Title", "x"}}),
               std::runtime_error);
}

} // namespace chapters_tests
