/* File: test_common.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "common_defs.hpp"
#include "document.hpp"
#include "font_metrics.hpp"
#include "page_counter.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include "test_pdf_factory.hpp"

using namespace pdfasm::pdf;
using pdfasm::test::FileToVector;
using pdfasm::test::PdfBytes;
using pdfasm::test::ScratchPath;
using pdfasm::test::WriteBrokenPdf;
using pdfasm::test::WritePdf;

TEST_CASE("Test reading file") {
  SECTION("Test FileToVector") {
    const std::string kFile1full(ScratchPath("test_file1"));
    REQUIRE(FileToVector("") == std::nullopt);
    REQUIRE(FileToVector("/var/sadl/ff") == std::nullopt);
    std::ofstream testfile(kFile1full, std::ios::out | std::ios::trunc);
    REQUIRE(testfile.is_open());
    auto res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->empty()));
    for (int i = 0; i < 1024; ++i) {
      testfile.write("\1", 1);
    }
    testfile.flush();
    res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->size() == 1024));
    size_t counter = 0;
    for (size_t i = 0; i < res->size(); ++i) {
      counter += res.value()[i];
    }
    REQUIRE(counter == res->size());
    testfile.close();
    std::filesystem::remove(kFile1full);
  }
}

TEST_CASE("String helpers") {
  SECTION("DoubleToString10") {
    REQUIRE(DoubleToString10(1) == "1");
    REQUIRE(DoubleToString10(0.5) == "0.5");
    REQUIRE(DoubleToString10(50.4) == "50.4");
    REQUIRE(DoubleToString10(-0.0) == "0");
  }
  SECTION("Utf8ToWinAnsi") {
    REQUIRE(Utf8ToWinAnsi("Report 2024") == "Report 2024");
    REQUIRE(Utf8ToWinAnsi("caf\xC3\xA9") == "caf\xE9");
    REQUIRE(Utf8ToWinAnsi("\xE2\x82\xAC") == "\x80");
    REQUIRE(Utf8ToWinAnsi("\xE2\x80\x94") == "\x97");
    // no WinAnsi code
    REQUIRE(Utf8ToWinAnsi("\xE4\xB8\xAD") == "?");
    // truncated sequence
    REQUIRE(Utf8ToWinAnsi("a\xC3") == "a?");
    REQUIRE(Utf8ToWinAnsi("").empty());
  }
  SECTION("EscapePdfString") {
    REQUIRE(EscapePdfString("plain") == "plain");
    REQUIRE(EscapePdfString("a(b)c\\") == "a\\(b\\)c\\\\");
    REQUIRE(EscapePdfString("1\n2\r") == "1\\n2\\r");
  }
  SECTION("TitleFromPath") {
    REQUIRE(TitleFromPath("/a/b/Trial 01.pdf") == "Trial 01");
    REQUIRE(TitleFromPath("relative/Study.final.pdf") == "Study.final");
    REQUIRE(TitleFromPath("noext") == "noext");
    REQUIRE(TitleFromPath("/a/b/ALL CAPS & (x).PDF") == "ALL CAPS & (x)");
  }
}

TEST_CASE("Font metrics") {
  REQUIRE(StringWidth("", StandardFont::kHelvetica, 10) == Approx(0));
  REQUIRE(StringWidth("A", StandardFont::kHelvetica, 1000) == Approx(667));
  REQUIRE(StringWidth("A", StandardFont::kHelveticaBold, 1000) ==
          Approx(722));
  REQUIRE(StringWidth("Page 1 of 5", StandardFont::kHelvetica, 10) ==
          Approx(51.15));
  // upper half of WinAnsi
  REQUIRE(StringWidth("\x97", StandardFont::kHelvetica, 1000) ==
          Approx(1000));
  REQUIRE(StringWidth("\x97", StandardFont::kHelveticaBold, 1000) ==
          Approx(1000));
  REQUIRE(StringWidth("\xDC", StandardFont::kHelveticaBold, 1000) ==
          Approx(722));
  REQUIRE(StringWidth("\xE9", StandardFont::kHelvetica, 1000) ==
          Approx(556));
  REQUIRE(StringWidth("\xF1", StandardFont::kHelveticaBold, 1000) ==
          Approx(611));
  REQUIRE(StringWidth("\xA9", StandardFont::kHelvetica, 1000) ==
          Approx(737));
  REQUIRE(StringWidth("\x91", StandardFont::kHelvetica, 1000) ==
          Approx(222));
  REQUIRE(StringWidth("\x91", StandardFont::kHelveticaBold, 1000) ==
          Approx(278));
  REQUIRE(StringWidth(Utf8ToWinAnsi("A \u2014 \u00DC"),
                      StandardFont::kHelveticaBold, 10) ==
          Approx((722 + 278 + 1000 + 278 + 722) / 100.0));
  // control characters and undefined codes
  REQUIRE(StringWidth("\t", StandardFont::kHelvetica, 1000) == Approx(556));
  REQUIRE(StringWidth("\x81", StandardFont::kHelvetica, 1000) ==
          Approx(556));
  REQUIRE(std::string(BaseFontName(StandardFont::kHelveticaBold)) ==
          "/Helvetica-Bold");
}

TEST_CASE("FooterSpec") {
  SECTION("Valid") {
    const FooterSpec spec(3, 12, "Annual report");
    REQUIRE(spec.PageNumber() == 3);
    REQUIRE(spec.TotalPages() == 12);
    REQUIRE(spec.ReportTitle() == "Annual report");
    REQUIRE(spec.PageText() == "Page 3 of 12");
    REQUIRE(FooterSpec(1, 1).PageText() == "Page 1 of 1");
    REQUIRE(FooterSpec(1, 1).ReportTitle().empty());
  }
  SECTION("Out of range") {
    REQUIRE_THROWS_AS(FooterSpec(0, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(FooterSpec(6, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(FooterSpec(1, 0), std::invalid_argument);
  }
}

TEST_CASE("DocumentSource") {
  SECTION("File") {
    const auto source = DocumentSource::FromFile("/data/Trial 7.pdf");
    REQUIRE_FALSE(source.IsBuffer());
    REQUIRE(source.Description() == "/data/Trial 7.pdf");
    REQUIRE(source.Title(1) == "Trial 7");
  }
  SECTION("Buffer") {
    auto data = std::make_shared<const BytesVector>(PdfBytes(1, "buf"));
    const auto named = DocumentSource::FromBuffer(data, "Memory study");
    REQUIRE(named.IsBuffer());
    REQUIRE(named.Title(2) == "Memory study");
    REQUIRE(named.Description() == "buffer:Memory study");
    const auto unnamed = DocumentSource::FromBuffer(data, "");
    REQUIRE(unnamed.Title(3) == "Trial 3");
    REQUIRE_THROWS_AS(DocumentSource::FromBuffer(nullptr, "x"),
                      std::invalid_argument);
  }
}

TEST_CASE("Document") {
  SECTION("Open errors") {
    REQUIRE_THROWS_AS(Document(DocumentSource::FromFile("")),
                      std::logic_error);
    REQUIRE_THROWS_AS(Document(DocumentSource::FromFile("/var/sadl/ff.pdf")),
                      std::logic_error);
    REQUIRE_THROWS(Document(DocumentSource::FromFile(
      WriteBrokenPdf("document_broken.pdf"))));
    REQUIRE_THROWS(Document(DocumentSource::FromBuffer(
      std::make_shared<const BytesVector>(), "empty")));
  }
  SECTION("Open file") {
    const std::string path = WritePdf("document_three.pdf", 3, "doc");
    Document doc(DocumentSource::FromFile(path));
    REQUIRE(doc.PagesCount() == 3);
    REQUIRE(doc.Pages().size() == 3);
    REQUIRE(doc.Source().Path() == path);
    std::filesystem::remove(path);
  }
  SECTION("Open buffer") {
    auto data = std::make_shared<const BytesVector>(PdfBytes(2, "mem"));
    Document doc(DocumentSource::FromBuffer(data, "mem"));
    REQUIRE(doc.PagesCount() == 2);
  }
}

TEST_CASE("PageCounter") {
  const PageCounter counter;
  const std::string good = WritePdf("counter_good.pdf", 4, "count");
  const std::string broken = WriteBrokenPdf("counter_broken.pdf");
  SECTION("Count") {
    REQUIRE(counter.Count(DocumentSource::FromFile(good)) == 4);
    REQUIRE(counter.Count(DocumentSource::FromFile(broken)) == 0);
    REQUIRE(counter.Count(DocumentSource::FromFile("/var/sadl/ff.pdf")) == 0);
  }
  SECTION("Count does not consume the source") {
    const auto source = DocumentSource::FromBuffer(
      std::make_shared<const BytesVector>(PdfBytes(2, "twice")), "twice");
    REQUIRE(counter.Count(source) == 2);
    REQUIRE(counter.Count(source) == 2);
  }
  SECTION("TryCount") {
    std::string error;
    REQUIRE(counter.TryCount(DocumentSource::FromFile(good), error) == 4);
    REQUIRE(error.empty());
    REQUIRE_FALSE(
      counter.TryCount(DocumentSource::FromFile(broken), error).has_value());
    REQUIRE_FALSE(error.empty());
  }
  SECTION("TryCount reports the error without throwing") {
    const std::string missing = ScratchPath("counter_missing.pdf");
    std::string error = "stale";
    REQUIRE(noexcept(counter.TryCount(DocumentSource::FromFile(missing),
                                      error)));
    REQUIRE_FALSE(
      counter.TryCount(DocumentSource::FromFile(missing), error).has_value());
    REQUIRE(error.find(missing) != std::string::npos);
  }
  std::filesystem::remove(good);
  std::filesystem::remove(broken);
}
