/* File: test_render.cpp
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

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "content_stream.hpp"
#include "cover_renderer.hpp"
#include "document.hpp"
#include "footer_band.hpp"
#include "output_document.hpp"
#include "overlay_renderer.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "stamp.hpp"
#include "test_pdf_factory.hpp"

using namespace pdfasm::pdf;
using pdfasm::test::Contains;
using pdfasm::test::MakePdf;
using pdfasm::test::PageText;
using pdfasm::test::ScratchPath;
using pdfasm::test::StreamData;
using pdfasm::test::WritePdf;

TEST_CASE("ContentStreamBuilder") {
  ContentStreamBuilder builder;
  REQUIRE_FALSE(builder.PaintedArea().has_value());
  builder.SaveState()
    .FillColor(RGBColor{1, 1, 1})
    .FillRect(BBox{{0, 0}, {612, 50.4}})
    .RestoreState();
  REQUIRE(builder.Str() == "q\n1 1 1 rg\n0 0 612 50.4 re f\nQ\n");
  REQUIRE(builder.UsedFonts().empty());
  REQUIRE(builder.PaintedArea()->right_top.y == Approx(50.4));

  ContentStreamBuilder text;
  text.Text(StandardFont::kHelveticaBold, 24, {10, 20}, "a(b)");
  REQUIRE(Contains(text.Str(), "/F2 24 Tf\n10 20 Td\n(a\\(b\\)) Tj\n"));
  REQUIRE(text.UsedFonts().count(StandardFont::kHelveticaBold) == 1);
  REQUIRE(text.PaintedArea()->left_bottom.y == Approx(14));
  REQUIRE(text.PaintedArea()->right_top.y == Approx(44));
}

TEST_CASE("Footer stamp") {
  const OverlayRenderer renderer;
  SECTION("Letter page") {
    const Stamp stamp = renderer.RenderFooter(FooterSpec(1, 5));
    REQUIRE(stamp.Size().Width() == Approx(kLetterWidth));
    REQUIRE(stamp.Size().Height() == Approx(kLetterHeight));
    const std::string &content = stamp.Content();
    // white band, full width, 0.7 inch
    REQUIRE(Contains(content, "1 1 1 rg\n0 0 612 50.4 re f\n"));
    // "Page 1 of 5" is 51.15pt wide, centered
    REQUIRE(Contains(content, "280.425 18 Td\n(Page 1 of 5) Tj\n"));
    REQUIRE(Contains(content, "0.5 0.5 0.5 RG\n"));
    REQUIRE(Contains(content, "36 36 m 576 36 l S\n"));
    // no title
    REQUIRE_FALSE(Contains(content, "36 18 Td"));
    REQUIRE(stamp.Page().getObjectHandle().getKey("/Resources")
              .getKey("/Font").hasKey("/F1"));
  }
  SECTION("Title") {
    const Stamp stamp =
      renderer.RenderFooter(FooterSpec(3, 12, "Quarterly (draft)"));
    REQUIRE(Contains(stamp.Content(), "36 18 Td\n(Quarterly \\(draft\\)) Tj\n"));
    REQUIRE(Contains(stamp.Content(), "(Page 3 of 12) Tj"));
  }
  SECTION("Paints only inside the band") {
    const Stamp stamp = renderer.RenderFooter(
      FooterSpec(120, 120, "A rather long report title for the band test"));
    REQUIRE(stamp.PaintedArea().has_value());
    const BBox &area = stamp.PaintedArea().value();
    REQUIRE(area.left_bottom.x >= 0);
    REQUIRE(area.left_bottom.y >= 0);
    REQUIRE(area.right_top.x <= kLetterWidth);
    REQUIRE(area.right_top.y <= kFooterBandHeight);
    REQUIRE(area.right_top.y == Approx(kFooterBandHeight));
  }
  SECTION("Non letter page") {
    const BBox a4{{0, 0}, {595, 842}};
    const Stamp stamp = renderer.RenderFooter(FooterSpec(2, 2), a4);
    REQUIRE(stamp.Size().Width() == Approx(595));
    REQUIRE(Contains(stamp.Content(), "0 0 595 50.4 re f\n"));
    REQUIRE(Contains(stamp.Content(), "36 36 m 559 36 l S\n"));
  }
  SECTION("Empty canvas") {
    REQUIRE_THROWS_AS(
      renderer.RenderFooter(FooterSpec(1, 1), BBox{{0, 0}, {0, 0}}),
      std::runtime_error);
  }
}

TEST_CASE("Cover stamp") {
  const CoverRenderer renderer;
  const Stamp cover = renderer.RenderCover("Trial A", FooterSpec(4, 9, "R"));
  REQUIRE(cover.Size().Width() == Approx(kLetterWidth));
  REQUIRE(cover.Size().Height() == Approx(kLetterHeight));
  const std::string &content = cover.Content();
  REQUIRE(Contains(content, "/F2 24 Tf\n"));
  REQUIRE(Contains(content, " 396 Td\n(Trial A) Tj\n"));
  REQUIRE(Contains(content, "(Page 4 of 9) Tj"));
  REQUIRE(Contains(content, "(R) Tj"));
  QPDFObjectHandle fonts =
    cover.Page().getObjectHandle().getKey("/Resources").getKey("/Font");
  REQUIRE(fonts.hasKey("/F1"));
  REQUIRE(fonts.hasKey("/F2"));
  REQUIRE(fonts.getKey("/F2").getKey("/BaseFont").getName() ==
          "/Helvetica-Bold");
  REQUIRE(fonts.getKey("/F1").getKey("/Encoding").getName() ==
          "/WinAnsiEncoding");
}

TEST_CASE("Overlay merge") {
  const OverlayRenderer renderer;
  SECTION("Original content is kept") {
    auto pdf = MakePdf(1, "merge");
    QPDFPageObjectHelper page(pdf->getAllPages().at(0));
    const Stamp stamp = renderer.RenderFooter(FooterSpec(1, 1));
    stamp.OverlayOnto(page);
    const std::string text = PageText(page);
    REQUIRE(text.rfind("q\n", 0) == 0);
    REQUIRE(Contains(text, "(Body merge 1) Tj"));
    REQUIRE(Contains(text, "(Old footer 1) Tj"));
    REQUIRE(Contains(text, "1 0 0 1 0 0 cm\n/Fx1 Do\nQ\n"));
    REQUIRE(Contains(text, "(Page 1 of 1) Tj"));
    // the stamp is drawn after the original content
    REQUIRE(text.find("/Fx1 Do") > text.find("(Old footer 1) Tj"));
    QPDFObjectHandle resources = page.getObjectHandle().getKey("/Resources");
    REQUIRE(resources.getKey("/Font").hasKey("/F1"));
    REQUIRE(resources.getKey("/XObject").hasKey("/Fx1"));
  }
  SECTION("Two stamps get different names") {
    auto pdf = MakePdf(1, "twice");
    QPDFPageObjectHelper page(pdf->getAllPages().at(0));
    renderer.RenderFooter(FooterSpec(1, 2)).OverlayOnto(page);
    renderer.RenderFooter(FooterSpec(2, 2)).OverlayOnto(page);
    QPDFObjectHandle xobjects =
      page.getObjectHandle().getKey("/Resources").getKey("/XObject");
    REQUIRE(xobjects.hasKey("/Fx1"));
    REQUIRE(xobjects.hasKey("/Fx2"));
  }
  SECTION("Crop box offset") {
    auto pdf = MakePdf(1, "offset", BBox{{100, 200}, {712, 992}});
    QPDFPageObjectHelper page(pdf->getAllPages().at(0));
    const auto size = VisiblePageSize(page);
    REQUIRE(size.has_value());
    REQUIRE(size->Width() == Approx(612));
    renderer.RenderFooter(FooterSpec(1, 1), size.value()).OverlayOnto(page);
    REQUIRE(Contains(PageText(page), "1 0 0 1 100 200 cm\n/Fx1 Do"));
  }
  SECTION("Page without a media box") {
    auto pdf = MakePdf(2, "nobox", BBox::Letter(), 1);
    QPDFPageObjectHelper page(pdf->getAllPages().at(0));
    REQUIRE_FALSE(VisiblePageSize(page).has_value());
    REQUIRE_FALSE(CropBoxOffsetsXY(page).has_value());
    REQUIRE_NOTHROW(renderer.RenderFooter(FooterSpec(1, 2)).OverlayOnto(page));
    const std::string text = PageText(page);
    REQUIRE(Contains(text, "(Body nobox 1) Tj"));
    REQUIRE(Contains(text, "1 0 0 1 0 0 cm\n/Fx1 Do"));
    REQUIRE(Contains(text, "(Page 1 of 2) Tj"));
  }
  SECTION("Stamp can't be merged onto itself") {
    const Stamp stamp = renderer.RenderFooter(FooterSpec(1, 1));
    QPDFPageObjectHelper own_page = stamp.Page();
    REQUIRE_THROWS_AS(stamp.OverlayOnto(own_page), std::runtime_error);
  }
}

TEST_CASE("OutputDocument") {
  const OverlayRenderer overlay;
  const CoverRenderer covers;
  const std::string dest = ScratchPath("output_document.pdf");
  std::filesystem::remove(dest);
  SECTION("Append and serialize") {
    OutputDocument output;
    {
      auto source = MakePdf(2, "out");
      for (auto &page : source->getAllPages()) {
        QPDFPageObjectHelper copied =
          output.AppendPage(QPDFPageObjectHelper(page));
        overlay.RenderFooter(FooterSpec(output.PagesCount(), 3))
          .OverlayOnto(copied);
      }
    }
    output.AppendStamp(covers.RenderCover("Cover", FooterSpec(3, 3)));
    REQUIRE(output.PagesCount() == 3);
    output.Serialize(dest, true);
    REQUIRE(output.Serialized());
    REQUIRE(std::filesystem::exists(dest));
    REQUIRE_FALSE(std::filesystem::exists(dest + ".part"));
    Document doc(DocumentSource::FromFile(dest));
    auto pages = doc.Pages();
    REQUIRE(pages.size() == 3);
    REQUIRE(Contains(PageText(pages[0]), "(Body out 1) Tj"));
    REQUIRE(Contains(PageText(pages[0]), "(Page 1 of 3) Tj"));
    REQUIRE(Contains(PageText(pages[1]), "(Page 2 of 3) Tj"));
    REQUIRE(Contains(PageText(pages[2]), "(Cover) Tj"));
    REQUIRE(Contains(PageText(pages[2]), "(Page 3 of 3) Tj"));
    // serialized only once
    REQUIRE_THROWS_AS(output.Serialize(dest, true), std::logic_error);
    REQUIRE_THROWS_AS(
      output.AppendStamp(covers.RenderCover("late", FooterSpec(1, 1))),
      std::logic_error);
  }
  SECTION("Unwritable destination") {
    OutputDocument output;
    output.AppendStamp(covers.RenderCover("Cover", FooterSpec(1, 1)));
    const std::string bad_dest = ScratchPath("no_such_dir/output.pdf");
    REQUIRE_THROWS_AS(output.Serialize(bad_dest, true), std::runtime_error);
    REQUIRE_FALSE(std::filesystem::exists(bad_dest));
    REQUIRE_FALSE(std::filesystem::exists(bad_dest + ".part"));
  }
  std::filesystem::remove(dest);
}
