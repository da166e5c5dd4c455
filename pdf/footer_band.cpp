/* File: footer_band.cpp
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

#include "footer_band.hpp"

#include "font_metrics.hpp"
#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::pdf {

BBox FooterBand::Band() const noexcept {
  return BBox{page_box_.left_bottom,
              {page_box_.right_top.x,
               page_box_.left_bottom.y + kFooterBandHeight}};
}

void FooterBand::Paint(ContentStreamBuilder &builder,
                       const FooterSpec &spec) const {
  const double left = page_box_.left_bottom.x;
  const double bottom = page_box_.left_bottom.y;
  const double width = page_box_.Width();
  builder.SaveState();
  builder.FillColor(RGBColor{1, 1, 1}).FillRect(Band());
  builder.FillColor(RGBColor{0, 0, 0});
  if (!spec.ReportTitle().empty()) {
    builder.Text(StandardFont::kHelvetica, kFooterFontSize,
                 {left + kFooterTextX, bottom + kFooterTextY},
                 Utf8ToWinAnsi(spec.ReportTitle()));
  }
  const std::string page_text = spec.PageText();
  const double text_width =
    StringWidth(page_text, StandardFont::kHelvetica, kFooterFontSize);
  builder.Text(StandardFont::kHelvetica, kFooterFontSize,
               {left + (width - text_width) / 2, bottom + kFooterTextY},
               page_text);
  builder.StrokeColor(
    RGBColor{kFooterLineGray, kFooterLineGray, kFooterLineGray});
  builder.LineWidth(1);
  builder.Line({left + kFooterLineMargin, bottom + kFooterLineY},
               {left + width - kFooterLineMargin, bottom + kFooterLineY});
  builder.RestoreState();
}

}  // namespace pdfasm::pdf
