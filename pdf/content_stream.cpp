/* File: content_stream.cpp
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

#include "content_stream.hpp"

#include <algorithm>

#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::pdf {

const char *FontResourceName(StandardFont font) noexcept {
  return font == StandardFont::kHelveticaBold ? kResFontBold : kResFontRegular;
}

ContentStreamBuilder &ContentStreamBuilder::SaveState() {
  stream_ << "q\n";
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::RestoreState() {
  stream_ << "Q\n";
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::FillColor(const RGBColor &color) {
  stream_ << color.ToString() << " rg\n";
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::StrokeColor(const RGBColor &color) {
  stream_ << color.ToString() << " RG\n";
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::LineWidth(double width) {
  line_width_ = width;
  stream_ << DoubleToString10(width) << " w\n";
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::FillRect(const BBox &rect) {
  stream_ << rect.left_bottom.ToString() << " "
          << DoubleToString10(rect.Width()) << " "
          << DoubleToString10(rect.Height()) << " re f\n";
  Touch(rect);
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::Line(const XYReal &from,
                                                 const XYReal &to) {
  stream_ << from.ToString() << " m " << to.ToString() << " l S\n";
  const double half_width = line_width_ / 2;
  Touch(BBox{{std::min(from.x, to.x) - half_width,
              std::min(from.y, to.y) - half_width},
             {std::max(from.x, to.x) + half_width,
              std::max(from.y, to.y) + half_width}});
  return *this;
}

ContentStreamBuilder &ContentStreamBuilder::Text(
  StandardFont font, double font_size, const XYReal &pos,
  const std::string &winansi_text) {
  stream_ << "BT\n"
          << FontResourceName(font) << " " << DoubleToString10(font_size)
          << " Tf\n"
          << pos.ToString() << " Td\n"
          << "(" << EscapePdfString(winansi_text) << ") Tj\n"
          << "ET\n";
  used_fonts_.insert(font);
  // the glyphs stay within [baseline,baseline+font_size] for these fonts
  // except for descenders
  const double width = StringWidth(winansi_text, font, font_size);
  const double descent = 0.25 * font_size;
  Touch(BBox{{pos.x, pos.y - descent}, {pos.x + width, pos.y + font_size}});
  return *this;
}

void ContentStreamBuilder::Touch(const BBox &rect) {
  if (!painted_area_) {
    painted_area_ = rect;
    return;
  }
  BBox &area = painted_area_.value();
  area.left_bottom.x = std::min(area.left_bottom.x, rect.left_bottom.x);
  area.left_bottom.y = std::min(area.left_bottom.y, rect.left_bottom.y);
  area.right_top.x = std::max(area.right_top.x, rect.right_top.x);
  area.right_top.y = std::max(area.right_top.y, rect.right_top.y);
}

}  // namespace pdfasm::pdf
