/* File: content_stream.hpp
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

#pragma once

#include <optional>
#include <set>
#include <sstream>
#include <string>

#include "font_metrics.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::pdf {

/**
 * @brief Builds a page content stream from graphic operators
 * @details ISO 32000 [8.2 Graphics Objects], [9.4 Text Objects]
 * Keeps track of the fonts used and of the area touched by painting
 * operators.
 */
class ContentStreamBuilder {
 public:
  ContentStreamBuilder &SaveState();
  ContentStreamBuilder &RestoreState();
  ContentStreamBuilder &FillColor(const RGBColor &color);
  ContentStreamBuilder &StrokeColor(const RGBColor &color);
  ContentStreamBuilder &LineWidth(double width);

  /// @brief re f - filled rectangle without a stroke
  ContentStreamBuilder &FillRect(const BBox &rect);

  /// @brief m l S
  ContentStreamBuilder &Line(const XYReal &from, const XYReal &to);

  /**
   * @brief BT Tf Td Tj ET
   * @param winansi_text single byte text, will be escaped
   */
  ContentStreamBuilder &Text(StandardFont font, double font_size,
                             const XYReal &pos, const std::string &winansi_text);

  [[nodiscard]] std::string Str() const { return stream_.str(); }

  [[nodiscard]] const std::set<StandardFont> &UsedFonts() const noexcept {
    return used_fonts_;
  }

  /// @brief bounding box of everything painted so far, nullopt if nothing
  [[nodiscard]] const std::optional<BBox> &PaintedArea() const noexcept {
    return painted_area_;
  }

 private:
  void Touch(const BBox &rect);

  std::ostringstream stream_;
  std::set<StandardFont> used_fonts_;
  std::optional<BBox> painted_area_;
  double line_width_ = 1;
};

/// @brief PDF resource name for the font, "/F1" or "/F2"
const char *FontResourceName(StandardFont font) noexcept;

}  // namespace pdfasm::pdf
