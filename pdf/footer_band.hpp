/* File: footer_band.hpp
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

#include "content_stream.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::pdf {

/**
 * @brief The footer shared by every generated stamp
 * @details paints, in order:
 * 1. an opaque white band over the bottom 0.7 inch of the page
 * 2. the report title at (0.5in,0.25in), if not empty
 * 3. "Page N of Total" centered at 0.25in
 * 4. a gray separator line at 0.5in, 0.5in from both edges
 * Nothing is painted above the band.
 */
class FooterBand {
public:
  /// @param page_box canvas [0,0,width,height]
  explicit FooterBand(const BBox &page_box) noexcept : page_box_(page_box) {}

  void Paint(ContentStreamBuilder &builder, const FooterSpec &spec) const;

  /// @brief the band rectangle [0,0,width,0.7in]
  [[nodiscard]] BBox Band() const noexcept;

private:
  BBox page_box_;
};

}  // namespace pdfasm::pdf
