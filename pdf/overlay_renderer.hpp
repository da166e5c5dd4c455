/* File: overlay_renderer.hpp
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

#include "pdf_structs.hpp"
#include "stamp.hpp"

namespace pdfasm::pdf {

/**
 * @brief Renders the footer-only stamp merged on top of every copied page
 */
class OverlayRenderer {
public:
  /// @brief footer stamp on a letter sized canvas
  [[nodiscard]] Stamp RenderFooter(const FooterSpec &spec) const;

  /**
   * @brief footer stamp sized to a target page
   * @param page_size visible size of the target page [0,0,width,height]
   */
  [[nodiscard]] Stamp RenderFooter(const FooterSpec &spec,
                                   const BBox &page_size) const;
};

}  // namespace pdfasm::pdf
