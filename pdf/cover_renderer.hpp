/* File: cover_renderer.hpp
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

#include <string>

#include "pdf_structs.hpp"
#include "stamp.hpp"

namespace pdfasm::pdf {

/**
 * @brief Renders the letter sized cover page placed before a trial document
 * @details the title is drawn with Helvetica-Bold 24pt, centered
 * horizontally at the middle of the page height, the page gets the usual
 * footer
 */
class CoverRenderer {
public:
  /**
   * @param title UTF-8 text, not sanitized
   * @param spec footer of the cover page
   */
  [[nodiscard]] Stamp RenderCover(const std::string &title,
                                  const FooterSpec &spec) const;
};

}  // namespace pdfasm::pdf
