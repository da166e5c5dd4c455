/* File: font_metrics.hpp
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

namespace pdfasm::pdf {

/// @brief Standard Type1 fonts used by the generated pages
enum class StandardFont { kHelvetica, kHelveticaBold };

/**
 * @brief PDF BaseFont name
 * @return "/Helvetica" or "/Helvetica-Bold"
 */
const char *BaseFontName(StandardFont font) noexcept;

/**
 * @brief Width of a WinAnsi encoded string
 *
 * @param text single byte WinAnsi text
 * @param font
 * @param font_size in points
 * @return double width in points
 * @details uses the AFM advance widths of the standard fonts
 */
double StringWidth(const std::string &text, StandardFont font,
                   double font_size) noexcept;

}  // namespace pdfasm::pdf
