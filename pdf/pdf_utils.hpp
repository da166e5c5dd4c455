/* File: pdf_utils.hpp
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

#include <cstdint>
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::pdf {
/**
 * @brief Return double as string with max 10 digits after point
 * @param val
 * @return std::string
 */
std::string DoubleToString10(double val);

/**
 * @brief Return the size of visible page rectangle [0,0,width,height]
 * @param page
 * @return BBox [0,0,width,height]
 */
std::optional<BBox> VisiblePageSize(QPDFPageObjectHelper &page) noexcept;

/**
 * @brief Return horizontal and vertical offset of cropbox
 * @param page
 * @return XYReal
 */
std::optional<XYReal> CropBoxOffsetsXY(QPDFPageObjectHelper &page) noexcept;

/**
 * @brief Convert UTF-8 string to the single byte WinAnsi encoding
 * @details code points that have no WinAnsi representation and broken
 * sequences are replaced with '?'
 */
std::string Utf8ToWinAnsi(const std::string &utf8);

/**
 * @brief Escape a byte string for a PDF literal string (...)
 * @details ISO 32000 [7.3.4.2 Literal Strings]
 */
std::string EscapePdfString(const std::string &val);

/**
 * @brief File name without directories and without the last extension
 * @param path
 * @return std::string "/a/b/Trial 01.pdf" -> "Trial 01"
 */
std::string TitleFromPath(const std::string &path);

}  // namespace pdfasm::pdf
