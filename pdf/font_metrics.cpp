/* File: font_metrics.cpp
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

#include "font_metrics.hpp"

#include <array>
#include <cstddef>

#include "pdf_defs.hpp"

namespace pdfasm::pdf {

namespace {

constexpr unsigned char kFirstChar = 32;
constexpr unsigned char kLastChar = 126;
constexpr size_t kTableSize = kLastChar - kFirstChar + 1;
constexpr unsigned char kFirstUpperChar = 128;
constexpr size_t kUpperTableSize = 128;
// control characters and the codes WinAnsi leaves undefined
constexpr int kDefaultWidth = 556;
constexpr double kUnitsPerEm = 1000;

using WidthTable = std::array<int, kTableSize>;
using UpperWidthTable = std::array<int, kUpperTableSize>;

// Helvetica.afm, codes 32..126
constexpr WidthTable kHelveticaWidths{
  278, 278, 355,  556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333,
  278, 278, 556,  556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278,
  584, 584, 584,  556, 1015, 667, 667, 722, 722, 667, 611, 778, 722, 278,
  500, 667, 556,  833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
  667, 667, 611,  278, 278, 278, 469, 556, 333, 556, 556, 500, 556, 556,
  278, 556, 556,  222, 222, 500, 222, 833, 556, 556, 556, 556, 333, 500,
  278, 556, 500,  722, 500, 500, 500, 334, 260, 334, 584};

// Helvetica-Bold.afm, codes 32..126
constexpr WidthTable kHelveticaBoldWidths{
  278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333,
  278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333,
  584, 584, 584, 611, 975, 722, 722, 722, 722, 667, 611, 778, 722, 278,
  556, 722, 611, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
  667, 667, 611, 333, 278, 333, 584, 556, 333, 556, 611, 556, 611, 556,
  333, 611, 611, 278, 278, 556, 278, 889, 611, 611, 611, 611, 389, 556,
  333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

// Helvetica.afm, WinAnsi codes 128..255
constexpr UpperWidthTable kHelveticaUpperWidths{
  556, 556, 222, 556, 333, 1000, 556, 556, 333, 1000, 667, 333, 1000, 556,
  611, 556, 556, 222, 222, 333, 333, 350, 556, 1000, 333, 1000, 500, 333,
  944, 556, 500, 667, 278, 333, 556, 556, 556, 556, 260, 556, 333, 737,
  370, 556, 584, 333, 737, 333, 400, 584, 333, 333, 333, 556, 537, 278,
  333, 333, 365, 556, 834, 834, 834, 611, 667, 667, 667, 667, 667, 667,
  1000, 722, 667, 667, 667, 667, 278, 278, 278, 278, 722, 722, 778, 778,
  778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611, 556, 556,
  556, 556, 556, 556, 889, 500, 556, 556, 556, 556, 278, 278, 278, 278,
  556, 556, 556, 556, 556, 556, 556, 584, 611, 556, 556, 556, 556, 500,
  556, 500};

// Helvetica-Bold.afm, WinAnsi codes 128..255
constexpr UpperWidthTable kHelveticaBoldUpperWidths{
  556, 556, 278, 556, 500, 1000, 556, 556, 333, 1000, 667, 333, 1000, 556,
  611, 556, 556, 278, 278, 500, 500, 350, 556, 1000, 333, 1000, 556, 333,
  944, 556, 500, 667, 278, 333, 556, 556, 556, 556, 280, 556, 333, 737,
  370, 556, 584, 333, 737, 333, 400, 584, 333, 333, 333, 611, 556, 278,
  333, 333, 365, 556, 834, 834, 834, 611, 722, 722, 722, 722, 722, 722,
  1000, 722, 667, 667, 667, 667, 278, 278, 278, 278, 722, 722, 778, 778,
  778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611, 556, 556,
  556, 556, 556, 556, 889, 556, 556, 556, 556, 556, 278, 278, 278, 278,
  611, 611, 611, 611, 611, 611, 611, 584, 611, 611, 611, 611, 611, 556,
  611, 556};

const UpperWidthTable &UpperWidths(StandardFont font) noexcept {
  return font == StandardFont::kHelveticaBold ? kHelveticaBoldUpperWidths
                                              : kHelveticaUpperWidths;
}

const WidthTable &Widths(StandardFont font) noexcept {
  return font == StandardFont::kHelveticaBold ? kHelveticaBoldWidths
                                              : kHelveticaWidths;
}

}  // namespace

const char *BaseFontName(StandardFont font) noexcept {
  return font == StandardFont::kHelveticaBold ? kFontHelveticaBold
                                              : kFontHelvetica;
}

double StringWidth(const std::string &text, StandardFont font,
                   double font_size) noexcept {
  const WidthTable &widths = Widths(font);
  const UpperWidthTable &upper_widths = UpperWidths(font);
  double units = 0;
  for (const char symbol : text) {
    const auto code = static_cast<unsigned char>(symbol);
    if (code >= kFirstChar && code <= kLastChar) {
      units += widths[code - kFirstChar];
    } else if (code >= kFirstUpperChar) {
      units += upper_widths[code - kFirstUpperChar];
    } else {
      units += kDefaultWidth;
    }
  }
  return units / kUnitsPerEm * font_size;
}

}  // namespace pdfasm::pdf
