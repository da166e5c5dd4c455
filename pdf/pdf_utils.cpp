/* File: pdf_utils.cpp
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

#include "pdf_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::pdf {

std::string DoubleToString10(double val) {
  std::ostringstream builder;
  builder << std::setprecision(10) << std::fixed << val;
  std::string res = builder.str();
  res.erase(res.find_last_not_of('0') + 1, std::string::npos);
  if (res.back() == '.') {
    res.pop_back();
  }
  if (res == "-0") {
    res = "0";
  }
  return res;
}

/**
 * @brief Return page rect
 * @param page
 * @return BBox
 */
std::optional<BBox> VisiblePageSize(QPDFPageObjectHelper &page) noexcept {
  try {
    QPDFObjectHandle page_obj = page.getObjectHandle();
    if (page_obj.isNull() || !page_obj.isPageObject()) {
      return std::nullopt;
    }
    auto media_box = page.getMediaBox();
    if (!media_box.isArray()) {
      return std::nullopt;
    }
    auto crop_box = page.getCropBox();
    if (!crop_box.isRectangle()) {
      return std::nullopt;
    }
    auto crop_box_rect = crop_box.getArrayAsRectangle();
    BBox res;
    res.left_bottom.x = 0;
    res.left_bottom.y = 0;
    res.right_top.x = crop_box_rect.urx - crop_box_rect.llx;
    res.right_top.y = crop_box_rect.ury - crop_box_rect.lly;
    if (res.right_top.x <= 0 || res.right_top.y <= 0) {
      return std::nullopt;
    }
    return res;
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    return std::nullopt;
  }
}

/**
 * @brief Return horizontal and vertical offset of cropbox
 * @param page
 * @return XYReal
 */
std::optional<XYReal> CropBoxOffsetsXY(QPDFPageObjectHelper &page) noexcept {
  try {
    auto crop_box = page.getCropBox();
    if (!crop_box.isRectangle()) {
      return std::nullopt;
    }
    auto crop_box_rect = crop_box.getArrayAsRectangle();
    return XYReal{crop_box_rect.llx, crop_box_rect.lly};
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    return std::nullopt;
  }
}

namespace {

// code points placed in 0x80..0x9F by WinAnsiEncoding
const std::map<uint32_t, unsigned char> &WinAnsiExtras() {
  static const std::map<uint32_t, unsigned char> extras{
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84},
    {0x2026, 0x85}, {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88},
    {0x2030, 0x89}, {0x0160, 0x8A}, {0x2039, 0x8B}, {0x0152, 0x8C},
    {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92}, {0x201C, 0x93},
    {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B},
    {0x0153, 0x9C}, {0x017E, 0x9E}, {0x0178, 0x9F}};
  return extras;
}

}  // namespace

std::string Utf8ToWinAnsi(const std::string &utf8) {
  std::string res;
  res.reserve(utf8.size());
  size_t pos = 0;
  while (pos < utf8.size()) {
    const auto lead = static_cast<unsigned char>(utf8[pos]);
    size_t len = 0;
    uint32_t code_point = 0;
    if (lead < 0x80) {
      len = 1;
      code_point = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      len = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      code_point = lead & 0x07;
    } else {
      res.push_back('?');
      ++pos;
      continue;
    }
    if (pos + len > utf8.size()) {
      res.push_back('?');
      break;
    }
    bool broken = false;
    for (size_t i = 1; i < len; ++i) {
      const auto cont = static_cast<unsigned char>(utf8[pos + i]);
      if ((cont & 0xC0) != 0x80) {
        broken = true;
        break;
      }
      code_point = (code_point << 6) | (cont & 0x3F);
    }
    if (broken) {
      res.push_back('?');
      ++pos;
      continue;
    }
    pos += len;
    if (code_point < 0x80 || (code_point >= 0xA0 && code_point <= 0xFF)) {
      res.push_back(static_cast<char>(code_point));
      continue;
    }
    const auto &extras = WinAnsiExtras();
    auto it_extra = extras.find(code_point);
    res.push_back(it_extra != extras.cend() ? static_cast<char>(it_extra->second)
                                            : '?');
  }
  return res;
}

std::string EscapePdfString(const std::string &val) {
  std::string res;
  res.reserve(val.size() + 8);
  for (const char symbol : val) {
    switch (symbol) {
      case '(':
      case ')':
      case '\\':
        res.push_back('\\');
        res.push_back(symbol);
        break;
      case '\r':
        res.append("\\r");
        break;
      case '\n':
        res.append("\\n");
        break;
      default:
        res.push_back(symbol);
    }
  }
  return res;
}

std::string TitleFromPath(const std::string &path) {
  return std::filesystem::path(path).stem().string();
}

}  // namespace pdfasm::pdf
