/* File: pdf_structs.cpp
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


#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include <iomanip>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
namespace pdfasm::pdf {

std::string XYReal::ToString() const {
  std::ostringstream builder;
  builder << DoubleToString10(x) << " " << DoubleToString10(y);
  return builder.str();
}

std::string BBox::ToString() const {
  std::ostringstream builder;
  builder << "[ " << left_bottom.ToString() << " " << right_top.ToString()
          << " ]";
  return builder.str();
}

std::string Matrix::toString() const {
  std::ostringstream builder;
  builder << DoubleToString10(a) << " " << DoubleToString10(b) << " "
          << DoubleToString10(c) << " " << DoubleToString10(d) << " "
          << DoubleToString10(e) << " " << DoubleToString10(f);
  return builder.str();
}

std::string RGBColor::ToString() const {
  std::ostringstream builder;
  builder << DoubleToString10(red) << " " << DoubleToString10(green) << " "
          << DoubleToString10(blue);
  return builder.str();
}

FooterSpec::FooterSpec(size_t page_number, size_t total_pages,
                       std::string report_title)
  : page_number_(page_number),
    total_pages_(total_pages),
    report_title_(std::move(report_title)) {
  if (page_number_ == 0 || page_number_ > total_pages_) {
    throw std::invalid_argument(
      "[FooterSpec] page number " + std::to_string(page_number_) +
      " is out of range 1.." + std::to_string(total_pages_));
  }
}

std::string FooterSpec::PageText() const {
  std::ostringstream builder;
  builder << "Page " << page_number_ << " of " << total_pages_;
  return builder.str();
}

}  // namespace pdfasm::pdf
