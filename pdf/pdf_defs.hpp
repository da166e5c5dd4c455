/* File: pdf_defs.hpp
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
#include <cstddef>
#define POINTERHOLDER_TRANSITION 3 // NOLINT (cppcoreguidelines-macro-usage)
#include <cstdint>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <vector>

namespace pdfasm::pdf {
using BytesVector = std::vector<unsigned char>;

constexpr const char *const kTagType = "/Type";
constexpr const char *const kTagSubType = "/Subtype";
constexpr const char *const kTagXObject = "/XObject";
constexpr const char *const kTagFont = "/Font";
constexpr const char *const kTagType1 = "/Type1";
constexpr const char *const kTagBaseFont = "/BaseFont";
constexpr const char *const kTagEncoding = "/Encoding";
constexpr const char *const kTagWinAnsiEncoding = "/WinAnsiEncoding";
constexpr const char *const kTagResources = "/Resources";
constexpr const char *const kTagProcSet = "/ProcSet";
constexpr const char *const kTagContents = "/Contents";
constexpr const char *const kTagPage = "/Page";
constexpr const char *const kTagMediaBox = "/MediaBox";

// resource names used inside generated stamps
constexpr const char *const kResFontRegular = "/F1";
constexpr const char *const kResFontBold = "/F2";
// prefix for the stamp form XObject in the target page resources
constexpr const char *const kResStampPrefix = "/Fx";

constexpr const char *const kFontHelvetica = "/Helvetica";
constexpr const char *const kFontHelveticaBold = "/Helvetica-Bold";

// geometry, PDF units (1/72 inch)
constexpr double kInch = 72.0;
constexpr double kLetterWidth = 8.5 * kInch;  // 612
constexpr double kLetterHeight = 11 * kInch;  // 792

// footer band
constexpr double kFooterBandHeight = 0.7 * kInch;
constexpr double kFooterTextX = 0.5 * kInch;
constexpr double kFooterTextY = 0.25 * kInch;
constexpr double kFooterLineY = 0.5 * kInch;
constexpr double kFooterLineMargin = 0.5 * kInch;
constexpr double kFooterFontSize = 10;
constexpr double kFooterLineGray = 0.5;

// cover page
constexpr double kCoverTitleFontSize = 24;

constexpr const char *const kErrPageSize = "Can't determine page size";
constexpr const char *const kErrEmptyPath = "empty path to file";
constexpr const char *const kErrNoFile = "file doesn't exist";
constexpr const char *const kErrFileTooBig = "file is too big";

}  // namespace pdfasm::pdf
