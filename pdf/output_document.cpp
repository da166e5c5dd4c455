/* File: output_document.cpp
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

#include "output_document.hpp"

#include <exception>
#include <filesystem>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <stdexcept>
#include <system_error>

namespace pdfasm::pdf {

OutputDocument::OutputDocument() : qpdf_(std::make_unique<QPDF>()) {
  qpdf_->emptyPDF();
}

void OutputDocument::CheckNotSerialized(const char *func_name) const {
  if (serialized_) {
    throw std::logic_error(std::string(func_name) +
                           " the document is already serialized");
  }
}

QPDFPageObjectHelper OutputDocument::AppendPage(QPDFPageObjectHelper page) {
  CheckNotSerialized("[OutputDocument::AppendPage]");
  // a foreign page is copied by addPage
  QPDFPageDocumentHelper(*qpdf_).addPage(page, false);
  const auto &pages = qpdf_->getAllPages();
  if (pages.empty()) {
    throw std::runtime_error("[OutputDocument::AppendPage] page was not added");
  }
  return QPDFPageObjectHelper(pages.back());
}

QPDFPageObjectHelper OutputDocument::AppendStamp(const Stamp &stamp) {
  return AppendPage(stamp.Page());
}

size_t OutputDocument::PagesCount() { return qpdf_->getAllPages().size(); }

void OutputDocument::Serialize(const std::string &path,
                               bool deterministic_id) {
  namespace fs = std::filesystem;
  const std::string func_name = "[OutputDocument::Serialize] ";
  CheckNotSerialized("[OutputDocument::Serialize]");
  if (path.empty()) {
    throw std::runtime_error(func_name + "empty destination path");
  }
  const fs::path dest(path);
  fs::path temp_path = dest;
  temp_path += ".part";
  serialized_ = true;
  try {
    QPDFWriter writer(*qpdf_, temp_path.c_str());
    writer.setStaticID(deterministic_id);
    writer.write();
  } catch (const std::exception &ex) {
    std::error_code err;
    fs::remove(temp_path, err);
    throw std::runtime_error(func_name + "can't write " + path + ": " +
                             ex.what());
  }
  std::error_code err;
  fs::rename(temp_path, dest, err);
  if (err) {
    std::error_code remove_err;
    fs::remove(temp_path, remove_err);
    throw std::runtime_error(func_name + "can't move the result to " + path +
                             ": " + err.message());
  }
}

}  // namespace pdfasm::pdf
