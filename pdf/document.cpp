/* File: document.cpp
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

#include "document.hpp"

#include <filesystem>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <stdexcept>
#include <utility>

#include "common_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::pdf {

DocumentSource DocumentSource::FromFile(std::string path) {
  DocumentSource res;
  res.path_ = std::move(path);
  return res;
}

DocumentSource DocumentSource::FromBuffer(
  std::shared_ptr<const BytesVector> data, std::string name) {
  if (!data) {
    throw std::invalid_argument("empty buffer for document " + name);
  }
  DocumentSource res;
  res.data_ = std::move(data);
  res.name_ = std::move(name);
  return res;
}

std::string DocumentSource::Description() const {
  if (IsBuffer()) {
    return "buffer:" + name_;
  }
  return path_;
}

std::string DocumentSource::Title(size_t index) const {
  std::string res = IsBuffer() ? name_ : TitleFromPath(path_);
  if (res.empty()) {
    res = "Trial " + std::to_string(index);
  }
  return res;
}

Document::Document(DocumentSource source)
    : source_(std::move(source)), qpdf_(std::make_unique<QPDF>()) {
  Open();
}

void Document::Open() {
  namespace fs = std::filesystem;
  qpdf_->setSuppressWarnings(true);
  if (source_.IsBuffer()) {
    const auto &data = source_.Data();
    if (data->empty()) {
      throw std::logic_error("empty buffer " + source_.Description());
    }
    if (data->size() > kMaxPdfFileSize) {
      throw std::logic_error(std::string(kErrFileTooBig) + " " +
                             source_.Description());
    }
    // qpdf doesn't copy the buffer, source_ keeps it alive
    const std::string description = source_.Description();
    qpdf_->processMemoryFile(description.c_str(),
                             reinterpret_cast<const char *>(data->data()),
                             data->size());
  } else {
    const std::string &path = source_.Path();
    if (path.empty()) {
      throw std::logic_error(kErrEmptyPath);
    }
    if (!fs::exists(path)) {
      throw std::logic_error(std::string(kErrNoFile) + " " + path);
    }
    if (!fs::is_regular_file(path)) {
      throw std::logic_error("not a regular file " + path);
    }
    if (fs::file_size(path) > kMaxPdfFileSize) {
      throw std::logic_error(std::string(kErrFileTooBig) + " " + path);
    }
    qpdf_->processFile(path.c_str());
  }
  qpdf_->setImmediateCopyFrom(true);
  qpdf_->pushInheritedAttributesToPage();
}

size_t Document::PagesCount() { return qpdf_->getAllPages().size(); }

std::vector<QPDFPageObjectHelper> Document::Pages() {
  return QPDFPageDocumentHelper(*qpdf_).getAllPages();
}

std::vector<std::string> Document::TakeWarnings() {
  std::vector<std::string> res;
  for (const QPDFExc &warning : qpdf_->getWarnings()) {
    res.emplace_back(warning.what());
  }
  return res;
}

}  // namespace pdfasm::pdf
