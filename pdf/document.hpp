/* File: document.hpp
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

#include <memory>
#include <string>
#include <vector>

#include "pdf_defs.hpp"

namespace pdfasm::pdf {

/**
 * @brief Locator of an input document: a path or an in-memory buffer
 */
class DocumentSource {
public:
  static DocumentSource FromFile(std::string path);

  /**
   * @brief Construct a source backed by memory
   * @param data pdf bytes, shared with every Document opened from it
   * @param name display name, used for logging and for the cover title
   */
  static DocumentSource FromBuffer(std::shared_ptr<const BytesVector> data,
                                   std::string name);

  [[nodiscard]] bool IsBuffer() const noexcept { return data_ != nullptr; }
  [[nodiscard]] const std::string &Path() const noexcept { return path_; }
  [[nodiscard]] const std::string &Name() const noexcept { return name_; }
  [[nodiscard]] const std::shared_ptr<const BytesVector> &Data()
    const noexcept {
    return data_;
  }

  /// @brief path or "buffer:<name>", for messages
  [[nodiscard]] std::string Description() const;

  /**
   * @brief Cover title of the document
   * @param index 1-based position among the trials
   * @return file name without extension, buffer name or "Trial {index}"
   */
  [[nodiscard]] std::string Title(size_t index) const;

private:
  DocumentSource() = default;

  std::string path_;
  std::string name_;
  std::shared_ptr<const BytesVector> data_;
};

/**
 * @brief Read-only pdf document opened from a DocumentSource
 * @details the underlying QPDF is released when the Document is destroyed.
 * Opened documents copy objects into other QPDF instances immediately, so
 * the pages appended elsewhere do not depend on this Document.
 */
class Document {
public:
  /**
   * @brief Open a document
   * @param source
   * @throws std::logic_error if a file doesn't exist or is too big
   * @throws std::runtime_error (QPDFExc) if the pdf can't be parsed
   */
  explicit Document(DocumentSource source);

  Document(const Document &) = delete;
  Document(Document &&) = delete;
  Document &operator=(const Document &) = delete;
  Document &operator=(Document &&) = delete;
  ~Document() = default;

  [[nodiscard]] size_t PagesCount();

  /// @brief all pages in order, inherited attributes pushed down to pages
  [[nodiscard]] std::vector<QPDFPageObjectHelper> Pages();

  [[nodiscard]] const DocumentSource &Source() const noexcept {
    return source_;
  }

  /// @brief warnings collected by qpdf while reading damaged files
  [[nodiscard]] std::vector<std::string> TakeWarnings();

private:
  void Open();

  DocumentSource source_;
  std::unique_ptr<QPDF> qpdf_;
};

}  // namespace pdfasm::pdf
