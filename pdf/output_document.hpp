/* File: output_document.hpp
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

#include "pdf_defs.hpp"
#include "stamp.hpp"

namespace pdfasm::pdf {

/**
 * @brief Append-only pdf accumulating the finished pages
 * @details serialized exactly once, no pages can be added after that
 */
class OutputDocument {
public:
  OutputDocument();

  OutputDocument(const OutputDocument &) = delete;
  OutputDocument(OutputDocument &&) = delete;
  OutputDocument &operator=(const OutputDocument &) = delete;
  OutputDocument &operator=(OutputDocument &&) = delete;
  ~OutputDocument() = default;

  /**
   * @brief Copy a page from another document to the end
   * @param page foreign page
   * @return QPDFPageObjectHelper the copy, owned by this document
   * @throws std::logic_error if already serialized
   */
  QPDFPageObjectHelper AppendPage(QPDFPageObjectHelper page);

  /**
   * @brief Append the stamp page as a standalone page
   * @throws std::logic_error if already serialized
   */
  QPDFPageObjectHelper AppendStamp(const Stamp &stamp);

  [[nodiscard]] size_t PagesCount();

  [[nodiscard]] bool Serialized() const noexcept { return serialized_; }

  /**
   * @brief Write the document
   * @details the file is written next to the destination and renamed,
   * nothing is left at the destination on failure
   * @param path destination
   * @param deterministic_id use a static /ID (reproducible output)
   * @throws std::runtime_error on write failure
   * @throws std::logic_error if called twice
   */
  void Serialize(const std::string &path, bool deterministic_id);

private:
  void CheckNotSerialized(const char *func_name) const;

  std::unique_ptr<QPDF> qpdf_;
  bool serialized_ = false;
};

}  // namespace pdfasm::pdf
