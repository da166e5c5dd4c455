/* File: page_counter.cpp
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

#include "page_counter.hpp"

#include <exception>
#include <new>
#include <utility>

#include "logger_utils.hpp"

namespace pdfasm::pdf {

PageCounter::PageCounter(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
  if (!logger_) {
    logger_ = logger::InitLog();
  }
}

std::optional<size_t> PageCounter::TryCount(
  const DocumentSource &source, std::string &error_message) const noexcept {
  try {
    Document doc(source);
    return doc.PagesCount();
  } catch (const std::exception &ex) {
    // copying the message may throw too
    try {
      error_message = ex.what();
    } catch (const std::bad_alloc & /*ex*/) {
      error_message.clear();
    }
  }
  return std::nullopt;
}

size_t PageCounter::Count(const DocumentSource &source) const noexcept {
  std::string error_message;
  auto res = TryCount(source, error_message);
  if (res) {
    if (logger_) {
      logger_->debug("counted {} pages in \"{}\"", res.value(),
                     source.Description());
    }
    return res.value();
  }
  if (logger_) {
    logger_->error("can't count pages of \"{}\", counted as 0: {}",
                   source.Description(), error_message);
  }
  return 0;
}

}  // namespace pdfasm::pdf
