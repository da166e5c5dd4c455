/* File: page_counter.hpp
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
#include <optional>
#include <spdlog/logger.h>

#include "document.hpp"

namespace pdfasm::pdf {

/**
 * @brief Reports the number of pages of a document source
 * @details the source is opened and released, it can be opened again later
 */
class PageCounter {
public:
  explicit PageCounter(std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Count pages
   * @return number of pages, 0 if the source can't be read (error is logged)
   */
  [[nodiscard]] size_t Count(const DocumentSource &source) const noexcept;

  /**
   * @brief Count pages
   * @return nullopt if the source can't be read, the reason in error_message
   */
  [[nodiscard]] std::optional<size_t> TryCount(
    const DocumentSource &source, std::string &error_message) const noexcept;

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pdfasm::pdf
