/* File: assembly_plan.hpp
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
#include <cstdint>
#include <string>
#include <vector>

#include "assembly_result.hpp"
#include "document.hpp"
#include "page_counter.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::assembler {

/**
 * @brief How the total page count treats trials that can't be read
 * @details kBestEffort - every trial gets a cover, an unreadable trial
 * counts as 0 pages and the total may overstate the real number of pages
 * if a trial fails later. kVerifiedReadable - trials that can't be opened
 * while counting are excluded from the run (no cover, no contribution).
 */
enum class TotalPolicy : uint8_t { kBestEffort, kVerifiedReadable };

enum class DocumentRole : uint8_t { kMain, kTrial };

struct PlannedDocument {
  pdf::DocumentSource source;
  DocumentRole role = DocumentRole::kMain;
  // 1-based position in the caller's list of trials, 0 for main
  size_t trial_index = 0;
  // cover title, empty for main
  std::string title;
  size_t counted_pages = 0;

  /// @brief pages this document adds to the total (a trial adds its cover)
  [[nodiscard]] size_t Contribution() const noexcept {
    return role == DocumentRole::kTrial ? counted_pages + 1 : counted_pages;
  }
};

/**
 * @brief The result of counting, fixed before any page is emitted
 */
class Plan {
public:
  Plan(PlannedDocument main, std::vector<PlannedDocument> trials);

  /**
   * @brief Count every document
   * @param issues [out] documents counted as 0 (kZeroPageCount) and trials
   * excluded by kVerifiedReadable (kRecoverableTrialError)
   */
  static Plan Build(const pdf::DocumentSource &main,
                    const std::vector<pdf::DocumentSource> &trials,
                    TotalPolicy policy, const pdf::PageCounter &counter,
                    std::vector<Failure> &issues);

  [[nodiscard]] size_t TotalPages() const noexcept { return total_; }
  [[nodiscard]] const PlannedDocument &Main() const noexcept { return main_; }
  [[nodiscard]] const std::vector<PlannedDocument> &Trials() const noexcept {
    return trials_;
  }

private:
  const PlannedDocument main_;
  const std::vector<PlannedDocument> trials_;
  const size_t total_;
};

/**
 * @brief The running page number, advanced once per emitted page
 */
class PageCursor {
public:
  explicit PageCursor(size_t total_pages) noexcept
      : total_pages_(total_pages) {}

  /// @brief 1-based number of the next page
  [[nodiscard]] size_t Current() const noexcept { return emitted_ + 1; }
  [[nodiscard]] size_t Emitted() const noexcept { return emitted_; }
  [[nodiscard]] size_t TotalPages() const noexcept { return total_pages_; }

  /**
   * @brief Footer parameters for the next page
   * @throws std::logic_error if all planned pages are already emitted
   */
  [[nodiscard]] pdf::FooterSpec Spec(const std::string &report_title) const;

  void Advance() noexcept { ++emitted_; }

private:
  size_t total_pages_;
  size_t emitted_ = 0;
};

}  // namespace pdfasm::assembler
