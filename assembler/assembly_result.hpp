/* File: assembly_result.hpp
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
#include <optional>
#include <string>
#include <vector>

namespace pdfasm::assembler {

/// @brief states of one assembly run, no transitions back
enum class RunState : uint8_t {
  kNotStarted,
  kCountingPages,
  kEmittingMain,
  kEmittingTrials,
  kSerializing,
  kSucceeded,
  kFailedFatal
};

enum class ErrorKind : uint8_t {
  kFatalInputError,        // main document can't be read, no output
  kRecoverableTrialError,  // trial skipped, the run goes on
  kZeroPageCount,          // counted as 0 pages because of a read error
  kFatalOutputError,       // destination can't be written
  kInvalidArgument         // rejected before counting
};

enum class PageKind : uint8_t { kMain, kCover, kTrial };

const char *RunStateName(RunState state) noexcept;
const char *ErrorKindName(ErrorKind kind) noexcept;

struct Failure {
  ErrorKind kind = ErrorKind::kFatalInputError;
  RunState phase = RunState::kNotStarted;
  std::string document;
  // 1-based index of the trial, if a trial is implicated
  std::optional<size_t> trial_index;
  std::string message;

  [[nodiscard]] std::string ToString() const;
};

/// @brief one page of the output document
struct EmittedPage {
  size_t sequence = 0;
  PageKind kind = PageKind::kMain;
  std::string document;
  // 1-based page number in the source document, 0 for covers
  size_t source_page = 0;
  size_t output_page = 0;
  size_t total_pages = 0;
  // cover title
  std::string title;
};

struct AssemblyResult {
  bool status = false;
  std::string output_path;
  size_t planned_total = 0;
  size_t emitted_pages = 0;
  // the footers show a total that differs from the real number of pages
  bool total_mismatch = false;
  RunState final_state = RunState::kNotStarted;
  std::optional<Failure> failure;
  std::vector<Failure> trial_errors;
  // documents that were counted as 0 pages because of read errors
  std::vector<Failure> count_errors;
  std::vector<EmittedPage> pages;
};

}  // namespace pdfasm::assembler
