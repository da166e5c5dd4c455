/* File: document_assembler.hpp
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

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <vector>

#include "assembly_plan.hpp"
#include "assembly_result.hpp"
#include "cover_renderer.hpp"
#include "document.hpp"
#include "output_document.hpp"
#include "overlay_renderer.hpp"
#include "page_counter.hpp"

namespace pdfasm::assembler {

struct AssemblerOptions {
  TotalPolicy total_policy = TotalPolicy::kBestEffort;
  // static /ID in the output, for reproducible files
  bool deterministic_id = false;
};

/**
 * @brief Builds one pdf from the main document and the trial documents
 * @details two passes: all documents are counted first, then the main
 * pages, and for every trial a cover page followed by the trial pages, are
 * stamped with "Page N of Total" and appended to the output document.
 * A trial that can't be read is skipped, a main document that can't be
 * read aborts the run. Nothing is written unless the run succeeds.
 */
class DocumentAssembler {
public:
  explicit DocumentAssembler(AssemblerOptions options = {},
                             std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Run the assembly
   *
   * @param main main document
   * @param trials trial documents in the output order
   * @param report_title printed in every footer, may be empty
   * @param output_path destination file
   * @return AssemblyResult status=true if the file was written
   */
  [[nodiscard]] AssemblyResult Assemble(
    const pdf::DocumentSource &main,
    const std::vector<pdf::DocumentSource> &trials,
    const std::string &report_title, const std::string &output_path);

  [[nodiscard]] RunState State() const noexcept { return state_; }

private:
  void SetState(RunState state, size_t trial_index = 0);

  /**
   * @brief Reject the arguments which make the run pointless
   * @throws std::invalid_argument
   */
  static void CheckArguments(const pdf::DocumentSource &main,
                             const std::vector<pdf::DocumentSource> &trials,
                             const std::string &output_path);

  /**
   * @brief Stamp and append every page of the document
   * @throws std::exception on any read, render or copy failure
   */
  void EmitPages(const PlannedDocument &planned, PageKind kind,
                 const std::string &report_title, PageCursor &cursor,
                 pdf::OutputDocument &output, AssemblyResult &result);

  /// @throws std::exception if the cover can't be rendered or appended
  void EmitCover(const PlannedDocument &planned,
                 const std::string &report_title, PageCursor &cursor,
                 pdf::OutputDocument &output, AssemblyResult &result);

  AssemblyResult &Fail(AssemblyResult &result, ErrorKind kind,
                       const std::string &document,
                       const std::string &message);

  AssemblerOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
  pdf::PageCounter counter_;
  pdf::OverlayRenderer overlay_;
  pdf::CoverRenderer cover_;
  RunState state_ = RunState::kNotStarted;
};

}  // namespace pdfasm::assembler
