/* File: document_assembler.cpp
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

#include "document_assembler.hpp"

#include <spdlog/sinks/null_sink.h>

#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "logger_utils.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::assembler {

namespace {

std::shared_ptr<spdlog::logger> LoggerOrDefault(
  std::shared_ptr<spdlog::logger> logger) {
  if (!logger) {
    logger = logger::InitLog();
  }
  if (!logger) {
    logger = std::make_shared<spdlog::logger>(
      "pdfasm_null", std::make_shared<spdlog::sinks::null_sink_mt>());
  }
  return logger;
}

bool SamePath(const std::string &lhs, const std::string &rhs) {
  namespace fs = std::filesystem;
  std::error_code err;
  const fs::path lhs_path = fs::weakly_canonical(lhs, err);
  if (err) {
    return lhs == rhs;
  }
  const fs::path rhs_path = fs::weakly_canonical(rhs, err);
  if (err) {
    return lhs == rhs;
  }
  return lhs_path == rhs_path;
}

}  // namespace

DocumentAssembler::DocumentAssembler(AssemblerOptions options,
                                     std::shared_ptr<spdlog::logger> logger)
    : options_(options),
      logger_(LoggerOrDefault(std::move(logger))),
      counter_(logger_) {}

void DocumentAssembler::SetState(RunState state, size_t trial_index) {
  state_ = state;
  if (state == RunState::kEmittingTrials) {
    logger_->info("run state: {}({})", RunStateName(state), trial_index);
    return;
  }
  logger_->info("run state: {}", RunStateName(state));
}

void DocumentAssembler::CheckArguments(
  const pdf::DocumentSource &main,
  const std::vector<pdf::DocumentSource> &trials,
  const std::string &output_path) {
  if (output_path.empty()) {
    throw std::invalid_argument("empty output path");
  }
  auto check_source = [&output_path](const pdf::DocumentSource &source) {
    if (source.IsBuffer()) {
      return;
    }
    if (source.Path().empty()) {
      throw std::invalid_argument("empty input path");
    }
    if (SamePath(source.Path(), output_path)) {
      throw std::invalid_argument("output path is the same as the input " +
                                  source.Path());
    }
  };
  check_source(main);
  for (const auto &trial : trials) {
    check_source(trial);
  }
}

AssemblyResult &DocumentAssembler::Fail(AssemblyResult &result,
                                        ErrorKind kind,
                                        const std::string &document,
                                        const std::string &message) {
  result.status = false;
  result.failure =
    Failure{kind, state_, document, std::nullopt, message};
  logger_->error("run failed: {}", result.failure->ToString());
  SetState(RunState::kFailedFatal);
  result.final_state = state_;
  return result;
}

AssemblyResult DocumentAssembler::Assemble(
  const pdf::DocumentSource &main,
  const std::vector<pdf::DocumentSource> &trials,
  const std::string &report_title, const std::string &output_path) {
  AssemblyResult result;
  result.output_path = output_path;
  state_ = RunState::kNotStarted;
  try {
    CheckArguments(main, trials, output_path);
  } catch (const std::invalid_argument &ex) {
    return Fail(result, ErrorKind::kInvalidArgument, {}, ex.what());
  }
  // ----------------
  // count
  SetState(RunState::kCountingPages);
  std::vector<Failure> issues;
  std::unique_ptr<const Plan> plan_holder;
  std::unique_ptr<pdf::OutputDocument> output_holder;
  try {
    plan_holder = std::make_unique<const Plan>(Plan::Build(
      main, trials, options_.total_policy, counter_, issues));
    output_holder = std::make_unique<pdf::OutputDocument>();
  } catch (const std::exception &ex) {
    return Fail(result, ErrorKind::kFatalOutputError, output_path,
                ex.what());
  }
  const Plan &plan = *plan_holder;
  pdf::OutputDocument &output = *output_holder;
  for (auto &issue : issues) {
    logger_->error("{}", issue.ToString());
    if (issue.kind == ErrorKind::kRecoverableTrialError) {
      result.trial_errors.push_back(std::move(issue));
    } else {
      result.count_errors.push_back(std::move(issue));
    }
  }
  result.planned_total = plan.TotalPages();
  logger_->info("planned total {} pages: main {} pages, {} trials",
                plan.TotalPages(), plan.Main().counted_pages,
                plan.Trials().size());
  PageCursor cursor(plan.TotalPages());
  // ----------------
  // main document
  SetState(RunState::kEmittingMain);
  try {
    EmitPages(plan.Main(), PageKind::kMain, report_title, cursor, output,
              result);
  } catch (const std::exception &ex) {
    return Fail(result, ErrorKind::kFatalInputError,
                plan.Main().source.Description(), ex.what());
  }
  // ----------------
  // trials
  for (const PlannedDocument &trial : plan.Trials()) {
    SetState(RunState::kEmittingTrials, trial.trial_index);
    try {
      EmitCover(trial, report_title, cursor, output, result);
    } catch (const std::exception &ex) {
      // the cover is generated, failing here means the output is unusable
      return Fail(result, ErrorKind::kFatalOutputError,
                  trial.source.Description(), ex.what());
    }
    try {
      EmitPages(trial, PageKind::kTrial, report_title, cursor, output,
                result);
    } catch (const std::exception &ex) {
      Failure failure{ErrorKind::kRecoverableTrialError, state_,
                      trial.source.Description(), trial.trial_index,
                      ex.what()};
      logger_->error("trial skipped: {}", failure.ToString());
      result.trial_errors.push_back(std::move(failure));
    }
  }
  // ----------------
  // write
  SetState(RunState::kSerializing);
  try {
    result.emitted_pages = output.PagesCount();
    result.total_mismatch = result.emitted_pages != result.planned_total;
    if (result.total_mismatch) {
      logger_->warn("the footers show {} pages total, the document has {}",
                    result.planned_total, result.emitted_pages);
    }
    output.Serialize(output_path, options_.deterministic_id);
  } catch (const std::exception &ex) {
    return Fail(result, ErrorKind::kFatalOutputError, output_path,
                ex.what());
  }
  SetState(RunState::kSucceeded);
  result.status = true;
  result.final_state = state_;
  logger_->info("written {} pages to {}", result.emitted_pages, output_path);
  return result;
}

void DocumentAssembler::EmitCover(const PlannedDocument &planned,
                                  const std::string &report_title,
                                  PageCursor &cursor,
                                  pdf::OutputDocument &output,
                                  AssemblyResult &result) {
  const pdf::FooterSpec spec = cursor.Spec(report_title);
  const pdf::Stamp cover = cover_.RenderCover(planned.title, spec);
  output.AppendStamp(cover);
  cursor.Advance();
  EmittedPage emitted{result.pages.size() + 1,
                      PageKind::kCover,
                      planned.source.Description(),
                      0,
                      spec.PageNumber(),
                      spec.TotalPages(),
                      planned.title};
  logger_->info("cover emitted seq={} title=\"{}\" output_page={}/{}",
                emitted.sequence, emitted.title, emitted.output_page,
                emitted.total_pages);
  result.pages.push_back(std::move(emitted));
}

void DocumentAssembler::EmitPages(const PlannedDocument &planned,
                                  PageKind kind,
                                  const std::string &report_title,
                                  PageCursor &cursor,
                                  pdf::OutputDocument &output,
                                  AssemblyResult &result) {
  // the document is released when leaving this scope, the copied pages
  // don't depend on it. The stamps are merged into this in-memory copy,
  // the file itself is never written.
  pdf::Document doc(planned.source);
  for (const auto &warning : doc.TakeWarnings()) {
    logger_->warn("\"{}\": {}", planned.source.Description(), warning);
  }
  const std::string description = planned.source.Description();
  size_t source_page = 0;
  for (auto &page : doc.Pages()) {
    ++source_page;
    const pdf::FooterSpec spec = cursor.Spec(report_title);
    const pdf::BBox page_size =
      pdf::VisiblePageSize(page).value_or(pdf::BBox::Letter());
    const pdf::Stamp footer = overlay_.RenderFooter(spec, page_size);
    // stamp first, a page that can't be stamped never reaches the output
    footer.OverlayOnto(page);
    output.AppendPage(page);
    cursor.Advance();
    EmittedPage emitted{result.pages.size() + 1,
                        kind,
                        description,
                        source_page,
                        spec.PageNumber(),
                        spec.TotalPages(),
                        {}};
    logger_->info(
      "page emitted seq={} source=\"{}\" source_page={} output_page={}/{}",
      emitted.sequence, emitted.document, emitted.source_page,
      emitted.output_page, emitted.total_pages);
    result.pages.push_back(std::move(emitted));
  }
}

}  // namespace pdfasm::assembler
