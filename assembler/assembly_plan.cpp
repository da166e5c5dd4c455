/* File: assembly_plan.cpp
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

#include "assembly_plan.hpp"

#include <numeric>
#include <optional>
#include <stdexcept>
#include <utility>

namespace pdfasm::assembler {

namespace {

size_t SumContributions(const PlannedDocument &main,
                        const std::vector<PlannedDocument> &trials) {
  return std::accumulate(trials.cbegin(), trials.cend(), main.Contribution(),
                         [](size_t sum, const PlannedDocument &trial) {
                           return sum + trial.Contribution();
                         });
}

}  // namespace

Plan::Plan(PlannedDocument main, std::vector<PlannedDocument> trials)
    : main_(std::move(main)),
      trials_(std::move(trials)),
      total_(SumContributions(main_, trials_)) {}

Plan Plan::Build(const pdf::DocumentSource &main,
                 const std::vector<pdf::DocumentSource> &trials,
                 TotalPolicy policy, const pdf::PageCounter &counter,
                 std::vector<Failure> &issues) {
  std::string error;
  PlannedDocument planned_main{main, DocumentRole::kMain, 0, {}, 0};
  const std::optional<size_t> main_count = counter.TryCount(main, error);
  if (main_count) {
    planned_main.counted_pages = main_count.value();
  } else {
    issues.push_back(Failure{ErrorKind::kZeroPageCount,
                             RunState::kCountingPages, main.Description(),
                             std::nullopt, error});
  }
  std::vector<PlannedDocument> planned_trials;
  planned_trials.reserve(trials.size());
  for (size_t i = 0; i < trials.size(); ++i) {
    const size_t trial_index = i + 1;
    const pdf::DocumentSource &source = trials[i];
    error.clear();
    const std::optional<size_t> count = counter.TryCount(source, error);
    if (!count) {
      if (policy == TotalPolicy::kVerifiedReadable) {
        issues.push_back(Failure{ErrorKind::kRecoverableTrialError,
                                 RunState::kCountingPages,
                                 source.Description(), trial_index,
                                 "excluded, " + error});
        continue;
      }
      issues.push_back(Failure{ErrorKind::kZeroPageCount,
                               RunState::kCountingPages, source.Description(),
                               trial_index, error});
    }
    planned_trials.push_back(PlannedDocument{source, DocumentRole::kTrial,
                                             trial_index,
                                             source.Title(trial_index),
                                             count.value_or(0)});
  }
  return Plan(std::move(planned_main), std::move(planned_trials));
}

pdf::FooterSpec PageCursor::Spec(const std::string &report_title) const {
  if (Current() > total_pages_) {
    throw std::logic_error("page " + std::to_string(Current()) +
                           " is beyond the planned total of " +
                           std::to_string(total_pages_));
  }
  return pdf::FooterSpec(Current(), total_pages_, report_title);
}

}  // namespace pdfasm::assembler
