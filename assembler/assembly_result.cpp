/* File: assembly_result.cpp
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

#include "assembly_result.hpp"

#include <sstream>

namespace pdfasm::assembler {

const char *RunStateName(RunState state) noexcept {
  switch (state) {
    case RunState::kNotStarted:
      return "NotStarted";
    case RunState::kCountingPages:
      return "CountingPages";
    case RunState::kEmittingMain:
      return "EmittingMain";
    case RunState::kEmittingTrials:
      return "EmittingTrials";
    case RunState::kSerializing:
      return "Serializing";
    case RunState::kSucceeded:
      return "Succeeded";
    case RunState::kFailedFatal:
      return "FailedFatal";
  }
  return "Unknown";
}

const char *ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kFatalInputError:
      return "FatalInputError";
    case ErrorKind::kRecoverableTrialError:
      return "RecoverableTrialError";
    case ErrorKind::kZeroPageCount:
      return "ZeroPageCount";
    case ErrorKind::kFatalOutputError:
      return "FatalOutputError";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

std::string Failure::ToString() const {
  std::ostringstream builder;
  builder << ErrorKindName(kind) << " in " << RunStateName(phase);
  if (trial_index) {
    builder << "(" << trial_index.value() << ")";
  }
  if (!document.empty()) {
    builder << " [" << document << "]";
  }
  builder << ": " << message;
  return builder.str();
}

}  // namespace pdfasm::assembler
