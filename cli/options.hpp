/* File: options.hpp
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

#include <spdlog/spdlog.h>

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <vector>

#include "assembly_plan.hpp"

namespace pdfasm::cli {

namespace po = boost::program_options;

const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
const char *const kMainTag = "main,m";
const char *const kMainTagL = "main";
const char *const kTrialTag = "trial,t";
const char *const kTrialTagL = "trial";
const char *const kTitleTag = "title,T";
const char *const kTitleTagL = "title";
const char *const kOutputTag = "output,o";
const char *const kOutputTagL = "output";
const char *const kTotalPolicyTagL = "total-policy";
const char *const kLogFileTagL = "log-file";
const char *const kLogLevelTagL = "log-level";

const char *const kPolicyBestEffort = "best-effort";
const char *const kPolicyVerified = "verified";
const char *const kOutputSuffix = "_WithCovers.pdf";

class Options {
 public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Print usage if asked or if the parameters are wrong
   * @return true if the usage was printed
   */
  [[nodiscard]] bool help() const;
  [[nodiscard]] bool HelpRequested() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  [[nodiscard]] std::string GetMainFile() const;
  [[nodiscard]] std::vector<std::string> GetTrialFiles() const;
  [[nodiscard]] std::string GetReportTitle() const;

  /// @brief --output or "<main without .pdf>_WithCovers.pdf"
  [[nodiscard]] std::string GetOutputFile() const;

  /// @brief nullopt if the value is not recognized
  [[nodiscard]] std::optional<assembler::TotalPolicy> GetTotalPolicy() const;

  [[nodiscard]] std::string GetLogFile() const;

  /// @brief nullopt if the value is not recognized
  [[nodiscard]] std::optional<spdlog::level::level_enum> GetLogLevel() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;

  std::shared_ptr<spdlog::logger> log_;
  po::positional_options_description pos_opt_desc_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

/**
 * @brief Default destination for the main file
 * @param main_file path to the main document
 * @return "/dir/report.pdf" -> "/dir/report_WithCovers.pdf"
 */
std::string DefaultOutputPath(const std::string &main_file);

}  // namespace pdfasm::cli
