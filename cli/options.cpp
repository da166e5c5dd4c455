/* File: options.cpp
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

#include "options.hpp"

#include "tr.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace pdfasm::cli {

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_(tr("Allowed options")) {
  description_.add_options()
    // clang-format off
      (kHelpTag, tr("produce this help message"))
      (kMainTag, po::value<std::string>(), tr("main document"))
      (kTrialTag, po::value<std::vector<std::string>>(), tr("trial document, can be repeated"))
      (kTitleTag, po::value<std::string>(), tr("report title printed in every footer"))
      (kOutputTag, po::value<std::string>(), tr("output file (default: <main>_WithCovers.pdf)"))
      (kTotalPolicyTagL, po::value<std::string>()->default_value(kPolicyBestEffort), tr("best-effort or verified"))
      (kLogFileTagL, po::value<std::string>(), tr("write the log to this file too"))
      (kLogLevelTagL, po::value<std::string>()->default_value("info"), tr("trace, debug, info, warn or error"));
  // clang-format on
  try {
    pos_opt_desc_.add(kTrialTagL, -1);
    po::store(po::command_line_parser(argc, argv)
                .options(description_)
                .positional(pos_opt_desc_)
                .run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    boost::wrapexcept<boost::program_options::invalid_command_line_syntax>
      & /*ex*/) {
    log_->error(tr("Wrong parameters, see --help"));
    wrong_params_ = true;
  } catch (boost::wrapexcept<boost::program_options::unknown_option> &ex) {
    log_->error(trs("Unknown option passed.") + ex.what());
    wrong_params_ = true;
  } catch (
    const boost::wrapexcept<boost::program_options::ambiguous_option> &ex) {
    wrong_params_ = true;
    log_->error(
      tr("Ambiguous option passed,use - for short options and -- "
         "for full otions,--help for help"));
  } catch (const po::error &ex) {
    log_->error(trs("Wrong parameters:") + " " + ex.what());
    wrong_params_ = true;
  }
}

bool Options::help() const {
  if (var_map_.empty() || var_map_.count(kHelpTagL) > 0 || wrong_params_ ||
      !AllMandatoryAreSet()) {
    std::cout << tr("A tool for assembling a report with its trial documents")
              << "\n";
    // clang-format off
    std::cout << tr("Usage") << ": "
              << TRANSLATION_DOMAIN << " "
              << "--main report.pdf"
              << " --title \"Annual report\""
              << " --output ./report_full.pdf"
              << " trial1.pdf trial2.pdf\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

bool Options::HelpRequested() const {
  return !wrong_params_ && var_map_.count(kHelpTagL) > 0;
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  std::string current_path = std::filesystem::current_path();
  current_path += "/";
  const char *home = getenv("HOME");  // NOLINT
  std::string home_path = home != nullptr ? home : "";
  home_path += "/";
  if (local_path.empty() || local_path == ".") {
    local_path = std::filesystem::current_path();
  }
  if (boost::starts_with(local_path, "./")) {
    boost::replace_first(local_path, "./", current_path);
  }
  if (boost::starts_with(local_path, "~/")) {
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
  }
  local_path = fs_path;
  return local_path;
}

bool Options::AllMandatoryAreSet() const {
  if (var_map_.count(kMainTagL) == 0) {
    log_->error(tr("No main document is set"));
    return false;
  }
  if (var_map_.at(kMainTagL).as<std::string>().empty()) {
    log_->error(tr("Empty path to the main document"));
    return false;
  }
  if (var_map_.count(kTrialTagL) == 0) {
    log_->error(tr("No trial documents are set"));
    return false;
  }
  if (!GetTotalPolicy()) {
    log_->error(trs("Unknown total policy, expected") + " " +
                kPolicyBestEffort + " " + trs("or") + " " + kPolicyVerified);
    return false;
  }
  if (!GetLogLevel()) {
    log_->error(tr("Unknown log level"));
    return false;
  }
  if (var_map_.count(kOutputTagL) > 0 &&
      var_map_.at(kOutputTagL).as<std::string>().empty()) {
    log_->error(tr("Empty output file name"));
    return false;
  }
  return true;
}

std::string Options::GetMainFile() const {
  if (var_map_.count(kMainTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kMainTagL).as<std::string>());
}

std::vector<std::string> Options::GetTrialFiles() const {
  if (var_map_.count(kTrialTagL) > 0) {
    auto files_list = var_map_.at(kTrialTagL).as<std::vector<std::string>>();
    std::for_each(
      files_list.begin(), files_list.end(),
      [this](std::string &file_name) { file_name = ResolvePath(file_name); });
    return files_list;
  }
  return {};
}

std::string Options::GetReportTitle() const {
  if (var_map_.count(kTitleTagL) == 0) {
    return {};
  }
  return var_map_.at(kTitleTagL).as<std::string>();
}

std::string Options::GetOutputFile() const {
  if (var_map_.count(kOutputTagL) > 0) {
    return ResolvePath(var_map_.at(kOutputTagL).as<std::string>());
  }
  const std::string main_file = GetMainFile();
  if (main_file.empty()) {
    return {};
  }
  return DefaultOutputPath(main_file);
}

std::optional<assembler::TotalPolicy> Options::GetTotalPolicy() const {
  if (var_map_.count(kTotalPolicyTagL) == 0) {
    return assembler::TotalPolicy::kBestEffort;
  }
  const std::string val = var_map_.at(kTotalPolicyTagL).as<std::string>();
  if (val == kPolicyBestEffort) {
    return assembler::TotalPolicy::kBestEffort;
  }
  if (val == kPolicyVerified) {
    return assembler::TotalPolicy::kVerifiedReadable;
  }
  return std::nullopt;
}

std::string Options::GetLogFile() const {
  if (var_map_.count(kLogFileTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kLogFileTagL).as<std::string>());
}

std::optional<spdlog::level::level_enum> Options::GetLogLevel() const {
  if (var_map_.count(kLogLevelTagL) == 0) {
    return spdlog::level::info;
  }
  const std::string val = var_map_.at(kLogLevelTagL).as<std::string>();
  const spdlog::level::level_enum level = spdlog::level::from_str(val);
  // from_str returns off for unknown names
  if (level == spdlog::level::off && val != "off") {
    return std::nullopt;
  }
  return level;
}

std::string DefaultOutputPath(const std::string &main_file) {
  std::filesystem::path res(main_file);
  res.replace_extension();
  res += kOutputSuffix;
  return res.string();
}

}  // namespace pdfasm::cli
