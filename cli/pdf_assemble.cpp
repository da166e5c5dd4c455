/* File: pdf_assemble.cpp
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

#include <libintl.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clocale>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include "cli_utils.hpp"
#include "document.hpp"
#include "document_assembler.hpp"
#include "options.hpp"
#include "tr.hpp"

int main(int argc, char* argv[]) {
  using pdfasm::cli::tr;
  using pdfasm::cli::trs;
  // setup the transtlator
  if (setlocale(LC_ALL, "") == nullptr) {  // NOLINT
    std::cerr << "Failed to set locale.\n";
    return 1;
  }
  bindtextdomain(TRANSLATION_DOMAIN, TRANSLATIONS_INSTALL_DIR);
  bind_textdomain_codeset(TRANSLATION_DOMAIN, "UTF-8");
  textdomain(TRANSLATION_DOMAIN);
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stderr_color_mt(TRANSLATION_DOMAIN);
    if (!console) {
      std::cerr << pdfasm::cli::tr("Setup logger failed");
      return 1;
    }
    const pdfasm::cli::Options options(argc, argv, console);
    if (options.help()) {
      return options.HelpRequested() ? 0 : 1;
    }
    console->set_level(options.GetLogLevel().value_or(spdlog::level::info));
    const std::string log_file = options.GetLogFile();
    if (!log_file.empty() && !pdfasm::cli::AddLogFile(console, log_file)) {
      return 1;
    }
    // ----------------
    // check the files
    const std::string main_file = options.GetMainFile();
    if (!pdfasm::cli::CheckInputFiles({main_file}, console)) {
      console->error(tr("The main document is not OK"));
      return 1;
    }
    const std::vector<std::string> trial_files = options.GetTrialFiles();
    for (const auto& trial_file : trial_files) {
      // a bad trial is skipped by the assembler, its cover stays
      if (!pdfasm::cli::CheckInputFiles({trial_file}, console)) {
        console->warn(trs("The trial document will be skipped") + " " +
                      trial_file);
      }
    }
    const std::string output_file = options.GetOutputFile();
    const std::string output_dir =
      std::filesystem::path(output_file).parent_path().string();
    if (!pdfasm::cli::CheckOutputDir(output_dir, console)) {
      console->error(tr("Output directory is not OK"));
      return 1;
    }
    // ----------------
    // assemble
    pdfasm::assembler::AssemblerOptions assembler_options;
    assembler_options.total_policy =
      options.GetTotalPolicy().value_or(
        pdfasm::assembler::TotalPolicy::kBestEffort);
    pdfasm::assembler::DocumentAssembler assembler(assembler_options, console);
    std::vector<pdfasm::pdf::DocumentSource> trials;
    trials.reserve(trial_files.size());
    for (const auto& trial_file : trial_files) {
      trials.push_back(pdfasm::pdf::DocumentSource::FromFile(trial_file));
    }
    const pdfasm::assembler::AssemblyResult result = assembler.Assemble(
      pdfasm::pdf::DocumentSource::FromFile(main_file), trials,
      options.GetReportTitle(), output_file);
    return pdfasm::cli::ReportResult(result, console);
  } catch (const std::exception& ex) {
    std::cerr << pdfasm::cli::tr("Error:") << ex.what() << "\n";
    return 1;
  }
  return 0;
}
