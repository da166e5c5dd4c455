/* File: test_cli.cpp
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

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "assembly_result.hpp"
#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "options.hpp"
#include "test_pdf_factory.hpp"

using namespace pdfasm::cli;
using pdfasm::assembler::AssemblyResult;
using pdfasm::assembler::ErrorKind;
using pdfasm::assembler::Failure;
using pdfasm::assembler::RunState;
using pdfasm::assembler::TotalPolicy;
using pdfasm::test::Contains;
using pdfasm::test::ScratchPath;
using pdfasm::test::WritePdf;

namespace {

// keeps the argv storage alive for the Options
class Args {
 public:
  explicit Args(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto &arg : args_) {
      ptrs_.push_back(arg.data());
    }
    ptrs_.push_back(nullptr);
    argv_ = ptrs_.data();
  }

  [[nodiscard]] int argc() const { return static_cast<int>(args_.size()); }
  char **&argv() { return argv_; }

 private:
  std::vector<std::string> args_;
  std::vector<char *> ptrs_;
  char **argv_ = nullptr;
};

std::shared_ptr<spdlog::logger> MakeLogger(std::ostringstream &stream) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
  return std::make_shared<spdlog::logger>("cli_test", sink);
}

}  // namespace

TEST_CASE("Options") {
  std::ostringstream log_stream;
  auto logger = MakeLogger(log_stream);
  SECTION("All options") {
    Args args({"pdf-assemble", "--main", "/data/report.pdf", "-t",
               "/data/t1.pdf", "/data/t2.pdf", "/data/t3.pdf", "-T",
               "Annual report", "-o", "/out/full.pdf", "--total-policy",
               "verified", "--log-level", "debug", "--log-file",
               "/var/log/asm.log"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(options.WrongParams());
    REQUIRE(options.AllMandatoryAreSet());
    REQUIRE_FALSE(options.help());
    REQUIRE(options.GetMainFile() == "/data/report.pdf");
    const std::vector<std::string> trials{"/data/t1.pdf", "/data/t2.pdf",
                                          "/data/t3.pdf"};
    REQUIRE(options.GetTrialFiles() == trials);
    REQUIRE(options.GetReportTitle() == "Annual report");
    REQUIRE(options.GetOutputFile() == "/out/full.pdf");
    REQUIRE(options.GetTotalPolicy() == TotalPolicy::kVerifiedReadable);
    REQUIRE(options.GetLogLevel() == spdlog::level::debug);
    REQUIRE(options.GetLogFile() == "/var/log/asm.log");
  }
  SECTION("Defaults") {
    Args args({"pdf-assemble", "-m", "/data/report.pdf", "/data/t1.pdf"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE(options.AllMandatoryAreSet());
    REQUIRE(options.GetReportTitle().empty());
    REQUIRE(options.GetOutputFile() == "/data/report_WithCovers.pdf");
    REQUIRE(options.GetTotalPolicy() == TotalPolicy::kBestEffort);
    REQUIRE(options.GetLogLevel() == spdlog::level::info);
    REQUIRE(options.GetLogFile().empty());
  }
  SECTION("Relative paths are resolved") {
    Args args({"pdf-assemble", "-m", "./report.pdf", "trial.pdf"});
    const Options options(args.argc(), args.argv(), logger);
    const std::string cwd = std::filesystem::current_path().string();
    REQUIRE(options.GetMainFile() == cwd + "/report.pdf");
    REQUIRE(options.GetTrialFiles().at(0) == cwd + "/trial.pdf");
  }
  SECTION("Missing trials") {
    Args args({"pdf-assemble", "-m", "/data/report.pdf"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(options.AllMandatoryAreSet());
    REQUIRE(options.help());
    REQUIRE_FALSE(options.HelpRequested());
  }
  SECTION("Missing main") {
    Args args({"pdf-assemble", "/data/t1.pdf"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(options.AllMandatoryAreSet());
  }
  SECTION("Help") {
    Args args({"pdf-assemble", "--help"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE(options.help());
    REQUIRE(options.HelpRequested());
  }
  SECTION("Unknown option") {
    Args args({"pdf-assemble", "--sign", "-m", "/data/report.pdf"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE(options.WrongParams());
    REQUIRE_FALSE(options.HelpRequested());
  }
  SECTION("Bad values") {
    Args args({"pdf-assemble", "-m", "/data/report.pdf", "/data/t1.pdf",
               "--total-policy", "sometimes", "--log-level", "loud"});
    const Options options(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(options.GetTotalPolicy().has_value());
    REQUIRE_FALSE(options.GetLogLevel().has_value());
    REQUIRE_FALSE(options.AllMandatoryAreSet());
  }
}

TEST_CASE("DefaultOutputPath") {
  REQUIRE(DefaultOutputPath("/a/b/report.pdf") ==
          "/a/b/report_WithCovers.pdf");
  REQUIRE(DefaultOutputPath("/a/b/report.v2.PDF") ==
          "/a/b/report.v2_WithCovers.pdf");
  REQUIRE(DefaultOutputPath("/a/b/report") == "/a/b/report_WithCovers.pdf");
}

TEST_CASE("File checks") {
  std::ostringstream log_stream;
  auto logger = MakeLogger(log_stream);
  const std::string good = WritePdf("cli_good.pdf", 1, "cli");
  const std::string text_file = ScratchPath("cli_text.pdf");
  {
    std::ofstream ofile(text_file, std::ios::out | std::ios::trunc);
    ofile << "just a text file, not a pdf";
  }
  SECTION("Input files") {
    REQUIRE(CheckInputFiles({good}, logger));
    REQUIRE_FALSE(CheckInputFiles({good, text_file}, logger));
    REQUIRE_FALSE(CheckInputFiles({ScratchPath("cli_missing.pdf")}, logger));
    REQUIRE_FALSE(CheckInputFiles({std::string(TEST_DIR)}, logger));
    REQUIRE(Contains(log_stream.str(), "Not a pdf file"));
  }
  SECTION("Output directory") {
    REQUIRE(CheckOutputDir(TEST_DIR, logger));
    REQUIRE_FALSE(CheckOutputDir(ScratchPath("cli_no_such_dir"), logger));
    REQUIRE_FALSE(CheckOutputDir(good, logger));
  }
  std::filesystem::remove(good);
  std::filesystem::remove(text_file);
}

TEST_CASE("Log file") {
  std::ostringstream log_stream;
  auto logger = MakeLogger(log_stream);
  const std::string log_file = ScratchPath("cli_test.log");
  std::filesystem::remove(log_file);
  REQUIRE(AddLogFile(logger, log_file));
  logger->info("written to both sinks");
  logger->flush();
  std::ifstream ifile(log_file);
  const std::string content((std::istreambuf_iterator<char>(ifile)),
                            std::istreambuf_iterator<char>());
  REQUIRE(Contains(content, "written to both sinks"));
  REQUIRE(Contains(log_stream.str(), "written to both sinks"));
  // a regular file can't be used as a directory
  REQUIRE_FALSE(AddLogFile(logger, log_file + "/nested.log"));
  std::filesystem::remove(log_file);
}

TEST_CASE("Result reporting") {
  std::ostringstream log_stream;
  auto logger = MakeLogger(log_stream);
  REQUIRE(std::string(ErrorCode(ErrorKind::kFatalInputError)) ==
          kErrMainDocument);
  REQUIRE(std::string(ErrorCode(ErrorKind::kRecoverableTrialError)) ==
          kErrTrialDocument);
  REQUIRE(std::string(ErrorCode(ErrorKind::kFatalOutputError)) ==
          kErrOutputWrite);
  REQUIRE(std::string(ErrorCode(ErrorKind::kInvalidArgument)) ==
          kErrInvalidArgument);
  SECTION("Success") {
    AssemblyResult result;
    result.status = true;
    result.output_path = "/out/full.pdf";
    result.trial_errors.push_back(
      Failure{ErrorKind::kRecoverableTrialError, RunState::kEmittingTrials,
              "/data/t1.pdf", 1, "can't open"});
    REQUIRE(ReportResult(result, logger) == 0);
    REQUIRE(Contains(log_stream.str(), kErrTrialDocument));
    REQUIRE(Contains(log_stream.str(), "/data/t1.pdf"));
  }
  SECTION("Failure") {
    AssemblyResult result;
    result.failure = Failure{ErrorKind::kFatalInputError,
                             RunState::kEmittingMain, "/data/report.pdf",
                             std::nullopt, "can't open"};
    REQUIRE(ReportResult(result, logger) == 1);
    REQUIRE(Contains(log_stream.str(), kErrMainDocument));
    REQUIRE(Contains(log_stream.str(),
                     "FatalInputError in EmittingMain [/data/report.pdf]"));
  }
}
