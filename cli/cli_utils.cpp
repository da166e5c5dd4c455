#include "cli_utils.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <ios>
#include <memory>
#include <string>

#include "common_defs.hpp"
#include "tr.hpp"

namespace pdfasm::cli {

/**
 * @brief Check all files - readable,non-empty, PDF
 *
 * @param files filenames
 * @param log logger
 * @return true if all files are ok
 * @return false if at least one file is bad
 */
bool CheckInputFiles(const std::vector<std::string>& files,
                     const std::shared_ptr<spdlog::logger>& log) {
  return std::all_of(
    files.cbegin(), files.cend(), [&log](const std::string& file) {
      try {
        if (!std::filesystem::exists(file)) {
          log->error(trs("File not found") + " " + file);
          return false;
        }
        if (!std::filesystem::is_regular_file(file)) {
          log->error(trs("This file is not a regular file") + " " + file);
          return false;
        }
        if (std::filesystem::file_size(file) < 10) {
          log->error(trs("File is empty or too small") + " " + file);
          return false;
        }
        // read 10 bytes to string
        auto ifile = std::ifstream(file, std::ios_base::binary);
        if (!ifile.is_open()) {
          log->error(trs("Can not open file") + " " + file);
          return false;
        }
        std::string read_buff;
        read_buff.resize(10, 0x00);
        if (!ifile.read(read_buff.data(), 10)) {
          log->error(trs("Can not read the file") + " " + file);
          return false;
        }
        if (!boost::contains(read_buff, "%PDF")) {
          log->error(trs("Not a pdf file") + " " + file);
          return false;
        }
        ifile.close();
      } catch (const std::exception& ex) {
        log->error(ex.what());
        return false;
      }
      return true;
    });
}

/**
 * @brief Check the output directory
 *
 * @param output_dir
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log) {
  std::error_code err;
  if (!std::filesystem::exists(output_dir, err) ||
      !std::filesystem::is_directory(output_dir, err)) {
    log->error(trs("Directory not found") + " " + output_dir);
    return false;
  }
  std::string tmp_filename = output_dir;
  if (tmp_filename.back() != '/') {
    tmp_filename.push_back('/');
  }
  tmp_filename += "test_temporary_file_for_pdfasm";
  std::ofstream ofile(tmp_filename);
  if (!ofile.is_open()) {
    log->error(trs("Can not create file in directory") + " " + output_dir);
    return false;
  }
  ofile.close();
  std::filesystem::remove(tmp_filename, err);
  return true;
}

bool AddLogFile(const std::shared_ptr<spdlog::logger>& logger,
                const std::string& log_file) {
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    logger->sinks().push_back(std::move(sink));
  } catch (const spdlog::spdlog_ex& ex) {
    logger->error(trs("Can not open the log file") + " " + log_file + " " +
                  ex.what());
    return false;
  }
  return true;
}

const char* ErrorCode(assembler::ErrorKind kind) noexcept {
  switch (kind) {
    case assembler::ErrorKind::kFatalInputError:
      return kErrMainDocument;
    case assembler::ErrorKind::kRecoverableTrialError:
    case assembler::ErrorKind::kZeroPageCount:
      return kErrTrialDocument;
    case assembler::ErrorKind::kFatalOutputError:
      return kErrOutputWrite;
    case assembler::ErrorKind::kInvalidArgument:
      return kErrInvalidArgument;
  }
  return kErrInvalidArgument;
}

int ReportResult(const assembler::AssemblyResult& result,
                 const std::shared_ptr<spdlog::logger>& log) {
  for (const auto& trial_error : result.trial_errors) {
    log->warn("{} {}", ErrorCode(trial_error.kind), trial_error.ToString());
  }
  if (!result.status) {
    if (result.failure) {
      log->error("{} {}", ErrorCode(result.failure->kind),
                 result.failure->ToString());
    }
    log->error(tr("No output file was written"));
    return 1;
  }
  if (result.total_mismatch) {
    log->warn(trs("Footers show a total of") + " " +
              std::to_string(result.planned_total) + ", " +
              trs("the document has") + " " +
              std::to_string(result.emitted_pages) + " " + trs("pages"));
  }
  log->info(trs("Output file:") + " " + result.output_path);
  return 0;
}

}  // namespace pdfasm::cli
