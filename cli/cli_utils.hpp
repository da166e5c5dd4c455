#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

#include "assembly_result.hpp"

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
                     const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Check the output directory
 *
 * @param output_dir
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Add a file sink to the logger
 *
 * @param logger
 * @param log_file path, appended if exists
 * @return true on success
 */
bool AddLogFile(const std::shared_ptr<spdlog::logger>& logger,
                const std::string& log_file);

/// @brief string error code for the failure kind, see common_defs.hpp
const char* ErrorCode(assembler::ErrorKind kind) noexcept;

/**
 * @brief Print the run summary and every failure
 * @return process exit code
 */
int ReportResult(const assembler::AssemblyResult& result,
                 const std::shared_ptr<spdlog::logger>& log);

}  // namespace pdfasm::cli
