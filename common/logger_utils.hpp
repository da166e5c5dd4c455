#pragma once
#include <memory>
#include <spdlog/logger.h>

namespace pdfasm::logger {

std::shared_ptr<spdlog::logger> InitLog() noexcept;

} // namespace pdfasm::logger
