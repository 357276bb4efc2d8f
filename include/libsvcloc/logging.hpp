#pragma once

#include "export.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace libsvcloc {

/// Name under which the default logger is registered with spdlog.
inline constexpr const char* logger_name = "libsvcloc";

/// The library logger.  Defaults to a stderr color logger at level warn,
/// or to the spdlog logger already registered as logger_name.
LIBSVCLOC_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Route library logging to `replacement`; nullptr restores the default.
LIBSVCLOC_EXPORT void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace libsvcloc
