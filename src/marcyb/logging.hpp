#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace marcyb {

/**
 * @brief Library-wide logger named "marcyb"
 *
 * Created on first use with a thread-safe stderr sink. Default level is
 * warn so that library callers only see unusual inputs.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set verbosity of the library logger
 * @param level spdlog level (trace, debug, info, warn, err, critical, off)
 */
void setLogLevel(spdlog::level::level_enum level);

} // namespace marcyb
