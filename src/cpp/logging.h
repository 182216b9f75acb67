/*
    Shared spdlog logger for the mnsig library
*/

#ifndef MNSIG_LOGGING_H
#define MNSIG_LOGGING_H

#include <spdlog/spdlog.h>
#include <memory>

namespace mnsig {

/**
 * @brief Library logger ("mnsig", colour stdout sink)
 *
 * Created on first use. The initial level is read from MNSIG_LOG_LEVEL
 * (trace, debug, info, warn, err, critical, off) and defaults to warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Change the level of the library logger
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace mnsig

#endif // MNSIG_LOGGING_H
