/**
 * @file engine_config.hpp
 * @brief Runtime defaults for the request handler, the C API and the CLI
 */

#pragma once

#include <export.hpp>
#include <utils/logger.hpp>
#include <cstdint>
#include <string>

namespace Chromaseq {

/**
 * @brief Defaults applied when a request leaves a field out.
 *
 * Environment variables (all optional):
 *   CHROMASEQ_MAX_SEARCH          upper bound of the inversion scan
 *   CHROMASEQ_MAX_COUNT           largest generate count / compare n accepted
 *   CHROMASEQ_TOLERANCE           RGB distance below which a candidate matches
 *   CHROMASEQ_PARALLEL_THRESHOLD  scans at least this long use OpenMP
 *   CHROMASEQ_THREADS             OpenMP team size (0 = runtime default)
 *   CHROMASEQ_LOG_LEVEL           debug | info | warning | error
 */
struct CHROMASEQ_API EngineConfig {
    uint32_t max_search = 10000;
    uint32_t max_count = 100000;
    double tolerance = 0.01;
    uint32_t parallel_threshold = 50000;
    int threads = 0;
    Logger::Level log_level = Logger::Level::Info;

    static EngineConfig load_from_env();

    // Throws ChromaseqError(InvalidParameter) for unknown names.
    static Logger::Level parse_log_level(const std::string& name);
};

} // namespace Chromaseq
