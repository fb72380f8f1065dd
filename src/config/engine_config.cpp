#include <config/engine_config.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace Chromaseq {

namespace {

uint64_t parse_unsigned(const char* name, const std::string& text, uint64_t max_value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value > max_value) {
            throw ChromaseqError(ErrorKind::InvalidParameter,
                                 std::string(name) + " is out of range: " + text);
        }
        return value;
    } catch (const std::out_of_range&) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(name) + " is out of range: " + text);
    }
}

double parse_tolerance(const std::string& text) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || !std::isfinite(value) || value < 0.0) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             "CHROMASEQ_TOLERANCE must be a finite non-negative number, got '" + text + "'");
    }
    return value;
}

} // namespace

Logger::Level EngineConfig::parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Logger::Level::Debug;
    if (lower == "info") return Logger::Level::Info;
    if (lower == "warning" || lower == "warn") return Logger::Level::Warning;
    if (lower == "error") return Logger::Level::Error;

    throw ChromaseqError(ErrorKind::InvalidParameter, "Unknown log level: " + name);
}

EngineConfig EngineConfig::load_from_env() {
    EngineConfig config;

    const char* max_search_env = std::getenv("CHROMASEQ_MAX_SEARCH");
    const char* max_count_env = std::getenv("CHROMASEQ_MAX_COUNT");
    const char* tolerance_env = std::getenv("CHROMASEQ_TOLERANCE");
    const char* threshold_env = std::getenv("CHROMASEQ_PARALLEL_THRESHOLD");
    const char* threads_env = std::getenv("CHROMASEQ_THREADS");
    const char* level_env = std::getenv("CHROMASEQ_LOG_LEVEL");

    constexpr uint64_t u32_max = std::numeric_limits<uint32_t>::max();

    if (max_search_env) {
        config.max_search = static_cast<uint32_t>(
            parse_unsigned("CHROMASEQ_MAX_SEARCH", max_search_env, u32_max));
    }
    if (max_count_env) {
        config.max_count = static_cast<uint32_t>(
            parse_unsigned("CHROMASEQ_MAX_COUNT", max_count_env, u32_max));
    }
    if (tolerance_env) {
        config.tolerance = parse_tolerance(tolerance_env);
    }
    if (threshold_env) {
        config.parallel_threshold = static_cast<uint32_t>(
            parse_unsigned("CHROMASEQ_PARALLEL_THRESHOLD", threshold_env, u32_max));
    }
    if (threads_env) {
        config.threads = static_cast<int>(
            parse_unsigned("CHROMASEQ_THREADS", threads_env, 1024));
    }
    if (level_env) {
        config.log_level = parse_log_level(level_env);
    }

    return config;
}

} // namespace Chromaseq
