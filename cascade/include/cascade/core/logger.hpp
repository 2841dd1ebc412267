#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

// Cascade convenience logging macros mapped to spdlog
#ifndef CASCADE_LOG_TRACE
#    define CASCADE_LOG_TRACE(logger, ...) SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__)
#endif
#ifndef CASCADE_LOG_DEBUG
#    define CASCADE_LOG_DEBUG(logger, ...) SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__)
#endif
#ifndef CASCADE_LOG_INFO
#    define CASCADE_LOG_INFO(logger, ...) SPDLOG_LOGGER_INFO(logger, __VA_ARGS__)
#endif
#ifndef CASCADE_LOG_WARN
#    define CASCADE_LOG_WARN(logger, ...) SPDLOG_LOGGER_WARN(logger, __VA_ARGS__)
#endif
#ifndef CASCADE_LOG_ERROR
#    define CASCADE_LOG_ERROR(logger, ...) SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__)
#endif
#ifndef CASCADE_LOG_CRITICAL
#    define CASCADE_LOG_CRITICAL(logger, ...) SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__)
#endif

namespace cascade::core
{
class Logger
{
public:
    using LoggerPtr = std::shared_ptr<spdlog::logger>;

    // Loggers created before init() receive the sinks here.
    static auto init() -> void;
    static auto shutdown() -> void;

    // Returns the already registered logger when t_name is taken.
    static auto createLogger(std::string_view t_name) -> LoggerPtr;

private:
    static auto initSinks() -> void;

    inline static std::vector<spdlog::sink_ptr> m_sinks{};
};
}  // namespace cascade::core
