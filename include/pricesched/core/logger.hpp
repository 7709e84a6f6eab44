#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pricesched {

class Logger {
public:
    /// Initialize the process logger. A colored stdout sink is always
    /// attached; a non-empty `log_file` adds an appending file sink.
    static void init(std::string_view name = "pricesched", std::string_view level = "info",
                     std::string_view log_file = {});
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view name);
    static void flush();
};

} // namespace pricesched

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::pricesched::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::pricesched::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::pricesched::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::pricesched::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::pricesched::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::pricesched::Logger::get(), __VA_ARGS__)
