#ifndef HYSPEXCPP_LOGGER_HPP
#define HYSPEXCPP_LOGGER_HPP

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <memory>
#include <optional>
#include <filesystem>
#include <string_view>


#ifdef DISABLE_LOGGING
    #define LOG_TRACE(...)
    #define LOG_INFO(...)
    #define LOG_WARN(...)
    #define LOG_ERROR(...)
    #define LOG_CRITICAL(...)
#else
    #define LOG_TRACE(...)    Logger::console_->trace(__VA_ARGS__)
    #define LOG_INFO(...)     Logger::console_->info(__VA_ARGS__)
    #define LOG_WARN(...)     Logger::console_->warn(__VA_ARGS__)
    #define LOG_ERROR(...)    Logger::console_->error(__VA_ARGS__)
    #define LOG_CRITICAL(...) Logger::console_->critical(__VA_ARGS__)
#endif


class Logger
{
public:
    /**
     * @brief Sets pattern and level of the console logger.
     * @param log_file when given, a rotating file sink is attached next to the console sink.
     */
    static void Init(spdlog::level::level_enum log_level,
                     const std::optional<std::filesystem::path> &log_file = std::nullopt);

    inline static std::shared_ptr<spdlog::logger> console_ = spdlog::stdout_color_mt("console");
};

/// Maps "trace", "info", "warn", ... to spdlog levels, unknown names fall back to info.
[[nodiscard]] spdlog::level::level_enum GetLogLevel(std::string_view name) noexcept;

#endif //HYSPEXCPP_LOGGER_HPP
