#include "Logger.hpp"

#include "spdlog/sinks/rotating_file_sink.h"

#include <string>


void Logger::Init(spdlog::level::level_enum log_level, const std::optional<std::filesystem::path> &log_file)
{
    static constexpr std::size_t max_file_size = 1048576 * 5;
    static constexpr std::size_t max_files = 3;

    if (log_file.has_value())
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file->string(),
                                                                                max_file_size, max_files, false);
        console_->sinks().push_back(file_sink);
    }

    console_->set_pattern("%^[%d-%m-%C %R] %l: %v%$");
    console_->set_level(log_level);
}


spdlog::level::level_enum GetLogLevel(std::string_view name) noexcept
{
    const auto level = spdlog::level::from_str(std::string{name});
    // from_str returns 'off' for names it does not know
    if (level == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return level;
}
