#ifndef HYSPEXCPP_SETTINGS_HPP
#define HYSPEXCPP_SETTINGS_HPP

#include "LineStream.hpp"

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>


enum class OutputMode
{
    FLOAT, INT
};

[[nodiscard]] std::optional<OutputMode> GetOutputMode(std::string_view text) noexcept;

struct ConversionSettings
{
    std::size_t start_line = 0;
    int64_t end_line = -1;              // -1 selects the last line
    std::size_t chunk_lines = 100;
    bool calibrate = true;
    std::size_t progress_interval = 500;
    std::string output_mode = "float";  // "float" or "int"
    double scale_factor = 1e-6;         // int output stores value / scale_factor
    std::string log_level = "info";
    std::string log_file;               // empty logs to the console only

    template<class Archive>
    void serialize(Archive &archive)
    {
        archive(
            CEREAL_NVP(start_line),
            CEREAL_NVP(end_line),
            CEREAL_NVP(chunk_lines),
            CEREAL_NVP(calibrate),
            CEREAL_NVP(progress_interval),
            CEREAL_NVP(output_mode),
            CEREAL_NVP(scale_factor),
            CEREAL_NVP(log_level),
            CEREAL_NVP(log_file));
    }

    [[nodiscard]] bool operator==(const ConversionSettings &) const = default;
};

/// Reads settings written by SaveSettings, throws FormatError on malformed JSON or invalid values.
[[nodiscard]] ConversionSettings LoadSettings(std::istream &iss);

[[nodiscard]] ConversionSettings LoadSettings(const std::filesystem::path &path);

void SaveSettings(const ConversionSettings &settings, std::ostream &os);

[[nodiscard]] StreamParameters ToStreamParameters(const ConversionSettings &settings);

#endif //HYSPEXCPP_SETTINGS_HPP
