#include "Settings.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cereal/archives/json.hpp>

#include <fstream>
#include <stdexcept>


namespace
{

void ValidateSettings(const ConversionSettings &settings)
{
    if (settings.end_line < -1)
    {
        throw FormatError{"Setting 'end_line' must be -1 or a line index"};
    }
    if (settings.chunk_lines == 0)
    {
        throw FormatError{"Setting 'chunk_lines' must be positive"};
    }
    if (!GetOutputMode(settings.output_mode).has_value())
    {
        throw FormatError{"Setting 'output_mode' must be 'float' or 'int', got '" + settings.output_mode + "'"};
    }
    if (!(settings.scale_factor > 0.0))
    {
        throw FormatError{"Setting 'scale_factor' must be positive"};
    }
}

}


std::optional<OutputMode> GetOutputMode(std::string_view text) noexcept
{
    if (text == "float")
        return std::optional<OutputMode>{OutputMode::FLOAT};
    else if (text == "int")
        return std::optional<OutputMode>{OutputMode::INT};
    return std::optional<OutputMode>{std::nullopt};
}

ConversionSettings LoadSettings(std::istream &iss)
{
    ConversionSettings settings{};
    try
    {
        cereal::JSONInputArchive archive(iss);
        archive(cereal::make_nvp("settings", settings));
    }
    catch (const cereal::Exception &e)
    {
        LOG_ERROR("Cant read conversion settings: {}", e.what());
        throw FormatError{std::string{"Malformed settings: "} + e.what()};
    }

    ValidateSettings(settings);
    return settings;
}

ConversionSettings LoadSettings(const std::filesystem::path &path)
{
    LOG_INFO("Loading settings from {}", path.string());

    std::ifstream file{path};
    if (!file.is_open())
    {
        LOG_ERROR("Cant open settings file {}", path.string());
        throw std::runtime_error{"Cannot open settings file " + path.string()};
    }
    return LoadSettings(file);
}

void SaveSettings(const ConversionSettings &settings, std::ostream &os)
{
    cereal::JSONOutputArchive archive(os);
    archive(cereal::make_nvp("settings", settings));
}

StreamParameters ToStreamParameters(const ConversionSettings &settings)
{
    StreamParameters parameters{
        .start_line = settings.start_line,
        .end_line = std::nullopt,
        .chunk_lines = settings.chunk_lines,
        .calibrate = settings.calibrate,
        .progress_interval = settings.progress_interval
    };
    if (settings.end_line >= 0)
    {
        parameters.end_line = static_cast<std::size_t>(settings.end_line);
    }
    return parameters;
}
