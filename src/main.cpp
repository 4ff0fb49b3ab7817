#include "BinaryHeader.hpp"
#include "ChunkWriter.hpp"
#include "LineStream.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>


namespace
{

void DumpSensorMetadata(const HyspexImage &image, std::filesystem::path path)
{
    if (image.binary_header == nullptr)
        return;

    std::ofstream file{path};
    if (!file.is_open())
    {
        throw std::runtime_error{"Cannot create " + path.string()};
    }
    hyspex::DumpBinaryHeader(*image.binary_header, file);
    LOG_INFO("Saved sensor metadata to {}", path.string());
}

}


int main(int argc, char* argv[])
{
    if (argc < 3 || argc > 4)
    {
        std::fprintf(stderr, "usage: %s <cube.hyspex> <output-basename> [settings.json]\n", argv[0]);
        return 2;
    }

    const std::filesystem::path cube_path{argv[1]};
    const std::filesystem::path output{argv[2]};

    Logger::Init(spdlog::level::info);

    try
    {
        ConversionSettings settings{};
        if (argc == 4)
        {
            settings = LoadSettings(std::filesystem::path{argv[3]});
        }

        std::optional<std::filesystem::path> log_file;
        if (!settings.log_file.empty())
        {
            log_file = settings.log_file;
        }
        Logger::Init(GetLogLevel(settings.log_level), log_file);

        LineStream stream{cube_path, ToStreamParameters(settings)};

        auto json_path = output;
        json_path += ".json";
        DumpSensorMetadata(stream.Image(), json_path);

        EnviWriter writer{output, GetOutputMode(settings.output_mode).value_or(OutputMode::FLOAT),
                          settings.scale_factor};
        const auto chunks = WriteStream(stream, writer);
        stream.Close();

        LOG_INFO("Converted {} rows in {} chunks", stream.TotalRows(), chunks);
    }
    catch (const std::exception &e)
    {
        LOG_CRITICAL("Conversion failed: {}", e.what());
        return 1;
    }

    return 0;
}
