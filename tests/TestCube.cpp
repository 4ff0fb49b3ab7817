#include "TestCube.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>


namespace
{

class ByteWriter
{
public:
    template <typename T>
    void Put(T value)
    {
        std::array<std::byte, sizeof(T)> bytes{};
        std::memcpy(bytes.data(), &value, sizeof(T));
        if constexpr (std::endian::native == std::endian::big)
        {
            std::ranges::reverse(bytes);
        }
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void Text(std::string_view text, std::size_t width)
    {
        for (std::size_t idx = 0; idx < width; ++idx)
        {
            data_.push_back(idx < text.size() ? static_cast<std::byte>(text[idx]) : std::byte{0});
        }
    }

    [[nodiscard]] std::vector<std::byte> Release() { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

template <typename T>
void PutElement(std::ofstream &os, double value, ByteOrder byte_order)
{
    std::array<std::byte, sizeof(T)> bytes{};
    const auto typed = static_cast<T>(value);
    std::memcpy(bytes.data(), &typed, sizeof(T));

    const bool big = byte_order == ByteOrder::BIG;
    if (big != (std::endian::native == std::endian::big))
    {
        std::ranges::reverse(bytes);
    }
    os.write(reinterpret_cast<const char *>(bytes.data()), sizeof(T));
}

void PutValue(std::ofstream &os, double value, DataType data_type, ByteOrder byte_order)
{
    switch (data_type)
    {
        case DataType::BYTE:
            PutElement<uint8_t>(os, std::fmod(value, 256.0), byte_order);
            break;
        case DataType::INT16:
            PutElement<int16_t>(os, value, byte_order);
            break;
        case DataType::UINT16:
            PutElement<uint16_t>(os, value, byte_order);
            break;
        case DataType::INT32:
            PutElement<int32_t>(os, value, byte_order);
            break;
        case DataType::UINT32:
            PutElement<uint32_t>(os, value, byte_order);
            break;
        case DataType::INT64:
            PutElement<int64_t>(os, value, byte_order);
            break;
        case DataType::UINT64:
            PutElement<uint64_t>(os, value, byte_order);
            break;
        case DataType::FLOAT32:
            PutElement<float>(os, value, byte_order);
            break;
        case DataType::FLOAT64:
            PutElement<double>(os, value, byte_order);
            break;
        case DataType::COMPLEX32:
            PutElement<float>(os, value, byte_order);
            PutElement<float>(os, 0.0, byte_order);
            break;
        case DataType::COMPLEX64:
            PutElement<double>(os, value, byte_order);
            PutElement<double>(os, 0.0, byte_order);
            break;
    }
}

}


std::filesystem::path TestDirectory()
{
    auto dir = std::filesystem::temp_directory_path() / "hyspexcpp_tests";
    std::filesystem::create_directories(dir);
    return dir;
}

double TestRawValue(std::size_t line, std::size_t band, std::size_t sample)
{
    return 1000.0 + 100.0 * static_cast<double>(line) + 10.0 * static_cast<double>(band) + static_cast<double>(sample);
}

double TestWavelength(std::size_t band)
{
    const auto b = static_cast<double>(band);
    return 400.0 + 10.0 * b + b * b;
}

double TestQe(std::size_t band)
{
    return 0.5 + 0.05 * static_cast<double>(band);
}

double TestResponse(std::size_t band, std::size_t sample)
{
    return 1.0 + 0.1 * static_cast<double>(band) + 0.01 * static_cast<double>(sample);
}

double TestBackground(std::size_t band, std::size_t sample)
{
    return 5.0 + static_cast<double>(band) + 0.5 * static_cast<double>(sample);
}

std::vector<std::byte> MakeBinaryHeader(const TestSensor &sensor, uint32_t bands, uint32_t samples)
{
    const uint32_t spectral_size = sensor.spectral_size.value_or(bands);
    const uint32_t spatial_size = sensor.spatial_size.value_or(samples);

    ByteWriter writer;
    writer.Text("HYSPEX", 8);
    writer.Put<int32_t>(0);
    writer.Put<uint32_t>(sensor.serial_number);
    writer.Text("config.cfg", 200);
    writer.Text("settings.set", 120);
    writer.Put<double>(1.0);
    writer.Put<uint32_t>(1);
    writer.Put<uint32_t>(0);
    writer.Text("COM1", 56);
    writer.Put<uint32_t>(50);
    writer.Put<uint32_t>(20);
    writer.Text("COM2", 64);
    writer.Text("detect", 200);
    writer.Text("sensor", 200);
    writer.Text("framegrabber", 200);
    writer.Text(sensor.id, 200);
    writer.Text("NEO", 200);
    writer.Text("low", 32);
    writer.Text("high", 32);
    writer.Text("synthetic test cube", 200);
    writer.Text("background.bin", 200);
    writer.Text("1", 1);

    writer.Put<uint32_t>(0);                        // unknown_ptr1
    writer.Put<uint32_t>(0);                        // serverindex
    writer.Put<uint32_t>(0);                        // comsettings
    writer.Put<uint32_t>(16);                       // number_of_background
    writer.Put<uint32_t>(spectral_size);
    writer.Put<uint32_t>(spatial_size);
    writer.Put<uint32_t>(1);                        // binning
    writer.Put<uint32_t>(1);                        // detected
    writer.Put<uint32_t>(sensor.integration_time);
    writer.Put<uint32_t>(20000);                    // frame_period
    writer.Put<uint32_t>(2);                        // default_r
    writer.Put<uint32_t>(1);                        // default_g
    writer.Put<uint32_t>(0);                        // default_b
    writer.Put<uint32_t>(0);                        // bitshift
    writer.Put<uint32_t>(0);                        // temperature_offset
    writer.Put<uint32_t>(1);                        // shutter
    writer.Put<uint32_t>(1);                        // background_present
    writer.Put<uint32_t>(1);                        // power
    writer.Put<uint32_t>(2);                        // current
    writer.Put<uint32_t>(3);                        // bias
    writer.Put<uint32_t>(4);                        // bandwidth
    writer.Put<uint32_t>(5);                        // vin
    writer.Put<uint32_t>(6);                        // vref
    writer.Put<uint32_t>(7);                        // sensor_vin
    writer.Put<uint32_t>(8);                        // sensor_vref
    writer.Put<uint32_t>(270);                      // cooling_temperature
    writer.Put<uint32_t>(0);                        // window_start
    writer.Put<uint32_t>(spectral_size);            // window_stop
    writer.Put<uint32_t>(100);                      // readout_time
    writer.Put<uint32_t>(1);                        // p
    writer.Put<uint32_t>(2);                        // i
    writer.Put<uint32_t>(3);                        // d
    writer.Put<uint32_t>(10);                       // numberofframes
    writer.Put<uint32_t>(static_cast<uint32_t>(sensor.bad_pixels.size()));
    writer.Put<uint32_t>(0);                        // dw
    writer.Put<uint32_t>(0);                        // eq
    writer.Put<uint32_t>(1);                        // lens
    writer.Put<uint32_t>(0);                        // fov_exp
    writer.Put<uint32_t>(0);                        // scanning_mode
    writer.Put<uint32_t>(sensor.calib_available);
    writer.Put<uint32_t>(1);                        // number_of_avg

    writer.Put<double>(sensor.sf);
    writer.Put<double>(sensor.aperture_size);
    writer.Put<double>(sensor.pixelsize_x);
    writer.Put<double>(sensor.pixelsize_y);
    writer.Put<double>(21.5);                       // temperature
    writer.Put<double>(100.0);                      // max_framerate

    for (uint32_t pointer = 0; pointer < 6; ++pointer)
    {
        writer.Put<uint32_t>(pointer);
    }

    for (uint32_t band = 0; band < spectral_size; ++band)
        writer.Put<double>(TestWavelength(band));
    for (uint32_t band = 0; band < spectral_size; ++band)
        writer.Put<double>(TestQe(band));
    for (uint32_t band = 0; band < spectral_size; ++band)
        for (uint32_t sample = 0; sample < spatial_size; ++sample)
            writer.Put<double>(TestResponse(band, sample) * sensor.response_scale);
    for (uint32_t band = 0; band < spectral_size; ++band)
        for (uint32_t sample = 0; sample < spatial_size; ++sample)
            writer.Put<double>(TestBackground(band, sample));
    for (const auto pixel : sensor.bad_pixels)
        writer.Put<uint32_t>(pixel);

    return writer.Release();
}

std::filesystem::path WriteTestCube(std::string_view name, const TestCubeOptions &options)
{
    const auto dir = TestDirectory();
    auto cube_path = dir / (std::string{name} + ".hyspex");
    auto header_path = dir / (std::string{name} + ".hdr");

    std::vector<std::byte> preamble;
    if (options.binary_header)
    {
        preamble = MakeBinaryHeader(options.sensor, static_cast<uint32_t>(options.bands),
                                    static_cast<uint32_t>(options.samples));
    }

    {
        std::ofstream header{header_path, std::ios::trunc};
        header << "ENVI\n"
               << "samples = " << options.samples << '\n'
               << "lines = " << options.declared_lines.value_or(options.lines) << '\n'
               << "bands = " << options.bands << '\n'
               << "header offset = " << preamble.size() << '\n'
               << "file type = ENVI Standard\n"
               << "data type = " << GetDataTypeCode(options.data_type) << '\n'
               << "interleave = " << to_string(options.interleave) << '\n'
               << "byte order = " << (options.byte_order == ByteOrder::BIG ? 1 : 0) << '\n';
        if (!options.ascii_wavelengths.empty())
        {
            header << "wavelength units = Nanometers\nwavelength = {";
            for (std::size_t idx = 0; idx < options.ascii_wavelengths.size(); ++idx)
            {
                header << (idx == 0 ? "" : ",\n ") << options.ascii_wavelengths[idx];
            }
            header << "}\n";
        }
        if (!header)
        {
            throw std::runtime_error{"Cannot write " + header_path.string()};
        }
    }

    std::ofstream cube{cube_path, std::ios::binary | std::ios::trunc};
    cube.write(reinterpret_cast<const char *>(preamble.data()), static_cast<std::streamsize>(preamble.size()));

    const auto put = [&](std::size_t line, std::size_t band, std::size_t sample) {
        PutValue(cube, TestRawValue(line, band, sample), options.data_type, options.byte_order);
    };

    switch (options.interleave)
    {
        case Interleave::BIL:
            for (std::size_t line = 0; line < options.lines; ++line)
                for (std::size_t band = 0; band < options.bands; ++band)
                    for (std::size_t sample = 0; sample < options.samples; ++sample)
                        put(line, band, sample);
            break;
        case Interleave::BIP:
            for (std::size_t line = 0; line < options.lines; ++line)
                for (std::size_t sample = 0; sample < options.samples; ++sample)
                    for (std::size_t band = 0; band < options.bands; ++band)
                        put(line, band, sample);
            break;
        case Interleave::BSQ:
            for (std::size_t band = 0; band < options.bands; ++band)
                for (std::size_t line = 0; line < options.lines; ++line)
                    for (std::size_t sample = 0; sample < options.samples; ++sample)
                        put(line, band, sample);
            break;
    }

    if (!cube)
    {
        throw std::runtime_error{"Cannot write " + cube_path.string()};
    }
    return cube_path;
}
