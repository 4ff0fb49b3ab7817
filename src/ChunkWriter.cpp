#include "ChunkWriter.hpp"
#include "EnviHeader.hpp"
#include "EnviParser.hpp"
#include "Logger.hpp"
#include "Quantizer.hpp"

#include <spdlog/fmt/fmt.h>

#include <bit>
#include <stdexcept>
#include <string>
#include <system_error>
#include <cerrno>


namespace
{

template <typename T>
void WriteValues(std::ofstream &os, std::span<const T> values)
{
    os.write(reinterpret_cast<const char *>(values.data()), static_cast<std::streamsize>(values.size_bytes()));
}

}


EnviWriter::EnviWriter(const std::filesystem::path &basename, OutputMode mode, double scale_factor)
    : mode_{mode}, scale_factor_{scale_factor}
{
    if (mode_ == OutputMode::INT && !(scale_factor_ > 0.0))
    {
        throw std::invalid_argument{"Scale factor must be positive"};
    }
    data_path_ = basename;
    data_path_ += ".bip";
    header_path_ = basename;
    header_path_ += ".hdr";
}

void EnviWriter::Begin(std::span<const float> wavelengths, std::size_t samples, std::size_t lines,
                       std::size_t bands)
{
    if (bands == 0)
    {
        throw std::invalid_argument{"Output needs at least one band"};
    }
    if (!wavelengths.empty() && wavelengths.size() != bands)
    {
        throw std::invalid_argument{"Got " + std::to_string(wavelengths.size()) + " wavelengths for " +
                                    std::to_string(bands) + " bands"};
    }

    data_.open(data_path_, std::ios::binary | std::ios::trunc);
    if (!data_.is_open())
    {
        LOG_ERROR("Cant create output file {}", data_path_.string());
        throw std::system_error{errno, std::generic_category(), "Cannot create " + data_path_.string()};
    }

    wavelengths_.assign(wavelengths.begin(), wavelengths.end());
    samples_ = samples;
    lines_ = lines;
    bands_ = bands;
    rows_written_ = 0;

    LOG_INFO("Writing {} lines x {} samples x {} bands to {}", lines_, samples_, bands_, data_path_.string());
}

void EnviWriter::Write(const SpectraMatrix &chunk)
{
    if (!data_.is_open())
    {
        throw std::logic_error{"EnviWriter::Write called before Begin"};
    }
    if (chunk.bands != bands_)
    {
        throw std::invalid_argument{"Chunk has " + std::to_string(chunk.bands) + " bands, expected " +
                                    std::to_string(bands_)};
    }

    const std::span<const float> values{chunk.data};
    if (mode_ == OutputMode::INT)
    {
        const auto quantized = QuantizeFixed(values, scale_factor_);
        WriteValues(data_, std::span<const int32_t>{quantized});
    }
    else
    {
        WriteValues(data_, values);
    }

    if (!data_)
    {
        throw std::runtime_error{"Write to " + data_path_.string() + " failed"};
    }
    rows_written_ += chunk.rows;
    LOG_TRACE("Wrote chunk of {} rows, {} in total", chunk.rows, rows_written_);
}

void EnviWriter::Finish()
{
    data_.close();
    if (data_.fail())
    {
        throw std::runtime_error{"Closing " + data_path_.string() + " failed"};
    }
    if (rows_written_ != samples_ * lines_)
    {
        LOG_ERROR("Expected {} rows in {}, got {}", samples_ * lines_, data_path_.string(), rows_written_);
        throw std::runtime_error{"Output " + data_path_.string() + " is incomplete"};
    }
    WriteHeader();
    LOG_INFO("Finished {}", data_path_.string());
}

void EnviWriter::WriteHeader() const
{
    const auto data_type = mode_ == OutputMode::INT ? DataType::INT32 : DataType::FLOAT32;

    envi::Fields fields;
    fields.Set("samples", std::to_string(samples_));
    fields.Set("lines", std::to_string(lines_));
    fields.Set("bands", std::to_string(bands_));
    fields.Set("header offset", "0");
    fields.Set("file type", "ENVI Standard");
    fields.Set("data type", std::to_string(GetDataTypeCode(data_type)));
    fields.Set("interleave", std::string{to_string(Interleave::BIP)});
    fields.Set("byte order", std::endian::native == std::endian::big ? "1" : "0");
    if (mode_ == OutputMode::INT)
    {
        fields.Set("scale factor", fmt::format("{}", scale_factor_));
    }
    if (!wavelengths_.empty())
    {
        std::vector<std::string> wavelengths;
        wavelengths.reserve(wavelengths_.size());
        for (const auto wavelength : wavelengths_)
        {
            wavelengths.push_back(fmt::format("{}", wavelength));
        }
        fields.Set("wavelength units", "Nanometers");
        fields.Set("wavelength", std::move(wavelengths));
    }

    std::ofstream header{header_path_, std::ios::trunc};
    if (!header.is_open())
    {
        LOG_ERROR("Cant create header file {}", header_path_.string());
        throw std::system_error{errno, std::generic_category(), "Cannot create " + header_path_.string()};
    }
    header << envi::DumpEnvi(fields);
    if (!header)
    {
        throw std::runtime_error{"Write to " + header_path_.string() + " failed"};
    }
}

std::size_t WriteStream(LineStream &stream, ChunkSink &sink)
{
    sink.Begin(stream.Wavelengths(), stream.Samples(), stream.TotalLines(), stream.Bands());

    std::size_t chunks = 0;
    while (auto chunk = stream.NextChunk())
    {
        sink.Write(*chunk);
        ++chunks;
    }
    sink.Finish();
    return chunks;
}
