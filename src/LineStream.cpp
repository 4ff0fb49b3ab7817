#include "LineStream.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>


namespace
{

/// One centre per band or nothing, lists of another length are skipped with a warning.
std::vector<float> SelectWavelengths(const HyspexImage &image, std::size_t bands)
{
    if (image.binary_header != nullptr && !image.binary_header->spectral_calib.empty())
    {
        const auto &centres = image.binary_header->spectral_calib;
        if (centres.size() == bands)
            return std::vector<float>(centres.begin(), centres.end());

        LOG_WARN("Binary header lists {} wavelengths for {} bands", centres.size(), bands);
    }
    if (image.header.wavelengths.has_value())
    {
        const auto &centres = image.header.wavelengths.value();
        if (centres.size() == bands)
        {
            LOG_INFO("Using wavelengths from the ENVI header");
            return centres;
        }
        LOG_WARN("ENVI header lists {} wavelengths for {} bands", centres.size(), bands);
    }
    LOG_WARN("No wavelength information found for {}", image.paths.img_data.string());
    return {};
}

}


LineStream::LineStream(const std::filesystem::path &cube_path, const StreamParameters &parameters)
    : LineStream(OpenHyspex(cube_path), parameters)
{
}

LineStream::LineStream(HyspexImage image, const StreamParameters &parameters)
    : image_{std::move(image)},
      start_line_{parameters.start_line},
      end_line_{0},
      chunk_lines_{parameters.chunk_lines},
      progress_interval_{parameters.progress_interval},
      samples_{0},
      bands_{0},
      next_line_{parameters.start_line}
{
    if (image_.cube == nullptr)
    {
        throw std::invalid_argument{"Line stream needs an open cube"};
    }
    const auto &cube = *image_.cube;

    if (cube.GetInterleave() != Interleave::BIL)
    {
        LOG_ERROR("Streaming supports bil interleave only, {} is {}", cube.Path().string(),
                  to_string(cube.GetInterleave()));
        throw FormatError{"Unsupported interleave '" + std::string{to_string(cube.GetInterleave())} +
                          "' for streaming, expected bil"};
    }
    if (cube.GetDataType() == DataType::COMPLEX32 || cube.GetDataType() == DataType::COMPLEX64)
    {
        LOG_ERROR("Streaming supports real data types only, {} is complex", cube.Path().string());
        throw FormatError{"Complex data type " + std::to_string(GetDataTypeCode(cube.GetDataType())) +
                          " cannot be streamed"};
    }
    if (chunk_lines_ == 0)
    {
        throw std::invalid_argument{"Chunk size must be at least one line"};
    }
    if (cube.Lines() == 0)
    {
        throw RangeError{"Cube " + cube.Path().string() + " holds no lines"};
    }

    end_line_ = parameters.end_line.value_or(cube.Lines() - 1);
    if (start_line_ > end_line_ || end_line_ >= cube.Lines())
    {
        LOG_ERROR("Line range {}..{} is invalid for a cube of {} lines", start_line_, end_line_, cube.Lines());
        throw RangeError{"Line range " + std::to_string(start_line_) + ".." + std::to_string(end_line_) +
                         " outside cube of " + std::to_string(cube.Lines()) + " lines"};
    }

    samples_ = cube.Samples();
    bands_ = cube.Bands();

    if (parameters.calibrate)
    {
        calibrator_.emplace(image_.cube, image_.binary_header);
    }
    else
    {
        line_buffer_.resize(bands_ * samples_);
    }

    wavelengths_ = SelectWavelengths(image_, bands_);

    LOG_INFO("Streaming lines {}..{} of {} in chunks of {} lines, {}", start_line_, end_line_,
             cube.Path().string(), chunk_lines_, calibrator_.has_value() ? "calibrated" : "raw");
}

void LineStream::ReadRawLine(std::size_t line, std::span<float> rows)
{
    image_.cube->ReadLine(line, line_buffer_);
    for (std::size_t sample = 0; sample < samples_; ++sample)
    {
        for (std::size_t band = 0; band < bands_; ++band)
        {
            rows[sample * bands_ + band] = line_buffer_[band * samples_ + sample];
        }
    }
}

std::optional<SpectraMatrix> LineStream::NextChunk()
{
    if (finished_)
        return std::nullopt;

    const auto lines_in_chunk = std::min(chunk_lines_, end_line_ - next_line_ + 1);
    auto chunk = MakeSpectraMatrix(lines_in_chunk * samples_, bands_);
    const auto line_size = samples_ * bands_;

    for (std::size_t idx = 0; idx < lines_in_chunk; ++idx)
    {
        const auto line = next_line_ + idx;
        auto rows = std::span<float>{chunk.data}.subspan(idx * line_size, line_size);

        if (calibrator_.has_value())
        {
            const auto radiance = calibrator_->CalibrateLine(line);
            std::ranges::copy(radiance.data, rows.begin());
        }
        else
        {
            ReadRawLine(line, rows);
        }

        const auto processed = line - start_line_ + 1;
        if (progress_interval_ != 0 && processed % progress_interval_ == 0)
        {
            LOG_INFO("Processed {} of {} lines", processed, TotalLines());
        }
    }

    next_line_ += lines_in_chunk;
    if (next_line_ > end_line_)
    {
        finished_ = true;
        LOG_TRACE("Line range {}..{} exhausted", start_line_, end_line_);
    }
    return chunk;
}

void LineStream::Close() noexcept
{
    finished_ = true;
    calibrator_.reset();
    if (image_.cube != nullptr)
    {
        image_.cube->Close();
    }
}
