#ifndef HYSPEXCPP_LINESTREAM_HPP
#define HYSPEXCPP_LINESTREAM_HPP

#include "HyspexImage.hpp"
#include "RadiometricCalibrator.hpp"
#include "SpectraMatrix.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>


struct StreamParameters
{
    std::size_t start_line = 0;
    std::optional<std::size_t> end_line;  // inclusive, last line of the cube when empty
    std::size_t chunk_lines = 100;
    bool calibrate = true;
    std::size_t progress_interval = 500;  // lines between progress messages, 0 disables them
};

/**
 * @brief Pull reader yielding a line range of a BIL cube in chunks of whole lines.
 *
 * Each chunk is [lines_in_chunk * samples, bands] float32 with pixels in line then sample order.
 * Chunks come strictly in line order, the last one may hold fewer lines, after it NextChunk() returns
 * std::nullopt. Only the chunk being assembled is held in memory.
 */
class LineStream
{
public:
    LineStream(const std::filesystem::path &cube_path, const StreamParameters &parameters);

    /// Throws FormatError for non-BIL or complex cubes or missing calibration, RangeError for a bad line range.
    LineStream(HyspexImage image, const StreamParameters &parameters);

    [[nodiscard]] std::optional<SpectraMatrix> NextChunk();

    /// Band centres, from the binary header when present, else the ENVI 'wavelength' list. Either has
    /// Bands() entries or is empty.
    [[nodiscard]] const std::vector<float>& Wavelengths() const noexcept { return wavelengths_; }

    [[nodiscard]] std::size_t TotalRows() const noexcept { return (end_line_ - start_line_ + 1) * samples_; }

    [[nodiscard]] std::size_t TotalLines() const noexcept { return end_line_ - start_line_ + 1; }

    [[nodiscard]] std::size_t Samples() const noexcept { return samples_; }
    [[nodiscard]] std::size_t Bands() const noexcept { return bands_; }
    [[nodiscard]] bool Calibrated() const noexcept { return calibrator_.has_value(); }

    [[nodiscard]] const HyspexImage& Image() const noexcept { return image_; }

    /// Releases the cube mapping, later calls to NextChunk() return std::nullopt.
    void Close() noexcept;

private:
    void ReadRawLine(std::size_t line, std::span<float> rows);

    HyspexImage image_;
    std::size_t start_line_;
    std::size_t end_line_;
    std::size_t chunk_lines_;
    std::size_t progress_interval_;
    std::size_t samples_;
    std::size_t bands_;

    std::optional<RadiometricCalibrator> calibrator_;
    std::vector<float> wavelengths_;
    std::vector<float> line_buffer_;

    std::size_t next_line_;
    bool finished_ = false;
};

#endif //HYSPEXCPP_LINESTREAM_HPP
