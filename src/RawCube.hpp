#ifndef HYSPEXCPP_RAWCUBE_HPP
#define HYSPEXCPP_RAWCUBE_HPP

#include "EnviHeader.hpp"

#include <cstddef>
#include <filesystem>
#include <span>


/**
 * @brief Read-only memory-mapped view of a raw cube.
 *
 * Elements are addressed logically as (line, band, sample) whatever the on-disk interleave. Pages are
 * loaded by the OS on first access, nothing is copied up front. The mapping is released by Close() or
 * the destructor.
 */
class RawCube
{
public:
    /// Maps \a path. The line count is derived from the file size and overrides the header value.
    RawCube(const std::filesystem::path &path, const EnviHeader &header);
    ~RawCube();

    RawCube(const RawCube &) = delete;
    RawCube& operator=(const RawCube &) = delete;
    RawCube(RawCube &&other) noexcept;
    RawCube& operator=(RawCube &&other) noexcept;

    [[nodiscard]] std::size_t Lines() const noexcept { return lines_; }
    [[nodiscard]] std::size_t Bands() const noexcept { return bands_; }
    [[nodiscard]] std::size_t Samples() const noexcept { return samples_; }
    [[nodiscard]] Interleave GetInterleave() const noexcept { return interleave_; }
    [[nodiscard]] DataType GetDataType() const noexcept { return data_type_; }
    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    /// Bytes in front of the pixel data, empty when the header offset is 0.
    [[nodiscard]] std::span<const std::byte> HeaderBytes() const;

    /// Single element, throws RangeError when outside the cube.
    [[nodiscard]] double At(std::size_t line, std::size_t band, std::size_t sample) const;

    /// All bands of one pixel, \a out must hold Bands() values.
    void ReadSpectrum(std::size_t line, std::size_t sample, std::span<float> out) const;

    /// One line as band-major [bands, samples], \a out must hold Bands() * Samples() values.
    void ReadLine(std::size_t line, std::span<float> out) const;

    [[nodiscard]] bool IsOpen() const noexcept { return !closed_; }

    void Close() noexcept;

private:
    [[nodiscard]] std::size_t Offset(std::size_t line, std::size_t band, std::size_t sample) const noexcept;

    void CheckIndex(std::size_t line, std::size_t band, std::size_t sample) const;

    void CheckOpen() const;

    template <typename Visitor>
    void VisitElementType(Visitor &&visitor) const;

    std::filesystem::path path_;
    Interleave interleave_;
    DataType data_type_;
    bool byte_swap_;
    std::size_t header_offset_;
    std::size_t element_size_;
    std::size_t lines_;
    std::size_t bands_;
    std::size_t samples_;

    const std::byte *map_ = nullptr;
    std::size_t map_size_ = 0;
    bool closed_ = false;
};

/// Number of whole lines between \a header_offset and the end of a file of \a file_size bytes.
[[nodiscard]] std::size_t LinesFromFileSize(std::size_t file_size, std::size_t header_offset,
                                            std::size_t samples, std::size_t bands, std::size_t element_size);

#endif //HYSPEXCPP_RAWCUBE_HPP
