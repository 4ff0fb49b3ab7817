#include "RawCube.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>


namespace
{

template <typename T>
T LoadElement(const std::byte *ptr, bool byte_swap) noexcept
{
    std::array<std::byte, sizeof(T)> bytes{};
    std::memcpy(bytes.data(), ptr, sizeof(T));
    if (byte_swap)
    {
        std::ranges::reverse(bytes);
    }
    return std::bit_cast<T>(bytes);
}

}


std::size_t LinesFromFileSize(std::size_t file_size, std::size_t header_offset,
                              std::size_t samples, std::size_t bands, std::size_t element_size)
{
    const std::size_t line_bytes = samples * bands * element_size;
    if (line_bytes == 0)
    {
        throw FormatError{"Cube declares zero samples or bands"};
    }
    if (file_size < header_offset)
    {
        throw FormatError{"Header offset " + std::to_string(header_offset) + " lies beyond the end of the file"};
    }
    return (file_size - header_offset) / line_bytes;
}

RawCube::RawCube(const std::filesystem::path &path, const EnviHeader &header)
    : path_{path},
      interleave_{header.interleave},
      data_type_{header.data_type},
      byte_swap_{(header.byte_order == ByteOrder::BIG) != (std::endian::native == std::endian::big)},
      header_offset_{header.header_offset},
      element_size_{GetDataTypeSize(header.data_type)},
      lines_{0},
      bands_{header.bands_number},
      samples_{header.samples_per_image}
{
    std::error_code ec;
    const auto file_size = static_cast<std::size_t>(std::filesystem::file_size(path_, ec));
    if (ec)
    {
        LOG_ERROR("Cant read size of raw cube {}: {}", path_.string(), ec.message());
        throw std::system_error{ec, "Cannot stat raw cube " + path_.string()};
    }

    lines_ = LinesFromFileSize(file_size, header_offset_, samples_, bands_, element_size_);
    if (lines_ != header.lines_per_image)
    {
        LOG_WARN("Number of lines does not match file size: estimated {} (header {}) in {}",
                 lines_, header.lines_per_image, path_.string());
    }

    if (file_size == 0)
        return;

    const int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd < 0)
    {
        throw std::system_error{errno, std::generic_category(), "Cannot open raw cube " + path_.string()};
    }

    void *ptr = ::mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
    const int map_error = errno;
    if (::close(fd) != 0)
    {
        LOG_WARN("Closing descriptor of {} failed: {}", path_.string(), std::strerror(errno));
    }
    if (ptr == MAP_FAILED)
    {
        throw std::system_error{map_error, std::generic_category(), "Cannot map raw cube " + path_.string()};
    }

    if (::madvise(ptr, file_size, MADV_SEQUENTIAL) != 0)
    {
        LOG_TRACE("madvise on {} failed: {}", path_.string(), std::strerror(errno));
    }

    map_ = static_cast<const std::byte *>(ptr);
    map_size_ = file_size;

    LOG_INFO("Mapped {}: {} lines, {} bands, {} samples, interleave {}",
             path_.string(), lines_, bands_, samples_, to_string(interleave_));
}

RawCube::~RawCube()
{
    Close();
}

RawCube::RawCube(RawCube &&other) noexcept
    : path_{std::move(other.path_)},
      interleave_{other.interleave_},
      data_type_{other.data_type_},
      byte_swap_{other.byte_swap_},
      header_offset_{other.header_offset_},
      element_size_{other.element_size_},
      lines_{other.lines_},
      bands_{other.bands_},
      samples_{other.samples_},
      map_{std::exchange(other.map_, nullptr)},
      map_size_{std::exchange(other.map_size_, 0)},
      closed_{std::exchange(other.closed_, true)}
{
}

RawCube& RawCube::operator=(RawCube &&other) noexcept
{
    if (this != &other)
    {
        Close();
        path_ = std::move(other.path_);
        interleave_ = other.interleave_;
        data_type_ = other.data_type_;
        byte_swap_ = other.byte_swap_;
        header_offset_ = other.header_offset_;
        element_size_ = other.element_size_;
        lines_ = other.lines_;
        bands_ = other.bands_;
        samples_ = other.samples_;
        map_ = std::exchange(other.map_, nullptr);
        map_size_ = std::exchange(other.map_size_, 0);
        closed_ = std::exchange(other.closed_, true);
    }
    return *this;
}

void RawCube::Close() noexcept
{
    if (map_ != nullptr)
    {
        if (::munmap(const_cast<std::byte *>(map_), map_size_) != 0)
        {
            LOG_ERROR("Unmapping {} failed: {}", path_.string(), std::strerror(errno));
        }
        LOG_TRACE("Released mapping of {}", path_.string());
    }
    map_ = nullptr;
    map_size_ = 0;
    closed_ = true;
}

std::span<const std::byte> RawCube::HeaderBytes() const
{
    CheckOpen();
    if (header_offset_ == 0)
        return {};
    return std::span<const std::byte>{map_, header_offset_};
}

std::size_t RawCube::Offset(std::size_t line, std::size_t band, std::size_t sample) const noexcept
{
    switch (interleave_)
    {
        case Interleave::BIL:
            return (line * bands_ + band) * samples_ + sample;
        case Interleave::BIP:
            return (line * samples_ + sample) * bands_ + band;
        case Interleave::BSQ:
            return (band * lines_ + line) * samples_ + sample;
    }
    return 0;
}

void RawCube::CheckIndex(std::size_t line, std::size_t band, std::size_t sample) const
{
    if (line >= lines_ || band >= bands_ || sample >= samples_)
    {
        throw RangeError{"Index (line " + std::to_string(line) + ", band " + std::to_string(band) +
                         ", sample " + std::to_string(sample) + ") outside cube of " + std::to_string(lines_) +
                         " lines, " + std::to_string(bands_) + " bands, " + std::to_string(samples_) + " samples"};
    }
}

void RawCube::CheckOpen() const
{
    if (closed_)
    {
        throw std::runtime_error{"Raw cube " + path_.string() + " is closed"};
    }
}

template <typename Visitor>
void RawCube::VisitElementType(Visitor &&visitor) const
{
    switch (data_type_)
    {
        case DataType::BYTE:
            visitor(uint8_t{});
            return;
        case DataType::INT16:
            visitor(int16_t{});
            return;
        case DataType::INT32:
            visitor(int32_t{});
            return;
        case DataType::FLOAT32:
            visitor(float{});
            return;
        case DataType::FLOAT64:
            visitor(double{});
            return;
        case DataType::UINT16:
            visitor(uint16_t{});
            return;
        case DataType::UINT32:
            visitor(uint32_t{});
            return;
        case DataType::INT64:
            visitor(int64_t{});
            return;
        case DataType::UINT64:
            visitor(uint64_t{});
            return;
        case DataType::COMPLEX32:
        case DataType::COMPLEX64:
            break;
    }
    throw FormatError{"Complex data types cannot be read as real values"};
}

double RawCube::At(std::size_t line, std::size_t band, std::size_t sample) const
{
    CheckOpen();
    CheckIndex(line, band, sample);

    const std::byte *element = map_ + header_offset_ + Offset(line, band, sample) * element_size_;

    double value = 0.0;
    VisitElementType([&]<typename T>(T) {
        value = static_cast<double>(LoadElement<T>(element, byte_swap_));
    });
    return value;
}

void RawCube::ReadSpectrum(std::size_t line, std::size_t sample, std::span<float> out) const
{
    if (out.size() != bands_)
    {
        throw std::invalid_argument{"Spectrum buffer must hold " + std::to_string(bands_) + " values"};
    }
    CheckOpen();
    CheckIndex(line, 0, sample);

    const std::byte *data = map_ + header_offset_;
    VisitElementType([&]<typename T>(T) {
        for (std::size_t band = 0; band < bands_; ++band)
        {
            out[band] = static_cast<float>(LoadElement<T>(data + Offset(line, band, sample) * element_size_, byte_swap_));
        }
    });
}

void RawCube::ReadLine(std::size_t line, std::span<float> out) const
{
    if (out.size() != bands_ * samples_)
    {
        throw std::invalid_argument{"Line buffer must hold " + std::to_string(bands_ * samples_) + " values"};
    }
    CheckOpen();
    CheckIndex(line, 0, 0);

    const std::byte *data = map_ + header_offset_;
    VisitElementType([&]<typename T>(T) {
        for (std::size_t band = 0; band < bands_; ++band)
        {
            for (std::size_t sample = 0; sample < samples_; ++sample)
            {
                out[band * samples_ + sample] =
                    static_cast<float>(LoadElement<T>(data + Offset(line, band, sample) * element_size_, byte_swap_));
            }
        }
    });
}
