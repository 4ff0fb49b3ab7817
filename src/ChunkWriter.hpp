#ifndef HYSPEXCPP_CHUNKWRITER_HPP
#define HYSPEXCPP_CHUNKWRITER_HPP

#include "LineStream.hpp"
#include "Settings.hpp"
#include "SpectraMatrix.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>


/// Consumer of a chunk sequence. Begin() once, Write() per chunk in order, Finish() once.
class ChunkSink
{
public:
    virtual ~ChunkSink() = default;

    /// \a wavelengths holds \a bands centres or is empty.
    virtual void Begin(std::span<const float> wavelengths, std::size_t samples, std::size_t lines,
                       std::size_t bands) = 0;

    virtual void Write(const SpectraMatrix &chunk) = 0;

    virtual void Finish() = 0;
};

/**
 * @brief Writes chunks as an ENVI BIP cube, '<basename>.bip' plus '<basename>.hdr'.
 *
 * Float mode stores float32. Int mode stores int32 from QuantizeFixed and records the factor in the
 * 'scale factor' header key, value = integer * scale factor.
 */
class EnviWriter : public ChunkSink
{
public:
    EnviWriter(const std::filesystem::path &basename, OutputMode mode, double scale_factor = 1e-6);

    void Begin(std::span<const float> wavelengths, std::size_t samples, std::size_t lines,
               std::size_t bands) override;

    void Write(const SpectraMatrix &chunk) override;

    /// Throws std::runtime_error when fewer or more rows than announced were written.
    void Finish() override;

    [[nodiscard]] const std::filesystem::path& DataPath() const noexcept { return data_path_; }
    [[nodiscard]] const std::filesystem::path& HeaderPath() const noexcept { return header_path_; }
    [[nodiscard]] std::size_t RowsWritten() const noexcept { return rows_written_; }

private:
    void WriteHeader() const;

    std::filesystem::path data_path_;
    std::filesystem::path header_path_;
    OutputMode mode_;
    double scale_factor_;

    std::ofstream data_;
    std::vector<float> wavelengths_;
    std::size_t samples_ = 0;
    std::size_t lines_ = 0;
    std::size_t bands_ = 0;
    std::size_t rows_written_ = 0;
};

/// Drains \a stream into \a sink and returns the number of chunks written.
std::size_t WriteStream(LineStream &stream, ChunkSink &sink);

#endif //HYSPEXCPP_CHUNKWRITER_HPP
