#ifndef HYSPEXCPP_SPECTRAMATRIX_HPP
#define HYSPEXCPP_SPECTRAMATRIX_HPP

#include <cstddef>
#include <span>
#include <vector>


/// Row-major [rows, bands] block of spectra, one row per pixel.
struct SpectraMatrix
{
    std::size_t rows;
    std::size_t bands;
    std::vector<float> data;

    [[nodiscard]] float At(std::size_t row, std::size_t band) const { return data[row * bands + band]; }

    [[nodiscard]] std::span<const float> Row(std::size_t row) const
    {
        return std::span<const float>{data}.subspan(row * bands, bands);
    }

    [[nodiscard]] std::span<float> Row(std::size_t row)
    {
        return std::span<float>{data}.subspan(row * bands, bands);
    }
};

[[nodiscard]] inline SpectraMatrix MakeSpectraMatrix(std::size_t rows, std::size_t bands)
{
    return SpectraMatrix{.rows = rows, .bands = bands, .data = std::vector<float>(rows * bands)};
}

#endif //HYSPEXCPP_SPECTRAMATRIX_HPP
