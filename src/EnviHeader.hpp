#ifndef HYSPEXCPP_ENVIHEADER_HPP
#define HYSPEXCPP_ENVIHEADER_HPP

#include "EnviParser.hpp"

#include <cstdint>
#include <vector>
#include <optional>
#include <string_view>
#include <filesystem>


enum class ByteOrder
{
    LITTLE = 0, BIG = 1
};

enum class DataType
{
    BYTE,
    INT16,
    INT32,
    FLOAT32,
    FLOAT64,
    COMPLEX32,
    COMPLEX64,
    UINT16,
    UINT32,
    INT64,
    UINT64
};

[[nodiscard]] std::optional<DataType> GetDataType(uint32_t value) noexcept;

[[nodiscard]] uint32_t GetDataTypeCode(DataType data_type) noexcept;

/// Element width in bytes, complex types count both components.
[[nodiscard]] std::size_t GetDataTypeSize(DataType data_type) noexcept;

enum class Interleave
{
    BSQ, BIL, BIP
};

/// Case-insensitive, 'Bil' and 'BIL' both map to Interleave::BIL.
[[nodiscard]] std::optional<Interleave> GetInterleave(std::string_view text);

[[nodiscard]] constexpr std::string_view to_string(Interleave interleave) noexcept
{
    switch (interleave)
    {
        case Interleave::BSQ:
            return "bsq";
        case Interleave::BIL:
            return "bil";
        case Interleave::BIP:
            return "bip";
    }
    return "";
}

enum class LengthUnits
{
    MICRO, NANO, MILLI, CENT, METER
};

[[nodiscard]] std::optional<LengthUnits> GetLengthUnits(std::string_view text) noexcept;

struct EnviHeader
{
    uint32_t bands_number;
    ByteOrder byte_order;
    DataType data_type;
    std::size_t header_offset;
    Interleave interleave;
    std::size_t lines_per_image;
    uint32_t samples_per_image;

    std::optional<LengthUnits> wavelength_unit;
    std::optional<std::vector<float>> wavelengths;

    envi::Fields fields;
};

[[nodiscard]] EnviHeader LoadEnvi(const std::filesystem::path &path, const envi::ParseOptions &options = {});

[[nodiscard]] EnviHeader ParseEnviText(std::istream &iss, const envi::ParseOptions &options = {});

/// Builds the typed header, throws FormatError when a required key is missing or has a bad value.
[[nodiscard]] EnviHeader MakeEnviHeader(envi::Fields fields);

/// Returns true when \a expression names a field of EnviHeader and was stored in \a envi_header.
bool MatchExpression(const envi::Expression &expression, EnviHeader &envi_header);

#endif //HYSPEXCPP_ENVIHEADER_HPP
