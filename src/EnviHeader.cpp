#include "EnviHeader.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "EnviParser.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <string>

using namespace envi;

namespace
{

constexpr std::array<std::string_view, 6> required_fields = {
    "samples", "lines", "bands", "interleave", "data type", "header offset"
};

const std::string& GetScalar(const Expression &expression)
{
    const auto *value = std::get_if<std::string>(&expression.value);
    if (value == nullptr)
    {
        throw FormatError{"Wrong type, expected single value in field '" + expression.field + "'"};
    }
    return *value;
}

template <typename T>
T ParseInteger(const Expression &expression)
{
    const auto &text = GetScalar(expression);

    T number{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec == std::errc::result_out_of_range)
    {
        throw FormatError{"Numeric value " + text + " out of range in field '" + expression.field + "'"};
    }
    if (ec != std::errc() || ptr != text.data() + text.size())
    {
        throw FormatError{"Wrong value '" + text + "', expected non-negative integer in field '" + expression.field + "'"};
    }
    return number;
}

std::vector<float> ParseFloats(const Expression &expression)
{
    const auto *list = std::get_if<std::vector<std::string>>(&expression.value);
    if (list == nullptr)
    {
        throw FormatError{"Wrong type, expected list in field '" + expression.field + "'"};
    }

    std::vector<float> values;
    values.reserve(list->size());
    for (const auto &item : *list)
    {
        float number{};
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), number);
        if (ec != std::errc() || ptr != item.data() + item.size())
        {
            throw FormatError{"Wrong value '" + item + "' in list of field '" + expression.field + "'"};
        }
        values.push_back(number);
    }
    return values;
}

}


std::optional<DataType> GetDataType(uint32_t value) noexcept
{
    switch (value)
    {
        case 1:
            return std::optional<DataType>{DataType::BYTE};
        case 2:
            return std::optional<DataType>{DataType::INT16};
        case 3:
            return std::optional<DataType>{DataType::INT32};
        case 4:
            return std::optional<DataType>{DataType::FLOAT32};
        case 5:
            return std::optional<DataType>{DataType::FLOAT64};
        case 6:
            return std::optional<DataType>{DataType::COMPLEX32};
        case 9:
            return std::optional<DataType>{DataType::COMPLEX64};
        case 12:
            return std::optional<DataType>{DataType::UINT16};
        case 13:
            return std::optional<DataType>{DataType::UINT32};
        case 14:
            return std::optional<DataType>{DataType::INT64};
        case 15:
            return std::optional<DataType>{DataType::UINT64};
        default:
            return std::optional<DataType>{std::nullopt};
    }
}

uint32_t GetDataTypeCode(DataType data_type) noexcept
{
    switch (data_type)
    {
        case DataType::BYTE:
            return 1;
        case DataType::INT16:
            return 2;
        case DataType::INT32:
            return 3;
        case DataType::FLOAT32:
            return 4;
        case DataType::FLOAT64:
            return 5;
        case DataType::COMPLEX32:
            return 6;
        case DataType::COMPLEX64:
            return 9;
        case DataType::UINT16:
            return 12;
        case DataType::UINT32:
            return 13;
        case DataType::INT64:
            return 14;
        case DataType::UINT64:
            return 15;
    }
    return 0;
}

std::size_t GetDataTypeSize(DataType data_type) noexcept
{
    switch (data_type)
    {
        case DataType::BYTE:
            return 1;
        case DataType::INT16:
        case DataType::UINT16:
            return 2;
        case DataType::INT32:
        case DataType::UINT32:
        case DataType::FLOAT32:
            return 4;
        case DataType::FLOAT64:
        case DataType::COMPLEX32:
        case DataType::INT64:
        case DataType::UINT64:
            return 8;
        case DataType::COMPLEX64:
            return 16;
    }
    return 0;
}

std::optional<Interleave> GetInterleave(std::string_view text)
{
    const auto lower = envi::ToLower(text);
    if (lower == "bsq")
        return std::optional<Interleave>{Interleave::BSQ};
    else if (lower == "bil")
        return std::optional<Interleave>{Interleave::BIL};
    else if (lower == "bip")
        return std::optional<Interleave>{Interleave::BIP};
    return std::optional<Interleave>{std::nullopt};
}

std::optional<LengthUnits> GetLengthUnits(std::string_view text) noexcept
{
    if (text == "Micrometers" || text == "um")
        return std::optional<LengthUnits>{LengthUnits::MICRO};
    else if (text == "Nanometers" || text == "nm")
        return std::optional<LengthUnits>{LengthUnits::NANO};
    else if (text == "Millimeters" || text == "mm")
        return std::optional<LengthUnits>{LengthUnits::MILLI};
    else if (text == "Centimeters" || text == "cm")
        return std::optional<LengthUnits>{LengthUnits::CENT};
    else if (text == "Meters" || text == "m")
        return std::optional<LengthUnits>{LengthUnits::METER};
    return std::optional<LengthUnits>{std::nullopt};
}


EnviHeader LoadEnvi(const std::filesystem::path &path, const ParseOptions &options)
{
    LOG_INFO("Loading file {}", path.string());

    std::ifstream file{path};
    if (!file.is_open())
    {
        LOG_ERROR("Cant open file {} to parse ENVI header", path.string());
        throw FormatError{"Cannot open ENVI header " + path.string()};
    }
    return ParseEnviText(file, options);
}


EnviHeader ParseEnviText(std::istream &iss, const ParseOptions &options)
{
    auto fields = ParseText(iss, options);
    LOG_TRACE("Parsed {} header fields", fields.Size());
    return MakeEnviHeader(std::move(fields));
}

EnviHeader MakeEnviHeader(Fields fields)
{
    for (const auto field : required_fields)
    {
        if (fields.FindNoCase(field) == nullptr)
        {
            LOG_ERROR("ENVI header is missing required field '{}'", field);
            throw FormatError{"Missing required field '" + std::string{field} + "'"};
        }
    }

    EnviHeader envi_header{};
    envi_header.byte_order = ByteOrder::LITTLE;

    for (const auto &[field, value] : fields)
    {
        const Expression expression{ToLower(field), value};
        if (!MatchExpression(expression, envi_header))
        {
            LOG_TRACE("Field '{}' is kept only in the raw field list", field);
        }
    }

    envi_header.fields = std::move(fields);
    return envi_header;
}

bool MatchExpression(const Expression &expression, EnviHeader &envi_header)
{
    if (expression.field == "bands")
    {
        envi_header.bands_number = ParseInteger<uint32_t>(expression);
    }
    else if (expression.field == "byte order")
    {
        auto value = ParseInteger<uint32_t>(expression);
        if (value != 0 && value != 1)
        {
            throw FormatError{"Wrong value in field 'byte order', expected '0' or '1'"};
        }
        envi_header.byte_order = static_cast<ByteOrder>(value);
    }
    else if (expression.field == "data type")
    {
        auto opt_data_type = GetDataType(ParseInteger<uint32_t>(expression));
        if (!opt_data_type.has_value())
        {
            throw FormatError{"Wrong value in field 'data type', value does not match any data type value"};
        }
        envi_header.data_type = opt_data_type.value();
    }
    else if (expression.field == "header offset")
    {
        envi_header.header_offset = ParseInteger<std::size_t>(expression);
    }
    else if (expression.field == "interleave")
    {
        const auto &value = GetScalar(expression);
        auto opt_interleave = GetInterleave(value);
        if (!opt_interleave.has_value())
        {
            throw FormatError{"Unknown interleave '" + value + "', expected bil, bip or bsq"};
        }
        envi_header.interleave = opt_interleave.value();
    }
    else if (expression.field == "lines")
    {
        envi_header.lines_per_image = ParseInteger<std::size_t>(expression);
    }
    else if (expression.field == "samples")
    {
        envi_header.samples_per_image = ParseInteger<uint32_t>(expression);
    }
    else if (expression.field == "wavelength units")
    {
        auto opt_unit = GetLengthUnits(GetScalar(expression));
        if (!opt_unit.has_value())
        {
            LOG_WARN("Value in field 'wavelength units' does not match known measure unit, ignored");
        }
        envi_header.wavelength_unit = opt_unit;
    }
    else if (expression.field == "wavelength")
    {
        envi_header.wavelengths = ParseFloats(expression);
    }
    else
    {
        return false;
    }
    return true;
}
