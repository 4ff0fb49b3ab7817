#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "EnviHeader.hpp"
#include "Errors.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>


TEST_CASE("Parse envi header", "[Envi]")
{
    constexpr static std::string_view input = R"V0G0N( ENVI
    bands = 64
    data type = 4
    interleave = bsq
    header offset = 0
    wavelength units = Nanometers
    byte order = 0
    wavelength = {405.79999, 415.39999, 424.89999, 434.39999, 443.89999,     453.5,
          463,     472.5,       482,     491.5,       501, 510.60001,
    520.09998, 529.59998, 539.09998, 548.59998, 558.09998, 567.59998,
    577.20001, 586.70001, 596.20001, 605.70001, 615.20001, 624.70001,
    634.20001, 643.79999, 653.29999, 662.79999, 672.29999, 681.79999,
    691.29999, 700.79999, 710.29999, 719.79999, 729.40002, 738.90002,
    748.40002, 757.90002, 767.40002, 776.90002, 786.40002, 795.90002,
        805.5,       815,     824.5,       834,     843.5,       853,
        862.5, 872.09998, 881.59998, 891.09998, 900.59998, 910.09998,
    919.59998, 929.20001, 938.70001, 948.20001, 957.70001, 967.20001,
    976.79999, 986.29999, 995.79999,     1005.3}
    lines = 325
    samples = 220
    )V0G0N";

    std::vector<float> vec_result = {405.79999f, 415.39999f, 424.89999f, 434.39999f, 443.89999f,     453.5f,
                                     463.f,     472.5f,       482.f,     491.5f,       501.f, 510.60001f,
                                     520.09998f, 529.59998f, 539.09998f, 548.59998f, 558.09998f, 567.59998f,
                                     577.20001f, 586.70001f, 596.20001f, 605.70001f, 615.20001f, 624.70001f,
                                     634.20001f, 643.79999f, 653.29999f, 662.79999f, 672.29999f, 681.79999f,
                                     691.29999f, 700.79999f, 710.29999f, 719.79999f, 729.40002f, 738.90002f,
                                     748.40002f, 757.90002f, 767.40002f, 776.90002f, 786.40002f, 795.90002f,
                                     805.5f,       815.f,     824.5f,       834.f,     843.5f,       853.f,
                                     862.5f, 872.09998f, 881.59998f, 891.09998f, 900.59998f, 910.09998f,
                                     919.59998f, 929.20001f, 938.70001f, 948.20001f, 957.70001f, 967.20001f,
                                     976.79999f, 986.29999f, 995.79999f,     1005.3f};

    std::stringstream stream{input.data()};
    auto envi = ParseEnviText(stream);

    REQUIRE(envi.bands_number == 64);
    REQUIRE(envi.data_type == DataType::FLOAT32);
    REQUIRE(envi.interleave == Interleave::BSQ);
    REQUIRE(envi.header_offset == 0);
    REQUIRE(envi.wavelength_unit == LengthUnits::NANO);
    REQUIRE(envi.byte_order == ByteOrder::LITTLE);
    REQUIRE(envi.lines_per_image == 325);
    REQUIRE(envi.samples_per_image == 220);


    REQUIRE(envi.wavelengths.has_value());

    auto vec_wave = envi.wavelengths.value();
    for (std::size_t idx = 0; idx < vec_wave.size(); ++idx)
    {
        REQUIRE(vec_wave[idx] == vec_result[idx]);
    }
}


namespace
{

constexpr std::string_view minimal_header = R"V0G0N(ENVI
samples = 1800
lines = 2500
bands = 186
header offset = 126608
data type = 12
interleave = bil
)V0G0N";

EnviHeader ParseString(const std::string &input, const envi::ParseOptions &options = {})
{
    std::stringstream stream{input};
    return ParseEnviText(stream, options);
}

std::string Without(std::string_view field)
{
    std::string text{minimal_header};
    const auto start = text.find(field);
    const auto end = text.find('\n', start);
    text.erase(start, end - start + 1);
    return text;
}

}

TEST_CASE("Parse HySpex header", "[Envi]")
{
    const auto envi = ParseString(std::string{minimal_header});

    REQUIRE(envi.samples_per_image == 1800);
    REQUIRE(envi.lines_per_image == 2500);
    REQUIRE(envi.bands_number == 186);
    REQUIRE(envi.header_offset == 126608);
    REQUIRE(envi.data_type == DataType::UINT16);
    REQUIRE(envi.interleave == Interleave::BIL);
    REQUIRE(envi.byte_order == ByteOrder::LITTLE);
    REQUIRE_FALSE(envi.wavelengths.has_value());
    REQUIRE(envi.fields.Size() == 6);
}

TEST_CASE("Missing required field", "[Envi]")
{
    auto field = GENERATE(as<std::string>{}, "samples", "lines", "bands", "header offset", "data type", "interleave");

    CAPTURE(field);
    REQUIRE_THROWS_AS(ParseString(Without(field)), FormatError);
}

TEST_CASE("Invalid field values", "[Envi]")
{
    std::string text{minimal_header};

    SECTION("Unknown interleave")
    {
        text += "interleave = bsx\n";
    }
    SECTION("Unknown data type code")
    {
        text += "data type = 7\n";
    }
    SECTION("Byte order out of range")
    {
        text += "byte order = 2\n";
    }
    SECTION("Non numeric count")
    {
        text += "samples = many\n";
    }
    SECTION("Negative count")
    {
        text += "lines = -4\n";
    }
    SECTION("List where a number is expected")
    {
        text += "bands = {1, 2}\n";
    }
    SECTION("Non numeric wavelength")
    {
        text += "wavelength = {400, abc}\n";
    }

    REQUIRE_THROWS_AS(ParseString(text), FormatError);
}

TEST_CASE("Unknown wavelength units are ignored", "[Envi]")
{
    std::string text{minimal_header};
    text += "wavelength units = parsecs\nbyte order = 1\n";

    const auto envi = ParseString(text);
    REQUIRE_FALSE(envi.wavelength_unit.has_value());
    REQUIRE(envi.byte_order == ByteOrder::BIG);
}

TEST_CASE("Case preserving keys still fill the typed header", "[Envi]")
{
    const auto envi = ParseString("ENVI\nSamples = 4\nLines = 2\nBands = 3\nHeader Offset = 0\n"
                                  "Data Type = 4\nInterleave = BSQ\n", envi::ParseOptions{.preserve_case = true});

    REQUIRE(envi.samples_per_image == 4);
    REQUIRE(envi.interleave == Interleave::BSQ);
    REQUIRE(envi.fields.Contains("Samples"));
}

TEST_CASE("Data type table", "[Envi]")
{
    REQUIRE(GetDataType(6) == DataType::COMPLEX32);
    REQUIRE(GetDataType(9) == DataType::COMPLEX64);
    REQUIRE_FALSE(GetDataType(8).has_value());
    REQUIRE(GetDataTypeSize(DataType::COMPLEX64) == 16);
    REQUIRE(GetDataTypeSize(DataType::UINT16) == 2);

    for (const uint32_t code : {1u, 2u, 3u, 4u, 5u, 6u, 9u, 12u, 13u, 14u, 15u})
    {
        REQUIRE(GetDataTypeCode(GetDataType(code).value()) == code);
    }
}

TEST_CASE("Missing header file", "[Envi]")
{
    REQUIRE_THROWS(LoadEnvi("/nonexistent/hyspexcpp/cube.hdr"));
}

TEST_CASE("Interleave names ignore case", "[Envi]")
{
    REQUIRE(GetInterleave("Bil") == Interleave::BIL);
    REQUIRE(GetInterleave("bSq") == Interleave::BSQ);
    REQUIRE(GetInterleave("BIP") == Interleave::BIP);
    REQUIRE_FALSE(GetInterleave("bilx").has_value());

    std::stringstream stream{"ENVI\nsamples = 2\nlines = 3\nbands = 4\nheader offset = 0\n"
                             "data type = 12\ninterleave = Bil\n"};
    REQUIRE(ParseEnviText(stream).interleave == Interleave::BIL);
}
