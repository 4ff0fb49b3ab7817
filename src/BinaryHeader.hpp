#ifndef HYSPEXCPP_BINARYHEADER_HPP
#define HYSPEXCPP_BINARYHEADER_HPP

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <bit>
#include <type_traits>


namespace hyspex
{

inline constexpr std::string_view magic_word = "HYSPEX";

/// Bytes occupied by the scalar part of the record, the arrays follow directly.
inline constexpr std::size_t fixed_header_size = 2181;

/**
 * @brief Binary preamble written by the HySpex acquisition software in front of the pixel cube.
 *
 * Field order follows the on-disk layout. \a re and \a background_before are row-major
 * [spectral_size, spatial_size].
 */
struct BinaryHeader
{
    int32_t size;
    uint32_t serial_number;
    std::string configfile;
    std::string settingfile;
    double scaling_factor;
    uint32_t electronics;
    uint32_t comsettings_electronics;
    std::string comport_electronics;
    uint32_t fanspeed;
    uint32_t backtemperature;
    std::string comport;
    std::string detectstring;
    std::string sensor;
    std::string framegrabber;
    std::string id;
    std::string supplier;
    std::string left_gain;
    std::string right_gain;
    std::string comment;
    std::string backgroundfile;
    std::string record_hd;
    uint32_t unknown_ptr1;
    uint32_t serverindex;
    uint32_t comsettings;
    uint32_t number_of_background;
    uint32_t spectral_size;
    uint32_t spatial_size;
    uint32_t binning;
    uint32_t detected;
    uint32_t integration_time;  // microseconds
    uint32_t frame_period;
    uint32_t default_r;
    uint32_t default_g;
    uint32_t default_b;
    uint32_t bitshift;
    uint32_t temperature_offset;
    uint32_t shutter;
    uint32_t background_present;
    uint32_t power;
    uint32_t current;
    uint32_t bias;
    uint32_t bandwidth;
    uint32_t vin;
    uint32_t vref;
    uint32_t sensor_vin;
    uint32_t sensor_vref;
    uint32_t cooling_temperature;
    uint32_t window_start;
    uint32_t window_stop;
    uint32_t readout_time;
    uint32_t p;
    uint32_t i;
    uint32_t d;
    uint32_t numberofframes;
    uint32_t nobp;
    uint32_t dw;
    uint32_t eq;
    uint32_t lens;
    uint32_t fov_exp;
    uint32_t scanning_mode;
    uint32_t calib_available;
    uint32_t number_of_avg;
    double sf;             // DN per photoelectron
    double aperture_size;
    double pixelsize_x;    // radians
    double pixelsize_y;
    double temperature;
    double max_framerate;
    uint32_t spectral_calib_pointer;
    uint32_t re_pointer;
    uint32_t qe_pointer;
    uint32_t background_pointer;
    uint32_t bad_pixels_pointer;
    uint32_t image_format;

    std::vector<double> spectral_calib;     // band centres in nm
    std::vector<double> qe;
    std::vector<double> re;
    std::vector<double> background_before;
    std::vector<uint32_t> bad_pixels;

    [[nodiscard]] bool CalibrationAvailable() const noexcept { return calib_available != 0; }

    /// Element of the response matrix for \a band and \a sample.
    [[nodiscard]] double Response(std::size_t band, std::size_t sample) const { return re[band * spatial_size + sample]; }

    [[nodiscard]] double Background(std::size_t band, std::size_t sample) const
    {
        return background_before[band * spatial_size + sample];
    }

    template<class Archive>
    void serialize(Archive &archive)
    {
        archive(
            CEREAL_NVP(size), CEREAL_NVP(serial_number), CEREAL_NVP(configfile), CEREAL_NVP(settingfile),
            CEREAL_NVP(scaling_factor), CEREAL_NVP(electronics), CEREAL_NVP(comsettings_electronics),
            CEREAL_NVP(comport_electronics), CEREAL_NVP(fanspeed), CEREAL_NVP(backtemperature),
            CEREAL_NVP(comport), CEREAL_NVP(detectstring), CEREAL_NVP(sensor), CEREAL_NVP(framegrabber),
            CEREAL_NVP(id), CEREAL_NVP(supplier), CEREAL_NVP(left_gain), CEREAL_NVP(right_gain),
            CEREAL_NVP(comment), CEREAL_NVP(backgroundfile), CEREAL_NVP(record_hd));
        archive(
            CEREAL_NVP(unknown_ptr1), CEREAL_NVP(serverindex), CEREAL_NVP(comsettings),
            CEREAL_NVP(number_of_background), CEREAL_NVP(spectral_size), CEREAL_NVP(spatial_size),
            CEREAL_NVP(binning), CEREAL_NVP(detected), CEREAL_NVP(integration_time), CEREAL_NVP(frame_period),
            CEREAL_NVP(default_r), CEREAL_NVP(default_g), CEREAL_NVP(default_b), CEREAL_NVP(bitshift),
            CEREAL_NVP(temperature_offset), CEREAL_NVP(shutter), CEREAL_NVP(background_present),
            CEREAL_NVP(power), CEREAL_NVP(current), CEREAL_NVP(bias), CEREAL_NVP(bandwidth));
        archive(
            CEREAL_NVP(vin), CEREAL_NVP(vref), CEREAL_NVP(sensor_vin), CEREAL_NVP(sensor_vref),
            CEREAL_NVP(cooling_temperature), CEREAL_NVP(window_start), CEREAL_NVP(window_stop),
            CEREAL_NVP(readout_time), CEREAL_NVP(p), CEREAL_NVP(i), CEREAL_NVP(d), CEREAL_NVP(numberofframes),
            CEREAL_NVP(nobp), CEREAL_NVP(dw), CEREAL_NVP(eq), CEREAL_NVP(lens), CEREAL_NVP(fov_exp),
            CEREAL_NVP(scanning_mode), CEREAL_NVP(calib_available), CEREAL_NVP(number_of_avg));
        archive(
            CEREAL_NVP(sf), CEREAL_NVP(aperture_size), CEREAL_NVP(pixelsize_x), CEREAL_NVP(pixelsize_y),
            CEREAL_NVP(temperature), CEREAL_NVP(max_framerate), CEREAL_NVP(spectral_calib_pointer),
            CEREAL_NVP(re_pointer), CEREAL_NVP(qe_pointer), CEREAL_NVP(background_pointer),
            CEREAL_NVP(bad_pixels_pointer), CEREAL_NVP(image_format));
        archive(
            CEREAL_NVP(spectral_calib), CEREAL_NVP(qe), CEREAL_NVP(re), CEREAL_NVP(background_before),
            CEREAL_NVP(bad_pixels));
    }
};


/**
 * @brief Forward-only little-endian reader over a byte buffer.
 *
 * Every read names the field it decodes so a truncated buffer reports which field was cut.
 */
class ByteCursor
{
public:
    explicit ByteCursor(std::span<const std::byte> data) noexcept: data_{data}, pos_{0} {}

    template <typename T>
    [[nodiscard]] T Read(std::string_view field)
    {
        static_assert(std::is_arithmetic_v<T>);
        const auto bytes = Take(sizeof(T), field);
        return Decode<T>(bytes.data());
    }

    /// Fixed-width text field, trailing NUL padding removed.
    [[nodiscard]] std::string ReadString(std::size_t width, std::string_view field);

    template <typename T>
    [[nodiscard]] std::vector<T> ReadArray(std::size_t count, std::string_view field)
    {
        if (count != 0 && count > (data_.size() - pos_) / sizeof(T))
        {
            ThrowTruncated(field, count * sizeof(T));
        }
        const auto bytes = Take(count * sizeof(T), field);

        std::vector<T> values(count);
        for (std::size_t idx = 0; idx < count; ++idx)
        {
            values[idx] = Decode<T>(bytes.data() + idx * sizeof(T));
        }
        return values;
    }

    [[nodiscard]] std::size_t Position() const noexcept { return pos_; }

private:
    std::span<const std::byte> Take(std::size_t count, std::string_view field);

    [[noreturn]] void ThrowTruncated(std::string_view field, std::size_t wanted) const;

    template <typename T>
    [[nodiscard]] static T Decode(const std::byte *ptr) noexcept
    {
        using Bits = std::conditional_t<sizeof(T) == 1, uint8_t,
                     std::conditional_t<sizeof(T) == 2, uint16_t,
                     std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;

        Bits bits = 0;
        for (std::size_t idx = 0; idx < sizeof(T); ++idx)
        {
            bits |= static_cast<Bits>(std::to_integer<uint8_t>(ptr[idx])) << (8 * idx);
        }
        return std::bit_cast<T>(bits);
    }

    std::span<const std::byte> data_;
    std::size_t pos_;
};

/**
 * @brief Decodes the binary preamble of a HySpex raw file.
 *
 * Array lengths come from spectral_size, spatial_size and nobp read earlier in the same pass, so the
 * decode is a single sequential walk. Throws FormatError when the magic word is not 'HYSPEX' or the
 * buffer ends before a declared field.
 */
[[nodiscard]] BinaryHeader ParseBinaryHeader(std::span<const std::byte> data);

/// Writes \a header as JSON.
void DumpBinaryHeader(const BinaryHeader &header, std::ostream &os);

}

#endif //HYSPEXCPP_BINARYHEADER_HPP
