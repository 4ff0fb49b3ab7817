#include "BinaryHeader.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cereal/archives/json.hpp>



namespace hyspex
{

std::span<const std::byte> ByteCursor::Take(std::size_t count, std::string_view field)
{
    if (count > data_.size() - pos_)
    {
        ThrowTruncated(field, count);
    }
    auto bytes = data_.subspan(pos_, count);
    pos_ += count;
    return bytes;
}

void ByteCursor::ThrowTruncated(std::string_view field, std::size_t wanted) const
{
    LOG_ERROR("Binary header truncated at field '{}', offset {}, needs {} bytes, {} left",
              field, pos_, wanted, data_.size() - pos_);
    throw FormatError{"Binary header truncated while reading field '" + std::string{field} + "'"};
}

std::string ByteCursor::ReadString(std::size_t width, std::string_view field)
{
    const auto bytes = Take(width, field);

    // latin-1 maps byte values one to one onto the first 256 code points
    std::string text(width, '\0');
    for (std::size_t idx = 0; idx < width; ++idx)
    {
        text[idx] = static_cast<char>(bytes[idx]);
    }

    const auto last = text.find_last_not_of('\0');
    text.erase(last == std::string::npos ? 0 : last + 1);
    return text;
}


BinaryHeader ParseBinaryHeader(std::span<const std::byte> data)
{
    ByteCursor cursor{data};

    const auto word = cursor.ReadString(8, "magic");
    if (word != magic_word)
    {
        LOG_ERROR("Expected binary header magic word '{}', got '{}'", magic_word, word);
        throw FormatError{"Unknown binary file format"};
    }

    BinaryHeader header{};

    header.size = cursor.Read<int32_t>("size");
    header.serial_number = cursor.Read<uint32_t>("serial_number");
    header.configfile = cursor.ReadString(200, "configfile");
    header.settingfile = cursor.ReadString(120, "settingfile");
    header.scaling_factor = cursor.Read<double>("scaling_factor");
    header.electronics = cursor.Read<uint32_t>("electronics");
    header.comsettings_electronics = cursor.Read<uint32_t>("comsettings_electronics");
    header.comport_electronics = cursor.ReadString(56, "comport_electronics");
    header.fanspeed = cursor.Read<uint32_t>("fanspeed");
    header.backtemperature = cursor.Read<uint32_t>("backtemperature");
    header.comport = cursor.ReadString(64, "comport");
    header.detectstring = cursor.ReadString(200, "detectstring");
    header.sensor = cursor.ReadString(200, "sensor");
    header.framegrabber = cursor.ReadString(200, "framegrabber");
    header.id = cursor.ReadString(200, "id");
    header.supplier = cursor.ReadString(200, "supplier");
    header.left_gain = cursor.ReadString(32, "left_gain");
    header.right_gain = cursor.ReadString(32, "right_gain");
    header.comment = cursor.ReadString(200, "comment");
    header.backgroundfile = cursor.ReadString(200, "backgroundfile");
    header.record_hd = cursor.ReadString(1, "record_hd");

    header.unknown_ptr1 = cursor.Read<uint32_t>("unknown_ptr1");
    header.serverindex = cursor.Read<uint32_t>("serverindex");
    header.comsettings = cursor.Read<uint32_t>("comsettings");
    header.number_of_background = cursor.Read<uint32_t>("number_of_background");
    header.spectral_size = cursor.Read<uint32_t>("spectral_size");
    header.spatial_size = cursor.Read<uint32_t>("spatial_size");
    header.binning = cursor.Read<uint32_t>("binning");
    header.detected = cursor.Read<uint32_t>("detected");
    header.integration_time = cursor.Read<uint32_t>("integration_time");
    header.frame_period = cursor.Read<uint32_t>("frame_period");
    header.default_r = cursor.Read<uint32_t>("default_r");
    header.default_g = cursor.Read<uint32_t>("default_g");
    header.default_b = cursor.Read<uint32_t>("default_b");
    header.bitshift = cursor.Read<uint32_t>("bitshift");
    header.temperature_offset = cursor.Read<uint32_t>("temperature_offset");
    header.shutter = cursor.Read<uint32_t>("shutter");
    header.background_present = cursor.Read<uint32_t>("background_present");
    header.power = cursor.Read<uint32_t>("power");
    header.current = cursor.Read<uint32_t>("current");
    header.bias = cursor.Read<uint32_t>("bias");
    header.bandwidth = cursor.Read<uint32_t>("bandwidth");
    header.vin = cursor.Read<uint32_t>("vin");
    header.vref = cursor.Read<uint32_t>("vref");
    header.sensor_vin = cursor.Read<uint32_t>("sensor_vin");
    header.sensor_vref = cursor.Read<uint32_t>("sensor_vref");
    header.cooling_temperature = cursor.Read<uint32_t>("cooling_temperature");
    header.window_start = cursor.Read<uint32_t>("window_start");
    header.window_stop = cursor.Read<uint32_t>("window_stop");
    header.readout_time = cursor.Read<uint32_t>("readout_time");
    header.p = cursor.Read<uint32_t>("p");
    header.i = cursor.Read<uint32_t>("i");
    header.d = cursor.Read<uint32_t>("d");
    header.numberofframes = cursor.Read<uint32_t>("numberofframes");
    header.nobp = cursor.Read<uint32_t>("nobp");
    header.dw = cursor.Read<uint32_t>("dw");
    header.eq = cursor.Read<uint32_t>("eq");
    header.lens = cursor.Read<uint32_t>("lens");
    header.fov_exp = cursor.Read<uint32_t>("fov_exp");
    header.scanning_mode = cursor.Read<uint32_t>("scanning_mode");
    header.calib_available = cursor.Read<uint32_t>("calib_available");
    header.number_of_avg = cursor.Read<uint32_t>("number_of_avg");

    header.sf = cursor.Read<double>("sf");
    header.aperture_size = cursor.Read<double>("aperture_size");
    header.pixelsize_x = cursor.Read<double>("pixelsize_x");
    header.pixelsize_y = cursor.Read<double>("pixelsize_y");
    header.temperature = cursor.Read<double>("temperature");
    header.max_framerate = cursor.Read<double>("max_framerate");

    header.spectral_calib_pointer = cursor.Read<uint32_t>("spectral_calib_pointer");
    header.re_pointer = cursor.Read<uint32_t>("re_pointer");
    header.qe_pointer = cursor.Read<uint32_t>("qe_pointer");
    header.background_pointer = cursor.Read<uint32_t>("background_pointer");
    header.bad_pixels_pointer = cursor.Read<uint32_t>("bad_pixels_pointer");
    header.image_format = cursor.Read<uint32_t>("image_format");

    // both factors are 32-bit so the product fits in 64 bits
    const std::size_t matrix_size = static_cast<std::size_t>(header.spectral_size) * header.spatial_size;

    header.spectral_calib = cursor.ReadArray<double>(header.spectral_size, "spectral_calib");
    header.qe = cursor.ReadArray<double>(header.spectral_size, "qe");
    header.re = cursor.ReadArray<double>(matrix_size, "re");
    header.background_before = cursor.ReadArray<double>(matrix_size, "background_before");
    header.bad_pixels = cursor.ReadArray<uint32_t>(header.nobp, "bad_pixels");

    LOG_INFO("Binary header of sensor '{}' (SN {}): {} bands, {} samples, {} bad pixels, {} bytes",
             header.id, header.serial_number, header.spectral_size, header.spatial_size, header.nobp,
             cursor.Position());
    return header;
}

void DumpBinaryHeader(const BinaryHeader &header, std::ostream &os)
{
    cereal::JSONOutputArchive archive(os);
    archive(cereal::make_nvp("hyspex", header));
}

}
