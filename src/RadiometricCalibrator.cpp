#include "RadiometricCalibrator.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cstddef>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>


namespace
{

void CheckCalibration(const RawCube &cube, const hyspex::BinaryHeader &header)
{
    if (!header.CalibrationAvailable())
    {
        LOG_ERROR("Binary header of sensor '{}' has no radiometric calibration", header.id);
        throw FormatError{"Calibration is not available for this cube"};
    }
    if (header.spectral_size != cube.Bands() || header.spatial_size != cube.Samples())
    {
        LOG_ERROR("Calibration describes {} bands x {} samples, cube has {} x {}",
                  header.spectral_size, header.spatial_size, cube.Bands(), cube.Samples());
        throw FormatError{"Calibration data does not match the cube dimensions"};
    }
    if (header.spectral_size < 2)
    {
        throw FormatError{"At least two bands are needed to derive band widths"};
    }
}

std::vector<double> ComputeBandwidths(const std::vector<double> &wavelengths)
{
    std::vector<double> widths(wavelengths.size());
    for (std::size_t band = 0; band + 1 < wavelengths.size(); ++band)
    {
        widths[band] = wavelengths[band + 1] - wavelengths[band];
    }
    widths.back() = widths[widths.size() - 2];
    return widths;
}

double ComputeScalingFactor(const hyspex::BinaryHeader &header)
{
    const auto integration_s = static_cast<float>(header.integration_time / 1e6);
    const double pixel_area = header.pixelsize_x * header.pixelsize_y;
    const double aperture_area = std::numbers::pi * header.aperture_size * header.aperture_size;

    return (pixel_area * integration_s * aperture_area * header.sf) / (planck_constant * speed_of_light_nm);
}

std::vector<float> ToFloat(const std::vector<double> &values)
{
    return std::vector<float>(values.begin(), values.end());
}

}


RadiometricCalibrator::RadiometricCalibrator(std::shared_ptr<const RawCube> cube,
                                             std::shared_ptr<const hyspex::BinaryHeader> header)
    : cube_{std::move(cube)}, header_{std::move(header)}
{
    if (cube_ == nullptr)
    {
        throw std::invalid_argument{"Calibrator needs an open cube"};
    }
    if (header_ == nullptr)
    {
        throw FormatError{"Calibration requires the binary header, cube " + cube_->Path().string() + " has none"};
    }
    CheckCalibration(*cube_, *header_);

    bands_ = header_->spectral_size;
    samples_ = header_->spatial_size;

    background_ = ToFloat(header_->background_before);
    response_ = ToFloat(header_->re);
    bandwidths_ = ComputeBandwidths(header_->spectral_calib);
    scaling_factor_ = ComputeScalingFactor(*header_);

    // the same spectral factor applies to every sample
    tensor_.resize(bands_ * samples_);
    for (std::size_t band = 0; band < bands_; ++band)
    {
        const auto value = static_cast<float>(
            header_->qe[band] * bandwidths_[band] * header_->spectral_calib[band] * scaling_factor_);
        std::fill_n(tensor_.begin() + static_cast<std::ptrdiff_t>(band * samples_), samples_, value);
    }

    LOG_INFO("Calibration tensor ready: {} bands x {} samples, scaling factor {:e}", bands_, samples_, scaling_factor_);
}

void RadiometricCalibrator::CalibrateSpectrum(std::span<float> spectrum, std::size_t sample) const noexcept
{
    for (std::size_t band = 0; band < bands_; ++band)
    {
        const auto idx = band * samples_ + sample;
        float value = spectrum[band] - background_[idx];
        value /= response_[idx];
        value /= tensor_[idx];
        spectrum[band] = value;
    }
}

SpectraMatrix RadiometricCalibrator::Calibrate(std::span<const std::size_t> lines,
                                               std::span<const std::size_t> samples) const
{
    if (lines.size() != samples.size())
    {
        throw std::invalid_argument{"Line and sample index lists differ in length"};
    }

    for (std::size_t idx = 0; idx < lines.size(); ++idx)
    {
        if (lines[idx] >= cube_->Lines() || samples[idx] >= samples_)
        {
            LOG_ERROR("Pixel (line {}, sample {}) is outside the cube of {} lines x {} samples",
                      lines[idx], samples[idx], cube_->Lines(), samples_);
            throw RangeError{"Pixel (line " + std::to_string(lines[idx]) + ", sample " +
                             std::to_string(samples[idx]) + ") is outside the cube"};
        }
    }

    auto radiance = MakeSpectraMatrix(lines.size(), bands_);
    for (std::size_t idx = 0; idx < lines.size(); ++idx)
    {
        auto spectrum = radiance.Row(idx);
        cube_->ReadSpectrum(lines[idx], samples[idx], spectrum);
        CalibrateSpectrum(spectrum, samples[idx]);
    }
    return radiance;
}

SpectraMatrix RadiometricCalibrator::CalibrateLine(std::size_t line) const
{
    if (line >= cube_->Lines())
    {
        throw RangeError{"Line " + std::to_string(line) + " is outside the cube of " +
                         std::to_string(cube_->Lines()) + " lines"};
    }

    std::vector<float> raw(bands_ * samples_);
    cube_->ReadLine(line, raw);

    auto radiance = MakeSpectraMatrix(samples_, bands_);
    for (std::size_t sample = 0; sample < samples_; ++sample)
    {
        auto spectrum = radiance.Row(sample);
        for (std::size_t band = 0; band < bands_; ++band)
        {
            spectrum[band] = raw[band * samples_ + sample];
        }
        CalibrateSpectrum(spectrum, sample);
    }
    return radiance;
}
