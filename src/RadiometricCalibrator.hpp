#ifndef HYSPEXCPP_RADIOMETRICCALIBRATOR_HPP
#define HYSPEXCPP_RADIOMETRICCALIBRATOR_HPP

#include "BinaryHeader.hpp"
#include "RawCube.hpp"
#include "SpectraMatrix.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <vector>


/// Planck constant [J s].
inline constexpr double planck_constant = 6.62607004e-34;

/// Speed of light in nanometres per second, wavelengths in the binary header are in nm.
inline constexpr double speed_of_light_nm = 2.99792458e17;

/**
 * @brief Converts raw digital numbers into spectral radiance.
 *
 * Background, response and the calibration tensor are [bands, samples] float32 buffers built once in
 * the constructor. For a pixel (line, sample) radiance in band b is
 * (raw - background[b, sample]) / response[b, sample] / tensor[b, sample], evaluated in float32.
 */
class RadiometricCalibrator
{
public:
    /// Throws FormatError when the header has no calibration or does not describe \a cube.
    RadiometricCalibrator(std::shared_ptr<const RawCube> cube, std::shared_ptr<const hyspex::BinaryHeader> header);

    /**
     * Radiance of the pixels (lines[i], samples[i]) as [pixels, bands]. Every index is checked before
     * anything is read, out of range throws RangeError.
     */
    [[nodiscard]] SpectraMatrix Calibrate(std::span<const std::size_t> lines, std::span<const std::size_t> samples) const;

    /// Radiance of every sample of \a line as [samples, bands].
    [[nodiscard]] SpectraMatrix CalibrateLine(std::size_t line) const;

    /// pixel_area * integration_time * aperture_area * SF / (h * c)
    [[nodiscard]] double ScalingFactor() const noexcept { return scaling_factor_; }

    /// Band widths in nm, the last band repeats the width of the one before it.
    [[nodiscard]] const std::vector<double>& Bandwidths() const noexcept { return bandwidths_; }

    [[nodiscard]] float Tensor(std::size_t band, std::size_t sample) const { return tensor_[band * samples_ + sample]; }

    [[nodiscard]] std::size_t Bands() const noexcept { return bands_; }
    [[nodiscard]] std::size_t Samples() const noexcept { return samples_; }

private:
    void CalibrateSpectrum(std::span<float> spectrum, std::size_t sample) const noexcept;

    std::shared_ptr<const RawCube> cube_;
    std::shared_ptr<const hyspex::BinaryHeader> header_;
    std::size_t bands_;
    std::size_t samples_;

    std::vector<float> background_;
    std::vector<float> response_;
    std::vector<double> bandwidths_;
    double scaling_factor_;
    std::vector<float> tensor_;
};

#endif //HYSPEXCPP_RADIOMETRICCALIBRATOR_HPP
