#ifndef HYSPEXCPP_QUANTIZER_HPP
#define HYSPEXCPP_QUANTIZER_HPP

#include "Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>


inline constexpr std::size_t default_quantize_chunk = 1'000'000;

struct AutoScaled
{
    std::vector<int32_t> values;
    double scale;  // value ~ integer / scale
};

/**
 * @brief round(value / scale_factor) as int32, walking \a values in blocks of \a chunk_size.
 *
 * Rounds half to even. Throws RangeError when a scaled value does not fit in int32 and
 * std::invalid_argument for a non-positive scale factor or a zero chunk size.
 */
[[nodiscard]] std::vector<int32_t> QuantizeFloats(std::span<const float> values, double scale_factor,
                                                  std::size_t chunk_size = default_quantize_chunk);

/**
 * @brief Picks the smallest power of ten up to \a max_scale that turns every value into an integer
 * within \a tolerance.
 *
 * The tolerance applies to the scaled value and is widened by the float32 rounding of each input, so
 * 1234.56f fits scale 100 although it is stored as 1234.56005859375.
 *
 * Throws PrecisionError when no such scale exists.
 */
[[nodiscard]] AutoScaled AutoScaleFloats(std::span<const float> values, double max_scale, double tolerance = 1e-3);

template <typename T>
[[nodiscard]] std::vector<int32_t> QuantizeFixed(std::span<const T> values, double scale_factor,
                                                 std::size_t chunk_size = default_quantize_chunk)
{
    if constexpr (std::is_same_v<std::remove_cv_t<T>, float>)
        return QuantizeFloats(values, scale_factor, chunk_size);
    else
        throw TypeError{"Quantization expects 32-bit float values"};
}

template <typename T>
[[nodiscard]] AutoScaled QuantizeAuto(std::span<const T> values, double max_scale, double tolerance = 1e-3)
{
    if constexpr (std::is_same_v<std::remove_cv_t<T>, float>)
        return AutoScaleFloats(values, max_scale, tolerance);
    else
        throw TypeError{"Quantization expects 32-bit float values"};
}

/// integer * scale_factor
[[nodiscard]] std::vector<float> Dequantize(std::span<const int32_t> values, double scale_factor);

/// integer / scale
[[nodiscard]] std::vector<float> Dequantize(const AutoScaled &scaled);

#endif //HYSPEXCPP_QUANTIZER_HPP
