#include "Quantizer.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>


namespace
{

constexpr double int32_lowest = static_cast<double>(std::numeric_limits<int32_t>::lowest());
constexpr double int32_max = static_cast<double>(std::numeric_limits<int32_t>::max());

int32_t ToInt32(double rounded)
{
    // NaN fails both comparisons
    if (!(rounded >= int32_lowest && rounded <= int32_max))
    {
        throw RangeError{"Scaled value " + std::to_string(rounded) + " does not fit in a 32-bit integer"};
    }
    return static_cast<int32_t>(rounded);
}

// Half the float32 spacing at value, the most a decimal literal moves when stored as float.
double RepresentationError(float value)
{
    const float magnitude = std::abs(value);
    return 0.5 * static_cast<double>(std::nextafter(magnitude, std::numeric_limits<float>::infinity()) - magnitude);
}

bool FitsScale(std::span<const float> values, double scale, double tolerance)
{
    return std::ranges::all_of(values, [&](float value) {
        const double scaled = static_cast<double>(value) * scale;
        const double allowed = tolerance + RepresentationError(value) * scale;
        return std::abs(scaled - std::nearbyint(scaled)) <= allowed;
    });
}

}


std::vector<int32_t> QuantizeFloats(std::span<const float> values, double scale_factor, std::size_t chunk_size)
{
    if (!(scale_factor > 0.0))
    {
        throw std::invalid_argument{"Scale factor must be positive"};
    }
    if (chunk_size == 0)
    {
        throw std::invalid_argument{"Quantization chunk size must be positive"};
    }

    std::vector<int32_t> quantized(values.size());
    for (std::size_t begin = 0; begin < values.size(); begin += chunk_size)
    {
        const auto end = std::min(values.size(), begin + chunk_size);
        for (std::size_t idx = begin; idx < end; ++idx)
        {
            quantized[idx] = ToInt32(std::nearbyint(static_cast<double>(values[idx]) / scale_factor));
        }
    }
    return quantized;
}

AutoScaled AutoScaleFloats(std::span<const float> values, double max_scale, double tolerance)
{
    for (double scale = 1.0; scale <= max_scale; scale *= 10.0)
    {
        if (!FitsScale(values, scale, tolerance))
            continue;

        LOG_TRACE("Values fit scale {} within tolerance {}", scale, tolerance);

        AutoScaled result{.values = std::vector<int32_t>(values.size()), .scale = scale};
        for (std::size_t idx = 0; idx < values.size(); ++idx)
        {
            result.values[idx] = ToInt32(std::nearbyint(static_cast<double>(values[idx]) * scale));
        }
        return result;
    }

    LOG_ERROR("No power of ten up to {} represents the values within tolerance {}", max_scale, tolerance);
    throw PrecisionError{"No scale up to " + std::to_string(max_scale) + " preserves the values"};
}

std::vector<float> Dequantize(std::span<const int32_t> values, double scale_factor)
{
    std::vector<float> restored(values.size());
    std::ranges::transform(values, restored.begin(), [scale_factor](int32_t value) {
        return static_cast<float>(static_cast<double>(value) * scale_factor);
    });
    return restored;
}

std::vector<float> Dequantize(const AutoScaled &scaled)
{
    std::vector<float> restored(scaled.values.size());
    std::ranges::transform(scaled.values, restored.begin(), [&scaled](int32_t value) {
        return static_cast<float>(static_cast<double>(value) / scaled.scale);
    });
    return restored;
}
