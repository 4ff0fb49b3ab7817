#ifndef HYSPEXCPP_ERRORS_HPP
#define HYSPEXCPP_ERRORS_HPP

#include <stdexcept>


/// Malformed or unsupported structural input: bad magic word, unknown interleave,
/// truncated binary header, missing header keys.
class FormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Pixel coordinates or line range outside of the cube.
class RangeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Quantizer given an array that is not 32-bit float.
class TypeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// No power of ten up to the ceiling represents the data within tolerance.
class PrecisionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif //HYSPEXCPP_ERRORS_HPP
