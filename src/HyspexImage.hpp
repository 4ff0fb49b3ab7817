#ifndef HYSPEXCPP_HYSPEXIMAGE_HPP
#define HYSPEXCPP_HYSPEXIMAGE_HPP

#include "BinaryHeader.hpp"
#include "EnviHeader.hpp"
#include "RawCube.hpp"

#include <filesystem>
#include <memory>


struct FilesystemPaths
{
    std::filesystem::path envi_header;
    std::filesystem::path img_data;
};

/// Pairs \a cube_path with its sidecar header, the same stem with a '.hdr' extension.
[[nodiscard]] FilesystemPaths ResolvePaths(const std::filesystem::path &cube_path);

/**
 * @brief Everything read from one HySpex acquisition at open time.
 *
 * Headers are immutable once opened. The binary header is null when the cube has no preamble
 * (header offset 0).
 */
struct HyspexImage
{
    FilesystemPaths paths;
    EnviHeader header;
    std::shared_ptr<const hyspex::BinaryHeader> binary_header;
    std::shared_ptr<RawCube> cube;
};

[[nodiscard]] HyspexImage OpenHyspex(const FilesystemPaths &paths, const envi::ParseOptions &options = {});

[[nodiscard]] HyspexImage OpenHyspex(const std::filesystem::path &cube_path, const envi::ParseOptions &options = {});

#endif //HYSPEXCPP_HYSPEXIMAGE_HPP
