#include "HyspexImage.hpp"
#include "Logger.hpp"


FilesystemPaths ResolvePaths(const std::filesystem::path &cube_path)
{
    auto header_path = cube_path;
    header_path.replace_extension(".hdr");
    return FilesystemPaths{.envi_header = header_path, .img_data = cube_path};
}

HyspexImage OpenHyspex(const std::filesystem::path &cube_path, const envi::ParseOptions &options)
{
    return OpenHyspex(ResolvePaths(cube_path), options);
}

HyspexImage OpenHyspex(const FilesystemPaths &paths, const envi::ParseOptions &options)
{
    LOG_INFO("Opening HySpex cube {} with header {}", paths.img_data.string(), paths.envi_header.string());

    HyspexImage image{.paths = paths, .header = LoadEnvi(paths.envi_header, options)};
    image.cube = std::make_shared<RawCube>(paths.img_data, image.header);

    if (image.header.header_offset > 0)
    {
        image.binary_header = std::make_shared<const hyspex::BinaryHeader>(
            hyspex::ParseBinaryHeader(image.cube->HeaderBytes()));

        const auto &binary = *image.binary_header;
        if (binary.spectral_size != image.cube->Bands() || binary.spatial_size != image.cube->Samples())
        {
            LOG_WARN("Binary header describes {} bands x {} samples, ENVI header {} x {}",
                     binary.spectral_size, binary.spatial_size, image.cube->Bands(), image.cube->Samples());
        }
    }
    else
    {
        LOG_WARN("Cube {} has no binary header, calibration is unavailable", paths.img_data.string());
    }

    return image;
}
