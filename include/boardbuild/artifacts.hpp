#pragma once

#include "boardbuild/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace boardbuild {

/** @brief Location of the version-info resource inside the checkout. */
inline constexpr std::string_view version_info_path = "board/common/overlay/etc/version";
inline constexpr std::string_view product_name_key = "os_short_name";
inline constexpr std::string_view manifest_name = ".image_files";

struct ArtifactManifest {
    std::string gz_image;
    std::string xz_image;
};

/**
 * @brief Reads the product short name from the checkout's version-info resource.
 * @return The name, or an ArtifactError if the resource is missing, malformed or lacks the key.
 */
Result<std::string> read_product_name(const std::filesystem::path &checkout);

/** @brief `<product>-<board>-<version>.img.gz` and the `.img.xz` counterpart. */
ArtifactManifest image_names(std::string_view product, std::string_view board, std::string_view version);

std::filesystem::path manifest_path(const std::filesystem::path &output_root, std::string_view board);

/**
 * @brief Writes the manifest: gzip image name first (truncating), then the xz image name.
 */
Result<void> write_manifest(const std::filesystem::path &path, const ArtifactManifest &manifest);

/**
 * @brief Computes the image names for a finished release and writes the manifest.
 * @return The written manifest.
 */
Result<ArtifactManifest> report_artifacts(const std::filesystem::path &checkout,
                                          const std::filesystem::path &output_root,
                                          std::string_view board,
                                          std::string_view version);

} // namespace boardbuild
