#include "boardbuild/artifacts.hpp"

#include "boardbuild/keyvalue.hpp"

#include <format>
#include <fstream>
#include <print>
#include <string>

namespace boardbuild {

Result<std::string> read_product_name(const std::filesystem::path &checkout) {
    const auto path = checkout / version_info_path;
    auto values = parse_key_value_file(path);
    if (!values)
        return std::unexpected(values.error());

    auto it = values->find(product_name_key);
    if (it == values->end() || it->second.empty()) {
        return fail(ErrorKind::Artifact, std::format("{} does not define {}", path.string(), product_name_key));
    }
    return it->second;
}

ArtifactManifest image_names(std::string_view product, std::string_view board, std::string_view version) {
    const std::string base = std::format("{}-{}-{}.img", product, board, version);
    return {base + ".gz", base + ".xz"};
}

std::filesystem::path manifest_path(const std::filesystem::path &output_root, std::string_view board) {
    return output_root / board / manifest_name;
}

Result<void> write_manifest(const std::filesystem::path &path, const ArtifactManifest &manifest) {
    {
        std::ofstream f(path, std::ios::trunc);
        f << manifest.gz_image << '\n';
        if (!f)
            return fail(ErrorKind::Artifact, std::format("cannot write {}", path.string()));
    }
    std::ofstream f(path, std::ios::app);
    f << manifest.xz_image << '\n';
    f.close();
    if (!f)
        return fail(ErrorKind::Artifact, std::format("cannot append to {}", path.string()));
    return {};
}

Result<ArtifactManifest> report_artifacts(const std::filesystem::path &checkout,
                                          const std::filesystem::path &output_root,
                                          std::string_view board,
                                          std::string_view version) {
    auto product = read_product_name(checkout);
    if (!product)
        return std::unexpected(product.error());

    ArtifactManifest manifest = image_names(*product, board, version);
    const auto path = manifest_path(output_root, board);
    if (auto res = write_manifest(path, manifest); !res)
        return std::unexpected(res.error());

    std::println("images: {} {}", manifest.gz_image, manifest.xz_image);
    return manifest;
}

} // namespace boardbuild
