#pragma once

#include "boardbuild/utility.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace boardbuild {

using KeyValues = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Parses shell-sourceable `KEY=value` text without executing it.
 *
 * Accepts comments, blank lines, an optional `export` prefix and single or
 * double quoted values. Variable references are kept literally.
 *
 * @param content The text to parse.
 * @param origin Name used in error messages (usually the file path).
 * @return The assignments, later keys overriding earlier ones, or an
 *         ArtifactError naming the offending line.
 */
Result<KeyValues> parse_key_values(std::string_view content, std::string_view origin = "<input>");

/**
 * @brief Maps `path` and parses it with `parse_key_values`.
 * @return The assignments, or an ArtifactError if the file cannot be read or parsed.
 */
Result<KeyValues> parse_key_value_file(const std::filesystem::path &path);

} // namespace boardbuild
