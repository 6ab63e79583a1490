#pragma once

#include "boardbuild/domain.hpp"
#include "boardbuild/utility.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

namespace boardbuild {

using Environment = std::unordered_map<std::string, std::string>;

/** @brief Copies a `NAME=value` array (as passed to `main`) into a map. */
Environment capture_environment(const char *const *envp);

/**
 * @brief Fills in keys from a key/value file that `env` does not already set.
 *
 * The process environment always wins over the file.
 *
 * @return The merged environment, or a ConfigurationError if the file is
 *         missing or malformed.
 */
Result<Environment> apply_env_file(Environment env, const std::filesystem::path &path);

/**
 * @brief Builds the immutable request from the `TB_*` keys of `env`.
 *
 * Every problem is collected; the returned ConfigurationError lists them all,
 * one per line.
 */
Result<BuildRequest> parse_request(const Environment &env);

} // namespace boardbuild
