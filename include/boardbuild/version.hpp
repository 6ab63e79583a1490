#pragma once

#include "boardbuild/domain.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace boardbuild {

inline constexpr std::string_view default_version = "0.0.0";

/** @brief True for exactly 40 lower-case hex digits, i.e. a full git commit id. */
bool is_commit_hash(std::string_view s);

/**
 * @brief Derives the release version used in image names.
 *
 * Override beats the checkout reference, which beats `0.0.0`. A full commit
 * id is then shortened to `git` plus its first seven characters.
 */
std::string resolve_version(const BuildRequest &request, const std::optional<ResolvedCheckout> &checkout);

} // namespace boardbuild
