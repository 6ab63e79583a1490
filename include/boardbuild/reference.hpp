#pragma once

#include "boardbuild/domain.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace boardbuild {

/**
 * @brief Picks the reference to check out.
 *
 * Priority is branch > pull request > tag > commit; lower priority selectors
 * are ignored when a higher one is set. A pull request resolves to the local
 * branch `pr<id>`.
 *
 * @return The resolved checkout, or std::nullopt to keep the clone's default branch.
 */
std::optional<ResolvedCheckout> resolve_checkout(const BuildRequest &request);

/**
 * @brief Embeds `credentials` into an http(s) URL as `scheme://<credentials>@host...`.
 *
 * URLs with any other scheme are returned unchanged.
 */
std::string inject_credentials(std::string_view url, std::string_view credentials);

/** @brief Local branch name a pull request is fetched into. */
std::string pull_request_ref(std::uint64_t id);

} // namespace boardbuild
