#include "boardbuild/version.hpp"

#include <algorithm>

namespace boardbuild {

bool is_commit_hash(std::string_view s) {
    return s.size() == 40 &&
           std::ranges::all_of(s, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

std::string resolve_version(const BuildRequest &request, const std::optional<ResolvedCheckout> &checkout) {
    std::string version;
    if (request.version_override)
        version = *request.version_override;
    else if (checkout)
        version = checkout->ref;
    else
        return std::string(default_version);

    if (is_commit_hash(version))
        return "git" + version.substr(0, 7);
    return version;
}

} // namespace boardbuild
