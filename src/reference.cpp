#include "boardbuild/reference.hpp"

#include <array>
#include <string>
#include <string_view>

namespace boardbuild {

std::string pull_request_ref(std::uint64_t id) {
    return "pr" + std::to_string(id);
}

std::optional<ResolvedCheckout> resolve_checkout(const BuildRequest &request) {
    if (request.branch)
        return ResolvedCheckout{*request.branch, CheckoutKind::Branch};
    if (request.pull_request)
        return ResolvedCheckout{pull_request_ref(*request.pull_request), CheckoutKind::PullRequest};
    if (request.tag)
        return ResolvedCheckout{*request.tag, CheckoutKind::Tag};
    if (request.commit)
        return ResolvedCheckout{*request.commit, CheckoutKind::Commit};
    return std::nullopt;
}

std::string inject_credentials(std::string_view url, std::string_view credentials) {
    if (credentials.empty())
        return std::string(url);

    static constexpr std::array<std::string_view, 2> schemes = {"http://", "https://"};
    for (auto scheme : schemes) {
        if (url.starts_with(scheme)) {
            std::string out(scheme);
            out += credentials;
            out += '@';
            out += url.substr(scheme.size());
            return out;
        }
    }
    return std::string(url);
}

} // namespace boardbuild
