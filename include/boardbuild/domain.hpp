#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boardbuild {

enum class CleanScope { Full, TargetOnly };

enum class AttachMode { Auto, Bind, Symlink };

/** @brief Host and in-tree roots used by a build. */
struct Layout {
    std::filesystem::path os_dir = "/os";
    std::filesystem::path dl_dir = "/mnt/dl";
    std::filesystem::path ccache_dir = "/mnt/ccache";
    std::filesystem::path output_dir = "/mnt/output";
};

/**
 * @brief Everything a single pipeline run needs to know.
 *
 * Built once by `parse_request` and never modified afterwards.
 */
struct BuildRequest {
    std::string repo_url;
    std::optional<std::string> credentials;
    std::string board;

    std::optional<std::string> branch;
    std::optional<std::uint64_t> pull_request;
    std::optional<std::string> tag;
    std::optional<std::string> commit;

    std::optional<std::string> version_override;
    std::optional<std::string> custom_command;
    CleanScope clean_scope = CleanScope::Full;
    std::optional<std::string> loop_dev;
    std::vector<std::string> clone_args;

    Layout layout;
    std::string build_driver = "build.sh";
    AttachMode attach_mode = AttachMode::Auto;
    bool local_checkout = false;
    bool preserve_dl_on_clean_target = false;
};

enum class CheckoutKind { Branch, PullRequest, Tag, Commit };

struct ResolvedCheckout {
    std::string ref;
    CheckoutKind kind;

    bool operator==(const ResolvedCheckout &) const = default;
};

enum class BuildPhase { CleanTarget, Distclean, BuildAll, MkRelease, Custom };

constexpr std::string_view to_string(CheckoutKind kind) {
    switch (kind) {
    case CheckoutKind::Branch:
        return "branch";
    case CheckoutKind::PullRequest:
        return "pull-request";
    case CheckoutKind::Tag:
        return "tag";
    case CheckoutKind::Commit:
        return "commit";
    }
    return "unknown";
}

constexpr std::string_view to_string(BuildPhase phase) {
    switch (phase) {
    case BuildPhase::CleanTarget:
        return "clean-target";
    case BuildPhase::Distclean:
        return "distclean";
    case BuildPhase::BuildAll:
        return "build-all";
    case BuildPhase::MkRelease:
        return "mkrelease";
    case BuildPhase::Custom:
        return "custom";
    }
    return "unknown";
}

constexpr std::string_view to_string(AttachMode mode) {
    switch (mode) {
    case AttachMode::Auto:
        return "auto";
    case AttachMode::Bind:
        return "bind";
    case AttachMode::Symlink:
        return "symlink";
    }
    return "unknown";
}

} // namespace boardbuild
