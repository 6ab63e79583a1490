#pragma once

#include "boardbuild/domain.hpp"
#include "boardbuild/utility.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace boardbuild {

enum class AttachmentRole { DownloadCache, CompilerCache, Output };

constexpr std::string_view to_string(AttachmentRole role) {
    switch (role) {
    case AttachmentRole::DownloadCache:
        return "download cache";
    case AttachmentRole::CompilerCache:
        return "compiler cache";
    case AttachmentRole::Output:
        return "output";
    }
    return "unknown";
}

/** @brief A host directory made visible at a fixed path inside the checkout. */
struct Attachment {
    AttachmentRole role;
    std::filesystem::path host;
    std::filesystem::path in_tree;
};

/**
 * @brief Explicit description of a board's workspace.
 *
 * Cache host paths are keyed by board; the output host path is shared and
 * only its `<board>` subdirectory is board specific.
 */
struct WorkspaceSpec {
    std::filesystem::path root;
    std::vector<Attachment> attachments;
    std::vector<std::filesystem::path> host_dirs; ///< Directories that must exist on the host.
};

WorkspaceSpec make_workspace_spec(const BuildRequest &request);

/**
 * @brief Owns the attachments of a WorkspaceSpec.
 *
 * Attach and detach are idempotent. Anything still attached when the object
 * is destroyed is detached; the host directories and their contents are
 * never touched.
 */
class Workspace {
public:
    Workspace(WorkspaceSpec spec, AttachMode mode);
    ~Workspace();

    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    /** @brief Creates every host directory of the spec. */
    Result<void> ensure_host_dirs();

    /** @brief Ensures host directories, then attaches every attachment in declaration order. */
    Result<void> attach_all();

    /** @brief Ensures the host directory of `role` and attaches it. */
    Result<void> attach(AttachmentRole role);

    Result<void> detach(AttachmentRole role);

    /** @brief Detaches everything, in reverse order. */
    Result<void> release();

    bool is_attached(AttachmentRole role) const;

    const WorkspaceSpec &spec() const {
        return spec_;
    }

private:
    enum class State { Detached, Bound, Linked };

    size_t index_of(AttachmentRole role) const;
    Result<void> attach_at(size_t idx);
    Result<void> detach_at(size_t idx);
    Result<bool> bind(const Attachment &att);
    Result<void> link(const Attachment &att);

    WorkspaceSpec spec_;
    AttachMode mode_;
    std::vector<State> states_;
};

} // namespace boardbuild
