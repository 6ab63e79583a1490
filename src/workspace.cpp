#include "boardbuild/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <ranges>
#include <system_error>

#include <sys/mount.h>

namespace fs = std::filesystem;

namespace boardbuild {

namespace {

Result<void> isolation_error(std::string_view what, const fs::path &path, const std::error_code &ec) {
    return fail(ErrorKind::Isolation, std::format("{} {}: {}", what, path.string(), ec.message()));
}

Result<void> make_dirs(const fs::path &path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        return isolation_error("cannot create", path, ec);
    if (!fs::is_directory(path, ec))
        return fail(ErrorKind::Isolation, std::format("{} exists and is not a directory", path.string()));
    return {};
}

// stat() follows symlinks, so this holds for a bind mount and for a symlink alike
bool resolves_to(const fs::path &in_tree, const fs::path &host) {
    std::error_code ec;
    bool same = fs::equivalent(in_tree, host, ec);
    return !ec && same;
}

bool mount_unavailable(int err) {
    return err == EPERM || err == EACCES || err == ENOSYS;
}

} // namespace

WorkspaceSpec make_workspace_spec(const BuildRequest &request) {
    const auto &layout = request.layout;
    const auto &board = request.board;
    const fs::path root = fs::absolute(layout.os_dir);
    const fs::path ccache_name = ".buildroot-ccache-" + board;

    WorkspaceSpec spec;
    spec.root = root;
    spec.attachments = {
        {AttachmentRole::DownloadCache, fs::absolute(layout.dl_dir) / board, root / "dl"},
        {AttachmentRole::CompilerCache, fs::absolute(layout.ccache_dir) / ccache_name, root / ccache_name},
        {AttachmentRole::Output, fs::absolute(layout.output_dir), root / "output"},
    };
    for (const auto &att : spec.attachments)
        spec.host_dirs.push_back(att.host);
    spec.host_dirs.push_back(fs::absolute(layout.output_dir) / board);
    return spec;
}

Workspace::Workspace(WorkspaceSpec spec, AttachMode mode)
    : spec_(std::move(spec)), mode_(mode), states_(spec_.attachments.size(), State::Detached) {
}

Workspace::~Workspace() {
    if (auto res = release(); !res) {
        std::println(stderr, "Failed to release workspace: {}", res.error());
    }
}

Result<void> Workspace::ensure_host_dirs() {
    for (const auto &dir : spec_.host_dirs) {
        if (auto res = make_dirs(dir); !res)
            return res;
    }
    return {};
}

Result<void> Workspace::attach_all() {
    if (auto res = ensure_host_dirs(); !res)
        return res;
    for (size_t i = 0; i < spec_.attachments.size(); ++i) {
        if (auto res = attach_at(i); !res)
            return res;
    }
    return {};
}

size_t Workspace::index_of(AttachmentRole role) const {
    for (size_t i = 0; i < spec_.attachments.size(); ++i) {
        if (spec_.attachments[i].role == role)
            return i;
    }
    return spec_.attachments.size();
}

Result<void> Workspace::attach(AttachmentRole role) {
    size_t idx = index_of(role);
    if (idx == spec_.attachments.size())
        return fail(ErrorKind::Isolation, std::format("workspace has no {} attachment", to_string(role)));
    return attach_at(idx);
}

Result<void> Workspace::detach(AttachmentRole role) {
    size_t idx = index_of(role);
    if (idx == spec_.attachments.size())
        return fail(ErrorKind::Isolation, std::format("workspace has no {} attachment", to_string(role)));
    return detach_at(idx);
}

Result<void> Workspace::release() {
    Result<void> first = {};
    for (size_t idx : std::views::iota(size_t{0}, spec_.attachments.size()) | std::views::reverse) {
        // later attachments are still released; the first error is reported
        if (auto res = detach_at(idx); !res && first)
            first = std::move(res);
    }
    return first;
}

bool Workspace::is_attached(AttachmentRole role) const {
    size_t idx = index_of(role);
    return idx < states_.size() && states_[idx] != State::Detached;
}

Result<void> Workspace::attach_at(size_t idx) {
    const Attachment &att = spec_.attachments[idx];

    if (auto res = make_dirs(att.host); !res)
        return res;
    if (states_[idx] != State::Detached)
        return {};

    // left behind by an earlier attach in this checkout
    if (resolves_to(att.in_tree, att.host)) {
        std::error_code ec;
        states_[idx] = fs::is_symlink(fs::symlink_status(att.in_tree, ec)) ? State::Linked : State::Bound;
        return {};
    }

    if (mode_ != AttachMode::Symlink) {
        auto bound = bind(att);
        if (!bound)
            return std::unexpected(bound.error());
        if (*bound) {
            states_[idx] = State::Bound;
            return {};
        }
        std::println("bind mounts unavailable, linking {} instead", to_string(att.role));
    }

    if (auto res = link(att); !res)
        return res;
    states_[idx] = State::Linked;
    return {};
}

// False when mounting is not permitted here and auto mode may fall back to a
// symlink. The empty mount point is left for link() to replace.
Result<bool> Workspace::bind(const Attachment &att) {
    if (auto res = make_dirs(att.in_tree); !res)
        return std::unexpected(res.error());

    if (mount(att.host.c_str(), att.in_tree.c_str(), "", MS_BIND, nullptr) == -1) {
        int err = errno;
        if (mode_ == AttachMode::Auto && mount_unavailable(err))
            return false;
        return fail(ErrorKind::Isolation, std::format("bind mount from {} to {} failed: {}", att.host.string(),
                                                      att.in_tree.string(), std::strerror(err)));
    }
    std::println("mounted {} at {}", att.host.string(), att.in_tree.string());
    return true;
}

Result<void> Workspace::link(const Attachment &att) {
    std::error_code ec;
    auto st = fs::symlink_status(att.in_tree, ec);
    if (fs::is_symlink(st)) {
        fs::remove(att.in_tree, ec);
        if (ec)
            return isolation_error("cannot remove stale link", att.in_tree, ec);
    } else if (fs::is_directory(st)) {
        if (!fs::is_empty(att.in_tree, ec) || ec)
            return fail(ErrorKind::Isolation, std::format("{} exists and is not empty", att.in_tree.string()));
        fs::remove(att.in_tree, ec);
        if (ec)
            return isolation_error("cannot remove", att.in_tree, ec);
    } else if (fs::exists(st)) {
        return fail(ErrorKind::Isolation, std::format("{} exists and is not a directory", att.in_tree.string()));
    }

    if (auto res = make_dirs(att.in_tree.parent_path()); !res)
        return res;
    fs::create_directory_symlink(att.host, att.in_tree, ec);
    if (ec)
        return isolation_error("cannot link", att.in_tree, ec);
    std::println("linked {} -> {}", att.in_tree.string(), att.host.string());
    return {};
}

Result<void> Workspace::detach_at(size_t idx) {
    const Attachment &att = spec_.attachments[idx];
    switch (states_[idx]) {
    case State::Detached:
        return {};
    case State::Bound:
        if (umount2(att.in_tree.c_str(), MNT_DETACH) == -1) {
            return fail(ErrorKind::Isolation,
                        std::format("unmounting {} failed: {}", att.in_tree.string(), std::strerror(errno)));
        }
        break;
    case State::Linked: {
        std::error_code ec;
        fs::remove(att.in_tree, ec);
        if (ec)
            return isolation_error("cannot unlink", att.in_tree, ec);
        break;
    }
    }
    states_[idx] = State::Detached;
    return {};
}

} // namespace boardbuild
