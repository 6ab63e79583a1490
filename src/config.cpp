#include "boardbuild/config.hpp"

#include "boardbuild/keyvalue.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace boardbuild {

namespace {

std::optional<std::string> lookup(const Environment &env, std::string_view key) {
    if (auto it = env.find(std::string(key)); it != env.end() && !it->second.empty())
        return it->second;
    return std::nullopt;
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::optional<bool> parse_bool(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < s.size()) {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
            pos++;
        size_t start = pos;
        while (pos < s.size() && !std::isspace(static_cast<unsigned char>(s[pos])))
            pos++;
        if (pos > start)
            words.emplace_back(s.substr(start, pos - start));
    }
    return words;
}

} // namespace

Environment capture_environment(const char *const *envp) {
    Environment env;
    if (!envp)
        return env;
    for (; *envp; ++envp) {
        std::string_view entry = *envp;
        size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

Result<Environment> apply_env_file(Environment env, const std::filesystem::path &path) {
    auto values = parse_key_value_file(path);
    if (!values) {
        return fail(ErrorKind::Configuration, values.error().message);
    }
    for (const auto &[key, value] : *values) {
        env.try_emplace(key, value);
    }
    return env;
}

Result<BuildRequest> parse_request(const Environment &env) {
    BuildRequest req;
    std::vector<std::string> problems;

    auto flag = [&](std::string_view key, bool &out) {
        if (auto v = lookup(env, key)) {
            if (auto b = parse_bool(*v))
                out = *b;
            else
                problems.push_back(std::format("{} must be a boolean, got '{}'", key, *v));
        }
    };

    flag("TB_LOCAL", req.local_checkout);

    if (auto v = lookup(env, "TB_REPO"))
        req.repo_url = *v;
    else if (!req.local_checkout)
        problems.emplace_back("environment variable TB_REPO must be set");

    if (auto v = lookup(env, "TB_BOARD"))
        req.board = *v;
    else
        problems.emplace_back("environment variable TB_BOARD must be set");

    if (req.board.find('/') != std::string::npos || req.board == "." || req.board == "..")
        problems.push_back(std::format("TB_BOARD '{}' is not a valid board identifier", req.board));

    req.credentials = lookup(env, "TB_GIT_CREDENTIALS");
    req.branch = lookup(env, "TB_BRANCH");
    req.tag = lookup(env, "TB_TAG");
    req.commit = lookup(env, "TB_COMMIT");
    req.version_override = lookup(env, "TB_VERSION");
    req.custom_command = lookup(env, "TB_CUSTOM_CMD");
    req.loop_dev = lookup(env, "TB_LOOP_DEV");

    if (auto v = lookup(env, "TB_PR")) {
        std::uint64_t pr = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), pr);
        if (ec != std::errc() || ptr != v->data() + v->size() || pr == 0)
            problems.push_back(std::format("TB_PR must be a positive number, got '{}'", *v));
        else
            req.pull_request = pr;
    }

    if (auto v = lookup(env, "TB_GIT_CLONE_ARGS"))
        req.clone_args = split_words(*v);

    bool target_only = false;
    flag("TB_CLEAN_TARGET_ONLY", target_only);
    req.clean_scope = target_only ? CleanScope::TargetOnly : CleanScope::Full;
    flag("TB_PRESERVE_DL_ON_CLEAN_TARGET", req.preserve_dl_on_clean_target);

    if (auto v = lookup(env, "TB_OS_DIR"))
        req.layout.os_dir = *v;
    if (auto v = lookup(env, "TB_DL_DIR"))
        req.layout.dl_dir = *v;
    if (auto v = lookup(env, "TB_CCACHE_DIR"))
        req.layout.ccache_dir = *v;
    if (auto v = lookup(env, "TB_OUTPUT_DIR"))
        req.layout.output_dir = *v;
    if (auto v = lookup(env, "TB_BUILD_DRIVER"))
        req.build_driver = *v;

    if (auto v = lookup(env, "TB_ATTACH_MODE")) {
        const std::string mode = lowercase(*v);
        if (mode == "auto")
            req.attach_mode = AttachMode::Auto;
        else if (mode == "bind")
            req.attach_mode = AttachMode::Bind;
        else if (mode == "symlink")
            req.attach_mode = AttachMode::Symlink;
        else
            problems.push_back(std::format("TB_ATTACH_MODE must be auto, bind or symlink, got '{}'", *v));
    }

    if (!problems.empty()) {
        std::string message = problems.front();
        for (const auto &p : problems | std::views::drop(1)) {
            message += '\n';
            message += p;
        }
        return fail(ErrorKind::Configuration, std::move(message));
    }
    return req;
}

} // namespace boardbuild
