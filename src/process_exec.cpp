#include "boardbuild/process_exec.hpp"

#include <expected>
#include <format>
#include <reproc++/run.hpp>
#include <string>
#include <system_error>
#include <vector>

namespace boardbuild {

std::expected<int, std::string> ProcessRunner::run(const Command &cmd) {
    if (cmd.args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.out.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;

    if (cmd.working_dir) {
        options.working_directory = cmd.working_dir->c_str();
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (!cmd.env.empty()) {
        options.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : cmd.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        options.env.extra = env_ptrs.data();
    }

    auto [status, ec] = reproc::run(cmd.args, options);
    if (ec) {
        return std::unexpected(std::format("{}: {}", cmd.args.front(), ec.message()));
    }
    return status;
}

int exit_code(int status) {
    if (status > 0 && status < 256)
        return status;
    if (status > 255 && status - 255 < 128)
        return 128 + (status - 255);
    return 1;
}

std::string format_command(const std::vector<std::string> &args) {
    std::string out;
    for (const auto &arg : args) {
        if (!out.empty())
            out += ' ';
        bool quote = arg.empty() || arg.find_first_of(" \t\"'$") != std::string::npos;
        if (quote) {
            out += '\'';
            for (char c : arg) {
                if (c == '\'')
                    out += "'\\''";
                else
                    out += c;
            }
            out += '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace boardbuild
