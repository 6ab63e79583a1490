#pragma once

#include "boardbuild/utility.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace boardbuild {

/** @brief One blocking external command. */
struct Command {
    std::vector<std::string> args; ///< First argument is the executable.
    std::optional<std::string> working_dir = std::nullopt;
    std::unordered_map<std::string, std::string> env; ///< Extends the parent environment.
};

/**
 * @brief Runs external commands on behalf of the pipeline.
 *
 * Every git, build driver and custom command invocation goes through this
 * interface so the stages never spawn processes themselves.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs `cmd` to completion.
     * @return The exit status of the process, or an error message if it could not be started.
     */
    virtual std::expected<int, std::string> run(const Command &cmd) = 0;
};

/** @brief CommandRunner backed by reproc++, children share the parent's stdout/stderr. */
class ProcessRunner final : public CommandRunner {
public:
    std::expected<int, std::string> run(const Command &cmd) override;
};

/**
 * @brief Maps a status returned by CommandRunner::run to a process exit code.
 *
 * reproc reports a child killed by signal N as 255 + N; that becomes the
 * shell's 128 + N. Zero, negative and otherwise unrepresentable statuses
 * become 1.
 */
int exit_code(int status);

/** @brief Renders a command line for logs and plans. */
std::string format_command(const std::vector<std::string> &args);

} // namespace boardbuild
