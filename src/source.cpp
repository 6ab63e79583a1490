#include "boardbuild/source.hpp"

#include "boardbuild/reference.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <system_error>

namespace boardbuild {

namespace {

Command git(std::vector<std::string> args, std::optional<std::string> working_dir) {
    args.insert(args.begin(), "git");
    // a missing credential must fail the clone instead of waiting on a prompt
    return Command{.args = std::move(args), .working_dir = std::move(working_dir), .env = {{"GIT_TERMINAL_PROMPT", "0"}}};
}

} // namespace

std::vector<Command> acquisition_commands(const BuildRequest &request,
                                          const std::optional<ResolvedCheckout> &checkout) {
    const std::string os_dir = request.layout.os_dir.string();
    std::vector<Command> cmds;

    if (!request.local_checkout) {
        std::vector<std::string> clone{"clone"};
        clone.insert(clone.end(), request.clone_args.begin(), request.clone_args.end());
        clone.push_back(inject_credentials(request.repo_url, request.credentials.value_or("")));
        clone.push_back(os_dir);
        cmds.push_back(git(std::move(clone), std::nullopt));
    }

    if (checkout && checkout->kind == CheckoutKind::PullRequest && request.pull_request) {
        cmds.push_back(git({"fetch", "origin", std::format("pull/{}/head:{}", *request.pull_request, checkout->ref)},
                           os_dir));
    }

    if (checkout) {
        cmds.push_back(git({"checkout", checkout->ref}, os_dir));
    }
    return cmds;
}

Result<void> acquire_source(const BuildRequest &request,
                            const std::optional<ResolvedCheckout> &checkout,
                            CommandRunner &runner) {
    if (request.local_checkout) {
        std::error_code ec;
        if (!std::filesystem::is_directory(request.layout.os_dir, ec)) {
            return fail(ErrorKind::Acquisition,
                        std::format("local checkout {} does not exist", request.layout.os_dir.string()));
        }
    }

    for (const auto &cmd : acquisition_commands(request, checkout)) {
        // args[1] is the git subcommand
        std::println("git {}", cmd.args[1]);
        auto res = runner.run(cmd);
        if (!res) {
            return fail(ErrorKind::Acquisition, std::format("failed to execute git: {}", res.error()));
        }
        if (*res != 0) {
            return fail(ErrorKind::Acquisition, std::format("git {} failed (exit code {})", cmd.args[1], *res), *res);
        }
    }
    return {};
}

} // namespace boardbuild
