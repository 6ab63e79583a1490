#include "boardbuild/sequencer.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <string_view>

#include <unistd.h>

namespace boardbuild {

namespace {

std::string_view driver_verb(BuildPhase phase) {
    switch (phase) {
    case BuildPhase::CleanTarget:
        return "clean-target";
    case BuildPhase::Distclean:
        return "distclean";
    case BuildPhase::BuildAll:
        return "all";
    case BuildPhase::MkRelease:
        return "mkrelease";
    case BuildPhase::Custom:
        break;
    }
    return "";
}

void announce(BuildPhase phase, std::string_view board, size_t n, size_t total) {
    const bool tty = isatty(fileno(stdout)) != 0;
    std::println("{}[{}/{}]{} {}{}{} -> {}", tty ? "\033[1m" : "", n, total, tty ? "\033[0m" : "",
                 tty ? "\033[1;32m" : "", to_string(phase), tty ? "\033[0m" : "", board);
    std::fflush(stdout);
}

} // namespace

std::unordered_map<std::string, std::string> build_environment(const BuildRequest &request,
                                                               const std::string &version) {
    std::unordered_map<std::string, std::string> env{
        {"THINGOS_VERSION", version},
        {"TB_BOARD", request.board},
    };
    if (request.loop_dev)
        env.emplace("TB_LOOP_DEV", *request.loop_dev);
    return env;
}

SequencerConfig make_sequencer_config(const BuildRequest &request, const std::string &version) {
    return SequencerConfig{
        .board = request.board,
        .checkout = std::filesystem::absolute(request.layout.os_dir),
        .driver = request.build_driver,
        .clean_scope = request.clean_scope,
        .preserve_dl_on_clean_target = request.preserve_dl_on_clean_target,
        .custom_command = request.custom_command,
        .env = build_environment(request, version),
    };
}

std::vector<BuildPhase> plan_phases(const SequencerConfig &config) {
    if (config.custom_command)
        return {BuildPhase::Custom};
    BuildPhase clean = config.clean_scope == CleanScope::TargetOnly ? BuildPhase::CleanTarget : BuildPhase::Distclean;
    return {clean, BuildPhase::BuildAll, BuildPhase::MkRelease};
}

Command phase_command(const SequencerConfig &config, BuildPhase phase) {
    Command cmd{.args = {}, .working_dir = config.checkout.string(), .env = config.env};
    if (phase == BuildPhase::Custom) {
        cmd.args = {"/bin/sh", "-c", config.custom_command.value_or("")};
        return cmd;
    }
    std::filesystem::path driver = config.driver.is_absolute() ? config.driver : config.checkout / config.driver;
    cmd.args = {driver.string(), config.board, std::string(driver_verb(phase))};
    return cmd;
}

PhaseSequencer::PhaseSequencer(SequencerConfig config, CommandRunner &runner, Workspace &workspace)
    : config(std::move(config)), runner(runner), workspace(workspace) {
}

bool PhaseSequencer::detaches_dl_cache(BuildPhase phase) const {
    return phase == BuildPhase::Distclean || (phase == BuildPhase::CleanTarget && config.preserve_dl_on_clean_target);
}

Result<void> PhaseSequencer::run_phase(BuildPhase phase, size_t n, size_t total) {
    announce(phase, config.board, n, total);

    const bool detach = detaches_dl_cache(phase);
    if (detach) {
        if (auto res = workspace.detach(AttachmentRole::DownloadCache); !res)
            return res;
    }

    const Command cmd = phase_command(config, phase);
    auto status = runner.run(cmd);
    if (!status) {
        return fail(ErrorKind::Build, std::format("failed to execute {}: {}", to_string(phase), status.error()));
    }
    if (*status != 0) {
        return fail(ErrorKind::Build,
                    std::format("{} failed: {} (exit code {})", to_string(phase), format_command(cmd.args), *status),
                    *status);
    }

    if (detach) {
        if (auto res = workspace.attach(AttachmentRole::DownloadCache); !res)
            return res;
    }
    return {};
}

Result<std::vector<BuildPhase>> PhaseSequencer::run() {
    const std::vector<BuildPhase> phases = plan();
    std::vector<BuildPhase> done;
    for (size_t i = 0; i < phases.size(); ++i) {
        if (auto res = run_phase(phases[i], i + 1, phases.size()); !res)
            return std::unexpected(res.error());
        done.push_back(phases[i]);
    }
    return done;
}

} // namespace boardbuild
