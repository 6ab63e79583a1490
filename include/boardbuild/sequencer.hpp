#pragma once

#include "boardbuild/domain.hpp"
#include "boardbuild/process_exec.hpp"
#include "boardbuild/utility.hpp"
#include "boardbuild/workspace.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace boardbuild {

struct SequencerConfig {
    std::string board;
    std::filesystem::path checkout;
    std::filesystem::path driver; ///< Relative paths resolve inside the checkout.
    CleanScope clean_scope = CleanScope::Full;
    bool preserve_dl_on_clean_target = false;
    std::optional<std::string> custom_command;
    std::unordered_map<std::string, std::string> env; ///< Build metadata exported to every phase.
};

/** @brief Build metadata environment: THINGOS_VERSION, TB_BOARD and TB_LOOP_DEV. */
std::unordered_map<std::string, std::string> build_environment(const BuildRequest &request, const std::string &version);

SequencerConfig make_sequencer_config(const BuildRequest &request, const std::string &version);

/** @brief The phases a sequencer with `config` executes, in order. */
std::vector<BuildPhase> plan_phases(const SequencerConfig &config);

/** @brief The driver (or shell) invocation for `phase`. */
Command phase_command(const SequencerConfig &config, BuildPhase phase);

/**
 * @brief Drives the external build driver through clean, build and release.
 *
 * A custom command replaces the whole sequence. Every phase blocks until the
 * driver exits; the first nonzero status stops the sequence with a
 * BuildError carrying that status.
 */
class PhaseSequencer {
public:
    PhaseSequencer(SequencerConfig config, CommandRunner &runner, Workspace &workspace);

    std::vector<BuildPhase> plan() const {
        return plan_phases(config);
    }

    /** @brief True if the download cache is detached around `phase`. */
    bool detaches_dl_cache(BuildPhase phase) const;

    /**
     * @brief Runs the planned phases.
     * @return The phases that completed, or the first failure.
     */
    Result<std::vector<BuildPhase>> run();

private:
    Result<void> run_phase(BuildPhase phase, size_t n, size_t total);

    SequencerConfig config;
    CommandRunner &runner;
    Workspace &workspace;
};

} // namespace boardbuild
