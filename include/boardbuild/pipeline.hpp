#pragma once

#include "boardbuild/artifacts.hpp"
#include "boardbuild/domain.hpp"
#include "boardbuild/process_exec.hpp"
#include "boardbuild/utility.hpp"
#include "boardbuild/workspace.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boardbuild {

/** @brief Everything a run would do, resolved without side effects. */
struct PipelinePlan {
    std::string board;
    std::optional<ResolvedCheckout> checkout;
    std::string version;
    WorkspaceSpec workspace;
    std::vector<Command> acquisition;
    std::vector<BuildPhase> phases;
    std::vector<Command> phase_commands;
};

struct PipelineOutcome {
    std::optional<ResolvedCheckout> checkout;
    std::string version;
    std::vector<BuildPhase> phases;
    std::optional<ArtifactManifest> manifest; ///< Absent when a custom command ran.
};

/** @brief Resolves the plan for `request`. Credentials are masked in the clone URL. */
PipelinePlan plan_pipeline(const BuildRequest &request);

/**
 * @brief Runs acquisition, isolation, the build phases and the artifact report.
 *
 * Stops at the first failure and returns it unchanged. Workspace attachments
 * are released before returning, whatever the outcome; the host caches stay.
 */
Result<PipelineOutcome> run_pipeline(const BuildRequest &request, CommandRunner &runner);

} // namespace boardbuild
