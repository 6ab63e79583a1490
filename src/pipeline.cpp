#include "boardbuild/pipeline.hpp"

#include "boardbuild/reference.hpp"
#include "boardbuild/report.hpp"
#include "boardbuild/sequencer.hpp"
#include "boardbuild/source.hpp"
#include "boardbuild/version.hpp"

#include <filesystem>
#include <print>
#include <utility>

namespace boardbuild {

PipelinePlan plan_pipeline(const BuildRequest &request) {
    PipelinePlan plan;
    plan.board = request.board;
    plan.checkout = resolve_checkout(request);
    plan.version = resolve_version(request, plan.checkout);
    plan.workspace = make_workspace_spec(request);

    BuildRequest shown = request;
    if (shown.credentials)
        shown.credentials = "***";
    plan.acquisition = acquisition_commands(shown, plan.checkout);

    const SequencerConfig config = make_sequencer_config(request, plan.version);
    plan.phases = plan_phases(config);
    for (BuildPhase phase : plan.phases)
        plan.phase_commands.push_back(phase_command(config, phase));
    return plan;
}

Result<PipelineOutcome> run_pipeline(const BuildRequest &request, CommandRunner &runner) {
    PipelineOutcome outcome;
    outcome.checkout = resolve_checkout(request);
    outcome.version = resolve_version(request, outcome.checkout);

    if (outcome.checkout)
        std::println("checkout: {} {}", to_string(outcome.checkout->kind), outcome.checkout->ref);
    else
        std::println("checkout: default branch");
    std::println("version: {}", outcome.version);

    Workspace workspace(make_workspace_spec(request), request.attach_mode);
    PhaseSequencer sequencer(make_sequencer_config(request, outcome.version), runner, workspace);
    const auto output_root = std::filesystem::absolute(request.layout.output_dir);

    return acquire_source(request, outcome.checkout, runner)
        .and_then([&] { return workspace.attach_all(); })
        .and_then([&] { return sequencer.run(); })
        .and_then([&](std::vector<BuildPhase> phases) -> Result<void> {
            outcome.phases = std::move(phases);
            if (request.custom_command)
                return {};
            auto manifest = report_artifacts(workspace.spec().root, output_root, request.board, outcome.version);
            if (!manifest)
                return std::unexpected(manifest.error());
            outcome.manifest = std::move(*manifest);
            return write_build_record(build_record_path(output_root, request.board), request.board, outcome);
        })
        .transform([&] { return std::move(outcome); });
}

} // namespace boardbuild
