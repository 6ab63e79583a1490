#include "boardbuild/report.hpp"

#include <format>
#include <fstream>
#include <string>

namespace boardbuild {

namespace {

using json = nlohmann::json;

json command_to_json(const Command &cmd) {
    json entry;
    entry["arguments"] = cmd.args;
    if (cmd.working_dir)
        entry["directory"] = *cmd.working_dir;
    if (!cmd.env.empty())
        entry["env"] = cmd.env;
    return entry;
}

json checkout_to_json(const std::optional<ResolvedCheckout> &checkout) {
    if (!checkout)
        return nullptr;
    return {{"ref", checkout->ref}, {"kind", to_string(checkout->kind)}};
}

json phases_to_json(const std::vector<BuildPhase> &phases) {
    json out = json::array();
    for (BuildPhase phase : phases)
        out.push_back(to_string(phase));
    return out;
}

} // namespace

json plan_to_json(const PipelinePlan &plan) {
    json out;
    out["board"] = plan.board;
    out["checkout"] = checkout_to_json(plan.checkout);
    out["version"] = plan.version;

    json attachments = json::array();
    for (const auto &att : plan.workspace.attachments) {
        attachments.push_back({
            {"role", to_string(att.role)},
            {"host", att.host.string()},
            {"in_tree", att.in_tree.string()},
        });
    }
    out["workspace"] = {{"root", plan.workspace.root.string()}, {"attachments", attachments}};

    json acquisition = json::array();
    for (const auto &cmd : plan.acquisition)
        acquisition.push_back(command_to_json(cmd));
    out["acquisition"] = acquisition;

    out["phases"] = phases_to_json(plan.phases);
    json commands = json::array();
    for (const auto &cmd : plan.phase_commands)
        commands.push_back(command_to_json(cmd));
    out["phase_commands"] = commands;
    return out;
}

json outcome_to_json(std::string_view board, const PipelineOutcome &outcome) {
    json out;
    out["board"] = std::string(board);
    out["checkout"] = checkout_to_json(outcome.checkout);
    out["version"] = outcome.version;
    out["phases"] = phases_to_json(outcome.phases);
    if (outcome.manifest) {
        out["images"] = {{"gz", outcome.manifest->gz_image}, {"xz", outcome.manifest->xz_image}};
    } else {
        out["images"] = nullptr;
    }
    return out;
}

std::filesystem::path build_record_path(const std::filesystem::path &output_root, std::string_view board) {
    return output_root / board / build_record_name;
}

Result<void> write_build_record(const std::filesystem::path &path,
                                std::string_view board,
                                const PipelineOutcome &outcome) {
    std::ofstream f(path, std::ios::trunc);
    f << outcome_to_json(board, outcome).dump(4) << '\n';
    f.close();
    if (!f)
        return fail(ErrorKind::Artifact, std::format("cannot write {}", path.string()));
    return {};
}

} // namespace boardbuild
