#pragma once

#include "boardbuild/pipeline.hpp"
#include "boardbuild/utility.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string_view>

namespace boardbuild {

inline constexpr std::string_view build_record_name = ".build_info.json";

nlohmann::json plan_to_json(const PipelinePlan &plan);

nlohmann::json outcome_to_json(std::string_view board, const PipelineOutcome &outcome);

std::filesystem::path build_record_path(const std::filesystem::path &output_root, std::string_view board);

/**
 * @brief Writes the JSON record of a finished build next to its manifest.
 * @return Success, or an ArtifactError if the file cannot be written.
 */
Result<void> write_build_record(const std::filesystem::path &path,
                                std::string_view board,
                                const PipelineOutcome &outcome);

} // namespace boardbuild
