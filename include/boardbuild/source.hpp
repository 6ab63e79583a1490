#pragma once

#include "boardbuild/domain.hpp"
#include "boardbuild/process_exec.hpp"
#include "boardbuild/utility.hpp"

#include <optional>
#include <vector>

namespace boardbuild {

/**
 * @brief The git commands needed to populate the checkout, in order.
 *
 * Clone (skipped for a local checkout), pull request fetch
 * and checkout of the resolved reference.
 */
std::vector<Command> acquisition_commands(const BuildRequest &request, const std::optional<ResolvedCheckout> &checkout);

/**
 * @brief Clones the repository into the checkout root and checks out `checkout`.
 *
 * No retry. A failed command leaves whatever it wrote in place.
 *
 * @return Success, or an AcquisitionError carrying the failed command's status.
 */
Result<void> acquire_source(const BuildRequest &request,
                            const std::optional<ResolvedCheckout> &checkout,
                            CommandRunner &runner);

} // namespace boardbuild
