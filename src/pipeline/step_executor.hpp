#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "pipeline/command_runner.hpp"
#include "pipeline/rootfs_workspace.hpp"

namespace stratum {

// Per-build state threaded through every step.
struct BuildContext {
    std::string buildId;
    std::string effectiveIdentity;
    IdentityPolicy identityPolicy = IdentityPolicy::Lazy;
    int commandTimeoutMs = -1;
    RootfsWorkspace *workspace = nullptr;
    std::vector<LayerRecord> layers;
};

/**
 * Applies single steps to a BuildContext.
 *
 * None of the operations throw for step-level failures; a failed step is
 * reported through StepResult::status with errorKind set. Workspace failures
 * surface as a failed step of kind Workspace.
 */
class StepExecutor {
public:
    explicit StepExecutor(CommandRunner &runner);

    StepResult apply(BuildContext &context, const Step &step, size_t index);

    StepResult setIdentity(BuildContext &context, const std::string &name);
    StepResult run(BuildContext &context, const Step &step);
    StepResult declare(BuildContext &context, const std::string &text);

private:
    CommandRunner &m_runner;
};

} // namespace stratum
