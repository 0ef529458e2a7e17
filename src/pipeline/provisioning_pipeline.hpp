#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "image/image_store.hpp"
#include "pipeline/command_runner.hpp"
#include "pipeline/step_executor.hpp"

namespace stratum {

struct PipelineOptions {
    IdentityPolicy identityPolicy = IdentityPolicy::Lazy;
    int commandTimeoutMs = -1;
    // Leave images/<id> on disk after a failed build for inspection.
    bool keepFailedBuilds = false;
};

/**
 * ProvisioningPipeline replays a Descriptor against its base image:
 * - resolves the base reference in the ImageStore
 * - copies its filesystem into a fresh workspace
 * - applies every step in order through StepExecutor, halting at the first failure
 * - records the resulting image (and tags) only when all steps committed
 *
 * build() returns the new image or throws BuildError. Step results of the
 * last build stay available through stepResults() either way.
 */
class ProvisioningPipeline {
public:
    using StepObserver = std::function<void(const Step &, const StepResult &)>;

    ProvisioningPipeline(ImageStore &store, CommandRunner &runner,
                         PipelineOptions options = {});

    ImageRecord build(const Descriptor &descriptor,
                      const std::vector<std::string> &tags = {});

    // Called after every applied step, failed ones included.
    void setStepObserver(StepObserver observer);

    const std::vector<StepResult> &stepResults() const { return m_stepResults; }
    const BuildContext &lastContext() const { return m_context; }

private:
    ImageStore &m_store;
    StepExecutor m_executor;
    PipelineOptions m_options;
    StepObserver m_observer;

    std::vector<StepResult> m_stepResults;
    BuildContext m_context;
};

} // namespace stratum
