#include "pipeline/provisioning_pipeline.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/id_utils.hpp"
#include "common/logging.hpp"
#include "descriptor/descriptor_parser.hpp"
#include "image/package_inventory.hpp"
#include "pipeline/rootfs_workspace.hpp"

namespace stratum {

namespace {

constexpr const char *kDefaultIdentity = "root";

std::string joinedOutput(const StepResult &result)
{
    std::string output;
    for (const auto &sub : result.subResults) {
        output += sub.output;
    }
    return output;
}

void discardWorkspace(RootfsWorkspace &workspace, const QString &reason)
{
    try {
        workspace.discard();
    } catch (const BuildError &cleanupError) {
        SLOG_WARN(QStringLiteral("ProvisioningPipeline"),
                  QStringLiteral("build"),
                  QStringLiteral("workspace_discard_failed"),
                  reason,
                  QStringLiteral("remove_all"),
                  stratum::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"message", cleanupError.what()}}));
    }
}

} // namespace

ProvisioningPipeline::ProvisioningPipeline(ImageStore &store, CommandRunner &runner,
                                           PipelineOptions options)
    : m_store(store)
    , m_executor(runner)
    , m_options(options)
{
}

void ProvisioningPipeline::setStepObserver(StepObserver observer)
{
    m_observer = std::move(observer);
}

ImageRecord ProvisioningPipeline::build(const Descriptor &descriptor,
                                        const std::vector<std::string> &tags)
{
    m_stepResults.clear();
    m_context = BuildContext{};

    for (const auto &tag : tags) {
        if (!isValidImageReference(tag)) {
            throw BuildError(BuildErrorKind::Parse,
                             "invalid tag '" + tag + "'", 2);
        }
    }

    const std::string buildId = generateHexId();
    stratum::logging::CorrelationScope correlation(QString::fromStdString(buildId));

    SLOG_INFO(QStringLiteral("ProvisioningPipeline"),
              QStringLiteral("build"),
              QStringLiteral("build_start"),
              QStringLiteral("build_request"),
              QStringLiteral("sequential_steps"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"source", descriptor.sourceName},
                              {"from", descriptor.baseReference},
                              {"steps", descriptor.steps.size()},
                              {"tags", tags}}));

    // Nothing below may run unless the base resolves.
    const auto base = m_store.findByReference(descriptor.baseReference);
    if (!base.has_value()) {
        SLOG_ERROR(QStringLiteral("ProvisioningPipeline"),
                   QStringLiteral("build"),
                   QStringLiteral("base_unresolvable"),
                   QStringLiteral("build_request"),
                   QStringLiteral("image_store_lookup"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"from", descriptor.baseReference}}));
        throw BuildError(BuildErrorKind::UnresolvableBase,
                         "unable to resolve base image '" + descriptor.baseReference
                             + "': not found in image store",
                         1, descriptor.baseLine);
    }
    if (!std::filesystem::is_directory(base->rootfs)) {
        throw BuildError(BuildErrorKind::UnresolvableBase,
                         "base image '" + descriptor.baseReference
                             + "' has no filesystem at " + base->rootfs,
                         1, descriptor.baseLine);
    }

    RootfsWorkspace workspace(m_store.imageDir(buildId));
    try {
        workspace.initialize(base->rootfs);
    } catch (const BuildError &) {
        std::error_code cleanupError;
        std::filesystem::remove_all(workspace.imageDir(), cleanupError);
        throw;
    }

    m_context.buildId = buildId;
    m_context.effectiveIdentity = base->defaultUser.empty()
        ? std::string(kDefaultIdentity)
        : base->defaultUser;
    m_context.identityPolicy = m_options.identityPolicy;
    m_context.commandTimeoutMs = m_options.commandTimeoutMs;
    m_context.workspace = &workspace;

    for (size_t i = 0; i < descriptor.steps.size(); ++i) {
        const Step &step = descriptor.steps[i];
        StepResult result = m_executor.apply(m_context, step, i);
        m_stepResults.push_back(result);
        if (m_observer) {
            m_observer(step, result);
        }

        if (result.status == StepStatus::Committed) {
            continue;
        }

        SLOG_ERROR(QStringLiteral("ProvisioningPipeline"),
                   QStringLiteral("build"),
                   QStringLiteral("build_failed"),
                   QStringLiteral("step_failure"),
                   QStringLiteral("halt_pipeline"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"step", i},
                                   {"line", step.line},
                                   {"kind", buildErrorKindName(*result.errorKind)},
                                   {"message", result.errorMessage},
                                   {"exitCode", result.exitCode}}));

        m_context.workspace = nullptr;
        if (!m_options.keepFailedBuilds) {
            discardWorkspace(workspace, QStringLiteral("step_failure"));
        }
        throw BuildError(*result.errorKind, result.errorMessage, result.exitCode,
                         step.line, joinedOutput(result));
    }

    ImageRecord image;
    image.id = buildId;
    image.parentId = base->id;
    image.rootfs = workspace.rootfs().string();
    image.defaultUser = m_context.effectiveIdentity;
    image.source = descriptor.sourceName;
    image.createdAt = std::chrono::system_clock::now();
    image.layers = m_context.layers;
    image.packages = readPackageInventory(image.rootfs);
    m_context.workspace = nullptr;

    try {
        m_store.addImage(image, tags);
    } catch (const std::exception &error) {
        SLOG_ERROR(QStringLiteral("ProvisioningPipeline"),
                   QStringLiteral("build"),
                   QStringLiteral("image_record_failed"),
                   QStringLiteral("store_failure"),
                   QStringLiteral("discard_workspace"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"id", image.id}, {"error", error.what()}}));
        if (!m_options.keepFailedBuilds) {
            discardWorkspace(workspace, QStringLiteral("store_failure"));
        }
        throw;
    }
    std::set<std::string> normalizedTags;
    for (const auto &tag : tags) {
        normalizedTags.insert(normalizeImageReference(tag));
    }
    image.tags.assign(normalizedTags.begin(), normalizedTags.end());

    SLOG_INFO(QStringLiteral("ProvisioningPipeline"),
              QStringLiteral("build"),
              QStringLiteral("build_complete"),
              QStringLiteral("build_request"),
              QStringLiteral("sequential_steps"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"id", image.id},
                              {"defaultUser", image.defaultUser},
                              {"layers", image.layers.size()}}));
    return image;
}

} // namespace stratum
