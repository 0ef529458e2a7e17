#include "pipeline/step_executor.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/id_utils.hpp"
#include "common/logging.hpp"
#include "image/principal_resolver.hpp"

namespace stratum {

namespace {

int stepExitCode(int exitCode)
{
    if (exitCode >= 1 && exitCode <= 255) {
        return exitCode;
    }
    return 1;
}

std::string committedRootfs(const BuildContext &context)
{
    return context.workspace ? context.workspace->rootfs().string() : std::string("/");
}

void markFailed(StepResult &result, BuildErrorKind kind, const std::string &message,
                int exitCode)
{
    result.status = StepStatus::Failed;
    result.errorKind = kind;
    result.errorMessage = message;
    result.exitCode = exitCode;
}

std::string unknownIdentityMessage(const std::string &identity)
{
    return "unable to find user " + identity + ": no matching entries in passwd file";
}

std::string commandFailureMessage(const SubCommandResult &sub, int timeoutMs)
{
    if (!sub.started) {
        return "command '" + sub.command + "' could not be started: " + sub.output;
    }
    if (sub.timedOut) {
        return "command '" + sub.command + "' timed out after "
            + std::to_string(timeoutMs / 1000) + "s";
    }
    return "command '" + sub.command + "' returned a non-zero code: "
        + std::to_string(sub.exitCode);
}

} // namespace

StepExecutor::StepExecutor(CommandRunner &runner)
    : m_runner(runner)
{
}

StepResult StepExecutor::apply(BuildContext &context, const Step &step, size_t index)
{
    StepResult result;
    switch (step.kind) {
    case StepKind::SetUser:
        result = setIdentity(context, step.payload);
        break;
    case StepKind::Run:
        result = run(context, step);
        break;
    case StepKind::Comment:
        result = declare(context, step.payload);
        break;
    }
    result.index = index;
    result.line = step.line;
    return result;
}

StepResult StepExecutor::setIdentity(BuildContext &context, const std::string &name)
{
    StepResult result;
    result.kind = StepKind::SetUser;
    result.payload = name;

    if (context.identityPolicy == IdentityPolicy::Strict
        && !resolvePrincipal(committedRootfs(context), name).has_value()) {
        result.identity = context.effectiveIdentity;
        markFailed(result, BuildErrorKind::UnknownIdentity,
                   unknownIdentityMessage(name), 1);
        return result;
    }

    SLOG_INFO(QStringLiteral("StepExecutor"),
              QStringLiteral("setIdentity"),
              QStringLiteral("identity_changed"),
              QStringLiteral("user_step"),
              context.identityPolicy == IdentityPolicy::Strict
                  ? QStringLiteral("strict_policy")
                  : QStringLiteral("lazy_policy"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"from", context.effectiveIdentity}, {"to", name}}));

    context.effectiveIdentity = name;
    result.identity = name;
    return result;
}

StepResult StepExecutor::run(BuildContext &context, const Step &step)
{
    StepResult result;
    result.kind = StepKind::Run;
    result.payload = step.payload;
    result.identity = context.effectiveIdentity;

    if (!context.workspace) {
        markFailed(result, BuildErrorKind::Workspace, "no workspace to run in", 1);
        return result;
    }

    const auto principal = resolvePrincipal(committedRootfs(context),
                                            context.effectiveIdentity);
    if (!principal.has_value()) {
        markFailed(result, BuildErrorKind::UnknownIdentity,
                   unknownIdentityMessage(context.effectiveIdentity), 1);
        return result;
    }

    std::filesystem::path staging;
    try {
        staging = context.workspace->beginLayer();
    } catch (const BuildError &error) {
        markFailed(result, BuildErrorKind::Workspace, error.what(), 1);
        return result;
    }

    CommandRequest request;
    request.commands = step.subCommands.empty()
        ? std::vector<std::string>{step.payload}
        : step.subCommands;
    request.principal = *principal;
    request.rootfs = staging.string();
    request.timeoutMs = context.commandTimeoutMs;

    result.subResults = m_runner.run(request);
    if (result.subResults.empty()) {
        SubCommandResult missing;
        missing.command = request.commands.front();
        missing.started = false;
        missing.exitCode = 127;
        missing.output = "no result from the command runner";
        result.subResults.push_back(missing);
    }
    const SubCommandResult &last = result.subResults.back();
    if (!last.started || last.timedOut || last.exitCode != 0) {
        SLOG_WARN(QStringLiteral("StepExecutor"),
                  QStringLiteral("run"),
                  QStringLiteral("sub_command_failed"),
                  QStringLiteral("run_step"),
                  QStringLiteral("abort_layer"),
                  stratum::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"command", last.command},
                                  {"position", result.subResults.size()},
                                  {"exitCode", last.exitCode},
                                  {"started", last.started},
                                  {"timedOut", last.timedOut}}));

        markFailed(result, BuildErrorKind::CommandFailed,
                   commandFailureMessage(last, context.commandTimeoutMs),
                   stepExitCode(last.exitCode));
        try {
            context.workspace->abortLayer();
        } catch (const BuildError &error) {
            result.errorMessage += "; discarding the staged layer also failed: ";
            result.errorMessage += error.what();
        }
        return result;
    }

    try {
        context.workspace->commitLayer();
    } catch (const BuildError &error) {
        markFailed(result, BuildErrorKind::Workspace, error.what(), 1);
        return result;
    }

    LayerRecord layer;
    layer.id = generateHexId();
    layer.createdAt = std::chrono::system_clock::now();
    layer.createdBy = "RUN " + step.payload;
    layer.identity = context.effectiveIdentity;
    context.layers.push_back(layer);
    result.layerId = layer.id;

    SLOG_INFO(QStringLiteral("StepExecutor"),
              QStringLiteral("run"),
              QStringLiteral("layer_committed"),
              QStringLiteral("run_step"),
              QStringLiteral("staging_swap"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"layer", layer.id},
                              {"identity", layer.identity},
                              {"subCommands", result.subResults.size()}}));
    return result;
}

StepResult StepExecutor::declare(BuildContext &context, const std::string &text)
{
    StepResult result;
    result.kind = StepKind::Comment;
    result.payload = text;
    result.identity = context.effectiveIdentity;
    return result;
}

} // namespace stratum
