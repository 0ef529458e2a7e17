#include "cli/StratumCli.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "descriptor/descriptor_parser.hpp"
#include "image/image_store.hpp"
#include "pipeline/provisioning_pipeline.hpp"

namespace stratum {

namespace {

constexpr int kUsageExitCode = 2;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  stratum build  -f FILE [-t REF]... [--strict-identity] [--format text|json]\n"
        "  stratum ensure -f FILE -t REF [--strict-identity] [--format text|json]\n"
        "  stratum plan   -f FILE [--format text|json]\n"
        "  stratum import REF --rootfs DIR [--user NAME]\n"
        "  stratum images [--format text|json]\n"
        "  stratum inspect REF\n"
        "  stratum tag SOURCE_REF TARGET_REF\n"
        "  stratum rmi REF\n");
}

int usageError()
{
    std::cerr << usageText().toStdString();
    return kUsageExitCode;
}

bool isValueOption(const QString &arg)
{
    static const QStringList valueOptions = {
        QStringLiteral("-f"), QStringLiteral("--file"),
        QStringLiteral("-t"), QStringLiteral("--tag"),
        QStringLiteral("--format"), QStringLiteral("--rootfs"),
        QStringLiteral("--user"),
    };
    return valueOptions.contains(arg);
}

QString getArgValue(const QStringList &args, const QString &shortKey, const QString &key)
{
    for (int i = 2; i + 1 < args.size(); ++i) {
        if (args.at(i) == key || (!shortKey.isEmpty() && args.at(i) == shortKey)) {
            return args.at(i + 1);
        }
    }
    return {};
}

QStringList getArgValues(const QStringList &args, const QString &shortKey, const QString &key)
{
    QStringList values;
    for (int i = 2; i + 1 < args.size(); ++i) {
        if (args.at(i) == key || args.at(i) == shortKey) {
            values.push_back(args.at(i + 1));
            ++i;
        }
    }
    return values;
}

// Arguments after the subcommand that are neither options nor option values.
QStringList positionalArgs(const QStringList &args)
{
    QStringList positional;
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (isValueOption(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QLatin1Char('-'))) {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QString(), QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

bool isKnownFormat(const QString &format)
{
    return format == QStringLiteral("text") || format == QStringLiteral("json");
}

std::vector<std::string> toStdStrings(const QStringList &values)
{
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const QString &value : values) {
        out.push_back(value.toStdString());
    }
    return out;
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm").toStdString();
}

std::string stepLine(const Step &step)
{
    switch (step.kind) {
    case StepKind::SetUser:
        return "USER " + step.payload;
    case StepKind::Run:
        return "RUN " + step.payload;
    case StepKind::Comment:
        return "# " + step.payload;
    }
    return step.payload;
}

size_t countInstructions(const Descriptor &descriptor)
{
    size_t count = 0;
    for (const auto &step : descriptor.steps) {
        if (step.kind != StepKind::Comment) {
            ++count;
        }
    }
    return count;
}

void renderPlanText(const Descriptor &descriptor)
{
    std::cout << "FROM " << descriptor.baseReference << "\n";
    size_t number = 0;
    const size_t total = countInstructions(descriptor);
    for (const auto &step : descriptor.steps) {
        if (step.kind == StepKind::Comment) {
            continue;
        }
        ++number;
        std::cout << "Step " << number << "/" << total << " (line " << step.line
                  << ") : " << stepLine(step) << "\n";
        if (step.kind != StepKind::Run) {
            continue;
        }
        for (size_t i = 0; i < step.subCommands.size(); ++i) {
            std::cout << "  [" << (i + 1) << "/" << step.subCommands.size() << "] "
                      << step.subCommands[i] << "\n";
        }
    }
}

void renderImagesText(const std::vector<ImageRecord> &images)
{
    std::cout << std::left
              << std::setw(40) << "REFERENCE"
              << std::setw(14) << "IMAGE ID"
              << std::setw(18) << "CREATED"
              << std::setw(12) << "USER"
              << "PACKAGES\n";

    for (const auto &image : images) {
        std::vector<std::string> references = image.tags;
        if (references.empty()) {
            references.push_back("<none>");
        }
        for (const auto &reference : references) {
            std::cout << std::left
                      << std::setw(40) << reference
                      << std::setw(14) << shortId(image.id)
                      << std::setw(18) << formatLocalTime(image.createdAt)
                      << std::setw(12) << image.defaultUser
                      << image.packages.size() << "\n";
        }
    }
}

void printStepText(const Step &step, const StepResult &result, size_t number, size_t total)
{
    std::cout << "Step " << number << "/" << total << " : " << stepLine(step) << "\n";
    for (size_t i = 0; i < result.subResults.size(); ++i) {
        const auto &sub = result.subResults[i];
        std::cout << " ---> [" << (i + 1) << "/" << result.subResults.size() << "] "
                  << sub.command << "\n";
        if (!sub.output.empty()) {
            std::cout << sub.output;
            if (sub.output.back() != '\n') {
                std::cout << "\n";
            }
        }
    }
    if (!result.layerId.empty()) {
        std::cout << " ---> layer " << shortId(result.layerId) << "\n";
    }
    std::cout.flush();
}

} // namespace

StratumCli::StratumCli(StratumConfig config, std::unique_ptr<CommandRunner> runner)
    : m_config(std::move(config))
    , m_runner(std::move(runner))
{
}

CommandRunner &StratumCli::runner()
{
    if (!m_runner) {
        m_runner = std::make_unique<ShellCommandRunner>(m_config.shell);
    }
    return *m_runner;
}

int StratumCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        return usageError();
    }

    const QString command = args.at(1);
    SLOG_INFO(QStringLiteral("StratumCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("build")) {
            return runBuild(args, false);
        }
        if (command == QStringLiteral("ensure")) {
            return runBuild(args, true);
        }
        if (command == QStringLiteral("plan")) {
            return runPlan(args);
        }
        if (command == QStringLiteral("import")) {
            return runImport(args);
        }
        if (command == QStringLiteral("images")) {
            return runImages(args);
        }
        if (command == QStringLiteral("inspect")) {
            return runInspect(args);
        }
        if (command == QStringLiteral("tag")) {
            return runTag(args);
        }
        if (command == QStringLiteral("rmi")) {
            return runRemove(args);
        }
    } catch (const BuildError &error) {
        std::cerr << "Error: " << error.what() << std::endl;
        return error.exitCode();
    } catch (const std::exception &error) {
        SLOG_ERROR(QStringLiteral("StratumCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("cli"),
                   stratum::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"error", error.what()}}));
        std::cerr << "Error: " << error.what() << std::endl;
        return 1;
    }

    return usageError();
}

int StratumCli::runBuild(const QStringList &args, bool onlyIfMissing)
{
    const QString file = getArgValue(args, QStringLiteral("-f"), QStringLiteral("--file"));
    const QStringList tags = getArgValues(args, QStringLiteral("-t"), QStringLiteral("--tag"));
    if (file.isEmpty() || (onlyIfMissing && tags.size() != 1)) {
        return usageError();
    }

    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kUsageExitCode;
    }
    const bool json = format == QStringLiteral("json");

    ImageStore store(m_config.stateDir.toStdString());

    if (onlyIfMissing) {
        // Reuse the tagged image when one exists; build only on a miss.
        if (const auto existing = store.findByReference(tags.front().toStdString())) {
            SLOG_INFO(QStringLiteral("StratumCli"),
                      QStringLiteral("runBuild"),
                      QStringLiteral("ensure_hit"),
                      QStringLiteral("user_invocation"),
                      QStringLiteral("image_store_lookup"),
                      stratum::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"reference", tags.front().toStdString()},
                                      {"id", existing->id}}));
            if (json) {
                std::cout << nlohmann::json{{"built", false}, {"image", *existing}}.dump(2)
                          << std::endl;
            } else {
                std::cout << "Image " << tags.front().toStdString() << " is present ("
                          << shortId(existing->id) << "), nothing to build\n";
            }
            return 0;
        }
    }

    const Descriptor descriptor = parseDescriptorFile(file.toStdString());

    PipelineOptions options;
    options.identityPolicy = args.contains(QStringLiteral("--strict-identity"))
        ? IdentityPolicy::Strict
        : m_config.identityPolicy;
    options.commandTimeoutMs = m_config.commandTimeoutMs;
    options.keepFailedBuilds = m_config.keepFailedBuilds;

    ProvisioningPipeline pipeline(store, runner(), options);

    if (!json) {
        std::cout << "Step 0 : FROM " << descriptor.baseReference << "\n";
        const size_t total = countInstructions(descriptor);
        auto number = std::make_shared<size_t>(0);
        pipeline.setStepObserver([number, total](const Step &step, const StepResult &result) {
            if (step.kind == StepKind::Comment) {
                return;
            }
            printStepText(step, result, ++(*number), total);
        });
    }

    try {
        const ImageRecord image = pipeline.build(descriptor, toStdStrings(tags));
        if (json) {
            std::cout << nlohmann::json{{"built", true},
                                        {"image", image},
                                        {"steps", pipeline.stepResults()}}.dump(2)
                      << std::endl;
        } else {
            std::cout << "Successfully built " << shortId(image.id) << "\n";
            for (const auto &tag : image.tags) {
                std::cout << "Successfully tagged " << tag << "\n";
            }
        }
        return 0;
    } catch (const BuildError &error) {
        if (!json) {
            throw;
        }
        std::cout << nlohmann::json{{"built", false},
                                    {"error", {{"kind", buildErrorKindName(error.kind())},
                                               {"message", error.what()},
                                               {"line", error.line()},
                                               {"exitCode", error.exitCode()}}},
                                    {"steps", pipeline.stepResults()}}.dump(2)
                  << std::endl;
        return error.exitCode();
    }
}

int StratumCli::runPlan(const QStringList &args)
{
    const QString file = getArgValue(args, QStringLiteral("-f"), QStringLiteral("--file"));
    if (file.isEmpty()) {
        return usageError();
    }
    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kUsageExitCode;
    }

    const Descriptor descriptor = parseDescriptorFile(file.toStdString());
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(descriptor).dump(2) << std::endl;
    } else {
        renderPlanText(descriptor);
    }
    return 0;
}

int StratumCli::runImport(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    const QString rootfs = getArgValue(args, QString(), QStringLiteral("--rootfs"));
    if (positional.size() != 1 || rootfs.isEmpty()) {
        return usageError();
    }
    const QString user = getArgValue(args, QString(), QStringLiteral("--user"));

    ImageStore store(m_config.stateDir.toStdString());
    const ImageRecord image = store.importImage(positional.front().toStdString(),
                                                rootfs.toStdString(),
                                                user.toStdString());
    std::cout << "Imported " << shortId(image.id);
    for (const auto &tag : image.tags) {
        std::cout << " as " << tag;
    }
    std::cout << " (" << image.packages.size() << " packages, user "
              << image.defaultUser << ")\n";
    return 0;
}

int StratumCli::runImages(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kUsageExitCode;
    }

    ImageStore store(m_config.stateDir.toStdString());
    const auto images = store.listImages();
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(images).dump(2) << std::endl;
    } else {
        renderImagesText(images);
    }
    return 0;
}

int StratumCli::runInspect(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.size() != 1) {
        return usageError();
    }

    ImageStore store(m_config.stateDir.toStdString());
    const auto image = store.findByReference(positional.front().toStdString());
    if (!image.has_value()) {
        std::cerr << "Error: no such image: " << positional.front().toStdString() << std::endl;
        return 1;
    }
    std::cout << nlohmann::json(*image).dump(2) << std::endl;
    return 0;
}

int StratumCli::runTag(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.size() != 2) {
        return usageError();
    }

    ImageStore store(m_config.stateDir.toStdString());
    const auto image = store.findByReference(positional.at(0).toStdString());
    if (!image.has_value()) {
        std::cerr << "Error: no such image: " << positional.at(0).toStdString() << std::endl;
        return 1;
    }
    store.tagImage(positional.at(1).toStdString(), image->id);
    return 0;
}

int StratumCli::runRemove(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.size() != 1) {
        return usageError();
    }

    ImageStore store(m_config.stateDir.toStdString());
    const std::string reference = positional.front().toStdString();
    const auto image = store.findByReference(reference);
    const bool deleted = store.removeTag(reference);
    const std::string normalized = normalizeImageReference(reference);
    if (image.has_value()
        && std::find(image->tags.begin(), image->tags.end(), normalized) != image->tags.end()) {
        std::cout << "Untagged: " << normalized << "\n";
    }
    if (deleted && image.has_value()) {
        std::cout << "Deleted: " << image->id << "\n";
    }
    return 0;
}

} // namespace stratum
