#include "pipeline/command_runner.hpp"

#include <QProcess>
#include <QProcessEnvironment>
#include <QStringList>

#include <unistd.h>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/id_utils.hpp"
#include "common/logging.hpp"

namespace stratum {

namespace {

constexpr int kNotStartedExitCode = 127;
constexpr int kTimedOutExitCode = 124;
constexpr int kCrashedExitCode = 128;

constexpr const char *kDefaultPath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

bool isHostTree(const std::string &rootfs)
{
    return rootfs.empty() || rootfs == "/";
}

QProcessEnvironment environmentFor(const Principal &principal)
{
    QProcessEnvironment env;
    env.insert(QStringLiteral("PATH"), QString::fromLatin1(kDefaultPath));
    env.insert(QStringLiteral("HOME"), QString::fromStdString(principal.home));
    env.insert(QStringLiteral("USER"), QString::fromStdString(principal.name));
    env.insert(QStringLiteral("LOGNAME"), QString::fromStdString(principal.name));
    return env;
}

std::string decode(const QByteArray &bytes)
{
    return QString::fromUtf8(bytes).toStdString();
}

struct SplitOutput {
    std::vector<SubCommandResult> results;
    // False when the shell ended before reporting the last entry's status.
    bool lastReported = true;
};

// Cuts merged shell output at the status lines written after each command.
// Each status line is "\n<marker> <index> <status>\n".
SplitOutput splitOutput(const CommandRequest &request,
                        const QByteArray &marker,
                        const QByteArray &output)
{
    SplitOutput split;
    const QByteArray needle = QByteArrayLiteral("\n") + marker + QByteArrayLiteral(" ");
    qsizetype cursor = 0;

    while (!marker.isEmpty() && split.results.size() < request.commands.size()) {
        const qsizetype at = output.indexOf(needle, cursor);
        if (at < 0) {
            break;
        }
        const qsizetype fieldsStart = at + needle.size();
        const qsizetype lineEnd = output.indexOf('\n', fieldsStart);
        if (lineEnd < 0) {
            break;
        }
        const QList<QByteArray> fields = output.mid(fieldsStart, lineEnd - fieldsStart).split(' ');
        bool ok = fields.size() == 2;
        const int status = ok ? fields.at(1).toInt(&ok) : 0;
        if (!ok) {
            break;
        }

        SubCommandResult result;
        result.command = request.commands.at(split.results.size());
        result.output = decode(output.mid(cursor, at - cursor));
        result.exitCode = status;
        split.results.push_back(std::move(result));
        cursor = lineEnd + 1;
    }

    const QByteArray rest = output.mid(cursor);
    if (split.results.size() < request.commands.size()) {
        SubCommandResult result;
        result.command = request.commands.at(split.results.size());
        result.output = decode(rest);
        split.results.push_back(std::move(result));
        split.lastReported = false;
    } else if (!rest.isEmpty()) {
        split.results.back().output += decode(rest);
    }
    return split;
}

} // namespace

ShellCommandRunner::ShellCommandRunner(QString shell)
    : m_shell(std::move(shell))
    , m_marker(QByteArray::fromStdString("stratum-status-" + generateHexId()))
{
}

QString ShellCommandRunner::script(const CommandRequest &request) const
{
    if (request.commands.size() == 1) {
        return QString::fromStdString(request.commands.front());
    }

    QStringList lines;
    for (size_t i = 0; i < request.commands.size(); ++i) {
        lines << QString::fromStdString(request.commands[i]);
        lines << QStringLiteral("__stratum_rc=$?; printf '\\n%s %d %d\\n' %1 %2 \"$__stratum_rc\"; "
                                "[ \"$__stratum_rc\" -eq 0 ] || exit \"$__stratum_rc\"")
                     .arg(QString::fromLatin1(m_marker))
                     .arg(static_cast<qulonglong>(i));
    }
    return lines.join(QLatin1Char('\n'));
}

QStringList ShellCommandRunner::commandLine(const CommandRequest &request) const
{
    const QString command = script(request);
    const QString uid = QString::number(request.principal.uid);
    const QString gid = QString::number(request.principal.gid);

    if (!isHostTree(request.rootfs)) {
        return {QStringLiteral("chroot"),
                QStringLiteral("--userspec=%1:%2").arg(uid, gid),
                QString::fromStdString(request.rootfs),
                m_shell, QStringLiteral("-c"), command};
    }

    if (request.principal.uid != static_cast<uint32_t>(getuid())) {
        return {QStringLiteral("setpriv"),
                QStringLiteral("--reuid=%1").arg(uid),
                QStringLiteral("--regid=%1").arg(gid),
                QStringLiteral("--clear-groups"),
                m_shell, QStringLiteral("-c"), command};
    }

    return {m_shell, QStringLiteral("-c"), command};
}

std::vector<SubCommandResult> ShellCommandRunner::run(const CommandRequest &request)
{
    if (request.commands.empty()) {
        return {};
    }

    QStringList arguments = commandLine(request);
    const QString program = arguments.takeFirst();

    SLOG_DEBUG(QStringLiteral("ShellCommandRunner"),
               QStringLiteral("run"),
               QStringLiteral("shell_start"),
               QStringLiteral("run_step"),
               program,
               stratum::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"commands", request.commands},
                               {"principal", request.principal.name},
                               {"uid", request.principal.uid},
                               {"rootfs", request.rootfs}}));

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.setProcessEnvironment(environmentFor(request.principal));
    if (isHostTree(request.rootfs)) {
        process.setWorkingDirectory(QStringLiteral("/"));
    }
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        SubCommandResult result;
        result.command = request.commands.front();
        result.started = false;
        result.exitCode = kNotStartedExitCode;
        result.output = process.errorString().toStdString();
        return {result};
    }
    process.closeWriteChannel();

    const bool finished = process.waitForFinished(request.timeoutMs);
    if (!finished) {
        process.kill();
        process.waitForFinished();
    }

    const QByteArray marker = request.commands.size() == 1 ? QByteArray() : m_marker;
    SplitOutput split = splitOutput(request, marker, process.readAll());
    SubCommandResult &last = split.results.back();

    if (!finished) {
        last.timedOut = true;
        last.exitCode = kTimedOutExitCode;
    } else if (process.exitStatus() != QProcess::NormalExit) {
        last.exitCode = kCrashedExitCode;
    } else if (!split.lastReported) {
        // The shell left early, e.g. through exit; its status belongs to the
        // command that was running.
        last.exitCode = process.exitCode();
    }
    return split.results;
}

} // namespace stratum
