#pragma once

#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace stratum {

struct CommandRequest {
    // Sub-commands of one RUN step, in order. They share one shell
    // invocation and stop at the first non-zero status.
    std::vector<std::string> commands;
    Principal principal;
    // Root filesystem the command sees; "/" runs on the host tree.
    std::string rootfs = "/";
    // -1 waits forever.
    int timeoutMs = -1;
};

// Executes one shell invocation and blocks until it finishes.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // One result per sub-command that ran; a failure is always the last entry.
    virtual std::vector<SubCommandResult> run(const CommandRequest &request) = 0;
};

/**
 * Runs commands through a POSIX shell with QProcess.
 *
 * - rootfs other than "/": chroot --userspec=UID:GID ROOTFS SHELL -c SCRIPT
 * - host tree, different uid: setpriv --reuid --regid --clear-groups SHELL -c SCRIPT
 * - host tree, same uid: SHELL -c SCRIPT
 *
 * A single command is passed to the shell unchanged. Several commands are
 * written one per line, each followed by a status line carrying a per-runner
 * marker, so the merged output can be cut back into sub-command results.
 *
 * A command that cannot start reports exit code 127, a timed-out one 124 and
 * a crashed shell 128.
 */
class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(QString shell = QStringLiteral("/bin/sh"));

    std::vector<SubCommandResult> run(const CommandRequest &request) override;

    // Program and arguments run() would start; exposed for inspection.
    QStringList commandLine(const CommandRequest &request) const;

    // Script handed to the shell's -c option.
    QString script(const CommandRequest &request) const;

private:
    QString m_shell;
    QByteArray m_marker;
};

} // namespace stratum
