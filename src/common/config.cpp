#include "common/config.hpp"

#include <QtGlobal>

#include <limits>

namespace stratum {

namespace {

bool flagEnabled(const char *name)
{
    return qEnvironmentVariableIntValue(name) == 1;
}

} // namespace

QString defaultStateDir()
{
    const QString explicitHome = qEnvironmentVariable("STRATUM_HOME");
    if (!explicitHome.isEmpty()) {
        return explicitHome;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/stratum");
    }
    return home + QStringLiteral("/.local/share/stratum");
}

StratumConfig loadConfigFromEnvironment()
{
    StratumConfig config;
    config.stateDir = defaultStateDir();
    config.traceEnabled = flagEnabled("STRATUM_TRACE");
    if (flagEnabled("STRATUM_STRICT_IDENTITY")) {
        config.identityPolicy = IdentityPolicy::Strict;
    }

    const QString shell = qEnvironmentVariable("STRATUM_SHELL");
    if (!shell.isEmpty()) {
        config.shell = shell;
    }

    bool ok = false;
    const int timeoutSeconds = qEnvironmentVariableIntValue("STRATUM_COMMAND_TIMEOUT", &ok);
    if (ok && timeoutSeconds > 0) {
        const qint64 timeoutMs = qint64(timeoutSeconds) * 1000;
        config.commandTimeoutMs = int(qMin(timeoutMs, qint64(std::numeric_limits<int>::max())));
    }

    config.keepFailedBuilds = flagEnabled("STRATUM_KEEP_FAILED");
    return config;
}

} // namespace stratum
