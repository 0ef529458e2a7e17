#pragma once

#include <QString>

#include "common/enums.hpp"

namespace stratum {

struct StratumConfig {
    // Root of the image store and the log directory.
    QString stateDir;
    bool traceEnabled = false;
    IdentityPolicy identityPolicy = IdentityPolicy::Lazy;
    // Shell used for sub-commands, resolved inside the image filesystem.
    QString shell = QStringLiteral("/bin/sh");
    // Timeout of one RUN shell invocation; -1 waits forever.
    int commandTimeoutMs = -1;
    bool keepFailedBuilds = false;
};

// STRATUM_HOME, or $HOME/.local/share/stratum.
QString defaultStateDir();

// Reads the STRATUM_* environment variables on top of the defaults.
StratumConfig loadConfigFromEnvironment();

} // namespace stratum
