#include <QCoreApplication>

#include <vector>

#include <nlohmann/json.hpp>

#include "cli/StratumCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("stratum"));

    stratum::StratumConfig config = stratum::loadConfigFromEnvironment();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    stratum::logging::initLogging(QStringLiteral("stratum"), config.traceEnabled);
    SLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              stratum::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()},
                              {"stateDir", config.stateDir.toStdString()}}));

    stratum::StratumCli cli(config);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
