#pragma once

#include <memory>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "pipeline/command_runner.hpp"

namespace stratum {

class StratumCli
{
public:
    // runner defaults to a ShellCommandRunner using config.shell.
    explicit StratumCli(StratumConfig config,
                        std::unique_ptr<CommandRunner> runner = nullptr);

    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runBuild(const QStringList &args, bool onlyIfMissing);
    int runPlan(const QStringList &args);
    int runImport(const QStringList &args);
    int runImages(const QStringList &args);
    int runInspect(const QStringList &args);
    int runTag(const QStringList &args);
    int runRemove(const QStringList &args);

    CommandRunner &runner();

    StratumConfig m_config;
    std::unique_ptr<CommandRunner> m_runner;
};

} // namespace stratum
