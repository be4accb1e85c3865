#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class ConnectivityChecker;
class PrivilegedExecutor;
class SystemProbe;

class DriverManagerCli
{
public:
    DriverManagerCli(SystemProbe &probe,
                     PrivilegedExecutor &executor,
                     ConnectivityChecker &connectivity,
                     const EngineConfig &config);
    ~DriverManagerCli();

    // returns exit code
    int run(int argc, char *argv[]);

private:
    struct Engine;

    int runDetect(const QStringList &args);
    int runPlan(const QStringList &args);
    int runInstall(const QStringList &args);
    int runBackups(const QStringList &args);
    int runRestore(const QStringList &args);
    int runStatus(const QStringList &args);
    int runCancelDeferred(const QStringList &args);
    int runHistory(const QStringList &args);
    int runDiagnostics(const QStringList &args);
    int runVersions(const QStringList &args);

    // Detection and selection errors map to their exit codes here.
    std::optional<Strategy> selectStrategy(const QString &name,
                                           const EnvironmentSnapshot &snapshot,
                                           int &exitCode);

    SystemProbe &m_probe;
    PrivilegedExecutor &m_executor;
    ConnectivityChecker &m_connectivity;
    EngineConfig m_config;
    std::unique_ptr<Engine> m_engine;
};

} // namespace nvdm
