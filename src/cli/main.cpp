#include <QCoreApplication>

#include <vector>

#include <nlohmann/json.hpp>

#include "cli/DriverManagerCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/nvdm_version.hpp"
#include "common/paths.hpp"
#include "engine/connectivity_checker.hpp"
#include "engine/privileged_executor.hpp"
#include "engine/system_probe.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("nvdm"));
    QCoreApplication::setApplicationVersion(QStringLiteral(NVDM_VERSION_STRING));

    bool trace = qEnvironmentVariableIntValue("NVDM_TRACE") == 1;
    std::vector<QByteArray> utf8Args;
    utf8Args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        }
        utf8Args.push_back(arg.toLocal8Bit());
    }

    nvdm::ensureAppLayout();
    nvdm::logging::initLogging(QStringLiteral("nvdm"), trace);
    NVDM_LOG_INFO(QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("cli_start"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("cli"),
                  nvdm::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"args", argc}, {"version", NVDM_VERSION_STRING}}));

    const nvdm::EngineConfig config = nvdm::loadEngineConfig();
    nvdm::HostSystemProbe probe;
    nvdm::TerminalPasswordPrompt prompt;
    nvdm::SudoExecutor executor(prompt);
    nvdm::TcpConnectivityChecker connectivity;

    nvdm::DriverManagerCli cli(probe, executor, connectivity, config);
    std::vector<char *> rawArgs;
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
