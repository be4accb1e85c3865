#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <iostream>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/DriverManagerCli.hpp"
#include "common/paths.hpp"
#include "test_fakes.hpp"

using namespace nvdm;
using namespace nvdm::testing;

class DriverManagerCliTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testUsageWithoutCommand();
    void testDetectJson();
    void testDetectFailureExitCode();
    void testUnknownStrategy();
    void testUnsupportedKernelExitCode();
    void testPlanListsCommandsWithoutRunning();
    void testDeferredInstallLifecycle();
    void testVersionsRefreshPersists();
    void testSecureBootWarningBeforeProprietaryInstall();
    void testDeleteBackup();

private:
    int runCli(const QStringList &args, std::string &out);
    void scriptLegacyDownload();

    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<FakeSystemProbe> m_probe;
    std::unique_ptr<FakeExecutor> m_executor;
    std::unique_ptr<FakeConnectivity> m_connectivity;
};

void DriverManagerCliTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    qputenv("NVDM_BASE", m_tempDir->path().toUtf8());
    m_probe = std::make_unique<FakeSystemProbe>();
    m_executor = std::make_unique<FakeExecutor>(m_probe.get());
    m_connectivity = std::make_unique<FakeConnectivity>();
}

void DriverManagerCliTests::cleanup()
{
    m_executor.reset();
    m_probe.reset();
    m_connectivity.reset();
    m_tempDir.reset();
    qunsetenv("NVDM_BASE");
}

int DriverManagerCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    DriverManagerCli cli(*m_probe, *m_executor, *m_connectivity, EngineConfig{});
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    utf8Args.push_back(QByteArrayLiteral("nvdm"));
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void DriverManagerCliTests::scriptLegacyDownload()
{
    const std::string file = "NVIDIA-Linux-x86_64-470.256.02.run";
    m_probe->script(commandKey("curl", {"-fL", "-o",
                                        m_tempDir->path().toStdString() + "/cache/downloads/" + file,
                                        "https://us.download.nvidia.com/XFree86/Linux-x86_64/470.256.02/"
                                            + file}));
}

void DriverManagerCliTests::testUsageWithoutCommand()
{
    std::string out;
    QCOMPARE(runCli({}, out), 2);
    QVERIFY(out.find("Usage:") != std::string::npos);

    QCOMPARE(runCli({QStringLiteral("frobnicate")}, out), 2);
}

void DriverManagerCliTests::testDetectJson()
{
    scriptDebianHost(*m_probe);
    std::string out;
    QCOMPARE(runCli({QStringLiteral("detect"), QStringLiteral("--format"), QStringLiteral("json")}, out), 0);

    const auto start = out.find('{');
    QVERIFY(start != std::string::npos);
    const nlohmann::json j = nlohmann::json::parse(out.substr(start));
    QCOMPARE(QString::fromStdString(j.at("distroFamily").get<std::string>()), QStringLiteral("debian"));
    QCOMPARE(QString::fromStdString(j.at("currentDriver").at("family").get<std::string>()),
             QStringLiteral("nouveau"));

    QCOMPARE(runCli({QStringLiteral("detect"), QStringLiteral("--format"), QStringLiteral("yaml")}, out), 2);
}

void DriverManagerCliTests::testDetectFailureExitCode()
{
    scriptDebianHost(*m_probe);
    m_probe->files["/etc/os-release"] = "ID=gentoo\n";
    std::string out;
    QCOMPARE(runCli({QStringLiteral("detect")}, out), 23);
    QVERIFY(out.find("gentoo") != std::string::npos);
}

void DriverManagerCliTests::testUnknownStrategy()
{
    scriptDebianHost(*m_probe);
    std::string out;
    QCOMPARE(runCli({QStringLiteral("install"), QStringLiteral("nvidia-latest"), QStringLiteral("--yes")}, out), 2);
    QVERIFY(out.find("Unknown strategy") != std::string::npos);
    QVERIFY(m_executor->commands.empty());
}

void DriverManagerCliTests::testUnsupportedKernelExitCode()
{
    scriptDebianHost(*m_probe, "5.15.0-119-generic");
    std::string out;
    QCOMPARE(runCli({QStringLiteral("install"), QStringLiteral("nvk"), QStringLiteral("--yes")}, out), 21);
    QVERIFY(m_executor->commands.empty());
}

void DriverManagerCliTests::testPlanListsCommandsWithoutRunning()
{
    scriptDebianHost(*m_probe);
    setRunDriver(*m_probe, "580.126.09");
    std::string out;
    QCOMPARE(runCli({QStringLiteral("plan"), QStringLiteral("run-legacy")}, out), 0);

    QVERIFY(out.find("Preparation:") != std::string::npos);
    QVERIFY(out.find("On next boot:") != std::string::npos);
    QVERIFY(out.find("[run-installer] # sh /usr/local/lib/nvdm-deferred/NVIDIA-Linux-x86_64-470.256.02.run")
            != std::string::npos);
    QVERIFY(out.find("[fetch-installer] $ curl") != std::string::npos);
    QVERIFY(out.find("Commands:") == std::string::npos);
    QVERIFY(m_executor->commands.empty());
}

void DriverManagerCliTests::testDeferredInstallLifecycle()
{
    scriptDebianHost(*m_probe);
    setRunDriver(*m_probe, "580.126.09");
    scriptLegacyDownload();

    std::string out;
    QCOMPARE(runCli({QStringLiteral("install"), QStringLiteral("run-legacy"), QStringLiteral("--yes")}, out), 10);
    QVERIFY(out.find("-> deferred-pending") != std::string::npos);
    QVERIFY(m_executor->ranStep("stage-enable-unit"));
    QVERIFY(!m_executor->ranStep("run-installer"));

    QCOMPARE(runCli({QStringLiteral("status")}, out), 10);
    QVERIFY(out.find("pending (run-legacy)") != std::string::npos);

    const auto before = m_executor->commands.size();
    QCOMPARE(runCli({QStringLiteral("install"), QStringLiteral("nvk"), QStringLiteral("--yes")}, out), 20);
    QCOMPARE(m_executor->commands.size(), before);

    QCOMPARE(runCli({QStringLiteral("cancel-deferred")}, out), 0);
    QVERIFY(out.find("cancelled") != std::string::npos);
    QCOMPARE(runCli({QStringLiteral("status")}, out), 0);

    QCOMPARE(runCli({QStringLiteral("history")}, out), 0);
    QVERIFY(out.find("run-legacy 470.256.02  failed") != std::string::npos);
}

void DriverManagerCliTests::testVersionsRefreshPersists()
{
    m_probe->script("uname -m", "x86_64\n");
    m_probe->script("curl -s -L https://download.nvidia.com/XFree86/Linux-x86_64/",
                    "<a href='580.105.08/'>580.105.08/</a>\n<a href='470.239.06/'>470.239.06/</a>\n");
    std::string out;
    QCOMPARE(runCli({QStringLiteral("versions"), QStringLiteral("--refresh")}, out), 0);
    QVERIFY(out.find("run-production   580.105.08") != std::string::npos);

    // A later invocation sees the stored list without fetching again.
    m_probe->unscript("curl -s -L https://download.nvidia.com/XFree86/Linux-x86_64/");
    QCOMPARE(runCli({QStringLiteral("versions")}, out), 0);
    QVERIFY(out.find("run-production   580.105.08") != std::string::npos);
    QVERIFY(out.find("run-legacy       470.239.06") != std::string::npos);
}

void DriverManagerCliTests::testSecureBootWarningBeforeProprietaryInstall()
{
    scriptFedoraHost(*m_probe);
    std::string out;
    QCOMPARE(runCli({QStringLiteral("plan"), QStringLiteral("nvk")}, out), 0);
    QVERIFY(out.find("Secure Boot") == std::string::npos);

    QCOMPARE(runCli({QStringLiteral("plan"), QStringLiteral("repo-stable")}, out), 0);
    QVERIFY(out.find("Warning: Secure Boot is enabled") != std::string::npos);

    runCli({QStringLiteral("install"), QStringLiteral("repo-stable"), QStringLiteral("--yes")}, out);
    const auto warning = out.find("Warning: Secure Boot is enabled");
    QVERIFY(warning != std::string::npos);
    QVERIFY(warning < out.find("-> preflight-checking"));
}

void DriverManagerCliTests::testDeleteBackup()
{
    {
        StateStore store(stateDatabasePath().toStdString());
        for (const char *label : {"before nvk", "before repo-stable"}) {
            Backup backup;
            backup.createdAt = std::chrono::system_clock::now();
            backup.label = label;
            store.insertBackup(backup, 10);
        }
    }
    QVERIFY(QDir().mkpath(backupsDirPath() + QStringLiteral("/1")));

    std::string out;
    QCOMPARE(runCli({QStringLiteral("backups"), QStringLiteral("--delete"), QStringLiteral("1"),
                     QStringLiteral("--yes")}, out), 0);
    QVERIFY(out.find("Deleted backup #1.") != std::string::npos);
    QVERIFY(!QDir(backupsDirPath() + QStringLiteral("/1")).exists());

    QCOMPARE(runCli({QStringLiteral("backups")}, out), 0);
    QVERIFY(out.find("#1 ") == std::string::npos);
    QVERIFY(out.find("#2 ") != std::string::npos);

    QCOMPARE(runCli({QStringLiteral("backups"), QStringLiteral("--delete"), QStringLiteral("1"),
                     QStringLiteral("--yes")}, out), 1);
    QVERIFY(out.find("Backup #1 not found.") != std::string::npos);
    QCOMPARE(runCli({QStringLiteral("backups"), QStringLiteral("--delete"), QStringLiteral("latest")},
                    out), 2);
    QVERIFY(m_executor->commands.empty());
}

QTEST_MAIN(DriverManagerCliTests)
#include "test_driver_manager_cli.moc"
