#include <QtTest/QtTest>

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

#include "engine/system_probe.hpp"

using namespace nvdm;

class SystemProbeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testRunCapturesOutput();
    void testStdinReachesCommand();
    void testNonzeroExit();
    void testMissingProgram();
    void testTimeoutKillsCommand();
    void testTimeoutTerminatesBeforeKilling();
    void testTimeoutKillsCommandIgnoringTerm();
    void testNegativeTimeoutStillBounded();
    void testFileAccess();

private:
    QTemporaryDir m_tempDir;
};

void SystemProbeTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NVDM_BASE", m_tempDir.path().toUtf8());
}

void SystemProbeTests::cleanupTestCase()
{
    qunsetenv("NVDM_BASE");
}

void SystemProbeTests::testRunCapturesOutput()
{
    HostSystemProbe probe;
    const CommandResult result = probe.run("sh", {"-c", "echo out; echo err >&2"},
                                           std::chrono::seconds(10));
    QVERIFY(result.succeeded());
    QCOMPARE(QString::fromStdString(result.stdoutText), QStringLiteral("out\n"));
    QCOMPARE(QString::fromStdString(result.stderrText), QStringLiteral("err\n"));
    QVERIFY(probe.succeeds("true", {}));
}

void SystemProbeTests::testStdinReachesCommand()
{
    const CommandResult result = runProcess("cat", {}, "options nouveau modeset=1\n",
                                            std::chrono::seconds(10));
    QVERIFY(result.succeeded());
    QCOMPARE(QString::fromStdString(result.stdoutText), QStringLiteral("options nouveau modeset=1\n"));
}

void SystemProbeTests::testNonzeroExit()
{
    HostSystemProbe probe;
    const CommandResult result = probe.run("sh", {"-c", "exit 3"}, std::chrono::seconds(10));
    QCOMPARE(result.exitCode, 3);
    QVERIFY(!result.timedOut);
    QVERIFY(!result.succeeded());
}

void SystemProbeTests::testMissingProgram()
{
    HostSystemProbe probe;
    const CommandResult result = probe.run("nvdm-no-such-program", {}, std::chrono::seconds(5));
    QCOMPARE(result.exitCode, 127);
    QVERIFY(!result.stderrText.empty());
}

void SystemProbeTests::testTimeoutKillsCommand()
{
    HostSystemProbe probe;
    const CommandResult result = probe.run("sleep", {"10"}, std::chrono::milliseconds(200));
    QVERIFY(result.timedOut);
    QCOMPARE(result.exitCode, 124);
    QVERIFY(!result.succeeded());
}

void SystemProbeTests::testTimeoutTerminatesBeforeKilling()
{
    const QString marker = m_tempDir.path() + QStringLiteral("/terminated");
    const std::string script = "trap 'echo term > \"" + marker.toStdString()
        + "\"; exit 0' TERM; while :; do sleep 0.1; done";

    const CommandResult result = runProcess("sh", {"-c", script}, std::string(),
                                            std::chrono::milliseconds(300));
    QVERIFY(result.timedOut);
    QCOMPARE(result.exitCode, 124);
    QTRY_VERIFY_WITH_TIMEOUT(QFile::exists(marker), 2000);
}

void SystemProbeTests::testTimeoutKillsCommandIgnoringTerm()
{
    QElapsedTimer timer;
    timer.start();
    const CommandResult result = runProcess("sh", {"-c", "trap '' TERM; sleep 30"},
                                            std::string(), std::chrono::milliseconds(200));
    QVERIFY(result.timedOut);
    QCOMPARE(result.exitCode, 124);
    QVERIFY(timer.elapsed() < 20000);
}

void SystemProbeTests::testNegativeTimeoutStillBounded()
{
    const CommandResult result = runProcess("sleep", {"10"}, std::string(),
                                            std::chrono::milliseconds(-5));
    QVERIFY(result.timedOut);
}

void SystemProbeTests::testFileAccess()
{
    HostSystemProbe probe;
    const QString dir = m_tempDir.path() + QStringLiteral("/etc");
    QVERIFY(QDir().mkpath(dir));
    QFile file(dir + QStringLiteral("/os-release"));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("ID=ubuntu\n");
    file.close();

    const auto content = probe.readFile((dir + QStringLiteral("/os-release")).toStdString());
    QVERIFY(content.has_value());
    QCOMPARE(QString::fromStdString(*content), QStringLiteral("ID=ubuntu\n"));
    QVERIFY(!probe.readFile((dir + QStringLiteral("/missing")).toStdString()).has_value());
    QVERIFY(probe.fileExists(dir.toStdString()));

    const std::vector<std::string> entries = probe.listDirectory(dir.toStdString());
    const std::vector<std::string> expected = {"os-release"};
    QVERIFY(entries == expected);
    QVERIFY(probe.listDirectory((dir + QStringLiteral("/none")).toStdString()).empty());
    QVERIFY(probe.freeDiskBytes(m_tempDir.path().toStdString()).has_value());
}

QTEST_MAIN(SystemProbeTests)
#include "test_system_probe.moc"
