#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "engine/privileged_executor.hpp"
#include "engine/system_probe.hpp"

using namespace nvdm;

namespace {

class CountingPrompt : public PasswordPrompt
{
public:
    std::optional<std::string> askPassword(const std::string &prompt) override
    {
        Q_UNUSED(prompt);
        ++asked;
        return std::nullopt;
    }

    int asked = 0;
};

CommandDescriptor teeCommand()
{
    CommandDescriptor command;
    command.stepId = "blacklist-nouveau";
    command.action = StepAction::WriteConfigFile;
    command.argv = {"tee", "/etc/modprobe.d/blacklist-nouveau.conf"};
    command.stdinData = "blacklist nouveau\noptions nouveau modeset=0\n";
    return command;
}

} // namespace

class PrivilegedExecutorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testPasswordInvocationAlwaysReadsPassword();
    void testPasswordLineNeverReachesCommand();
    void testEmptyCommandIsRefused();

private:
    QTemporaryDir m_tempDir;
};

void PrivilegedExecutorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NVDM_BASE", m_tempDir.path().toUtf8());
}

void PrivilegedExecutorTests::cleanupTestCase()
{
    qunsetenv("NVDM_BASE");
}

void PrivilegedExecutorTests::testPasswordInvocationAlwaysReadsPassword()
{
    const CommandDescriptor command = teeCommand();
    const SudoInvocation invocation = passwordSudoInvocation("hunter2", command);

    QCOMPARE(QString::fromStdString(invocation.program), QStringLiteral("sudo"));
    const std::vector<std::string> expected = {
        "-k", "-S", "-p", "", "--", "tee", "/etc/modprobe.d/blacklist-nouveau.conf"};
    QVERIFY(invocation.args == expected);
    QCOMPARE(QString::fromStdString(invocation.input),
             QStringLiteral("hunter2\nblacklist nouveau\noptions nouveau modeset=0\n"));
}

void PrivilegedExecutorTests::testPasswordLineNeverReachesCommand()
{
    // sudo -S consumes exactly the first line; emulate that with `read`.
    const CommandDescriptor command = teeCommand();
    const SudoInvocation invocation = passwordSudoInvocation("hunter2", command);

    const CommandResult result = runProcess("sh", {"-c", "read -r secret; cat"},
                                            invocation.input, std::chrono::seconds(10));
    QVERIFY(result.succeeded());
    QCOMPARE(QString::fromStdString(result.stdoutText),
             QString::fromStdString(command.stdinData));
    QVERIFY(!QString::fromStdString(result.stdoutText).contains(QStringLiteral("hunter2")));
}

void PrivilegedExecutorTests::testEmptyCommandIsRefused()
{
    CountingPrompt prompt;
    SudoExecutor executor(prompt);

    CommandDescriptor command;
    command.stepId = "empty";
    const CommandResult result = executor.runElevated(command);

    QCOMPARE(result.exitCode, 126);
    QVERIFY(!result.succeeded());
    QCOMPARE(prompt.asked, 0);
}

QTEST_MAIN(PrivilegedExecutorTests)
#include "test_privileged_executor.moc"
