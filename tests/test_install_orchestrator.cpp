#include <QtTest/QtTest>

#include <QDeadlineTimer>
#include <QFile>
#include <QSemaphore>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "test_fakes.hpp"

using namespace nvdm;
using namespace nvdm::testing;

class InstallOrchestratorTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testFedoraNvkRunsStepsInOrder();
    void testRunDriverToNvkRemovesLeftoversFirst();
    void testVerificationFailureOffersRestore();
    void testStepFailureStopsAndWritesReport();
    void testStepTimeoutFails();
    void testUnsupportedKernelRunsNothing();
    void testUnreachableNetworkFailsPreflight();
    void testLowDiskSpaceFailsPreflight();
    void testUnknownDiskSpaceContinues();
    void testCancelDuringPreflight();
    void testCancelDuringBackup();
    void testCancelIgnoredWhileExecuting();
    void testConcurrentInstallWhileExecuting();
    void testSimultaneousInstallsAdmitOnlyOne();
    void testUnexpectedExceptionEndsInFailed();
    void testNvkWithoutPriorDriverNeedsLoadedNouveau();
    void testFailedInstallRestoresPreviousDriver();
    void testSecureBootWarnsForProprietaryDriver();
    void testRunLegacyIsDeferredWithoutLiveChanges();
    void testDeferredPendingRejectsNewRuns();
    void testDeferredCompletionObservedByNewInstance();
    void testDeferredFailureMarkedInHistory();
    void testAbandonDeferredInstall();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    QByteArray m_prevBase;
    std::unique_ptr<EngineHarness> m_engine;

    std::string databasePath() const;
    Strategy select(StrategyKind kind);
    InstallReport stageRunLegacy();
};

void InstallOrchestratorTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    m_prevBase = qgetenv("NVDM_BASE");
    qputenv("NVDM_BASE", m_tempDir->path().toUtf8());
    m_engine = std::make_unique<EngineHarness>(databasePath());
}

void InstallOrchestratorTests::cleanup()
{
    m_engine.reset();
    if (m_prevBase.isEmpty()) {
        qunsetenv("NVDM_BASE");
    } else {
        qputenv("NVDM_BASE", m_prevBase);
    }
    m_tempDir.reset();
}

std::string InstallOrchestratorTests::databasePath() const
{
    return m_tempDir->path().toStdString() + "/cache/state.db";
}

Strategy InstallOrchestratorTests::select(StrategyKind kind)
{
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    return m_engine->selector.select(kind, snapshot);
}

InstallReport InstallOrchestratorTests::stageRunLegacy()
{
    auto &probe = m_engine->probe;
    scriptDebianHost(probe);
    setRunDriver(probe, "580.126.09");

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::RunLegacy, snapshot);
    probe.script(commandKey("curl", {"-fL", "-o",
                                     m_engine->planner.installerCachePath(strategy, snapshot),
                                     m_engine->planner.installerUrl(strategy, snapshot)}));
    return m_engine->orchestrator->beginInstall(strategy, snapshot);
}

void InstallOrchestratorTests::testFedoraNvkRunsStepsInOrder()
{
    scriptFedoraHost(m_engine->probe);

    std::vector<OrchestratorState> states;
    m_engine->orchestrator->setStateObserver(
        [&states](OrchestratorState state) { states.push_back(state); });

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    QCOMPARE(report.finalState, OrchestratorState::Succeeded);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Succeeded);

    const std::vector<std::string> expected = {
        "delete-nouveau-blacklist", "write-nouveau-options", "add-nouveau-initramfs-module",
        "install-nvk-packages", "rebuild-initramfs",
    };
    QCOMPARE(m_engine->executor.stepIds(), expected);

    const auto &install = m_engine->executor.commands.at(3);
    QCOMPARE(QString::fromStdString(install.argv.at(0)), QStringLiteral("dnf5"));
    QCOMPARE(QString::fromStdString(install.argv.at(3)), QStringLiteral("nvidia-gpu-firmware"));
    QCOMPARE(QString::fromStdString(m_engine->executor.commands.back().commandLine()),
             QStringLiteral("dracut --force"));

    const std::vector<OrchestratorState> expectedStates = {
        OrchestratorState::PreflightChecking, OrchestratorState::BackingUp,
        OrchestratorState::Executing, OrchestratorState::Verifying,
        OrchestratorState::Succeeded,
    };
    QCOMPARE(states, expectedStates);

    QVERIFY(report.warnings.empty());
    QVERIFY(report.backup.has_value());
    QCOMPARE(QString::fromStdString(report.backup->label), QStringLiteral("before NVK install"));
    QVERIFY(!report.restoreOfferBackupId().has_value());
    QVERIFY(report.verifiedDriver.has_value());
    QCOMPARE(report.verifiedDriver->family, DriverFamily::Nouveau);

    const auto history = m_engine->store.lastHistory();
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::Success);
    QCOMPARE(history->backupId, report.backup->id);
    QCOMPARE(QString::fromStdString(history->targetVersion), QStringLiteral("mesa"));
}

void InstallOrchestratorTests::testRunDriverToNvkRemovesLeftoversFirst()
{
    auto &probe = m_engine->probe;
    scriptDebianHost(probe);
    setRunDriver(probe, "580.126.09");
    probe.script("dpkg -l",
                 "ii  bash  5.2.21-2ubuntu4  amd64  GNU Bourne Again SHell\n"
                 "ii  libnvidia-egl-wayland1:amd64  1:1.1.13-1build1  amd64  Wayland EGL\n");
    m_engine->executor.hooks["remove-driver-libraries"] = [&probe]() {
        clearDriver(probe, kDebianKernel);
    };
    m_engine->executor.commandFailures["systemctl disable --now nvidia-persistenced.service"] =
        failResult(1, "Failed to disable unit: Unit file nvidia-persistenced.service does not exist.");

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    QCOMPARE(snapshot.currentDriver.family, DriverFamily::ProprietaryRun);
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    QCOMPARE(report.finalState, OrchestratorState::Succeeded);

    const std::vector<std::string> expected = {
        "remove-driver-configs", "purge-driver-packages", "remove-kernel-modules",
        "remove-driver-libraries", "delete-nouveau-blacklist", "write-nouveau-options",
        "add-nouveau-initramfs-module", "enable-mesa-ppa", "refresh-repositories",
        "install-nvk-packages", "reinstall-desktop-and-mesa", "rebuild-initramfs",
        "write-nvk-reboot-check", "enable-nvk-reboot-check",
    };
    QCOMPARE(m_engine->executor.stepIds(), expected);
    QVERIFY(probe.files.count("/etc/systemd/system/nvdm-nvk-check.service") == 1);

    bool purged = false;
    for (const auto &command : m_engine->executor.commands) {
        if (command.stepId == "purge-driver-packages"
            && command.commandLine().find("remove --purge -y libnvidia-egl-wayland1:amd64")
                != std::string::npos) {
            purged = true;
        }
    }
    QVERIFY(purged);

    QVERIFY(report.backup.has_value());
    QCOMPARE(report.backup->driver.family, DriverFamily::ProprietaryRun);
    QCOMPARE(QString::fromStdString(report.backup->driver.version), QStringLiteral("580.126.09"));
}

void InstallOrchestratorTests::testVerificationFailureOffersRestore()
{
    auto &probe = m_engine->probe;
    scriptDebianHost(probe);
    probe.script("apt-cache show nvidia-driver-580-open",
                 "Package: nvidia-driver-580-open\nVersion: 580.95.05-0ubuntu1\n");

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::RepoStable, snapshot);
    QCOMPARE(QString::fromStdString(strategy.repoBranch), QStringLiteral("580"));

    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    // Every command succeeded but the driver never changed.
    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Failed);
    QVERIFY(m_engine->executor.ranStep("rebuild-initramfs"));
    QVERIFY(QString::fromStdString(report.failureReason).contains(QStringLiteral("verification failed")));
    QVERIFY(report.backup.has_value());
    QCOMPARE(report.restoreOfferBackupId().value_or(0), report.backup->id);

    QVERIFY(!report.errorReportPath.empty());
    QFile file(QString::fromStdString(report.errorReportPath));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto json = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(json.at("strategy").at("kind").get<std::string>()),
             QStringLiteral("repo-stable"));
    QCOMPARE(json.at("backupId").get<std::int64_t>(), report.backup->id);
    QVERIFY(json.at("environment").is_object());

    const auto history = m_engine->store.lastHistory();
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::Failed);
    QCOMPARE(QString::fromStdString(history->errorReportPath),
             QString::fromStdString(report.errorReportPath));
}

void InstallOrchestratorTests::testStepFailureStopsAndWritesReport()
{
    scriptFedoraHost(m_engine->probe);
    m_engine->executor.failures["install-nvk-packages"] =
        failResult(1, "Error: Unable to find a match: mesa-vulkan-drivers");

    const Strategy strategy = select(StrategyKind::NVK);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QCOMPARE(QString::fromStdString(report.failedStepId), QStringLiteral("install-nvk-packages"));
    QCOMPARE(report.failedStepOutput.exitCode, 1);
    QVERIFY(!m_engine->executor.ranStep("rebuild-initramfs"));
    QCOMPARE(QString::fromStdString(report.executedCommands.back().stepId),
             QStringLiteral("install-nvk-packages"));
    QVERIFY(report.restoreOfferBackupId().has_value());

    QFile file(QString::fromStdString(report.errorReportPath));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto json = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(json.at("failedStep").at("id").get<std::string>()),
             QStringLiteral("install-nvk-packages"));
    QCOMPARE(json.at("failedStep").at("result").at("exitCode").get<int>(), 1);
    QVERIFY(QString::fromStdString(json.at("failedStep").at("result").at("stderr").get<std::string>())
                .contains(QStringLiteral("Unable to find a match")));
    QCOMPARE(json.at("executedCommands").size(), report.executedCommands.size());
}

void InstallOrchestratorTests::testStepTimeoutFails()
{
    scriptFedoraHost(m_engine->probe);
    CommandResult timedOut;
    timedOut.exitCode = 124;
    timedOut.timedOut = true;
    m_engine->executor.failures["rebuild-initramfs"] = timedOut;

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report =
        m_engine->orchestrator->beginInstall(strategy, m_engine->detector.detect());

    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QVERIFY(report.failedStepOutput.timedOut);
    QVERIFY(QString::fromStdString(report.failureReason).contains(QStringLiteral("timed out")));
}

void InstallOrchestratorTests::testUnsupportedKernelRunsNothing()
{
    scriptDebianHost(m_engine->probe, "5.15.0-91-generic");
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();

    QVERIFY_EXCEPTION_THROWN(m_engine->selector.select(StrategyKind::NVK, snapshot),
                             UnsupportedKernelError);
    QVERIFY(m_engine->executor.commands.empty());
    QCOMPARE(m_engine->store.countBackups(), 0);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Idle);
}

void InstallOrchestratorTests::testUnreachableNetworkFailsPreflight()
{
    scriptFedoraHost(m_engine->probe);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    m_engine->connectivity.reachable = false;

    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QVERIFY(QString::fromStdString(report.failureReason).contains(QStringLiteral("network unreachable")));
    QVERIFY(!report.backup.has_value());
    QVERIFY(!report.restoreOfferBackupId().has_value());
    QVERIFY(m_engine->executor.commands.empty());
    QVERIFY(QFile::exists(QString::fromStdString(report.errorReportPath)));
    QCOMPARE(m_engine->store.countBackups(), 0);
}

void InstallOrchestratorTests::testLowDiskSpaceFailsPreflight()
{
    scriptFedoraHost(m_engine->probe);
    m_engine->probe.freeBytes = 512ULL * 1024ULL * 1024ULL;

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report =
        m_engine->orchestrator->beginInstall(strategy, m_engine->detector.detect());

    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QVERIFY(QString::fromStdString(report.failureReason).contains(QStringLiteral("disk space")));
    QVERIFY(m_engine->executor.commands.empty());
}

void InstallOrchestratorTests::testUnknownDiskSpaceContinues()
{
    scriptFedoraHost(m_engine->probe);
    m_engine->probe.freeBytes = std::nullopt;

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report =
        m_engine->orchestrator->beginInstall(strategy, m_engine->detector.detect());
    QCOMPARE(report.finalState, OrchestratorState::Succeeded);
}

void InstallOrchestratorTests::testCancelDuringPreflight()
{
    scriptFedoraHost(m_engine->probe);
    InstallOrchestrator &orchestrator = *m_engine->orchestrator;
    bool accepted = false;
    orchestrator.setStateObserver([&orchestrator, &accepted](OrchestratorState state) {
        if (state == OrchestratorState::PreflightChecking) {
            accepted = orchestrator.requestCancel();
        }
    });

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report = orchestrator.beginInstall(strategy, m_engine->detector.detect());

    QVERIFY(accepted);
    QCOMPARE(report.finalState, OrchestratorState::Idle);
    QCOMPARE(orchestrator.state(), OrchestratorState::Idle);
    QCOMPARE(m_engine->store.countBackups(), 0);
    QVERIFY(m_engine->executor.commands.empty());
}

void InstallOrchestratorTests::testCancelDuringBackup()
{
    scriptFedoraHost(m_engine->probe);
    InstallOrchestrator &orchestrator = *m_engine->orchestrator;
    orchestrator.setStateObserver([&orchestrator](OrchestratorState state) {
        if (state == OrchestratorState::BackingUp) {
            orchestrator.requestCancel();
        }
    });

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report = orchestrator.beginInstall(strategy, m_engine->detector.detect());

    QCOMPARE(report.finalState, OrchestratorState::Idle);
    QVERIFY(report.backup.has_value());
    QVERIFY(m_engine->executor.commands.empty());
}

void InstallOrchestratorTests::testCancelIgnoredWhileExecuting()
{
    scriptFedoraHost(m_engine->probe);
    InstallOrchestrator &orchestrator = *m_engine->orchestrator;
    bool accepted = true;
    orchestrator.setStateObserver([&orchestrator, &accepted](OrchestratorState state) {
        if (state == OrchestratorState::Executing) {
            accepted = orchestrator.requestCancel();
        }
    });

    const Strategy strategy = select(StrategyKind::NVK);
    const InstallReport report = orchestrator.beginInstall(strategy, m_engine->detector.detect());

    QVERIFY(!accepted);
    QCOMPARE(report.finalState, OrchestratorState::Succeeded);
}

void InstallOrchestratorTests::testConcurrentInstallWhileExecuting()
{
    scriptFedoraHost(m_engine->probe);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);

    InstallOrchestrator &orchestrator = *m_engine->orchestrator;
    bool rejected = false;
    OrchestratorState stateAfterReject = OrchestratorState::Idle;
    orchestrator.setStateObserver([&](OrchestratorState state) {
        if (state != OrchestratorState::Executing) {
            return;
        }
        try {
            orchestrator.beginInstall(strategy, snapshot);
        } catch (const ConcurrentInstallError &) {
            rejected = true;
            stateAfterReject = orchestrator.state();
        }
    });

    const InstallReport report = orchestrator.beginInstall(strategy, snapshot);
    QVERIFY(rejected);
    QCOMPARE(stateAfterReject, OrchestratorState::Executing);
    QCOMPARE(report.finalState, OrchestratorState::Succeeded);
    QCOMPARE(m_engine->store.countBackups(), 1);
}

void InstallOrchestratorTests::testSimultaneousInstallsAdmitOnlyOne()
{
    scriptFedoraHost(m_engine->probe);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);

    constexpr int kThreads = 8;
    QSemaphore gate;
    std::atomic<int> ready{0};
    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> succeeded{0};
    // The admitted run parks in preflight until every other caller has returned.
    m_engine->connectivity.onCheck = [&gate, &admitted]() {
        ++admitted;
        gate.acquire();
    };

    InstallOrchestrator &orchestrator = *m_engine->orchestrator;
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            ++ready;
            while (ready.load() < kThreads) {
                std::this_thread::yield();
            }
            try {
                const InstallReport report = orchestrator.beginInstall(strategy, snapshot);
                if (report.finalState == OrchestratorState::Succeeded) {
                    ++succeeded;
                }
            } catch (const ConcurrentInstallError &) {
                ++rejected;
            }
        });
    }

    QDeadlineTimer deadline(10000);
    while (admitted.load() + rejected.load() < kThreads && !deadline.hasExpired()) {
        QThread::msleep(5);
    }
    gate.release(kThreads);
    for (auto &thread : threads) {
        thread.join();
    }

    QCOMPARE(admitted.load(), 1);
    QCOMPARE(rejected.load(), kThreads - 1);
    QCOMPARE(succeeded.load(), 1);
    QCOMPARE(m_engine->store.countBackups(), 1);
    QCOMPARE(orchestrator.state(), OrchestratorState::Succeeded);
}

void InstallOrchestratorTests::testUnexpectedExceptionEndsInFailed()
{
    scriptFedoraHost(m_engine->probe);
    m_engine->executor.hooks["install-nvk-packages"] = []() {
        throw std::runtime_error("executor lost its session");
    };

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Failed);
    QVERIFY(QString::fromStdString(report.failureReason)
                .contains(QStringLiteral("executor lost its session")));
    QVERIFY(!m_engine->executor.ranStep("rebuild-initramfs"));
    QVERIFY(QFile::exists(QString::fromStdString(report.errorReportPath)));
    QCOMPARE(report.restoreOfferBackupId().value_or(0), report.backup->id);

    const auto history = m_engine->store.lastHistory();
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::Failed);

    // Failed is terminal: the next run is admitted.
    m_engine->executor.hooks.clear();
    const InstallReport retry = m_engine->orchestrator->beginInstall(strategy, snapshot);
    QCOMPARE(retry.finalState, OrchestratorState::Succeeded);
}

void InstallOrchestratorTests::testNvkWithoutPriorDriverNeedsLoadedNouveau()
{
    auto &probe = m_engine->probe;
    scriptDebianHost(probe);
    probe.files["/proc/modules"] = "snd_hda_intel 61440 3 - Live 0x0\n";
    const std::string modinfoKey = "modinfo -k " + std::string(kDebianKernel) + " nouveau";
    probe.script(modinfoKey, "filename: nouveau.ko\n");

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    QCOMPARE(snapshot.currentDriver.family, DriverFamily::None);
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);

    // Nothing was unloaded, so an available module is not proof of a switch.
    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QVERIFY(QString::fromStdString(report.failureReason)
                .contains(QStringLiteral("verification failed")));
    QVERIFY(!probe.wasCalled(modinfoKey));
}

void InstallOrchestratorTests::testFailedInstallRestoresPreviousDriver()
{
    auto &probe = m_engine->probe;
    scriptDebianHost(probe);
    probe.script("apt-cache show nvidia-driver-580-open",
                 "Package: nvidia-driver-580-open\nVersion: 580.95.05-0ubuntu1\n");
    m_engine->executor.hooks["install-repo-driver"] = [&probe]() {
        setDebianRepoDriver(probe, "580", "580.95.05");
    };
    m_engine->executor.failures["rebuild-initramfs"] =
        failResult(1, "update-initramfs: failed for /boot/initrd.img-6.8.0-45-generic");

    const EnvironmentSnapshot before = m_engine->detector.detect();
    QCOMPARE(before.currentDriver.family, DriverFamily::Nouveau);
    const Strategy strategy = m_engine->selector.select(StrategyKind::RepoStable, before);
    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, before);
    QCOMPARE(report.finalState, OrchestratorState::Failed);
    QVERIFY(report.restoreOfferBackupId().has_value());
    QVERIFY(probe.files.count("/etc/modprobe.d/blacklist-nouveau.conf") == 1);

    m_engine->executor.commands.clear();
    m_engine->executor.hooks["restore-remove-packages"] = [&probe]() {
        probe.script("dpkg -l", "ii  bash  5.2.21-2ubuntu4  amd64  GNU Bourne Again SHell\n");
        probe.unscript(kSmiKey);
        probe.files["/proc/modules"] = "nouveau 3096576 4 - Live 0x0000000000000000\n";
    };
    m_engine->executor.failures.clear();

    const RestoreResult restored = m_engine->orchestrator->restoreFromBackup(
        *report.restoreOfferBackupId(), m_engine->detector.detect());
    QVERIFY2(restored.ok, restored.message.c_str());
    QCOMPARE(restored.restoredDriver.family, DriverFamily::Nouveau);

    const auto &commands = m_engine->executor.commands;
    QCOMPARE(QString::fromStdString(commands.front().stepId),
             QStringLiteral("restore-remove-packages"));
    QVERIFY(commands.front().commandLine().find(
                "remove --purge -y nvidia-driver-580-open libnvidia-gl-580:amd64")
            != std::string::npos);
    QVERIFY(probe.files.count("/etc/modprobe.d/blacklist-nouveau.conf") == 0);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Failed);
}

void InstallOrchestratorTests::testSecureBootWarnsForProprietaryDriver()
{
    scriptFedoraHost(m_engine->probe);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    QVERIFY(snapshot.secureBootEnabled);
    const Strategy strategy = m_engine->selector.select(StrategyKind::RepoStable, snapshot);

    const InstallReport report = m_engine->orchestrator->beginInstall(strategy, snapshot);
    QCOMPARE(static_cast<int>(report.warnings.size()), 1);
    QVERIFY(QString::fromStdString(report.warnings.front()).contains(QStringLiteral("mokutil")));
    QVERIFY(InstallOrchestrator::warningsFor(select(StrategyKind::NVK), snapshot).empty());
}

void InstallOrchestratorTests::testRunLegacyIsDeferredWithoutLiveChanges()
{
    const InstallReport report = stageRunLegacy();

    QCOMPARE(report.finalState, OrchestratorState::DeferredPending);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::DeferredPending);
    QVERIFY(report.deferredJob.has_value());

    const std::vector<std::string> expected = {
        "install-build-requirements", "stage-create-dir", "stage-copy-script",
        "stage-copy-payload", "stage-marker-dir", "stage-clear-marker", "stage-write-unit",
        "stage-unit-mode", "stage-daemon-reload", "stage-enable-unit",
    };
    QCOMPARE(m_engine->executor.stepIds(), expected);
    for (const char *live : {"remove-driver-configs", "purge-driver-packages",
                             "remove-kernel-modules", "run-installer", "blacklist-nouveau"}) {
        QVERIFY2(!m_engine->executor.ranStep(live), live);
    }
    QVERIFY(m_engine->probe.wasCalled(
        "curl -fL -o " + m_tempDir->path().toStdString()
        + "/cache/downloads/NVIDIA-Linux-x86_64-470.256.02.run "
          "https://us.download.nvidia.com/XFree86/Linux-x86_64/470.256.02/"
          "NVIDIA-Linux-x86_64-470.256.02.run"));

    QFile script(QString::fromStdString(report.deferredJob->stagedScriptPath));
    QVERIFY(script.open(QIODevice::ReadOnly));
    const QString content = QString::fromUtf8(script.readAll());
    const int disable = content.indexOf(QStringLiteral("systemctl disable \"$UNIT\""));
    const int leftovers = content.indexOf(QStringLiteral("run_step remove-driver-configs"));
    const int blacklist = content.indexOf(QStringLiteral("run_step blacklist-nouveau"));
    const int installer = content.indexOf(QStringLiteral("run_step run-installer"));
    QVERIFY(disable >= 0);
    QVERIFY(leftovers > disable);
    QVERIFY(blacklist > leftovers);
    QVERIFY(installer > blacklist);
    QVERIFY(content.contains(
        QStringLiteral("sh /usr/local/lib/nvdm-deferred/NVIDIA-Linux-x86_64-470.256.02.run --silent")));
    QVERIFY(content.contains(QStringLiteral("--dkms")));

    const auto pending = m_engine->store.pendingDeferredJob();
    QVERIFY(pending.has_value());
    QCOMPARE(pending->strategy, StrategyKind::RunLegacy);
    const auto history = m_engine->store.getHistory(pending->historyId);
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::DeferredPending);
}

void InstallOrchestratorTests::testDeferredPendingRejectsNewRuns()
{
    QCOMPARE(stageRunLegacy().finalState, OrchestratorState::DeferredPending);
    const std::size_t commandsBefore = m_engine->executor.commands.size();

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::NVK, snapshot);
    QVERIFY_EXCEPTION_THROWN(m_engine->orchestrator->beginInstall(strategy, snapshot),
                             ConcurrentInstallError);
    QVERIFY_EXCEPTION_THROWN(m_engine->orchestrator->restoreFromBackup(1, snapshot),
                             ConcurrentInstallError);
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::DeferredPending);
    QCOMPARE(m_engine->executor.commands.size(), commandsBefore);

    // A fresh process only knows about the job through the store.
    auto restarted = m_engine->makeOrchestrator();
    QCOMPARE(restarted->state(), OrchestratorState::Idle);
    QVERIFY_EXCEPTION_THROWN(restarted->beginInstall(strategy, snapshot), DeferredJobPendingError);
    QCOMPARE(restarted->state(), OrchestratorState::Idle);

    const JobStatus status = restarted->refreshDeferredStatus();
    QCOMPARE(status.state, JobState::Pending);
    QCOMPARE(restarted->state(), OrchestratorState::DeferredPending);
    QCOMPARE(m_engine->executor.commands.size(), commandsBefore);
}

void InstallOrchestratorTests::testDeferredCompletionObservedByNewInstance()
{
    QCOMPARE(stageRunLegacy().finalState, OrchestratorState::DeferredPending);
    const auto pending = m_engine->store.pendingDeferredJob();
    QVERIFY(pending.has_value());

    m_engine->probe.files[m_engine->config.system.markerPath] =
        "completed=1\nexitCode=0\nfinishedAt=2026-03-01T08:00:00Z\nstrategy=run-legacy\n";
    m_engine->probe.files[m_engine->config.system.logPath] =
        "[2026-03-01 07:58:00] [INFO] starting run-legacy 470.256.02\n"
        "[2026-03-01 08:00:00] [INFO] deferred install finished\n";

    auto restarted = m_engine->makeOrchestrator();
    const JobStatus status = restarted->refreshDeferredStatus();
    QCOMPARE(status.state, JobState::Completed);
    QCOMPARE(status.exitCode, 0);
    QCOMPARE(static_cast<int>(status.logTail.size()), 2);
    QCOMPARE(restarted->state(), OrchestratorState::DeferredCompleted);
    QVERIFY(!m_engine->store.pendingDeferredJob().has_value());

    const auto history = m_engine->store.getHistory(pending->historyId);
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::DeferredCompleted);
    QCOMPARE(QString::fromStdString(toIso8601Utc(history->finishedAt)),
             QStringLiteral("2026-03-01T08:00:00Z"));

    // Observed once; a later refresh changes nothing and new runs are allowed.
    restarted->refreshDeferredStatus();
    QCOMPARE(restarted->state(), OrchestratorState::DeferredCompleted);
    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    const Strategy strategy = m_engine->selector.select(StrategyKind::RepoStable, snapshot);
    const InstallReport next = restarted->beginInstall(strategy, snapshot);
    QVERIFY(next.finalState != OrchestratorState::DeferredPending);
}

void InstallOrchestratorTests::testDeferredFailureMarkedInHistory()
{
    QCOMPARE(stageRunLegacy().finalState, OrchestratorState::DeferredPending);
    const auto pending = m_engine->store.pendingDeferredJob();
    QVERIFY(pending.has_value());

    m_engine->probe.files[m_engine->config.system.markerPath] =
        "completed=1\nexitCode=3\nfinishedAt=2026-03-01T08:00:00Z\nstrategy=run-legacy\n";
    const JobStatus status = m_engine->orchestrator->refreshDeferredStatus();
    QVERIFY(!status.succeeded());
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::DeferredCompleted);

    const auto history = m_engine->store.getHistory(pending->historyId);
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::Failed);
}

void InstallOrchestratorTests::testAbandonDeferredInstall()
{
    QCOMPARE(stageRunLegacy().finalState, OrchestratorState::DeferredPending);
    const auto pending = m_engine->store.pendingDeferredJob();
    QVERIFY(pending.has_value());

    QVERIFY(m_engine->orchestrator->abandonDeferredInstall());
    QCOMPARE(m_engine->orchestrator->state(), OrchestratorState::Idle);
    QVERIFY(!m_engine->store.pendingDeferredJob().has_value());
    QVERIFY(m_engine->executor.ranStep("cancel-disable-unit"));
    QVERIFY(!QFile::exists(QString::fromStdString(pending->stagedScriptPath)));

    const auto history = m_engine->store.getHistory(pending->historyId);
    QVERIFY(history.has_value());
    QCOMPARE(history->outcome, InstallOutcome::Failed);

    QVERIFY(!m_engine->orchestrator->abandonDeferredInstall());
}

QTEST_MAIN(InstallOrchestratorTests)
#include "test_install_orchestrator.moc"
