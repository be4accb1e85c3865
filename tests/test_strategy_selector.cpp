#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/errors.hpp"
#include "engine/strategy_selector.hpp"
#include "engine/version_catalog.hpp"
#include "test_fakes.hpp"

using namespace nvdm;
using namespace nvdm::testing;

namespace {

EnvironmentSnapshot snapshotFor(DistroFamily family, int major, int minor)
{
    EnvironmentSnapshot snapshot;
    snapshot.distroFamily = family;
    snapshot.kernel = KernelVersion{std::to_string(major) + "." + std::to_string(minor) + ".0-1-generic",
                                    major, minor, 0};
    snapshot.architecture = "Linux-x86_64";
    return snapshot;
}

} // namespace

class StrategySelectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testNvkNeedsKernelSix();
    void testUnknownDistributionRejected();
    void testUpgradeNeedsRepositoryDriver();
    void testRemoveNeedsProprietaryDriver();
    void testRepoBranchesFromAptCache();
    void testRunVersionsFromCatalog();
    void testRunStrategiesAreDeferred();

private:
    QTemporaryDir m_tempDir;
};

void StrategySelectorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NVDM_BASE", m_tempDir.path().toUtf8());
}

void StrategySelectorTests::cleanupTestCase()
{
    qunsetenv("NVDM_BASE");
}

void StrategySelectorTests::testNvkNeedsKernelSix()
{
    FakeSystemProbe probe;
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    QVERIFY_EXCEPTION_THROWN(selector.select(StrategyKind::NVK, snapshotFor(DistroFamily::Debian, 5, 15)),
                             UnsupportedKernelError);

    const Strategy strategy = selector.select(StrategyKind::NVK, snapshotFor(DistroFamily::Debian, 6, 0));
    QCOMPARE(strategy.expectedDriver, DriverFamily::Nouveau);
    QVERIFY(strategy.removesExistingDriver);
    QVERIFY(!strategy.requiresRebootDeferral);
    QVERIFY(!strategy.steps.empty());
}

void StrategySelectorTests::testUnknownDistributionRejected()
{
    FakeSystemProbe probe;
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    QVERIFY_EXCEPTION_THROWN(selector.select(StrategyKind::RepoStable, snapshotFor(DistroFamily::Unknown, 6, 8)),
                             UnsupportedDistributionError);
    QVERIFY(probe.calls.empty());
}

void StrategySelectorTests::testUpgradeNeedsRepositoryDriver()
{
    FakeSystemProbe probe;
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    EnvironmentSnapshot snapshot = snapshotFor(DistroFamily::Debian, 6, 8);
    snapshot.currentDriver.family = DriverFamily::ProprietaryRun;
    snapshot.currentDriver.version = "580.126.09";
    QVERIFY_EXCEPTION_THROWN(selector.select(StrategyKind::UpgradeRepo, snapshot), SelectionError);

    snapshot.currentDriver.family = DriverFamily::ProprietaryRepo;
    snapshot.currentDriver.package = "nvidia-driver-580-open";
    const Strategy strategy = selector.select(StrategyKind::UpgradeRepo, snapshot);
    QCOMPARE(QString::fromStdString(strategy.targetVersion), QStringLiteral("580.126.09"));
    QVERIFY(!strategy.removesExistingDriver);
}

void StrategySelectorTests::testRemoveNeedsProprietaryDriver()
{
    FakeSystemProbe probe;
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    EnvironmentSnapshot snapshot = snapshotFor(DistroFamily::Fedora, 6, 11);
    snapshot.currentDriver.family = DriverFamily::Nouveau;
    QVERIFY_EXCEPTION_THROWN(selector.select(StrategyKind::RemoveProprietary, snapshot), SelectionError);

    snapshot.currentDriver.family = DriverFamily::ProprietaryRepo;
    const Strategy strategy = selector.select(StrategyKind::RemoveProprietary, snapshot);
    QCOMPARE(strategy.expectedDriver, DriverFamily::None);
}

void StrategySelectorTests::testRepoBranchesFromAptCache()
{
    FakeSystemProbe probe;
    probe.script("apt-cache show nvidia-driver-590-open",
                 "Package: nvidia-driver-590-open\nVersion: 590.48.01-0ubuntu0.24.04.1\n");
    probe.script("apt-cache show nvidia-driver-580-open",
                 "Package: nvidia-driver-580-open\nVersion: 580.95.05-0ubuntu0.24.04.2\n");
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    const Strategy latest = selector.select(StrategyKind::RepoLatest, snapshotFor(DistroFamily::Debian, 6, 8));
    QCOMPARE(QString::fromStdString(latest.repoBranch), QStringLiteral("590"));
    QCOMPARE(QString::fromStdString(latest.targetVersion), QStringLiteral("590.48.01"));

    const Strategy stable = selector.select(StrategyKind::RepoStable, snapshotFor(DistroFamily::Debian, 6, 8));
    QCOMPARE(QString::fromStdString(stable.repoBranch), QStringLiteral("580"));
    QCOMPARE(QString::fromStdString(stable.targetVersion), QStringLiteral("580.95.05"));
    QCOMPARE(stable.expectedDriver, DriverFamily::ProprietaryRepo);
}

void StrategySelectorTests::testRunVersionsFromCatalog()
{
    FakeSystemProbe probe;
    EngineConfig config;
    config.driverVersions.production = "580.105.08";
    VersionCatalog catalog(probe, config);
    StrategySelector selector(catalog);

    const Strategy production = selector.select(StrategyKind::RunProduction,
                                                snapshotFor(DistroFamily::Debian, 6, 8));
    QCOMPARE(QString::fromStdString(production.targetVersion), QStringLiteral("580.105.08"));

    const Strategy legacy = selector.select(StrategyKind::RunLegacy, snapshotFor(DistroFamily::Fedora, 6, 11));
    QCOMPARE(QString::fromStdString(legacy.targetVersion), QStringLiteral("470.256.02"));
}

void StrategySelectorTests::testRunStrategiesAreDeferred()
{
    FakeSystemProbe probe;
    VersionCatalog catalog(probe, EngineConfig{});
    StrategySelector selector(catalog);

    const Strategy strategy = selector.select(StrategyKind::RunNewFeature, snapshotFor(DistroFamily::Debian, 6, 8));
    QVERIFY(strategy.requiresRebootDeferral);
    QCOMPARE(strategy.expectedDriver, DriverFamily::ProprietaryRun);

    bool sawPrepare = false;
    bool sawBoot = false;
    for (const auto &step : strategy.steps) {
        if (step.phase == StepPhase::Live) {
            QFAIL("run strategies must not touch the live system");
        }
        sawPrepare = sawPrepare || step.phase == StepPhase::Prepare;
        // Preparation always precedes the boot-time part.
        QVERIFY(!(step.phase == StepPhase::Prepare && sawBoot));
        sawBoot = sawBoot || step.phase == StepPhase::Boot;
    }
    QVERIFY(sawPrepare);
    QVERIFY(sawBoot);
}

QTEST_MAIN(StrategySelectorTests)
#include "test_strategy_selector.moc"
