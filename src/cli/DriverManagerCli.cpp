#include "cli/DriverManagerCli.hpp"

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/backup_manager.hpp"
#include "engine/deferred_installer.hpp"
#include "engine/diagnostics_collector.hpp"
#include "engine/environment_detector.hpp"
#include "engine/error_reporter.hpp"
#include "engine/install_orchestrator.hpp"
#include "engine/state_store.hpp"
#include "engine/step_planner.hpp"
#include "engine/strategy_selector.hpp"
#include "engine/system_probe.hpp"
#include "engine/version_catalog.hpp"

namespace nvdm {

namespace {

constexpr int kExitSucceeded = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitDeferredPending = 10;
constexpr int kExitDeferredCompleted = 11;
constexpr int kExitConcurrent = 20;
constexpr int kExitUnsupportedKernel = 21;
constexpr int kExitUnsupportedDistribution = 22;
constexpr int kExitDetection = 23;

const char *const kDriverVersionsMetaKey = "driver_versions";

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  nvdm detect [--format text|json] [--system-info]\n"
        "  nvdm plan <strategy>\n"
        "  nvdm install <strategy> [--yes]\n"
        "  nvdm backups [--delete <backup-id> [--yes]]\n"
        "  nvdm restore <backup-id> [--yes]\n"
        "  nvdm status\n"
        "  nvdm cancel-deferred\n"
        "  nvdm history\n"
        "  nvdm diagnostics [--out PATH]\n"
        "  nvdm versions [--refresh]\n"
        "\n"
        "Strategies: nvk, repo-stable, repo-latest, run-production, run-new-feature,\n"
        "            run-beta, run-legacy, remove-proprietary, upgrade-repo\n"
        "Global: --trace\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString positional(const QStringList &args)
{
    // args[0] is the program, args[1] the command.
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        return {};
    }
    return args.at(2);
}

bool confirm(const QStringList &args, const std::string &question)
{
    if (args.contains(QStringLiteral("--yes"))) {
        return true;
    }
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    answer = toLower(trim(answer));
    return answer == "y" || answer == "yes";
}

int exitCodeFor(OrchestratorState state)
{
    switch (state) {
    case OrchestratorState::Succeeded:
        return kExitSucceeded;
    case OrchestratorState::DeferredPending:
        return kExitDeferredPending;
    case OrchestratorState::DeferredCompleted:
        return kExitDeferredCompleted;
    case OrchestratorState::Idle:
    case OrchestratorState::PreflightChecking:
    case OrchestratorState::BackingUp:
    case OrchestratorState::Executing:
    case OrchestratorState::Verifying:
    case OrchestratorState::Failed:
        return kExitFailed;
    }
    return kExitFailed;
}

std::string driverText(const DriverDescriptor &driver)
{
    std::string text = toDriverFamilyString(driver.family);
    if (!driver.version.empty()) {
        text += " " + driver.version;
    }
    if (!driver.package.empty()) {
        text += " (" + driver.package + ")";
    }
    return text;
}

void renderSnapshotText(const EnvironmentSnapshot &snapshot)
{
    std::cout << "Distribution:   " << snapshot.distroName << " (" << snapshot.distroId
              << ", " << toDistroString(snapshot.distroFamily) << ")\n";
    std::cout << "Kernel:         " << snapshot.kernel.release << "\n";
    std::cout << "Architecture:   " << snapshot.architecture << "\n";
    std::cout << "Session:        " << toSessionString(snapshot.sessionType) << "\n";
    std::cout << "Secure Boot:    " << (snapshot.secureBootEnabled ? "enabled" : "disabled") << "\n";
    std::cout << "GPU:            " << snapshot.gpuIdentifier << "\n";
    std::cout << "Driver:         " << driverText(snapshot.currentDriver) << "\n";
    std::cout << "Package tool:   " << snapshot.packageManager << "\n";
    std::cout << "Network:        " << (snapshot.networkReachable ? "reachable" : "unreachable")
              << "\n";
}

void renderCommands(const char *title, const std::vector<CommandDescriptor> &commands)
{
    if (commands.empty()) {
        return;
    }
    std::cout << "\n" << title << ":\n";
    for (const auto &command : commands) {
        std::cout << "  [" << command.stepId << "] "
                  << (command.elevated ? "# " : "$ ") << command.commandLine() << "\n";
    }
}

void renderJobStatus(const JobStatus &status)
{
    switch (status.state) {
    case JobState::None:
        std::cout << "Deferred install: none\n";
        return;
    case JobState::Pending:
        std::cout << "Deferred install: pending (" << toStrategyString(status.job->strategy)
                  << "), runs on next reboot\n";
        break;
    case JobState::Completed:
        std::cout << "Deferred install: completed (" << toStrategyString(status.job->strategy)
                  << ") exit code " << status.exitCode << " at "
                  << toIso8601Utc(status.finishedAt) << "\n";
        break;
    }
    std::cout << "  unit: " << status.job->unitPath << "\n";
    std::cout << "  log:  " << status.job->logPath << "\n";
    if (!status.logTail.empty()) {
        std::cout << "  last log lines:\n";
        for (const auto &line : status.logTail) {
            std::cout << "    " << line << "\n";
        }
    }
}

void applyStoredVersions(StateStore &store, EngineConfig &config)
{
    const auto stored = store.getMeta(kDriverVersionsMetaKey);
    if (!stored.has_value()) {
        return;
    }
    try {
        const nlohmann::json j = nlohmann::json::parse(*stored);
        config.driverVersions.production = j.value("production", config.driverVersions.production);
        config.driverVersions.newFeature = j.value("newFeature", config.driverVersions.newFeature);
        config.driverVersions.beta = j.value("beta", config.driverVersions.beta);
        config.driverVersions.legacy = j.value("legacy", config.driverVersions.legacy);
    } catch (const nlohmann::json::exception &error) {
        NVDM_LOG_WARN(QStringLiteral("DriverManagerCli"),
                      QStringLiteral("applyStoredVersions"),
                      QStringLiteral("stored_versions_invalid"),
                      QString::fromUtf8(error.what()),
                      QStringLiteral("json_parse"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json::object());
    }
}

} // namespace

struct DriverManagerCli::Engine {
    Engine(SystemProbe &probe,
           PrivilegedExecutor &executor,
           ConnectivityChecker &connectivity,
           EngineConfig engineConfig)
        : config(std::move(engineConfig))
        , detector(probe, connectivity, config)
        , catalog(probe, withStoredVersions(config))
        , selector(catalog)
        , planner(probe, config)
        , backups(store, probe, executor, detector, planner, config)
        , deferred(store, probe, executor, config)
        , reporter(probe)
        , orchestrator(OrchestratorServices{probe, executor, connectivity, detector, planner,
                                            backups, deferred, store, reporter},
                       config)
        , diagnostics(probe, detector, store, deferred)
    {
    }

    EngineConfig withStoredVersions(EngineConfig base)
    {
        applyStoredVersions(store, base);
        return base;
    }

    StateStore store;
    EngineConfig config;
    EnvironmentDetector detector;
    VersionCatalog catalog;
    StrategySelector selector;
    StepPlanner planner;
    BackupManager backups;
    DeferredInstaller deferred;
    ErrorReporter reporter;
    InstallOrchestrator orchestrator;
    DiagnosticsCollector diagnostics;
};

DriverManagerCli::DriverManagerCli(SystemProbe &probe,
                                   PrivilegedExecutor &executor,
                                   ConnectivityChecker &connectivity,
                                   const EngineConfig &config)
    : m_probe(probe)
    , m_executor(executor)
    , m_connectivity(connectivity)
    , m_config(config)
{
}

DriverManagerCli::~DriverManagerCli() = default;

int DriverManagerCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        args.push_back(arg);
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    NVDM_LOG_INFO(QStringLiteral("DriverManagerCli"),
                  QStringLiteral("run"),
                  QStringLiteral("cli_command"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("cli"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"command", command.toStdString()}}));

    try {
        m_engine = std::make_unique<Engine>(m_probe, m_executor, m_connectivity, m_config);

        // A boot-time install may have finished since the last invocation.
        const JobStatus deferredStatus = m_engine->orchestrator.refreshDeferredStatus();
        if (deferredStatus.state == JobState::Completed
            && m_engine->orchestrator.state() == OrchestratorState::DeferredCompleted
            && command != QStringLiteral("status")) {
            std::cout << "Deferred install finished with exit code " << deferredStatus.exitCode
                      << " (see " << deferredStatus.job->logPath << ").\n";
        }

        if (command == QStringLiteral("detect")) {
            return runDetect(args);
        }
        if (command == QStringLiteral("plan")) {
            return runPlan(args);
        }
        if (command == QStringLiteral("install")) {
            return runInstall(args);
        }
        if (command == QStringLiteral("backups")) {
            return runBackups(args);
        }
        if (command == QStringLiteral("restore")) {
            return runRestore(args);
        }
        if (command == QStringLiteral("status")) {
            return runStatus(args);
        }
        if (command == QStringLiteral("cancel-deferred")) {
            return runCancelDeferred(args);
        }
        if (command == QStringLiteral("history")) {
            return runHistory(args);
        }
        if (command == QStringLiteral("diagnostics")) {
            return runDiagnostics(args);
        }
        if (command == QStringLiteral("versions")) {
            return runVersions(args);
        }
    } catch (const DetectionError &error) {
        std::cerr << "Detection failed: " << error.what() << std::endl;
        return kExitDetection;
    } catch (const NvdmError &error) {
        NVDM_LOG_ERROR(QStringLiteral("DriverManagerCli"),
                       QStringLiteral("run"),
                       QStringLiteral("cli_command_failed"),
                       QString::fromUtf8(error.what()),
                       QStringLiteral("cli"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "Error: " << error.what() << std::endl;
        return kExitFailed;
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

std::optional<Strategy> DriverManagerCli::selectStrategy(const QString &name,
                                                         const EnvironmentSnapshot &snapshot,
                                                         int &exitCode)
{
    const auto kind = parseStrategyString(name.toStdString());
    if (!kind.has_value()) {
        std::cerr << "Unknown strategy: " << name.toStdString() << "\n"
                  << usageText().toStdString();
        exitCode = kExitUsage;
        return std::nullopt;
    }

    try {
        return m_engine->selector.select(*kind, snapshot);
    } catch (const UnsupportedKernelError &error) {
        std::cerr << error.what() << std::endl;
        exitCode = kExitUnsupportedKernel;
    } catch (const UnsupportedDistributionError &error) {
        std::cerr << error.what() << std::endl;
        exitCode = kExitUnsupportedDistribution;
    } catch (const SelectionError &error) {
        std::cerr << error.what() << std::endl;
        exitCode = kExitFailed;
    }
    return std::nullopt;
}

int DriverManagerCli::runDetect(const QStringList &args)
{
    QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    if (format.isEmpty()) {
        format = QStringLiteral("text");
    }
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(snapshot).dump(2) << std::endl;
    } else {
        renderSnapshotText(snapshot);
    }

    if (args.contains(QStringLiteral("--system-info"))) {
        const std::string info = m_engine->detector.systemInfo(snapshot.distroFamily, &m_executor);
        if (info.empty()) {
            std::cerr << "System information is unavailable (inxi missing)." << std::endl;
        } else {
            std::cout << "\n" << info;
        }
    }
    return kExitSucceeded;
}

int DriverManagerCli::runPlan(const QStringList &args)
{
    const QString name = positional(args);
    if (name.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    int exitCode = kExitSucceeded;
    const auto strategy = selectStrategy(name, snapshot, exitCode);
    if (!strategy.has_value()) {
        return exitCode;
    }

    const PlannedCommands planned = m_engine->orchestrator.planCommands(*strategy, snapshot);
    std::cout << "Strategy " << toStrategyDisplayName(strategy->kind);
    if (!strategy->targetVersion.empty()) {
        std::cout << " " << strategy->targetVersion;
    }
    std::cout << " on " << snapshot.distroName << "\n";
    std::cout << "Current driver: " << driverText(snapshot.currentDriver) << "\n";
    if (strategy->requiresRebootDeferral) {
        std::cout << "Boot commands run from " << m_config.system.unitName
                  << " on the next reboot.\n";
    }
    for (const auto &warning : InstallOrchestrator::warningsFor(*strategy, snapshot)) {
        std::cout << "Warning: " << warning << "\n";
    }
    renderCommands("Commands", planned.live);
    renderCommands("Preparation", planned.prepare);
    renderCommands("On next boot", planned.boot);
    return kExitSucceeded;
}

int DriverManagerCli::runInstall(const QStringList &args)
{
    const QString name = positional(args);
    if (name.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    int exitCode = kExitSucceeded;
    const auto strategy = selectStrategy(name, snapshot, exitCode);
    if (!strategy.has_value()) {
        return exitCode;
    }

    for (const auto &warning : InstallOrchestrator::warningsFor(*strategy, snapshot)) {
        std::cout << "Warning: " << warning << "\n";
    }
    std::string question = "Install " + toStrategyDisplayName(strategy->kind);
    if (!strategy->targetVersion.empty()) {
        question += " " + strategy->targetVersion;
    }
    question += " replacing " + driverText(snapshot.currentDriver) + "?";
    if (strategy->requiresRebootDeferral) {
        question += " The driver is installed on the next reboot.";
    }
    if (!confirm(args, question)) {
        std::cout << "Aborted." << std::endl;
        return kExitFailed;
    }

    m_engine->orchestrator.setStateObserver([](OrchestratorState state) {
        std::cout << "-> " << toStateString(state) << std::endl;
    });

    InstallReport report;
    try {
        report = m_engine->orchestrator.beginInstall(*strategy, snapshot);
    } catch (const ConcurrentInstallError &error) {
        std::cerr << error.what() << std::endl;
        return kExitConcurrent;
    } catch (const DeferredJobPendingError &error) {
        std::cerr << error.what() << std::endl;
        return kExitConcurrent;
    }

    switch (report.finalState) {
    case OrchestratorState::Succeeded:
        std::cout << "Installed " << driverText(*report.verifiedDriver)
                  << ". Reboot to load the new driver." << std::endl;
        break;
    case OrchestratorState::DeferredPending:
        std::cout << "Staged " << report.deferredJob->unitPath
                  << ". Reboot to run the installation; progress is logged to "
                  << report.deferredJob->logPath << "." << std::endl;
        break;
    case OrchestratorState::Failed:
        std::cerr << "Installation failed: " << report.failureReason << std::endl;
        if (!report.failedStepOutput.stderrText.empty()) {
            std::cerr << report.failedStepOutput.stderrText << std::endl;
        }
        if (!report.errorReportPath.empty()) {
            std::cerr << "Error report: " << report.errorReportPath << std::endl;
        }
        if (const auto offer = report.restoreOfferBackupId(); offer.has_value()) {
            std::cerr << "To return to the previous state run: nvdm restore " << *offer
                      << std::endl;
        }
        break;
    case OrchestratorState::Idle:
        std::cout << "Cancelled: " << report.failureReason << std::endl;
        break;
    case OrchestratorState::PreflightChecking:
    case OrchestratorState::BackingUp:
    case OrchestratorState::Executing:
    case OrchestratorState::Verifying:
    case OrchestratorState::DeferredCompleted:
        break;
    }
    return exitCodeFor(report.finalState);
}

int DriverManagerCli::runBackups(const QStringList &args)
{
    if (args.contains(QStringLiteral("--delete"))) {
        bool ok = false;
        const qint64 id = getArgValue(args, QStringLiteral("--delete")).toLongLong(&ok);
        if (!ok || id <= 0) {
            std::cerr << usageText().toStdString();
            return kExitUsage;
        }
        const auto backup = m_engine->store.getBackup(id);
        if (!backup.has_value()) {
            std::cerr << "Backup #" << id << " not found." << std::endl;
            return kExitFailed;
        }
        if (!confirm(args, "Delete backup #" + std::to_string(id) + " (" + backup->label + ")?")) {
            std::cout << "Aborted." << std::endl;
            return kExitFailed;
        }
        if (!m_engine->backups.remove(id)) {
            std::cerr << "Backup #" << id << " not found." << std::endl;
            return kExitFailed;
        }
        std::cout << "Deleted backup #" << id << "." << std::endl;
        return kExitSucceeded;
    }

    const auto backups = m_engine->backups.list();
    if (backups.empty()) {
        std::cout << "No backups." << std::endl;
        return kExitSucceeded;
    }
    for (const auto &backup : backups) {
        std::cout << "#" << backup.id << "  " << toIso8601Utc(backup.createdAt) << "  "
                  << backup.label << "  [" << driverText(backup.driver) << ", "
                  << backup.packages.size() << " packages]\n";
    }
    return kExitSucceeded;
}

int DriverManagerCli::runRestore(const QStringList &args)
{
    const QString idText = positional(args);
    bool ok = false;
    const qint64 id = idText.toLongLong(&ok);
    if (!ok || id <= 0) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const auto backup = m_engine->store.getBackup(id);
    if (!backup.has_value()) {
        std::cerr << "Backup #" << id << " not found." << std::endl;
        return kExitFailed;
    }
    if (!confirm(args, "Restore backup #" + std::to_string(id) + " (" + backup->label + ")?")) {
        std::cout << "Aborted." << std::endl;
        return kExitFailed;
    }

    const EnvironmentSnapshot snapshot = m_engine->detector.detect();
    RestoreResult result;
    try {
        result = m_engine->orchestrator.restoreFromBackup(id, snapshot);
    } catch (const ConcurrentInstallError &error) {
        std::cerr << error.what() << std::endl;
        return kExitConcurrent;
    }

    if (!result.ok) {
        std::cerr << "Restore failed";
        if (!result.failedStepId.empty()) {
            std::cerr << " at step " << result.failedStepId;
        }
        std::cerr << ": " << result.message << std::endl;
        if (!result.failedStepOutput.stderrText.empty()) {
            std::cerr << result.failedStepOutput.stderrText << std::endl;
        }
        return kExitFailed;
    }
    std::cout << "Restored backup #" << id << " (" << driverText(result.restoredDriver)
              << "). The state before restoring is kept as backup #"
              << result.preRestoreBackupId << ". Reboot to apply." << std::endl;
    return kExitSucceeded;
}

int DriverManagerCli::runStatus(const QStringList &args)
{
    Q_UNUSED(args);
    const OrchestratorState state = m_engine->orchestrator.state();
    const JobStatus status = m_engine->deferred.checkCompletion();
    std::cout << "State: " << toStateString(state) << "\n";
    renderJobStatus(status);
    if (const auto last = m_engine->store.lastHistory(); last.has_value()) {
        std::cout << "Last install: " << toStrategyString(last->strategy) << " "
                  << last->targetVersion << " -> " << toOutcomeString(last->outcome) << "\n";
    }
    std::cout << std::flush;
    if (state == OrchestratorState::DeferredPending
        || state == OrchestratorState::DeferredCompleted) {
        return exitCodeFor(state);
    }
    return kExitSucceeded;
}

int DriverManagerCli::runCancelDeferred(const QStringList &args)
{
    Q_UNUSED(args);
    try {
        if (!m_engine->orchestrator.abandonDeferredInstall()) {
            std::cout << "No deferred install is pending." << std::endl;
            return kExitSucceeded;
        }
    } catch (const ConcurrentInstallError &error) {
        std::cerr << error.what() << std::endl;
        return kExitConcurrent;
    }
    std::cout << "Deferred install cancelled." << std::endl;
    return kExitSucceeded;
}

int DriverManagerCli::runHistory(const QStringList &args)
{
    Q_UNUSED(args);
    const auto entries = m_engine->store.listHistory();
    if (entries.empty()) {
        std::cout << "No installations recorded." << std::endl;
        return kExitSucceeded;
    }
    for (const auto &entry : entries) {
        std::cout << "#" << entry.id << "  " << toIso8601Utc(entry.startedAt) << "  "
                  << toStrategyString(entry.strategy);
        if (!entry.targetVersion.empty()) {
            std::cout << " " << entry.targetVersion;
        }
        std::cout << "  " << toOutcomeString(entry.outcome);
        if (entry.backupId != 0) {
            std::cout << "  backup #" << entry.backupId;
        }
        if (!entry.errorReportPath.empty()) {
            std::cout << "  report " << entry.errorReportPath;
        }
        std::cout << "\n";
    }
    std::cout << std::flush;
    return kExitSucceeded;
}

int DriverManagerCli::runDiagnostics(const QStringList &args)
{
    const DiagnosticsReport report =
        m_engine->diagnostics.collect(m_engine->orchestrator.state());
    const QString out = getArgValue(args, QStringLiteral("--out"));
    if (out.isEmpty()) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
        return kExitSucceeded;
    }
    if (!DiagnosticsCollector::writeJson(report, out.toStdString())) {
        std::cerr << "Failed to write " << out.toStdString() << std::endl;
        return kExitFailed;
    }
    std::cout << "Diagnostics written to " << out.toStdString() << std::endl;
    return kExitSucceeded;
}

int DriverManagerCli::runVersions(const QStringList &args)
{
    if (args.contains(QStringLiteral("--refresh"))) {
        const std::string machine =
            trim(m_probe.run("uname", {"-m"}, std::chrono::seconds(10)).stdoutText);
        if (machine.empty() || !m_engine->catalog.refresh("Linux-" + machine)) {
            std::cerr << "Could not refresh the version list; showing known versions."
                      << std::endl;
        } else {
            const DriverVersions &versions = m_engine->catalog.versions();
            m_engine->store.setMeta(kDriverVersionsMetaKey,
                                    nlohmann::json{{"production", versions.production},
                                                   {"newFeature", versions.newFeature},
                                                   {"beta", versions.beta},
                                                   {"legacy", versions.legacy}}
                                        .dump());
        }
    }

    const DriverVersions &versions = m_engine->catalog.versions();
    std::cout << "run-production   " << versions.production << "\n"
              << "run-new-feature  " << versions.newFeature << "\n"
              << "run-beta         " << versions.beta << "\n"
              << "run-legacy       " << versions.legacy << std::endl;
    return kExitSucceeded;
}

} // namespace nvdm
