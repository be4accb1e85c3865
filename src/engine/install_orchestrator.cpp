#include "engine/install_orchestrator.hpp"

#include <algorithm>
#include <iterator>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/backup_manager.hpp"
#include "engine/connectivity_checker.hpp"
#include "engine/deferred_installer.hpp"
#include "engine/environment_detector.hpp"
#include "engine/error_reporter.hpp"
#include "engine/privileged_executor.hpp"
#include "engine/state_store.hpp"
#include "engine/step_planner.hpp"
#include "engine/step_table.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;

std::string newRunId()
{
    return "install-" + std::to_string(toEpochMillis(std::chrono::system_clock::now()));
}

nlohmann::json commandContext(const CommandDescriptor &command, const CommandResult &result)
{
    return nlohmann::json{{"step", command.stepId},
                          {"command", command.commandLine()},
                          {"exitCode", result.exitCode},
                          {"timedOut", result.timedOut}};
}

} // namespace

InstallOrchestrator::InstallOrchestrator(OrchestratorServices services, const EngineConfig &config)
    : m_services(services)
    , m_config(config)
{
}

bool InstallOrchestrator::isInProgress(OrchestratorState state)
{
    switch (state) {
    case OrchestratorState::PreflightChecking:
    case OrchestratorState::BackingUp:
    case OrchestratorState::Executing:
    case OrchestratorState::Verifying:
    case OrchestratorState::DeferredPending:
        return true;
    case OrchestratorState::Idle:
    case OrchestratorState::Succeeded:
    case OrchestratorState::Failed:
    case OrchestratorState::DeferredCompleted:
        return false;
    }
    return false;
}

std::vector<std::string> InstallOrchestrator::warningsFor(const Strategy &strategy,
                                                         const EnvironmentSnapshot &snapshot)
{
    std::vector<std::string> warnings;
    const bool proprietary = strategy.expectedDriver == DriverFamily::ProprietaryRepo
        || strategy.expectedDriver == DriverFamily::ProprietaryRun;
    if (proprietary && snapshot.secureBootEnabled) {
        warnings.push_back("Secure Boot is enabled: the NVIDIA kernel modules will not load "
                           "unless they are signed. Disable Secure Boot or enroll a module "
                           "signing key with mokutil.");
    }
    return warnings;
}

OrchestratorState InstallOrchestrator::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void InstallOrchestrator::setStateObserver(StateObserver observer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_observer = std::move(observer);
}

void InstallOrchestrator::transition(OrchestratorState next)
{
    OrchestratorState previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state;
        m_state = next;
    }
    announce(previous, next);
}

void InstallOrchestrator::announce(OrchestratorState previous, OrchestratorState next)
{
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        observer = m_observer;
    }

    NVDM_LOG_INFO(QStringLiteral("InstallOrchestrator"),
                  QStringLiteral("transition"),
                  QStringLiteral("state_changed"),
                  QStringLiteral("orchestration_run"),
                  QStringLiteral("state_machine"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"from", toStateString(previous)},
                                  {"to", toStateString(next)}}));
    if (observer) {
        observer(next);
    }
}

bool InstallOrchestrator::requestCancel()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != OrchestratorState::PreflightChecking
        && m_state != OrchestratorState::BackingUp) {
        return false;
    }
    m_cancelRequested = true;
    return true;
}

bool InstallOrchestrator::takeCancel()
{
    return m_cancelRequested.exchange(false);
}

PlannedCommands InstallOrchestrator::planCommands(const Strategy &strategy,
                                                  const EnvironmentSnapshot &snapshot)
{
    std::vector<StepDescriptor> steps;
    const bool removesDriver =
        strategy.removesExistingDriver && snapshot.currentDriver.isProprietary();
    if (removesDriver) {
        // Leftovers of the active driver go first, inside the boot script for
        // deferred strategies so the running driver stays untouched until then.
        steps = StepTable::builtin().leftoverRemovalSteps(
            snapshot.distroFamily,
            strategy.requiresRebootDeferral ? StepPhase::Boot : StepPhase::Live);
    }
    std::copy_if(strategy.steps.begin(), strategy.steps.end(), std::back_inserter(steps),
                 [removesDriver](const StepDescriptor &step) {
                     return removesDriver || !step.afterDriverRemoval;
                 });

    PlannedCommands planned;
    for (const auto &step : steps) {
        auto rendered = m_services.planner.render(step, strategy, snapshot);
        std::vector<CommandDescriptor> *target = &planned.live;
        if (step.phase == StepPhase::Prepare) {
            target = &planned.prepare;
        } else if (step.phase == StepPhase::Boot) {
            target = &planned.boot;
        }
        target->insert(target->end(), rendered.begin(), rendered.end());
    }
    return planned;
}

CommandResult InstallOrchestrator::execute(const CommandDescriptor &command)
{
    if (command.elevated) {
        return m_services.executor.runElevated(command);
    }
    if (command.argv.empty()) {
        CommandResult result;
        result.exitCode = 127;
        result.stderrText = "empty command";
        return result;
    }
    const std::vector<std::string> args(command.argv.begin() + 1, command.argv.end());
    return m_services.probe.run(command.argv.front(), args,
                                std::chrono::duration_cast<std::chrono::milliseconds>(command.timeout));
}

bool InstallOrchestrator::runCommands(const std::vector<CommandDescriptor> &commands,
                                      InstallReport &report)
{
    for (const auto &command : commands) {
        report.executedCommands.push_back(command);
        const CommandResult result = execute(command);
        if (result.succeeded()) {
            continue;
        }
        if (StepPlanner::acceptsFailure(command, result)) {
            NVDM_LOG_DEBUG(QStringLiteral("InstallOrchestrator"),
                           QStringLiteral("runCommands"),
                           QStringLiteral("step_failure_accepted"),
                           QStringLiteral("acceptable_stderr"),
                           QStringLiteral("marker_match"),
                           logging::defaultWho(),
                           logging::currentCorrelationId(),
                           commandContext(command, result));
            continue;
        }

        const StepExecutionError error(
            result.timedOut ? "step " + command.stepId + " timed out"
                            : "step " + command.stepId + " exited with code "
                                  + std::to_string(result.exitCode),
            command.stepId, result);
        report.failureReason = error.what();
        report.failedStepId = error.stepId();
        report.failedStepOutput = error.result();
        NVDM_LOG_ERROR(QStringLiteral("InstallOrchestrator"),
                       QStringLiteral("runCommands"),
                       QStringLiteral("step_failed"),
                       QString::fromStdString(report.failureReason),
                       QStringLiteral("privileged_executor"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       commandContext(command, result));
        return false;
    }
    return true;
}

void InstallOrchestrator::preflight(const Strategy &strategy, const EnvironmentSnapshot &snapshot)
{
    const bool needsNetwork = std::any_of(strategy.steps.begin(), strategy.steps.end(),
                                          [](const StepDescriptor &step) { return step.needsNetwork; });
    if (needsNetwork
        && !m_services.connectivity.isReachable(m_config.connectivityHost,
                                                m_config.connectivityPort,
                                                m_config.connectivityTimeout)) {
        throw PreflightError("network unreachable: cannot connect to "
                             + m_config.connectivityHost + ":"
                             + std::to_string(m_config.connectivityPort));
    }

    const auto freeBytes = m_services.probe.freeDiskBytes("/");
    if (!freeBytes.has_value()) {
        NVDM_LOG_WARN(QStringLiteral("InstallOrchestrator"),
                      QStringLiteral("preflight"),
                      QStringLiteral("disk_space_unknown"),
                      QStringLiteral("statvfs_failed"),
                      QStringLiteral("filesystem_space"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      nlohmann::json::object());
    } else if (*freeBytes < m_config.minFreeDiskMb * kBytesPerMb) {
        throw PreflightError("not enough disk space: "
                             + std::to_string(*freeBytes / kBytesPerMb) + " MiB free, "
                             + std::to_string(m_config.minFreeDiskMb) + " MiB required");
    }

    if (strategy.distroFamily != snapshot.distroFamily) {
        throw PreflightError("strategy was selected for " + toDistroString(strategy.distroFamily)
                             + " but the host is " + toDistroString(snapshot.distroFamily));
    }
}

bool InstallOrchestrator::driverMatches(const Strategy &strategy,
                                        const EnvironmentSnapshot &snapshot,
                                        const DriverDescriptor &driver)
{
    if (strategy.expectedDriver == DriverFamily::None) {
        return driver.family == DriverFamily::None || driver.family == DriverFamily::Nouveau;
    }
    if (strategy.expectedDriver == DriverFamily::Nouveau && driver.family == DriverFamily::None
        && snapshot.currentDriver.isProprietary()) {
        // The proprietary module was unloaded and nouveau only loads after a
        // reboot; it has to exist for the running kernel.
        return m_services.probe.succeeds("modinfo", {"-k", snapshot.kernel.release, "nouveau"});
    }
    return driver.family == strategy.expectedDriver;
}

void InstallOrchestrator::fail(InstallReport &report,
                               const std::string &reason,
                               const Strategy &strategy,
                               const EnvironmentSnapshot &snapshot,
                               InstallationHistoryEntry *history)
{
    report.finalState = OrchestratorState::Failed;
    if (report.failureReason.empty()) {
        report.failureReason = reason;
    }

    ErrorReportInput input;
    input.runId = report.runId;
    input.reason = report.failureReason;
    input.environment = snapshot;
    input.strategy = strategy;
    input.failedStepId = report.failedStepId;
    input.failedStepOutput = report.failedStepOutput;
    input.executedCommands = report.executedCommands;
    input.backupId = report.backup.has_value() ? report.backup->id : 0;
    try {
        report.errorReportPath = m_services.reporter.write(input);
    } catch (const std::exception &error) {
        NVDM_LOG_WARN(QStringLiteral("InstallOrchestrator"),
                      QStringLiteral("fail"),
                      QStringLiteral("error_report_failed"),
                      QString::fromUtf8(error.what()),
                      QStringLiteral("error_reporter"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      nlohmann::json::object());
    }

    if (history != nullptr) {
        history->finishedAt = std::chrono::system_clock::now();
        history->outcome = InstallOutcome::Failed;
        history->errorReportPath = report.errorReportPath;
        try {
            if (history->id == 0) {
                history->id = m_services.store.addHistory(*history);
            } else {
                m_services.store.updateHistory(*history);
            }
            report.historyId = history->id;
        } catch (const std::exception &error) {
            NVDM_LOG_WARN(QStringLiteral("InstallOrchestrator"),
                          QStringLiteral("fail"),
                          QStringLiteral("history_update_failed"),
                          QString::fromUtf8(error.what()),
                          QStringLiteral("state_store"),
                          logging::defaultWho(),
                          logging::currentCorrelationId(),
                          (nlohmann::json{{"historyId", history->id}}));
        }
    }

    NVDM_LOG_ERROR(QStringLiteral("InstallOrchestrator"),
                   QStringLiteral("beginInstall"),
                   QStringLiteral("install_failed"),
                   QString::fromStdString(report.failureReason),
                   QStringLiteral("state_machine"),
                   logging::defaultWho(),
                   report.runId.empty() ? QString() : QString::fromStdString(report.runId),
                   (nlohmann::json{{"strategy", toStrategyString(strategy.kind)},
                                   {"failedStep", report.failedStepId},
                                   {"errorReport", report.errorReportPath},
                                   {"restoreOffer", report.restoreOfferBackupId().value_or(0)}}));
    transition(OrchestratorState::Failed);
}

InstallReport InstallOrchestrator::beginInstall(const Strategy &strategy,
                                                const EnvironmentSnapshot &snapshot)
{
    // The run is claimed in the same critical section as the check.
    OrchestratorState previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isInProgress(m_state) || m_restoring) {
            throw ConcurrentInstallError("an installation is already in progress (state "
                                         + toStateString(m_state) + ")");
        }
        previous = m_state;
        m_state = OrchestratorState::PreflightChecking;
        m_cancelRequested = false;
    }
    try {
        if (const auto pending = m_services.store.pendingDeferredJob(); pending.has_value()) {
            throw DeferredJobPendingError("deferred install #" + std::to_string(pending->id)
                                          + " is waiting for a reboot; cancel it first");
        }
    } catch (...) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = previous;
        throw;
    }

    InstallReport report;
    report.runId = newRunId();
    logging::CorrelationScope scope(QString::fromStdString(report.runId));

    InstallationHistoryEntry history;
    history.strategy = strategy.kind;
    history.targetVersion = strategy.targetVersion;
    history.startedAt = std::chrono::system_clock::now();

    NVDM_LOG_INFO(QStringLiteral("InstallOrchestrator"),
                  QStringLiteral("beginInstall"),
                  QStringLiteral("install_started"),
                  QStringLiteral("user_request"),
                  QStringLiteral("state_machine"),
                  logging::defaultWho(),
                  QString::fromStdString(report.runId),
                  (nlohmann::json{{"strategy", strategy},
                                  {"currentDriver", snapshot.currentDriver}}));
    report.warnings = warningsFor(strategy, snapshot);
    for (const auto &warning : report.warnings) {
        NVDM_LOG_WARN(QStringLiteral("InstallOrchestrator"),
                      QStringLiteral("beginInstall"),
                      QStringLiteral("install_warning"),
                      QString::fromStdString(warning),
                      QStringLiteral("environment_snapshot"),
                      logging::defaultWho(),
                      QString::fromStdString(report.runId),
                      (nlohmann::json{{"secureBoot", snapshot.secureBootEnabled}}));
    }

    try {
        announce(previous, OrchestratorState::PreflightChecking);
        runInstall(strategy, snapshot, report, history);
    } catch (const std::exception &error) {
        // Anything unexpected still ends the run in Failed.
        report.failureReason.clear();
        fail(report, std::string("unexpected error: ") + error.what(), strategy, snapshot,
             &history);
    }
    return report;
}

void InstallOrchestrator::runInstall(const Strategy &strategy,
                                     const EnvironmentSnapshot &snapshot,
                                     InstallReport &report,
                                     InstallationHistoryEntry &history)
{
    PlannedCommands planned;
    try {
        preflight(strategy, snapshot);
        planned = planCommands(strategy, snapshot);
    } catch (const PreflightError &error) {
        fail(report, std::string("preflight failed: ") + error.what(), strategy, snapshot, &history);
        return;
    }
    if (takeCancel()) {
        report.failureReason = "cancelled before backup";
        report.finalState = OrchestratorState::Idle;
        transition(OrchestratorState::Idle);
        return;
    }

    transition(OrchestratorState::BackingUp);
    try {
        report.backup = m_services.backups.snapshot(
            "before " + toStrategyDisplayName(strategy.kind) + " install", snapshot);
    } catch (const NvdmError &error) {
        fail(report, std::string("backup failed: ") + error.what(), strategy, snapshot, &history);
        return;
    }
    history.backupId = report.backup->id;
    history.outcome = InstallOutcome::Failed;
    history.id = m_services.store.addHistory(history);
    report.historyId = history.id;

    if (takeCancel()) {
        report.failureReason = "cancelled before execution";
        report.finalState = OrchestratorState::Idle;
        history.finishedAt = std::chrono::system_clock::now();
        m_services.store.updateHistory(history);
        transition(OrchestratorState::Idle);
        return;
    }

    transition(OrchestratorState::Executing);
    if (strategy.requiresRebootDeferral) {
        if (!runCommands(planned.prepare, report)) {
            fail(report, report.failureReason, strategy, snapshot, &history);
            return;
        }
        try {
            const std::string script =
                m_services.deferred.buildInstallScript(strategy, planned.boot);
            StageRequest request;
            request.scriptPath = m_services.deferred.writeStagedScript(strategy, script);
            request.strategy = strategy.kind;
            request.distroFamily = snapshot.distroFamily;
            request.historyId = history.id;
            const bool usesInstaller = std::any_of(
                strategy.steps.begin(), strategy.steps.end(),
                [](const StepDescriptor &step) { return step.action == StepAction::RunInstaller; });
            if (usesInstaller) {
                request.payloads.push_back(m_services.planner.installerCachePath(strategy, snapshot));
            }
            report.deferredJob = m_services.deferred.stage(request);
        } catch (const StepExecutionError &error) {
            report.failedStepId = error.stepId();
            report.failedStepOutput = error.result();
            fail(report, error.what(), strategy, snapshot, &history);
            return;
        } catch (const NvdmError &error) {
            fail(report, std::string("staging failed: ") + error.what(), strategy, snapshot, &history);
            return;
        }

        history.outcome = InstallOutcome::DeferredPending;
        m_services.store.updateHistory(history);
        report.finalState = OrchestratorState::DeferredPending;
        transition(OrchestratorState::DeferredPending);
        return;
    }

    if (!runCommands(planned.live, report)) {
        fail(report, report.failureReason, strategy, snapshot, &history);
        return;
    }

    transition(OrchestratorState::Verifying);
    const DriverDescriptor detected = m_services.detector.detectDriver(snapshot.distroFamily);
    report.verifiedDriver = detected;
    if (!driverMatches(strategy, snapshot, detected)) {
        const VerificationError error("verification failed: expected "
                                      + toDriverFamilyString(strategy.expectedDriver)
                                      + " driver, detected "
                                      + toDriverFamilyString(detected.family));
        fail(report, error.what(), strategy, snapshot, &history);
        return;
    }

    history.finishedAt = std::chrono::system_clock::now();
    history.outcome = InstallOutcome::Success;
    m_services.store.updateHistory(history);
    report.finalState = OrchestratorState::Succeeded;
    NVDM_LOG_INFO(QStringLiteral("InstallOrchestrator"),
                  QStringLiteral("beginInstall"),
                  QStringLiteral("install_succeeded"),
                  QStringLiteral("driver_verified"),
                  QStringLiteral("state_machine"),
                  logging::defaultWho(),
                  QString::fromStdString(report.runId),
                  (nlohmann::json{{"driver", detected},
                                  {"commands", report.executedCommands.size()}}));
    transition(OrchestratorState::Succeeded);
}

RestoreResult InstallOrchestrator::restoreFromBackup(std::int64_t backupId,
                                                     const EnvironmentSnapshot &snapshot)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isInProgress(m_state) || m_restoring) {
            throw ConcurrentInstallError("cannot restore while state is "
                                         + toStateString(m_state));
        }
        m_restoring = true;
    }

    try {
        RestoreResult result = m_services.backups.restore(backupId, snapshot);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_restoring = false;
        return result;
    } catch (...) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_restoring = false;
        throw;
    }
}

JobStatus InstallOrchestrator::refreshDeferredStatus()
{
    const JobStatus status = m_services.deferred.checkCompletion();
    if (!status.job.has_value()) {
        return status;
    }

    const OrchestratorState current = state();
    if (status.state == JobState::Pending) {
        if (!isInProgress(current)) {
            transition(OrchestratorState::DeferredPending);
        }
        return status;
    }

    if (status.job->completed) {
        return status;
    }

    // First observation of a finished boot-time run.
    m_services.store.markDeferredJobCompleted(status.job->id);
    if (status.job->historyId != 0) {
        if (auto entry = m_services.store.getHistory(status.job->historyId); entry.has_value()) {
            entry->outcome = status.succeeded() ? InstallOutcome::DeferredCompleted
                                                : InstallOutcome::Failed;
            entry->finishedAt = status.finishedAt.time_since_epoch().count() != 0
                ? status.finishedAt
                : std::chrono::system_clock::now();
            m_services.store.updateHistory(*entry);
        }
    }

    NVDM_LOG_INFO(QStringLiteral("InstallOrchestrator"),
                  QStringLiteral("refreshDeferredStatus"),
                  QStringLiteral("deferred_install_completed"),
                  QStringLiteral("boot_marker_found"),
                  QStringLiteral("marker_file"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  nlohmann::json(status));
    if (current == OrchestratorState::DeferredPending || !isInProgress(current)) {
        transition(OrchestratorState::DeferredCompleted);
    }
    return status;
}

bool InstallOrchestrator::abandonDeferredInstall()
{
    const OrchestratorState current = state();
    if (isInProgress(current) && current != OrchestratorState::DeferredPending) {
        throw ConcurrentInstallError("cannot cancel while state is " + toStateString(current));
    }

    const auto pending = m_services.store.pendingDeferredJob();
    if (!m_services.deferred.cancel()) {
        return false;
    }
    if (pending.has_value() && pending->historyId != 0) {
        if (auto entry = m_services.store.getHistory(pending->historyId); entry.has_value()) {
            entry->outcome = InstallOutcome::Failed;
            entry->finishedAt = std::chrono::system_clock::now();
            m_services.store.updateHistory(*entry);
        }
    }
    transition(OrchestratorState::Idle);
    return true;
}

} // namespace nvdm
