#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace nvdm {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(std::int64_t value)
{
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{value}};
}

inline std::string toDistroString(DistroFamily family)
{
    switch (family) {
    case DistroFamily::Debian:
        return "debian";
    case DistroFamily::Fedora:
        return "fedora";
    case DistroFamily::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline DistroFamily parseDistroString(const std::string &value)
{
    if (value == "debian") {
        return DistroFamily::Debian;
    }
    if (value == "fedora") {
        return DistroFamily::Fedora;
    }
    return DistroFamily::Unknown;
}

inline std::string toSessionString(SessionType session)
{
    switch (session) {
    case SessionType::X11:
        return "x11";
    case SessionType::Wayland:
        return "wayland";
    case SessionType::Tty:
        return "tty";
    case SessionType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline SessionType parseSessionString(const std::string &value)
{
    if (value == "x11") {
        return SessionType::X11;
    }
    if (value == "wayland") {
        return SessionType::Wayland;
    }
    if (value == "tty") {
        return SessionType::Tty;
    }
    return SessionType::Unknown;
}

inline std::string toDriverFamilyString(DriverFamily family)
{
    switch (family) {
    case DriverFamily::None:
        return "none";
    case DriverFamily::Nouveau:
        return "nouveau";
    case DriverFamily::ProprietaryRepo:
        return "proprietary-repo";
    case DriverFamily::ProprietaryRun:
        return "proprietary-run";
    }
    return "none";
}

inline DriverFamily parseDriverFamilyString(const std::string &value)
{
    if (value == "nouveau") {
        return DriverFamily::Nouveau;
    }
    if (value == "proprietary-repo") {
        return DriverFamily::ProprietaryRepo;
    }
    if (value == "proprietary-run") {
        return DriverFamily::ProprietaryRun;
    }
    return DriverFamily::None;
}

inline std::string toStrategyString(StrategyKind kind)
{
    switch (kind) {
    case StrategyKind::NVK:
        return "nvk";
    case StrategyKind::RepoStable:
        return "repo-stable";
    case StrategyKind::RepoLatest:
        return "repo-latest";
    case StrategyKind::RunProduction:
        return "run-production";
    case StrategyKind::RunNewFeature:
        return "run-new-feature";
    case StrategyKind::RunBeta:
        return "run-beta";
    case StrategyKind::RunLegacy:
        return "run-legacy";
    case StrategyKind::RemoveProprietary:
        return "remove-proprietary";
    case StrategyKind::UpgradeRepo:
        return "upgrade-repo";
    }
    return "nvk";
}

// Human-facing name used in backup labels ("before NVK install").
inline std::string toStrategyDisplayName(StrategyKind kind)
{
    switch (kind) {
    case StrategyKind::NVK:
        return "NVK";
    case StrategyKind::RepoStable:
        return "RepoStable";
    case StrategyKind::RepoLatest:
        return "RepoLatest";
    case StrategyKind::RunProduction:
        return "RunProduction";
    case StrategyKind::RunNewFeature:
        return "RunNewFeature";
    case StrategyKind::RunBeta:
        return "RunBeta";
    case StrategyKind::RunLegacy:
        return "RunLegacy";
    case StrategyKind::RemoveProprietary:
        return "RemoveProprietary";
    case StrategyKind::UpgradeRepo:
        return "UpgradeRepo";
    }
    return "NVK";
}

inline std::optional<StrategyKind> parseStrategyString(const std::string &value)
{
    static const StrategyKind kinds[] = {
        StrategyKind::NVK,
        StrategyKind::RepoStable,
        StrategyKind::RepoLatest,
        StrategyKind::RunProduction,
        StrategyKind::RunNewFeature,
        StrategyKind::RunBeta,
        StrategyKind::RunLegacy,
        StrategyKind::RemoveProprietary,
        StrategyKind::UpgradeRepo,
    };
    for (StrategyKind kind : kinds) {
        if (toStrategyString(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

inline std::string toStateString(OrchestratorState state)
{
    switch (state) {
    case OrchestratorState::Idle:
        return "idle";
    case OrchestratorState::PreflightChecking:
        return "preflight-checking";
    case OrchestratorState::BackingUp:
        return "backing-up";
    case OrchestratorState::Executing:
        return "executing";
    case OrchestratorState::Verifying:
        return "verifying";
    case OrchestratorState::Succeeded:
        return "succeeded";
    case OrchestratorState::Failed:
        return "failed";
    case OrchestratorState::DeferredPending:
        return "deferred-pending";
    case OrchestratorState::DeferredCompleted:
        return "deferred-completed";
    }
    return "idle";
}

inline std::string toOutcomeString(InstallOutcome outcome)
{
    switch (outcome) {
    case InstallOutcome::Success:
        return "success";
    case InstallOutcome::Failed:
        return "failed";
    case InstallOutcome::DeferredPending:
        return "deferred-pending";
    case InstallOutcome::DeferredCompleted:
        return "deferred-completed";
    }
    return "failed";
}

inline InstallOutcome parseOutcomeString(const std::string &value)
{
    if (value == "success") {
        return InstallOutcome::Success;
    }
    if (value == "deferred-pending") {
        return InstallOutcome::DeferredPending;
    }
    if (value == "deferred-completed") {
        return InstallOutcome::DeferredCompleted;
    }
    return InstallOutcome::Failed;
}

inline std::string toActionString(StepAction action)
{
    switch (action) {
    case StepAction::RefreshRepositories:
        return "refresh-repositories";
    case StepAction::InstallPackages:
        return "install-packages";
    case StepAction::ReinstallPackages:
        return "reinstall-packages";
    case StepAction::ReinstallDesktop:
        return "reinstall-desktop";
    case StepAction::UpgradePackages:
        return "upgrade-packages";
    case StepAction::RemovePackages:
        return "remove-packages";
    case StepAction::PurgeDriverPackages:
        return "purge-driver-packages";
    case StepAction::RemoveKernelModules:
        return "remove-kernel-modules";
    case StepAction::RemoveDriverLibraries:
        return "remove-driver-libraries";
    case StepAction::RemoveDriverConfigs:
        return "remove-driver-configs";
    case StepAction::WriteConfigFile:
        return "write-config-file";
    case StepAction::DeleteConfigLines:
        return "delete-config-lines";
    case StepAction::DeleteFiles:
        return "delete-files";
    case StepAction::EnableRepository:
        return "enable-repository";
    case StepAction::RemoveRepository:
        return "remove-repository";
    case StepAction::AddInitramfsModule:
        return "add-initramfs-module";
    case StepAction::RebuildInitramfs:
        return "rebuild-initramfs";
    case StepAction::EnableUnit:
        return "enable-unit";
    case StepAction::FetchInstaller:
        return "fetch-installer";
    case StepAction::RunInstaller:
        return "run-installer";
    case StepAction::VerifyKernelModule:
        return "verify-kernel-module";
    }
    return "install-packages";
}

inline void to_json(nlohmann::json &j, const KernelVersion &kernel)
{
    j = nlohmann::json{
        {"release", kernel.release},
        {"major", kernel.major},
        {"minor", kernel.minor},
        {"patch", kernel.patch}
    };
}

inline void from_json(const nlohmann::json &j, KernelVersion &kernel)
{
    kernel.release = j.value("release", "");
    kernel.major = j.value("major", 0);
    kernel.minor = j.value("minor", 0);
    kernel.patch = j.value("patch", 0);
}

inline void to_json(nlohmann::json &j, const DriverDescriptor &driver)
{
    j = nlohmann::json{
        {"family", toDriverFamilyString(driver.family)},
        {"version", driver.version},
        {"package", driver.package}
    };
}

inline void from_json(const nlohmann::json &j, DriverDescriptor &driver)
{
    driver.family = parseDriverFamilyString(j.value("family", "none"));
    driver.version = j.value("version", "");
    driver.package = j.value("package", "");
}

inline void to_json(nlohmann::json &j, const EnvironmentSnapshot &snapshot)
{
    j = nlohmann::json{
        {"detectedAt", toIso8601Utc(snapshot.detectedAt)},
        {"distroFamily", toDistroString(snapshot.distroFamily)},
        {"distroId", snapshot.distroId},
        {"distroName", snapshot.distroName},
        {"kernel", snapshot.kernel},
        {"architecture", snapshot.architecture},
        {"sessionType", toSessionString(snapshot.sessionType)},
        {"secureBootEnabled", snapshot.secureBootEnabled},
        {"gpu", snapshot.gpuIdentifier},
        {"currentDriver", snapshot.currentDriver},
        {"networkReachable", snapshot.networkReachable},
        {"packageManager", snapshot.packageManager}
    };
}

inline void from_json(const nlohmann::json &j, EnvironmentSnapshot &snapshot)
{
    snapshot.detectedAt = fromIso8601Utc(j.value("detectedAt", ""));
    snapshot.distroFamily = parseDistroString(j.value("distroFamily", "unknown"));
    snapshot.distroId = j.value("distroId", "");
    snapshot.distroName = j.value("distroName", "");
    if (j.contains("kernel") && j.at("kernel").is_object()) {
        snapshot.kernel = j.at("kernel").get<KernelVersion>();
    }
    snapshot.architecture = j.value("architecture", "");
    snapshot.sessionType = parseSessionString(j.value("sessionType", "unknown"));
    snapshot.secureBootEnabled = j.value("secureBootEnabled", false);
    snapshot.gpuIdentifier = j.value("gpu", "");
    if (j.contains("currentDriver") && j.at("currentDriver").is_object()) {
        snapshot.currentDriver = j.at("currentDriver").get<DriverDescriptor>();
    }
    snapshot.networkReachable = j.value("networkReachable", false);
    snapshot.packageManager = j.value("packageManager", "");
}

inline void to_json(nlohmann::json &j, const StepDescriptor &step)
{
    j = nlohmann::json{
        {"id", step.id},
        {"action", toActionString(step.action)},
        {"operands", step.operands},
        {"phase", step.phase == StepPhase::Boot
                      ? "boot"
                      : (step.phase == StepPhase::Prepare ? "prepare" : "live")},
        {"needsNetwork", step.needsNetwork},
        {"afterDriverRemoval", step.afterDriverRemoval}
    };
}

inline void to_json(nlohmann::json &j, const CommandDescriptor &command)
{
    j = nlohmann::json{
        {"stepId", command.stepId},
        {"action", toActionString(command.action)},
        {"argv", command.argv},
        {"timeoutSeconds", command.timeout.count()},
        {"elevated", command.elevated}
    };
}

inline void to_json(nlohmann::json &j, const CommandResult &result)
{
    j = nlohmann::json{
        {"exitCode", result.exitCode},
        {"stdout", result.stdoutText},
        {"stderr", result.stderrText},
        {"timedOut", result.timedOut}
    };
}

inline void to_json(nlohmann::json &j, const Strategy &strategy)
{
    j = nlohmann::json{
        {"kind", toStrategyString(strategy.kind)},
        {"distroFamily", toDistroString(strategy.distroFamily)},
        {"steps", strategy.steps},
        {"requiresRebootDeferral", strategy.requiresRebootDeferral},
        {"removesExistingDriver", strategy.removesExistingDriver},
        {"expectedDriver", toDriverFamilyString(strategy.expectedDriver)},
        {"targetVersion", strategy.targetVersion},
        {"repoBranch", strategy.repoBranch}
    };
    if (strategy.minimumKernel.has_value()) {
        j["minimumKernel"] = *strategy.minimumKernel;
    }
}

inline void to_json(nlohmann::json &j, const ConfigFileRecord &record)
{
    j = nlohmann::json{
        {"path", record.path},
        {"sha256", record.sha256},
        {"existed", record.existed},
        {"contentCaptured", record.contentCaptured},
        {"storedAs", record.storedAs}
    };
}

inline void from_json(const nlohmann::json &j, ConfigFileRecord &record)
{
    record.path = j.value("path", "");
    record.sha256 = j.value("sha256", "");
    record.existed = j.value("existed", false);
    record.contentCaptured = j.value("contentCaptured", false);
    record.storedAs = j.value("storedAs", "");
}

inline void to_json(nlohmann::json &j, const Backup &backup)
{
    j = nlohmann::json{
        {"id", backup.id},
        {"createdAt", toIso8601Utc(backup.createdAt)},
        {"label", backup.label},
        {"driver", backup.driver},
        {"configFiles", backup.configFiles},
        {"packages", backup.packages}
    };
}

inline void to_json(nlohmann::json &j, const DeferredInstallJob &job)
{
    j = nlohmann::json{
        {"id", job.id},
        {"stagedScriptPath", job.stagedScriptPath},
        {"systemScriptPath", job.systemScriptPath},
        {"unitPath", job.unitPath},
        {"executionContext", job.executionContext},
        {"createdAt", toIso8601Utc(job.createdAt)},
        {"completed", job.completed},
        {"logPath", job.logPath},
        {"markerPath", job.markerPath},
        {"strategy", toStrategyString(job.strategy)},
        {"historyId", job.historyId}
    };
}

inline void to_json(nlohmann::json &j, const JobStatus &status)
{
    std::string state = "none";
    if (status.state == JobState::Pending) {
        state = "pending";
    } else if (status.state == JobState::Completed) {
        state = "completed";
    }
    j = nlohmann::json{{"state", state}, {"logTail", status.logTail}};
    if (status.job.has_value()) {
        j["job"] = *status.job;
    }
    if (status.state == JobState::Completed) {
        j["exitCode"] = status.exitCode;
        j["finishedAt"] = toIso8601Utc(status.finishedAt);
    }
}

inline void to_json(nlohmann::json &j, const InstallationHistoryEntry &entry)
{
    j = nlohmann::json{
        {"id", entry.id},
        {"backupId", entry.backupId},
        {"strategy", toStrategyString(entry.strategy)},
        {"targetVersion", entry.targetVersion},
        {"startedAt", toIso8601Utc(entry.startedAt)},
        {"finishedAt", toIso8601Utc(entry.finishedAt)},
        {"outcome", toOutcomeString(entry.outcome)},
        {"errorReport", entry.errorReportPath}
    };
}

inline void to_json(nlohmann::json &j, const DiagnosticsReport &report)
{
    j = nlohmann::json{
        {"generatedAt", toIso8601Utc(report.generatedAt)},
        {"orchestratorState", toStateString(report.orchestratorState)},
        {"backups", report.backups},
        {"deferredJob", report.deferredJob},
        {"dkmsStatus", report.dkmsStatus},
        {"kernelModules", report.kernelModules},
        {"loadedModules", report.loadedModules},
        {"driverSources", report.driverSources},
        {"advice", report.advice}
    };
    if (report.environment.has_value()) {
        j["environment"] = *report.environment;
    } else {
        j["environment"] = nullptr;
        j["detectionError"] = report.detectionError;
    }
    if (report.lastInstall.has_value()) {
        j["lastInstall"] = *report.lastInstall;
    } else {
        j["lastInstall"] = nullptr;
    }
}

} // namespace nvdm
