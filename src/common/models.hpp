#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/string_utils.hpp"

namespace nvdm {

struct KernelVersion {
    std::string release;
    int major = 0;
    int minor = 0;
    int patch = 0;

    bool atLeast(int wantMajor, int wantMinor) const
    {
        return major > wantMajor || (major == wantMajor && minor >= wantMinor);
    }
};

struct DriverDescriptor {
    DriverFamily family = DriverFamily::None;
    std::string version;
    // Repository package providing the driver, empty for .run installs.
    std::string package;

    bool isProprietary() const
    {
        return family == DriverFamily::ProprietaryRepo
            || family == DriverFamily::ProprietaryRun;
    }
};

// Immutable per run. Re-detect instead of patching a stale copy.
struct EnvironmentSnapshot {
    std::chrono::system_clock::time_point detectedAt;
    DistroFamily distroFamily = DistroFamily::Unknown;
    std::string distroId;
    std::string distroName;
    KernelVersion kernel;
    std::string architecture;
    SessionType sessionType = SessionType::Unknown;
    bool secureBootEnabled = false;
    std::string gpuIdentifier;
    DriverDescriptor currentDriver;
    bool networkReachable = false;
    std::string packageManager;
};

struct StepDescriptor {
    std::string id;
    StepAction action = StepAction::InstallPackages;
    std::vector<std::string> operands;
    StepPhase phase = StepPhase::Live;
    TimeoutClass timeout = TimeoutClass::Standard;
    bool needsNetwork = false;
    // stderr fragments that turn a nonzero exit into success
    // (e.g. a systemd unit that does not exist).
    std::vector<std::string> acceptableStderr;
    // Planned only when a proprietary driver is removed before the strategy.
    bool afterDriverRemoval = false;
};

struct CommandDescriptor {
    std::string stepId;
    StepAction action = StepAction::InstallPackages;
    std::vector<std::string> argv;
    std::string stdinData;
    std::chrono::seconds timeout{900};
    bool elevated = true;
    std::vector<std::string> acceptableStderr;

    std::string commandLine() const;
};

struct CommandResult {
    int exitCode = 0;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;

    bool succeeded() const
    {
        return exitCode == 0 && !timedOut;
    }
};

struct Strategy {
    StrategyKind kind = StrategyKind::NVK;
    DistroFamily distroFamily = DistroFamily::Unknown;
    std::vector<StepDescriptor> steps;
    bool requiresRebootDeferral = false;
    bool removesExistingDriver = false;
    std::optional<KernelVersion> minimumKernel;
    DriverFamily expectedDriver = DriverFamily::None;
    // Version of the vendor installer or repository package the steps target.
    std::string targetVersion;
    // Debian repository branch, e.g. "580" for nvidia-driver-580-open.
    std::string repoBranch;
};

struct ConfigFileRecord {
    std::string path;
    std::string sha256;
    bool existed = false;
    bool contentCaptured = false;
    // Relative to the backup directory when contentCaptured is set.
    std::string storedAs;
};

struct Backup {
    std::int64_t id = 0;
    std::chrono::system_clock::time_point createdAt;
    std::string label;
    DriverDescriptor driver;
    std::vector<ConfigFileRecord> configFiles;
    std::vector<std::string> packages;
};

struct RestoreResult {
    bool ok = false;
    std::int64_t backupId = 0;
    std::int64_t preRestoreBackupId = 0;
    DriverDescriptor restoredDriver;
    std::string failedStepId;
    CommandResult failedStepOutput;
    std::string message;
};

struct DeferredInstallJob {
    std::int64_t id = 0;
    std::string stagedScriptPath;
    std::string systemScriptPath;
    std::string unitPath;
    std::string executionContext;
    std::chrono::system_clock::time_point createdAt;
    bool completed = false;
    std::string logPath;
    std::string markerPath;
    StrategyKind strategy = StrategyKind::RunProduction;
    std::int64_t historyId = 0;
};

enum class JobState {
    None,
    Pending,
    Completed
};

struct JobStatus {
    JobState state = JobState::None;
    std::optional<DeferredInstallJob> job;
    int exitCode = -1;
    std::chrono::system_clock::time_point finishedAt;
    std::vector<std::string> logTail;

    bool succeeded() const
    {
        return state == JobState::Completed && exitCode == 0;
    }
};

struct InstallationHistoryEntry {
    std::int64_t id = 0;
    std::int64_t backupId = 0;
    StrategyKind strategy = StrategyKind::NVK;
    std::string targetVersion;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    InstallOutcome outcome = InstallOutcome::Failed;
    std::string errorReportPath;
};

struct InstallReport {
    std::string runId;
    OrchestratorState finalState = OrchestratorState::Idle;
    std::string failureReason;
    std::string failedStepId;
    CommandResult failedStepOutput;
    std::vector<CommandDescriptor> executedCommands;
    std::optional<Backup> backup;
    std::optional<DeferredInstallJob> deferredJob;
    std::optional<DriverDescriptor> verifiedDriver;
    std::string errorReportPath;
    std::int64_t historyId = 0;
    // Shown to the user; they do not change the outcome.
    std::vector<std::string> warnings;

    // Failed runs that got past BackingUp offer restoring this backup.
    std::optional<std::int64_t> restoreOfferBackupId() const
    {
        if (finalState == OrchestratorState::Failed && backup.has_value()) {
            return backup->id;
        }
        return std::nullopt;
    }
};

struct DiagnosticsReport {
    std::chrono::system_clock::time_point generatedAt;
    std::optional<EnvironmentSnapshot> environment;
    std::string detectionError;
    OrchestratorState orchestratorState = OrchestratorState::Idle;
    std::vector<Backup> backups;
    std::optional<InstallationHistoryEntry> lastInstall;
    JobStatus deferredJob;
    std::vector<std::string> dkmsStatus;
    std::vector<std::string> kernelModules;
    std::vector<std::string> loadedModules;
    std::vector<std::string> driverSources;
    std::vector<std::string> advice;
};

inline std::string CommandDescriptor::commandLine() const
{
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto &arg : argv) {
        quoted.push_back(shellQuote(arg));
    }
    return join(quoted, " ");
}

} // namespace nvdm
