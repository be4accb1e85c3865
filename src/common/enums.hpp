#pragma once

namespace nvdm {

enum class DistroFamily {
    Debian,
    Fedora,
    Unknown
};

enum class SessionType {
    X11,
    Wayland,
    Tty,
    Unknown
};

enum class DriverFamily {
    None,
    Nouveau,
    ProprietaryRepo,
    ProprietaryRun
};

enum class StrategyKind {
    NVK,
    RepoStable,
    RepoLatest,
    RunProduction,
    RunNewFeature,
    RunBeta,
    RunLegacy,
    RemoveProprietary,
    UpgradeRepo
};

enum class OrchestratorState {
    Idle,
    PreflightChecking,
    BackingUp,
    Executing,
    Verifying,
    Succeeded,
    Failed,
    DeferredPending,
    DeferredCompleted
};

enum class InstallOutcome {
    Success,
    Failed,
    DeferredPending,
    DeferredCompleted
};

enum class StepPhase {
    Live,
    Prepare,
    Boot
};

enum class StepAction {
    RefreshRepositories,
    InstallPackages,
    ReinstallPackages,
    ReinstallDesktop,
    UpgradePackages,
    RemovePackages,
    PurgeDriverPackages,
    RemoveKernelModules,
    RemoveDriverLibraries,
    RemoveDriverConfigs,
    WriteConfigFile,
    DeleteConfigLines,
    DeleteFiles,
    EnableRepository,
    RemoveRepository,
    AddInitramfsModule,
    RebuildInitramfs,
    EnableUnit,
    FetchInstaller,
    RunInstaller,
    VerifyKernelModule
};

enum class TimeoutClass {
    Short,
    Standard,
    PackageTransaction
};

} // namespace nvdm
