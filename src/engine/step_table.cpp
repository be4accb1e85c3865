#include "engine/step_table.hpp"

#include <utility>

namespace nvdm {

namespace {

constexpr const char *kBlacklistNouveauPath = "/etc/modprobe.d/blacklist-nouveau.conf";
constexpr const char *kNouveauOptionsPath = "/etc/modprobe.d/nouveau.conf";
constexpr const char *kNvidiaDrmOptionsPath = "/etc/modprobe.d/nvidia-drm.conf";
constexpr const char *kMesaPpa = "ppa:kisak/kisak-mesa";
constexpr const char *kSddmConfigPath = "/etc/sddm.conf";
constexpr const char *kNvkCheckUnit = "nvdm-nvk-check.service";
constexpr const char *kNvkCheckUnitPath = "/etc/systemd/system/nvdm-nvk-check.service";

// One-shot check on the first boot after switching to NVK: NVIDIA modules
// that survived in an old initramfs need one more reboot.
constexpr const char *kNvkCheckUnitText =
    "[Unit]\n"
    "Description=nvdm: reboot once more if NVIDIA modules are still loaded\n"
    "After=multi-user.target\n"
    "\n"
    "[Service]\n"
    "Type=oneshot\n"
    "ExecStart=/bin/sh -c 'systemctl disable nvdm-nvk-check.service; "
    "rm -f /etc/systemd/system/nvdm-nvk-check.service; sleep 10; "
    "if grep -q \"^nvidia\" /proc/modules; then systemctl reboot; fi'\n"
    "RemainAfterExit=no\n"
    "\n"
    "[Install]\n"
    "WantedBy=multi-user.target\n";
constexpr const char *kRpmFusionNonfree =
    "https://download1.rpmfusion.org/nonfree/fedora/"
    "rpmfusion-nonfree-release-{fedora_release}.noarch.rpm";

StepDescriptor step(std::string id,
                    StepAction action,
                    std::vector<std::string> operands = {},
                    TimeoutClass timeout = TimeoutClass::Standard,
                    bool needsNetwork = false)
{
    StepDescriptor descriptor;
    descriptor.id = std::move(id);
    descriptor.action = action;
    descriptor.operands = std::move(operands);
    descriptor.timeout = timeout;
    descriptor.needsNetwork = needsNetwork;
    return descriptor;
}

StepDescriptor inPhase(StepDescriptor descriptor, StepPhase phase)
{
    descriptor.phase = phase;
    return descriptor;
}

StepDescriptor blacklistNouveau()
{
    return step("blacklist-nouveau", StepAction::WriteConfigFile,
                {kBlacklistNouveauPath, "blacklist nouveau\noptions nouveau modeset=0\n"},
                TimeoutClass::Short);
}

StepDescriptor nouveauOptions()
{
    return step("write-nouveau-options", StepAction::WriteConfigFile,
                {kNouveauOptionsPath, "options nouveau modeset=1\n"},
                TimeoutClass::Short);
}

StepDescriptor rebuildInitramfs()
{
    return step("rebuild-initramfs", StepAction::RebuildInitramfs, {},
                TimeoutClass::PackageTransaction);
}

StepDescriptor refreshRepositories()
{
    return step("refresh-repositories", StepAction::RefreshRepositories, {},
                TimeoutClass::Standard, true);
}

std::vector<std::string> buildRequirements(DistroFamily family)
{
    if (family == DistroFamily::Fedora) {
        return {"kernel-devel", "gcc"};
    }
    return {"linux-headers-{kernel}", "dkms", "build-essential"};
}

StepDescriptor afterDriverRemoval(StepDescriptor descriptor)
{
    descriptor.afterDriverRemoval = true;
    return descriptor;
}

StrategyRow nvkRow(DistroFamily family)
{
    StrategyRow row;
    row.kind = StrategyKind::NVK;
    row.family = family;
    row.removesExistingDriver = true;
    row.minimumKernel = KernelVersion{"6.0", 6, 0, 0};
    row.expectedDriver = DriverFamily::Nouveau;

    row.steps.push_back(step("delete-nouveau-blacklist", StepAction::DeleteFiles,
                             {kBlacklistNouveauPath}, TimeoutClass::Short));
    row.steps.push_back(nouveauOptions());
    row.steps.push_back(step("add-nouveau-initramfs-module", StepAction::AddInitramfsModule,
                             {"nouveau"}, TimeoutClass::Short));

    if (family == DistroFamily::Debian) {
        row.steps.push_back(step("enable-mesa-ppa", StepAction::EnableRepository,
                                 {kMesaPpa}, TimeoutClass::Standard, true));
        row.steps.push_back(refreshRepositories());
        row.steps.push_back(step("install-nvk-packages", StepAction::InstallPackages,
                                 {"mesa-vulkan-drivers", "libgl1-mesa-dri", "libegl-mesa0",
                                  "libgles2", "libglx-mesa0", "mesa-utils", "vulkan-tools",
                                  "xserver-xorg-video-nouveau"},
                                 TimeoutClass::PackageTransaction, true));
        row.steps.push_back(step("reinstall-desktop-and-mesa", StepAction::ReinstallDesktop,
                                 {"libgl1-mesa-dri", "libegl-mesa0", "libgles2", "libglx-mesa0"},
                                 TimeoutClass::PackageTransaction, true));
        row.steps.push_back(step("configure-sddm-wayland", StepAction::DeleteConfigLines,
                                 {kSddmConfigPath, "Session=plasma.desktop"},
                                 TimeoutClass::Short));
    } else {
        // GSP firmware has to be installed before the initramfs is rebuilt.
        row.steps.push_back(step("install-nvk-packages", StepAction::InstallPackages,
                                 {"nvidia-gpu-firmware", "mesa-vulkan-drivers",
                                  "mesa-dri-drivers", "mesa-libEGL", "mesa-libGL",
                                  "vulkan-tools", "xorg-x11-drv-nouveau", "glx-utils"},
                                 TimeoutClass::PackageTransaction, true));
    }
    row.steps.push_back(rebuildInitramfs());
    row.steps.push_back(afterDriverRemoval(step("write-nvk-reboot-check", StepAction::WriteConfigFile,
                                                {kNvkCheckUnitPath, kNvkCheckUnitText},
                                                TimeoutClass::Short)));
    row.steps.push_back(afterDriverRemoval(step("enable-nvk-reboot-check", StepAction::EnableUnit,
                                                {kNvkCheckUnit}, TimeoutClass::Short)));
    return row;
}

StrategyRow repoRow(StrategyKind kind, DistroFamily family)
{
    StrategyRow row;
    row.kind = kind;
    row.family = family;
    row.removesExistingDriver = true;
    row.expectedDriver = DriverFamily::ProprietaryRepo;

    row.steps.push_back(step("install-build-requirements", StepAction::InstallPackages,
                             buildRequirements(family), TimeoutClass::PackageTransaction, true));
    if (family == DistroFamily::Debian) {
        row.steps.push_back(step("remove-mesa-ppa", StepAction::RemoveRepository, {kMesaPpa}));
        row.steps.push_back(refreshRepositories());
        row.steps.push_back(step("install-repo-driver", StepAction::InstallPackages,
                                 {"nvidia-driver-{repo_branch}-open"},
                                 TimeoutClass::PackageTransaction, true));
    } else {
        row.steps.push_back(step("enable-rpmfusion-nonfree", StepAction::EnableRepository,
                                 {kRpmFusionNonfree}, TimeoutClass::Standard, true));
        row.steps.push_back(refreshRepositories());
        row.steps.push_back(step("install-repo-driver", StepAction::InstallPackages,
                                 {"akmod-nvidia", "xorg-x11-drv-nvidia", "xorg-x11-drv-nvidia-cuda"},
                                 TimeoutClass::PackageTransaction, true));
    }
    row.steps.push_back(blacklistNouveau());
    row.steps.push_back(rebuildInitramfs());
    return row;
}

StrategyRow runRow(StrategyKind kind, DistroFamily family)
{
    StrategyRow row;
    row.kind = kind;
    row.family = family;
    row.requiresRebootDeferral = true;
    row.removesExistingDriver = true;
    row.expectedDriver = DriverFamily::ProprietaryRun;

    row.steps.push_back(inPhase(step("install-build-requirements", StepAction::InstallPackages,
                                     buildRequirements(family),
                                     TimeoutClass::PackageTransaction, true),
                                StepPhase::Prepare));
    row.steps.push_back(inPhase(step("fetch-installer", StepAction::FetchInstaller, {},
                                     TimeoutClass::PackageTransaction, true),
                                StepPhase::Prepare));

    std::vector<std::string> installerFlags = {
        "--silent", "--no-questions", "--accept-license",
        "--disable-nouveau", "--run-nvidia-xconfig",
    };
    if (family == DistroFamily::Debian) {
        installerFlags.push_back("--dkms");
    }

    row.steps.push_back(inPhase(blacklistNouveau(), StepPhase::Boot));
    row.steps.push_back(inPhase(step("run-installer", StepAction::RunInstaller, installerFlags,
                                     TimeoutClass::Standard),
                                StepPhase::Boot));
    row.steps.push_back(inPhase(step("write-nvidia-drm-options", StepAction::WriteConfigFile,
                                     {kNvidiaDrmOptionsPath,
                                      "options nvidia-drm modeset=1 fbdev=1\n"},
                                     TimeoutClass::Short),
                                StepPhase::Boot));
    row.steps.push_back(inPhase(rebuildInitramfs(), StepPhase::Boot));
    row.steps.push_back(inPhase(step("verify-kernel-module", StepAction::VerifyKernelModule,
                                     {"nvidia"}, TimeoutClass::Short),
                                StepPhase::Boot));
    return row;
}

StrategyRow removeProprietaryRow(DistroFamily family)
{
    StrategyRow row;
    row.kind = StrategyKind::RemoveProprietary;
    row.family = family;
    row.removesExistingDriver = true;
    row.expectedDriver = DriverFamily::None;
    row.steps.push_back(nouveauOptions());
    row.steps.push_back(rebuildInitramfs());
    return row;
}

StrategyRow upgradeRepoRow(DistroFamily family)
{
    StrategyRow row;
    row.kind = StrategyKind::UpgradeRepo;
    row.family = family;
    row.expectedDriver = DriverFamily::ProprietaryRepo;
    row.steps.push_back(refreshRepositories());
    if (family == DistroFamily::Debian) {
        row.steps.push_back(step("upgrade-repo-driver", StepAction::UpgradePackages,
                                 {"{repo_package}"}, TimeoutClass::PackageTransaction, true));
    } else {
        row.steps.push_back(step("upgrade-repo-driver", StepAction::UpgradePackages,
                                 {"akmod-nvidia", "xorg-x11-drv-nvidia"},
                                 TimeoutClass::PackageTransaction, true));
    }
    return row;
}

std::vector<StepDescriptor> leftoverSteps()
{
    return {
        step("remove-driver-configs", StepAction::RemoveDriverConfigs, {}, TimeoutClass::Short),
        step("purge-driver-packages", StepAction::PurgeDriverPackages, {},
             TimeoutClass::PackageTransaction),
        step("remove-kernel-modules", StepAction::RemoveKernelModules),
        step("remove-driver-libraries", StepAction::RemoveDriverLibraries, {}, TimeoutClass::Short),
    };
}

StepTable makeBuiltinTable()
{
    StepTable table;
    for (DistroFamily family : {DistroFamily::Debian, DistroFamily::Fedora}) {
        table.addRow(nvkRow(family));
        table.addRow(repoRow(StrategyKind::RepoStable, family));
        table.addRow(repoRow(StrategyKind::RepoLatest, family));
        for (StrategyKind kind : {StrategyKind::RunProduction, StrategyKind::RunNewFeature,
                                  StrategyKind::RunBeta, StrategyKind::RunLegacy}) {
            table.addRow(runRow(kind, family));
        }
        table.addRow(removeProprietaryRow(family));
        table.addRow(upgradeRepoRow(family));
        table.setLeftoverRemoval(family, leftoverSteps());
    }
    return table;
}

} // namespace

const StepTable &StepTable::builtin()
{
    static const StepTable table = makeBuiltinTable();
    return table;
}

const StrategyRow *StepTable::find(StrategyKind kind, DistroFamily family) const
{
    for (const auto &row : m_rows) {
        if (row.kind == kind && row.family == family) {
            return &row;
        }
    }
    return nullptr;
}

std::vector<StepDescriptor> StepTable::leftoverRemovalSteps(DistroFamily family,
                                                            StepPhase phase) const
{
    const auto it = m_leftovers.find(family);
    if (it == m_leftovers.end()) {
        return {};
    }
    std::vector<StepDescriptor> steps = it->second;
    for (auto &descriptor : steps) {
        descriptor.phase = phase;
    }
    return steps;
}

void StepTable::addRow(StrategyRow row)
{
    m_rows.push_back(std::move(row));
}

void StepTable::setLeftoverRemoval(DistroFamily family, std::vector<StepDescriptor> steps)
{
    m_leftovers[family] = std::move(steps);
}

} // namespace nvdm
