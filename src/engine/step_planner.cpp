#include "engine/step_planner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>

#include "common/errors.hpp"
#include "common/paths.hpp"
#include "common/string_utils.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::chrono::seconds kQueryTimeout{30};
constexpr std::uint64_t kMinimumInstallerBytes = 50000000;

const std::vector<std::string> kMissingUnitMarkers = {"not loaded", "does not exist"};
const std::vector<std::string> kMissingDkmsMarkers = {"not located in the DKMS tree"};

const std::vector<std::string> kDriverServices = {
    "nvidia-persistenced", "nvidia-powerd", "nvidia-suspend",
    "nvidia-resume", "nvidia-hibernate",
};

const std::vector<std::string> kDriverConfigFiles = {
    "/etc/modprobe.d/blacklist-nouveau.conf",
    "/etc/modprobe.d/disable-nvidia.conf",
    "/etc/X11/xorg.conf",
    "/etc/X11/xorg.conf.nvidia-xconfig-original",
};

const std::vector<std::string> kDriverConfigGlobs = {
    "/etc/modprobe.d/nvidia*.conf",
    "/etc/ld.so.conf.d/*nvidia*",
    "/etc/X11/xorg.conf.d/*nvidia*",
    "/usr/share/X11/xorg.conf.d/*nvidia*",
};

const std::vector<std::string> kLibraryDirGlobs = {
    "/usr/lib/x86_64-linux-gnu/libnvidia*",
    "/usr/lib/i386-linux-gnu/libnvidia*",
    "/usr/lib32/libnvidia*",
    "/usr/lib/nvidia*",
    "/usr/lib32/nvidia*",
    "/lib/x86_64-linux-gnu/libnvidia*",
    "/lib/i386-linux-gnu/libnvidia*",
};

const std::vector<std::string> kLibraryFileGlobs = {
    "/lib/x86_64-linux-gnu/*nvidia*.so*",
    "/lib/i386-linux-gnu/*nvidia*.so*",
    "/usr/lib/x86_64-linux-gnu/*nvidia*.so*",
    "/usr/lib/i386-linux-gnu/*nvidia*.so*",
    "/usr/lib/x86_64-linux-gnu/vdpau/libvdpau_nvidia*",
    "/usr/lib/i386-linux-gnu/vdpau/libvdpau_nvidia*",
    "/usr/bin/nvidia*",
    "/usr/sbin/nvidia*",
};

const std::vector<std::string> kFedoraLibraryGlobs = {
    "/usr/lib64/libnvidia*",
    "/usr/lib64/nvidia*",
    "/usr/lib64/*nvidia*.so*",
    "/usr/lib64/libvdpau_nvidia*",
};

struct DesktopPackages {
    const char *marker;
    std::vector<std::string> debian;
    std::vector<std::string> fedora;
};

// First marker found in the installed package list wins.
const std::vector<DesktopPackages> kDesktopPackages = {
    {"plasma-workspace",
     {"sddm", "plasma-workspace", "kwin-wayland", "libqt6opengl6", "qt6-qpa-plugins"},
     {"sddm", "plasma-workspace", "kwin-wayland", "qt6-qtbase", "qt6-qtwayland"}},
    {"cinnamon",
     {"cinnamon", "cinnamon-desktop-environment", "libqt6opengl6", "qt6-qpa-plugins"},
     {"cinnamon", "cinnamon-desktop-environment", "qt6-qtbase", "qt6-qtwayland"}},
    {"mate-desktop",
     {"mate-desktop-environment", "mate-desktop-environment-core", "libqt6opengl6",
      "qt6-qpa-plugins"},
     {"mate-desktop-environment", "qt6-qtbase", "qt6-qtwayland"}},
    {"xfce4-session",
     {"xfce4", "xfce4-session", "libqt6opengl6", "qt6-qpa-plugins"},
     {"xfce4-session", "qt6-qtbase", "qt6-qtwayland"}},
    {"gnome-shell",
     {"gnome-shell", "gnome-session", "libqt6opengl6", "qt6-qpa-plugins"},
     {"gnome-shell", "gnome-session", "qt6-qtbase", "qt6-qtwayland"}},
};

std::vector<std::string> concat(std::vector<std::string> head, const std::vector<std::string> &tail)
{
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

// Globs need a shell; every pattern here is a fixed literal.
std::vector<std::string> shellRemove(const std::string &flags, const std::vector<std::string> &globs)
{
    return {"sh", "-c", "rm " + flags + " " + join(globs, " ")};
}

std::string packageManager(const EnvironmentSnapshot &snapshot)
{
    if (!snapshot.packageManager.empty()) {
        return snapshot.packageManager;
    }
    return snapshot.distroFamily == DistroFamily::Fedora ? "dnf" : "apt-get";
}

std::vector<std::string> packageCommand(const EnvironmentSnapshot &snapshot,
                                        const std::vector<std::string> &args)
{
    const std::string manager = packageManager(snapshot);
    if (manager == "apt-get") {
        return concat({"env", "DEBIAN_FRONTEND=noninteractive", "apt-get"}, args);
    }
    return concat({manager}, args);
}

bool isDigits(const std::string &value)
{
    return !value.empty()
        && std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::vector<std::string> queryDriverPackages(SystemProbe &probe, DistroFamily family)
{
    std::vector<std::string> packages;
    if (family == DistroFamily::Fedora) {
        const CommandResult result = probe.run(
            "rpm", {"-qa", "--queryformat", "%{NAME}\n"}, kQueryTimeout);
        if (!result.succeeded()) {
            return packages;
        }
        for (const auto &line : splitLines(result.stdoutText)) {
            const std::string name = trim(line);
            if (name.empty() || !containsIgnoreCase(name, "nvidia")
                || name == "nvidia-gpu-firmware") {
                continue;
            }
            packages.push_back(name);
        }
        return packages;
    }

    if (family == DistroFamily::Debian) {
        const CommandResult result = probe.run("dpkg", {"-l"}, kQueryTimeout);
        if (!result.succeeded()) {
            return packages;
        }
        for (const auto &line : splitLines(result.stdoutText)) {
            const auto fields = splitWhitespace(line);
            if (fields.size() < 2 || fields[0] != "ii" || !containsIgnoreCase(fields[1], "nvidia")) {
                continue;
            }
            packages.push_back(fields[1]);
        }
    }
    return packages;
}

StepPlanner::StepPlanner(SystemProbe &probe, const EngineConfig &config)
    : m_probe(probe)
    , m_config(config)
{
}

std::chrono::seconds StepPlanner::timeoutFor(TimeoutClass timeout) const
{
    switch (timeout) {
    case TimeoutClass::Short:
        return m_config.shortStepTimeout;
    case TimeoutClass::Standard:
        return m_config.stepTimeout;
    case TimeoutClass::PackageTransaction:
        return m_config.packageTransactionTimeout;
    }
    return m_config.stepTimeout;
}

bool StepPlanner::acceptsFailure(const CommandDescriptor &command, const CommandResult &result)
{
    if (result.timedOut || result.exitCode == 0) {
        return false;
    }
    return std::any_of(command.acceptableStderr.begin(), command.acceptableStderr.end(),
                       [&result](const std::string &marker) {
                           return result.stderrText.find(marker) != std::string::npos;
                       });
}

std::string StepPlanner::installerFileName(const Strategy &strategy,
                                           const EnvironmentSnapshot &snapshot) const
{
    return "NVIDIA-" + snapshot.architecture + "-" + strategy.targetVersion + ".run";
}

std::string StepPlanner::installerCachePath(const Strategy &strategy,
                                            const EnvironmentSnapshot &snapshot) const
{
    return downloadsDirPath().toStdString() + "/" + installerFileName(strategy, snapshot);
}

std::string StepPlanner::installerBootPath(const Strategy &strategy,
                                           const EnvironmentSnapshot &snapshot) const
{
    return m_config.system.scriptDir + "/" + installerFileName(strategy, snapshot);
}

std::string StepPlanner::installerUrl(const Strategy &strategy,
                                      const EnvironmentSnapshot &snapshot) const
{
    return "https://us.download.nvidia.com/XFree86/" + snapshot.architecture + "/"
        + strategy.targetVersion + "/" + installerFileName(strategy, snapshot);
}

std::string StepPlanner::fedoraRelease()
{
    if (m_fedoraRelease.empty()) {
        const CommandResult result = m_probe.run("rpm", {"-E", "%{fedora}"}, kQueryTimeout);
        const std::string release = trim(result.stdoutText);
        if (!result.succeeded() || !isDigits(release)) {
            throw PreflightError("cannot determine the Fedora release for RPM Fusion");
        }
        m_fedoraRelease = release;
    }
    return m_fedoraRelease;
}

std::vector<std::string> StepPlanner::desktopPackages(DistroFamily family)
{
    const bool fedora = family == DistroFamily::Fedora;
    const CommandResult result = fedora
        ? m_probe.run("rpm", {"-qa", "--queryformat", "%{NAME}\n"}, kQueryTimeout)
        : m_probe.run("dpkg", {"-l"}, kQueryTimeout);
    if (!result.succeeded()) {
        return {};
    }
    for (const auto &desktop : kDesktopPackages) {
        if (result.stdoutText.find(desktop.marker) != std::string::npos) {
            return fedora ? desktop.fedora : desktop.debian;
        }
    }
    return {};
}

std::vector<std::string> StepPlanner::dkmsEntries()
{
    std::vector<std::string> entries;
    const CommandResult result = m_probe.run("dkms", {"status"}, kQueryTimeout);
    if (!result.succeeded()) {
        return entries;
    }
    // "nvidia/580.126.09, 6.8.0-45-generic, x86_64: installed"
    for (const auto &line : splitLines(result.stdoutText)) {
        if (!containsIgnoreCase(line, "nvidia")) {
            continue;
        }
        const std::string entry = trim(line.substr(0, line.find(',')));
        if (!entry.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::string StepPlanner::substitute(const std::string &operand,
                                    const Strategy &strategy,
                                    const EnvironmentSnapshot &snapshot)
{
    std::string value = replaceAll(operand, "{kernel}", snapshot.kernel.release);
    value = replaceAll(value, "{repo_branch}", strategy.repoBranch);
    value = replaceAll(value, "{repo_package}", snapshot.currentDriver.package);
    if (value.find("{fedora_release}") != std::string::npos) {
        value = replaceAll(value, "{fedora_release}", fedoraRelease());
    }
    return value;
}

std::vector<CommandDescriptor> StepPlanner::render(const std::vector<StepDescriptor> &steps,
                                                   const Strategy &strategy,
                                                   const EnvironmentSnapshot &snapshot)
{
    std::vector<CommandDescriptor> commands;
    for (const auto &step : steps) {
        auto rendered = render(step, strategy, snapshot);
        commands.insert(commands.end(),
                        std::make_move_iterator(rendered.begin()),
                        std::make_move_iterator(rendered.end()));
    }
    return commands;
}

std::vector<CommandDescriptor> StepPlanner::render(const StepDescriptor &step,
                                                   const Strategy &strategy,
                                                   const EnvironmentSnapshot &snapshot)
{
    std::vector<std::string> operands;
    operands.reserve(step.operands.size());
    for (const auto &operand : step.operands) {
        operands.push_back(substitute(operand, strategy, snapshot));
    }

    const bool fedora = snapshot.distroFamily == DistroFamily::Fedora;
    std::vector<CommandDescriptor> commands;
    const auto emit = [&](std::vector<std::string> argv) -> CommandDescriptor & {
        CommandDescriptor command;
        command.stepId = step.id;
        command.action = step.action;
        command.argv = std::move(argv);
        command.timeout = timeoutFor(step.timeout);
        command.acceptableStderr = step.acceptableStderr;
        commands.push_back(std::move(command));
        return commands.back();
    };

    switch (step.action) {
    case StepAction::RefreshRepositories:
        emit(packageCommand(snapshot, {fedora ? "makecache" : "update"}));
        break;
    case StepAction::InstallPackages:
        emit(packageCommand(snapshot, concat({"install", "-y"}, operands)));
        break;
    case StepAction::ReinstallPackages:
        if (operands.empty()) {
            break;
        }
        emit(packageCommand(snapshot, fedora ? concat({"install", "-y"}, operands)
                                             : concat({"install", "-y", "--reinstall"}, operands)));
        break;
    case StepAction::ReinstallDesktop: {
        // The desktop first, then the Mesa packages given as operands.
        const auto reinstall = [&](const std::vector<std::string> &packages) {
            emit(packageCommand(snapshot, fedora ? concat({"reinstall", "-y"}, packages)
                                                 : concat({"install", "-y", "--reinstall"}, packages)));
        };
        const std::vector<std::string> desktop = desktopPackages(snapshot.distroFamily);
        if (!desktop.empty()) {
            reinstall(desktop);
        }
        if (!operands.empty()) {
            reinstall(operands);
        }
        break;
    }
    case StepAction::UpgradePackages:
        emit(packageCommand(snapshot, fedora ? concat({"upgrade", "-y"}, operands)
                                             : concat({"install", "-y", "--only-upgrade"}, operands)));
        break;
    case StepAction::RemovePackages:
        if (operands.empty()) {
            break;
        }
        emit(packageCommand(snapshot, fedora ? concat({"remove", "-y"}, operands)
                                             : concat({"remove", "--purge", "-y"}, operands)));
        break;
    case StepAction::PurgeDriverPackages: {
        const auto packages = queryDriverPackages(m_probe, snapshot.distroFamily);
        if (packages.empty()) {
            break;
        }
        if (fedora) {
            emit(packageCommand(snapshot, concat({"remove", "-y"}, packages)));
        } else {
            emit(packageCommand(snapshot, concat({"remove", "--purge", "-y"}, packages)));
            emit(packageCommand(snapshot, {"autoremove", "--purge", "-y"}));
        }
        break;
    }
    case StepAction::RemoveKernelModules:
        if (!fedora) {
            for (const auto &entry : dkmsEntries()) {
                emit({"dkms", "remove", entry, "--all"}).acceptableStderr = kMissingDkmsMarkers;
            }
            emit(shellRemove("-rf", {"/var/lib/dkms/nvidia*", "/usr/src/nvidia*", "/usr/src/NVIDIA*"}));
            emit({"find", "/lib/modules", "-name", "nvidia*.ko*",
                  "!", "-path", "*/updates/dkms/*", "-delete"});
        } else {
            emit({"find", "/lib/modules", "-name", "nvidia*.ko*", "-delete"});
        }
        emit({"depmod", "-a"});
        break;
    case StepAction::RemoveDriverLibraries:
        emit(shellRemove("-rf", fedora ? concat(kLibraryDirGlobs, {kFedoraLibraryGlobs[0], kFedoraLibraryGlobs[1]})
                                       : kLibraryDirGlobs));
        emit(shellRemove("-f", fedora ? concat(kLibraryFileGlobs, {kFedoraLibraryGlobs[2], kFedoraLibraryGlobs[3]})
                                      : kLibraryFileGlobs));
        emit({"ldconfig"});
        break;
    case StepAction::RemoveDriverConfigs:
        for (const auto &service : kDriverServices) {
            emit({"systemctl", "disable", "--now", service + ".service"}).acceptableStderr =
                kMissingUnitMarkers;
        }
        emit(concat({"rm", "-f"}, kDriverConfigFiles));
        emit(shellRemove("-f", kDriverConfigGlobs));
        break;
    case StepAction::WriteConfigFile:
        if (operands.size() < 2) {
            throw PreflightError("step " + step.id + " lacks a path or content");
        }
        emit({"tee", operands[0]}).stdinData = operands[1];
        break;
    case StepAction::DeleteConfigLines:
        if (operands.size() < 2) {
            throw PreflightError("step " + step.id + " lacks a path or pattern");
        }
        if (m_probe.fileExists(operands[0])) {
            emit({"sed", "-i", "/" + operands[1] + "/d", operands[0]});
        }
        break;
    case StepAction::DeleteFiles:
        emit(concat({"rm", "-f"}, operands));
        break;
    case StepAction::EnableRepository:
        for (const auto &repository : operands) {
            if (!fedora) {
                emit({"add-apt-repository", "-y", repository});
                continue;
            }
            if (repository.find("rpmfusion-nonfree") != std::string::npos
                && m_probe.succeeds("rpm", {"-q", "rpmfusion-nonfree-release"})) {
                continue;
            }
            emit(packageCommand(snapshot, {"install", "-y", repository}));
        }
        break;
    case StepAction::RemoveRepository:
        if (!fedora) {
            for (const auto &repository : operands) {
                emit({"add-apt-repository", "-y", "--remove", repository});
            }
        }
        break;
    case StepAction::AddInitramfsModule:
        for (const auto &module : operands) {
            if (fedora) {
                emit({"tee", "/etc/dracut.conf.d/" + module + ".conf"}).stdinData =
                    "add_drivers+=\" " + module + " \"\n";
            } else {
                emit({"sh", "-c",
                      "grep -qx " + shellQuote(module) + " /etc/initramfs-tools/modules || echo "
                          + shellQuote(module) + " >> /etc/initramfs-tools/modules"});
            }
        }
        break;
    case StepAction::RebuildInitramfs:
        if (fedora) {
            emit({"dracut", "--force"});
        } else {
            emit({"update-initramfs", "-u", "-k", "all"});
        }
        break;
    case StepAction::EnableUnit:
        emit({"systemctl", "daemon-reload"});
        for (const auto &unit : operands) {
            emit({"systemctl", "enable", unit});
        }
        break;
    case StepAction::FetchInstaller: {
        const std::string path = installerCachePath(strategy, snapshot);
        if (m_probe.fileExists(path)) {
            const CommandResult size = m_probe.run("stat", {"-c", "%s", path}, kQueryTimeout);
            const std::string bytes = trim(size.stdoutText);
            if (size.succeeded() && isDigits(bytes) && bytes.size() < 19
                && std::stoull(bytes) > kMinimumInstallerBytes) {
                break;
            }
        }
        const std::string url = installerUrl(strategy, snapshot);
        CommandDescriptor &fetch = m_probe.fileExists("/usr/bin/curl")
            ? emit({"curl", "-fL", "-o", path, url})
            : emit({"wget", "-O", path, url});
        fetch.elevated = false;
        break;
    }
    case StepAction::RunInstaller:
        emit(concat({"sh", installerBootPath(strategy, snapshot)}, operands));
        emit({"depmod", "-a"});
        break;
    case StepAction::VerifyKernelModule:
        // Looks at the running kernel when the command runs, not at planning time.
        for (const auto &module : operands) {
            emit({"sh", "-c",
                  "find \"/lib/modules/$(uname -r)\" -name " + shellQuote(module + ".ko*")
                      + " | grep -q ."});
        }
        break;
    }

    return commands;
}

} // namespace nvdm
