#include "engine/environment_detector.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <regex>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "engine/connectivity_checker.hpp"
#include "engine/privileged_executor.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::chrono::seconds kProbeTimeout{30};
constexpr std::chrono::seconds kInxiTimeout{60};

const std::array<const char *, 10> kDebianIds = {
    "debian", "ubuntu", "kubuntu", "lubuntu", "xubuntu",
    "pop", "linuxmint", "zorin", "elementary", "neon",
};

const std::array<const char *, 6> kFedoraIds = {
    "fedora", "rhel", "centos", "rocky", "almalinux", "alma",
};

std::string unquote(std::string value)
{
    if (value.size() >= 2
        && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

EnvironmentDetector::EnvironmentDetector(SystemProbe &probe,
                                         ConnectivityChecker &connectivity,
                                         const EngineConfig &config)
    : m_probe(probe)
    , m_connectivity(connectivity)
    , m_config(config)
{
}

OsRelease EnvironmentDetector::parseOsRelease(const std::string &text)
{
    OsRelease release;
    for (const auto &rawLine : splitLines(text)) {
        const std::string line = trim(rawLine);
        const auto eq = line.find('=');
        if (line.empty() || line.front() == '#' || eq == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, eq);
        const std::string value = unquote(trim(line.substr(eq + 1)));
        if (key == "ID") {
            release.id = toLower(value);
        } else if (key == "NAME") {
            release.name = value;
        }
    }
    return release;
}

DistroFamily EnvironmentDetector::familyForId(const std::string &id)
{
    const auto matches = [&id](const char *candidate) { return id == candidate; };
    if (std::any_of(kDebianIds.begin(), kDebianIds.end(), matches)) {
        return DistroFamily::Debian;
    }
    if (std::any_of(kFedoraIds.begin(), kFedoraIds.end(), matches)) {
        return DistroFamily::Fedora;
    }
    return DistroFamily::Unknown;
}

KernelVersion EnvironmentDetector::parseKernelVersion(const std::string &release)
{
    KernelVersion kernel;
    kernel.release = trim(release);

    // "6.8.0-45-generic", "6.11.4-301.fc41.x86_64"
    static const std::regex pattern(R"(^(\d{1,6})\.(\d{1,6})(?:\.(\d{1,6}))?)");
    std::smatch match;
    if (!std::regex_search(kernel.release, match, pattern)) {
        return kernel;
    }
    kernel.major = std::stoi(match[1].str());
    kernel.minor = std::stoi(match[2].str());
    kernel.patch = match[3].matched ? std::stoi(match[3].str()) : 0;
    return kernel;
}

std::string EnvironmentDetector::parseGpu(const std::string &lspciOutput)
{
    for (const auto &line : splitLines(lspciOutput)) {
        if (!containsIgnoreCase(line, "nvidia")) {
            continue;
        }
        if (containsIgnoreCase(line, "vga") || containsIgnoreCase(line, "3d")
            || containsIgnoreCase(line, "display")) {
            return trim(line);
        }
    }
    return {};
}

std::string EnvironmentDetector::packageManagerFor(DistroFamily family)
{
    switch (family) {
    case DistroFamily::Debian:
        return "apt-get";
    case DistroFamily::Fedora:
        return m_probe.fileExists("/usr/bin/dnf5") ? "dnf5" : "dnf";
    case DistroFamily::Unknown:
        break;
    }
    return {};
}

std::optional<DriverDescriptor> EnvironmentDetector::repoDriverPackage(DistroFamily family)
{
    if (family == DistroFamily::Debian) {
        const CommandResult listing = m_probe.run("dpkg", {"-l"}, kProbeTimeout);
        if (!listing.succeeded()) {
            return std::nullopt;
        }
        for (const auto &line : splitLines(listing.stdoutText)) {
            const auto fields = splitWhitespace(line);
            if (fields.size() < 3 || fields[0] != "ii") {
                continue;
            }
            const std::string &name = fields[1];
            if (startsWith(name, "nvidia-driver-") && name.find("-open") != std::string::npos) {
                DriverDescriptor driver;
                driver.family = DriverFamily::ProprietaryRepo;
                driver.package = name;
                driver.version = fields[2];
                return driver;
            }
        }
        return std::nullopt;
    }

    if (family == DistroFamily::Fedora) {
        const CommandResult query = m_probe.run(
            "rpm", {"-q", "--queryformat", "%{VERSION}", "akmod-nvidia"}, kProbeTimeout);
        if (!query.succeeded()) {
            return std::nullopt;
        }
        DriverDescriptor driver;
        driver.family = DriverFamily::ProprietaryRepo;
        driver.package = "akmod-nvidia";
        driver.version = trim(query.stdoutText);
        return driver;
    }

    return std::nullopt;
}

DriverDescriptor EnvironmentDetector::detectDriver(DistroFamily family)
{
    const auto repoPackage = repoDriverPackage(family);

    const CommandResult smi = m_probe.run(
        "nvidia-smi", {"--query-gpu=driver_version", "--format=csv,noheader"}, kProbeTimeout);
    if (smi.succeeded()) {
        const auto lines = splitLines(smi.stdoutText);
        const std::string version = lines.empty() ? std::string() : trim(lines.front());
        if (repoPackage.has_value()) {
            DriverDescriptor driver = *repoPackage;
            if (!version.empty()) {
                driver.version = version;
            }
            return driver;
        }
        DriverDescriptor driver;
        driver.family = DriverFamily::ProprietaryRun;
        driver.version = version;
        return driver;
    }

    if (repoPackage.has_value()) {
        return *repoPackage;
    }

    const auto modules = m_probe.readFile("/proc/modules");
    if (modules.has_value()) {
        for (const auto &line : splitLines(*modules)) {
            if (startsWith(line, "nouveau ")) {
                DriverDescriptor driver;
                driver.family = DriverFamily::Nouveau;
                driver.version = "kernel";
                return driver;
            }
        }
    }

    return DriverDescriptor{};
}

EnvironmentSnapshot EnvironmentDetector::detect()
{
    EnvironmentSnapshot snapshot;
    snapshot.detectedAt = std::chrono::system_clock::now();

    const auto osRelease = m_probe.readFile("/etc/os-release");
    if (!osRelease.has_value()) {
        throw DetectionError("cannot read /etc/os-release");
    }
    const OsRelease release = parseOsRelease(*osRelease);
    snapshot.distroId = release.id;
    snapshot.distroName = release.name;
    snapshot.distroFamily = familyForId(release.id);
    if (snapshot.distroFamily == DistroFamily::Unknown) {
        throw DetectionError("unsupported distribution: '" + release.id + "'");
    }

    const CommandResult uname = m_probe.run("uname", {"-r"}, kProbeTimeout);
    snapshot.kernel = parseKernelVersion(uname.succeeded() ? uname.stdoutText : std::string());

    const CommandResult machine = m_probe.run("uname", {"-m"}, kProbeTimeout);
    const std::string arch = machine.succeeded() ? trim(machine.stdoutText) : "x86_64";
    snapshot.architecture = "Linux-" + (arch.empty() ? std::string("x86_64") : arch);

    snapshot.sessionType = parseSessionString(toLower(m_probe.environment("XDG_SESSION_TYPE")));

    const CommandResult sb = m_probe.run("mokutil", {"--sb-state"}, kProbeTimeout);
    snapshot.secureBootEnabled = containsIgnoreCase(sb.stdoutText, "enabled")
        && !containsIgnoreCase(sb.stdoutText, "disabled");

    const CommandResult lspci = m_probe.run("lspci", {}, kProbeTimeout);
    snapshot.gpuIdentifier = parseGpu(lspci.stdoutText);
    if (snapshot.gpuIdentifier.empty()) {
        throw DetectionError("no NVIDIA GPU found");
    }

    snapshot.currentDriver = detectDriver(snapshot.distroFamily);
    snapshot.packageManager = packageManagerFor(snapshot.distroFamily);
    snapshot.networkReachable = m_connectivity.isReachable(m_config.connectivityHost,
                                                           m_config.connectivityPort,
                                                           m_config.connectivityTimeout);

    NVDM_LOG_INFO(QStringLiteral("EnvironmentDetector"),
                  QStringLiteral("detect"),
                  QStringLiteral("environment_detected"),
                  QStringLiteral("orchestration_run"),
                  QStringLiteral("os-release+uname+lspci"),
                  QStringLiteral("system"),
                  logging::currentCorrelationId(),
                  nlohmann::json(snapshot));
    return snapshot;
}

std::string EnvironmentDetector::systemInfo(DistroFamily family, PrivilegedExecutor *executor)
{
    if (!m_probe.fileExists("/usr/bin/inxi")) {
        if (executor == nullptr || m_inxiInstallRequested || family == DistroFamily::Unknown) {
            return {};
        }
        m_inxiInstallRequested = true;

        CommandDescriptor install;
        install.stepId = "install-inxi";
        install.action = StepAction::InstallPackages;
        install.argv = {packageManagerFor(family), "install", "-y", "inxi"};
        install.timeout = m_config.stepTimeout;
        const CommandResult result = executor->runElevated(install);
        if (!result.succeeded()) {
            NVDM_LOG_WARN(QStringLiteral("EnvironmentDetector"),
                          QStringLiteral("systemInfo"),
                          QStringLiteral("inxi_install_failed"),
                          QStringLiteral("system_info_tool_missing"),
                          QStringLiteral("package_manager"),
                          QStringLiteral("system"),
                          logging::currentCorrelationId(),
                          (nlohmann::json{{"exitCode", result.exitCode},
                                          {"stderr", result.stderrText}}));
            return {};
        }
    }

    const CommandResult info = m_probe.run("inxi", {"-Fxz", "-c", "0"}, kInxiTimeout);
    return info.succeeded() ? info.stdoutText : std::string();
}

} // namespace nvdm
