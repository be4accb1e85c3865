#include "engine/diagnostics_collector.hpp"

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "engine/deferred_installer.hpp"
#include "engine/environment_detector.hpp"
#include "engine/state_store.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::chrono::seconds kQueryTimeout{30};
constexpr std::size_t kMaxBackupsListed = 10;

} // namespace

DiagnosticsCollector::DiagnosticsCollector(SystemProbe &probe,
                                           EnvironmentDetector &detector,
                                           StateStore &store,
                                           const DeferredInstaller &deferred)
    : m_probe(probe)
    , m_detector(detector)
    , m_store(store)
    , m_deferred(deferred)
{
}

DiagnosticsReport DiagnosticsCollector::collect(OrchestratorState orchestratorState)
{
    DiagnosticsReport report;
    report.generatedAt = std::chrono::system_clock::now();
    report.orchestratorState = orchestratorState;

    try {
        report.environment = m_detector.detect();
    } catch (const DetectionError &error) {
        report.detectionError = error.what();
    }

    report.backups = m_store.listBackups();
    if (report.backups.size() > kMaxBackupsListed) {
        report.backups.resize(kMaxBackupsListed);
    }
    report.lastInstall = m_store.lastHistory();
    report.deferredJob = m_deferred.checkCompletion();

    report.dkmsStatus = dkmsStatus();
    report.loadedModules = loadedModules();
    report.driverSources = driverSources();

    std::string kernelRelease;
    if (report.environment.has_value()) {
        kernelRelease = report.environment->kernel.release;
    } else {
        kernelRelease = trim(m_probe.run("uname", {"-r"}, kQueryTimeout).stdoutText);
    }
    if (!kernelRelease.empty()) {
        report.kernelModules = kernelModules(kernelRelease);
    }

    if (report.environment.has_value() && report.environment->secureBootEnabled) {
        report.advice.push_back(
            "Secure Boot is enabled: unsigned NVIDIA kernel modules will not load. "
            "Enroll a Machine Owner Key (mokutil --import) or disable Secure Boot.");
    }
    if (report.deferredJob.state == JobState::Pending) {
        report.advice.push_back("A deferred install is waiting for the next reboot.");
    } else if (report.deferredJob.state == JobState::Completed && !report.deferredJob.succeeded()) {
        report.advice.push_back("The last boot-time install failed; see "
                                + report.deferredJob.job->logPath + ".");
    }
    if (!report.dkmsStatus.empty() && report.kernelModules.empty()) {
        report.advice.push_back(
            "DKMS knows an NVIDIA module but none is built for the running kernel.");
    }

    NVDM_LOG_INFO(QStringLiteral("DiagnosticsCollector"),
                  QStringLiteral("collect"),
                  QStringLiteral("diagnostics_collected"),
                  QStringLiteral("user_request"),
                  QStringLiteral("read_only_probe"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"backups", report.backups.size()},
                                  {"kernelModules", report.kernelModules.size()},
                                  {"detectionError", report.detectionError}}));
    return report;
}

std::vector<std::string> DiagnosticsCollector::dkmsStatus()
{
    std::vector<std::string> lines;
    const CommandResult result = m_probe.run("dkms", {"status"}, kQueryTimeout);
    if (!result.succeeded()) {
        return lines;
    }
    for (const auto &line : splitLines(result.stdoutText)) {
        if (containsIgnoreCase(line, "nvidia")) {
            lines.push_back(trim(line));
        }
    }
    return lines;
}

std::vector<std::string> DiagnosticsCollector::kernelModules(const std::string &kernelRelease)
{
    std::vector<std::string> modules;
    const CommandResult result = m_probe.run(
        "find", {"/lib/modules/" + kernelRelease, "-name", "nvidia*.ko*"}, kQueryTimeout);
    for (const auto &line : splitLines(result.stdoutText)) {
        const std::string path = trim(line);
        if (!path.empty()) {
            modules.push_back(path);
        }
    }
    return modules;
}

std::vector<std::string> DiagnosticsCollector::loadedModules()
{
    std::vector<std::string> modules;
    const auto text = m_probe.readFile("/proc/modules");
    if (!text.has_value()) {
        return modules;
    }
    for (const auto &line : splitLines(*text)) {
        if (startsWith(line, "nvidia") || startsWith(line, "nouveau")) {
            modules.push_back(line.substr(0, line.find(' ')));
        }
    }
    return modules;
}

std::vector<std::string> DiagnosticsCollector::driverSources()
{
    std::vector<std::string> sources;
    for (const auto &entry : m_probe.listDirectory("/usr/src")) {
        if (startsWith(entry, "nvidia")) {
            sources.push_back("/usr/src/" + entry);
        }
    }
    return sources;
}

bool DiagnosticsCollector::writeJson(const DiagnosticsReport &report, const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        NVDM_LOG_WARN(QStringLiteral("DiagnosticsCollector"),
                      QStringLiteral("writeJson"),
                      QStringLiteral("report_write_failed"),
                      file.errorString(),
                      QStringLiteral("qfile"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"path", path}}));
        return false;
    }
    const std::string text = nlohmann::json(report).dump(2);
    return file.write(text.data(), static_cast<qint64>(text.size()))
        == static_cast<qint64>(text.size());
}

} // namespace nvdm
