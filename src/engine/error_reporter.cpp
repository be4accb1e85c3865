#include "engine/error_reporter.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "common/string_utils.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::chrono::seconds kExtrasTimeout{15};

} // namespace

ErrorReporter::ErrorReporter(SystemProbe &probe)
    : m_probe(probe)
{
}

std::string ErrorReporter::write(const ErrorReportInput &input)
{
    nlohmann::json report;
    report["generatedAt"] = toIso8601Utc(std::chrono::system_clock::now());
    report["runId"] = input.runId;
    report["reason"] = input.reason;
    report["backupId"] = input.backupId;
    report["environment"] = input.environment.has_value() ? nlohmann::json(*input.environment)
                                                          : nlohmann::json();
    report["strategy"] = input.strategy.has_value() ? nlohmann::json(*input.strategy)
                                                    : nlohmann::json();
    report["failedStep"] = {
        {"id", input.failedStepId},
        {"result", input.failedStepOutput},
    };

    nlohmann::json executed = nlohmann::json::array();
    for (const auto &command : input.executedCommands) {
        executed.push_back({{"step", command.stepId}, {"command", command.commandLine()}});
    }
    report["executedCommands"] = executed;

    nlohmann::json dkms = nlohmann::json::array();
    const CommandResult dkmsStatus = m_probe.run("dkms", {"status"}, kExtrasTimeout);
    if (dkmsStatus.succeeded()) {
        for (const auto &line : splitLines(dkmsStatus.stdoutText)) {
            if (containsIgnoreCase(line, "nvidia")) {
                dkms.push_back(trim(line));
            }
        }
    }
    report["dkmsStatus"] = dkms;

    nlohmann::json modules = nlohmann::json::array();
    if (const auto loaded = m_probe.readFile("/proc/modules"); loaded.has_value()) {
        for (const auto &line : splitLines(*loaded)) {
            if (startsWith(line, "nvidia") || startsWith(line, "nouveau")) {
                modules.push_back(line.substr(0, line.find(' ')));
            }
        }
    }
    report["loadedModules"] = modules;

    const QString dir = errorReportsDirPath();
    QDir().mkpath(dir);
    const QString path = dir + QStringLiteral("/error-report-")
        + QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMdd-HHmmss-zzz"))
        + QStringLiteral(".json");

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        NVDM_LOG_ERROR(QStringLiteral("ErrorReporter"),
                       QStringLiteral("write"),
                       QStringLiteral("error_report_write_failed"),
                       QString::fromStdString(input.reason),
                       QStringLiteral("qfile"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"path", path.toStdString()},
                                       {"error", file.errorString().toStdString()}}));
        return {};
    }
    const std::string text = report.dump(2);
    file.write(text.data(), static_cast<qint64>(text.size()));
    file.close();

    NVDM_LOG_INFO(QStringLiteral("ErrorReporter"),
                  QStringLiteral("write"),
                  QStringLiteral("error_report_written"),
                  QString::fromStdString(input.reason),
                  QStringLiteral("qfile"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"path", path.toStdString()}}));
    return path.toStdString();
}

} // namespace nvdm
