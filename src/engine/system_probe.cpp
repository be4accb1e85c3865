#include "engine/system_probe.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QStringList>

namespace nvdm {

namespace {

constexpr std::chrono::seconds kProbeTimeout{30};
constexpr int kTimeoutExitCode = 124;
constexpr int kLaunchFailureExitCode = 127;
constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(24);
constexpr std::chrono::milliseconds kTerminateGrace{5000};
constexpr std::chrono::milliseconds kKillWait{2000};

} // namespace

CommandResult runProcess(const std::string &program,
                         const std::vector<std::string> &arguments,
                         const std::string &stdinData,
                         std::chrono::milliseconds timeout)
{
    CommandResult result;

    QStringList args;
    args.reserve(static_cast<int>(arguments.size()));
    for (const auto &arg : arguments) {
        args.push_back(QString::fromStdString(arg));
    }

    QProcess process;
    process.start(QString::fromStdString(program), args);
    if (!process.waitForStarted()) {
        result.exitCode = kLaunchFailureExitCode;
        result.stderrText = process.errorString().toStdString();
        return result;
    }

    if (!stdinData.empty()) {
        process.write(stdinData.data(), static_cast<qint64>(stdinData.size()));
    }
    process.closeWriteChannel();

    const auto bounded = std::clamp(timeout, std::chrono::milliseconds(1), kMaxTimeout);
    if (!process.waitForFinished(static_cast<int>(bounded.count()))) {
        // SIGTERM first so sudo can forward it and the command can clean up.
        process.terminate();
        if (!process.waitForFinished(static_cast<int>(kTerminateGrace.count()))) {
            process.kill();
            process.waitForFinished(static_cast<int>(kKillWait.count()));
        }
        result.exitCode = kTimeoutExitCode;
        result.timedOut = true;
        result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
        result.stderrText = "Timeout";
        return result;
    }

    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
    result.stderrText = QString::fromUtf8(process.readAllStandardError()).toStdString();
    if (process.exitStatus() != QProcess::NormalExit) {
        result.exitCode = process.exitCode() != 0 ? process.exitCode() : 1;
        return result;
    }
    result.exitCode = process.exitCode();
    return result;
}

bool SystemProbe::succeeds(const std::string &program,
                           const std::vector<std::string> &arguments)
{
    return run(program, arguments, kProbeTimeout).succeeded();
}

CommandResult HostSystemProbe::run(const std::string &program,
                                   const std::vector<std::string> &arguments,
                                   std::chrono::milliseconds timeout)
{
    return runProcess(program, arguments, std::string(), timeout);
}

std::optional<std::string> HostSystemProbe::readFile(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

bool HostSystemProbe::fileExists(const std::string &path)
{
    return QFileInfo::exists(QString::fromStdString(path));
}

std::vector<std::string> HostSystemProbe::listDirectory(const std::string &path)
{
    std::vector<std::string> entries;
    const QDir dir(QString::fromStdString(path));
    if (!dir.exists()) {
        return entries;
    }
    const QStringList names = dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &name : names) {
        entries.push_back(name.toStdString());
    }
    return entries;
}

std::optional<std::uint64_t> HostSystemProbe::freeDiskBytes(const std::string &path)
{
    std::error_code error;
    const auto info = std::filesystem::space(path, error);
    if (error) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

std::string HostSystemProbe::environment(const std::string &name)
{
    return qEnvironmentVariable(name.c_str()).toStdString();
}

} // namespace nvdm
