#include "engine/deferred_installer.hpp"

#include <sstream>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "common/string_utils.hpp"
#include "engine/privileged_executor.hpp"
#include "engine/state_store.hpp"
#include "engine/step_planner.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr const char *kExecutionContext = "systemd oneshot before display-manager.service";
constexpr const char *kScriptName = "nvdm-deferred-install.sh";
constexpr std::size_t kLogTailLines = 20;

const std::vector<std::string> kMissingUnitMarkers = {"not loaded", "does not exist"};
const std::vector<std::string> kMissingPathMarkers = {"No such file or directory"};

std::string dirName(const std::string &path)
{
    const auto slash = path.rfind('/');
    return slash == std::string::npos || slash == 0 ? std::string("/") : path.substr(0, slash);
}

std::string baseName(const std::string &path)
{
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

constexpr const char *kScriptPrelude = R"SH(
mkdir -p "$(dirname "$LOG")" "$(dirname "$MARKER")"

log() {
    local line
    line="[$(date '+%Y-%m-%d %H:%M:%S')] [$1] $2"
    echo "$line" >> "$LOG"
    echo "$line" > /dev/console 2>/dev/null || true
}

finish() {
    local code=$?
    {
        echo "completed=1"
        echo "exitCode=$code"
        echo "finishedAt=$(date -u '+%Y-%m-%dT%H:%M:%SZ')"
        echo "strategy=$STRATEGY"
    } > "$MARKER"
    chmod 644 "$MARKER" "$LOG" 2>/dev/null || true
    if [ "$code" -eq 0 ]; then
        log INFO "deferred install finished"
    else
        log ERROR "deferred install failed with exit code $code"
    fi
}
trap finish EXIT

# run_step <id> <marker-count> [markers...] <command...>
run_step() {
    local id="$1" count="$2"
    shift 2
    local markers=()
    while [ "$count" -gt 0 ]; do
        markers+=(-e "$1")
        shift
        count=$((count - 1))
    done
    log INFO "step $id: $*"
    local err rc
    err=$(mktemp)
    "$@" >> "$LOG" 2> "$err"
    rc=$?
    cat "$err" >> "$LOG"
    if [ "$rc" -ne 0 ] && [ "${#markers[@]}" -gt 0 ] && grep -qF "${markers[@]}" "$err"; then
        log WARN "step $id: exit code $rc accepted"
        rc=0
    fi
    rm -f "$err"
    if [ "$rc" -ne 0 ]; then
        log ERROR "step $id failed with exit code $rc"
        exit "$rc"
    fi
}

# Run exactly once, even if a step reboots or hangs.
systemctl disable "$UNIT" >> "$LOG" 2>&1 || true

log INFO "stopping display managers"
for dm in display-manager sddm gdm3 gdm lightdm lxdm; do
    systemctl stop "$dm.service" >> "$LOG" 2>&1 || true
done
modprobe -r nouveau >> "$LOG" 2>&1 || true
)SH";

constexpr const char *kScriptEpilogue = R"SH(
# xorg.conf written by --run-nvidia-xconfig while headless pins a low resolution.
if [ -f /etc/X11/xorg.conf ]; then
    cp /etc/X11/xorg.conf /etc/X11/xorg.conf.nvdm-boot-backup
    rm -f /etc/X11/xorg.conf
    log INFO "removed headless xorg.conf"
fi

log INFO "rebooting in 5 seconds"
sleep 5
reboot
)SH";

} // namespace

DeferredInstaller::DeferredInstaller(StateStore &store,
                                     SystemProbe &probe,
                                     PrivilegedExecutor &executor,
                                     const EngineConfig &config)
    : m_store(store)
    , m_probe(probe)
    , m_executor(executor)
    , m_config(config)
{
}

std::string DeferredInstaller::systemScriptPath() const
{
    return m_config.system.scriptDir + "/" + kScriptName;
}

std::string DeferredInstaller::renderUnit() const
{
    std::ostringstream unit;
    unit << "[Unit]\n"
         << "Description=nvdm deferred NVIDIA driver install\n"
         << "DefaultDependencies=no\n"
         << "Before=display-manager.service\n"
         << "After=local-fs.target systemd-udev-settle.service\n"
         << "Wants=systemd-udev-settle.service\n"
         << "\n"
         << "[Service]\n"
         << "Type=oneshot\n"
         << "ExecStart=/bin/bash " << systemScriptPath() << "\n"
         << "StandardOutput=tty\n"
         << "StandardError=tty\n"
         << "TTYPath=/dev/console\n"
         << "TTYReset=yes\n"
         << "RemainAfterExit=no\n"
         << "TimeoutStartSec=900\n"
         << "User=root\n"
         << "Environment=HOME=/root\n"
         << "\n"
         << "[Install]\n"
         << "WantedBy=multi-user.target\n";
    return unit.str();
}

std::string DeferredInstaller::buildInstallScript(const Strategy &strategy,
                                                  const std::vector<CommandDescriptor> &bootCommands) const
{
    std::ostringstream script;
    script << "#!/bin/bash\n"
           << "# nvdm deferred install: " << toStrategyString(strategy.kind)
           << " " << strategy.targetVersion << "\n"
           << "LOG=" << shellQuote(m_config.system.logPath) << "\n"
           << "MARKER=" << shellQuote(m_config.system.markerPath) << "\n"
           << "UNIT=" << shellQuote(m_config.system.unitName) << "\n"
           << "STRATEGY=" << shellQuote(toStrategyString(strategy.kind)) << "\n"
           << kScriptPrelude
           << "\n"
           << "log INFO " << shellQuote("starting " + toStrategyString(strategy.kind) + " "
                                        + strategy.targetVersion)
           << "\n";

    for (const auto &command : bootCommands) {
        script << "run_step " << shellQuote(command.stepId) << " "
               << command.acceptableStderr.size();
        for (const auto &marker : command.acceptableStderr) {
            script << " " << shellQuote(marker);
        }
        script << " " << command.commandLine();
        if (!command.stdinData.empty()) {
            script << " < <(printf '%s' " << shellQuote(command.stdinData) << ")";
        }
        script << "\n";
    }

    script << kScriptEpilogue;
    return script.str();
}

std::string DeferredInstaller::writeStagedScript(const Strategy &strategy,
                                                 const std::string &content) const
{
    const QString dir = stagedScriptsDirPath();
    if (!QDir().mkpath(dir)) {
        throw PreflightError("cannot create " + dir.toStdString());
    }
    const QString path = dir + QStringLiteral("/") + QString::fromStdString(
        "install-" + toStrategyString(strategy.kind) + ".sh");

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw PreflightError("cannot write staged script " + path.toStdString());
    }
    file.write(content.data(), static_cast<qint64>(content.size()));
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
                        | QFileDevice::ReadGroup | QFileDevice::ReadOther);
    return path.toStdString();
}

CommandDescriptor DeferredInstaller::command(const std::string &stepId,
                                             std::vector<std::string> argv) const
{
    CommandDescriptor descriptor;
    descriptor.stepId = stepId;
    descriptor.action = StepAction::WriteConfigFile;
    descriptor.argv = std::move(argv);
    descriptor.timeout = m_config.shortStepTimeout;
    return descriptor;
}

void DeferredInstaller::runOrThrow(const CommandDescriptor &descriptor)
{
    const CommandResult result = m_executor.runElevated(descriptor);
    if (!result.succeeded() && !StepPlanner::acceptsFailure(descriptor, result)) {
        throw StepExecutionError("staging step " + descriptor.stepId + " failed",
                                 descriptor.stepId, result);
    }
}

std::vector<CommandDescriptor> DeferredInstaller::teardownCommands(const std::string &prefix,
                                                                  const std::string &unitPath) const
{
    const std::string &scriptDir = m_config.system.scriptDir;
    std::vector<CommandDescriptor> commands;

    CommandDescriptor disable = command(prefix + "-disable-unit",
                                        {"systemctl", "disable", m_config.system.unitName});
    disable.acceptableStderr = kMissingUnitMarkers;
    commands.push_back(disable);
    commands.push_back(command(prefix + "-remove-unit", {"rm", "-f", unitPath}));
    commands.push_back(command(prefix + "-remove-scripts", {"rm", "-f", systemScriptPath()}));

    // Only files staging put there; the directory itself goes only when empty.
    CommandDescriptor payloads = command(prefix + "-remove-payloads",
                                         {"find", scriptDir, "-maxdepth", "1", "-type", "f",
                                          "-name", "NVIDIA-*.run", "-delete"});
    payloads.acceptableStderr = kMissingPathMarkers;
    commands.push_back(payloads);
    CommandDescriptor dir = command(prefix + "-remove-script-dir",
                                    {"rmdir", "--ignore-fail-on-non-empty", scriptDir});
    dir.acceptableStderr = kMissingPathMarkers;
    commands.push_back(dir);

    commands.push_back(command(prefix + "-daemon-reload", {"systemctl", "daemon-reload"}));
    return commands;
}

void DeferredInstaller::rollbackStaging(const std::string &reason)
{
    NVDM_LOG_WARN(QStringLiteral("DeferredInstaller"),
                  QStringLiteral("rollbackStaging"),
                  QStringLiteral("staging_rolled_back"),
                  QStringLiteral("staging_failed"),
                  QStringLiteral("remove_partial_unit"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"error", reason}}));

    for (const auto &descriptor : teardownCommands("rollback", m_config.system.unitPath)) {
        CommandResult result;
        try {
            result = m_executor.runElevated(descriptor);
        } catch (const std::exception &ex) {
            result.exitCode = -1;
            result.stderrText = ex.what();
        }
        if (!result.succeeded() && !StepPlanner::acceptsFailure(descriptor, result)) {
            NVDM_LOG_ERROR(QStringLiteral("DeferredInstaller"),
                           QStringLiteral("rollbackStaging"),
                           QStringLiteral("rollback_step_failed"),
                           QStringLiteral("nonzero_exit"),
                           QStringLiteral("continue_rollback"),
                           logging::defaultWho(),
                           logging::currentCorrelationId(),
                           (nlohmann::json{{"step", descriptor.stepId},
                                           {"exitCode", result.exitCode},
                                           {"stderr", result.stderrText}}));
        }
    }
}

DeferredInstallJob DeferredInstaller::stage(const StageRequest &request)
{
    if (const auto pending = m_store.pendingDeferredJob(); pending.has_value()) {
        throw DeferredJobPendingError("deferred install #" + std::to_string(pending->id)
                                      + " is already pending; cancel it first");
    }
    if (!QFileInfo::exists(QString::fromStdString(request.scriptPath))) {
        throw PreflightError("staged script " + request.scriptPath + " does not exist");
    }

    const SystemLocations &system = m_config.system;
    const std::string target = systemScriptPath();

    std::vector<CommandDescriptor> commands;
    commands.push_back(command("stage-create-dir", {"install", "-d", "-m", "755", system.scriptDir}));
    commands.push_back(command("stage-copy-script",
                               {"install", "-m", "755", request.scriptPath, target}));
    for (const auto &payload : request.payloads) {
        commands.push_back(command("stage-copy-payload",
                                   {"install", "-m", "755", payload,
                                    system.scriptDir + "/" + baseName(payload)}));
    }
    commands.push_back(command("stage-marker-dir",
                               {"install", "-d", "-m", "755", dirName(system.markerPath)}));
    commands.push_back(command("stage-clear-marker", {"rm", "-f", system.markerPath}));

    CommandDescriptor unit = command("stage-write-unit", {"tee", system.unitPath});
    unit.stdinData = renderUnit();
    commands.push_back(unit);
    commands.push_back(command("stage-unit-mode", {"chmod", "644", system.unitPath}));
    if (request.distroFamily == DistroFamily::Fedora) {
        commands.push_back(command("stage-selinux-label", {"restorecon", "-R", system.scriptDir}));
    }
    commands.push_back(command("stage-daemon-reload", {"systemctl", "daemon-reload"}));
    commands.push_back(command("stage-enable-unit", {"systemctl", "enable", system.unitName}));

    try {
        for (const auto &descriptor : commands) {
            runOrThrow(descriptor);
        }
    } catch (const std::exception &ex) {
        rollbackStaging(ex.what());
        throw;
    }

    DeferredInstallJob job;
    job.stagedScriptPath = request.scriptPath;
    job.systemScriptPath = target;
    job.unitPath = system.unitPath;
    job.executionContext = kExecutionContext;
    job.createdAt = std::chrono::system_clock::now();
    job.logPath = system.logPath;
    job.markerPath = system.markerPath;
    job.strategy = request.strategy;
    job.historyId = request.historyId;

    DeferredInstallJob stored;
    try {
        stored = m_store.insertDeferredJob(job);
    } catch (const std::exception &ex) {
        rollbackStaging(ex.what());
        throw;
    }
    NVDM_LOG_INFO(QStringLiteral("DeferredInstaller"),
                  QStringLiteral("stage"),
                  QStringLiteral("deferred_job_staged"),
                  QStringLiteral("requires_reboot"),
                  QStringLiteral("systemd_oneshot"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  nlohmann::json(stored));
    return stored;
}

std::map<std::string, std::string> DeferredInstaller::parseMarker(const std::string &text)
{
    std::map<std::string, std::string> values;
    for (const auto &line : splitLines(text)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return values;
}

JobStatus DeferredInstaller::checkCompletion() const
{
    JobStatus status;
    auto job = m_store.pendingDeferredJob();
    if (!job.has_value()) {
        job = m_store.latestDeferredJob();
    }
    if (!job.has_value()) {
        return status;
    }
    status.job = job;
    status.state = job->completed ? JobState::Completed : JobState::Pending;

    if (const auto marker = m_probe.readFile(job->markerPath); marker.has_value()) {
        const auto values = parseMarker(*marker);
        const auto completed = values.find("completed");
        if (completed != values.end() && completed->second == "1") {
            status.state = JobState::Completed;
            const auto code = values.find("exitCode");
            if (code != values.end()) {
                try {
                    status.exitCode = std::stoi(code->second);
                } catch (const std::exception &) {
                    status.exitCode = -1;
                }
            }
            const auto finished = values.find("finishedAt");
            if (finished != values.end()) {
                status.finishedAt = fromIso8601Utc(finished->second);
            }
        }
    }

    if (const auto log = m_probe.readFile(job->logPath); log.has_value()) {
        const auto lines = splitLines(*log);
        const std::size_t first = lines.size() > kLogTailLines ? lines.size() - kLogTailLines : 0;
        status.logTail.assign(lines.begin() + static_cast<std::ptrdiff_t>(first), lines.end());
    }
    return status;
}

bool DeferredInstaller::cancel()
{
    const auto pending = m_store.pendingDeferredJob();
    if (!pending.has_value()) {
        return false;
    }

    for (const auto &descriptor : teardownCommands("cancel", pending->unitPath)) {
        runOrThrow(descriptor);
    }

    m_store.deleteDeferredJob(pending->id);
    QFile::remove(QString::fromStdString(pending->stagedScriptPath));

    NVDM_LOG_INFO(QStringLiteral("DeferredInstaller"),
                  QStringLiteral("cancel"),
                  QStringLiteral("deferred_job_cancelled"),
                  QStringLiteral("user_request"),
                  QStringLiteral("systemd_disable"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"jobId", pending->id}}));
    return true;
}

} // namespace nvdm
