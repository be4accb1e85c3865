#include "engine/privileged_executor.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr int kMaxPasswordAttempts = 3;
constexpr std::chrono::seconds kValidateTimeout{30};
constexpr int kRefusedExitCode = 126;

} // namespace

SudoInvocation passwordSudoInvocation(const std::string &password,
                                      const CommandDescriptor &command)
{
    SudoInvocation invocation;
    invocation.program = "sudo";
    invocation.args = {"-k", "-S", "-p", "", "--"};
    invocation.args.insert(invocation.args.end(), command.argv.begin(), command.argv.end());
    invocation.input = password + "\n" + command.stdinData;
    return invocation;
}

std::optional<std::string> TerminalPasswordPrompt::askPassword(const std::string &prompt)
{
    const int fd = ::open("/dev/tty", O_RDWR | O_NOCTTY);
    if (fd < 0) {
        return std::nullopt;
    }

    termios original{};
    if (tcgetattr(fd, &original) != 0) {
        ::close(fd);
        return std::nullopt;
    }

    const std::string text = prompt + ": ";
    if (::write(fd, text.data(), text.size()) < 0) {
        ::close(fd);
        return std::nullopt;
    }

    termios silent = original;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(fd, TCSAFLUSH, &silent);

    std::string password;
    char c = 0;
    bool gotNewline = false;
    while (::read(fd, &c, 1) == 1) {
        if (c == '\n' || c == '\r') {
            gotNewline = true;
            break;
        }
        password.push_back(c);
    }

    tcsetattr(fd, TCSAFLUSH, &original);
    const char newline = '\n';
    if (::write(fd, &newline, 1) < 0) {
        // Prompt cosmetics only.
    }
    ::close(fd);

    if (!gotNewline && password.empty()) {
        return std::nullopt;
    }
    return password;
}

SudoExecutor::SudoExecutor(PasswordPrompt &prompt)
    : m_prompt(prompt)
{
}

SudoExecutor::~SudoExecutor()
{
    std::fill(m_password.begin(), m_password.end(), '\0');
}

bool SudoExecutor::ensureCredentials()
{
    if (m_mode == Mode::Root || m_mode == Mode::CachedCredentials
        || m_mode == Mode::Password) {
        return true;
    }

    if (geteuid() == 0) {
        m_mode = Mode::Root;
        return true;
    }

    if (runProcess("sudo", {"-n", "true"}, std::string(), kValidateTimeout).succeeded()) {
        m_mode = Mode::CachedCredentials;
        NVDM_LOG_INFO(QStringLiteral("SudoExecutor"),
                      QStringLiteral("ensureCredentials"),
                      QStringLiteral("sudo_cached"),
                      QStringLiteral("privileged_step"),
                      QStringLiteral("sudo_-n"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json::object());
        return true;
    }

    for (int attempt = 1; attempt <= kMaxPasswordAttempts; ++attempt) {
        const auto password = m_prompt.askPassword("[nvdm] sudo password");
        if (!password.has_value()) {
            break;
        }

        const CommandResult check = runProcess(
            "sudo", {"-S", "-p", "", "-v"}, *password + "\n", kValidateTimeout);
        if (check.succeeded()) {
            m_password = *password;
            m_mode = Mode::Password;
            NVDM_LOG_INFO(QStringLiteral("SudoExecutor"),
                          QStringLiteral("ensureCredentials"),
                          QStringLiteral("sudo_granted"),
                          QStringLiteral("privileged_step"),
                          QStringLiteral("terminal_prompt"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"attempt", attempt}}));
            return true;
        }

        NVDM_LOG_WARN(QStringLiteral("SudoExecutor"),
                      QStringLiteral("ensureCredentials"),
                      QStringLiteral("sudo_wrong_password"),
                      QStringLiteral("validation_failed"),
                      QStringLiteral("terminal_prompt"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"attempt", attempt}}));
    }

    m_mode = Mode::Refused;
    NVDM_LOG_ERROR(QStringLiteral("SudoExecutor"),
                   QStringLiteral("ensureCredentials"),
                   QStringLiteral("sudo_refused"),
                   QStringLiteral("no_credentials"),
                   QStringLiteral("terminal_prompt"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    return false;
}

CommandResult SudoExecutor::runElevated(const CommandDescriptor &command)
{
    CommandResult result;
    if (command.argv.empty()) {
        result.exitCode = kRefusedExitCode;
        result.stderrText = "empty command";
        return result;
    }

    if (!ensureCredentials()) {
        result.exitCode = kRefusedExitCode;
        result.stderrText = "privilege elevation refused";
        return result;
    }

    NVDM_LOG_DEBUG(QStringLiteral("SudoExecutor"),
                   QStringLiteral("runElevated"),
                   QStringLiteral("elevated_command"),
                   QStringLiteral("strategy_step"),
                   QStringLiteral("sudo"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"step", command.stepId},
                                   {"command", command.commandLine()}}));

    std::string program;
    std::vector<std::string> args;
    std::string input = command.stdinData;
    switch (m_mode) {
    case Mode::Root:
        program = command.argv.front();
        args.assign(command.argv.begin() + 1, command.argv.end());
        break;
    case Mode::CachedCredentials:
        program = "sudo";
        args = {"-n", "--"};
        args.insert(args.end(), command.argv.begin(), command.argv.end());
        break;
    case Mode::Password: {
        SudoInvocation invocation = passwordSudoInvocation(m_password, command);
        program = std::move(invocation.program);
        args = std::move(invocation.args);
        input = std::move(invocation.input);
        break;
    }
    case Mode::Unknown:
    case Mode::Refused:
        result.exitCode = kRefusedExitCode;
        result.stderrText = "privilege elevation refused";
        return result;
    }

    result = runProcess(program, args, input,
                        std::chrono::duration_cast<std::chrono::milliseconds>(command.timeout));
    if (!result.succeeded()) {
        NVDM_LOG_WARN(QStringLiteral("SudoExecutor"),
                      QStringLiteral("runElevated"),
                      QStringLiteral("elevated_command_failed"),
                      result.timedOut ? QStringLiteral("timeout") : QStringLiteral("nonzero_exit"),
                      QStringLiteral("sudo"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"step", command.stepId},
                                      {"exitCode", result.exitCode},
                                      {"stderr", result.stderrText}}));
    }
    return result;
}

} // namespace nvdm
