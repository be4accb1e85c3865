#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nvdm {

/**
 * Runs one command at a time with elevated rights. Implementations must
 * report every failure through the returned CommandResult; a timeout is a
 * failure with timedOut set.
 */
class PrivilegedExecutor {
public:
    virtual ~PrivilegedExecutor() = default;

    virtual CommandResult runElevated(const CommandDescriptor &command) = 0;
};

class PasswordPrompt {
public:
    virtual ~PasswordPrompt() = default;

    virtual std::optional<std::string> askPassword(const std::string &prompt) = 0;
};

// Reads a password from the controlling terminal with echo disabled.
class TerminalPasswordPrompt : public PasswordPrompt {
public:
    std::optional<std::string> askPassword(const std::string &prompt) override;
};

struct SudoInvocation {
    std::string program;
    std::vector<std::string> args;
    std::string input;
};

// `sudo -k -S` for a password-authenticated command. -k makes sudo read the
// password line on every call, so the first stdin line never reaches the
// command even while a credential timestamp is cached.
SudoInvocation passwordSudoInvocation(const std::string &password,
                                      const CommandDescriptor &command);

// sudo-backed executor. Uses cached credentials when `sudo -n` works and
// otherwise asks once through the prompt, then feeds the password with -S.
class SudoExecutor : public PrivilegedExecutor {
public:
    explicit SudoExecutor(PasswordPrompt &prompt);
    ~SudoExecutor() override;

    SudoExecutor(const SudoExecutor &) = delete;
    SudoExecutor &operator=(const SudoExecutor &) = delete;

    // Establishes credentials up front so the first step does not prompt.
    bool ensureCredentials();

    CommandResult runElevated(const CommandDescriptor &command) override;

private:
    enum class Mode {
        Unknown,
        Root,
        CachedCredentials,
        Password,
        Refused
    };

    PasswordPrompt &m_prompt;
    Mode m_mode = Mode::Unknown;
    std::string m_password;
};

} // namespace nvdm
