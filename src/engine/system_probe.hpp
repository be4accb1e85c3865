#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nvdm {

/**
 * Read-only, unprivileged view of the host. Detection, planning, backup
 * capture and diagnostics only look at the system through this seam.
 */
class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    virtual CommandResult run(const std::string &program,
                              const std::vector<std::string> &arguments,
                              std::chrono::milliseconds timeout) = 0;
    virtual std::optional<std::string> readFile(const std::string &path) = 0;
    virtual bool fileExists(const std::string &path) = 0;
    virtual std::vector<std::string> listDirectory(const std::string &path) = 0;
    virtual std::optional<std::uint64_t> freeDiskBytes(const std::string &path) = 0;
    virtual std::string environment(const std::string &name) = 0;

    // Convenience for probes whose exit status is the only signal.
    bool succeeds(const std::string &program, const std::vector<std::string> &arguments);
};

class HostSystemProbe : public SystemProbe {
public:
    CommandResult run(const std::string &program,
                      const std::vector<std::string> &arguments,
                      std::chrono::milliseconds timeout) override;
    std::optional<std::string> readFile(const std::string &path) override;
    bool fileExists(const std::string &path) override;
    std::vector<std::string> listDirectory(const std::string &path) override;
    std::optional<std::uint64_t> freeDiskBytes(const std::string &path) override;
    std::string environment(const std::string &name) override;
};

// Shared QProcess driver used by the host probe and the privileged executor.
// The timeout is clamped to [1 ms, 24 h]. On expiry the process gets SIGTERM
// and, if still running after a grace period, SIGKILL.
CommandResult runProcess(const std::string &program,
                         const std::vector<std::string> &arguments,
                         const std::string &stdinData,
                         std::chrono::milliseconds timeout);

} // namespace nvdm
