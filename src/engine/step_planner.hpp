#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class SystemProbe;

// Installed packages that belong to the NVIDIA driver stack, by name.
// nvidia-gpu-firmware is kept out because the open driver needs it too.
std::vector<std::string> queryDriverPackages(SystemProbe &probe, DistroFamily family);

/**
 * Turns abstract step descriptors into concrete commands for one
 * environment. Dynamic operands are resolved through the probe at render
 * time; a step may render to zero commands when there is nothing to do.
 */
class StepPlanner {
public:
    StepPlanner(SystemProbe &probe, const EngineConfig &config);

    std::vector<CommandDescriptor> render(const std::vector<StepDescriptor> &steps,
                                          const Strategy &strategy,
                                          const EnvironmentSnapshot &snapshot);
    std::vector<CommandDescriptor> render(const StepDescriptor &step,
                                          const Strategy &strategy,
                                          const EnvironmentSnapshot &snapshot);

    std::string installerFileName(const Strategy &strategy,
                                  const EnvironmentSnapshot &snapshot) const;
    std::string installerCachePath(const Strategy &strategy,
                                   const EnvironmentSnapshot &snapshot) const;
    std::string installerBootPath(const Strategy &strategy,
                                  const EnvironmentSnapshot &snapshot) const;
    std::string installerUrl(const Strategy &strategy,
                             const EnvironmentSnapshot &snapshot) const;

    std::chrono::seconds timeoutFor(TimeoutClass timeout) const;

    // Nonzero exit whose stderr carries one of the command's acceptable
    // markers. Timeouts are never acceptable.
    static bool acceptsFailure(const CommandDescriptor &command, const CommandResult &result);

private:
    std::string substitute(const std::string &operand,
                           const Strategy &strategy,
                           const EnvironmentSnapshot &snapshot);
    std::string fedoraRelease();
    std::vector<std::string> dkmsEntries();
    // Packages of the installed desktop environment, empty when none is known.
    std::vector<std::string> desktopPackages(DistroFamily family);

    SystemProbe &m_probe;
    EngineConfig m_config;
    std::string m_fedoraRelease;
};

} // namespace nvdm
