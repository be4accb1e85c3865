#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nvdm {

class SystemProbe;

struct ErrorReportInput {
    std::string runId;
    std::string reason;
    std::optional<EnvironmentSnapshot> environment;
    std::optional<Strategy> strategy;
    std::string failedStepId;
    CommandResult failedStepOutput;
    std::vector<CommandDescriptor> executedCommands;
    std::int64_t backupId = 0;
};

// Writes logs/errors/error-report-<timestamp>.json for one failed run.
class ErrorReporter {
public:
    explicit ErrorReporter(SystemProbe &probe);

    // Returns the report path, or an empty string when it could not be written.
    std::string write(const ErrorReportInput &input);

private:
    SystemProbe &m_probe;
};

} // namespace nvdm
