#pragma once

#include <stdexcept>
#include <string>

#include "common/models.hpp"

namespace nvdm {

class NvdmError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Environment facts could not be established.
class DetectionError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

// No valid strategy for the request/environment pair.
class SelectionError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

class UnsupportedKernelError : public SelectionError {
public:
    using SelectionError::SelectionError;
};

class UnsupportedDistributionError : public SelectionError {
public:
    using SelectionError::SelectionError;
};

class PreflightError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

class StepExecutionError : public NvdmError {
public:
    StepExecutionError(const std::string &message,
                       std::string stepId,
                       CommandResult result)
        : NvdmError(message)
        , m_stepId(std::move(stepId))
        , m_result(std::move(result))
    {
    }

    const std::string &stepId() const
    {
        return m_stepId;
    }

    const CommandResult &result() const
    {
        return m_result;
    }

private:
    std::string m_stepId;
    CommandResult m_result;
};

class VerificationError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

class ConcurrentInstallError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

// Raised when the backup cap would be exceeded after an insert. Signals a bug.
class BackupRetentionError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

class DeferredJobPendingError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

class StoreError : public NvdmError {
public:
    using NvdmError::NvdmError;
};

} // namespace nvdm
