#pragma once

#include <stdexcept>
#include <string>

// Raised before any step runs: missing tools, privileges, disk space,
// malformed configuration or a job directory held by another instance.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

class JobLockedError : public ConfigurationError {
public:
    explicit JobLockedError(const std::string& jobDir)
        : ConfigurationError("Job directory is in use by another instance: " + jobDir)
        , jobDir_(jobDir) {}

    const std::string& jobDir() const { return jobDir_; }

private:
    std::string jobDir_;
};

// Base class for failures raised while a job is running.
class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(const std::string& message)
        : std::runtime_error(message) {}
};

class StepExecutionError : public OrchestrationError {
public:
    StepExecutionError(const std::string& stepId, const std::string& cause)
        : OrchestrationError("Step '" + stepId + "' failed: " + cause)
        , stepId_(stepId)
        , cause_(cause) {}

    const std::string& stepId() const { return stepId_; }
    const std::string& cause() const { return cause_; }

private:
    std::string stepId_;
    std::string cause_;
};

class JobCancelledError : public OrchestrationError {
public:
    explicit JobCancelledError(const std::string& stepId)
        : OrchestrationError(stepId.empty() ? std::string("Job cancelled by operator")
                                            : "Job cancelled by operator during step '" + stepId + "'")
        , stepId_(stepId) {}

    const std::string& stepId() const { return stepId_; }

private:
    std::string stepId_;
};
