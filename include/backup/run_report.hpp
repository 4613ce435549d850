#pragma once

#include <chrono>
#include <string>
#include <vector>

enum class StepOutcome {
    COMPLETED,
    ALREADY_DONE,
    DECLINED,
    NOT_APPLICABLE,
    SEALED,
    FAILED,
    CANCELLED
};

std::string toString(StepOutcome outcome);

struct StepRecord {
    std::string stepId;
    std::string description;
    StepOutcome outcome{StepOutcome::COMPLETED};
    bool hasDuration{false};
    double durationSeconds{0.0};
    std::string detail;
};

class RunReport {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    void begin(TimePoint start) { startTime_ = start; }
    void finish(TimePoint end) { endTime_ = end; finished_ = true; }

    void record(StepRecord record);
    void setVerification(bool success, const std::string& message);

    const std::vector<StepRecord>& records() const { return records_; }
    const StepRecord* find(const std::string& stepId) const;
    std::vector<std::string> idsWithOutcome(StepOutcome outcome) const;
    size_t durationEntryCount() const;

    bool verificationRan() const { return verificationRan_; }
    bool verificationSucceeded() const { return verificationSucceeded_; }
    const std::string& verificationMessage() const { return verificationMessage_; }

    TimePoint getStartTime() const { return startTime_; }
    TimePoint getEndTime() const { return endTime_; }
    double totalSeconds() const;

    std::string render(const std::string& title) const;

    // Replaces the file atomically with the rendered report.
    bool writeTo(const std::string& path, const std::string& title) const;

private:
    std::vector<StepRecord> records_;
    TimePoint startTime_{};
    TimePoint endTime_{};
    bool finished_{false};
    bool verificationRan_{false};
    bool verificationSucceeded_{false};
    std::string verificationMessage_;
};
