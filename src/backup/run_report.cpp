#include "backup/run_report.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string toString(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::COMPLETED:      return "completed";
        case StepOutcome::ALREADY_DONE:   return "already done";
        case StepOutcome::DECLINED:       return "declined";
        case StepOutcome::NOT_APPLICABLE: return "not applicable";
        case StepOutcome::SEALED:         return "skipped (job sealed)";
        case StepOutcome::FAILED:         return "failed";
        case StepOutcome::CANCELLED:      return "cancelled";
        default:                          return "unknown";
    }
}

void RunReport::record(StepRecord record) {
    records_.push_back(std::move(record));
}

void RunReport::setVerification(bool success, const std::string& message) {
    verificationRan_ = true;
    verificationSucceeded_ = success;
    verificationMessage_ = message;
}

const StepRecord* RunReport::find(const std::string& stepId) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&stepId](const StepRecord& r) { return r.stepId == stepId; });
    return it != records_.end() ? &*it : nullptr;
}

std::vector<std::string> RunReport::idsWithOutcome(StepOutcome outcome) const {
    std::vector<std::string> ids;
    for (const auto& record : records_) {
        if (record.outcome == outcome) {
            ids.push_back(record.stepId);
        }
    }
    return ids;
}

size_t RunReport::durationEntryCount() const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                             [](const StepRecord& r) { return r.hasDuration; }));
}

double RunReport::totalSeconds() const {
    TimePoint end = finished_ ? endTime_ : std::chrono::system_clock::now();
    return std::chrono::duration<double>(end - startTime_).count();
}

std::string RunReport::render(const std::string& title) const {
    std::ostringstream out;
    out << title << "\n";
    out << "Started: " << utils::formatTime(startTime_) << "\n";
    if (finished_) {
        out << "Finished: " << utils::formatTime(endTime_) << "\n";
    }
    out << "\n";

    out << std::fixed << std::setprecision(1);
    for (const auto& record : records_) {
        out << record.stepId;
        if (!record.description.empty()) {
            out << " (" << record.description << ")";
        }
        out << ": " << toString(record.outcome);
        if (record.hasDuration) {
            out << " in " << record.durationSeconds << " seconds";
        }
        if (!record.detail.empty()) {
            out << " - " << record.detail;
        }
        out << "\n";
    }

    if (verificationRan_) {
        out << "\nVerification: " << (verificationSucceeded_ ? "passed" : "FAILED");
        if (!verificationMessage_.empty()) {
            out << " - " << verificationMessage_;
        }
        out << "\n";
    }
    out << "Total time taken: " << totalSeconds() << " seconds\n";
    return out.str();
}

bool RunReport::writeTo(const std::string& path, const std::string& title) const {
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Failed to open report for writing: " + tmpPath);
            return false;
        }
        file << render(title);
        if (!file) {
            Logger::error("Failed to write report: " + tmpPath);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        Logger::error("Failed to replace report " + path + ": " + ec.message());
        return false;
    }
    return true;
}
