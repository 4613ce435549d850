#pragma once

#include <map>
#include <set>
#include <string>

// Steps a previous run already committed, with the durations they took.
struct ResumeState {
    std::set<std::string> done;
    std::map<std::string, double> durations;

    bool contains(const std::string& stepId) const { return done.count(stepId) > 0; }
};

// Append-only record of completed step identifiers, one per line:
//     <step id>[\t<seconds>]
// append() returns only after the line is on stable storage.
class StateJournal {
public:
    static constexpr const char* kBackupJournal = "state.log";
    static constexpr const char* kRestoreJournal = "restore_state.log";

    explicit StateJournal(std::string path);
    virtual ~StateJournal() = default;

    // Missing or empty journals load as an empty state. Duplicates and
    // blank lines are tolerated.
    virtual ResumeState load() const;

    // No-op when the id is already present. Throws OrchestrationError when
    // the entry cannot be made durable.
    virtual void append(const std::string& stepId, double seconds);

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

// Journal-adjacent failure log (<job>/error.log), one line per failure,
// always attributed to a step.
class ErrorLog {
public:
    explicit ErrorLog(std::string path);

    bool append(const std::string& stepId, const std::string& message) const;
    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};
