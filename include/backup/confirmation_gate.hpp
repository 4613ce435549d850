#pragma once

#include "backup/step.hpp"
#include <deque>
#include <iosfwd>
#include <memory>
#include <set>
#include <string>
#include <vector>

enum class Decision {
    YES,
    NO,
    YES_TO_ALL
};

std::string toString(Decision decision);

// Per-run confirmation state, passed by value into the orchestrator.
struct ConfirmationPolicy {
    bool allRemaining{false};
    bool yesToAllCoversDestructive{false};

    bool covers(const Step& step) const {
        return allRemaining && (!step.destructive || yesToAllCoversDestructive);
    }
};

class ConfirmationGate {
public:
    virtual ~ConfirmationGate() = default;

    virtual Decision ask(const std::string& prompt) = 0;

    // Secondary confirmation for irreversible writes: true only when the
    // operator names the exact target.
    virtual bool confirmTarget(const std::string& prompt, const std::string& target) = 0;

    virtual std::string askText(const std::string& prompt) = 0;
};

// Interactive gate. "(Y/n/A, default is Y)", Enter accepts.
class ConsoleConfirmationGate : public ConfirmationGate {
public:
    ConsoleConfirmationGate(std::istream& in, std::ostream& out);

    Decision ask(const std::string& prompt) override;
    bool confirmTarget(const std::string& prompt, const std::string& target) override;
    std::string askText(const std::string& prompt) override;

    // Maps one line of operator input; false when the input is not an answer.
    static bool parseDecision(const std::string& input, Decision& decision);

private:
    std::istream& in_;
    std::ostream& out_;
};

// Non-interactive gate replaying a fixed script. Once a script runs out the
// gate answers NO, refuses targets and returns empty text.
class ScriptedConfirmationGate : public ConfirmationGate {
public:
    explicit ScriptedConfirmationGate(std::vector<Decision> decisions,
                                      std::vector<bool> targetConfirmations = {},
                                      std::vector<std::string> textAnswers = {});

    Decision ask(const std::string& prompt) override;
    bool confirmTarget(const std::string& prompt, const std::string& target) override;
    std::string askText(const std::string& prompt) override;

    const std::vector<std::string>& prompts() const { return prompts_; }
    const std::vector<std::string>& confirmedTargets() const { return confirmedTargets_; }

private:
    std::deque<Decision> decisions_;
    std::deque<bool> targetConfirmations_;
    std::deque<std::string> textAnswers_;
    std::vector<std::string> prompts_;
    std::vector<std::string> confirmedTargets_;
};

// Targets listed up front (--confirm-target) are confirmed without asking.
// Everything else goes to the operator's gate.
class PreapprovedTargetGate : public ConfirmationGate {
public:
    PreapprovedTargetGate(std::shared_ptr<ConfirmationGate> operatorGate, std::set<std::string> approvedTargets);

    Decision ask(const std::string& prompt) override;
    bool confirmTarget(const std::string& prompt, const std::string& target) override;
    std::string askText(const std::string& prompt) override;

private:
    std::shared_ptr<ConfirmationGate> operatorGate_;
    std::set<std::string> approvedTargets_;
};
