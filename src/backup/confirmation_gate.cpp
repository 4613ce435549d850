#include "backup/confirmation_gate.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cctype>
#include <istream>
#include <ostream>

std::string toString(Decision decision) {
    switch (decision) {
        case Decision::YES:        return "yes";
        case Decision::NO:         return "no";
        case Decision::YES_TO_ALL: return "yes-to-all";
        default:                   return "unknown";
    }
}

ConsoleConfirmationGate::ConsoleConfirmationGate(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out) {
}

bool ConsoleConfirmationGate::parseDecision(const std::string& input, Decision& decision) {
    std::string answer = utils::trim(input);
    if (answer.empty()) {
        decision = Decision::YES;
        return true;
    }
    switch (std::tolower(static_cast<unsigned char>(answer[0]))) {
        case 'y': decision = Decision::YES;        return true;
        case 'n': decision = Decision::NO;         return true;
        case 'a': decision = Decision::YES_TO_ALL; return true;
        default:  return false;
    }
}

Decision ConsoleConfirmationGate::ask(const std::string& prompt) {
    while (true) {
        out_ << prompt << " (Y/n/A, default is Y): " << std::flush;
        std::string line;
        if (!std::getline(in_, line)) {
            // Closed input never counts as consent
            out_ << std::endl;
            return Decision::NO;
        }
        Decision decision;
        if (parseDecision(line, decision)) {
            return decision;
        }
        out_ << "Please answer yes, no, or all." << std::endl;
    }
}

bool ConsoleConfirmationGate::confirmTarget(const std::string& prompt, const std::string& target) {
    out_ << prompt << std::endl;
    out_ << "Type '" << target << "' to continue: " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return false;
    }
    bool confirmed = utils::trim(line) == target;
    if (!confirmed) {
        out_ << "Target not confirmed, skipping." << std::endl;
    }
    return confirmed;
}

std::string ConsoleConfirmationGate::askText(const std::string& prompt) {
    out_ << prompt << ": " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return "";
    }
    return utils::trim(line);
}

ScriptedConfirmationGate::ScriptedConfirmationGate(std::vector<Decision> decisions,
                                                   std::vector<bool> targetConfirmations,
                                                   std::vector<std::string> textAnswers)
    : decisions_(decisions.begin(), decisions.end())
    , targetConfirmations_(targetConfirmations.begin(), targetConfirmations.end())
    , textAnswers_(textAnswers.begin(), textAnswers.end()) {
}

Decision ScriptedConfirmationGate::ask(const std::string& prompt) {
    prompts_.push_back(prompt);
    if (decisions_.empty()) {
        return Decision::NO;
    }
    Decision decision = decisions_.front();
    decisions_.pop_front();
    return decision;
}

bool ScriptedConfirmationGate::confirmTarget(const std::string& prompt, const std::string& target) {
    prompts_.push_back(prompt);
    if (targetConfirmations_.empty()) {
        return false;
    }
    bool confirmed = targetConfirmations_.front();
    targetConfirmations_.pop_front();
    if (confirmed) {
        confirmedTargets_.push_back(target);
    }
    return confirmed;
}

std::string ScriptedConfirmationGate::askText(const std::string& prompt) {
    prompts_.push_back(prompt);
    if (textAnswers_.empty()) {
        return "";
    }
    std::string answer = textAnswers_.front();
    textAnswers_.pop_front();
    return answer;
}

PreapprovedTargetGate::PreapprovedTargetGate(std::shared_ptr<ConfirmationGate> operatorGate,
                                             std::set<std::string> approvedTargets)
    : operatorGate_(std::move(operatorGate))
    , approvedTargets_(std::move(approvedTargets)) {
}

Decision PreapprovedTargetGate::ask(const std::string& prompt) {
    return operatorGate_->ask(prompt);
}

bool PreapprovedTargetGate::confirmTarget(const std::string& prompt, const std::string& target) {
    if (approvedTargets_.count(target) > 0) {
        Logger::info(prompt + " -> " + target + " confirmed by --confirm-target");
        return true;
    }
    return operatorGate_->confirmTarget(prompt, target);
}

std::string PreapprovedTargetGate::askText(const std::string& prompt) {
    return operatorGate_->askText(prompt);
}
