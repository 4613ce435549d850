#include "backup/step_registry.hpp"
#include "common/errors.hpp"
#include <algorithm>

void StepRegistry::add(Step step) {
    if (step.id.empty()) {
        throw ConfigurationError("Step id must not be empty");
    }
    if (contains(step.id)) {
        throw ConfigurationError("Duplicate step id: " + step.id);
    }
    if (!step.action) {
        throw ConfigurationError("Step '" + step.id + "' has no action");
    }
    steps_.push_back(std::move(step));
}

const Step* StepRegistry::find(const std::string& id) const {
    auto it = std::find_if(steps_.begin(), steps_.end(),
                           [&id](const Step& step) { return step.id == id; });
    return it != steps_.end() ? &*it : nullptr;
}

std::vector<std::string> StepRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(steps_.size());
    for (const auto& step : steps_) {
        result.push_back(step.id);
    }
    return result;
}
