#pragma once

#include "backup/step.hpp"
#include <string>
#include <vector>

// Ordered catalog of steps. Order only matters for prompting and reporting.
class StepRegistry {
public:
    // Throws ConfigurationError on an empty or duplicate id or a missing action.
    void add(Step step);

    const std::vector<Step>& steps() const { return steps_; }
    const Step* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }
    std::vector<std::string> ids() const;
    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

private:
    std::vector<Step> steps_;
};
