#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Ordered target composition of a portfolio. Duplicate tickers are kept.
// A sum of targets away from 1.0 is reported as a warning on stderr and
// never blocks construction.
class AllocationPolicy {
public:
    using const_iterator = std::vector<AllocationTarget>::const_iterator;

    explicit AllocationPolicy(std::vector<AllocationTarget> targets,
                              double epsilon = RebalanceSettings{}.allocation_epsilon);

    const std::vector<AllocationTarget>& targets() const { return targets_; }
    const_iterator begin() const { return targets_.begin(); }
    const_iterator end() const { return targets_.end(); }
    std::size_t size() const { return targets_.size(); }
    bool empty() const { return targets_.empty(); }

    double total_allocation() const { return total_allocation_; }

    // Set when the targets do not sum to ~1.0
    const std::optional<std::string>& allocation_warning() const { return warning_; }

private:
    std::vector<AllocationTarget> targets_;
    double total_allocation_ = 0.0;
    std::optional<std::string> warning_;
};
