#include "allocation_policy.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

AllocationPolicy::AllocationPolicy(std::vector<AllocationTarget> targets, double epsilon)
    : targets_(std::move(targets)) {
    for (const auto& target : targets_) {
        total_allocation_ += target.target_percentage;
    }

    if (std::abs(total_allocation_ - 1.0) > epsilon) {
        std::ostringstream msg;
        msg << "Total allocation is " << total_allocation_ * 100.0 << "%, not 100%";
        warning_ = msg.str();
        std::cerr << "Warning: " << *warning_ << std::endl;
    }
}
