#include "safety_check.hpp"
#include <cmath>

SafetyCheck::Result SafetyCheck::validate(const Holdings& holdings) {
    for (const auto& asset : holdings) {
        if (!asset) {
            return {false, "Holding entry is missing."};
        }

        // Check 1: Symbol Validity
        if (asset->ticker().empty()) {
            return {false, "Holding symbol cannot be empty."};
        }

        // Check 2: Shares >= 0
        if (!std::isfinite(asset->shares()) || asset->shares() < 0) {
            return {false, "Holding shares must be non-negative. Found: " + std::to_string(asset->shares()) + " for symbol: " + asset->ticker()};
        }

        // Check 3: Price resolvable and >= 0
        double price = 0.0;
        try {
            price = asset->current_price();
        } catch (const PriceUnavailable& e) {
            return {false, e.what()};
        }
        if (!std::isfinite(price) || price < 0) {
            return {false, "Price must be a non-negative number. Found: " + std::to_string(price) + " for symbol: " + asset->ticker()};
        }
    }

    return {true, ""};
}

SafetyCheck::Result SafetyCheck::validate(const AllocationPolicy& policy) {
    for (const auto& target : policy) {
        if (target.ticker.empty()) {
            return {false, "Allocation symbol cannot be empty."};
        }

        if (!std::isfinite(target.target_percentage) || target.target_percentage < 0.0 || target.target_percentage > 1.0) {
            return {false, "Target percentage must be within [0, 1]. Found: " + std::to_string(target.target_percentage) + " for symbol: " + target.ticker};
        }
    }

    return {true, ""};
}

SafetyCheck::Result SafetyCheck::validate(const std::vector<RebalanceAction>& actions) {
    for (const auto& action : actions) {
        // Check 1: Amount > 0
        if (!std::isfinite(action.amount) || action.amount <= 0) {
            return {false, "Action amount must be positive. Found: " + std::to_string(action.amount) + " for symbol: " + action.ticker};
        }

        // Check 2: Symbol Validity
        if (action.ticker.empty()) {
            return {false, "Action symbol cannot be empty."};
        }
    }

    return {true, ""};
}
