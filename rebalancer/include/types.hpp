#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

enum class ActionType {
    BUY,
    SELL
};

struct RebalanceAction {
    std::string ticker;
    ActionType action;
    double amount; // shares to transact

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RebalanceAction, ticker, action, amount)
};

struct AllocationTarget {
    std::string ticker;
    double target_percentage; // fraction of total value, 0.0 to 1.0

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(AllocationTarget, ticker, target_percentage)
};

struct MarketData {
    std::map<std::string, double> prices;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MarketData, prices)
};

struct RebalanceSettings {
    // Minimum absolute currency deviation before an action is emitted
    double tolerance = 0.01;
    // Allowed distance of the allocation sum from 1.0 before warning
    double allocation_epsilon = 0.001;
};

// Both keys are optional; missing ones keep the defaults
inline void to_json(nlohmann::json& j, const RebalanceSettings& s) {
    j = nlohmann::json{{"tolerance", s.tolerance}, {"allocation_epsilon", s.allocation_epsilon}};
}

inline void from_json(const nlohmann::json& j, RebalanceSettings& s) {
    const RebalanceSettings defaults;
    s.tolerance = j.value("tolerance", defaults.tolerance);
    s.allocation_epsilon = j.value("allocation_epsilon", defaults.allocation_epsilon);
}

// JSON conversions for Enums
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {
    {ActionType::BUY, "BUY"},
    {ActionType::SELL, "SELL"}
})
