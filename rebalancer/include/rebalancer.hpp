#pragma once

#include "types.hpp"
#include "priced_asset.hpp"
#include "allocation_policy.hpp"
#include <vector>

class Rebalancer {
public:
    // Calculate the buy/sell actions that bring the holdings back to the policy.
    // Only tickers that are both held and targeted produce actions; amounts are
    // share counts.
    static std::vector<RebalanceAction> rebalance(
        const Holdings& holdings,
        const AllocationPolicy& policy,
        const RebalanceSettings& settings = RebalanceSettings{}
    );

    // Sum of current values over every holding, targeted or not
    static double total_value(const Holdings& holdings);
};
