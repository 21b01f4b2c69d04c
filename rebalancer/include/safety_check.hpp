#pragma once

#include "types.hpp"
#include "priced_asset.hpp"
#include "allocation_policy.hpp"
#include <vector>
#include <string>

class SafetyCheck {
public:
    struct Result {
        bool valid;
        std::string reason;
    };

    // Tickers, share counts and resolvable prices of the holdings
    static Result validate(const Holdings& holdings);

    // Tickers and target ranges. An allocation sum away from 1.0 is not a failure.
    static Result validate(const AllocationPolicy& policy);

    static Result validate(const std::vector<RebalanceAction>& actions);
};
