#pragma once

#include "types.hpp"
#include "priced_asset.hpp"
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

// A parsed rebalance request
struct PortfolioInput {
    Holdings holdings;
    std::vector<AllocationTarget> allocations;
    std::shared_ptr<const MarketData> market_data;
    RebalanceSettings settings;
};

// Holdings with a "price" get a fixed price; the others are quoted from
// the "prices" table. Throws nlohmann::json::exception on malformed input.
PortfolioInput parse_portfolio_input(const nlohmann::json& input);
