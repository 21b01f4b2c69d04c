#include "rebalancer.hpp"
#include <cmath>

namespace {

const PricedAsset* find_holding(const Holdings& holdings, const std::string& ticker) {
    for (const auto& asset : holdings) {
        if (asset && asset->ticker() == ticker) {
            return asset.get();
        }
    }
    return nullptr;
}

} // namespace

double Rebalancer::total_value(const Holdings& holdings) {
    double total = 0.0;
    for (const auto& asset : holdings) {
        if (asset) {
            total += asset->shares() * asset->current_price();
        }
    }
    return total;
}

std::vector<RebalanceAction> Rebalancer::rebalance(
    const Holdings& holdings,
    const AllocationPolicy& policy,
    const RebalanceSettings& settings
) {
    std::vector<RebalanceAction> actions;
    const double total = total_value(holdings);

    for (const auto& target : policy) {
        double target_value = total * target.target_percentage;

        // Missing holding counts as zero value but never yields an opening buy
        const PricedAsset* current = find_holding(holdings, target.ticker);
        double current_value = current ? current->current_value() : 0.0;

        double difference = target_value - current_value;

        if (current && std::abs(difference) > settings.tolerance) {
            // A zero price cannot be expressed as a share count
            double price = current->current_price();
            if (price <= 0.0) {
                continue;
            }

            ActionType action = difference > 0 ? ActionType::BUY : ActionType::SELL;
            actions.push_back({target.ticker, action, std::abs(difference) / price});
        }
    }

    // Holdings outside the policy are left untouched
    return actions;
}
