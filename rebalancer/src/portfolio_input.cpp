#include "portfolio_input.hpp"
#include <string>

PortfolioInput parse_portfolio_input(const nlohmann::json& input) {
    PortfolioInput parsed;

    auto market_data = std::make_shared<MarketData>();
    if (input.contains("prices")) {
        market_data->prices = input.at("prices").get<std::map<std::string, double>>();
    }
    parsed.market_data = market_data;

    if (input.contains("holdings")) {
        for (const auto& holding : input.at("holdings")) {
            auto ticker = holding.at("ticker").get<std::string>();
            auto shares = holding.at("shares").get<double>();

            if (holding.contains("price")) {
                parsed.holdings.push_back(std::make_shared<StaticPriceAsset>(ticker, shares, holding.at("price").get<double>()));
            } else {
                parsed.holdings.push_back(std::make_shared<QuotedAsset>(ticker, shares, parsed.market_data));
            }
        }
    }

    if (input.contains("allocations")) {
        parsed.allocations = input.at("allocations").get<std::vector<AllocationTarget>>();
    }

    if (input.contains("settings")) {
        parsed.settings = input.at("settings").get<RebalanceSettings>();
    }

    return parsed;
}
