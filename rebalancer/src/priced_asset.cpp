#include "priced_asset.hpp"

PriceUnavailable::PriceUnavailable(const std::string& ticker)
    : std::runtime_error("No price available for symbol: " + ticker), ticker_(ticker) {}

QuotedAsset::QuotedAsset(std::string ticker, double shares, std::shared_ptr<const MarketData> quotes)
    : PricedAsset(std::move(ticker), shares), quotes_(std::move(quotes)) {}

double QuotedAsset::current_price() const {
    if (!quotes_) {
        throw PriceUnavailable(ticker());
    }

    auto it = quotes_->prices.find(ticker());
    if (it == quotes_->prices.end()) {
        throw PriceUnavailable(ticker());
    }
    return it->second;
}
