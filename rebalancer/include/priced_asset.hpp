#pragma once

#include "types.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thrown when no price can be resolved for a holding
class PriceUnavailable : public std::runtime_error {
public:
    explicit PriceUnavailable(const std::string& ticker);

    const std::string& ticker() const { return ticker_; }

private:
    std::string ticker_;
};

// A held quantity of a tradable asset. The price is a capability rather
// than a field so that price sources can be swapped without touching
// the rebalancer.
class PricedAsset {
public:
    PricedAsset(std::string ticker, double shares)
        : ticker_(std::move(ticker)), shares_(shares) {}

    virtual ~PricedAsset() = default;

    // Latest available price. Pure query.
    virtual double current_price() const = 0;

    double current_value() const { return shares_ * current_price(); }

    const std::string& ticker() const { return ticker_; }
    double shares() const { return shares_; }

private:
    std::string ticker_;
    double shares_;
};

// Price fixed at construction
class StaticPriceAsset : public PricedAsset {
public:
    StaticPriceAsset(std::string ticker, double shares, double price)
        : PricedAsset(std::move(ticker), shares), price_(price) {}

    double current_price() const override { return price_; }

private:
    double price_;
};

// Price read from a shared quote table on every call
class QuotedAsset : public PricedAsset {
public:
    QuotedAsset(std::string ticker, double shares, std::shared_ptr<const MarketData> quotes);

    double current_price() const override;

private:
    std::shared_ptr<const MarketData> quotes_;
};

using Holdings = std::vector<std::shared_ptr<const PricedAsset>>;
