#include <gtest/gtest.h>
#include "types.hpp"
#include <nlohmann/json.hpp>

TEST(TypesTest, ActionSerialization) {
    RebalanceAction action{"APPL", ActionType::BUY, 7.0};
    nlohmann::json j = action;

    EXPECT_EQ(j["ticker"], "APPL");
    EXPECT_EQ(j["action"], "BUY");
    EXPECT_EQ(j["amount"], 7.0);
}

TEST(TypesTest, AllocationTargetDeserialization) {
    auto j = nlohmann::json::parse(R"({"ticker": "META", "target_percentage": 0.4})");
    auto target = j.get<AllocationTarget>();

    EXPECT_EQ(target.ticker, "META");
    EXPECT_DOUBLE_EQ(target.target_percentage, 0.4);
}

TEST(TypesTest, SettingsDefaultsWhenKeysMissing) {
    auto settings = nlohmann::json::parse(R"({"tolerance": 0.5})").get<RebalanceSettings>();

    EXPECT_DOUBLE_EQ(settings.tolerance, 0.5);
    EXPECT_DOUBLE_EQ(settings.allocation_epsilon, 0.001);

    auto defaults = nlohmann::json::object().get<RebalanceSettings>();
    EXPECT_DOUBLE_EQ(defaults.tolerance, 0.01);
}

TEST(TypesTest, MarketDataSerialization) {
    MarketData md;
    md.prices["META"] = 300.0;

    nlohmann::json j = md;
    EXPECT_EQ(j["prices"]["META"], 300.0);
}
