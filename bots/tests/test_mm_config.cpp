#include "bots/mm_config.H"
#include "common/errors.H"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace kestrel;
using namespace kestrel::bots;

namespace {

nlohmann::json minimal_config() {
    return nlohmann::json::parse(R"({
        "symbols": [{"symbol": "BTC-USDT", "start_price": 50000}]
    })");
}

}

TEST(MMConfig, DefaultsFromMinimalConfig) {
    mm_config config = mm_config_from_json(minimal_config());

    EXPECT_EQ(config.exchange.mode, EXCHANGE_MODE::PAPER);
    EXPECT_EQ(config.exchange.timeout_ms, 5000);
    ASSERT_EQ(config.symbols.size(), 1);
    EXPECT_EQ(config.symbols[0].definition.symbol, "BTC-USDT");
    EXPECT_DOUBLE_EQ(config.symbols[0].definition.tick_size, 0.01);
    EXPECT_EQ(config.symbols[0].inventory.symbol, "BTC-USDT");
    EXPECT_DOUBLE_EQ(config.strategy.spread_bps, 10);
    EXPECT_EQ(config.loop_interval_ms, 200);
    EXPECT_DOUBLE_EQ(config.paper.exchange.commission_rate, 0.0005);
    EXPECT_DOUBLE_EQ(config.paper.exchange.slippage, 0.0001);
}

TEST(MMConfig, FullConfig) {
    auto j = nlohmann::json::parse(R"({
        "log_file": "logs/test_mm",
        "exchange": {"mode": "rest", "base_url": "https://venue.test", "api_key_env": "K", "api_secret_env": "S",
                     "timeout_ms": 1500, "recv_window_ms": 3000, "depth_limit": 50, "depth_poll_ms": 250},
        "symbols": [
            {"symbol": "BTC-USDT", "tick_size": 0.1, "lot_size": 0.001, "min_quantity": 0.001, "max_quantity": 5},
            {"symbol": "ETH-USDT", "inventory": {"max_inventory": 20, "skew_mode": "exponential"}}
        ],
        "inventory": {"max_inventory": 2, "skew_factor": 0.25},
        "strategy": {"order_size": 0.05, "spread_bps": 8, "order_levels": 3, "level_spread_bps": 4,
                     "requote_bps": 1, "loop_interval_ms": 50}
    })");

    mm_config config = mm_config_from_json(j);
    EXPECT_EQ(config.log_file, "logs/test_mm");
    EXPECT_EQ(config.exchange.mode, EXCHANGE_MODE::REST);
    EXPECT_EQ(config.exchange.rest.base_url, "https://venue.test");
    EXPECT_EQ(config.exchange.rest.api_key_env, "K");
    EXPECT_EQ(config.exchange.rest.api_secret_env, "S");
    EXPECT_EQ(config.exchange.rest.recv_window_ms, 3000);
    EXPECT_EQ(config.exchange.timeout_ms, 1500);
    EXPECT_EQ(config.exchange.depth_limit, 50);
    EXPECT_EQ(config.exchange.depth_poll_ms, 250);

    ASSERT_EQ(config.symbols.size(), 2);
    EXPECT_DOUBLE_EQ(config.symbols[0].definition.tick_size, 0.1);
    EXPECT_DOUBLE_EQ(config.symbols[0].definition.max_quantity, 5);
    EXPECT_DOUBLE_EQ(config.symbols[0].inventory.max_inventory, 2);
    EXPECT_DOUBLE_EQ(config.symbols[0].inventory.skew_factor, 0.25);

    // per symbol keys override the shared inventory section
    EXPECT_DOUBLE_EQ(config.symbols[1].inventory.max_inventory, 20);
    EXPECT_DOUBLE_EQ(config.symbols[1].inventory.skew_factor, 0.25);
    EXPECT_EQ(config.symbols[1].inventory.skew_mode, inv::SKEW_MODE::EXPONENTIAL);

    EXPECT_DOUBLE_EQ(config.strategy.order_size, 0.05);
    EXPECT_EQ(config.strategy.order_levels, 3);
    EXPECT_EQ(config.loop_interval_ms, 50);
}

TEST(MMConfig, FeedTakesTickAndStartFromSymbol) {
    auto j = minimal_config();
    j["symbols"][0]["tick_size"] = 0.5;
    j["paper"] = {{"feed", {{"start_price", 100}, {"depth", 4}, {"seed", 7}}}};

    mm_config config = mm_config_from_json(j);
    feed_params p = config.feed_for(config.symbols[0]);
    EXPECT_DOUBLE_EQ(p.tick_size, 0.5);
    EXPECT_DOUBLE_EQ(p.start_price, 50000);
    EXPECT_EQ(p.depth, 4);
    EXPECT_EQ(p.seed, 7);

    config.symbols[0].start_price = 0;
    EXPECT_DOUBLE_EQ(config.feed_for(config.symbols[0]).start_price, 100);
}

TEST(MMConfig, RejectsBadConfigs) {
    EXPECT_THROW(mm_config_from_json(nlohmann::json::array()), InvalidConfiguration);
    EXPECT_THROW(mm_config_from_json(nlohmann::json::object()), InvalidConfiguration);
    EXPECT_THROW(mm_config_from_json({{"symbols", nlohmann::json::array()}}), InvalidConfiguration);

    auto j = minimal_config();
    j["exchange"] = {{"mode", "fix"}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["symbols"].push_back(nlohmann::json{{"symbol", "BTC-USDT"}});
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["symbols"][0]["tick_size"] = 0;
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["symbols"][0]["tick_size"] = "small";
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["inventory"] = {{"max_inventory", -1}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["strategy"] = {{"spread_bps", 0}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["strategy"] = {{"loop_interval_ms", 0}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["paper"] = {{"commission_rate", -0.1}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);

    j = minimal_config();
    j["paper"] = {{"feed", {{"depth", 0}}}};
    EXPECT_THROW(mm_config_from_json(j), InvalidConfiguration);
}

TEST(MMConfig, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "mm_config_test.json";
    {
        std::ofstream out(path);
        out << minimal_config().dump(4);
    }
    mm_config config = load_mm_config(path);
    EXPECT_EQ(config.symbols.size(), 1);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_mm_config(path), InvalidConfiguration);
    std::remove(path.c_str());

    EXPECT_THROW(load_mm_config(path), InvalidConfiguration);
}

TEST(MMConfig, ExchangeModeNames) {
    EXPECT_EQ(exchange_mode_from_string("paper"), EXCHANGE_MODE::PAPER);
    EXPECT_EQ(exchange_mode_from_string("rest"), EXCHANGE_MODE::REST);
    EXPECT_STREQ(to_string(EXCHANGE_MODE::REST), "rest");
    EXPECT_THROW(exchange_mode_from_string("PAPER"), InvalidConfiguration);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
