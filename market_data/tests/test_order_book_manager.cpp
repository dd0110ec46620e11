#include "market_data/order_book_manager.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <set>
#include <thread>

using namespace kestrel;
using namespace kestrel::md;

TEST(OrderBookManagerTest, GetOrCreateIsIdempotent) {
    OrderBookManager manager(spdlog::default_logger());

    OrderBook& first = manager.get_or_create("BTC-USDT");
    first.apply_update(SIDE::BUY, 100.0, 1.0, 1, 1);

    OrderBook& second = manager.get_or_create("BTC-USDT");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.bid_levels(), 1);
    EXPECT_EQ(manager.size(), 1);
}

TEST(OrderBookManagerTest, GetReturnsNullForUnknownSymbol) {
    OrderBookManager manager(spdlog::default_logger());
    EXPECT_EQ(manager.get("ETH-USDT"), nullptr);

    manager.get_or_create("ETH-USDT");
    ASSERT_NE(manager.get("ETH-USDT"), nullptr);
    EXPECT_EQ(manager.get("ETH-USDT")->symbol(), "ETH-USDT");
}

TEST(OrderBookManagerTest, SymbolsAreListedSorted) {
    OrderBookManager manager(spdlog::default_logger());
    manager.get_or_create("SOL-USDT");
    manager.get_or_create("BTC-USDT");
    manager.get_or_create("ETH-USDT");

    auto symbols = manager.symbols();
    ASSERT_EQ(symbols.size(), 3);
    EXPECT_EQ(symbols[0], "BTC-USDT");
    EXPECT_EQ(symbols[1], "ETH-USDT");
    EXPECT_EQ(symbols[2], "SOL-USDT");
}

TEST(OrderBookManagerTest, ConcurrentCreatorsShareOneBook) {
    OrderBookManager manager(spdlog::default_logger());

    std::vector<OrderBook*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&manager, &seen, i]() {
            seen[i] = &manager.get_or_create("BTC-USDT");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<OrderBook*> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), 1);
    EXPECT_EQ(manager.size(), 1);
}

TEST(OrderBookManagerTest, ReadersSeeConsistentBookWhileFeedWrites) {
    OrderBookManager manager(spdlog::default_logger());
    OrderBook& book = manager.get_or_create("BTC-USDT");
    book.apply_snapshot({{100.0, 1.0, 1}}, {{101.0, 1.0, 1}}, 0);

    std::thread feed([&book]() {
        for (int i = 0; i < 5000; i++) {
            double offset = (i % 10) * 0.5;
            book.apply_update(SIDE::BUY, 99.0 - offset, 1.0, 1, i);
            book.apply_update(SIDE::SELL, 102.0 + offset, 1.0, 1, i);
        }
    });

    for (int i = 0; i < 2000; i++) {
        auto bids = book.bids();
        for (size_t j = 1; j < bids.size(); j++) {
            EXPECT_GT(bids[j - 1].price, bids[j].price);
        }
        auto spread = book.get_spread();
        EXPECT_TRUE(spread.has_value());
        EXPECT_GT(spread.value_or(-1.0), 0.0);
    }
    feed.join();
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
