#include "order_entry/paper_exchange.H"
#include "common/errors.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace kestrel;
using namespace kestrel::oe;

class PaperExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        books.get_or_create("BTC-USDT").apply_snapshot(
            {{100.0, 5.0, 1}, {99.0, 5.0, 1}},
            {{101.0, 5.0, 1}, {102.0, 5.0, 1}}, 1);
    }

    paper_exchange_config make_config(double balance = 10000) {
        paper_exchange_config config;
        config.initial_balance = balance;
        return config;
    }

    order_request request(SIDE side, ORDER_TYPE type, std::optional<double> price, double quantity,
                          TIME_IN_FORCE tif = TIME_IN_FORCE::GTC) {
        order_request r;
        r.client_order_id = "c" + std::to_string(++client_counter);
        r.symbol = "BTC-USDT";
        r.side = side;
        r.type = type;
        r.time_in_force = tif;
        r.price = price;
        r.quantity = quantity;
        return r;
    }

    double free_cash(PaperExchange& exchange) {
        auto balances = exchange.get_balance(timeout);
        EXPECT_EQ(balances.size(), 1);
        return balances.empty() ? 0 : balances[0].free;
    }

    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
    md::OrderBookManager books{logger};
    EventQueue events;
    std::chrono::milliseconds timeout{1000};
    int client_counter = 0;
};

TEST_F(PaperExchangeTest, MarketBuyFillsAtAskWithSlippage) {
    PaperExchange exchange(make_config(), books, logger, &events);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::MARKET, std::nullopt, 2.0), timeout);

    EXPECT_EQ(report.status, ORDER_STATUS::FILLED);
    EXPECT_DOUBLE_EQ(report.filled_quantity, 2.0);
    EXPECT_DOUBLE_EQ(report.avg_fill_price, 101.0 * 1.0001);

    double notional = 2.0 * 101.0 * 1.0001;
    EXPECT_NEAR(exchange.commission_paid(), notional * 0.0005, 1e-9);
    EXPECT_NEAR(free_cash(exchange), 10000 - notional * 1.0005, 1e-9);

    auto positions = exchange.get_positions(timeout);
    ASSERT_EQ(positions.size(), 1);
    EXPECT_DOUBLE_EQ(positions[0].quantity, 2.0);
    EXPECT_DOUBLE_EQ(positions[0].entry_price, 101.0 * 1.0001);

    exchange_event event;
    ASSERT_TRUE(events.try_pop(event));
    ASSERT_TRUE(std::holds_alternative<order_fill_event>(event));
    const auto& f = std::get<order_fill_event>(event);
    EXPECT_EQ(f.exchange_order_id, report.exchange_order_id);
    EXPECT_DOUBLE_EQ(f.fill_quantity, 2.0);
    EXPECT_EQ(f.total_filled, std::optional<double>(2.0));
}

TEST_F(PaperExchangeTest, MarketSellFillsAtBidWithSlippage) {
    PaperExchange exchange(make_config(), books, logger);
    auto report = exchange.submit_order(request(SIDE::SELL, ORDER_TYPE::MARKET, std::nullopt, 1.0), timeout);

    EXPECT_EQ(report.status, ORDER_STATUS::FILLED);
    EXPECT_DOUBLE_EQ(report.avg_fill_price, 100.0 * 0.9999);

    auto positions = exchange.get_positions(timeout);
    ASSERT_EQ(positions.size(), 1);
    EXPECT_DOUBLE_EQ(positions[0].quantity, -1.0);
}

TEST_F(PaperExchangeTest, MarketOrderWithoutBookIsRejected) {
    PaperExchange exchange(make_config(), books, logger);
    auto r = request(SIDE::BUY, ORDER_TYPE::MARKET, std::nullopt, 1.0);
    r.symbol = "ETH-USDT";
    EXPECT_EQ(exchange.submit_order(r, timeout).status, ORDER_STATUS::REJECTED);
}

TEST_F(PaperExchangeTest, InsufficientBalanceRejects) {
    PaperExchange exchange(make_config(100), books, logger);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::MARKET, std::nullopt, 1.0), timeout);
    EXPECT_EQ(report.status, ORDER_STATUS::REJECTED);

    report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 95.0, 2.0), timeout);
    EXPECT_EQ(report.status, ORDER_STATUS::REJECTED);
    EXPECT_DOUBLE_EQ(free_cash(exchange), 100);
}

TEST_F(PaperExchangeTest, RestingLimitFillsWhenBookCrosses) {
    PaperExchange exchange(make_config(), books, logger, &events);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 100.5, 1.0), timeout);

    EXPECT_EQ(report.status, ORDER_STATUS::SUBMITTED);
    EXPECT_EQ(exchange.get_open_orders(std::nullopt, timeout).size(), 1);
    EXPECT_EQ(exchange.process(), 0);

    auto balances = exchange.get_balance(timeout);
    EXPECT_NEAR(balances[0].locked, 100.5 * 1.0005, 1e-9);

    books.get("BTC-USDT")->apply_update(SIDE::SELL, 100.4, 1.0, 1, 2);
    EXPECT_EQ(exchange.process(), 1);

    auto filled = exchange.get_order("BTC-USDT", report.exchange_order_id, timeout);
    EXPECT_EQ(filled.status, ORDER_STATUS::FILLED);
    EXPECT_DOUBLE_EQ(filled.avg_fill_price, 100.5);
    EXPECT_TRUE(exchange.get_open_orders(std::nullopt, timeout).empty());
    EXPECT_NEAR(exchange.get_balance(timeout)[0].locked, 0, 1e-9);
    EXPECT_NEAR(free_cash(exchange), 10000 - 100.5 * 1.0005, 1e-9);

    exchange_event event;
    ASSERT_TRUE(events.try_pop(event));
    EXPECT_TRUE(std::holds_alternative<order_fill_event>(event));
}

TEST_F(PaperExchangeTest, RestingSellFillsWhenBidRises) {
    PaperExchange exchange(make_config(), books, logger);
    auto report = exchange.submit_order(request(SIDE::SELL, ORDER_TYPE::LIMIT, 100.8, 1.0), timeout);
    EXPECT_EQ(report.status, ORDER_STATUS::SUBMITTED);

    books.get("BTC-USDT")->apply_update(SIDE::BUY, 100.9, 1.0, 1, 2);
    EXPECT_EQ(exchange.process(), 1);
    EXPECT_EQ(exchange.get_order("BTC-USDT", report.exchange_order_id, timeout).status, ORDER_STATUS::FILLED);
}

TEST_F(PaperExchangeTest, CrossingLimitFillsAtLimitPrice) {
    PaperExchange exchange(make_config(), books, logger);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 101.5, 1.0), timeout);
    EXPECT_EQ(report.status, ORDER_STATUS::FILLED);
    EXPECT_DOUBLE_EQ(report.avg_fill_price, 101.5);
}

TEST_F(PaperExchangeTest, PostOnlyThatCrossesIsRejected) {
    PaperExchange exchange(make_config(), books, logger);
    auto crossing = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 101.0, 1.0, TIME_IN_FORCE::ALO), timeout);
    EXPECT_EQ(crossing.status, ORDER_STATUS::REJECTED);

    auto passive = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 100.0, 1.0, TIME_IN_FORCE::ALO), timeout);
    EXPECT_EQ(passive.status, ORDER_STATUS::SUBMITTED);
}

TEST_F(PaperExchangeTest, ImmediateOrCancelDoesNotRest) {
    PaperExchange exchange(make_config(), books, logger);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 99.5, 1.0, TIME_IN_FORCE::IOC), timeout);
    EXPECT_EQ(report.status, ORDER_STATUS::CANCELLED);
    EXPECT_TRUE(exchange.get_open_orders(std::nullopt, timeout).empty());
}

TEST_F(PaperExchangeTest, CancelReleasesLockedCash) {
    PaperExchange exchange(make_config(), books, logger, &events);
    auto report = exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 99.0, 1.0), timeout);

    EXPECT_TRUE(exchange.cancel_order("BTC-USDT", report.exchange_order_id, timeout));
    EXPECT_DOUBLE_EQ(free_cash(exchange), 10000);
    EXPECT_EQ(exchange.get_order("BTC-USDT", report.exchange_order_id, timeout).status, ORDER_STATUS::CANCELLED);

    // second cancel and unknown ids are not confirmed
    EXPECT_FALSE(exchange.cancel_order("BTC-USDT", report.exchange_order_id, timeout));
    EXPECT_FALSE(exchange.cancel_order("BTC-USDT", "paper-999", timeout));

    exchange_event event;
    ASSERT_TRUE(events.try_pop(event));
    ASSERT_TRUE(std::holds_alternative<order_update_event>(event));
    EXPECT_EQ(std::get<order_update_event>(event).status, ORDER_STATUS::CANCELLED);
}

TEST_F(PaperExchangeTest, CancelAllOnlyTouchesSymbol) {
    books.get_or_create("ETH-USDT").apply_snapshot({{10.0, 1.0, 1}}, {{11.0, 1.0, 1}}, 1);
    PaperExchange exchange(make_config(), books, logger);

    exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 98.0, 1.0), timeout);
    exchange.submit_order(request(SIDE::SELL, ORDER_TYPE::LIMIT, 105.0, 1.0), timeout);
    auto eth = request(SIDE::BUY, ORDER_TYPE::LIMIT, 9.0, 1.0);
    eth.symbol = "ETH-USDT";
    exchange.submit_order(eth, timeout);

    auto cancelled = exchange.cancel_all_orders("BTC-USDT", timeout);
    EXPECT_EQ(cancelled.size(), 2);
    auto open = exchange.get_open_orders(std::nullopt, timeout);
    ASSERT_EQ(open.size(), 1);
    EXPECT_EQ(open[0].symbol, "ETH-USDT");
}

TEST_F(PaperExchangeTest, FindByClientId) {
    PaperExchange exchange(make_config(), books, logger);
    auto r = request(SIDE::BUY, ORDER_TYPE::LIMIT, 99.0, 1.0);
    auto report = exchange.submit_order(r, timeout);

    auto found = exchange.find_order_by_client_id("BTC-USDT", r.client_order_id, timeout);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->exchange_order_id, report.exchange_order_id);
    EXPECT_FALSE(exchange.find_order_by_client_id("BTC-USDT", "never-sent", timeout).has_value());

    EXPECT_THROW(exchange.submit_order(r, timeout), ExchangeError);
    EXPECT_THROW(exchange.get_order("BTC-USDT", "paper-999", timeout), ExchangeError);
}

TEST_F(PaperExchangeTest, PositionEntryPriceAndPnl) {
    PaperExchange exchange(make_config(), books, logger);
    exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 101.0, 1.0), timeout);
    exchange.submit_order(request(SIDE::BUY, ORDER_TYPE::LIMIT, 102.0, 1.0), timeout);

    auto positions = exchange.get_positions(timeout);
    ASSERT_EQ(positions.size(), 1);
    EXPECT_DOUBLE_EQ(positions[0].quantity, 2.0);
    EXPECT_DOUBLE_EQ(positions[0].entry_price, 101.5);
    // mid is 100.5
    EXPECT_DOUBLE_EQ(positions[0].unrealized_pnl, -2.0);

    exchange.submit_order(request(SIDE::SELL, ORDER_TYPE::LIMIT, 100.0, 2.0), timeout);
    EXPECT_TRUE(exchange.get_positions(timeout).empty());
}

TEST_F(PaperExchangeTest, RejectsNegativeSettings) {
    auto config = make_config();
    config.commission_rate = -0.1;
    EXPECT_THROW({ PaperExchange exchange(config, books, logger); }, InvalidConfiguration);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
