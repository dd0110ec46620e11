/**
 * Run the skew market maker on every configured symbol, against the paper
 * exchange or a live REST venue.
 */
#include "mm_config.H"
#include "random_walk_feed.H"
#include "skew_market_maker.H"
#include "common/errors.H"
#include "common/utils.H"
#include "inventory/inventory_manager.H"
#include "market_data/order_book_manager.H"
#include "order_entry/event_pump.H"
#include "order_entry/event_queue.H"
#include "order_entry/http_client.H"
#include "order_entry/order_manager.H"
#include "order_entry/order_validator.H"
#include "order_entry/paper_exchange.H"
#include "order_entry/rest_exchange.H"

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace kestrel;

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

// Steps every random walk book, then lets the paper exchange fill what they crossed.
void run_paper_feed(std::vector<std::unique_ptr<bots::RandomWalkFeed>>& feeds, oe::PaperExchange& paper,
                    std::chrono::milliseconds interval, const oe::CancellationToken& stop) {
    do {
        uint64_t now = epoch_nanos();
        for (auto& feed : feeds) {
            feed->step(now);
        }
        paper.process();
    } while (!stop.wait_for(interval));
}

// Polls depth snapshots and order status; a REST venue pushes neither.
void run_rest_feed(const bots::mm_config& config, oe::RestExchange& rest, md::OrderBookManager& books,
                   oe::OrderManager& orders, const oe::CancellationToken& stop,
                   std::shared_ptr<spdlog::logger> logger) {
    std::chrono::milliseconds timeout(config.exchange.timeout_ms);
    do {
        for (const auto& symbol : config.symbols) {
            const std::string& name = symbol.definition.symbol;
            try {
                oe::depth_snapshot depth = rest.get_depth(name, config.exchange.depth_limit, timeout);
                books.get_or_create(name).apply_snapshot(std::move(depth.bids), std::move(depth.asks), epoch_nanos());
            } catch (const ExchangeError& e) {
                logger->warn("Depth poll for {} failed: {}", name, e.what());
            }
        }

        for (const auto& o : orders.get_active_orders()) {
            try {
                orders.refresh_order_status(o.client_order_id);
            } catch (const ExchangeError& e) {
                logger->warn("Status poll for {} failed: {}", o.client_order_id, e.what());
            } catch (const OrderNotFound& e) {
                logger->warn("Status poll for {} failed: {}", o.client_order_id, e.what());
            }
        }
    } while (!stop.wait_for(std::chrono::milliseconds(config.exchange.depth_poll_ms)));
}

} // namespace

int main(int argc, char* argv[]) {

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    bots::mm_config config;
    try {
        config = bots::load_mm_config(argv[1]);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    auto logger = spdlog::daily_logger_mt<spdlog::async_factory>("async_logger", config.log_file);
    logger->flush_on(spdlog::level::warn);
    logger->info("Starting mm_runner in {} mode with {} symbols", bots::to_string(config.exchange.mode), config.symbols.size());

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int exit_code = 0;
    try {
        md::OrderBookManager books(logger);
        oe::EventQueue events;

        std::unordered_map<std::string, symbol_definition> definitions;
        std::vector<std::unique_ptr<inv::InventoryManager>> inventories;
        for (const auto& symbol : config.symbols) {
            definitions.emplace(symbol.definition.symbol, symbol.definition);
            inventories.push_back(std::make_unique<inv::InventoryManager>(symbol.inventory, logger));
            books.get_or_create(symbol.definition.symbol);
        }
        oe::OrderValidator validator(definitions, logger);

        std::unique_ptr<oe::Exchange> exchange;
        oe::PaperExchange* paper = nullptr;
        oe::RestExchange* rest = nullptr;
        if (config.exchange.mode == bots::EXCHANGE_MODE::PAPER) {
            auto p = std::make_unique<oe::PaperExchange>(config.paper.exchange, books, logger, &events);
            paper = p.get();
            exchange = std::move(p);
        } else {
            auto r = std::make_unique<oe::RestExchange>(config.exchange.rest, std::make_unique<oe::CurlHttpClient>(), logger);
            rest = r.get();
            exchange = std::move(r);
        }

        oe::OrderManager orders(*exchange, validator, logger, std::chrono::milliseconds(config.exchange.timeout_ms));

        std::vector<std::unique_ptr<bots::Strategy>> strategies;
        for (size_t i = 0; i < config.symbols.size(); i++) {
            orders.track_inventory(config.symbols[i].definition.symbol, *inventories[i]);
            strategies.push_back(std::make_unique<bots::SkewMarketMaker>(
                config.symbols[i].definition, config.strategy, orders, books, *inventories[i], logger));
        }

        orders.set_on_order_update([&strategies](const oe::order& o) {
            for (auto& strategy : strategies) {
                strategy->on_order_update(o);
            }
        });
        orders.set_on_order_fill([&strategies](const oe::order& o) {
            for (auto& strategy : strategies) {
                strategy->on_order_fill(o);
            }
        });

        oe::EventPump pump(events, orders, logger);
        pump.start();

        std::vector<std::unique_ptr<bots::RandomWalkFeed>> feeds;
        if (paper) {
            for (const auto& symbol : config.symbols) {
                feeds.push_back(std::make_unique<bots::RandomWalkFeed>(
                    symbol.definition.symbol, config.feed_for(symbol), books, logger));
            }
        }

        oe::CancellationToken stop;
        std::thread feed_thread([&]() {
            try {
                if (paper) {
                    run_paper_feed(feeds, *paper, std::chrono::milliseconds(config.paper.feed_interval_ms), stop);
                } else {
                    run_rest_feed(config, *rest, books, orders, stop, logger);
                }
            } catch (const std::exception& e) {
                logger->error("Feed thread stopped: {}", e.what());
                stop_requested = true;
            }
        });

        std::chrono::milliseconds loop_interval(config.loop_interval_ms);
        try {
            while (!stop_requested) {
                for (auto& strategy : strategies) {
                    strategy->process();
                }
                if (stop.wait_for(loop_interval)) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            logger->error("Strategy loop stopped: {}", e.what());
            exit_code = 1;
        }

        logger->info("Shutting down");
        stop.cancel();
        feed_thread.join();

        for (auto& strategy : strategies) {
            try {
                strategy->shutdown();
            } catch (const std::exception& e) {
                logger->error("Shutdown of {} failed: {}", strategy->name(), e.what());
                exit_code = 1;
            }
        }

        // paper cancels arrive as events
        pump.stop();
        pump.process();

        for (size_t i = 0; i < config.symbols.size(); i++) {
            auto s = inventories[i]->stats();
            logger->info("{}: inventory {} (peak {}), bought {}, sold {}, rebalances {}",
                config.symbols[i].definition.symbol, s.current, s.peak, s.total_bought, s.total_sold, s.rebalance_count);
        }
        auto s = orders.stats();
        logger->info("Orders: submitted {}, rejected {}, fills {}, active {}",
            s.submitted_count, s.rejected_count, s.fill_count, s.active_count);
        if (paper) {
            logger->info("Paper commission paid: {}", paper->commission_paid());
        }
    } catch (const std::exception& e) {
        logger->error("mm_runner failed: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    spdlog::shutdown();
    return exit_code;
}
