#include "random_walk_feed.H"

#include "common/errors.H"

#include <algorithm>
#include <cmath>

namespace kestrel::bots {

void feed_params::validate() const {
    if (!(start_price > 0)) {
        throw InvalidConfiguration("feed start_price must be positive");
    }
    if (!(tick_size > 0)) {
        throw InvalidConfiguration("feed tick_size must be positive");
    }
    if (volatility_bps < 0) {
        throw InvalidConfiguration("feed volatility_bps must be non-negative");
    }
    if (depth < 1) {
        throw InvalidConfiguration("feed depth must be at least 1");
    }
    if (!(level_size > 0)) {
        throw InvalidConfiguration("feed level_size must be positive");
    }
    if (start_price <= (depth + 5) * tick_size) {
        throw InvalidConfiguration("feed start_price too close to zero for its depth");
    }
}

feed_params feed_params_from_json(const nlohmann::json& j) {
    feed_params p;
    try {
        p.start_price = j.value("start_price", p.start_price);
        p.tick_size = j.value("tick_size", p.tick_size);
        p.volatility_bps = j.value("volatility_bps", p.volatility_bps);
        p.depth = j.value("depth", p.depth);
        p.level_size = j.value("level_size", p.level_size);
        p.seed = j.value("seed", p.seed);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfiguration(std::string("feed: ") + e.what());
    }
    p.validate();
    return p;
}

RandomWalkFeed::RandomWalkFeed(std::string symbol, feed_params params, md::OrderBookManager& books,
                               std::shared_ptr<spdlog::logger> logger)
    : feed_symbol(std::move(symbol)), params(params), books(books), logger(logger),
      gen(params.seed ? params.seed : std::random_device{}()),
      fair(params.start_price), min_price((params.depth + 5) * params.tick_size) {
    this->params.validate();
}

void RandomWalkFeed::build(levels& bids, levels& asks) {
    int64_t fair_ticks = static_cast<int64_t>(std::llround(fair / params.tick_size));
    for (uint32_t i = 0; i < params.depth; i++) {
        bids[fair_ticks - 1 - i] = params.level_size * size_value(gen);
        asks[fair_ticks + 1 + i] = params.level_size * size_value(gen);
    }
}

std::vector<md::PriceLevel> RandomWalkFeed::to_price_levels(const levels& side_levels, bool descending) const {
    std::vector<md::PriceLevel> result;
    result.reserve(side_levels.size());
    for (const auto& [ticks, size] : side_levels) {
        result.push_back({ticks * params.tick_size, size, 1});
    }
    if (descending) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

void RandomWalkFeed::publish(md::OrderBook& book, SIDE side, const levels& before, const levels& after, uint64_t timestamp) {
    for (const auto& [ticks, size] : before) {
        if (!after.count(ticks)) {
            book.apply_update(side, ticks * params.tick_size, 0, 0, timestamp);
        }
    }
    for (const auto& [ticks, size] : after) {
        auto it = before.find(ticks);
        if (it == before.end() || it->second != size) {
            book.apply_update(side, ticks * params.tick_size, size, 1, timestamp);
        }
    }
}

double RandomWalkFeed::step(uint64_t timestamp) {
    md::OrderBook& book = books.get_or_create(feed_symbol);

    if (step_count > 0) {
        fair += fair * params.volatility_bps / 10000.0 * walk_value(gen);
        if (fair < min_price) {
            fair = min_price;
        }
    }

    levels bids;
    levels asks;
    build(bids, asks);

    if (step_count == 0) {
        book.apply_snapshot(to_price_levels(bids, true), to_price_levels(asks, false), timestamp);
        logger->info("Feed for {} started at {}", feed_symbol, fair);
    } else {
        // asks first so a rising book never crosses between the two sides
        if (bids.rbegin()->first > last_bids.rbegin()->first) {
            publish(book, SIDE::SELL, last_asks, asks, timestamp);
            publish(book, SIDE::BUY, last_bids, bids, timestamp);
        } else {
            publish(book, SIDE::BUY, last_bids, bids, timestamp);
            publish(book, SIDE::SELL, last_asks, asks, timestamp);
        }
    }

    last_bids = std::move(bids);
    last_asks = std::move(asks);
    step_count++;
    return fair;
}

} // namespace kestrel::bots
