#include "order_book.H"

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>

namespace kestrel::md {

OrderBook::OrderBook(std::string symbol, std::shared_ptr<spdlog::logger> logger)
    : book_symbol(std::move(symbol)), logger(logger) {}

template <typename Compare>
void OrderBook::normalize(std::vector<PriceLevel>& levels, Compare cmp) {
    levels.erase(std::remove_if(levels.begin(), levels.end(), [](const PriceLevel& level) {
        return !(level.size > 0) || !(level.price > 0) || !std::isfinite(level.price) || !std::isfinite(level.size);
    }), levels.end());

    std::stable_sort(levels.begin(), levels.end(), [&cmp](const PriceLevel& a, const PriceLevel& b) {
        return cmp(a.price, b.price);
    });

    // the last level given for a price wins
    std::vector<PriceLevel> unique;
    unique.reserve(levels.size());
    for (const auto& level : levels) {
        if (!unique.empty() && unique.back().price == level.price) {
            unique.back() = level;
        } else {
            unique.push_back(level);
        }
    }
    levels.swap(unique);
}

template <typename Compare>
void OrderBook::upsert_level(std::vector<PriceLevel>& levels, const PriceLevel& level, Compare cmp) {
    auto it = std::lower_bound(levels.begin(), levels.end(), level.price, [&cmp](const PriceLevel& l, double price) {
        return cmp(l.price, price);
    });

    if (it != levels.end() && it->price == level.price) {
        *it = level;
    } else {
        levels.insert(it, level);
    }
}

template <typename Compare>
bool OrderBook::remove_level(std::vector<PriceLevel>& levels, double price, Compare cmp) {
    auto it = std::lower_bound(levels.begin(), levels.end(), price, [&cmp](const PriceLevel& l, double p) {
        return cmp(l.price, p);
    });

    if (it == levels.end() || it->price != price) {
        return false;
    }
    levels.erase(it);
    return true;
}

void OrderBook::apply_snapshot(std::vector<PriceLevel> bids, std::vector<PriceLevel> asks, uint64_t timestamp) {
    normalize(bids, std::greater<double>());
    normalize(asks, std::less<double>());

    std::unique_lock<std::shared_mutex> lock(mutex);
    bid_side.swap(bids);
    ask_side.swap(asks);
    update_time = timestamp;
    seq = 0;

    logger->debug("Snapshot {}: {} bid levels, {} ask levels", book_symbol, bid_side.size(), ask_side.size());
}

bool OrderBook::apply_update(SIDE side, double price, double size, uint32_t num_orders, uint64_t timestamp) {
    if (!(price > 0) || !std::isfinite(price) || !(size >= 0) || !std::isfinite(size)) {
        logger->warn("Rejecting update for {}: side={}, price={}, size={}", book_symbol, to_string(side), price, size);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    if (side == SIDE::BUY) {
        if (size == 0) {
            remove_level(bid_side, price, std::greater<double>());
        } else {
            upsert_level(bid_side, PriceLevel{price, size, num_orders}, std::greater<double>());
        }
    } else {
        if (size == 0) {
            remove_level(ask_side, price, std::less<double>());
        } else {
            upsert_level(ask_side, PriceLevel{price, size, num_orders}, std::less<double>());
        }
    }

    update_time = timestamp;
    ++seq;
    return true;
}

std::optional<PriceLevel> OrderBook::get_best_bid() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    if (bid_side.empty()) {
        return std::nullopt;
    }
    return bid_side.front();
}

std::optional<PriceLevel> OrderBook::get_best_ask() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    if (ask_side.empty()) {
        return std::nullopt;
    }
    return ask_side.front();
}

std::optional<double> OrderBook::get_mid_price() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    if (bid_side.empty() || ask_side.empty()) {
        return std::nullopt;
    }
    return (bid_side.front().price + ask_side.front().price) / 2.0;
}

std::optional<double> OrderBook::get_spread() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    if (bid_side.empty() || ask_side.empty()) {
        return std::nullopt;
    }
    return ask_side.front().price - bid_side.front().price;
}

double OrderBook::get_depth(SIDE side, double target_price) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    double depth = 0;
    if (side == SIDE::BUY) {
        for (const auto& level : bid_side) {
            if (level.price < target_price) {
                break;
            }
            depth += level.size;
        }
    } else {
        for (const auto& level : ask_side) {
            if (level.price > target_price) {
                break;
            }
            depth += level.size;
        }
    }
    return depth;
}

std::optional<slippage_estimate> OrderBook::get_slippage(SIDE side, double quantity) const {
    if (!(quantity > 0)) {
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(mutex);

    // a buy takes liquidity from the asks, a sell from the bids
    const auto& levels = side == SIDE::BUY ? ask_side : bid_side;

    double available = 0;
    for (const auto& level : levels) {
        available += level.size;
    }
    if (levels.empty() || available < quantity) {
        return std::nullopt;
    }

    double remaining = quantity;
    double total_cost = 0;
    for (const auto& level : levels) {
        if (remaining <= 0) {
            break;
        }
        double fill = std::min(remaining, level.size);
        total_cost += fill * level.price;
        remaining -= fill;
    }

    double best = levels.front().price;
    double avg_price = total_cost / quantity;
    return slippage_estimate{avg_price, std::abs(avg_price - best) / best, total_cost};
}

std::vector<PriceLevel> OrderBook::bids() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return bid_side;
}

std::vector<PriceLevel> OrderBook::asks() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return ask_side;
}

size_t OrderBook::bid_levels() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return bid_side.size();
}

size_t OrderBook::ask_levels() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return ask_side.size();
}

uint64_t OrderBook::sequence() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return seq;
}

uint64_t OrderBook::last_update_time() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return update_time;
}

} // namespace kestrel::md
