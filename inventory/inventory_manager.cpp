#include "inventory_manager.H"

#include "common/errors.H"

#include <algorithm>
#include <cmath>

namespace kestrel::inv {

// used when neither a price unit nor a positive spread is available
static constexpr double FALLBACK_UNIT_OF_MID = 0.0001;

const char* to_string(REBALANCE_ACTION action) {
    switch (action) {
        case REBALANCE_ACTION::NONE: return "none";
        case REBALANCE_ACTION::LIMIT_ORDER: return "limit_order";
        case REBALANCE_ACTION::MARKET_ORDER: return "market_order";
        case REBALANCE_ACTION::EMERGENCY_STOP: return "emergency_stop";
    }
    return "unknown";
}

InventoryManager::InventoryManager(inventory_config config, std::shared_ptr<spdlog::logger> logger)
    : logger(logger), cfg(std::move(config)) {
    cfg.validate();
    logger->info("Inventory manager for {}: max={}, mode={}, skew_factor={}, rebalance={}, emergency={}",
        cfg.symbol, cfg.max_inventory, to_string(cfg.skew_mode), cfg.skew_factor,
        cfg.rebalance_threshold, cfg.emergency_threshold);
}

double InventoryManager::ratio_locked() const {
    return current / cfg.max_inventory;
}

double InventoryManager::skew_locked() const {
    double n = std::clamp(ratio_locked(), -1.0, 1.0);

    switch (cfg.skew_mode) {
        case SKEW_MODE::LINEAR:
            return n;
        case SKEW_MODE::EXPONENTIAL:
            return n < 0 ? -(n * n) : n * n;
        case SKEW_MODE::TIERED: {
            double multiplier = 1.0;
            double magnitude = std::abs(n);
            for (const auto& tier : cfg.tiers) {
                if (tier.threshold > magnitude) {
                    break;
                }
                multiplier = tier.multiplier;
            }
            // not clamped, a multiplier above 1 widens the skew near the limit
            return n * multiplier;
        }
    }
    return n;
}

double InventoryManager::calculate_skew() const {
    std::lock_guard<std::mutex> lock(mutex);
    return skew_locked();
}

quote_pair InventoryManager::adjust_quotes(double bid, double ask, double mid) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (cfg.skew_factor == 0) {
        return {bid, ask};
    }

    double unit = cfg.price_unit;
    if (unit <= 0) {
        unit = (ask - bid) / 2.0;
    }
    if (unit <= 0) {
        unit = mid * FALLBACK_UNIT_OF_MID;
    }

    double offset = skew_locked() * cfg.skew_factor * unit;
    return {bid - offset, ask - offset};
}

void InventoryManager::update_inventory(SIDE side, double quantity) {
    if (!(quantity >= 0) || !std::isfinite(quantity)) {
        throw ValidationError("fill quantity must be non-negative");
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (side == SIDE::BUY) {
        current += quantity;
        total_bought += quantity;
    } else {
        current -= quantity;
        total_sold += quantity;
    }
    peak = std::max(peak, std::abs(current));

    logger->info("Inventory {}: {} {} -> {} (ratio {:.4f})", cfg.symbol, to_string(side), quantity, current, ratio_locked());
}

bool InventoryManager::needs_rebalance() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::abs(ratio_locked()) >= cfg.rebalance_threshold;
}

bool InventoryManager::is_emergency() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::abs(ratio_locked()) >= cfg.emergency_threshold;
}

rebalance_action InventoryManager::get_rebalance_action() const {
    std::lock_guard<std::mutex> lock(mutex);
    double ratio = std::abs(ratio_locked());

    rebalance_action action;
    action.side = current > 0 ? SIDE::SELL : SIDE::BUY;
    action.quantity = std::abs(current - cfg.target_inventory);

    if (ratio >= cfg.emergency_threshold) {
        action.action_type = REBALANCE_ACTION::EMERGENCY_STOP;
    } else if (ratio < cfg.rebalance_threshold) {
        action.action_type = REBALANCE_ACTION::NONE;
        action.quantity = 0;
    } else if (ratio >= (cfg.rebalance_threshold + cfg.emergency_threshold) / 2.0) {
        action.action_type = REBALANCE_ACTION::MARKET_ORDER;
    } else {
        action.action_type = REBALANCE_ACTION::LIMIT_ORDER;
    }
    return action;
}

double InventoryManager::current_inventory() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

double InventoryManager::inventory_ratio() const {
    std::lock_guard<std::mutex> lock(mutex);
    return ratio_locked();
}

void InventoryManager::set_inventory(double inventory) {
    if (!std::isfinite(inventory)) {
        throw ValidationError("inventory must be finite");
    }

    std::lock_guard<std::mutex> lock(mutex);
    logger->info("Inventory {} set from {} to {}", cfg.symbol, current, inventory);
    current = inventory;
    peak = std::max(peak, std::abs(current));
}

void InventoryManager::record_rebalance() {
    std::lock_guard<std::mutex> lock(mutex);
    ++rebalance_count;
}

void InventoryManager::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    current = 0;
    peak = 0;
    total_bought = 0;
    total_sold = 0;
    rebalance_count = 0;
}

inventory_stats InventoryManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    inventory_stats s;
    s.current = current;
    s.ratio = ratio_locked();
    s.skew = skew_locked();
    s.peak = peak;
    s.total_bought = total_bought;
    s.total_sold = total_sold;
    s.rebalance_count = rebalance_count;
    s.needs_rebalance = std::abs(s.ratio) >= cfg.rebalance_threshold;
    s.emergency = std::abs(s.ratio) >= cfg.emergency_threshold;
    return s;
}

inventory_config InventoryManager::config() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cfg;
}

void InventoryManager::update_config(inventory_config config) {
    config.validate();

    std::lock_guard<std::mutex> lock(mutex);
    if (config.symbol != cfg.symbol) {
        throw InvalidConfiguration("cannot change inventory symbol from " + cfg.symbol + " to " + config.symbol);
    }
    cfg = std::move(config);
    logger->info("Inventory config for {} updated: max={}, mode={}, skew_factor={}",
        cfg.symbol, cfg.max_inventory, to_string(cfg.skew_mode), cfg.skew_factor);
}

} // namespace kestrel::inv
