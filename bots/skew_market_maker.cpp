#include "skew_market_maker.H"

#include "common/errors.H"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace kestrel::bots {

static constexpr double ROUNDING_EPSILON = 1e-9;
static constexpr uint32_t MAX_ORDER_LEVELS = 20;

void mm_params::validate() const {
    if (!(order_size > 0)) {
        throw InvalidConfiguration("order_size must be positive");
    }
    if (!(spread_bps > 0)) {
        throw InvalidConfiguration("spread_bps must be positive");
    }
    if (order_levels < 1 || order_levels > MAX_ORDER_LEVELS) {
        throw InvalidConfiguration("order_levels must be between 1 and " + std::to_string(MAX_ORDER_LEVELS));
    }
    if (level_spread_bps < 0) {
        throw InvalidConfiguration("level_spread_bps must be non-negative");
    }
    if (requote_bps < 0) {
        throw InvalidConfiguration("requote_bps must be non-negative");
    }
}

mm_params mm_params_from_json(const nlohmann::json& j, const mm_params& base) {
    mm_params p = base;
    try {
        if (!j.is_object()) {
            throw InvalidConfiguration("strategy parameters must be an object");
        }
        if (j.contains("order_size")) {
            p.order_size = j.at("order_size").get<double>();
        }
        if (j.contains("spread_bps")) {
            p.spread_bps = j.at("spread_bps").get<double>();
        }
        if (j.contains("order_levels")) {
            p.order_levels = j.at("order_levels").get<uint32_t>();
        }
        if (j.contains("level_spread_bps")) {
            p.level_spread_bps = j.at("level_spread_bps").get<double>();
        }
        if (j.contains("requote_bps")) {
            p.requote_bps = j.at("requote_bps").get<double>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfiguration(std::string("strategy parameters: ") + e.what());
    }
    p.validate();
    return p;
}

nlohmann::json to_json(const mm_params& params) {
    return {
        {"order_size", params.order_size},
        {"spread_bps", params.spread_bps},
        {"order_levels", params.order_levels},
        {"level_spread_bps", params.level_spread_bps},
        {"requote_bps", params.requote_bps},
    };
}

double round_to_tick_size(double price, double tick_size, SIDE side) {
    if (tick_size <= 0) {
        return price;
    }
    double ticks = price / tick_size;
    if (side == SIDE::BUY) {
        return std::floor(ticks + ROUNDING_EPSILON) * tick_size;
    }
    return std::ceil(ticks - ROUNDING_EPSILON) * tick_size;
}

double round_to_lot_size(double quantity, double lot_size) {
    if (lot_size <= 0) {
        return quantity;
    }
    return std::floor(quantity / lot_size + ROUNDING_EPSILON) * lot_size;
}

SkewMarketMaker::SkewMarketMaker(symbol_definition symbol, mm_params params, oe::OrderManager& orders,
                                 md::OrderBookManager& books, inv::InventoryManager& inventory,
                                 std::shared_ptr<spdlog::logger> logger)
    : symbol(std::move(symbol)), orders(orders), books(books), inventory(inventory), logger(logger),
      params(params) {
    this->params.validate();
    if (inventory.config().symbol != this->symbol.symbol) {
        throw InvalidConfiguration("inventory for " + inventory.config().symbol + " cannot back quotes on " + this->symbol.symbol);
    }
}

void SkewMarketMaker::validate_params(const nlohmann::json& j) const {
    mm_params base;
    {
        std::lock_guard<std::mutex> lock(mutex);
        base = params;
    }
    mm_params_from_json(j, base);
}

void SkewMarketMaker::update_params(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex);
    mm_params base = pending_params ? *pending_params : params;
    pending_params = mm_params_from_json(j, base);
    logger->info("Staged new parameters for {}: {}", symbol.symbol, to_json(*pending_params).dump());
}

nlohmann::json SkewMarketMaker::get_params() const {
    std::lock_guard<std::mutex> lock(mutex);
    return to_json(params);
}

mm_params SkewMarketMaker::apply_pending_params() {
    std::lock_guard<std::mutex> lock(mutex);
    if (pending_params) {
        params = *pending_params;
        pending_params.reset();
        logger->info("Applied new parameters for {}", symbol.symbol);
    }
    return params;
}

void SkewMarketMaker::process() {
    mm_params p = apply_pending_params();
    reconcile();

    const md::OrderBook* book = books.get(symbol.symbol);
    std::optional<double> mid = book ? book->get_mid_price() : std::nullopt;
    if (!mid) {
        logger->debug("No two sided book for {}, not quoting", symbol.symbol);
        return;
    }

    bool quote_bids = true;
    bool quote_asks = true;
    inv::rebalance_action action = inventory.get_rebalance_action();
    switch (action.action_type) {
        case inv::REBALANCE_ACTION::NONE:
            break;
        case inv::REBALANCE_ACTION::EMERGENCY_STOP:
            logger->warn("Inventory emergency on {} at {}, pulling quotes", symbol.symbol, inventory.current_inventory());
            cancel_all_quotes();
            rebalance(action, "emergency");
            return;
        case inv::REBALANCE_ACTION::MARKET_ORDER:
            rebalance(action, "rebalance");
            [[fallthrough]];
        case inv::REBALANCE_ACTION::LIMIT_ORDER:
            // only the side that brings inventory back
            if (action.side == SIDE::SELL) {
                quote_bids = false;
            } else {
                quote_asks = false;
            }
            break;
    }

    requote(compute_targets(*mid, p, quote_bids, quote_asks), *mid, p);
}

// Drops finished quotes, resolves orders stuck in PENDING and cancels live
// orders on this symbol that are not tracked (a submit that timed out).
void SkewMarketMaker::reconcile() {
    std::vector<quote> current;
    std::optional<std::string> rebalance_id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        current = working;
        rebalance_id = rebalance_order_id;
    }

    for (const auto& q : current) {
        auto o = orders.get_order(q.client_order_id);
        if (!o || oe::is_terminal(o->status)) {
            forget_quote(q.client_order_id);
        }
    }

    std::unordered_set<std::string> known;
    for (const auto& q : current) {
        known.insert(q.client_order_id);
    }
    if (rebalance_id) {
        known.insert(*rebalance_id);
    }

    for (const auto& o : orders.get_active_orders(symbol.symbol)) {
        try {
            if (o.status == oe::ORDER_STATUS::PENDING) {
                auto refreshed = orders.refresh_order_status(o.client_order_id);
                logger->info("Reconciled pending order {} as {}", o.client_order_id, oe::to_string(refreshed.status));
            } else if (!known.count(o.client_order_id)) {
                logger->warn("Cancelling untracked order {} on {}", o.client_order_id, symbol.symbol);
                orders.cancel_order(o.client_order_id);
            }
        } catch (const ExchangeError& e) {
            logger->error("Reconcile of {} failed: {}", o.client_order_id, e.what());
        } catch (const InvalidOrderStatus& e) {
            logger->warn("Reconcile of {} skipped: {}", o.client_order_id, e.what());
        } catch (const OrderNotFound& e) {
            logger->warn("Reconcile of {} skipped: {}", o.client_order_id, e.what());
        }
    }

    if (rebalance_id) {
        auto o = orders.get_order(*rebalance_id);
        if (!o || oe::is_terminal(o->status)) {
            std::lock_guard<std::mutex> lock(mutex);
            if (rebalance_order_id == rebalance_id) {
                rebalance_order_id.reset();
            }
        }
    }
}

std::vector<SkewMarketMaker::quote_target> SkewMarketMaker::compute_targets(double mid, const mm_params& p,
                                                                          bool quote_bids, bool quote_asks) const {
    double half_spread = mid * p.spread_bps / 20000.0;
    inv::quote_pair adjusted = inventory.adjust_quotes(mid - half_spread, mid + half_spread, mid);

    std::vector<quote_target> targets;
    for (uint32_t level = 0; level < p.order_levels; level++) {
        double offset = mid * p.level_spread_bps * level / 10000.0;
        double bid = round_to_tick_size(adjusted.bid - offset, symbol.tick_size, SIDE::BUY);
        double ask = round_to_tick_size(adjusted.ask + offset, symbol.tick_size, SIDE::SELL);
        if (ask <= bid) {
            ask = bid + symbol.tick_size;
        }

        if (quote_bids && bid > 0) {
            targets.push_back({SIDE::BUY, level, bid});
        }
        if (quote_asks) {
            targets.push_back({SIDE::SELL, level, ask});
        }
    }
    return targets;
}

void SkewMarketMaker::requote(const std::vector<quote_target>& targets, double mid, const mm_params& p) {
    std::vector<quote> current = quotes();
    std::vector<bool> covered(targets.size(), false);

    for (const auto& q : current) {
        auto it = std::find_if(targets.begin(), targets.end(), [&q](const quote_target& t) {
            return t.side == q.side && t.level == q.level;
        });

        if (it != targets.end()) {
            double moved_bps = std::abs(q.price - it->price) / mid * 10000.0;
            if (moved_bps <= p.requote_bps) {
                covered[it - targets.begin()] = true;
                continue;
            }
            logger->info("Requoting {} {} level {} from {} to {}", symbol.symbol, to_string(q.side), q.level, q.price, it->price);
        }

        if (!cancel_quote(q) && it != targets.end()) {
            // still working at the old price, try again next cycle
            covered[it - targets.begin()] = true;
        }
    }

    for (size_t i = 0; i < targets.size(); i++) {
        if (!covered[i]) {
            place_quote(targets[i], p);
        }
    }
}

void SkewMarketMaker::rebalance(const inv::rebalance_action& action, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (rebalance_order_id) {
            logger->debug("Rebalance order {} still working", *rebalance_order_id);
            return;
        }
    }

    double quantity = round_to_lot_size(action.quantity, symbol.lot_size);
    if (quantity < symbol.min_quantity) {
        return;
    }
    quantity = std::min(quantity, symbol.max_quantity);

    logger->warn("Sending {} market order {} {} {}", reason, to_string(action.side), quantity, symbol.symbol);
    try {
        oe::order o = orders.submit_order(action.side, oe::ORDER_TYPE::MARKET, std::nullopt, quantity, symbol.symbol);
        inventory.record_rebalance();
        std::lock_guard<std::mutex> lock(mutex);
        counters.rebalances++;
        if (!oe::is_terminal(o.status)) {
            rebalance_order_id = o.client_order_id;
        }
    } catch (const ValidationError& e) {
        logger->error("{} order on {} failed validation: {}", reason, symbol.symbol, e.what());
    } catch (const ExchangeError& e) {
        logger->error("{} order on {} failed: {}", reason, symbol.symbol, e.what());
    }
}

void SkewMarketMaker::cancel_all_quotes() {
    for (const auto& q : quotes()) {
        cancel_quote(q);
    }
}

bool SkewMarketMaker::cancel_quote(const quote& q) {
    try {
        oe::order o = orders.cancel_order(q.client_order_id);
        {
            std::lock_guard<std::mutex> lock(mutex);
            counters.cancels_sent++;
        }
        if (oe::is_terminal(o.status)) {
            forget_quote(q.client_order_id);
            return true;
        }
        return false;
    } catch (const OrderNotFound&) {
        forget_quote(q.client_order_id);
        return true;
    } catch (const InvalidOrderStatus&) {
        auto o = orders.get_order(q.client_order_id);
        if (!o || oe::is_terminal(o->status)) {
            forget_quote(q.client_order_id);
            return true;
        }
        return false;
    } catch (const ExchangeError& e) {
        logger->error("Cancel of {} on {} failed: {}", q.client_order_id, symbol.symbol, e.what());
        return false;
    }
}

void SkewMarketMaker::place_quote(const quote_target& target, const mm_params& p) {
    double quantity = round_to_lot_size(p.order_size, symbol.lot_size);
    try {
        oe::order o = orders.submit_order(target.side, oe::ORDER_TYPE::LIMIT, target.price, quantity, symbol.symbol);
        std::lock_guard<std::mutex> lock(mutex);
        counters.quotes_sent++;
        if (!oe::is_terminal(o.status)) {
            working.push_back({o.client_order_id, target.side, target.level, target.price});
        }
    } catch (const ValidationError& e) {
        logger->error("Quote {} {} @ {} on {} failed validation: {}", to_string(target.side), quantity, target.price,
                      symbol.symbol, e.what());
    } catch (const ExchangeError& e) {
        logger->error("Quote {} {} @ {} on {} failed: {}", to_string(target.side), quantity, target.price,
                      symbol.symbol, e.what());
    }
}

void SkewMarketMaker::forget_quote(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex);
    working.erase(std::remove_if(working.begin(), working.end(),
        [&client_order_id](const quote& q) { return q.client_order_id == client_order_id; }), working.end());
}

void SkewMarketMaker::on_order_update(const oe::order& o) {
    if (o.symbol != symbol.symbol || !oe::is_terminal(o.status)) {
        return;
    }
    forget_quote(o.client_order_id);

    std::lock_guard<std::mutex> lock(mutex);
    if (rebalance_order_id && *rebalance_order_id == o.client_order_id) {
        rebalance_order_id.reset();
    }
}

void SkewMarketMaker::on_order_fill(const oe::order& o) {
    if (o.symbol != symbol.symbol) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        counters.fills++;
    }
    logger->info("{} {} {} filled at {}, inventory {} skew {}", symbol.symbol, to_string(o.side), o.filled_quantity,
                 o.avg_fill_price, inventory.current_inventory(), inventory.calculate_skew());
}

void SkewMarketMaker::shutdown() {
    try {
        size_t cancelled = orders.cancel_all_orders(symbol.symbol);
        logger->info("Cancelled {} orders on {} at shutdown", cancelled, symbol.symbol);
    } catch (const ExchangeError& e) {
        logger->error("Cancel all on {} at shutdown failed: {}", symbol.symbol, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex);
    working.clear();
}

std::vector<SkewMarketMaker::quote> SkewMarketMaker::quotes() const {
    std::lock_guard<std::mutex> lock(mutex);
    return working;
}

mm_stats SkewMarketMaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    mm_stats s = counters;
    s.working_quotes = working.size();
    return s;
}

} // namespace kestrel::bots
