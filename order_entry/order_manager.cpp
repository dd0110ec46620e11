#include "order_manager.H"

#include "common/errors.H"
#include "common/utils.H"

#include <cmath>
#include <set>

namespace kestrel::oe {

static constexpr double QTY_EPSILON = 1e-9;
static constexpr size_t MAX_PARKED_ORDERS = 1024;

OrderManager::OrderManager(Exchange& exchange, const OrderValidator& validator, std::shared_ptr<spdlog::logger> logger,
                           std::chrono::milliseconds timeout, size_t max_history_per_symbol)
    : exchange(exchange), validator(validator), logger(logger), timeout(timeout),
      store(logger, max_history_per_symbol) {}

void OrderManager::track_inventory(const std::string& symbol, inv::InventoryManager& inventory) {
    std::lock_guard<std::mutex> lock(mutex);
    inventories[symbol] = &inventory;
}

void OrderManager::set_on_order_update(OrderCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    on_order_update = std::move(callback);
}

void OrderManager::set_on_order_fill(OrderCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    on_order_fill = std::move(callback);
}

std::string OrderManager::next_client_order_id_locked() {
    return "order-" + std::to_string(epoch_millis()) + "-" + std::to_string(++order_counter);
}

order OrderManager::submit_order(SIDE side, ORDER_TYPE type, std::optional<double> price, double quantity,
                                 const std::string& symbol, TIME_IN_FORCE time_in_force) {
    order_request request;
    request.symbol = symbol;
    request.side = side;
    request.type = type;
    request.time_in_force = time_in_force;
    request.price = price;
    request.quantity = quantity;

    REJECT_REASON reason = validator.validate_new_order(request);
    if (reason != REJECT_REASON::NONE) {
        throw ValidationError(std::string(to_string(reason)) + " for " + symbol);
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        request.client_order_id = next_client_order_id_locked();

        order o;
        o.client_order_id = request.client_order_id;
        o.symbol = symbol;
        o.side = side;
        o.type = type;
        o.time_in_force = time_in_force;
        o.price = price;
        o.quantity = quantity;
        o.status = ORDER_STATUS::PENDING;
        o.created_time = epoch_nanos();
        o.updated_time = o.created_time;
        store.add(std::move(o));
        in_flight.insert(request.client_order_id);
    }

    logger->info("Submitting order {}: {} {} {} {} @ {}", request.client_order_id, symbol, to_string(side),
        to_string(type), quantity, price ? std::to_string(*price) : "market");

    order_report report;
    try {
        report = exchange.submit_order(request, timeout);
    } catch (const std::exception& e) {
        logger->error("Submit of {} to {} failed, order left pending: {}", request.client_order_id, exchange.name(), e.what());
        std::lock_guard<std::mutex> lock(mutex);
        in_flight.erase(request.client_order_id);
        throw;
    }

    notifications notes;
    order result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight.erase(request.client_order_id);
        apply_report_locked(request.client_order_id, report, notes);
        replay_parked_locked(report.exchange_order_id, notes);

        const order* stored = store.find(request.client_order_id);
        result = *stored;
        if (result.status == ORDER_STATUS::REJECTED) {
            ++rejected_count;
        } else {
            ++submitted_count;
        }
    }

    logger->info("Order {} acknowledged as {} with status {}", result.client_order_id,
        result.exchange_order_id.value_or(""), to_string(result.status));
    notify(notes);
    return result;
}

order OrderManager::cancel_order(const std::string& client_order_id) {
    std::string symbol;
    std::string exchange_order_id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const order* o = store.find(client_order_id);
        if (!o) {
            throw OrderNotFound(client_order_id);
        }
        if (!is_cancellable(o->status) || !o->exchange_order_id) {
            throw InvalidOrderStatus(client_order_id, to_string(o->status));
        }
        symbol = o->symbol;
        exchange_order_id = *o->exchange_order_id;
    }

    bool confirmed = false;
    try {
        confirmed = exchange.cancel_order(symbol, exchange_order_id, timeout);
    } catch (const std::exception& e) {
        logger->error("Cancel of {} failed: {}", client_order_id, e.what());
        throw;
    }

    notifications notes;
    order result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const order* o = store.find(client_order_id);
        if (!o) {
            throw OrderNotFound(client_order_id);
        }

        if (!confirmed) {
            logger->warn("Cancel of {} not confirmed by {}, status stays {}", client_order_id, exchange.name(), to_string(o->status));
        } else if (!is_terminal(o->status)) {
            order next = *o;
            next.status = ORDER_STATUS::CANCELLED;
            next.updated_time = epoch_nanos();
            commit_locked(*o, next, notes);
        }
        result = *store.find(client_order_id);
    }

    notify(notes);
    return result;
}

size_t OrderManager::cancel_all_orders(const std::optional<std::string>& symbol) {
    std::set<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& o : store.get_active_orders(symbol)) {
            if (is_cancellable(o.status)) {
                symbols.insert(o.symbol);
            }
        }
    }

    size_t cancelled = 0;
    for (const auto& sym : symbols) {
        std::vector<std::string> ids;
        try {
            ids = exchange.cancel_all_orders(sym, timeout);
        } catch (const std::exception& e) {
            logger->error("Cancel all on {} failed: {}", sym, e.what());
            throw;
        }

        notifications notes;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& id : ids) {
                const order* o = store.find_by_exchange_id(id);
                if (!o) {
                    logger->warn("Exchange cancelled unknown order {} on {}", id, sym);
                    continue;
                }
                if (is_terminal(o->status)) {
                    continue;
                }
                order next = *o;
                next.status = ORDER_STATUS::CANCELLED;
                next.updated_time = epoch_nanos();
                commit_locked(*o, next, notes);
                ++cancelled;
            }
        }
        notify(notes);
    }

    logger->info("Cancelled {} orders{}", cancelled, symbol ? " on " + *symbol : std::string());
    return cancelled;
}

order OrderManager::refresh_order_status(const std::string& client_order_id) {
    std::string symbol;
    std::optional<std::string> exchange_order_id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const order* o = store.find(client_order_id);
        if (!o) {
            throw OrderNotFound(client_order_id);
        }
        if (in_flight.count(client_order_id)) {
            logger->debug("Order {} submit in flight, not refreshing", client_order_id);
            return *o;
        }
        symbol = o->symbol;
        exchange_order_id = o->exchange_order_id;
    }

    std::optional<order_report> report;
    try {
        if (exchange_order_id) {
            report = exchange.get_order(symbol, *exchange_order_id, timeout);
        } else {
            report = exchange.find_order_by_client_id(symbol, client_order_id, timeout);
        }
    } catch (const std::exception& e) {
        logger->error("Refresh of {} failed: {}", client_order_id, e.what());
        throw;
    }

    notifications notes;
    order result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const order* o = store.find(client_order_id);
        if (!o) {
            throw OrderNotFound(client_order_id);
        }

        if (report) {
            apply_report_locked(client_order_id, *report, notes);
            replay_parked_locked(report->exchange_order_id, notes);
        } else if (o->status == ORDER_STATUS::PENDING && !in_flight.count(client_order_id)) {
            logger->warn("Order {} never reached {}, marking rejected", client_order_id, exchange.name());
            order next = *o;
            next.status = ORDER_STATUS::REJECTED;
            next.updated_time = epoch_nanos();
            commit_locked(*o, next, notes);
            presumed_rejected.insert(client_order_id);
        }
        result = *store.find(client_order_id);
    }

    notify(notes);
    return result;
}

void OrderManager::handle_order_update(const order_update_event& event) {
    notifications notes;
    {
        std::lock_guard<std::mutex> lock(mutex);
        apply_update_locked(event, notes);
    }
    notify(notes);
}

void OrderManager::handle_order_fill(const order_fill_event& event) {
    if (!(event.fill_quantity > 0) || !(event.fill_price > 0)) {
        logger->warn("Ignoring fill for {} with quantity {} price {}", event.exchange_order_id, event.fill_quantity, event.fill_price);
        return;
    }

    notifications notes;
    {
        std::lock_guard<std::mutex> lock(mutex);
        apply_fill_locked(event, notes);
    }
    notify(notes);
}

void OrderManager::apply_report_locked(const std::string& client_order_id, const order_report& report, notifications& notes) {
    const order* o = store.find(client_order_id);
    if (!o) {
        throw OrderNotFound(client_order_id);
    }

    if (!report.exchange_order_id.empty() && !o->exchange_order_id) {
        store.assign_exchange_id(client_order_id, report.exchange_order_id);
    }

    // the venue accepted it, it is no longer only ours
    ORDER_STATUS status = report.status == ORDER_STATUS::PENDING ? ORDER_STATUS::SUBMITTED : report.status;

    if (presumed_rejected.erase(client_order_id) && o->status == ORDER_STATUS::REJECTED
            && status != ORDER_STATUS::REJECTED) {
        logger->warn("Order {} presumed rejected is live on {} as {}", client_order_id, exchange.name(), to_string(status));
        order reopened = *o;
        reopened.status = ORDER_STATUS::SUBMITTED;
        reopened.updated_time = epoch_nanos();
        o = &store.reopen(reopened);
        if (!apply_state_locked(*o, status, report.filled_quantity, report.avg_fill_price, report.timestamp, notes)) {
            notes.push_back({*o, false});
        }
        return;
    }

    apply_state_locked(*o, status, report.filled_quantity, report.avg_fill_price, report.timestamp, notes);
}

void OrderManager::apply_update_locked(const order_update_event& event, notifications& notes) {
    const order* o = store.find_by_exchange_id(event.exchange_order_id);
    if (!o) {
        park_locked(event.exchange_order_id, event);
        return;
    }
    if (!apply_state_locked(*o, event.status, event.filled_quantity, event.avg_fill_price, event.timestamp, notes)) {
        notes.push_back({*o, false});
    }
}

bool OrderManager::apply_state_locked(const order& current, ORDER_STATUS status, double filled_quantity,
                                      double avg_fill_price, uint64_t timestamp, notifications& notes) {
    double delta = filled_quantity - current.filled_quantity;
    order next = current;
    if (delta < -QTY_EPSILON) {
        // fills only grow; the status still applies
        logger->warn("Stale fill state for {}: filled {} behind local {}", current.client_order_id, filled_quantity, current.filled_quantity);
    } else if (delta > QTY_EPSILON) {
        next.filled_quantity = filled_quantity;
        next.avg_fill_price = avg_fill_price > 0 ? avg_fill_price : current.avg_fill_price;
    }

    if (status == ORDER_STATUS::PENDING) {
        status = ORDER_STATUS::SUBMITTED;
    }
    if (status == ORDER_STATUS::SUBMITTED && next.filled_quantity > QTY_EPSILON) {
        status = ORDER_STATUS::PARTIALLY_FILLED;
    }

    if (is_terminal(current.status)) {
        // a terminal order only picks up late fills, or FILLED if the venue says so
        if (status == ORDER_STATUS::FILLED) {
            next.status = status;
        }
    } else {
        next.status = status;
    }

    if (next.status == current.status && next.filled_quantity == current.filled_quantity) {
        return false;
    }

    next.updated_time = timestamp ? timestamp : epoch_nanos();
    commit_locked(current, next, notes);
    return true;
}

void OrderManager::apply_fill_locked(const order_fill_event& event, notifications& notes) {
    const order* o = store.find_by_exchange_id(event.exchange_order_id);
    if (!o) {
        park_locked(event.exchange_order_id, event);
        return;
    }
    const order& current = *o;

    if (event.total_filled && *event.total_filled <= current.filled_quantity + QTY_EPSILON) {
        logger->debug("Fill for {} already applied, total {} local {}", current.client_order_id,
            *event.total_filled, current.filled_quantity);
        return;
    }

    order next = current;
    next.filled_quantity = current.filled_quantity + event.fill_quantity;
    next.avg_fill_price = (current.avg_fill_price * current.filled_quantity + event.fill_price * event.fill_quantity)
        / next.filled_quantity;

    ORDER_STATUS status = next.filled_quantity + QTY_EPSILON >= current.quantity
        ? ORDER_STATUS::FILLED : ORDER_STATUS::PARTIALLY_FILLED;
    if (!is_terminal(current.status) || status == ORDER_STATUS::FILLED) {
        next.status = status;
    }
    next.updated_time = event.timestamp ? event.timestamp : epoch_nanos();

    ++fill_count;
    logger->info("Order {} filled {} @ {}, total {} avg {}", current.client_order_id, event.fill_quantity,
        event.fill_price, next.filled_quantity, next.avg_fill_price);
    commit_locked(current, next, notes);
}

void OrderManager::commit_locked(const order& previous, const order& next, notifications& notes) {
    double delta = next.filled_quantity - previous.filled_quantity;
    ORDER_STATUS old_status = previous.status;
    SIDE side = previous.side;
    std::string symbol = previous.symbol;

    // previous refers into the store and is overwritten here
    const order& stored = store.update(next);

    if (delta > QTY_EPSILON) {
        auto it = inventories.find(symbol);
        if (it != inventories.end()) {
            it->second->update_inventory(side, delta);
        } else {
            logger->debug("No inventory tracked for {}", symbol);
        }
    }

    if (old_status != stored.status) {
        logger->info("Order {} {} -> {}", stored.client_order_id, to_string(old_status), to_string(stored.status));
    }

    notes.push_back({stored, stored.status == ORDER_STATUS::FILLED && old_status != ORDER_STATUS::FILLED});
}

void OrderManager::park_locked(const std::string& exchange_order_id, parked_event event) {
    auto it = parked.find(exchange_order_id);
    if (it == parked.end()) {
        if (parked_order.size() >= MAX_PARKED_ORDERS) {
            logger->warn("Dropping events parked for unknown order {}", parked_order.front());
            parked.erase(parked_order.front());
            parked_order.pop_front();
        }
        parked_order.push_back(exchange_order_id);
        it = parked.emplace(exchange_order_id, std::vector<parked_event>{}).first;
    }
    it->second.push_back(std::move(event));
    logger->warn("Event for unknown order {} parked", exchange_order_id);
}

void OrderManager::replay_parked_locked(const std::string& exchange_order_id, notifications& notes) {
    auto it = parked.find(exchange_order_id);
    if (it == parked.end()) {
        return;
    }

    std::vector<parked_event> events = std::move(it->second);
    parked.erase(it);
    for (auto order_it = parked_order.begin(); order_it != parked_order.end(); ++order_it) {
        if (*order_it == exchange_order_id) {
            parked_order.erase(order_it);
            break;
        }
    }

    logger->info("Replaying {} parked events for {}", events.size(), exchange_order_id);
    for (const auto& event : events) {
        if (std::holds_alternative<order_update_event>(event)) {
            apply_update_locked(std::get<order_update_event>(event), notes);
        } else {
            apply_fill_locked(std::get<order_fill_event>(event), notes);
        }
    }
}

void OrderManager::notify(const notifications& notes) {
    if (notes.empty()) {
        return;
    }

    OrderCallback update_cb;
    OrderCallback fill_cb;
    {
        std::lock_guard<std::mutex> lock(mutex);
        update_cb = on_order_update;
        fill_cb = on_order_fill;
    }

    for (const auto& note : notes) {
        if (update_cb) {
            update_cb(note.snapshot);
        }
        if (note.filled && fill_cb) {
            fill_cb(note.snapshot);
        }
    }
}

std::optional<order> OrderManager::get_order(const std::string& client_order_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const order* o = store.find(client_order_id);
    if (!o) {
        return std::nullopt;
    }
    return *o;
}

std::optional<order> OrderManager::get_order_by_exchange_id(const std::string& exchange_order_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const order* o = store.find_by_exchange_id(exchange_order_id);
    if (!o) {
        return std::nullopt;
    }
    return *o;
}

std::vector<order> OrderManager::get_active_orders(const std::optional<std::string>& symbol) const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.get_active_orders(symbol);
}

std::vector<order> OrderManager::get_order_history(const std::optional<std::string>& symbol, size_t offset, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.get_order_history(symbol, offset, limit);
}

order_manager_stats OrderManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    order_manager_stats s;
    s.active_count = store.active_count();
    s.history_count = store.history_count();
    s.submitted_count = submitted_count;
    s.rejected_count = rejected_count;
    s.fill_count = fill_count;
    s.parked_events = parked.size();
    return s;
}

} // namespace kestrel::oe
