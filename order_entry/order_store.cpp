#include "order_store.H"

#include "common/errors.H"

#include <algorithm>

namespace kestrel::oe {

OrderStore::OrderStore(std::shared_ptr<spdlog::logger> logger, size_t max_history_per_symbol)
    : logger(logger), max_history_per_symbol(max_history_per_symbol) {
    if (max_history_per_symbol == 0) {
        throw InvalidConfiguration("order history must retain at least one order per symbol");
    }
}

const order& OrderStore::add(order o) {
    if (o.client_order_id.empty()) {
        throw ValidationError("client order id is empty");
    }
    if (by_client_id.count(o.client_order_id)) {
        throw DuplicateOrder(o.client_order_id);
    }
    if (o.exchange_order_id && by_exchange_id.count(*o.exchange_order_id)) {
        throw DuplicateOrder(*o.exchange_order_id);
    }

    auto owned = std::make_unique<order>(std::move(o));
    order* raw = owned.get();
    auto client_it = by_client_id.emplace(raw->client_order_id, std::move(owned)).first;

    bool indexed = false;
    try {
        if (raw->exchange_order_id) {
            by_exchange_id.emplace(*raw->exchange_order_id, raw);
            indexed = true;
        }
        if (is_terminal(raw->status)) {
            history_by_symbol[raw->symbol].push_back(raw);
        } else {
            active.insert(raw);
        }
    } catch (...) {
        if (indexed) {
            by_exchange_id.erase(*raw->exchange_order_id);
        }
        by_client_id.erase(client_it);
        throw;
    }

    if (is_terminal(raw->status)) {
        trim_history(raw->symbol);
    }
    return *raw;
}

void OrderStore::assign_exchange_id(const std::string& client_order_id, const std::string& exchange_order_id) {
    auto it = by_client_id.find(client_order_id);
    if (it == by_client_id.end()) {
        throw OrderNotFound(client_order_id);
    }
    order* stored = it->second.get();

    if (stored->exchange_order_id) {
        if (*stored->exchange_order_id == exchange_order_id) {
            return;
        }
        throw ValidationError("order " + client_order_id + " already has exchange id " + *stored->exchange_order_id);
    }

    auto existing = by_exchange_id.find(exchange_order_id);
    if (existing != by_exchange_id.end()) {
        throw DuplicateOrder(exchange_order_id);
    }

    std::optional<std::string> id = exchange_order_id;
    by_exchange_id.emplace(exchange_order_id, stored);
    stored->exchange_order_id = std::move(id);
}

const order& OrderStore::update(const order& updated) {
    auto it = by_client_id.find(updated.client_order_id);
    if (it == by_client_id.end()) {
        throw OrderNotFound(updated.client_order_id);
    }
    order* stored = it->second.get();

    if (updated.symbol != stored->symbol) {
        throw ValidationError("order " + updated.client_order_id + " cannot move from " + stored->symbol + " to " + updated.symbol);
    }

    bool was_terminal = is_terminal(stored->status);
    bool now_terminal = is_terminal(updated.status);
    if (was_terminal && !now_terminal) {
        throw InvalidOrderStatus(updated.client_order_id, to_string(updated.status));
    }

    bool needs_index = false;
    if (updated.exchange_order_id != stored->exchange_order_id) {
        if (stored->exchange_order_id || !updated.exchange_order_id) {
            throw ValidationError("exchange id of order " + updated.client_order_id + " cannot change");
        }
        auto existing = by_exchange_id.find(*updated.exchange_order_id);
        if (existing != by_exchange_id.end()) {
            throw DuplicateOrder(*updated.exchange_order_id);
        }
        needs_index = true;
    }

    order copy = updated;

    bool indexed = false;
    try {
        if (needs_index) {
            by_exchange_id.emplace(*copy.exchange_order_id, stored);
            indexed = true;
        }
        if (!was_terminal && now_terminal) {
            history_by_symbol[stored->symbol].push_back(stored);
        }
    } catch (...) {
        if (indexed) {
            by_exchange_id.erase(*copy.exchange_order_id);
        }
        throw;
    }

    if (!was_terminal && now_terminal) {
        active.erase(stored);
    }
    *stored = std::move(copy);

    if (!was_terminal && now_terminal) {
        logger->info("Order {} moved to history as {}", stored->client_order_id, to_string(stored->status));
        trim_history(stored->symbol);
    }
    return *stored;
}

const order& OrderStore::reopen(const order& updated) {
    auto it = by_client_id.find(updated.client_order_id);
    if (it == by_client_id.end()) {
        throw OrderNotFound(updated.client_order_id);
    }
    order* stored = it->second.get();

    if (!is_terminal(stored->status) || is_terminal(updated.status)) {
        throw InvalidOrderStatus(updated.client_order_id, to_string(updated.status));
    }
    if (updated.symbol != stored->symbol || updated.exchange_order_id != stored->exchange_order_id) {
        throw ValidationError("order " + updated.client_order_id + " can only reopen with its own symbol and ids");
    }

    active.insert(stored);
    auto& history = history_by_symbol[stored->symbol];
    history.erase(std::remove(history.begin(), history.end(), stored), history.end());
    *stored = updated;

    logger->warn("Order {} reopened as {}", stored->client_order_id, to_string(stored->status));
    return *stored;
}

void OrderStore::trim_history(const std::string& symbol) {
    auto it = history_by_symbol.find(symbol);
    if (it == history_by_symbol.end() || it->second.size() <= max_history_per_symbol) {
        return;
    }

    auto& history = it->second;
    size_t excess = history.size() - max_history_per_symbol;
    for (size_t i = 0; i < excess; i++) {
        order* oldest = history[i];
        if (oldest->exchange_order_id) {
            by_exchange_id.erase(*oldest->exchange_order_id);
        }
        std::string client_order_id = oldest->client_order_id;
        by_client_id.erase(client_order_id);
    }
    history.erase(history.begin(), history.begin() + excess);
    logger->debug("Trimmed {} orders from {} history", excess, symbol);
}

const order* OrderStore::find(const std::string& client_order_id) const {
    auto it = by_client_id.find(client_order_id);
    return it == by_client_id.end() ? nullptr : it->second.get();
}

const order* OrderStore::find_by_exchange_id(const std::string& exchange_order_id) const {
    auto it = by_exchange_id.find(exchange_order_id);
    return it == by_exchange_id.end() ? nullptr : it->second;
}

std::vector<order> OrderStore::get_active_orders(const std::optional<std::string>& symbol) const {
    std::vector<const order*> selected;
    selected.reserve(active.size());
    for (const order* o : active) {
        if (!symbol || o->symbol == *symbol) {
            selected.push_back(o);
        }
    }

    std::sort(selected.begin(), selected.end(), [](const order* a, const order* b) {
        if (a->created_time != b->created_time) {
            return a->created_time < b->created_time;
        }
        return a->client_order_id < b->client_order_id;
    });

    std::vector<order> result;
    result.reserve(selected.size());
    for (const order* o : selected) {
        result.push_back(*o);
    }
    return result;
}

std::vector<order> OrderStore::get_order_history(const std::optional<std::string>& symbol, size_t offset, size_t limit) const {
    std::vector<const order*> selected;

    if (symbol) {
        auto it = history_by_symbol.find(*symbol);
        if (it != history_by_symbol.end()) {
            selected.assign(it->second.rbegin(), it->second.rend());
        }
    } else {
        for (const auto& [sym, history] : history_by_symbol) {
            selected.insert(selected.end(), history.begin(), history.end());
        }
        std::sort(selected.begin(), selected.end(), [](const order* a, const order* b) {
            if (a->updated_time != b->updated_time) {
                return a->updated_time > b->updated_time;
            }
            return a->client_order_id > b->client_order_id;
        });
    }

    std::vector<order> result;
    for (size_t i = offset; i < selected.size() && result.size() < limit; i++) {
        result.push_back(*selected[i]);
    }
    return result;
}

size_t OrderStore::history_count() const {
    size_t count = 0;
    for (const auto& [symbol, history] : history_by_symbol) {
        count += history.size();
    }
    return count;
}

} // namespace kestrel::oe
