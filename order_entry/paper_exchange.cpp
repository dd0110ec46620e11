#include "paper_exchange.H"

#include "common/errors.H"
#include "common/utils.H"

#include <cmath>

namespace kestrel::oe {

PaperExchange::PaperExchange(paper_exchange_config config, md::OrderBookManager& books,
                             std::shared_ptr<spdlog::logger> logger, EventQueue* events)
    : config(std::move(config)), books(books), logger(logger), events(events), cash(this->config.initial_balance) {
    if (this->config.initial_balance < 0 || this->config.commission_rate < 0 || this->config.slippage < 0) {
        throw InvalidConfiguration("paper exchange balance, commission and slippage must be non-negative");
    }
    logger->info("Paper exchange {} started with {} {}", this->config.name, cash, this->config.quote_asset);
}

order_report PaperExchange::reject_locked(paper_order& o, const char* reason) {
    o.report.status = ORDER_STATUS::REJECTED;
    logger->warn("Paper order {} rejected: {}", o.report.client_order_id, reason);
    return o.report;
}

order_report PaperExchange::submit_order(const order_request& request, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);

    if (!request.client_order_id.empty() && exchange_id_by_client.count(request.client_order_id)) {
        throw ExchangeError(EXCHANGE_ERROR::REJECTED, "duplicate client order id " + request.client_order_id);
    }

    paper_order o;
    o.sequence = ++order_counter;
    o.report.exchange_order_id = "paper-" + std::to_string(o.sequence);
    o.report.client_order_id = request.client_order_id;
    o.report.symbol = request.symbol;
    o.report.side = request.side;
    o.report.status = ORDER_STATUS::SUBMITTED;
    o.report.quantity = request.quantity;
    o.report.timestamp = epoch_nanos();
    o.type = request.type;
    o.time_in_force = request.time_in_force;

    const std::string id = o.report.exchange_order_id;
    paper_order& po = orders.emplace(id, std::move(o)).first->second;
    if (!request.client_order_id.empty()) {
        exchange_id_by_client[request.client_order_id] = id;
    }

    if (!(request.quantity > 0)) {
        return reject_locked(po, "quantity must be positive");
    }

    const bool buy = request.side == SIDE::BUY;
    const md::OrderBook* book = books.get(request.symbol);
    std::optional<md::PriceLevel> touch;
    if (book) {
        touch = buy ? book->get_best_ask() : book->get_best_bid();
    }

    if (request.type == ORDER_TYPE::MARKET) {
        if (!touch) {
            return reject_locked(po, "no price available for market order");
        }
        double price = buy ? touch->price * (1 + config.slippage) : touch->price * (1 - config.slippage);
        if (buy && required_cash(price * request.quantity) > cash - locked_cash) {
            return reject_locked(po, "insufficient balance");
        }
        fill_locked(po, price);
        return po.report;
    }

    if (!request.price || !(*request.price > 0)) {
        return reject_locked(po, "limit order needs a positive price");
    }
    po.price = *request.price;

    bool crosses = touch && (buy ? touch->price <= po.price : touch->price >= po.price);
    if (crosses && po.time_in_force == TIME_IN_FORCE::ALO) {
        return reject_locked(po, "post only order would cross");
    }

    double needed = buy ? required_cash(po.price * request.quantity) : 0;
    if (needed > cash - locked_cash) {
        return reject_locked(po, "insufficient balance");
    }

    if (crosses) {
        fill_locked(po, po.price);
        return po.report;
    }

    if (po.time_in_force == TIME_IN_FORCE::IOC || po.time_in_force == TIME_IN_FORCE::FOK) {
        po.report.status = ORDER_STATUS::CANCELLED;
        logger->info("Paper order {} expired without a fill", id);
        return po.report;
    }

    po.locked = needed;
    locked_cash += needed;
    resting[po.sequence] = &po;
    logger->info("Paper order {} resting {} {} {} @ {}", id, to_string(po.report.side), po.report.quantity,
                 po.report.symbol, po.price);
    return po.report;
}

void PaperExchange::fill_locked(paper_order& o, double price) {
    double quantity = o.report.quantity - o.report.filled_quantity;
    double notional = quantity * price;
    double commission = notional * config.commission_rate;
    double signed_quantity = o.report.side == SIDE::BUY ? quantity : -quantity;

    if (o.report.side == SIDE::BUY) {
        cash -= notional + commission;
    } else {
        cash += notional - commission;
    }
    locked_cash -= o.locked;
    o.locked = 0;
    commission_total += commission;

    holding& h = holdings[o.report.symbol];
    double before = h.quantity;
    double after = before + signed_quantity;
    if (before == 0 || before * signed_quantity > 0) {
        h.entry_price = (std::abs(before) * h.entry_price + quantity * price) / std::abs(after);
    } else if (std::abs(after) < 1e-12) {
        after = 0;
        h.entry_price = 0;
    } else if (before * after < 0) {
        h.entry_price = price;
    }
    h.quantity = after;

    o.report.filled_quantity = o.report.quantity;
    o.report.avg_fill_price = price;
    o.report.status = ORDER_STATUS::FILLED;
    o.report.timestamp = epoch_nanos();
    resting.erase(o.sequence);

    logger->info("Paper fill {} {} {} {} @ {} commission {}", o.report.exchange_order_id, to_string(o.report.side),
                 quantity, o.report.symbol, price, commission);

    if (events) {
        events->push(order_fill_event{o.report.exchange_order_id, quantity, price, o.report.timestamp,
                                      o.report.filled_quantity});
    }
}

size_t PaperExchange::process() {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<paper_order*> crossed;
    for (auto& [sequence, o] : resting) {
        const md::OrderBook* book = books.get(o->report.symbol);
        if (!book) {
            continue;
        }
        if (o->report.side == SIDE::BUY) {
            auto ask = book->get_best_ask();
            if (ask && ask->price <= o->price) {
                crossed.push_back(o);
            }
        } else {
            auto bid = book->get_best_bid();
            if (bid && bid->price >= o->price) {
                crossed.push_back(o);
            }
        }
    }

    for (paper_order* o : crossed) {
        fill_locked(*o, o->price);
    }
    return crossed.size();
}

PaperExchange::paper_order& PaperExchange::find_locked(const std::string& exchange_order_id) {
    auto it = orders.find(exchange_order_id);
    if (it == orders.end()) {
        throw ExchangeError(EXCHANGE_ERROR::REJECTED, "unknown order " + exchange_order_id);
    }
    return it->second;
}

bool PaperExchange::cancel_order(const std::string& symbol, const std::string& exchange_order_id, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = orders.find(exchange_order_id);
    if (it == orders.end() || it->second.report.symbol != symbol || !resting.count(it->second.sequence)) {
        logger->warn("Paper cancel for {} {} not confirmed", symbol, exchange_order_id);
        return false;
    }

    paper_order& o = it->second;
    locked_cash -= o.locked;
    o.locked = 0;
    o.report.status = ORDER_STATUS::CANCELLED;
    o.report.timestamp = epoch_nanos();
    resting.erase(o.sequence);

    if (events) {
        events->push(order_update_event{o.report.exchange_order_id, o.report.status, o.report.filled_quantity,
                                        o.report.avg_fill_price, o.report.timestamp});
    }
    return true;
}

std::vector<std::string> PaperExchange::cancel_all_orders(const std::string& symbol, std::chrono::milliseconds timeout) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [sequence, o] : resting) {
            if (o->report.symbol == symbol) {
                ids.push_back(o->report.exchange_order_id);
            }
        }
    }

    std::vector<std::string> cancelled;
    for (const auto& id : ids) {
        if (cancel_order(symbol, id, timeout)) {
            cancelled.push_back(id);
        }
    }
    return cancelled;
}

order_report PaperExchange::get_order(const std::string& symbol, const std::string& exchange_order_id, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);
    const paper_order& o = find_locked(exchange_order_id);
    if (o.report.symbol != symbol) {
        throw ExchangeError(EXCHANGE_ERROR::REJECTED, "order " + exchange_order_id + " is not on " + symbol);
    }
    return o.report;
}

std::optional<order_report> PaperExchange::find_order_by_client_id(const std::string& symbol, const std::string& client_order_id,
                                                                   std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = exchange_id_by_client.find(client_order_id);
    if (it == exchange_id_by_client.end()) {
        return std::nullopt;
    }
    const paper_order& o = find_locked(it->second);
    if (o.report.symbol != symbol) {
        return std::nullopt;
    }
    return o.report;
}

std::vector<order_report> PaperExchange::get_open_orders(const std::optional<std::string>& symbol, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<order_report> open;
    for (const auto& [sequence, o] : resting) {
        if (!symbol || o->report.symbol == *symbol) {
            open.push_back(o->report);
        }
    }
    return open;
}

std::vector<balance> PaperExchange::get_balance(std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);
    return {balance{config.quote_asset, cash - locked_cash, locked_cash}};
}

std::vector<position> PaperExchange::get_positions(std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<position> positions;
    for (const auto& [symbol, h] : holdings) {
        if (h.quantity == 0) {
            continue;
        }
        position p{symbol, h.quantity, h.entry_price, 0};
        const md::OrderBook* book = books.get(symbol);
        if (book) {
            auto mid = book->get_mid_price();
            if (mid) {
                p.unrealized_pnl = (*mid - h.entry_price) * h.quantity;
            }
        }
        positions.push_back(p);
    }
    return positions;
}

double PaperExchange::commission_paid() const {
    std::lock_guard<std::mutex> lock(mutex);
    return commission_total;
}

} // namespace kestrel::oe
