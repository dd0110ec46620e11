#include "rest_exchange.H"

#include "common/errors.H"
#include "common/utils.H"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace kestrel::oe {

namespace {

// Error answered by the venue itself, with its numeric code.
class VenueError : public ExchangeError {
public:
    VenueError(EXCHANGE_ERROR kind, int code, const std::string& message)
        : ExchangeError(kind, "code " + std::to_string(code) + ": " + message), code(code) {}

    int code;
};

constexpr int UNKNOWN_ORDER = -2011;
constexpr int ORDER_DOES_NOT_EXIST = -2013;
constexpr int INVALID_SIGNATURE = -1022;
constexpr int INVALID_API_KEY = -2014;
constexpr int REJECTED_API_KEY = -2015;

double to_double(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

} // namespace

RestExchange::RestExchange(rest_exchange_config config, std::unique_ptr<HttpClient> http, std::shared_ptr<spdlog::logger> logger)
    : config(std::move(config)), http(std::move(http)), logger(logger),
      signer([key_env = this->config.api_key_env, secret_env = this->config.api_secret_env, logger]() {
          logger->info("Loading API credentials from {} and {}", key_env, secret_env);
          return HmacSigner::from_environment(key_env, secret_env);
      }) {}

std::string RestExchange::venue_symbol(const std::string& symbol) {
    std::string venue;
    venue.reserve(symbol.size());
    for (char c : symbol) {
        if (c != '-' && c != '/' && c != '_') {
            venue.push_back(c);
        }
    }
    return venue;
}

std::string RestExchange::format_decimal(double value) {
    std::string s = fmt::format("{:.8f}", value);
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    return s;
}

std::string RestExchange::build_query(const params& query) {
    std::string qs;
    for (const auto& [key, value] : query) {
        if (!qs.empty()) {
            qs += '&';
        }
        qs += key;
        qs += '=';
        qs += value;
    }
    return qs;
}

order_report RestExchange::parse_order(const nlohmann::json& j, const std::string& symbol) {
    try {
        order_report report;
        const auto& id = j.at("orderId");
        report.exchange_order_id = id.is_string() ? id.get<std::string>() : std::to_string(id.get<int64_t>());
        report.client_order_id = j.value("clientOrderId", std::string());
        report.symbol = symbol;
        report.side = side_from_string(j.at("side").get<std::string>());
        report.status = order_status_from_string(j.at("status").get<std::string>());
        report.quantity = to_double(j, "origQty");
        report.filled_quantity = to_double(j, "executedQty");

        double quote_qty = j.contains("cummulativeQuoteQty") ? to_double(j, "cummulativeQuoteQty") : 0;
        if (report.filled_quantity > 0 && quote_qty > 0) {
            report.avg_fill_price = quote_qty / report.filled_quantity;
        } else if (report.filled_quantity > 0 && j.contains("price")) {
            report.avg_fill_price = to_double(j, "price");
        }

        uint64_t millis = j.value("updateTime", j.value("transactTime", j.value("time", uint64_t{0})));
        report.timestamp = millis * 1000000ULL;
        return report;
    } catch (const nlohmann::json::exception& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad order payload: ") + e.what());
    } catch (const std::logic_error& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad order payload: ") + e.what());
    }
}

nlohmann::json RestExchange::parse_response(const std::string& method, const std::string& path, const http_response& response) const {
    if (response.status == 401 || response.status == 403) {
        throw ExchangeError(EXCHANGE_ERROR::AUTH, method + " " + path + " returned " + std::to_string(response.status));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        EXCHANGE_ERROR kind = response.status >= 500 ? EXCHANGE_ERROR::TRANSPORT : EXCHANGE_ERROR::PROTOCOL;
        throw ExchangeError(kind, method + " " + path + " returned " + std::to_string(response.status) + " with unreadable body");
    }

    bool venue_error = j.is_object() && j.contains("code") && j.at("code").is_number_integer() && j.at("code").get<int>() < 0;
    if (response.status >= 400 || venue_error) {
        int code = j.is_object() ? j.value("code", 0) : 0;
        std::string message = j.is_object() ? j.value("msg", std::string()) : std::string();

        EXCHANGE_ERROR kind = EXCHANGE_ERROR::REJECTED;
        if (code == INVALID_SIGNATURE || code == INVALID_API_KEY || code == REJECTED_API_KEY) {
            kind = EXCHANGE_ERROR::AUTH;
        } else if (response.status >= 500 || response.status == 429 || response.status == 418) {
            kind = EXCHANGE_ERROR::TRANSPORT;
        }
        logger->warn("{} {} failed with status {} code {}: {}", method, path, response.status, code, message);
        throw VenueError(kind, code, message);
    }
    return j;
}

nlohmann::json RestExchange::signed_request(const std::string& method, const std::string& path, params query,
                                            std::chrono::milliseconds timeout) {
    const HmacSigner& s = signer.get();

    query.emplace_back("recvWindow", std::to_string(config.recv_window_ms));
    query.emplace_back("timestamp", std::to_string(epoch_millis()));
    std::string qs = build_query(query);

    http_request request;
    request.method = method;
    request.url = config.base_url + path + "?" + qs + "&signature=" + s.sign(qs);
    request.headers.push_back("X-MBX-APIKEY: " + s.api_key());
    request.timeout = timeout;

    http_response response;
    {
        std::lock_guard<std::mutex> lock(http_mutex);
        response = http->perform(request);
    }
    return parse_response(method, path, response);
}

nlohmann::json RestExchange::public_request(const std::string& path, const params& query,
                                            std::chrono::milliseconds timeout) {
    http_request request;
    request.url = config.base_url + path + "?" + build_query(query);
    request.timeout = timeout;

    http_response response;
    {
        std::lock_guard<std::mutex> lock(http_mutex);
        response = http->perform(request);
    }
    return parse_response("GET", path, response);
}

void RestExchange::remember_symbol(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(symbol_mutex);
    symbols_by_venue.emplace(venue_symbol(symbol), symbol);
}

std::string RestExchange::local_symbol(const std::string& venue) const {
    std::lock_guard<std::mutex> lock(symbol_mutex);
    auto it = symbols_by_venue.find(venue);
    return it == symbols_by_venue.end() ? venue : it->second;
}

order_report RestExchange::submit_order(const order_request& request, std::chrono::milliseconds timeout) {
    remember_symbol(request.symbol);

    params query;
    query.emplace_back("symbol", venue_symbol(request.symbol));
    query.emplace_back("side", to_string(request.side));
    if (request.type == ORDER_TYPE::MARKET) {
        query.emplace_back("type", "MARKET");
    } else if (request.time_in_force == TIME_IN_FORCE::ALO) {
        query.emplace_back("type", "LIMIT_MAKER");
    } else {
        query.emplace_back("type", "LIMIT");
        query.emplace_back("timeInForce", to_string(request.time_in_force));
    }
    query.emplace_back("quantity", format_decimal(request.quantity));
    if (request.price) {
        query.emplace_back("price", format_decimal(*request.price));
    }
    query.emplace_back("newClientOrderId", request.client_order_id);
    query.emplace_back("newOrderRespType", "RESULT");

    try {
        auto j = signed_request("POST", "/api/v3/order", std::move(query), timeout);
        return parse_order(j, request.symbol);
    } catch (const VenueError& e) {
        if (e.kind != EXCHANGE_ERROR::REJECTED) {
            throw;
        }
        logger->warn("Order {} rejected by {}: {}", request.client_order_id, config.name, e.what());
        order_report report;
        report.client_order_id = request.client_order_id;
        report.symbol = request.symbol;
        report.side = request.side;
        report.status = ORDER_STATUS::REJECTED;
        report.quantity = request.quantity;
        report.timestamp = epoch_nanos();
        return report;
    }
}

bool RestExchange::cancel_order(const std::string& symbol, const std::string& exchange_order_id, std::chrono::milliseconds timeout) {
    try {
        auto j = signed_request("DELETE", "/api/v3/order",
            {{"symbol", venue_symbol(symbol)}, {"orderId", exchange_order_id}}, timeout);
        return j.value("status", std::string()) == "CANCELED";
    } catch (const VenueError& e) {
        if (e.code == UNKNOWN_ORDER) {
            logger->warn("Cancel of {} on {} refused: {}", exchange_order_id, symbol, e.what());
            return false;
        }
        throw;
    }
}

std::vector<std::string> RestExchange::cancel_all_orders(const std::string& symbol, std::chrono::milliseconds timeout) {
    std::vector<std::string> cancelled;
    nlohmann::json j;
    try {
        j = signed_request("DELETE", "/api/v3/openOrders", {{"symbol", venue_symbol(symbol)}}, timeout);
    } catch (const VenueError& e) {
        if (e.code == UNKNOWN_ORDER) {
            return cancelled;
        }
        throw;
    }

    if (!j.is_array()) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, "cancel all on " + symbol + " did not return a list");
    }
    for (const auto& entry : j) {
        if (!entry.contains("orderId")) {
            continue;
        }
        auto report = parse_order(entry, symbol);
        if (report.status == ORDER_STATUS::CANCELLED) {
            cancelled.push_back(report.exchange_order_id);
        }
    }
    return cancelled;
}

order_report RestExchange::get_order(const std::string& symbol, const std::string& exchange_order_id, std::chrono::milliseconds timeout) {
    auto j = signed_request("GET", "/api/v3/order", {{"symbol", venue_symbol(symbol)}, {"orderId", exchange_order_id}}, timeout);
    return parse_order(j, symbol);
}

std::optional<order_report> RestExchange::find_order_by_client_id(const std::string& symbol, const std::string& client_order_id,
                                                                  std::chrono::milliseconds timeout) {
    try {
        auto j = signed_request("GET", "/api/v3/order",
            {{"symbol", venue_symbol(symbol)}, {"origClientOrderId", client_order_id}}, timeout);
        return parse_order(j, symbol);
    } catch (const VenueError& e) {
        if (e.code == ORDER_DOES_NOT_EXIST) {
            return std::nullopt;
        }
        throw;
    }
}

std::vector<order_report> RestExchange::get_open_orders(const std::optional<std::string>& symbol, std::chrono::milliseconds timeout) {
    params query;
    if (symbol) {
        query.emplace_back("symbol", venue_symbol(*symbol));
    }
    auto j = signed_request("GET", "/api/v3/openOrders", std::move(query), timeout);
    if (!j.is_array()) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, "open orders did not return a list");
    }

    std::vector<order_report> reports;
    reports.reserve(j.size());
    for (const auto& entry : j) {
        std::string venue = entry.value("symbol", std::string());
        reports.push_back(parse_order(entry, symbol ? *symbol : local_symbol(venue)));
    }
    return reports;
}

std::vector<balance> RestExchange::get_balance(std::chrono::milliseconds timeout) {
    auto j = signed_request("GET", "/api/v3/account", {}, timeout);

    std::vector<balance> balances;
    try {
        for (const auto& entry : j.at("balances")) {
            balance b;
            b.asset = entry.at("asset").get<std::string>();
            b.free = to_double(entry, "free");
            b.locked = to_double(entry, "locked");
            if (b.free != 0 || b.locked != 0) {
                balances.push_back(std::move(b));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad account payload: ") + e.what());
    } catch (const std::logic_error& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad account payload: ") + e.what());
    }
    return balances;
}

// A spot account holds assets, so each non-zero balance is reported as a position in that asset.
std::vector<position> RestExchange::get_positions(std::chrono::milliseconds timeout) {
    std::vector<position> positions;
    for (const auto& b : get_balance(timeout)) {
        position p;
        p.symbol = b.asset;
        p.quantity = b.free + b.locked;
        positions.push_back(std::move(p));
    }
    return positions;
}

depth_snapshot RestExchange::get_depth(const std::string& symbol, uint32_t limit, std::chrono::milliseconds timeout) {
    params query;
    query.emplace_back("symbol", venue_symbol(symbol));
    query.emplace_back("limit", std::to_string(limit));
    nlohmann::json j = public_request("/api/v3/depth", query, timeout);

    auto read_side = [](const nlohmann::json& side) {
        std::vector<md::PriceLevel> levels;
        levels.reserve(side.size());
        for (const auto& level : side) {
            levels.push_back({std::stod(level.at(0).get<std::string>()),
                              std::stod(level.at(1).get<std::string>()), 1});
        }
        return levels;
    };

    try {
        depth_snapshot snapshot;
        snapshot.last_update_id = j.at("lastUpdateId").get<uint64_t>();
        snapshot.bids = read_side(j.at("bids"));
        snapshot.asks = read_side(j.at("asks"));
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad depth response: ") + e.what());
    } catch (const std::logic_error& e) {
        throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, std::string("bad depth level: ") + e.what());
    }
}

} // namespace kestrel::oe
