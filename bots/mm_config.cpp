#include "mm_config.H"

#include "common/errors.H"

#include <fstream>
#include <set>

namespace kestrel::bots {

const char* to_string(EXCHANGE_MODE mode) {
    switch (mode) {
        case EXCHANGE_MODE::PAPER:
            return "paper";
        case EXCHANGE_MODE::REST:
            return "rest";
    }
    return "unknown";
}

EXCHANGE_MODE exchange_mode_from_string(const std::string& mode) {
    if (mode == "paper") {
        return EXCHANGE_MODE::PAPER;
    }
    if (mode == "rest") {
        return EXCHANGE_MODE::REST;
    }
    throw InvalidConfiguration("unknown exchange mode: " + mode);
}

namespace {

exchange_settings parse_exchange(const nlohmann::json& j) {
    exchange_settings settings;
    if (j.contains("mode")) {
        settings.mode = exchange_mode_from_string(j.at("mode").get<std::string>());
    }
    settings.timeout_ms = j.value("timeout_ms", settings.timeout_ms);
    settings.depth_limit = j.value("depth_limit", settings.depth_limit);
    settings.depth_poll_ms = j.value("depth_poll_ms", settings.depth_poll_ms);
    settings.rest.name = j.value("name", settings.rest.name);
    settings.rest.base_url = j.value("base_url", settings.rest.base_url);
    settings.rest.api_key_env = j.value("api_key_env", settings.rest.api_key_env);
    settings.rest.api_secret_env = j.value("api_secret_env", settings.rest.api_secret_env);
    settings.rest.recv_window_ms = j.value("recv_window_ms", settings.rest.recv_window_ms);

    if (settings.timeout_ms == 0) {
        throw InvalidConfiguration("exchange timeout_ms must be positive");
    }
    if (settings.depth_limit == 0 || settings.depth_poll_ms == 0) {
        throw InvalidConfiguration("exchange depth_limit and depth_poll_ms must be positive");
    }
    if (settings.mode == EXCHANGE_MODE::REST && settings.rest.base_url.empty()) {
        throw InvalidConfiguration("rest exchange needs a base_url");
    }
    return settings;
}

symbol_settings parse_symbol(const nlohmann::json& j, const nlohmann::json& default_inventory) {
    symbol_settings settings;
    symbol_definition& def = settings.definition;
    def.symbol = j.at("symbol").get<std::string>();
    def.tick_size = j.value("tick_size", def.tick_size);
    def.lot_size = j.value("lot_size", def.lot_size);
    def.min_quantity = j.value("min_quantity", def.min_quantity);
    def.max_quantity = j.value("max_quantity", def.max_quantity);
    settings.start_price = j.value("start_price", settings.start_price);

    if (def.symbol.empty()) {
        throw InvalidConfiguration("symbol name must not be empty");
    }
    if (!(def.tick_size > 0) || !(def.lot_size > 0)) {
        throw InvalidConfiguration("tick_size and lot_size must be positive for " + def.symbol);
    }
    if (!(def.min_quantity > 0) || def.min_quantity > def.max_quantity) {
        throw InvalidConfiguration("bad quantity limits for " + def.symbol);
    }
    if (settings.start_price < 0) {
        throw InvalidConfiguration("start_price must be non-negative for " + def.symbol);
    }

    nlohmann::json inventory = default_inventory;
    if (j.contains("inventory")) {
        inventory.update(j.at("inventory"));
    }
    inventory["symbol"] = def.symbol;
    settings.inventory = inv::inventory_config_from_json(inventory);
    return settings;
}

paper_settings parse_paper(const nlohmann::json& j) {
    paper_settings settings;
    oe::paper_exchange_config& exchange = settings.exchange;
    exchange.name = j.value("name", exchange.name);
    exchange.quote_asset = j.value("quote_asset", exchange.quote_asset);
    exchange.initial_balance = j.value("initial_balance", exchange.initial_balance);
    exchange.commission_rate = j.value("commission_rate", exchange.commission_rate);
    exchange.slippage = j.value("slippage", exchange.slippage);
    settings.feed_interval_ms = j.value("feed_interval_ms", settings.feed_interval_ms);

    if (exchange.initial_balance < 0 || exchange.commission_rate < 0 || exchange.slippage < 0) {
        throw InvalidConfiguration("paper balance, commission and slippage must be non-negative");
    }
    if (settings.feed_interval_ms == 0) {
        throw InvalidConfiguration("paper feed_interval_ms must be positive");
    }

    settings.feed = feed_params_from_json(j.value("feed", nlohmann::json::object()));
    return settings;
}

} // namespace

feed_params mm_config::feed_for(const symbol_settings& symbol) const {
    feed_params p = paper.feed;
    p.tick_size = symbol.definition.tick_size;
    if (symbol.start_price > 0) {
        p.start_price = symbol.start_price;
    }
    p.validate();
    return p;
}

mm_config mm_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration("config must be a JSON object");
    }

    mm_config config;
    try {
        config.log_file = j.value("log_file", config.log_file);
        config.exchange = parse_exchange(j.value("exchange", nlohmann::json::object()));

        const nlohmann::json default_inventory = j.value("inventory", nlohmann::json::object());
        if (!j.contains("symbols") || !j.at("symbols").is_array() || j.at("symbols").empty()) {
            throw InvalidConfiguration("config needs a non-empty symbols list");
        }
        std::set<std::string> seen;
        for (const auto& entry : j.at("symbols")) {
            symbol_settings settings = parse_symbol(entry, default_inventory);
            if (!seen.insert(settings.definition.symbol).second) {
                throw InvalidConfiguration("duplicate symbol " + settings.definition.symbol);
            }
            config.symbols.push_back(std::move(settings));
        }

        const nlohmann::json strategy = j.value("strategy", nlohmann::json::object());
        config.strategy = mm_params_from_json(strategy);
        config.loop_interval_ms = strategy.value("loop_interval_ms", config.loop_interval_ms);
        if (config.loop_interval_ms == 0) {
            throw InvalidConfiguration("strategy loop_interval_ms must be positive");
        }

        config.paper = parse_paper(j.value("paper", nlohmann::json::object()));
        if (config.exchange.mode == EXCHANGE_MODE::PAPER) {
            for (const auto& symbol : config.symbols) {
                config.feed_for(symbol);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfiguration(std::string("config: ") + e.what());
    }
    return config;
}

mm_config load_mm_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InvalidConfiguration("cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidConfiguration("cannot parse " + path + ": " + e.what());
    }
    return mm_config_from_json(j);
}

} // namespace kestrel::bots
