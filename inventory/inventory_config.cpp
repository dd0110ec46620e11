#include "inventory_config.H"

#include "common/errors.H"

#include <cmath>

namespace kestrel::inv {

const char* to_string(SKEW_MODE mode) {
    switch (mode) {
        case SKEW_MODE::LINEAR: return "linear";
        case SKEW_MODE::EXPONENTIAL: return "exponential";
        case SKEW_MODE::TIERED: return "tiered";
    }
    return "unknown";
}

SKEW_MODE skew_mode_from_string(const std::string& mode) {
    if (mode == "linear") {
        return SKEW_MODE::LINEAR;
    }
    if (mode == "exponential") {
        return SKEW_MODE::EXPONENTIAL;
    }
    if (mode == "tiered") {
        return SKEW_MODE::TIERED;
    }
    throw InvalidConfiguration("unknown skew mode " + mode);
}

void inventory_config::validate() const {
    if (!(max_inventory > 0) || !std::isfinite(max_inventory)) {
        throw InvalidConfiguration("max_inventory must be positive");
    }
    if (!(skew_factor >= 0 && skew_factor <= 1)) {
        throw InvalidConfiguration("skew_factor must be in [0, 1]");
    }
    if (!(rebalance_threshold > 0 && rebalance_threshold <= 1)) {
        throw InvalidConfiguration("rebalance_threshold must be in (0, 1]");
    }
    if (!(emergency_threshold >= rebalance_threshold && emergency_threshold <= 1)) {
        throw InvalidConfiguration("emergency_threshold must be in [rebalance_threshold, 1]");
    }
    if (!std::isfinite(target_inventory) || std::abs(target_inventory) / max_inventory >= rebalance_threshold) {
        throw InvalidConfiguration("target_inventory must sit inside the rebalance band");
    }
    if (!(price_unit >= 0) || !std::isfinite(price_unit)) {
        throw InvalidConfiguration("price_unit must be non-negative");
    }

    for (size_t i = 0; i < tiers.size(); i++) {
        if (!(tiers[i].threshold >= 0 && tiers[i].threshold <= 1)) {
            throw InvalidConfiguration("tier threshold must be in [0, 1]");
        }
        if (!(tiers[i].multiplier >= 0) || !std::isfinite(tiers[i].multiplier)) {
            throw InvalidConfiguration("tier multiplier must be non-negative");
        }
        if (i > 0 && !(tiers[i - 1].threshold < tiers[i].threshold)) {
            throw InvalidConfiguration("tiers must be sorted by ascending threshold");
        }
    }
}

inventory_config inventory_config_from_json(const nlohmann::json& j) {
    inventory_config config;
    try {
        config.symbol = j.value("symbol", config.symbol);
        config.target_inventory = j.value("target_inventory", config.target_inventory);
        config.max_inventory = j.value("max_inventory", config.max_inventory);
        if (j.contains("skew_mode")) {
            config.skew_mode = skew_mode_from_string(j.at("skew_mode").get<std::string>());
        }
        config.skew_factor = j.value("skew_factor", config.skew_factor);
        config.rebalance_threshold = j.value("rebalance_threshold", config.rebalance_threshold);
        config.emergency_threshold = j.value("emergency_threshold", config.emergency_threshold);
        config.price_unit = j.value("price_unit", config.price_unit);

        if (j.contains("tiers")) {
            for (const auto& tier : j.at("tiers")) {
                config.tiers.push_back({tier.at("threshold").get<double>(), tier.at("multiplier").get<double>()});
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfiguration(std::string("inventory section: ") + e.what());
    }

    config.validate();
    return config;
}

} // namespace kestrel::inv
