#include "order_validator.H"

#include <cmath>

namespace kestrel::oe {

const char* to_string(REJECT_REASON reason) {
    switch (reason) {
        case REJECT_REASON::NONE: return "NONE";
        case REJECT_REASON::UNKNOWN_SYMBOL: return "UNKNOWN_SYMBOL";
        case REJECT_REASON::INVALID_QUANTITY: return "INVALID_QUANTITY";
        case REJECT_REASON::INVALID_PRICE: return "INVALID_PRICE";
        case REJECT_REASON::MISSING_PRICE: return "MISSING_PRICE";
        case REJECT_REASON::UNEXPECTED_PRICE: return "UNEXPECTED_PRICE";
    }
    return "UNKNOWN";
}

static bool is_multiple_of(double value, double increment) {
    if (increment <= 0) {
        return true;
    }
    double steps = value / increment;
    return std::abs(steps - std::round(steps)) < 1e-6;
}

OrderValidator::OrderValidator(std::unordered_map<std::string, symbol_definition> symbols, std::shared_ptr<spdlog::logger> logger)
    : symbols(std::move(symbols)), logger(logger) {}

REJECT_REASON OrderValidator::validate_new_order(const order_request& request) const {
    if (!(request.quantity > 0) || !std::isfinite(request.quantity)) {
        logger->error("Quantity {} must be positive", request.quantity);
        return REJECT_REASON::INVALID_QUANTITY;
    }

    if (request.type == ORDER_TYPE::LIMIT && !request.price) {
        logger->error("Limit order for {} has no price", request.symbol);
        return REJECT_REASON::MISSING_PRICE;
    }

    if (request.type == ORDER_TYPE::MARKET && request.price) {
        logger->error("Market order for {} carries price {}", request.symbol, *request.price);
        return REJECT_REASON::UNEXPECTED_PRICE;
    }

    if (request.price && (!(*request.price > 0) || !std::isfinite(*request.price))) {
        logger->error("Price {} must be positive", *request.price);
        return REJECT_REASON::INVALID_PRICE;
    }

    if (symbols.empty()) {
        return REJECT_REASON::NONE;
    }

    auto it = symbols.find(request.symbol);
    if (it == symbols.end()) {
        logger->error("Symbol {} not found", request.symbol);
        return REJECT_REASON::UNKNOWN_SYMBOL;
    }
    const auto& def = it->second;

    if (request.quantity < def.min_quantity || request.quantity > def.max_quantity) {
        logger->error("Quantity {} outside of range [{}, {}]", request.quantity, def.min_quantity, def.max_quantity);
        return REJECT_REASON::INVALID_QUANTITY;
    }

    if (!is_multiple_of(request.quantity, def.lot_size)) {
        logger->error("Quantity {} not a multiple of lot size {}", request.quantity, def.lot_size);
        return REJECT_REASON::INVALID_QUANTITY;
    }

    if (request.price && !is_multiple_of(*request.price, def.tick_size)) {
        logger->error("Price {} not a multiple of tick size {}", *request.price, def.tick_size);
        return REJECT_REASON::INVALID_PRICE;
    }

    return REJECT_REASON::NONE;
}

} // namespace kestrel::oe
