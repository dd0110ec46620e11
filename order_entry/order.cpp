#include "order.H"

#include "common/errors.H"

namespace kestrel::oe {

const char* to_string(ORDER_TYPE type) {
    switch (type) {
        case ORDER_TYPE::LIMIT: return "LIMIT";
        case ORDER_TYPE::MARKET: return "MARKET";
    }
    return "UNKNOWN";
}

const char* to_string(TIME_IN_FORCE tif) {
    switch (tif) {
        case TIME_IN_FORCE::GTC: return "GTC";
        case TIME_IN_FORCE::IOC: return "IOC";
        case TIME_IN_FORCE::ALO: return "ALO";
        case TIME_IN_FORCE::FOK: return "FOK";
    }
    return "UNKNOWN";
}

const char* to_string(ORDER_STATUS status) {
    switch (status) {
        case ORDER_STATUS::PENDING: return "PENDING";
        case ORDER_STATUS::SUBMITTED: return "SUBMITTED";
        case ORDER_STATUS::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case ORDER_STATUS::FILLED: return "FILLED";
        case ORDER_STATUS::CANCELLED: return "CANCELLED";
        case ORDER_STATUS::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

ORDER_TYPE order_type_from_string(const std::string& s) {
    if (s == "LIMIT" || s == "limit") {
        return ORDER_TYPE::LIMIT;
    }
    if (s == "MARKET" || s == "market") {
        return ORDER_TYPE::MARKET;
    }
    throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, "unknown order type " + s);
}

TIME_IN_FORCE time_in_force_from_string(const std::string& s) {
    if (s == "GTC") {
        return TIME_IN_FORCE::GTC;
    }
    if (s == "IOC") {
        return TIME_IN_FORCE::IOC;
    }
    if (s == "ALO" || s == "GTX") {
        return TIME_IN_FORCE::ALO;
    }
    if (s == "FOK") {
        return TIME_IN_FORCE::FOK;
    }
    throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, "unknown time in force " + s);
}

// Venue status names map onto the local state machine.
ORDER_STATUS order_status_from_string(const std::string& s) {
    if (s == "PENDING" || s == "PENDING_NEW") {
        return ORDER_STATUS::PENDING;
    }
    if (s == "NEW" || s == "SUBMITTED" || s == "OPEN") {
        return ORDER_STATUS::SUBMITTED;
    }
    if (s == "PARTIALLY_FILLED") {
        return ORDER_STATUS::PARTIALLY_FILLED;
    }
    if (s == "FILLED") {
        return ORDER_STATUS::FILLED;
    }
    if (s == "CANCELED" || s == "CANCELLED" || s == "EXPIRED" || s == "EXPIRED_IN_MATCH") {
        return ORDER_STATUS::CANCELLED;
    }
    if (s == "REJECTED") {
        return ORDER_STATUS::REJECTED;
    }
    throw ExchangeError(EXCHANGE_ERROR::PROTOCOL, "unknown order status " + s);
}

} // namespace kestrel::oe
