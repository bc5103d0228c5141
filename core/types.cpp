#include "types.H"

#include <cmath>
#include <stdexcept>

namespace predex {

const char* to_string(SIDE side) {
    return side == SIDE::BUY ? "BUY" : "SELL";
}

const char* to_string(OUTCOME outcome) {
    return outcome == OUTCOME::YES ? "YES" : "NO";
}

const char* to_string(ORDER_TYPE type) {
    return type == ORDER_TYPE::LIMIT ? "LIMIT" : "MARKET";
}

const char* to_string(ORDER_STATUS status) {
    switch (status) {
        case ORDER_STATUS::PENDING: return "PENDING";
        case ORDER_STATUS::OPEN: return "OPEN";
        case ORDER_STATUS::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case ORDER_STATUS::FILLED: return "FILLED";
        case ORDER_STATUS::CANCELLED: return "CANCELLED";
        case ORDER_STATUS::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

const char* to_string(MARKET_STATUS status) {
    switch (status) {
        case MARKET_STATUS::OPEN: return "OPEN";
        case MARKET_STATUS::CLOSED: return "CLOSED";
        case MARKET_STATUS::RESOLVED: return "RESOLVED";
    }
    return "UNKNOWN";
}

const char* to_string(MODE mode) {
    return mode == MODE::PAPER ? "paper" : "live";
}

SIDE parse_side(const std::string& text) {
    if (text == "BUY" || text == "buy") return SIDE::BUY;
    if (text == "SELL" || text == "sell") return SIDE::SELL;
    throw std::invalid_argument("Unknown side: " + text);
}

ORDER_TYPE parse_order_type(const std::string& text) {
    if (text == "LIMIT") return ORDER_TYPE::LIMIT;
    if (text == "MARKET") return ORDER_TYPE::MARKET;
    throw std::invalid_argument("Unknown order type: " + text);
}

ORDER_STATUS parse_order_status(const std::string& text) {
    if (text == "PENDING") return ORDER_STATUS::PENDING;
    if (text == "OPEN") return ORDER_STATUS::OPEN;
    if (text == "PARTIALLY_FILLED") return ORDER_STATUS::PARTIALLY_FILLED;
    if (text == "FILLED") return ORDER_STATUS::FILLED;
    if (text == "CANCELLED") return ORDER_STATUS::CANCELLED;
    if (text == "REJECTED") return ORDER_STATUS::REJECTED;
    throw std::invalid_argument("Unknown order status: " + text);
}

MARKET_STATUS parse_market_status(const std::string& text) {
    if (text == "OPEN") return MARKET_STATUS::OPEN;
    if (text == "CLOSED") return MARKET_STATUS::CLOSED;
    if (text == "RESOLVED") return MARKET_STATUS::RESOLVED;
    throw std::invalid_argument("Unknown market status: " + text);
}

MODE parse_mode(const std::string& text) {
    if (text == "paper") return MODE::PAPER;
    if (text == "live") return MODE::LIVE;
    throw std::invalid_argument("Unknown mode: " + text);
}

bool is_terminal(ORDER_STATUS status) {
    return status == ORDER_STATUS::FILLED || status == ORDER_STATUS::CANCELLED ||
           status == ORDER_STATUS::REJECTED;
}

int status_rank(ORDER_STATUS status) {
    switch (status) {
        case ORDER_STATUS::PENDING: return 0;
        case ORDER_STATUS::OPEN: return 1;
        case ORDER_STATUS::PARTIALLY_FILLED: return 2;
        default: return 3;
    }
}

std::optional<PriceLevel> OrderBookUpdate::best_bid() const {
    if (bids.empty()) {
        return std::nullopt;
    }
    PriceLevel best = bids.front();
    for (const auto& level : bids) {
        if (level.price > best.price) best = level;
    }
    return best;
}

std::optional<PriceLevel> OrderBookUpdate::best_ask() const {
    if (asks.empty()) {
        return std::nullopt;
    }
    PriceLevel best = asks.front();
    for (const auto& level : asks) {
        if (level.price < best.price) best = level;
    }
    return best;
}

bool Position::is_flat() const {
    return std::fabs(net_size) < 1e-9;
}

} // namespace predex
