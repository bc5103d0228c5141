#include "json_codec.H"

#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace predex {

double json_number(const json& value, double fallback) {
    if (value.is_null()) {
        return fallback;
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return fallback;
        }
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (end == nullptr || *end != '\0') {
            throw std::invalid_argument("Not a number: '" + text + "'");
        }
        return parsed;
    }
    throw std::invalid_argument(std::string("Expected a number, got ") + value.type_name());
}

double json_number(const json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    return json_number(*it, fallback);
}

std::string json_string(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // ids sometimes arrive as numbers
    return it->dump();
}

bool json_bool(const json& object, const char* key, bool fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(std::string(key) + " expected a boolean, got " + it->type_name());
    }
    return it->get<bool>();
}

uint64_t json_millis_to_nanos(const json& object, const char* key) {
    double millis = json_number(object, key, 0.0);
    if (millis <= 0) {
        return 0;
    }
    return static_cast<uint64_t>(millis) * 1000000ULL;
}

std::vector<PriceLevel> parse_levels(const json& levels) {
    std::vector<PriceLevel> result;
    if (!levels.is_array()) {
        return result;
    }
    result.reserve(levels.size());
    for (const auto& level : levels) {
        result.push_back({json_number(level, "price"), json_number(level, "size")});
    }
    return result;
}

OrderBookUpdate parse_order_book(const json& book) {
    OrderBookUpdate update;
    update.market_id = json_string(book, "market");
    update.token_id = json_string(book, "asset_id");
    update.timestamp = json_millis_to_nanos(book, "timestamp");
    update.hash = json_string(book, "hash");

    // the market channel has used both names for the sides
    if (book.contains("bids") || book.contains("asks")) {
        update.bids = parse_levels(book.value("bids", json::array()));
        update.asks = parse_levels(book.value("asks", json::array()));
    } else {
        update.bids = parse_levels(book.value("buys", json::array()));
        update.asks = parse_levels(book.value("sells", json::array()));
    }
    return update;
}

void to_json(json& j, const Order& order) {
    j = json{
        {"id", order.id},
        {"market_id", order.market_id},
        {"token_id", order.token_id},
        {"side", to_string(order.side)},
        {"type", to_string(order.type)},
        {"size", order.size},
        {"price", order.price},
        {"filled_size", order.filled_size},
        {"status", to_string(order.status)},
        {"created_at", order.created_at},
        {"updated_at", order.updated_at},
        {"mode", to_string(order.mode)},
        {"reject_reason", order.reject_reason},
    };
}

void from_json(const json& j, Order& order) {
    order.id = j.at("id").get<std::string>();
    order.market_id = j.value("market_id", "");
    order.token_id = j.value("token_id", "");
    order.side = parse_side(j.at("side").get<std::string>());
    order.type = parse_order_type(j.value("type", "LIMIT"));
    order.size = j.at("size").get<double>();
    order.price = j.at("price").get<double>();
    order.filled_size = j.value("filled_size", 0.0);
    order.status = parse_order_status(j.value("status", "PENDING"));
    order.created_at = j.value("created_at", uint64_t(0));
    order.updated_at = j.value("updated_at", uint64_t(0));
    order.mode = parse_mode(j.value("mode", "paper"));
    order.reject_reason = j.value("reject_reason", "");
}

void to_json(json& j, const Trade& trade) {
    j = json{
        {"id", trade.id},
        {"order_id", trade.order_id},
        {"market_id", trade.market_id},
        {"token_id", trade.token_id},
        {"side", to_string(trade.side)},
        {"price", trade.price},
        {"size", trade.size},
        {"fee", trade.fee},
        {"timestamp", trade.timestamp},
        {"mode", to_string(trade.mode)},
    };
}

void from_json(const json& j, Trade& trade) {
    trade.id = j.at("id").get<std::string>();
    trade.order_id = j.value("order_id", "");
    trade.market_id = j.value("market_id", "");
    trade.token_id = j.value("token_id", "");
    trade.side = parse_side(j.at("side").get<std::string>());
    trade.price = j.at("price").get<double>();
    trade.size = j.at("size").get<double>();
    trade.fee = j.value("fee", 0.0);
    trade.timestamp = j.at("timestamp").get<uint64_t>();
    trade.mode = parse_mode(j.value("mode", "paper"));
}

void to_json(json& j, const Position& position) {
    j = json{
        {"token_id", position.token_id},
        {"market_id", position.market_id},
        {"net_size", position.net_size},
        {"avg_entry_price", position.avg_entry_price},
        {"realized_pnl", position.realized_pnl},
        {"unrealized_pnl", position.unrealized_pnl},
        {"mark_price", position.mark_price},
        {"updated_at", position.updated_at},
    };
}

void from_json(const json& j, Position& position) {
    position.token_id = j.at("token_id").get<std::string>();
    position.market_id = j.value("market_id", "");
    position.net_size = j.value("net_size", 0.0);
    position.avg_entry_price = j.value("avg_entry_price", 0.0);
    position.realized_pnl = j.value("realized_pnl", 0.0);
    position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
    position.mark_price = j.value("mark_price", 0.0);
    position.updated_at = j.value("updated_at", uint64_t(0));
}

} // namespace predex
