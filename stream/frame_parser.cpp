#include "frame_parser.H"

#include "core/json_codec.H"
#include "core/utils.H"

#include <stdexcept>

using json = nlohmann::json;

namespace predex::stream {

const char* to_string(CHANNEL channel) {
    return channel == CHANNEL::MARKET ? "market" : "user";
}

static std::optional<double> optional_number(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) {
        return std::nullopt;
    }
    return json_number(*it);
}

static SIDE parse_side_or(const json& item, SIDE fallback) {
    std::string text = json_string(item, "side");
    if (text.empty()) {
        return fallback;
    }
    return parse_side(text);
}

static uint64_t timestamp_or_now(const json& item) {
    uint64_t ts = json_millis_to_nanos(item, "timestamp");
    return ts != 0 ? ts : nanotime();
}

FrameParser::FrameParser(CHANNEL channel, std::shared_ptr<spdlog::logger> logger)
    : channel(channel), logger(logger) {}

ParsedFrame FrameParser::parse(const std::string& frame) const {
    ParsedFrame out;

    if (frame == "PONG" || frame == "pong") {
        out.keepalive = true;
        return out;
    }

    json data = json::parse(frame, nullptr, false);
    if (data.is_discarded()) {
        logger->warn("Dropping malformed {} frame: {}", to_string(channel), frame.substr(0, 200));
        out.dropped++;
        return out;
    }

    if (data.is_array()) {
        // an empty array is the venue's reply to a subscribe with nothing to dump
        if (data.empty()) {
            out.keepalive = true;
        }
        for (const auto& item : data) {
            parse_item(item, out);
        }
    } else {
        parse_item(data, out);
    }
    return out;
}

void FrameParser::parse_item(const json& item, ParsedFrame& out) const {
    if (!item.is_object()) {
        logger->warn("Dropping non-object {} item: {}", to_string(channel), item.dump());
        out.dropped++;
        return;
    }

    for (const char* key : {"seq", "sequence"}) {
        auto it = item.find(key);
        if (it != item.end() && it->is_number_unsigned()) {
            out.venue_seq = it->get<uint64_t>();
        }
    }

    std::string type = json_string(item, "event_type");
    // a bad item contributes no events at all
    size_t mark = out.events.size();
    try {
        if (channel == CHANNEL::MARKET) {
            parse_market_item(type, item, out);
        } else {
            parse_user_item(type, item, out);
        }
    } catch (const std::invalid_argument& e) {
        logger->warn("Dropping {} {} item: {}", to_string(channel), type, e.what());
        out.events.resize(mark);
        out.dropped++;
    } catch (const json::exception& e) {
        logger->warn("Dropping {} {} item: {}", to_string(channel), type, e.what());
        out.events.resize(mark);
        out.dropped++;
    }
}

void FrameParser::parse_market_item(const std::string& type, const json& item, ParsedFrame& out) const {
    if (type == "book") {
        OrderBookUpdate book = parse_order_book(item);
        if (book.timestamp == 0) {
            book.timestamp = nanotime();
        }
        out.events.emplace_back(std::move(book));
    } else if (type == "price_change") {
        parse_price_change(item, out);
    } else if (type == "last_trade_price") {
        PriceUpdate update;
        update.market_id = json_string(item, "market");
        update.token_id = json_string(item, "asset_id");
        update.price = json_number(item, "price");
        update.size = json_number(item, "size");
        update.side = parse_side_or(item, SIDE::BUY);
        update.timestamp = timestamp_or_now(item);
        out.events.emplace_back(std::move(update));
    } else if (type == "tick_size_change" || type == "best_bid_ask") {
        logger->debug("Ignoring market {} event", type);
    } else {
        logger->warn("Dropping unknown market event type '{}'", type);
        out.dropped++;
    }
}

void FrameParser::parse_price_change(const json& item, ParsedFrame& out) const {
    std::string market_id = json_string(item, "market");
    uint64_t timestamp = timestamp_or_now(item);

    auto changes = item.find("price_changes");
    if (changes != item.end() && changes->is_array()) {
        for (const auto& change : *changes) {
            PriceUpdate update;
            update.market_id = market_id;
            update.token_id = json_string(change, "asset_id");
            update.price = json_number(change, "price");
            update.size = json_number(change, "size");
            update.side = parse_side_or(change, SIDE::BUY);
            update.best_bid = optional_number(change, "best_bid");
            update.best_ask = optional_number(change, "best_ask");
            update.timestamp = timestamp;
            out.events.emplace_back(std::move(update));
        }
        return;
    }

    // legacy layout: asset_id at the top level, either flat or with a changes list
    std::string token_id = json_string(item, "asset_id");
    auto legacy_changes = item.find("changes");
    if (legacy_changes != item.end() && legacy_changes->is_array()) {
        for (const auto& change : *legacy_changes) {
            PriceUpdate update;
            update.market_id = market_id;
            update.token_id = token_id;
            update.price = json_number(change, "price");
            update.size = json_number(change, "size");
            update.side = parse_side_or(change, SIDE::BUY);
            update.timestamp = timestamp;
            out.events.emplace_back(std::move(update));
        }
        return;
    }

    PriceUpdate update;
    update.market_id = market_id;
    update.token_id = token_id;
    update.price = json_number(item, "price");
    update.size = json_number(item, "size");
    update.side = parse_side_or(item, SIDE::BUY);
    update.best_bid = optional_number(item, "bid");
    update.best_ask = optional_number(item, "ask");
    update.timestamp = timestamp;
    out.events.emplace_back(std::move(update));
}

void FrameParser::parse_user_item(const std::string& type, const json& item, ParsedFrame& out) const {
    if (type == "trade") {
        parse_trade(item, out);
    } else if (type == "order") {
        // order placement / update / cancellation acks, fills arrive as trades
        logger->debug("User order event {} for {}", json_string(item, "type"), json_string(item, "id"));
    } else {
        logger->warn("Dropping unknown user event type '{}'", type);
        out.dropped++;
    }
}

void FrameParser::parse_trade(const json& item, ParsedFrame& out) const {
    std::string trade_id = json_string(item, "id");
    std::string market_id = json_string(item, "market");
    std::string status = json_string(item, "status");
    double fee_rate = json_number(item, "fee_rate_bps") / 10000.0;

    uint64_t timestamp = json_millis_to_nanos(item, "matchtime");
    if (timestamp == 0) {
        timestamp = timestamp_or_now(item);
    }

    if (trade_id.empty()) {
        throw std::invalid_argument("trade without id");
    }

    std::string taker_order = json_string(item, "taker_order_id");
    if (!taker_order.empty()) {
        FillNotification fill;
        fill.trade_id = trade_id;
        fill.order_id = taker_order;
        fill.market_id = market_id;
        fill.token_id = json_string(item, "asset_id");
        fill.price = json_number(item, "price");
        fill.size = json_number(item, "size");
        fill.fee = fill.price * fill.size * fee_rate;
        fill.timestamp = timestamp;
        fill.venue_status = status;
        out.events.emplace_back(std::move(fill));
    }

    auto makers = item.find("maker_orders");
    if (makers != item.end() && makers->is_array()) {
        for (const auto& maker : *makers) {
            FillNotification fill;
            fill.order_id = json_string(maker, "order_id");
            // one venue trade id covers every matched order
            fill.trade_id = trade_id + ":" + fill.order_id;
            fill.market_id = market_id;
            fill.token_id = json_string(maker, "asset_id");
            fill.price = json_number(maker, "price");
            fill.size = json_number(maker, "matched_amount");
            double maker_rate = maker.contains("fee_rate_bps") ? json_number(maker, "fee_rate_bps") / 10000.0 : fee_rate;
            fill.fee = fill.price * fill.size * maker_rate;
            fill.timestamp = timestamp;
            fill.venue_status = status;
            out.events.emplace_back(std::move(fill));
        }
    }
}

} // namespace predex::stream
