#include "clob_api.H"

#include "core/json_codec.H"

#include <stdexcept>

using json = nlohmann::json;

namespace predex::gateway {

static const ResponseSchema& market_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .require("id", JSON_TYPE::ANY)
        .optional("question", JSON_TYPE::STRING)
        .optional("conditionId", JSON_TYPE::STRING)
        .optional("slug", JSON_TYPE::STRING)
        .optional("closed", JSON_TYPE::BOOLEAN)
        .optional("volume", JSON_TYPE::NUMERIC)
        .optional("liquidity", JSON_TYPE::NUMERIC);
    return schema;
}

static const ResponseSchema& market_list_schema() {
    static const ResponseSchema schema = ResponseSchema::array_of(market_schema());
    return schema;
}

static const ResponseSchema& event_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .require("markets", JSON_TYPE::ARRAY);
    return schema;
}

static const ResponseSchema& midpoint_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .require("mid", JSON_TYPE::NUMERIC);
    return schema;
}

static const ResponseSchema& book_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .require("bids", JSON_TYPE::ARRAY)
        .require("asks", JSON_TYPE::ARRAY)
        .optional("asset_id", JSON_TYPE::STRING)
        .optional("hash", JSON_TYPE::STRING);
    return schema;
}

static const ResponseSchema& submit_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .optional("success", JSON_TYPE::BOOLEAN)
        .optional("orderID", JSON_TYPE::STRING)
        .optional("errorMsg", JSON_TYPE::STRING)
        .optional("status", JSON_TYPE::STRING);
    return schema;
}

static const ResponseSchema& cancel_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .optional("canceled", JSON_TYPE::ARRAY)
        .optional("not_canceled", JSON_TYPE::ANY);
    return schema;
}

static const ResponseSchema& balance_schema() {
    static const ResponseSchema schema = ResponseSchema::object()
        .require("balance", JSON_TYPE::NUMERIC);
    return schema;
}

// Gamma encodes some arrays as JSON text, e.g. "[\"0.45\", \"0.55\"]"
static json decode_embedded_array(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return json::array();
    }
    if (it->is_array()) {
        return *it;
    }
    if (it->is_string()) {
        json parsed = json::parse(it->get<std::string>(), nullptr, false);
        if (parsed.is_array()) {
            return parsed;
        }
    }
    throw SchemaViolation(std::string(key) + " is not an array");
}

ClobApi::ClobApi(RetryingGateway& gateway, const ApiConfig& config, StopToken stop,
                 std::shared_ptr<spdlog::logger> logger)
    : gateway(gateway), config(config), auth(config), stop(stop), logger(logger) {}

Market ClobApi::parse_market(const json& data) {
    Market market;
    market.id = json_string(data, "id");
    market.condition_id = json_string(data, "conditionId");
    market.question = json_string(data, "question");
    market.slug = json_string(data, "slug");

    json tokens = decode_embedded_array(data, "clobTokenIds");
    if (tokens.size() > 0) market.token_id_yes = tokens[0].is_string() ? tokens[0].get<std::string>() : tokens[0].dump();
    if (tokens.size() > 1) market.token_id_no = tokens[1].is_string() ? tokens[1].get<std::string>() : tokens[1].dump();

    bool closed = false;
    try {
        json prices = decode_embedded_array(data, "outcomePrices");
        if (prices.size() > 0) market.price_yes = json_number(prices[0]);
        if (prices.size() > 1) market.price_no = json_number(prices[1]);
        market.volume = json_number(data, "volume");
        market.liquidity = json_number(data, "liquidity");
        closed = json_bool(data, "closed", false);
    } catch (const std::invalid_argument& e) {
        throw SchemaViolation("market " + market.id + ": " + e.what());
    }

    if (json_string(data, "umaResolutionStatus") == "resolved") {
        market.status = MARKET_STATUS::RESOLVED;
    } else if (closed) {
        market.status = MARKET_STATUS::CLOSED;
    } else {
        market.status = MARKET_STATUS::OPEN;
    }
    return market;
}

HttpRequest ClobApi::public_request(const std::string& host, const std::string& path_and_query) const {
    HttpRequest request;
    request.method = "GET";
    request.url = host + path_and_query;
    request.headers.push_back({"Accept", "application/json"});
    return request;
}

HttpRequest ClobApi::auth_request(const std::string& method, const std::string& path, const std::string& query,
                                  const std::string& body) const {
    HttpRequest request;
    request.method = method;
    request.url = config.clob_host + path + (query.empty() ? "" : "?" + query);
    request.body = body;
    request.headers = auth.headers(method, path, body);
    request.headers.push_back({"Accept", "application/json"});
    if (!body.empty()) {
        request.headers.push_back({"Content-Type", "application/json"});
    }
    return request;
}

std::vector<Market> ClobApi::list_markets(int limit, int offset, bool closed) {
    std::string query = "/markets?closed=" + std::string(closed ? "true" : "false") +
                        "&limit=" + std::to_string(limit) + "&offset=" + std::to_string(offset) +
                        "&order=volume24hr&ascending=false";
    json data = gateway.call(public_request(config.gamma_host, query), market_list_schema(), stop);

    std::vector<Market> markets;
    markets.reserve(data.size());
    for (const auto& item : data) {
        markets.push_back(parse_market(item));
    }
    logger->debug("Fetched {} markets", markets.size());
    return markets;
}

Market ClobApi::get_market(const std::string& market_id) {
    json data = gateway.call(public_request(config.gamma_host, "/markets/" + market_id), market_schema(), stop);
    return parse_market(data);
}

Market ClobApi::get_market_by_slug(const std::string& slug) {
    json data = gateway.call(public_request(config.gamma_host, "/markets/slug/" + slug), market_schema(), stop);
    return parse_market(data);
}

std::vector<Market> ClobApi::get_event_markets(const std::string& event_slug) {
    json data = gateway.call(public_request(config.gamma_host, "/events/slug/" + event_slug), event_schema(), stop);

    std::vector<Market> markets;
    for (const auto& item : data["markets"]) {
        market_schema().validate(item);
        markets.push_back(parse_market(item));
    }
    return markets;
}

Market ClobApi::resolve_market_ref(const std::string& ref) {
    MarketRef parsed = parse_market_ref(ref);
    switch (parsed.type) {
        case REF_TYPE::ID:
            return get_market(parsed.value);
        case REF_TYPE::MARKET:
            return get_market_by_slug(parsed.value);
        case REF_TYPE::EVENT: {
            auto markets = get_event_markets(parsed.value);
            if (markets.empty()) {
                throw std::invalid_argument("Event " + parsed.value + " has no markets");
            }
            return markets.front();
        }
        case REF_TYPE::INVALID:
            break;
    }
    throw std::invalid_argument("Not a market id or market url: " + ref);
}

double ClobApi::get_midpoint(const std::string& token_id) {
    json data = gateway.call(public_request(config.clob_host, "/midpoint?token_id=" + token_id), midpoint_schema(), stop);
    return json_number(data["mid"]);
}

OrderBookUpdate ClobApi::get_order_book(const std::string& token_id) {
    json data = gateway.call(public_request(config.clob_host, "/book?token_id=" + token_id), book_schema(), stop);
    try {
        OrderBookUpdate book = parse_order_book(data);
        if (book.token_id.empty()) {
            book.token_id = token_id;
        }
        return book;
    } catch (const std::invalid_argument& e) {
        throw SchemaViolation(std::string("order book: ") + e.what());
    }
}

SubmitResult ClobApi::submit_order(const Order& order) {
    json payload = {
        {"order", {
            {"tokenID", order.token_id},
            {"price", order.price},
            {"size", order.size},
            {"side", to_string(order.side)},
        }},
        {"owner", config.api_key},
        {"orderType", order.type == ORDER_TYPE::MARKET ? "FOK" : "GTC"},
    };
    std::string body = payload.dump();

    json data = gateway.call(auth_request("POST", "/order", "", body), submit_schema(), stop);

    // rejects arrive with null orderID / errorMsg
    SubmitResult result;
    result.order_id = json_string(data, "orderID");
    result.status = json_string(data, "status");
    result.error = json_string(data, "errorMsg");
    try {
        result.accepted = json_bool(data, "success", !result.order_id.empty()) && !result.order_id.empty();
    } catch (const std::invalid_argument& e) {
        throw SchemaViolation(std::string("order submit: ") + e.what());
    }
    if (!result.accepted && result.error.empty()) {
        result.error = "order not accepted by venue";
    }
    return result;
}

bool ClobApi::cancel_order(const std::string& order_id) {
    json payload = {{"orderID", order_id}};
    json data = gateway.call(auth_request("DELETE", "/order", "", payload.dump()), cancel_schema(), stop);

    auto canceled = data.find("canceled");
    if (canceled == data.end() || !canceled->is_array()) {
        logger->warn("Cancel of {} not confirmed: {}", order_id, data.dump());
        return false;
    }
    for (const auto& id : *canceled) {
        if (id.is_string() && id.get<std::string>() == order_id) {
            return true;
        }
    }
    auto refused = data.find("not_canceled");
    logger->warn("Cancel of {} not confirmed: {}", order_id, refused != data.end() ? refused->dump() : "{}");
    return false;
}

double ClobApi::get_balance() {
    json data = gateway.call(auth_request("GET", "/balance-allowance", "asset_type=COLLATERAL", ""),
                             balance_schema(), stop);
    // USDC has 6 decimals
    return json_number(data["balance"]) / 1e6;
}

} // namespace predex::gateway
