#include "strategy.H"

#include <stdexcept>

namespace predex::strategy {

Strategy::Strategy(std::string name)
    : logger(spdlog::default_logger()), name(std::move(name)) {
}

void Strategy::attach(exec::ExecutionEngine& engine, const StrategyConfig& config,
                      std::shared_ptr<spdlog::logger> logger) {
    this->engine = &engine;
    this->config = config;
    this->logger = logger;
}

void Strategy::set_markets(std::vector<Market> markets) {
    this->markets = std::move(markets);
}

const Market* Strategy::find_market(const std::string& market_id) const {
    for (const auto& market : markets) {
        if (market.id == market_id) {
            return &market;
        }
    }
    return nullptr;
}

const Market* Strategy::market_for_token(const std::string& token_id) const {
    for (const auto& market : markets) {
        if (market.holds_token(token_id)) {
            return &market;
        }
    }
    return nullptr;
}

std::vector<std::string> Strategy::get_token_ids() const {
    std::vector<std::string> tokens;
    for (const auto& market : markets) {
        if (!market.token_id_yes.empty()) {
            tokens.push_back(market.token_id_yes);
        }
        if (!market.token_id_no.empty()) {
            tokens.push_back(market.token_id_no);
        }
    }
    return tokens;
}

void Strategy::update_market_price(const std::string& token_id, double price) {
    for (auto& market : markets) {
        if (token_id == market.token_id_yes) {
            market.price_yes = price;
        } else if (token_id == market.token_id_no) {
            market.price_no = price;
        }
    }
}

exec::ExecutionEngine& Strategy::require_engine() const {
    if (engine == nullptr) {
        throw std::logic_error("Strategy " + name + " is not attached to an execution engine");
    }
    return *engine;
}

exec::OrderHandle Strategy::place(const Market& market, SIDE side, double size, std::optional<double> price,
                                  OUTCOME outcome, ORDER_TYPE type) {
    if (find_market(market.id) == nullptr) {
        throw std::invalid_argument("Market " + market.id + " is not traded by strategy " + name);
    }

    // the strategy's own copy carries the freshest prices
    const Market& scoped = *find_market(market.id);
    double limit = price.value_or(scoped.last_price(outcome));
    if (!price && limit <= 0.0) {
        throw exec::ExecutionError(exec::EXEC_ERROR::INVALID_PRICE,
            "no known price for " + std::string(to_string(outcome)) + " in market " + market.id);
    }

    exec::OrderIntent intent;
    intent.market_id = scoped.id;
    intent.token_id = scoped.token_for(outcome);
    intent.side = side;
    intent.size = size;
    intent.price = limit;
    intent.type = type;

    exec::OrderHandle handle = require_engine().submit(intent);
    logger->info("[{}] {} {} {} @ {:.4f} in {} -> {} {}", name, to_string(side), size, to_string(outcome),
        limit, scoped.id, handle.order_id, to_string(handle.status));
    return handle;
}

exec::OrderHandle Strategy::buy(const Market& market, std::optional<double> size, std::optional<double> price,
                                OUTCOME outcome, ORDER_TYPE type) {
    return place(market, SIDE::BUY, size.value_or(config.default_size), price, outcome, type);
}

exec::OrderHandle Strategy::sell(const Market& market, std::optional<double> size, std::optional<double> price,
                                 OUTCOME outcome, ORDER_TYPE type) {
    double amount = size ? *size : position(market, outcome);
    if (amount <= 0.0) {
        throw exec::ExecutionError(exec::EXEC_ERROR::INSUFFICIENT_POSITION,
            "no " + std::string(to_string(outcome)) + " position to sell in market " + market.id);
    }
    return place(market, SIDE::SELL, amount, price, outcome, type);
}

bool Strategy::cancel(const std::string& order_id) {
    return require_engine().cancel(order_id);
}

size_t Strategy::cancel_all(const Market* market) {
    size_t cancelled = 0;
    for (const auto& order : require_engine().get_open_orders()) {
        if (market != nullptr && order.market_id != market->id) {
            continue;
        }
        if (find_market(order.market_id) == nullptr) {
            continue;
        }
        if (cancel(order.id)) {
            ++cancelled;
        }
    }
    return cancelled;
}

double Strategy::position(const Market& market, OUTCOME outcome) const {
    auto held = get_position(market, outcome);
    return held ? held->net_size : 0.0;
}

std::optional<Position> Strategy::get_position(const Market& market, OUTCOME outcome) const {
    return require_engine().get_position(market.token_for(outcome));
}

std::vector<Order> Strategy::open_orders(const Market& market) const {
    std::vector<Order> result;
    for (const auto& order : require_engine().get_open_orders()) {
        if (order.market_id == market.id) {
            result.push_back(order);
        }
    }
    return result;
}

double Strategy::balance() const {
    return require_engine().get_balance();
}

double Strategy::equity() const {
    return require_engine().get_stats().equity;
}

double Strategy::pnl() const {
    auto stats = require_engine().get_stats();
    return stats.realized_pnl + stats.unrealized_pnl;
}

void Strategy::signal(const Market& market, const std::string& signal, const std::string& reason) {
    logger->info("[{}] signal {} on {} ({}): {}", name, signal, market.id, market.question, reason);
}

} // namespace predex::strategy
