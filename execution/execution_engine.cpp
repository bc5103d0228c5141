#include "execution_engine.H"

#include "core/utils.H"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace predex::exec {

static constexpr double EPSILON = 1e-9;

ExecutionEngine::ExecutionEngine(const Config& config, gateway::ClobApi* api, storage::TradeStore* store,
                                 std::shared_ptr<spdlog::logger> logger)
    : mode(config.mode), paper(config.paper), api(api), store(store), logger(logger),
      balance(config.is_paper() ? config.paper.initial_balance : 0.0) {

    if (mode == MODE::LIVE && api == nullptr) {
        throw std::invalid_argument("Live execution requires a venue API client");
    }
    publish();
}

void ExecutionEngine::on_fill(FillCallback callback) {
    fill_callbacks.push_back(std::move(callback));
}

void ExecutionEngine::validate(const OrderIntent& intent) const {
    if (intent.token_id.empty()) {
        throw std::invalid_argument("Order intent has no token id");
    }
    if (intent.mode && *intent.mode != mode) {
        throw std::invalid_argument(std::string("Order intent for ") + to_string(*intent.mode)
            + " mode sent to " + to_string(mode) + " engine");
    }
    if (!std::isfinite(intent.price) || intent.price < 0.0 || intent.price > 1.0) {
        throw ExecutionError(EXEC_ERROR::INVALID_PRICE,
            fmt::format("price {} outside [0, 1]", intent.price));
    }
    if (!std::isfinite(intent.size) || intent.size <= 0.0) {
        throw ExecutionError(EXEC_ERROR::INVALID_PRICE,
            fmt::format("size {} must be positive", intent.size));
    }
}

OrderHandle ExecutionEngine::submit(const OrderIntent& intent) {
    validate(intent);
    return mode == MODE::PAPER ? submit_paper(intent) : submit_live(intent);
}

double ExecutionEngine::paper_fill_price(const OrderIntent& intent) const {
    if (intent.type == ORDER_TYPE::LIMIT) {
        return intent.price;
    }
    double base = get_last_price(intent.token_id).value_or(intent.price);
    double price = intent.side == SIDE::BUY ? base * (1.0 + paper.slippage) : base * (1.0 - paper.slippage);
    return std::clamp(price, 0.0, 1.0);
}

double ExecutionEngine::paper_fee(double price, double size) const {
    return price * size * paper.fee_rate;
}

void ExecutionEngine::check_affordable(const OrderIntent& intent, double price) const {
    if (paper.leverage_enabled) {
        return;
    }

    if (intent.side == SIDE::BUY) {
        double cost = price * intent.size + paper_fee(price, intent.size);
        double available = get_available_balance();
        if (cost > available + EPSILON) {
            throw ExecutionError(EXEC_ERROR::INSUFFICIENT_BALANCE,
                fmt::format("cost {:.4f} exceeds available balance {:.4f}", cost, available));
        }
    } else {
        double held = positions.net_size(intent.token_id) - resting_sell_size(intent.token_id);
        if (intent.size > held + EPSILON) {
            throw ExecutionError(EXEC_ERROR::INSUFFICIENT_POSITION,
                fmt::format("sell of {} exceeds sellable position {} in {}", intent.size, held, intent.token_id));
        }
    }
}

OrderHandle ExecutionEngine::submit_paper(const OrderIntent& intent) {
    bool rests = paper.fill_mode == FILL_MODE::ON_CROSS && intent.type == ORDER_TYPE::LIMIT;
    double fill_price = paper_fill_price(intent);

    // all checks happen before anything is mutated
    check_affordable(intent, fill_price);

    Order order;
    order.id = generate_id("paper_");
    order.market_id = intent.market_id;
    order.token_id = intent.token_id;
    order.side = intent.side;
    order.type = intent.type;
    order.size = intent.size;
    order.price = intent.price;
    order.status = ORDER_STATUS::OPEN;
    order.created_at = nanotime();
    order.updated_at = order.created_at;
    order.mode = MODE::PAPER;

    Order& stored = record_order(std::move(order));
    logger->info("Paper order {} created: {} {} {} @ {:.4f}", stored.id, to_string(stored.side),
        stored.size, stored.token_id, stored.price);

    if (rests) {
        if (stored.side == SIDE::BUY) {
            reservations[stored.id] = stored.size * stored.price * (1.0 + paper.fee_rate);
        }
        publish();
        return handle_for(stored);
    }

    fill(stored, fill_price, stored.size, paper_fee(fill_price, stored.size),
        generate_id("trade_"), nanotime());
    return handle_for(stored);
}

OrderHandle ExecutionEngine::submit_live(const OrderIntent& intent) {
    Order order;
    order.market_id = intent.market_id;
    order.token_id = intent.token_id;
    order.side = intent.side;
    order.type = intent.type;
    order.size = intent.size;
    order.price = intent.price;
    order.status = ORDER_STATUS::PENDING;
    order.created_at = nanotime();
    order.mode = MODE::LIVE;

    // transport and server failures propagate with nothing recorded, a 4xx
    // answer is the venue refusing the order
    gateway::SubmitResult result;
    try {
        result = api->submit_order(order);
    } catch (const gateway::GatewayError& e) {
        if (e.get_kind() != gateway::GATEWAY_ERROR::CLIENT_ERROR || e.is_schema_violation()) {
            throw;
        }
        result.accepted = false;
        result.error = e.what();
    }

    order.updated_at = nanotime();
    if (!result.accepted) {
        order.id = result.order_id.empty() ? generate_id("rejected_") : result.order_id;
        order.status = ORDER_STATUS::REJECTED;
        order.reject_reason = result.error;
        Order& stored = record_order(std::move(order));
        logger->warn("Live order {} rejected by venue: {}", stored.id, stored.reject_reason);
        publish();
        return handle_for(stored);
    }

    order.id = result.order_id;
    order.status = ORDER_STATUS::OPEN;
    Order& stored = record_order(std::move(order));
    logger->info("Live order {} accepted ({}): {} {} {} @ {:.4f}", stored.id, result.status,
        to_string(stored.side), stored.size, stored.token_id, stored.price);
    publish();
    return handle_for(stored);
}

Order& ExecutionEngine::record_order(Order order) {
    auto it = orders.find(order.id);
    if (it != orders.end()) {
        logger->warn("Order id {} reused, replacing previous record", order.id);
        it->second = std::move(order);
    } else {
        std::string id = order.id;
        order_sequence.push_back(id);
        it = orders.emplace(id, std::move(order)).first;
    }
    Order& stored = it->second;
    persist("order", [&stored](storage::TradeStore& s) { s.save_order(stored); });
    return stored;
}

bool ExecutionEngine::cancel(const std::string& order_id) {
    auto it = orders.find(order_id);
    if (it == orders.end()) {
        throw ExecutionError(EXEC_ERROR::UNKNOWN_ORDER, "no order " + order_id);
    }
    Order& order = it->second;
    if (is_terminal(order.status)) {
        logger->info("Cancel of {} ignored, order is {}", order_id, to_string(order.status));
        return false;
    }

    if (order.mode == MODE::LIVE && !api->cancel_order(order_id)) {
        return false;
    }

    order.status = ORDER_STATUS::CANCELLED;
    order.updated_at = nanotime();
    release_reservation(order_id);
    persist("order", [&order](storage::TradeStore& s) { s.save_order(order); });
    logger->info("Order {} cancelled with {} of {} filled", order_id, order.filled_size, order.size);
    publish();
    return true;
}

bool ExecutionEngine::apply_fill_notification(const FillNotification& notification) {
    if (!notification.trade_id.empty() && seen_trade_ids.count(notification.trade_id) != 0) {
        logger->debug("Duplicate fill {} for order {} ignored", notification.trade_id, notification.order_id);
        return false;
    }

    auto it = orders.find(notification.order_id);
    if (it == orders.end()) {
        logger->warn("Fill {} for unknown order {} dropped", notification.trade_id, notification.order_id);
        return false;
    }
    Order& order = it->second;

    double remaining = order.remaining_size();
    if (remaining <= EPSILON || order.status == ORDER_STATUS::REJECTED) {
        logger->warn("Fill {} for {} order {} has nothing left to fill, dropped",
            notification.trade_id, to_string(order.status), order.id);
        return false;
    }

    double size = notification.size;
    if (size > remaining + EPSILON) {
        logger->warn("Fill {} of {} exceeds remaining {} on order {}, clipped",
            notification.trade_id, size, remaining, order.id);
        size = remaining;
    }
    if (size <= EPSILON) {
        logger->warn("Fill {} on order {} has no size, dropped", notification.trade_id, order.id);
        return false;
    }

    std::string trade_id = notification.trade_id.empty() ? generate_id("trade_") : notification.trade_id;
    seen_trade_ids.insert(trade_id);
    uint64_t timestamp = notification.timestamp != 0 ? notification.timestamp : nanotime();
    fill(order, notification.price, size, notification.fee, trade_id, timestamp);
    return true;
}

void ExecutionEngine::fill(Order& order, double price, double size, double fee,
                           const std::string& trade_id, uint64_t timestamp) {
    Trade trade;
    trade.id = trade_id;
    trade.order_id = order.id;
    trade.market_id = order.market_id;
    trade.token_id = order.token_id;
    trade.side = order.side;
    trade.price = price;
    trade.size = size;
    trade.fee = fee;
    trade.timestamp = timestamp;
    trade.mode = order.mode;

    order.filled_size = std::min(order.size, order.filled_size + size);
    ORDER_STATUS next = order.remaining_size() <= EPSILON ? ORDER_STATUS::FILLED : ORDER_STATUS::PARTIALLY_FILLED;
    // a late fill on a cancelled order keeps it cancelled
    if (!is_terminal(order.status) && status_rank(next) >= status_rank(order.status)) {
        order.status = next;
    }
    order.updated_at = nanotime();

    if (trade.side == SIDE::BUY) {
        balance -= trade.value() + fee;
        volume_bought += trade.value();
    } else {
        balance += trade.value() - fee;
        volume_sold += trade.value();
    }
    fees_paid += fee;

    if (order.status == ORDER_STATUS::FILLED) {
        release_reservation(order.id);
    }

    positions.apply(trade);
    if (auto last = last_prices.find(trade.token_id); last != last_prices.end()) {
        positions.mark(trade.token_id, last->second, timestamp);
    }
    trades.push_back(trade);
    seen_trade_ids.insert(trade.id);

    logger->info("Order {} filled {} @ {:.4f} (fee {:.4f}), {} of {} done, balance {:.2f}",
        order.id, size, price, fee, order.filled_size, order.size, balance);

    Position position = *positions.find(trade.token_id);
    persist("trade", [&trade](storage::TradeStore& s) { s.save_trade(trade); });
    persist("order", [&order](storage::TradeStore& s) { s.save_order(order); });
    persist("position", [&position](storage::TradeStore& s) { s.upsert_position(position); });

    publish();

    FillEvent event{order, trade};
    for (auto& callback : fill_callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            logger->error("Fill callback failed for trade {}: {}", trade.id, e.what());
        }
    }
}

size_t ExecutionEngine::on_price_update(const PriceUpdate& update) {
    last_prices[update.token_id] = update.price;
    positions.mark(update.token_id, update.price, update.timestamp);

    size_t fills = 0;
    if (mode == MODE::PAPER && paper.fill_mode == FILL_MODE::ON_CROSS) {
        for (const auto& id : order_sequence) {
            Order& order = orders.at(id);
            if (!order.is_open() || order.token_id != update.token_id || order.type != ORDER_TYPE::LIMIT) {
                continue;
            }
            bool crossed = order.side == SIDE::BUY ? update.price <= order.price + EPSILON
                                                   : update.price >= order.price - EPSILON;
            if (!crossed) {
                continue;
            }
            double size = order.remaining_size();
            logger->debug("Price {:.4f} crossed {} limit {:.4f} on order {}", update.price,
                to_string(order.side), order.price, order.id);
            fill(order, order.price, size, paper_fee(order.price, size), generate_id("trade_"),
                update.timestamp != 0 ? update.timestamp : nanotime());
            ++fills;
        }
    }

    if (fills == 0) {
        publish();
    }
    return fills;
}

double ExecutionEngine::refresh_balance() {
    if (mode == MODE::LIVE) {
        balance = api->get_balance();
        logger->info("Venue balance refreshed: {:.2f}", balance);
        publish();
    }
    return balance;
}

void ExecutionEngine::restore(const std::vector<Position>& restored, double restored_balance) {
    positions.restore(restored);
    balance = restored_balance;
    logger->info("Restored {} positions, balance {:.2f}", restored.size(), balance);
    publish();
}

void ExecutionEngine::release_reservation(const std::string& order_id) {
    reservations.erase(order_id);
}

double ExecutionEngine::reserved_total() const {
    double total = 0.0;
    for (const auto& [id, amount] : reservations) {
        total += amount;
    }
    return total;
}

double ExecutionEngine::resting_sell_size(const std::string& token_id) const {
    double total = 0.0;
    for (const auto& [id, order] : orders) {
        if (order.is_open() && order.side == SIDE::SELL && order.token_id == token_id) {
            total += order.remaining_size();
        }
    }
    return total;
}

void ExecutionEngine::persist(const char* what, const std::function<void(storage::TradeStore&)>& op) {
    if (store == nullptr) {
        return;
    }
    try {
        op(*store);
    } catch (const std::exception& e) {
        logger->error("Failed to store {}: {}", what, e.what());
    }
}

std::optional<Position> ExecutionEngine::get_position(const std::string& token_id) const {
    const Position* position = positions.find(token_id);
    if (position == nullptr) {
        return std::nullopt;
    }
    return *position;
}

std::optional<Order> ExecutionEngine::get_order(const std::string& order_id) const {
    auto it = orders.find(order_id);
    if (it == orders.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Order> ExecutionEngine::get_open_orders() const {
    std::vector<Order> result;
    for (const auto& id : order_sequence) {
        const Order& order = orders.at(id);
        if (order.is_open()) {
            result.push_back(order);
        }
    }
    return result;
}

std::optional<double> ExecutionEngine::get_last_price(const std::string& token_id) const {
    auto it = last_prices.find(token_id);
    if (it == last_prices.end()) {
        return std::nullopt;
    }
    return it->second;
}

EngineStats ExecutionEngine::get_stats() const {
    EngineStats stats;
    stats.total_trades = trades.size();
    stats.volume_bought = volume_bought;
    stats.volume_sold = volume_sold;
    stats.fees = fees_paid;
    stats.realized_pnl = positions.realized_pnl();
    stats.unrealized_pnl = positions.unrealized_pnl();
    stats.equity = balance + positions.market_value();
    return stats;
}

void ExecutionEngine::publish() {
    auto next = std::make_shared<EngineSnapshot>();
    next->mode = mode;
    next->balance = balance;
    next->reserved = reserved_total();
    next->orders.reserve(order_sequence.size());
    for (const auto& id : order_sequence) {
        next->orders.push_back(orders.at(id));
    }
    next->positions = positions.all();
    next->stats = get_stats();
    next->taken_at = nanotime();

    std::lock_guard<std::mutex> lock(snapshot_mutex);
    published = std::move(next);
}

std::shared_ptr<const EngineSnapshot> ExecutionEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return published;
}

OrderHandle ExecutionEngine::handle_for(const Order& order) {
    OrderHandle handle;
    handle.order_id = order.id;
    handle.status = order.status;
    handle.filled_size = order.filled_size;
    handle.reject_reason = order.reject_reason;
    return handle;
}

} // namespace predex::exec
