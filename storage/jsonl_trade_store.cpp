#include "jsonl_trade_store.H"

#include "core/json_codec.H"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace predex::storage {

JsonlTradeStore::JsonlTradeStore(const std::string& data_dir, std::shared_ptr<spdlog::logger> logger)
    : logger(logger) {

    std::filesystem::path dir(data_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create data directory " + data_dir + ": " + ec.message());
    }
    path = (dir / "ledger.jsonl").string();

    replay();

    out.open(path, std::ios::out | std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open ledger for append: " + path);
    }
    if (torn_tail) {
        out << '\n';
        out.flush();
    }
    logger->info("Opened ledger {} with {} orders, {} trades, {} positions",
        path, orders.size(), trades.size(), positions.size());
}

void JsonlTradeStore::replay() {
    std::ifstream in(path);
    if (!in) {
        return;
    }

    std::string line;
    size_t line_no = 0;
    torn_tail = false;
    while (std::getline(in, line)) {
        ++line_no;
        torn_tail = in.eof();
        if (line.empty()) {
            continue;
        }
        try {
            json record = json::parse(line);
            apply(record.at("kind").get<std::string>(), record.at("data"));
        } catch (const std::exception& e) {
            ++skipped_lines;
            logger->warn("Skipping ledger line {} of {}: {}", line_no, path, e.what());
        }
    }
}

void JsonlTradeStore::apply(const std::string& kind, const json& data) {
    if (kind == "order") {
        Order order = data.get<Order>();
        orders[order.id] = order;
    } else if (kind == "trade") {
        Trade trade = data.get<Trade>();
        if (trade_index.count(trade.id) == 0) {
            trade_index[trade.id] = trades.size();
            trades.push_back(trade);
        }
    } else if (kind == "position") {
        Position position = data.get<Position>();
        positions[position.token_id] = position;
    } else {
        throw std::runtime_error("unknown record kind '" + kind + "'");
    }
}

void JsonlTradeStore::append(const char* kind, const json& data) {
    json record = {{"kind", kind}, {"data", data}};
    out << record.dump() << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + std::string(kind) + " record to " + path);
    }
}

void JsonlTradeStore::save_order(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex);
    append("order", order);
    orders[order.id] = order;
}

void JsonlTradeStore::save_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex);
    if (trade_index.count(trade.id) != 0) {
        logger->debug("Trade {} already stored", trade.id);
        return;
    }
    append("trade", trade);
    trade_index[trade.id] = trades.size();
    trades.push_back(trade);
}

void JsonlTradeStore::upsert_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex);
    append("position", position);
    positions[position.token_id] = position;
}

std::optional<Order> JsonlTradeStore::get_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = orders.find(order_id);
    if (it == orders.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Trade> JsonlTradeStore::get_trade(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = trade_index.find(trade_id);
    if (it == trade_index.end()) {
        return std::nullopt;
    }
    return trades[it->second];
}

std::vector<Order> JsonlTradeStore::get_orders(const std::string& market_id,
                                               std::optional<ORDER_STATUS> status,
                                               size_t limit) {
    std::vector<Order> result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [id, order] : orders) {
            if (!market_id.empty() && order.market_id != market_id) {
                continue;
            }
            if (status && order.status != *status) {
                continue;
            }
            result.push_back(order);
        }
    }

    std::sort(result.begin(), result.end(), [](const Order& a, const Order& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id < b.id;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::vector<Trade> JsonlTradeStore::get_trades(const std::string& market_id, size_t limit) {
    std::vector<Trade> result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        // arrival order reversed, so equal timestamps keep newest first
        for (auto it = trades.rbegin(); it != trades.rend(); ++it) {
            if (market_id.empty() || it->market_id == market_id) {
                result.push_back(*it);
            }
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const Trade& a, const Trade& b) {
        return a.timestamp > b.timestamp;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::vector<Position> JsonlTradeStore::get_positions() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Position> result;
    result.reserve(positions.size());
    for (const auto& [token, position] : positions) {
        result.push_back(position);
    }
    return result;
}

StoreStats JsonlTradeStore::stats() {
    std::lock_guard<std::mutex> lock(mutex);
    StoreStats stats;
    stats.total_orders = orders.size();
    stats.total_trades = trades.size();
    for (const auto& [token, position] : positions) {
        if (!position.is_flat()) {
            ++stats.open_positions;
        }
    }
    for (const Trade& trade : trades) {
        if (trade.side == SIDE::BUY) {
            stats.total_volume_bought += trade.value();
        } else {
            stats.total_volume_sold += trade.value();
        }
    }
    return stats;
}

} // namespace predex::storage
