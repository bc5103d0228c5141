#include "threshold_strategy.H"

#include "core/json_codec.H"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace predex::strategy {

ThresholdStrategy::ThresholdStrategy(const nlohmann::json& params)
    : Strategy("threshold"),
      entry_price(json_number(params, "entry_price", 0.3)),
      exit_price(json_number(params, "exit_price", 0.7)) {

    if (params.contains("size")) {
        size = json_number(params, "size");
        if (*size <= 0) {
            throw std::invalid_argument("threshold strategy size must be positive");
        }
    }
    if (entry_price <= 0 || exit_price >= 1 || entry_price >= exit_price) {
        throw std::invalid_argument("threshold strategy needs 0 < entry_price < exit_price < 1");
    }
}

void ThresholdStrategy::on_start() {
    logger->info("[{}] starting on {} markets, entry <= {:.3f}, exit >= {:.3f}",
        get_name(), get_markets().size(), entry_price, exit_price);
}

void ThresholdStrategy::on_stop() {
    logger->info("[{}] stopped after {} fills, {} rejected orders, pnl {:.2f}",
        get_name(), fills, rejections, pnl());
}

void ThresholdStrategy::on_price_update(const Market& market, const PriceUpdate& update) {
    if (update.token_id != market.token_id_yes) {
        return;
    }

    auto pending = working.find(market.id);
    if (pending != working.end()) {
        bool still_open = false;
        for (const auto& order : open_orders(market)) {
            still_open |= order.id == pending->second;
        }
        if (still_open) {
            return;
        }
        working.erase(pending);
    }

    double held = position(market);
    try {
        if (held <= 0 && update.price <= entry_price) {
            signal(market, "BUY", fmt::format("price {:.3f} at or below {:.3f}", update.price, entry_price));
            auto handle = buy(market, size, update.price);
            if (handle.is_rejected()) {
                ++rejections;
            } else if (!is_terminal(handle.status)) {
                working[market.id] = handle.order_id;
            }
        } else if (held > 0 && update.price >= exit_price) {
            signal(market, "SELL", fmt::format("price {:.3f} at or above {:.3f}", update.price, exit_price));
            auto handle = sell(market, std::nullopt, update.price);
            if (handle.is_rejected()) {
                ++rejections;
            } else if (!is_terminal(handle.status)) {
                working[market.id] = handle.order_id;
            }
        }
    } catch (const exec::ExecutionError& e) {
        ++rejections;
        logger->warn("[{}] order refused in {}: {}", get_name(), market.id, e.what());
    }
}

void ThresholdStrategy::on_fill(const Order& order, const Trade& trade) {
    ++fills;
    if (order.status == ORDER_STATUS::FILLED) {
        auto it = working.find(order.market_id);
        if (it != working.end() && it->second == order.id) {
            working.erase(it);
        }
    }
    logger->info("[{}] filled {} {} @ {:.4f}, balance {:.2f}",
        get_name(), to_string(trade.side), trade.size, trade.price, balance());
}

void ThresholdStrategy::on_heartbeat() {
    logger->info("[{}] alive, balance {:.2f}, equity {:.2f}", get_name(), balance(), equity());
}

} // namespace predex::strategy
