#include "position_book.H"

#include <algorithm>
#include <cmath>

namespace predex::exec {

static constexpr double EPSILON = 1e-9;

static void update_unrealized(Position& position) {
    if (position.mark_price > 0 && !position.is_flat()) {
        position.unrealized_pnl = (position.mark_price - position.avg_entry_price) * position.net_size;
    } else {
        position.unrealized_pnl = 0.0;
    }
}

const Position& PositionBook::apply(const Trade& trade) {
    Position& position = positions[trade.token_id];
    position.token_id = trade.token_id;
    if (!trade.market_id.empty()) {
        position.market_id = trade.market_id;
    }

    double signed_size = trade.signed_size();
    bool same_direction = position.is_flat() || (position.net_size > 0) == (signed_size > 0);

    if (same_direction) {
        double held = std::fabs(position.net_size);
        double cost = held * position.avg_entry_price + trade.size * trade.price;
        position.net_size += signed_size;
        position.avg_entry_price = cost / (held + trade.size);
    } else {
        double held = std::fabs(position.net_size);
        double closed = std::min(trade.size, held);
        double direction = position.net_size > 0 ? 1.0 : -1.0;
        position.realized_pnl += (trade.price - position.avg_entry_price) * closed * direction;
        position.net_size += signed_size;

        if (trade.size - closed > EPSILON) {
            position.avg_entry_price = trade.price;
        } else if (position.is_flat()) {
            position.net_size = 0.0;
            position.avg_entry_price = 0.0;
        }
    }

    position.updated_at = trade.timestamp;
    update_unrealized(position);
    return position;
}

void PositionBook::mark(const std::string& token_id, double price, uint64_t timestamp) {
    auto it = positions.find(token_id);
    if (it == positions.end()) {
        return;
    }
    it->second.mark_price = price;
    it->second.updated_at = std::max(it->second.updated_at, timestamp);
    update_unrealized(it->second);
}

void PositionBook::restore(const std::vector<Position>& restored) {
    positions.clear();
    for (const auto& position : restored) {
        positions[position.token_id] = position;
    }
}

const Position* PositionBook::find(const std::string& token_id) const {
    auto it = positions.find(token_id);
    return it == positions.end() ? nullptr : &it->second;
}

double PositionBook::net_size(const std::string& token_id) const {
    const Position* position = find(token_id);
    return position ? position->net_size : 0.0;
}

std::vector<Position> PositionBook::all() const {
    std::vector<Position> result;
    result.reserve(positions.size());
    for (const auto& [token, position] : positions) {
        result.push_back(position);
    }
    return result;
}

double PositionBook::realized_pnl() const {
    double total = 0.0;
    for (const auto& [token, position] : positions) {
        total += position.realized_pnl;
    }
    return total;
}

double PositionBook::unrealized_pnl() const {
    double total = 0.0;
    for (const auto& [token, position] : positions) {
        total += position.unrealized_pnl;
    }
    return total;
}

double PositionBook::market_value() const {
    double total = 0.0;
    for (const auto& [token, position] : positions) {
        double price = position.mark_price > 0 ? position.mark_price : position.avg_entry_price;
        total += position.net_size * price;
    }
    return total;
}

} // namespace predex::exec
