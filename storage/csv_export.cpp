#include "csv_export.H"

#include "core/utils.H"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace predex::storage {

namespace {

std::string number(double value) {
    std::ostringstream ss;
    ss.precision(10);
    ss << value;
    return ss.str();
}

const char* is_paper(MODE mode) {
    return mode == MODE::PAPER ? "true" : "false";
}

std::ofstream open_csv(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    return out;
}

void finish(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

} // namespace

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

size_t export_trades_csv(TradeStore& store, const std::string& path) {
    auto trades = store.get_trades("", std::numeric_limits<size_t>::max());
    std::ofstream out = open_csv(path);

    out << "id,order_id,market_id,token_id,side,price,size,fee,is_paper,executed_at\n";
    for (const Trade& t : trades) {
        out << csv_escape(t.id) << ','
            << csv_escape(t.order_id) << ','
            << csv_escape(t.market_id) << ','
            << csv_escape(t.token_id) << ','
            << to_string(t.side) << ','
            << number(t.price) << ','
            << number(t.size) << ','
            << number(t.fee) << ','
            << is_paper(t.mode) << ','
            << format_timestamp(t.timestamp) << '\n';
    }
    finish(out, path);
    return trades.size();
}

size_t export_orders_csv(TradeStore& store, const std::string& path) {
    auto orders = store.get_orders("", std::nullopt, std::numeric_limits<size_t>::max());
    std::ofstream out = open_csv(path);

    out << "id,market_id,token_id,side,order_type,status,price,size,filled_size,is_paper,created_at\n";
    for (const Order& o : orders) {
        out << csv_escape(o.id) << ','
            << csv_escape(o.market_id) << ','
            << csv_escape(o.token_id) << ','
            << to_string(o.side) << ','
            << to_string(o.type) << ','
            << to_string(o.status) << ','
            << number(o.price) << ','
            << number(o.size) << ','
            << number(o.filled_size) << ','
            << is_paper(o.mode) << ','
            << format_timestamp(o.created_at) << '\n';
    }
    finish(out, path);
    return orders.size();
}

size_t export_positions_csv(TradeStore& store, const std::string& path) {
    auto positions = store.get_positions();
    std::ofstream out = open_csv(path);

    out << "token_id,market_id,size,avg_entry_price,realized_pnl,updated_at\n";
    for (const Position& p : positions) {
        out << csv_escape(p.token_id) << ','
            << csv_escape(p.market_id) << ','
            << number(p.net_size) << ','
            << number(p.avg_entry_price) << ','
            << number(p.realized_pnl) << ','
            << format_timestamp(p.updated_at) << '\n';
    }
    finish(out, path);
    return positions.size();
}

} // namespace predex::storage
