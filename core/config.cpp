#include "config.H"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace predex {

static const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("Config section '") + key + "' must be an object");
    }
    return *it;
}

template <typename T>
static void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value for '") + key + "': " + e.what());
    }
}

static void read_string(const json& obj, const char* key, std::string& out) {
    read(obj, key, out);
    out = substitute_env(out);
}

static void read_millis(const json& obj, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    read(obj, key, ms);
    if (ms < 0) {
        throw std::runtime_error(std::string("Config value '") + key + "' must not be negative");
    }
    out = std::chrono::milliseconds(ms);
}

std::string substitute_env(const std::string& value) {
    std::string result;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t start = value.find("${", pos);
        if (start == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }
        size_t end = value.find('}', start + 2);
        if (end == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }
        result.append(value, pos, start - pos);

        std::string expr = value.substr(start + 2, end - start - 2);
        std::string name = expr;
        std::string fallback;
        size_t colon = expr.find(':');
        if (colon != std::string::npos) {
            name = expr.substr(0, colon);
            fallback = expr.substr(colon + 1);
        }

        const char* env = std::getenv(name.c_str());
        result += (env != nullptr && *env != '\0') ? std::string(env) : fallback;
        pos = end + 1;
    }
    return result;
}

Config parse_config(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    Config config;

    std::string mode = to_string(config.mode);
    read_string(j, "mode", mode);
    try {
        config.mode = parse_mode(mode);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Config 'mode' must be 'paper' or 'live', got '" + mode + "'");
    }

    const json& api = section(j, "api");
    read_string(api, "clob_host", config.api.clob_host);
    read_string(api, "gamma_host", config.api.gamma_host);
    read_string(api, "ws_host", config.api.ws_host);
    read_string(api, "address", config.api.address);
    read_string(api, "api_key", config.api.api_key);
    read_string(api, "api_secret", config.api.api_secret);
    read_string(api, "api_passphrase", config.api.api_passphrase);
    read(api, "chain_id", config.api.chain_id);

    const json& rate_limit = section(j, "rate_limit");
    read(rate_limit, "capacity", config.rate_limit.capacity);
    read(rate_limit, "refill_per_second", config.rate_limit.refill_per_second);
    if (config.rate_limit.capacity <= 0 || config.rate_limit.refill_per_second <= 0) {
        throw std::runtime_error("Config rate_limit capacity and refill_per_second must be positive");
    }

    const json& retry = section(j, "retry");
    read(retry, "max_attempts", config.retry.max_attempts);
    read_millis(retry, "base_delay_ms", config.retry.base_delay);
    read_millis(retry, "max_delay_ms", config.retry.max_delay);
    read_millis(retry, "jitter_ms", config.retry.jitter);
    read_millis(retry, "timeout_ms", config.retry.timeout);
    if (config.retry.max_attempts < 1) {
        throw std::runtime_error("Config retry.max_attempts must be at least 1");
    }

    const json& reconnect = section(j, "reconnect_backoff");
    read_millis(reconnect, "base_ms", config.reconnect_backoff.base);
    read_millis(reconnect, "max_ms", config.reconnect_backoff.max);
    read_millis(reconnect, "jitter_ms", config.reconnect_backoff.jitter);
    read(reconnect, "max_attempts", config.reconnect_backoff.max_attempts);

    const json& websocket = section(j, "websocket");
    read_millis(websocket, "ping_interval_ms", config.websocket.ping_interval);
    read_millis(websocket, "heartbeat_timeout_ms", config.websocket.heartbeat_timeout);
    if (config.websocket.heartbeat_timeout.count() == 0) {
        throw std::runtime_error("Config websocket.heartbeat_timeout_ms must be positive");
    }

    const json& paper = section(j, "paper_trading");
    read(paper, "initial_balance", config.paper.initial_balance);
    read(paper, "fee_rate", config.paper.fee_rate);
    read(paper, "slippage", config.paper.slippage);
    read(paper, "leverage_enabled", config.paper.leverage_enabled);
    std::string fill_mode = "immediate";
    read_string(paper, "fill_mode", fill_mode);
    if (fill_mode == "immediate") {
        config.paper.fill_mode = FILL_MODE::IMMEDIATE;
    } else if (fill_mode == "on_cross") {
        config.paper.fill_mode = FILL_MODE::ON_CROSS;
    } else {
        throw std::runtime_error("Config paper_trading.fill_mode must be 'immediate' or 'on_cross', got '" + fill_mode + "'");
    }
    if (config.paper.initial_balance < 0 || config.paper.fee_rate < 0 || config.paper.slippage < 0) {
        throw std::runtime_error("Config paper_trading values must not be negative");
    }

    read_string(section(j, "storage"), "data_dir", config.storage.data_dir);

    const json& logging = section(j, "logging");
    read_string(logging, "level", config.logging.level);
    read_string(logging, "dir", config.logging.dir);
    read(logging, "console", config.logging.console);

    const json& strategy = section(j, "strategy");
    read_millis(strategy, "heartbeat_interval_ms", config.strategy.heartbeat_interval);
    read(strategy, "default_size", config.strategy.default_size);
    read(strategy, "markets", config.strategy.markets);
    for (auto& ref : config.strategy.markets) {
        ref = substitute_env(ref);
    }
    if (auto params = strategy.find("params"); params != strategy.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw std::runtime_error("Config strategy.params must be an object");
        }
        config.strategy.params = *params;
    }
    if (config.strategy.default_size <= 0) {
        throw std::runtime_error("Config strategy.default_size must be positive");
    }

    const json& dispatcher = section(j, "dispatcher");
    read(dispatcher, "queue_capacity", config.dispatcher.queue_capacity);
    read(dispatcher, "graceful_shutdown", config.dispatcher.graceful_shutdown);

    return config;
}

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    return parse_config(j);
}

} // namespace predex
