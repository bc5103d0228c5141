#include "stream_manager.H"

#include "core/utils.H"

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace predex::stream {

// longest single receive wait, bounds how late a new subscription is sent
static constexpr std::chrono::milliseconds MAX_RECEIVE_WAIT{250};
// how often a push into a full output channel rechecks for shutdown
static constexpr std::chrono::milliseconds PUSH_WAIT{50};

const char* to_string(CHANNEL_STATE state) {
    switch (state) {
        case CHANNEL_STATE::DISCONNECTED: return "DISCONNECTED";
        case CHANNEL_STATE::CONNECTING: return "CONNECTING";
        case CHANNEL_STATE::SUBSCRIBED: return "SUBSCRIBED";
        case CHANNEL_STATE::STREAMING: return "STREAMING";
        case CHANNEL_STATE::GAVE_UP: return "GAVE_UP";
    }
    return "UNKNOWN";
}

StreamManager::StreamManager(const Config& config, ConnectionFactory factory, EventChannel<Event>& output,
                             std::shared_ptr<spdlog::logger> logger)
    : api(config.api), websocket(config.websocket), reconnect(config.reconnect_backoff),
      backoff(config.reconnect_backoff.base, config.reconnect_backoff.max, config.reconnect_backoff.jitter),
      factory(std::move(factory)), output(output), logger(logger) {
    channels[static_cast<size_t>(CHANNEL::MARKET)] =
        std::make_unique<Channel>(CHANNEL::MARKET, api.ws_host + "/ws/market", logger);
    channels[static_cast<size_t>(CHANNEL::USER)] =
        std::make_unique<Channel>(CHANNEL::USER, api.ws_host + "/ws/user", logger);
}

StreamManager::~StreamManager() {
    stop();
}

void StreamManager::set_status_callback(StatusCallback callback) {
    status_callback = std::move(callback);
}

void StreamManager::set_fatal_handler(FatalHandler handler) {
    fatal_handler = std::move(handler);
}

void StreamManager::subscribe_market(const std::vector<std::string>& token_ids) {
    add_subscriptions(CHANNEL::MARKET, token_ids);
}

void StreamManager::subscribe_user(const std::vector<std::string>& market_ids) {
    if (!api.has_credentials()) {
        logger->warn("No API credentials configured, user channel not subscribed");
        return;
    }
    add_subscriptions(CHANNEL::USER, market_ids);
}

void StreamManager::add_subscriptions(CHANNEL id, const std::vector<std::string>& ids) {
    Channel& ch = channel(id);
    bool added = false;
    {
        std::lock_guard<std::mutex> lock(ch.mutex);
        for (const auto& sub : ids) {
            if (!sub.empty() && ch.subscriptions.insert(sub).second) {
                added = true;
            }
        }
    }
    if (!added) {
        return;
    }

    logger->info("{} channel subscriptions extended by {}", to_string(id), ids.size());
    ch.resubscribe = true;

    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    if (running) {
        launch(ch);
    }
}

void StreamManager::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    if (running.exchange(true)) {
        return;
    }
    for (auto& ch : channels) {
        bool has_subscriptions;
        {
            std::lock_guard<std::mutex> ch_lock(ch->mutex);
            has_subscriptions = !ch->subscriptions.empty();
        }
        if (has_subscriptions) {
            launch(*ch);
        }
    }
}

// lifecycle_mutex held
void StreamManager::launch(Channel& ch) {
    if (ch.thread.joinable() || halt.stop_requested()) {
        return;
    }
    logger->info("Starting {} channel on {}", to_string(ch.id), ch.url);
    ch.thread = std::thread(&StreamManager::run_channel, this, std::ref(ch));
}

void StreamManager::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    running = false;
    halt.request_stop();

    for (auto& ch : channels) {
        std::lock_guard<std::mutex> ch_lock(ch->mutex);
        if (ch->connection != nullptr) {
            ch->connection->close();
        }
    }
    for (auto& ch : channels) {
        // a fatal handler may call stop() from the channel thread itself
        if (ch->thread.joinable() && ch->thread.get_id() != std::this_thread::get_id()) {
            ch->thread.join();
        }
    }
}

CHANNEL_STATE StreamManager::get_state(CHANNEL id) const {
    return channel(id).state.load();
}

uint64_t StreamManager::get_received(CHANNEL id) const {
    return channel(id).recv_seq.load();
}

void StreamManager::set_state(Channel& ch, CHANNEL_STATE state, uint32_t failures, const std::string& detail) {
    ch.state = state;
    if (!status_callback) {
        return;
    }
    try {
        status_callback(ChannelStatus{ch.id, state, failures, detail});
    } catch (const std::exception& e) {
        logger->error("Status callback failed for {} channel: {}", to_string(ch.id), e.what());
    }
}

std::string StreamManager::subscribe_message(Channel& ch) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(ch.mutex);
        ids.assign(ch.subscriptions.begin(), ch.subscriptions.end());
    }

    json message;
    if (ch.id == CHANNEL::MARKET) {
        message = {{"assets_ids", ids}, {"type", "market"}};
    } else {
        message = {
            {"auth", {{"apiKey", api.api_key}, {"secret", api.api_secret}, {"passphrase", api.api_passphrase}}},
            {"markets", ids},
            {"type", "user"},
        };
    }
    return message.dump();
}

void StreamManager::run_channel(Channel& ch) {
    uint32_t failures = 0;

    while (!halt.stop_requested()) {
        set_state(ch, CHANNEL_STATE::CONNECTING, failures);

        std::unique_ptr<WsConnection> connection;
        bool streamed = false;
        std::string reason;
        try {
            connection = factory();
            {
                std::lock_guard<std::mutex> lock(ch.mutex);
                ch.connection = connection.get();
            }
            if (halt.stop_requested()) {
                break;
            }

            connection->connect(ch.url, websocket.heartbeat_timeout);
            ch.resubscribe = false;
            connection->send(subscribe_message(ch));
            set_state(ch, CHANNEL_STATE::SUBSCRIBED, failures);

            stream_connection(ch, *connection, streamed);
        } catch (const StreamDisconnected& e) {
            reason = e.what();
        } catch (const std::exception& e) {
            reason = std::string("unexpected error: ") + e.what();
        }

        {
            std::lock_guard<std::mutex> lock(ch.mutex);
            ch.connection = nullptr;
        }
        if (connection) {
            connection->close();
            connection.reset();
        }

        if (halt.stop_requested()) {
            break;
        }

        if (streamed) {
            failures = 0;
        }
        failures++;

        if (reconnect.max_attempts > 0 && failures >= reconnect.max_attempts) {
            logger->critical("{} channel gave up after {} consecutive failures: {}", to_string(ch.id), failures, reason);
            set_state(ch, CHANNEL_STATE::GAVE_UP, failures, reason);
            if (fatal_handler) {
                fatal_handler(ch.id, reason);
            }
            return;
        }

        auto delay = backoff.delay(failures - 1);
        logger->warn("{} channel disconnected ({}), reconnect attempt {} in {}ms", to_string(ch.id), reason,
                     failures, delay.count());
        set_state(ch, CHANNEL_STATE::DISCONNECTED, failures, reason);

        if (halt.wait_for(delay)) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(ch.mutex);
        ch.connection = nullptr;
    }
    set_state(ch, CHANNEL_STATE::DISCONNECTED, 0, "stopped");
    logger->info("{} channel stopped", to_string(ch.id));
}

void StreamManager::stream_connection(Channel& ch, WsConnection& connection, bool& streamed) {
    using clock = std::chrono::steady_clock;
    using std::chrono::milliseconds;

    auto last_frame = clock::now();
    bool pinging = websocket.ping_interval.count() > 0;
    auto next_ping = pinging ? last_frame + websocket.ping_interval : clock::time_point::max();

    while (!halt.stop_requested()) {
        if (ch.resubscribe.exchange(false)) {
            connection.send(subscribe_message(ch));
        }

        auto now = clock::now();
        if (pinging && now >= next_ping) {
            connection.send("PING");
            next_ping = now + websocket.ping_interval;
        }

        auto deadline = last_frame + websocket.heartbeat_timeout;
        if (now >= deadline) {
            throw StreamDisconnected("no frame within " + std::to_string(websocket.heartbeat_timeout.count()) + "ms");
        }

        auto wake = std::min(deadline, next_ping);
        auto wait = std::min(std::chrono::duration_cast<milliseconds>(wake - now), MAX_RECEIVE_WAIT) + milliseconds(1);

        auto frame = connection.receive(wait);
        if (!frame) {
            continue;
        }

        last_frame = clock::now();
        ParsedFrame parsed = ch.parser.parse(*frame);
        // keepalives prove liveness but not a working subscription
        if (!streamed && !parsed.keepalive && !parsed.events.empty()) {
            streamed = true;
            logger->info("{} channel streaming", to_string(ch.id));
            set_state(ch, CHANNEL_STATE::STREAMING, 0);
        }
        publish(ch, parsed);
    }
}

void StreamManager::publish(Channel& ch, ParsedFrame& parsed) {
    for (auto& payload : parsed.events) {
        Event event;
        event.payload = std::move(payload);
        event.channel = to_string(ch.id);
        event.recv_seq = ++ch.recv_seq;
        event.venue_seq = parsed.venue_seq;
        event.received_at = nanotime();

        while (!output.push_for(event, PUSH_WAIT)) {
            if (output.is_closed()) {
                logger->debug("Output channel closed, dropping {} event", to_string(ch.id));
                return;
            }
            if (halt.stop_requested()) {
                logger->debug("Stopping with a full output channel, dropping {} event", to_string(ch.id));
                return;
            }
        }
    }
}

} // namespace predex::stream
