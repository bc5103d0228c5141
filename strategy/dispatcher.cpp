#include "dispatcher.H"

#include "core/utils.H"

#include <algorithm>
#include <type_traits>

namespace predex::strategy {

static constexpr std::chrono::milliseconds MAX_WAIT{100};

Dispatcher::Dispatcher(Strategy& strategy, exec::ExecutionEngine& engine, EventChannel<Event>& events,
                       const Config& config, std::shared_ptr<spdlog::logger> logger)
    : strategy(strategy), engine(engine), events(events),
      heartbeat_interval(config.strategy.heartbeat_interval), logger(logger) {

    engine.on_fill([this](const FillEvent& fill) { queue_fill(fill); });
}

void Dispatcher::queue_fill(const FillEvent& fill) {
    Event event;
    event.payload = fill;
    event.channel = "engine";
    event.recv_seq = ++engine_seq;
    event.received_at = nanotime();
    engine_events.push_back(std::move(event));
}

template <typename F>
void Dispatcher::invoke(const char* callback, const Event* event, F&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        failures++;
        if (event != nullptr) {
            logger->error("Strategy {} failed in {} for {} event #{} from {} received {}: {}",
                strategy.get_name(), callback, event_type_name(event->payload), event->recv_seq,
                event->channel, format_timestamp(event->received_at), e.what());
        } else {
            logger->error("Strategy {} failed in {} at {}: {}",
                strategy.get_name(), callback, format_timestamp(nanotime()), e.what());
        }
    }
}

bool Dispatcher::next_event(Event& event, std::chrono::milliseconds wait) {
    if (!engine_events.empty()) {
        event = std::move(engine_events.front());
        engine_events.pop_front();
        return true;
    }
    auto next = wait.count() > 0 ? events.pop_for(wait) : events.try_pop();
    if (!next) {
        return false;
    }
    event = std::move(*next);
    return true;
}

void Dispatcher::run() {
    running = true;
    logger->info("Dispatcher starting strategy {}", strategy.get_name());
    invoke("on_start", nullptr, [this] { strategy.on_start(); });

    auto last_activity = std::chrono::steady_clock::now();
    Event event;
    while (!hard_stop) {
        if (stopping) {
            // drain whatever is queued without waiting for more
            if (!next_event(event, std::chrono::milliseconds(0))) {
                break;
            }
            dispatch(event);
            continue;
        }

        auto wait = MAX_WAIT;
        if (heartbeat_interval.count() > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - last_activity);
            wait = std::clamp(heartbeat_interval - elapsed, std::chrono::milliseconds(1), MAX_WAIT);
        }

        if (next_event(event, wait)) {
            dispatch(event);
            last_activity = std::chrono::steady_clock::now();
            continue;
        }

        if (events.is_closed() && events.size() == 0 && engine_events.empty()) {
            logger->info("Event channel closed, dispatcher stopping");
            break;
        }

        if (heartbeat_interval.count() > 0 &&
            std::chrono::steady_clock::now() - last_activity >= heartbeat_interval) {
            invoke("on_heartbeat", nullptr, [this] { strategy.on_heartbeat(); });
            last_activity = std::chrono::steady_clock::now();
        }
    }

    invoke("on_stop", nullptr, [this] { strategy.on_stop(); });
    logger->info("Dispatcher stopped strategy {} after {} events, {} callback failures, {} left queued",
        strategy.get_name(), processed.load(), failures.load(), events.size() + engine_events.size());
    running = false;
}

void Dispatcher::stop(SHUTDOWN mode) {
    if (mode == SHUTDOWN::HARD) {
        hard_stop = true;
    }
    stopping = true;
}

void Dispatcher::dispatch(const Event& event) {
    processed++;
    std::visit([this, &event](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;

        if constexpr (std::is_same_v<T, PriceUpdate>) {
            const Market* market = strategy.market_for_token(payload.token_id);
            if (market == nullptr) {
                dropped++;
                logger->debug("Price update for untracked token {} dropped", payload.token_id);
                return;
            }
            strategy.update_market_price(payload.token_id, payload.price);
            invoke("engine.on_price_update", &event, [this, &payload] { engine.on_price_update(payload); });
            invoke("on_price_update", &event, [this, market, &payload] { strategy.on_price_update(*market, payload); });
        } else if constexpr (std::is_same_v<T, OrderBookUpdate>) {
            const Market* market = strategy.market_for_token(payload.token_id);
            if (market == nullptr) {
                dropped++;
                logger->debug("Book update for untracked token {} dropped", payload.token_id);
                return;
            }
            invoke("on_order_book_update", &event, [this, market, &payload] {
                strategy.on_order_book_update(*market, payload);
            });
        } else if constexpr (std::is_same_v<T, FillNotification>) {
            invoke("engine.apply_fill_notification", &event, [this, &payload] {
                engine.apply_fill_notification(payload);
            });
        } else if constexpr (std::is_same_v<T, FillEvent>) {
            invoke("on_fill", &event, [this, &payload] { strategy.on_fill(payload.order, payload.trade); });
        }
    }, event.payload);
}

} // namespace predex::strategy
