#include "runner.H"

#include "core/utils.H"
#include "stream/wspp_connection.H"

#include <stdexcept>

namespace predex::app {

Runner::Runner(const Config& config, std::shared_ptr<spdlog::logger> logger)
    : config(config), logger(logger),
      transport(logger),
      limiter(config.rate_limit),
      gateway(transport, limiter, config.retry, logger),
      api(gateway, config.api, stop, logger),
      store(config.storage.data_dir, logger),
      events(config.dispatcher.queue_capacity),
      loader(logger) {
}

Runner::~Runner() {
    if (stream) {
        stream->stop();
    }
}

std::vector<Market> Runner::resolve_markets(const std::vector<std::string>& refs) {
    std::vector<Market> markets;
    for (const auto& ref : refs) {
        Market market = api.resolve_market_ref(ref);
        if (market.status != MARKET_STATUS::OPEN) {
            logger->warn("Market {} is {}, trading it will likely be refused", market.id, to_string(market.status));
        }
        logger->info("Trading {}", gateway::format_market_summary(market));
        markets.push_back(std::move(market));
    }
    return markets;
}

void Runner::on_channel_status(const stream::ChannelStatus& status) {
    if (status.failures >= 3 && status.state == stream::CHANNEL_STATE::DISCONNECTED) {
        logger->warn("{} channel has failed {} times in a row: {}", stream::to_string(status.channel),
            status.failures, status.detail);
    } else {
        logger->debug("{} channel {} ({})", stream::to_string(status.channel), stream::to_string(status.state),
            status.detail);
    }
}

void Runner::on_channel_fatal(stream::CHANNEL channel, const std::string& reason) {
    // runs on the channel thread, the stream itself is stopped by run()
    logger->critical("{} channel gave up: {}. Shutting down.", stream::to_string(channel), reason);
    gave_up = true;
    request_stop(strategy::SHUTDOWN::GRACEFUL);
}

void Runner::request_stop(strategy::SHUTDOWN mode) {
    stop.request_stop();
    std::lock_guard<std::mutex> lock(stop_mutex);
    if (dispatcher) {
        dispatcher->stop(mode);
    } else {
        stop_pending = true;
        if (mode == strategy::SHUTDOWN::HARD) {
            pending_mode = mode;
        }
    }
}

int Runner::run(const std::string& strategy_ref) {
    strategy = loader.load(strategy_ref, config.strategy.params);

    if (config.strategy.markets.empty()) {
        throw std::runtime_error("No markets configured, set strategy.markets");
    }
    strategy->set_markets(resolve_markets(config.strategy.markets));

    engine = std::make_unique<exec::ExecutionEngine>(config, config.is_live() ? &api : nullptr, &store, logger);
    if (config.is_live()) {
        engine->restore(store.get_positions(), 0.0);
        engine->refresh_balance();
    }
    strategy->attach(*engine, config.strategy, logger);

    // seed the engine with the prices the market listing carried
    for (const auto& market : strategy->get_markets()) {
        for (auto outcome : {OUTCOME::YES, OUTCOME::NO}) {
            if (market.last_price(outcome) > 0 && !market.token_for(outcome).empty()) {
                PriceUpdate seed;
                seed.market_id = market.id;
                seed.token_id = market.token_for(outcome);
                seed.price = market.last_price(outcome);
                seed.timestamp = nanotime();
                engine->on_price_update(seed);
            }
        }
    }

    stream = std::make_unique<stream::StreamManager>(config, stream::wspp_connection_factory(logger), events, logger);
    stream->set_status_callback([this](const stream::ChannelStatus& status) { on_channel_status(status); });
    stream->set_fatal_handler([this](stream::CHANNEL channel, const std::string& reason) {
        on_channel_fatal(channel, reason);
    });
    stream->subscribe_market(strategy->get_token_ids());
    if (config.is_live()) {
        std::vector<std::string> condition_ids;
        for (const auto& market : strategy->get_markets()) {
            if (!market.condition_id.empty()) {
                condition_ids.push_back(market.condition_id);
            }
        }
        if (config.api.has_credentials() && !condition_ids.empty()) {
            stream->subscribe_user(condition_ids);
        } else {
            logger->warn("Live mode without user channel, fills will not be reported");
        }
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex);
        dispatcher = std::make_unique<strategy::Dispatcher>(*strategy, *engine, events, config, logger);
        if (stop_pending) {
            dispatcher->stop(pending_mode);
        }
    }

    stream->start();
    dispatcher->run();
    stream->stop();

    auto snap = engine->snapshot();
    logger->info("Run finished: {} trades, volume {:.2f}, fees {:.2f}, realized {:.2f}, unrealized {:.2f}, "
        "balance {:.2f}, equity {:.2f}",
        snap->stats.total_trades, snap->stats.total_volume(), snap->stats.fees, snap->stats.realized_pnl,
        snap->stats.unrealized_pnl, snap->balance, snap->stats.equity);

    return gave_up ? 2 : 0;
}

} // namespace predex::app
