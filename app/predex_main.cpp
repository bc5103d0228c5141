/**
 * predex command line.
 *
 *   predex <config.json> run <strategy name | plugin.so>
 *   predex <config.json> markets [limit]
 *   predex <config.json> export <trades|orders|positions> <file.csv>
 *   predex <config.json> status
 */
#include "runner.H"

#include "core/config.H"
#include "core/logging.H"
#include "core/utils.H"
#include "storage/csv_export.H"
#include "storage/jsonl_trade_store.H"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace predex;

static std::atomic<int> signal_count{0};

static void on_signal(int) {
    signal_count++;
}

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <config.json> run <strategy>" << std::endl;
    std::cerr << "       " << argv0 << " <config.json> markets [limit]" << std::endl;
    std::cerr << "       " << argv0 << " <config.json> export <trades|orders|positions> <file.csv>" << std::endl;
    std::cerr << "       " << argv0 << " <config.json> status" << std::endl;
}

static int run_strategy(const Config& config, const std::string& strategy_ref,
                        std::shared_ptr<spdlog::logger> logger) {
    app::Runner runner(config, logger);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // first signal stops gracefully (per config), a second one stops hard
    std::atomic<bool> done{false};
    std::thread watcher([&]() {
        int handled = 0;
        while (!done) {
            int seen = signal_count.load();
            if (seen > handled) {
                bool hard = seen >= 2 || !config.dispatcher.graceful_shutdown;
                logger->warn("Signal received, {} shutdown", hard ? "hard" : "graceful");
                runner.request_stop(hard ? strategy::SHUTDOWN::HARD : strategy::SHUTDOWN::GRACEFUL);
                handled = seen;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = 1;
    try {
        rc = runner.run(strategy_ref);
    } catch (const std::exception& e) {
        logger->error("Run failed: {}", e.what());
        std::cerr << "Run failed: " << e.what() << std::endl;
    }

    done = true;
    watcher.join();
    return rc;
}

static int list_markets(const Config& config, int limit, std::shared_ptr<spdlog::logger> logger) {
    StopToken stop;
    gateway::CurlTransport transport(logger);
    gateway::RateLimiter limiter(config.rate_limit);
    gateway::RetryingGateway gateway(transport, limiter, config.retry, logger);
    gateway::ClobApi api(gateway, config.api, stop, logger);

    auto markets = api.list_markets(limit, 0, false);
    for (const auto& market : markets) {
        std::cout << gateway::format_market_summary(market) << std::endl;
    }
    std::cout << markets.size() << " markets" << std::endl;
    return 0;
}

static int export_csv(const Config& config, const std::string& what, const std::string& path,
                      std::shared_ptr<spdlog::logger> logger) {
    storage::JsonlTradeStore store(config.storage.data_dir, logger);

    size_t rows = 0;
    if (what == "trades") {
        rows = storage::export_trades_csv(store, path);
    } else if (what == "orders") {
        rows = storage::export_orders_csv(store, path);
    } else if (what == "positions") {
        rows = storage::export_positions_csv(store, path);
    } else {
        std::cerr << "Unknown export '" << what << "', expected trades, orders or positions" << std::endl;
        return 1;
    }
    std::cout << "Exported " << rows << " " << what << " to " << path << std::endl;
    return 0;
}

static int print_status(const Config& config, std::shared_ptr<spdlog::logger> logger) {
    storage::JsonlTradeStore store(config.storage.data_dir, logger);
    storage::StoreStats stats = store.stats();

    std::cout << "mode            " << to_string(config.mode) << std::endl;
    std::cout << "ledger          " << store.get_path() << std::endl;
    std::cout << "orders          " << stats.total_orders << std::endl;
    std::cout << "trades          " << stats.total_trades << std::endl;
    std::cout << "open positions  " << stats.open_positions << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "volume bought   " << stats.total_volume_bought << std::endl;
    std::cout << "volume sold     " << stats.total_volume_sold << std::endl;
    std::cout << "volume total    " << stats.total_volume() << std::endl;

    for (const auto& position : store.get_positions()) {
        if (position.is_flat()) {
            continue;
        }
        std::cout << std::setprecision(4) << "  " << position.token_id << "  size " << position.net_size
                  << "  avg " << position.avg_entry_price << "  realized " << position.realized_pnl
                  << "  updated " << format_timestamp(position.updated_at) << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {

    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string config_path = argv[1];
    std::string command = argv[2];

    Config config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = create_logger(config.logging, "predex");
    } catch (const std::exception& e) {
        std::cerr << "Failed to create logger: " << e.what() << std::endl;
        return 1;
    }
    logger->info("Starting predex {} in {} mode", command, to_string(config.mode));

    int rc = 1;
    try {
        if (command == "run" && argc == 4) {
            rc = run_strategy(config, argv[3], logger);
        } else if (command == "markets" && (argc == 3 || argc == 4)) {
            rc = list_markets(config, argc == 4 ? std::stoi(argv[3]) : 20, logger);
        } else if (command == "export" && argc == 5) {
            rc = export_csv(config, argv[3], argv[4], logger);
        } else if (command == "status" && argc == 3) {
            rc = print_status(config, logger);
        } else {
            usage(argv[0]);
        }
    } catch (const std::exception& e) {
        logger->error("{} failed: {}", command, e.what());
        std::cerr << command << " failed: " << e.what() << std::endl;
        rc = 1;
    }

    logger->flush();
    spdlog::shutdown();
    return rc;
}
