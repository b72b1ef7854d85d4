#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "paper_ngin/core/engine_config.hpp"
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/state_manager.hpp"
#include "paper_ngin/data/outcome_sample_source.hpp"
#include "paper_ngin/data/postgres_database.hpp"
#include "paper_ngin/execution/trade_executor.hpp"
#include "paper_ngin/exit/exit_rule_engine.hpp"
#include "paper_ngin/exit/outcome_sample_cache.hpp"
#include "paper_ngin/live/http_price_oracle.hpp"
#include "paper_ngin/live/position_monitor.hpp"
#include "paper_ngin/live/trade_event_bus.hpp"
#include "paper_ngin/portfolio/portfolio_ledger.hpp"
#include "paper_ngin/statistics/outcome_statistics.hpp"
#include "paper_ngin/storage/database_portfolio_store.hpp"
#include "paper_ngin/storage/state_synchronizer.hpp"

using namespace paper_ngin;

namespace {

std::atomic<bool> g_shutdown{false};

// How long a stdin wait lasts before the shutdown flag is checked again
constexpr int kStdinPollMs = 200;

void handle_signal(int) {
    g_shutdown.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> [signals.jsonl]" << std::endl;
    std::cerr << "Reads one JSON object per line from the file, or stdin when omitted:" << std::endl;
    std::cerr << "  {\"user_id\": \"u1\", \"signal\": {...}, \"prefs\": {...}}" << std::endl;
    std::cerr << "  {\"command\": \"summary\", \"user_id\": \"u1\", \"page\": 0}" << std::endl;
    std::cerr << "  {\"command\": \"stats\", \"signal_class\": \"alpha\"}" << std::endl;
}

/**
 * @brief Read one line from stdin without blocking past a shutdown request
 *
 * std::getline on std::cin resumes after SIGINT, so stdin is polled directly and the
 * unconsumed tail is kept in `pending`.
 * @return false at end of input, on shutdown or on a read error
 */
bool read_stdin_line(std::string& pending, std::string& line) {
    while (true) {
        const auto newline = pending.find('\n');
        if (newline != std::string::npos) {
            line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            return true;
        }
        if (g_shutdown.load()) {
            return false;
        }

        pollfd stdin_fd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&stdin_fd, 1, kStdinPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ERROR("Polling stdin failed: " << std::strerror(errno));
            return false;
        }
        if (ready == 0) {
            continue;
        }

        char chunk[4096];
        const ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            ERROR("Reading stdin failed: " << std::strerror(errno));
            return false;
        }
        if (count == 0) {
            // Last line without a trailing newline
            if (pending.empty()) {
                return false;
            }
            line.swap(pending);
            pending.clear();
            return true;
        }
        pending.append(chunk, static_cast<size_t>(count));
    }
}

void print_outcome_stats(const std::string& class_name, const OutcomeSampleCache& cache,
                         double reach_fraction) {
    auto signal_class = signal_class_from_string(class_name);
    if (!signal_class) {
        std::cout << nlohmann::json{{"signal_class", class_name},
                                    {"error", "unknown signal class"}}
                  << std::endl;
        return;
    }

    const auto summary = statistics::summarize(cache.samples(*signal_class), reach_fraction);
    std::cout << nlohmann::json{{"signal_class", signal_class_to_string(*signal_class)},
                                {"sample_count", summary.sample_count},
                                {"winner_count", summary.winner_count},
                                {"median", summary.median},
                                {"mean", summary.mean},
                                {"mode", summary.mode},
                                {"smart", summary.smart}}
              << std::endl;
}

void print_summary(const std::string& user_id, size_t page, PortfolioLedger& ledger,
                   const PositionMonitor& monitor) {
    auto portfolio = ledger.snapshot(user_id);
    if (portfolio.is_error()) {
        std::cout << nlohmann::json{{"user_id", user_id},
                                    {"error", portfolio.error()->to_string()}}
                  << std::endl;
        return;
    }

    nlohmann::json out;
    out["user_id"] = user_id;
    out["capital"] = portfolio.value().capital;
    out["reserve"] = portfolio.value().reserve;
    out["available"] = portfolio.value().available();
    out["realized_pnl"] = portfolio.value().realized_pnl();
    out["win_rate"] = portfolio.value().stats.win_rate();

    auto unrealized = monitor.unrealized_summary(user_id);
    if (unrealized.is_ok()) {
        out["unrealized_pnl_usd"] = unrealized.value().unrealized_pnl_usd;
        out["unrealized_pnl_pct"] = unrealized.value().unrealized_pnl_pct;
        out["open_positions"] = unrealized.value().positions.size();
    }

    auto history = ledger.history_page(user_id, page);
    if (history.is_ok()) {
        out["history"] = history.value();
    }
    std::cout << out.dump() << std::endl;
}

void handle_line(const std::string& line, TradeExecutor& executor, PortfolioLedger& ledger,
                 const PositionMonitor& monitor, const OutcomeSampleCache& sample_cache,
                 double reach_fraction) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        WARN("Dropping unparseable line: " << e.what());
        return;
    }

    const std::string user_id = message.value("user_id", "");
    const std::string command = message.value("command", "");
    if (command == "summary") {
        print_summary(user_id, message.value("page", 0), ledger, monitor);
        return;
    }
    if (command == "stats") {
        print_outcome_stats(message.value("signal_class", ""), sample_cache, reach_fraction);
        return;
    }

    auto signal = signal_from_json(message.value("signal", nlohmann::json::object()));
    if (signal.is_error()) {
        WARN("Dropping signal for " << user_id << ": " << signal.error()->what());
        return;
    }
    auto prefs = user_prefs_from_json(message.value("prefs", nlohmann::json::object()));
    if (prefs.is_error()) {
        WARN("Dropping signal for " << user_id << ": " << prefs.error()->what());
        return;
    }

    auto outcome = executor.execute(user_id, signal.value(), prefs.value());
    if (outcome.is_error()) {
        ERROR("Execution failed for " << user_id << ": " << outcome.error()->to_string());
        return;
    }
    std::cout << nlohmann::json{{"user_id", user_id},
                                {"asset_id", signal.value().asset_id},
                                {"status", execution_status_to_string(outcome.value().status)},
                                {"reason", outcome.value().reason}}
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto config_result = load_engine_config(argv[1]);
        if (config_result.is_error()) {
            std::cerr << "Failed to load config: " << config_result.error()->what() << std::endl;
            return 1;
        }
        const EngineConfig& config = config_result.value();

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("PaperEngine");
        INFO("Logger initialized successfully");

        auto db = std::make_shared<PostgresDatabase>(config.database.get_connection_string());
        auto connected = db->connect();
        if (connected.is_error()) {
            ERROR("Failed to connect to database: " << connected.error()->what());
            return 1;
        }
        auto schema = db->initialize_schema(config.database.portfolio_table,
                                            config.database.outcome_table);
        if (schema.is_error()) {
            ERROR("Failed to initialize schema: " << schema.error()->what());
            return 1;
        }

        LedgerConfig ledger_config;
        ledger_config.starting_capital = config.starting_capital;
        ledger_config.default_reserve_percent = config.default_reserve_percent;
        ledger_config.page_size = config.page_size;
        auto ledger = std::make_shared<PortfolioLedger>(ledger_config);

        ExitRuleConfig exit_config;
        exit_config.default_take_profit_pct = config.default_take_profit_pct;
        exit_config.smart_reach_fraction = config.smart_reach_fraction;
        auto exit_engine = std::make_shared<ExitRuleEngine>(exit_config);

        auto sample_cache = std::make_shared<OutcomeSampleCache>(
            std::make_shared<DatabaseOutcomeSource>(db, config.sample_limit,
                                                    config.database.outcome_table));
        auto event_bus = std::make_shared<TradeEventBus>();
        auto oracle = std::make_shared<HttpPriceOracle>(config.price_source);
        auto store =
            std::make_shared<DatabasePortfolioStore>(db, config.database.portfolio_table);

        SynchronizerConfig sync_config;
        sync_config.persist_interval = std::chrono::seconds(config.persist_interval_seconds);
        auto synchronizer =
            std::make_shared<StateSynchronizer>(sync_config, ledger, store, event_bus);

        auto loaded = synchronizer->load_all();
        if (loaded.is_error()) {
            ERROR("Failed to load portfolios: " << loaded.error()->what());
            return 1;
        }
        for (const auto& user_id : synchronizer->quarantined_users()) {
            WARN("Portfolio of " << user_id << " is quarantined, its signals will be rejected");
        }
        // Warm the cache so the first signals can use dynamic take-profit targets
        if (const size_t failures = sample_cache->refresh_all()) {
            WARN(failures << " signal classes start without outcome samples");
        }

        ExecutorConfig executor_config;
        executor_config.hard_cap_usd = config.hard_cap_usd;
        executor_config.signal_freshness = std::chrono::seconds(config.signal_freshness_seconds);
        executor_config.expiry_by_signal_class = config.expiry_by_signal_class;
        TradeExecutor executor(executor_config, ledger, exit_engine, sample_cache, event_bus);

        MonitorConfig monitor_config;
        monitor_config.interval = std::chrono::seconds(config.monitor_interval_seconds);
        monitor_config.max_quote_age = std::chrono::seconds(config.max_quote_age_seconds);
        monitor_config.price_retry_attempts = config.price_retry_attempts;
        PositionMonitor monitor(monitor_config, ledger, oracle, exit_engine, sample_cache,
                                event_bus);

        auto sync_started = synchronizer->start();
        if (sync_started.is_error()) {
            ERROR("Failed to start synchronizer: " << sync_started.error()->what());
            return 1;
        }
        auto monitor_started = monitor.start();
        if (monitor_started.is_error()) {
            ERROR("Failed to start monitor: " << monitor_started.error()->what());
            synchronizer->stop();
            return 1;
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        std::ifstream file;
        if (argc > 2) {
            file.open(argv[2]);
            if (!file.is_open()) {
                ERROR("Cannot open signal file " << argv[2]);
                monitor.stop();
                synchronizer->stop();
                return 1;
            }
        }

        INFO("Paper engine running with " << loaded.value() << " restored portfolios");
        std::string line;
        std::string pending;
        while (!g_shutdown.load()) {
            const bool has_line = argc > 2 ? static_cast<bool>(std::getline(file, line))
                                           : read_stdin_line(pending, line);
            if (!has_line) {
                break;
            }
            if (line.empty()) {
                continue;
            }
            handle_line(line, executor, *ledger, monitor, *sample_cache,
                        config.smart_reach_fraction);
        }

        INFO("Shutting down paper engine");
        monitor.stop();
        synchronizer->stop();
        db->disconnect();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
