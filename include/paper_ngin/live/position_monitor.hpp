// include/paper_ngin/live/position_monitor.hpp
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/periodic_worker.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/exit/exit_rule_engine.hpp"
#include "paper_ngin/exit/outcome_sample_cache.hpp"
#include "paper_ngin/live/price_oracle_base.hpp"
#include "paper_ngin/live/trade_event_bus.hpp"
#include "paper_ngin/portfolio/portfolio_ledger.hpp"

namespace paper_ngin {

struct MonitorConfig {
    std::chrono::seconds interval{60};
    std::chrono::seconds max_quote_age{300};
    int price_retry_attempts{3};
    std::chrono::milliseconds retry_initial_delay{200};
    std::string component_id{"POSITION_MONITOR"};
};

/**
 * @brief Counts for one pass over the open positions
 */
struct CycleReport {
    size_t evaluated{0};
    size_t closed{0};
    size_t skipped{0};
    size_t errors{0};
};

/**
 * @brief Latest observation of an open position, including its all-time high since entry
 */
struct PositionMark {
    Price last_price{0.0};
    Timestamp as_of;
    Price peak_price{0.0};
    double peak_roi_pct{0.0};
};

struct UnrealizedPosition {
    PositionKey key;
    std::string symbol;
    double size_usd{0.0};
    Price entry_price{0.0};
    std::optional<Price> mark_price;  // Empty until the first usable quote
    double market_value{0.0};
    double unrealized_pnl_usd{0.0};
    double unrealized_roi_pct{0.0};
    double peak_roi_pct{0.0};
};

struct UnrealizedSummary {
    double cost_basis{0.0};
    double market_value{0.0};
    double unrealized_pnl_usd{0.0};
    double unrealized_pnl_pct{0.0};
    std::vector<UnrealizedPosition> positions;
};

/**
 * @brief Periodically prices open positions and closes those whose exit rules fire
 *
 * One quote is fetched per asset per cycle. A failure on one position is counted and logged;
 * the rest of the cycle proceeds. Marks live here, not in the ledger.
 */
class PositionMonitor {
public:
    PositionMonitor(MonitorConfig config, std::shared_ptr<PortfolioLedger> ledger,
                    std::shared_ptr<PriceOracleBase> oracle,
                    std::shared_ptr<ExitRuleEngine> exit_engine,
                    std::shared_ptr<OutcomeSampleCache> sample_cache,
                    std::shared_ptr<TradeEventBus> event_bus);

    ~PositionMonitor();

    PositionMonitor(const PositionMonitor&) = delete;
    PositionMonitor& operator=(const PositionMonitor&) = delete;

    /**
     * @brief Register with the StateManager and start the recurring cycle
     */
    Result<void> start();

    /**
     * @brief Let the running cycle finish and stop scheduling new ones
     */
    void stop();

    bool is_running() const {
        return worker_.is_running();
    }

    /**
     * @brief Run one monitoring pass synchronously
     */
    CycleReport run_cycle(Timestamp now);

    Result<UnrealizedSummary> unrealized_summary(const std::string& user_id) const;

    std::optional<PositionMark> mark(const std::string& user_id, const PositionKey& key) const;

private:
    struct QuoteState {
        std::optional<PriceQuote> quote;
        std::string failure;
    };

    QuoteState fetch_quote(const std::string& asset_id, Timestamp now);

    // Returns true when the position was closed by this call
    Result<bool> process_position(const std::string& user_id, const Position& position,
                                  const QuoteState& quote, Timestamp now);

    void update_mark(const std::string& user_id, const Position& position,
                     const PriceQuote& quote);

    static std::string mark_key(const std::string& user_id, const PositionKey& key);

    MonitorConfig config_;
    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<PriceOracleBase> oracle_;
    std::shared_ptr<ExitRuleEngine> exit_engine_;
    std::shared_ptr<OutcomeSampleCache> sample_cache_;
    std::shared_ptr<TradeEventBus> event_bus_;

    PeriodicWorker worker_;
    std::mutex cycle_mutex_;
    bool registered_{false};

    std::unordered_map<std::string, PositionMark> marks_;
    mutable std::mutex marks_mutex_;
};

}  // namespace paper_ngin
