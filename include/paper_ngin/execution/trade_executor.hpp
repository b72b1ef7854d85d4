// include/paper_ngin/execution/trade_executor.hpp
#pragma once

#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/core/engine_config.hpp"
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/exit/exit_rule_engine.hpp"
#include "paper_ngin/exit/outcome_sample_cache.hpp"
#include "paper_ngin/live/trade_event_bus.hpp"
#include "paper_ngin/portfolio/portfolio_ledger.hpp"

namespace paper_ngin {

/**
 * @brief A graded trade opportunity delivered by the upstream signal source
 */
struct Signal {
    std::string asset_id;
    std::string symbol;
    SignalClass signal_class{SignalClass::DISCOVERY};
    Timestamp graded_at;
    Price price{0.0};
    Grade grade{Grade::NONE};
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Parse one signal object, e.g.
 * {"asset_id": "...", "symbol": "BONK", "signal_class": "discovery",
 *  "graded_at": "2025-01-01T12:00:00Z", "price": 0.0012, "grade": "HIGH"}
 * @return JSON_PARSE_ERROR or INVALID_SIGNAL for malformed input
 */
Result<Signal> signal_from_json(const nlohmann::json& j);

/**
 * @brief Per-user trading preferences
 */
struct UserPrefs {
    bool trading_enabled{true};
    bool alpha_enabled{false};
    std::vector<Grade> allowed_grades;  // Empty allows every grade
    SizingMode sizing_mode{SizingMode::PERCENT};
    double fixed_size_usd{25.0};
    double percent_of_available{10.0};
    double min_trade_size_usd{10.0};
    double reserve_usd{0.0};
    TakeProfitMode take_profit_mode{TakeProfitMode::FIXED_PERCENT};
    double take_profit_pct{kDefaultTakeProfitPercent};
    std::optional<double> stop_loss_pct;
    bool swap_on_class_change{true};
};

Result<UserPrefs> user_prefs_from_json(const nlohmann::json& j);

enum class ExecutionStatus { OPENED, SKIPPED, REJECTED };

std::string execution_status_to_string(ExecutionStatus status);

struct ExecutionOutcome {
    ExecutionStatus status{ExecutionStatus::SKIPPED};
    std::optional<Position> position;
    std::string reason;
    ErrorCode error_code{ErrorCode::NONE};  // Set for REJECTED
};

struct ExecutorConfig {
    double hard_cap_usd{150.0};
    std::chrono::seconds signal_freshness{3600};
    std::map<SignalClass, std::chrono::seconds> expiry_by_signal_class{
        {SignalClass::DISCOVERY, std::chrono::hours(24)},
        {SignalClass::ALPHA, std::chrono::hours(168)},
        {SignalClass::MANUAL, std::chrono::hours(24 * 365)}};
};

/**
 * @brief Turns signals into ledger positions for one user at a time
 *
 * Deliveries of the same (user, asset) are serialized, so redelivered or concurrent duplicate
 * signals open at most one position. The ledger's key uniqueness remains the final guard.
 */
class TradeExecutor {
public:
    TradeExecutor(ExecutorConfig config, std::shared_ptr<PortfolioLedger> ledger,
                  std::shared_ptr<ExitRuleEngine> exit_engine,
                  std::shared_ptr<OutcomeSampleCache> sample_cache,
                  std::shared_ptr<TradeEventBus> event_bus);

    /**
     * @brief Act on a signal for a user
     *
     * Malformed signals and unaffordable trades are REJECTED, filtered, stale and duplicate
     * signals are SKIPPED. Errors are returned only for failures of the ledger itself.
     */
    Result<ExecutionOutcome> execute(const std::string& user_id, const Signal& signal,
                                     const UserPrefs& prefs);

    Result<ExecutionOutcome> execute(const std::string& user_id, const Signal& signal,
                                     const UserPrefs& prefs, Timestamp now);

    /**
     * @brief Position size for the given available capital, before affordability checks
     */
    double compute_size(const UserPrefs& prefs, double available) const;

private:
    static constexpr size_t kLockStripes = 64;

    std::mutex& key_lock(const std::string& user_id, const std::string& asset_id);

    std::optional<std::string> filter_reason(const Signal& signal, const UserPrefs& prefs,
                                             Timestamp now) const;

    Result<void> swap_out_other_class(const std::string& user_id, const Signal& signal,
                                      Timestamp now);

    ExitConfig build_exit_config(const Signal& signal, const UserPrefs& prefs) const;

    ExecutorConfig config_;
    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<ExitRuleEngine> exit_engine_;
    std::shared_ptr<OutcomeSampleCache> sample_cache_;
    std::shared_ptr<TradeEventBus> event_bus_;
    std::array<std::mutex, kLockStripes> key_locks_;
};

}  // namespace paper_ngin
