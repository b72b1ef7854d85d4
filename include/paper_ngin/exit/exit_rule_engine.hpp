// include/paper_ngin/exit/exit_rule_engine.hpp
#pragma once

#include <string>
#include <vector>
#include "paper_ngin/core/engine_config.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/portfolio/portfolio_types.hpp"

namespace paper_ngin {

// Tolerance on ROI threshold comparisons, so a price exactly at a threshold fires
constexpr double kRoiEpsilon = 1e-9;

enum class ExitDecision { NONE, TAKE_PROFIT_HIT, STOP_LOSS_HIT, EXPIRED };

std::string exit_decision_to_string(ExitDecision decision);

/**
 * @brief Ledger exit reason recorded for a firing decision
 */
ExitReason to_exit_reason(ExitDecision decision);

struct ExitRuleConfig {
    double default_take_profit_pct{kDefaultTakeProfitPercent};
    double smart_reach_fraction{0.75};
};

/**
 * @brief Pure evaluation of a position's exit rules against a price
 *
 * Priority is stop-loss, then take-profit, then expiry: when several conditions hold in the
 * same evaluation the highest priority decision is returned.
 */
class ExitRuleEngine {
public:
    explicit ExitRuleEngine(ExitRuleConfig config = ExitRuleConfig()) : config_(config) {}

    /**
     * @brief Decide whether a position should close
     * @param position Position to evaluate
     * @param current_price Latest price
     * @param now Evaluation time
     * @param samples Historical peak ROI percents for the position's signal class
     */
    ExitDecision evaluate(const Position& position, Price current_price, Timestamp now,
                          const std::vector<double>& samples) const;

    /**
     * @brief Take-profit target in percent for an exit configuration
     *
     * Dynamic modes use the positive samples only; with none the configured default applies.
     */
    double resolve_take_profit(const ExitConfig& exit_config,
                               const std::vector<double>& samples) const;

    /**
     * @brief (price / entry - 1) * 100
     */
    static double roi_percent(Price entry_price, Price current_price);

    static bool is_expired(const Position& position, Timestamp now);

    const ExitRuleConfig& config() const {
        return config_;
    }

private:
    ExitRuleConfig config_;
};

}  // namespace paper_ngin
