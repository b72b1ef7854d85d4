// src/exit/exit_rule_engine.cpp
#include "paper_ngin/exit/exit_rule_engine.hpp"

#include <cmath>
#include "paper_ngin/statistics/outcome_statistics.hpp"

namespace paper_ngin {

std::string exit_decision_to_string(ExitDecision decision) {
    switch (decision) {
        case ExitDecision::TAKE_PROFIT_HIT:
            return "TAKE_PROFIT_HIT";
        case ExitDecision::STOP_LOSS_HIT:
            return "STOP_LOSS_HIT";
        case ExitDecision::EXPIRED:
            return "EXPIRED";
        default:
            return "NONE";
    }
}

ExitReason to_exit_reason(ExitDecision decision) {
    switch (decision) {
        case ExitDecision::TAKE_PROFIT_HIT:
            return ExitReason::TAKE_PROFIT;
        case ExitDecision::STOP_LOSS_HIT:
            return ExitReason::STOP_LOSS;
        case ExitDecision::EXPIRED:
            return ExitReason::EXPIRED;
        default:
            return ExitReason::NONE;
    }
}

double ExitRuleEngine::roi_percent(Price entry_price, Price current_price) {
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return (current_price / entry_price - 1.0) * 100.0;
}

bool ExitRuleEngine::is_expired(const Position& position, Timestamp now) {
    return now - position.opened_at >= position.exit_config.expiry;
}

double ExitRuleEngine::resolve_take_profit(const ExitConfig& exit_config,
                                           const std::vector<double>& samples) const {
    if (exit_config.take_profit_mode == TakeProfitMode::FIXED_PERCENT) {
        return exit_config.take_profit_pct;
    }

    const Eigen::VectorXd winners = statistics::winning_samples(samples);
    if (winners.size() == 0) {
        return config_.default_take_profit_pct;
    }

    Result<double> target = make_error<double>(ErrorCode::INVALID_ARGUMENT, "Unknown mode");
    switch (exit_config.take_profit_mode) {
        case TakeProfitMode::MEDIAN:
            target = statistics::median(winners);
            break;
        case TakeProfitMode::MEAN:
            target = statistics::mean(winners);
            break;
        case TakeProfitMode::MODE:
            target = statistics::whole_percent_mode(winners);
            break;
        case TakeProfitMode::SMART_QUANTILE:
            target = statistics::reach_quantile(winners, config_.smart_reach_fraction);
            break;
        default:
            break;
    }

    if (target.is_error()) {
        return config_.default_take_profit_pct;
    }
    return target.value();
}

ExitDecision ExitRuleEngine::evaluate(const Position& position, Price current_price,
                                      Timestamp now, const std::vector<double>& samples) const {
    if (std::isfinite(current_price) && current_price > 0.0) {
        const double roi = roi_percent(position.entry_price, current_price);

        const auto& stop_loss = position.exit_config.stop_loss_pct;
        if (stop_loss && roi <= -*stop_loss + kRoiEpsilon) {
            return ExitDecision::STOP_LOSS_HIT;
        }

        if (roi >= resolve_take_profit(position.exit_config, samples) - kRoiEpsilon) {
            return ExitDecision::TAKE_PROFIT_HIT;
        }
    }

    if (is_expired(position, now)) {
        return ExitDecision::EXPIRED;
    }
    return ExitDecision::NONE;
}

}  // namespace paper_ngin
