// include/paper_ngin/portfolio/portfolio_types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/engine_config.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

enum class PositionStatus { OPEN, CLOSED };

/**
 * @brief Why a position was closed
 */
enum class ExitReason {
    NONE,
    TAKE_PROFIT,
    STOP_LOSS,
    EXPIRED,
    SIGNAL_SWAP,  // Replaced by a position of the other signal class
    MANUAL
};

std::string exit_reason_to_string(ExitReason reason);
ExitReason exit_reason_from_string(const std::string& value);

/**
 * @brief Exit rules fixed for the lifetime of a position
 */
struct ExitConfig {
    TakeProfitMode take_profit_mode{TakeProfitMode::FIXED_PERCENT};
    // Target for FIXED_PERCENT. For dynamic modes, the target resolved when the position opened
    double take_profit_pct{kDefaultTakeProfitPercent};
    // Positive magnitude; no stop-loss when empty
    std::optional<double> stop_loss_pct;
    std::chrono::seconds expiry{std::chrono::hours(24)};
};

/**
 * @brief A simulated holding of one asset under one signal class
 */
struct Position {
    PositionKey key;
    std::string symbol;
    Price entry_price{0.0};
    double size_usd{0.0};
    Timestamp opened_at;
    ExitConfig exit_config;
    PositionStatus status{PositionStatus::OPEN};

    // Set exactly once, on close
    std::optional<Timestamp> closed_at;
    std::optional<Price> exit_price;
    std::optional<double> realized_roi_pct;
    ExitReason exit_reason{ExitReason::NONE};

    SignalClass signal_class() const {
        return key.signal_class;
    }

    bool is_open() const {
        return status == PositionStatus::OPEN;
    }
};

/**
 * @brief History record of a closed position
 */
struct ClosedPosition {
    Position position;
    double pnl_usd{0.0};
    std::chrono::seconds hold_duration{0};
};

/**
 * @brief Running trade statistics of a portfolio
 */
struct TradeStats {
    uint64_t total_trades{0};
    uint64_t wins{0};
    uint64_t losses{0};
    double total_pnl_usd{0.0};
    double best_trade_pct{0.0};
    double worst_trade_pct{0.0};

    /**
     * @brief Fold one closed trade into the statistics
     */
    void record(const ClosedPosition& closed);

    double win_rate() const {
        return total_trades == 0 ? 0.0
                                 : static_cast<double>(wins) / static_cast<double>(total_trades);
    }
};

using PositionMap = std::unordered_map<PositionKey, Position, PositionKeyHash>;

/**
 * @brief One user's simulated account
 *
 * `reserve` is a floor held inside `capital`; only `capital - reserve` can fund new positions.
 * The ledger keeps capital + open exposure equal to starting capital + realized PnL.
 */
struct Portfolio {
    std::string user_id;
    double capital{0.0};
    double reserve{0.0};
    double starting_capital{0.0};
    PositionMap positions;  // OPEN positions only
    std::vector<ClosedPosition> history;
    TradeStats stats;
    uint64_t version{0};
    Timestamp created_at;
    bool corrupted{false};

    double available() const;
    double open_exposure() const;

    // Running total kept in stats, so the integrity check does not walk the history
    double realized_pnl() const;

    /**
     * @brief Check capital conservation and non-negativity
     * @return Description of the first violation, empty when consistent
     */
    std::string integrity_violation() const;
};

void to_json(nlohmann::json& j, const ExitConfig& config);
void from_json(const nlohmann::json& j, ExitConfig& config);
void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);
void to_json(nlohmann::json& j, const ClosedPosition& closed);
void from_json(const nlohmann::json& j, ClosedPosition& closed);
void to_json(nlohmann::json& j, const TradeStats& stats);
void from_json(const nlohmann::json& j, TradeStats& stats);
void to_json(nlohmann::json& j, const Portfolio& portfolio);
void from_json(const nlohmann::json& j, Portfolio& portfolio);

}  // namespace paper_ngin
