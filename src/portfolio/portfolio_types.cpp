// src/portfolio/portfolio_types.cpp
#include "paper_ngin/portfolio/portfolio_types.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace paper_ngin {

namespace {

constexpr double kConservationTolerance = 1e-6;

int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace

std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT:
            return "TAKE_PROFIT";
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::EXPIRED:
            return "EXPIRED";
        case ExitReason::SIGNAL_SWAP:
            return "SIGNAL_SWAP";
        case ExitReason::MANUAL:
            return "MANUAL";
        default:
            return "NONE";
    }
}

ExitReason exit_reason_from_string(const std::string& value) {
    if (value == "TAKE_PROFIT")
        return ExitReason::TAKE_PROFIT;
    if (value == "STOP_LOSS")
        return ExitReason::STOP_LOSS;
    if (value == "EXPIRED")
        return ExitReason::EXPIRED;
    if (value == "SIGNAL_SWAP")
        return ExitReason::SIGNAL_SWAP;
    if (value == "MANUAL")
        return ExitReason::MANUAL;
    return ExitReason::NONE;
}

void TradeStats::record(const ClosedPosition& closed) {
    const double roi = closed.position.realized_roi_pct.value_or(0.0);

    if (total_trades == 0) {
        best_trade_pct = roi;
        worst_trade_pct = roi;
    } else {
        best_trade_pct = std::max(best_trade_pct, roi);
        worst_trade_pct = std::min(worst_trade_pct, roi);
    }

    ++total_trades;
    if (closed.pnl_usd > 0.0) {
        ++wins;
    } else {
        ++losses;
    }
    total_pnl_usd += closed.pnl_usd;
}

double Portfolio::available() const {
    return std::max(0.0, capital - reserve);
}

double Portfolio::open_exposure() const {
    double total = 0.0;
    for (const auto& [_, position] : positions) {
        total += position.size_usd;
    }
    return total;
}

double Portfolio::realized_pnl() const {
    return stats.total_pnl_usd;
}

std::string Portfolio::integrity_violation() const {
    std::ostringstream ss;

    if (!std::isfinite(capital) || capital < -kConservationTolerance) {
        ss << "capital is negative or not finite (" << capital << ")";
        return ss.str();
    }

    for (const auto& [key, position] : positions) {
        if (position.key != key) {
            ss << "position stored under " << key.to_string() << " carries key "
               << position.key.to_string();
            return ss.str();
        }
        if (!position.is_open()) {
            ss << "closed position " << key.to_string() << " still in the open set";
            return ss.str();
        }
        if (!(position.size_usd > 0.0)) {
            ss << "position " << key.to_string() << " has non-positive size";
            return ss.str();
        }
    }

    const double lhs = capital + open_exposure();
    const double rhs = starting_capital + realized_pnl();
    if (std::fabs(lhs - rhs) > kConservationTolerance * std::max(1.0, std::fabs(rhs))) {
        ss << "conservation broken: capital + open exposure = " << lhs
           << ", starting capital + realized pnl = " << rhs;
        return ss.str();
    }

    return "";
}

void to_json(nlohmann::json& j, const ExitConfig& config) {
    j = nlohmann::json{{"take_profit_mode", take_profit_mode_to_string(config.take_profit_mode)},
                       {"take_profit_pct", config.take_profit_pct},
                       {"expiry_seconds", config.expiry.count()}};
    if (config.stop_loss_pct) {
        j["stop_loss_pct"] = *config.stop_loss_pct;
    } else {
        j["stop_loss_pct"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, ExitConfig& config) {
    auto mode = take_profit_mode_from_string(j.at("take_profit_mode").get<std::string>());
    if (!mode) {
        throw std::invalid_argument("Unknown take_profit_mode: " +
                                    j.at("take_profit_mode").get<std::string>());
    }
    config.take_profit_mode = *mode;
    config.take_profit_pct = j.at("take_profit_pct").get<double>();
    config.expiry = std::chrono::seconds(j.at("expiry_seconds").get<int64_t>());
    if (j.contains("stop_loss_pct") && !j.at("stop_loss_pct").is_null()) {
        config.stop_loss_pct = j.at("stop_loss_pct").get<double>();
    } else {
        config.stop_loss_pct.reset();
    }
}

void to_json(nlohmann::json& j, const Position& position) {
    j = nlohmann::json{{"asset_id", position.key.asset_id},
                       {"signal_class", signal_class_to_string(position.key.signal_class)},
                       {"symbol", position.symbol},
                       {"entry_price", position.entry_price},
                       {"size_usd", position.size_usd},
                       {"opened_at_ms", to_epoch_ms(position.opened_at)},
                       {"exit_config", position.exit_config},
                       {"status", position.is_open() ? "OPEN" : "CLOSED"},
                       {"exit_reason", exit_reason_to_string(position.exit_reason)}};

    if (position.closed_at)
        j["closed_at_ms"] = to_epoch_ms(*position.closed_at);
    if (position.exit_price)
        j["exit_price"] = *position.exit_price;
    if (position.realized_roi_pct)
        j["realized_roi_pct"] = *position.realized_roi_pct;
}

void from_json(const nlohmann::json& j, Position& position) {
    auto signal_class = signal_class_from_string(j.at("signal_class").get<std::string>());
    if (!signal_class) {
        throw std::invalid_argument("Unknown signal_class: " +
                                    j.at("signal_class").get<std::string>());
    }
    position.key = PositionKey(j.at("asset_id").get<std::string>(), *signal_class);
    position.symbol = j.value("symbol", "");
    position.entry_price = j.at("entry_price").get<double>();
    position.size_usd = j.at("size_usd").get<double>();
    position.opened_at = from_epoch_ms(j.at("opened_at_ms").get<int64_t>());
    position.exit_config = j.at("exit_config").get<ExitConfig>();
    position.status =
        j.at("status").get<std::string>() == "OPEN" ? PositionStatus::OPEN : PositionStatus::CLOSED;
    position.exit_reason = exit_reason_from_string(j.value("exit_reason", "NONE"));

    if (j.contains("closed_at_ms"))
        position.closed_at = from_epoch_ms(j.at("closed_at_ms").get<int64_t>());
    if (j.contains("exit_price"))
        position.exit_price = j.at("exit_price").get<double>();
    if (j.contains("realized_roi_pct"))
        position.realized_roi_pct = j.at("realized_roi_pct").get<double>();
}

void to_json(nlohmann::json& j, const ClosedPosition& closed) {
    j = nlohmann::json{{"position", closed.position},
                       {"pnl_usd", closed.pnl_usd},
                       {"hold_duration_seconds", closed.hold_duration.count()}};
}

void from_json(const nlohmann::json& j, ClosedPosition& closed) {
    closed.position = j.at("position").get<Position>();
    closed.pnl_usd = j.at("pnl_usd").get<double>();
    closed.hold_duration = std::chrono::seconds(j.at("hold_duration_seconds").get<int64_t>());
}

void to_json(nlohmann::json& j, const TradeStats& stats) {
    j = nlohmann::json{{"total_trades", stats.total_trades},
                       {"wins", stats.wins},
                       {"losses", stats.losses},
                       {"total_pnl_usd", stats.total_pnl_usd},
                       {"best_trade_pct", stats.best_trade_pct},
                       {"worst_trade_pct", stats.worst_trade_pct}};
}

void from_json(const nlohmann::json& j, TradeStats& stats) {
    stats.total_trades = j.value("total_trades", uint64_t{0});
    stats.wins = j.value("wins", uint64_t{0});
    stats.losses = j.value("losses", uint64_t{0});
    stats.total_pnl_usd = j.value("total_pnl_usd", 0.0);
    stats.best_trade_pct = j.value("best_trade_pct", 0.0);
    stats.worst_trade_pct = j.value("worst_trade_pct", 0.0);
}

void to_json(nlohmann::json& j, const Portfolio& portfolio) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& [_, position] : portfolio.positions) {
        positions.push_back(position);
    }

    j = nlohmann::json{{"user_id", portfolio.user_id},
                       {"capital", portfolio.capital},
                       {"reserve", portfolio.reserve},
                       {"starting_capital", portfolio.starting_capital},
                       {"positions", positions},
                       {"history", portfolio.history},
                       {"stats", portfolio.stats},
                       {"version", portfolio.version},
                       {"created_at_ms", to_epoch_ms(portfolio.created_at)},
                       {"corrupted", portfolio.corrupted}};
}

void from_json(const nlohmann::json& j, Portfolio& portfolio) {
    portfolio.user_id = j.at("user_id").get<std::string>();
    portfolio.capital = j.at("capital").get<double>();
    portfolio.reserve = j.value("reserve", 0.0);
    portfolio.starting_capital = j.at("starting_capital").get<double>();
    portfolio.version = j.at("version").get<uint64_t>();
    portfolio.created_at = from_epoch_ms(j.value("created_at_ms", int64_t{0}));
    portfolio.corrupted = j.value("corrupted", false);

    portfolio.positions.clear();
    for (const auto& item : j.at("positions")) {
        Position position = item.get<Position>();
        portfolio.positions[position.key] = std::move(position);
    }

    portfolio.history = j.value("history", std::vector<ClosedPosition>{});
    if (j.contains("stats")) {
        portfolio.stats = j.at("stats").get<TradeStats>();
    } else {
        // Rows written without stats are rebuilt from their history
        portfolio.stats = TradeStats{};
        for (const auto& closed : portfolio.history) {
            portfolio.stats.record(closed);
        }
    }
}

}  // namespace paper_ngin
