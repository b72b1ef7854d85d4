// src/execution/trade_executor.cpp
#include "paper_ngin/execution/trade_executor.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "TradeExecutor";

ExecutionOutcome skipped(std::string reason) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::SKIPPED;
    outcome.reason = std::move(reason);
    return outcome;
}

ExecutionOutcome rejected(ErrorCode code, std::string reason) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::REJECTED;
    outcome.error_code = code;
    outcome.reason = std::move(reason);
    return outcome;
}

std::optional<SignalClass> swap_counterpart(SignalClass signal_class) {
    switch (signal_class) {
        case SignalClass::DISCOVERY:
            return SignalClass::ALPHA;
        case SignalClass::ALPHA:
            return SignalClass::DISCOVERY;
        default:
            return std::nullopt;
    }
}

}  // namespace

Result<Signal> signal_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<Signal>(ErrorCode::JSON_PARSE_ERROR, "Signal must be a JSON object",
                                  kComponent);
    }

    try {
        Signal signal;
        signal.asset_id = j.value("asset_id", "");
        signal.symbol = j.value("symbol", "");

        auto signal_class = signal_class_from_string(j.value("signal_class", "discovery"));
        if (!signal_class) {
            return make_error<Signal>(ErrorCode::INVALID_SIGNAL,
                                      "Unknown signal_class: " + j.value("signal_class", ""),
                                      kComponent);
        }
        signal.signal_class = *signal_class;

        if (!j.contains("graded_at")) {
            return make_error<Signal>(ErrorCode::INVALID_SIGNAL, "Signal has no graded_at",
                                      kComponent);
        }
        const auto& graded_at = j.at("graded_at");
        if (graded_at.is_number()) {
            signal.graded_at = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(graded_at.get<int64_t>()));
        } else {
            auto parsed = core::from_iso8601(graded_at.get<std::string>());
            if (!parsed) {
                return make_error<Signal>(ErrorCode::INVALID_SIGNAL,
                                          "Unparseable graded_at: " + graded_at.dump(),
                                          kComponent);
            }
            signal.graded_at = *parsed;
        }

        const auto& price = j.at("price");
        signal.price = price.is_string() ? std::stod(price.get<std::string>()) : price.get<double>();
        signal.grade = grade_from_string(j.value("grade", "NONE"));
        if (j.contains("metadata") && j.at("metadata").is_object()) {
            signal.metadata = j.at("metadata");
        }
        return signal;
    } catch (const std::exception& e) {
        return make_error<Signal>(ErrorCode::JSON_PARSE_ERROR,
                                  std::string("Malformed signal: ") + e.what(), kComponent);
    }
}

Result<UserPrefs> user_prefs_from_json(const nlohmann::json& j) {
    try {
        UserPrefs prefs;
        prefs.trading_enabled = j.value("trading_enabled", prefs.trading_enabled);
        prefs.alpha_enabled = j.value("alpha_enabled", prefs.alpha_enabled);
        if (j.contains("allowed_grades")) {
            for (const auto& grade : j.at("allowed_grades")) {
                prefs.allowed_grades.push_back(grade_from_string(grade.get<std::string>()));
            }
        }
        if (j.contains("sizing_mode")) {
            prefs.sizing_mode = j.at("sizing_mode").get<std::string>() == "fixed"
                                    ? SizingMode::FIXED
                                    : SizingMode::PERCENT;
        }
        prefs.fixed_size_usd = j.value("fixed_size_usd", prefs.fixed_size_usd);
        prefs.percent_of_available = j.value("percent_of_available", prefs.percent_of_available);
        prefs.min_trade_size_usd = j.value("min_trade_size_usd", prefs.min_trade_size_usd);
        prefs.reserve_usd = j.value("reserve_usd", prefs.reserve_usd);
        if (j.contains("take_profit_mode")) {
            auto mode = take_profit_mode_from_string(j.at("take_profit_mode").get<std::string>());
            if (!mode) {
                return make_error<UserPrefs>(ErrorCode::INVALID_ARGUMENT,
                                             "Unknown take_profit_mode: " +
                                                 j.at("take_profit_mode").get<std::string>(),
                                             kComponent);
            }
            prefs.take_profit_mode = *mode;
        }
        prefs.take_profit_pct = j.value("take_profit_pct", prefs.take_profit_pct);
        if (j.contains("stop_loss_pct") && !j.at("stop_loss_pct").is_null()) {
            prefs.stop_loss_pct = j.at("stop_loss_pct").get<double>();
        }
        prefs.swap_on_class_change = j.value("swap_on_class_change", prefs.swap_on_class_change);
        return prefs;
    } catch (const nlohmann::json::exception& e) {
        return make_error<UserPrefs>(ErrorCode::JSON_PARSE_ERROR,
                                     std::string("Malformed user preferences: ") + e.what(),
                                     kComponent);
    }
}

std::string execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::OPENED:
            return "OPENED";
        case ExecutionStatus::SKIPPED:
            return "SKIPPED";
        case ExecutionStatus::REJECTED:
            return "REJECTED";
        default:
            return "UNKNOWN";
    }
}

TradeExecutor::TradeExecutor(ExecutorConfig config, std::shared_ptr<PortfolioLedger> ledger,
                             std::shared_ptr<ExitRuleEngine> exit_engine,
                             std::shared_ptr<OutcomeSampleCache> sample_cache,
                             std::shared_ptr<TradeEventBus> event_bus)
    : config_(std::move(config)),
      ledger_(std::move(ledger)),
      exit_engine_(std::move(exit_engine)),
      sample_cache_(std::move(sample_cache)),
      event_bus_(std::move(event_bus)) {}

std::mutex& TradeExecutor::key_lock(const std::string& user_id, const std::string& asset_id) {
    const size_t h = std::hash<std::string>{}(user_id + '\x1f' + asset_id);
    return key_locks_[h % kLockStripes];
}

double TradeExecutor::compute_size(const UserPrefs& prefs, double available) const {
    double size = 0.0;
    if (prefs.sizing_mode == SizingMode::FIXED) {
        size = prefs.fixed_size_usd;
    } else {
        size = std::max(prefs.min_trade_size_usd, available * prefs.percent_of_available / 100.0);
    }
    return std::min(size, config_.hard_cap_usd);
}

std::optional<std::string> TradeExecutor::filter_reason(const Signal& signal,
                                                        const UserPrefs& prefs,
                                                        Timestamp now) const {
    if (now - signal.graded_at > config_.signal_freshness) {
        return "signal is stale";
    }

    // Manual entries are explicit user requests and bypass the automatic-trading filters
    if (signal.signal_class == SignalClass::MANUAL) {
        return std::nullopt;
    }

    if (!prefs.trading_enabled) {
        return "trading disabled";
    }
    if (signal.signal_class == SignalClass::ALPHA && !prefs.alpha_enabled) {
        return "alpha trading disabled";
    }
    if (!prefs.allowed_grades.empty() &&
        std::find(prefs.allowed_grades.begin(), prefs.allowed_grades.end(), signal.grade) ==
            prefs.allowed_grades.end()) {
        return "grade " + grade_to_string(signal.grade) + " filtered out";
    }
    return std::nullopt;
}

ExitConfig TradeExecutor::build_exit_config(const Signal& signal, const UserPrefs& prefs) const {
    ExitConfig exit_config;
    exit_config.take_profit_mode = prefs.take_profit_mode;
    exit_config.take_profit_pct = prefs.take_profit_pct;
    exit_config.stop_loss_pct = prefs.stop_loss_pct;

    auto expiry = config_.expiry_by_signal_class.find(signal.signal_class);
    exit_config.expiry = expiry != config_.expiry_by_signal_class.end()
                             ? expiry->second
                             : std::chrono::seconds(std::chrono::hours(24));

    if (prefs.take_profit_mode != TakeProfitMode::FIXED_PERCENT) {
        std::vector<double> samples;
        if (sample_cache_) {
            samples = sample_cache_->samples(signal.signal_class);
        }
        exit_config.take_profit_pct = exit_engine_->resolve_take_profit(exit_config, samples);
    }
    return exit_config;
}

Result<void> TradeExecutor::swap_out_other_class(const std::string& user_id,
                                                 const Signal& signal, Timestamp now) {
    auto counterpart = swap_counterpart(signal.signal_class);
    if (!counterpart) {
        return Result<void>();
    }

    PositionKey other_key(signal.asset_id, *counterpart);
    auto snapshot = ledger_->snapshot(user_id);
    if (snapshot.is_error()) {
        return forward_error<void>(snapshot);
    }
    auto it = snapshot.value().positions.find(other_key);
    if (it == snapshot.value().positions.end()) {
        return Result<void>();
    }

    const double roi = ExitRuleEngine::roi_percent(it->second.entry_price, signal.price);
    auto closed = ledger_->close_position(user_id, other_key, signal.price, roi,
                                          ExitReason::SIGNAL_SWAP, now);
    if (closed.is_error()) {
        if (closed.error()->code() == ErrorCode::POSITION_NOT_FOUND) {
            // Closed by the monitor in the meantime
            return Result<void>();
        }
        return forward_error<void>(closed);
    }

    INFO("Swapped out " << other_key.to_string() << " for " << user_id << " at roi " << roi
                        << "%");

    if (event_bus_) {
        TradeEvent event;
        event.type = TradeEventType::POSITION_CLOSED;
        event.user_id = user_id;
        event.position = closed.value().position;
        event.timestamp = now;
        event.realized_roi_pct = closed.value().position.realized_roi_pct.value_or(roi);
        event.pnl_usd = closed.value().pnl_usd;
        event.reason = ExitReason::SIGNAL_SWAP;
        event_bus_->publish(event);
    }
    return Result<void>();
}

Result<ExecutionOutcome> TradeExecutor::execute(const std::string& user_id, const Signal& signal,
                                                const UserPrefs& prefs) {
    return execute(user_id, signal, prefs, std::chrono::system_clock::now());
}

Result<ExecutionOutcome> TradeExecutor::execute(const std::string& user_id, const Signal& signal,
                                                const UserPrefs& prefs, Timestamp now) {
    if (user_id.empty()) {
        return make_error<ExecutionOutcome>(ErrorCode::INVALID_ARGUMENT,
                                            "User ID cannot be empty", kComponent);
    }

    if (signal.asset_id.empty() || !std::isfinite(signal.price) || signal.price <= 0.0) {
        WARN("Rejected malformed signal for " << user_id << " (asset '" << signal.asset_id
                                              << "', price " << signal.price << ")");
        return rejected(ErrorCode::INVALID_SIGNAL, "malformed signal");
    }

    if (auto reason = filter_reason(signal, prefs, now)) {
        DEBUG("Skipped " << signal.asset_id << " for " << user_id << ": " << *reason);
        return skipped(*reason);
    }

    auto portfolio = ledger_->get_or_create(user_id);
    if (portfolio.is_error()) {
        return forward_error<ExecutionOutcome>(portfolio);
    }

    const PositionKey key(signal.asset_id, signal.signal_class);
    std::lock_guard<std::mutex> guard(key_lock(user_id, signal.asset_id));

    if (ledger_->has_open_position(user_id, key)) {
        DEBUG("Skipped duplicate " << key.to_string() << " for " << user_id);
        return skipped("position already open");
    }

    if (prefs.swap_on_class_change) {
        auto swap = swap_out_other_class(user_id, signal, now);
        if (swap.is_error()) {
            if (swap.error()->code() == ErrorCode::CORRUPTED_STATE) {
                return rejected(ErrorCode::CORRUPTED_STATE, swap.error()->what());
            }
            return forward_error<ExecutionOutcome>(swap);
        }
    }

    auto available_result = ledger_->get_available_capital(user_id);
    if (available_result.is_error()) {
        return forward_error<ExecutionOutcome>(available_result);
    }
    const double available = available_result.value();
    const double size = compute_size(prefs, available);

    if (!(size > 0.0) || available < size || available < prefs.reserve_usd ||
        available < prefs.min_trade_size_usd) {
        INFO("Rejected " << key.to_string() << " for " << user_id << ": available "
                         << available << ", size " << size);
        return rejected(ErrorCode::INSUFFICIENT_FUNDS, "insufficient available capital");
    }

    const ExitConfig exit_config = build_exit_config(signal, prefs);
    auto opened = ledger_->open_position(user_id, key, signal.symbol, size, signal.price,
                                         exit_config, now);
    if (opened.is_error()) {
        switch (opened.error()->code()) {
            case ErrorCode::DUPLICATE_POSITION:
                return skipped("position already open");
            case ErrorCode::INSUFFICIENT_FUNDS:
            case ErrorCode::CORRUPTED_STATE:
            case ErrorCode::INVALID_ARGUMENT:
                return rejected(opened.error()->code(), opened.error()->what());
            default:
                return forward_error<ExecutionOutcome>(opened);
        }
    }

    if (event_bus_) {
        TradeEvent event;
        event.type = TradeEventType::POSITION_OPENED;
        event.user_id = user_id;
        event.position = opened.value();
        event.timestamp = now;
        event_bus_->publish(event);
    }

    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::OPENED;
    outcome.position = opened.value();
    outcome.reason = "opened";
    return outcome;
}

}  // namespace paper_ngin
