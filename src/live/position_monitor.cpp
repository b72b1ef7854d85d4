// src/live/position_monitor.cpp
#include "paper_ngin/live/position_monitor.hpp"

#include <algorithm>
#include <unordered_set>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/retry.hpp"
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "PositionMonitor";
}

PositionMonitor::PositionMonitor(MonitorConfig config, std::shared_ptr<PortfolioLedger> ledger,
                                 std::shared_ptr<PriceOracleBase> oracle,
                                 std::shared_ptr<ExitRuleEngine> exit_engine,
                                 std::shared_ptr<OutcomeSampleCache> sample_cache,
                                 std::shared_ptr<TradeEventBus> event_bus)
    : config_(std::move(config)),
      ledger_(std::move(ledger)),
      oracle_(std::move(oracle)),
      exit_engine_(std::move(exit_engine)),
      sample_cache_(std::move(sample_cache)),
      event_bus_(std::move(event_bus)),
      worker_("PositionMonitor") {}

PositionMonitor::~PositionMonitor() {
    stop();
}

Result<void> PositionMonitor::start() {
    if (!ledger_ || !oracle_ || !exit_engine_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Monitor requires a ledger, a price oracle and an exit engine",
                                kComponent);
    }
    if (worker_.is_running()) {
        return Result<void>();
    }

    if (!registered_) {
        ComponentInfo info;
        info.type = ComponentType::POSITION_MONITOR;
        info.state = ComponentState::INITIALIZED;
        info.id = config_.component_id;
        info.last_update = std::chrono::system_clock::now();
        auto registered = StateManager::instance().register_component(info);
        if (registered.is_error()) {
            return registered;
        }
        registered_ = true;
    }

    auto running = StateManager::instance().update_state(config_.component_id,
                                                         ComponentState::RUNNING);
    if (running.is_error()) {
        return running;
    }

    worker_.start(config_.interval, [this] { run_cycle(std::chrono::system_clock::now()); });
    INFO("Position monitor started with interval " << config_.interval.count() << "s");
    return Result<void>();
}

void PositionMonitor::stop() {
    if (!worker_.is_running()) {
        return;
    }

    worker_.stop();

    if (registered_) {
        auto stopped = StateManager::instance().update_state(config_.component_id,
                                                             ComponentState::STOPPED);
        if (stopped.is_error()) {
            WARN("Failed to mark monitor stopped: " << stopped.error()->what());
        }
        auto removed = StateManager::instance().unregister_component(config_.component_id);
        if (removed.is_error()) {
            WARN("Failed to unregister monitor: " << removed.error()->what());
        }
        registered_ = false;
    }
    INFO("Position monitor stopped");
}

std::string PositionMonitor::mark_key(const std::string& user_id, const PositionKey& key) {
    return user_id + "|" + key.to_string();
}

PositionMonitor::QuoteState PositionMonitor::fetch_quote(const std::string& asset_id,
                                                         Timestamp now) {
    QuoteState state;
    auto quote = utils::retry_with_backoff(
        [this, &asset_id]() { return oracle_->get_quote(asset_id); },
        std::max(1, config_.price_retry_attempts), config_.retry_initial_delay);

    if (quote.is_error()) {
        state.failure = quote.error()->what();
        return state;
    }
    if (!PriceOracleBase::is_valid_price(quote.value().price)) {
        state.failure = "invalid price " + std::to_string(quote.value().price);
        return state;
    }
    if (now - quote.value().as_of > config_.max_quote_age) {
        state.failure = "quote from " + quote.value().source + " is stale";
        return state;
    }
    state.quote = quote.value();
    return state;
}

void PositionMonitor::update_mark(const std::string& user_id, const Position& position,
                                  const PriceQuote& quote) {
    std::lock_guard<std::mutex> lock(marks_mutex_);
    auto& mark = marks_[mark_key(user_id, position.key)];
    mark.last_price = quote.price;
    mark.as_of = quote.as_of;
    if (quote.price > mark.peak_price) {
        mark.peak_price = quote.price;
        mark.peak_roi_pct = ExitRuleEngine::roi_percent(position.entry_price, quote.price);
    }
}

std::optional<PositionMark> PositionMonitor::mark(const std::string& user_id,
                                                  const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(marks_mutex_);
    auto it = marks_.find(mark_key(user_id, key));
    if (it == marks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<bool> PositionMonitor::process_position(const std::string& user_id,
                                               const Position& position,
                                               const QuoteState& quote, Timestamp now) {
    ExitDecision decision = ExitDecision::NONE;
    Price exit_price = 0.0;

    if (quote.quote) {
        update_mark(user_id, position, *quote.quote);
        const auto samples = sample_cache_ ? sample_cache_->samples(position.signal_class())
                                           : std::vector<double>();
        exit_price = quote.quote->price;
        decision = exit_engine_->evaluate(position, exit_price, now, samples);
    } else if (ExitRuleEngine::is_expired(position, now)) {
        // Expiry does not need a price: close at the last mark, or flat at entry
        auto last = mark(user_id, position.key);
        exit_price = last ? last->last_price : position.entry_price;
        decision = ExitDecision::EXPIRED;
        WARN("No usable quote for expired " << position.key.to_string() << " of " << user_id
                                            << " (" << quote.failure << "), closing at "
                                            << exit_price);
    } else {
        DEBUG("Skipping " << position.key.to_string() << " of " << user_id << ": "
                          << quote.failure);
        return false;
    }

    if (decision == ExitDecision::NONE) {
        return false;
    }

    const double roi = ExitRuleEngine::roi_percent(position.entry_price, exit_price);
    const ExitReason reason = to_exit_reason(decision);
    auto closed = ledger_->close_position(user_id, position.key, exit_price, roi, reason, now);
    if (closed.is_error()) {
        if (closed.error()->code() == ErrorCode::POSITION_NOT_FOUND) {
            // Closed concurrently, e.g. by a class swap
            return false;
        }
        return forward_error<bool>(closed);
    }

    {
        std::lock_guard<std::mutex> lock(marks_mutex_);
        marks_.erase(mark_key(user_id, position.key));
    }

    INFO(exit_decision_to_string(decision) << " for " << position.key.to_string() << " of "
                                           << user_id << " at " << exit_price << " (roi "
                                           << closed.value().position.realized_roi_pct.value_or(roi)
                                           << "%)");

    if (event_bus_) {
        TradeEvent event;
        event.type = TradeEventType::POSITION_CLOSED;
        event.user_id = user_id;
        event.position = closed.value().position;
        event.timestamp = now;
        event.realized_roi_pct = closed.value().position.realized_roi_pct.value_or(roi);
        event.pnl_usd = closed.value().pnl_usd;
        event.reason = reason;
        event_bus_->publish(event);
    }
    return true;
}

CycleReport PositionMonitor::run_cycle(Timestamp now) {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    CycleReport report;

    if (sample_cache_) {
        const size_t failures = sample_cache_->refresh_all();
        if (failures > 0) {
            WARN(failures << " outcome sample refreshes failed, using cached samples");
        }
    }

    const auto open = ledger_->open_positions();

    // Drop marks of positions that closed elsewhere
    {
        std::unordered_set<std::string> live;
        for (const auto& [user_id, position] : open) {
            live.insert(mark_key(user_id, position.key));
        }
        std::lock_guard<std::mutex> lock(marks_mutex_);
        for (auto it = marks_.begin(); it != marks_.end();) {
            if (live.count(it->first)) {
                ++it;
            } else {
                it = marks_.erase(it);
            }
        }
    }

    std::unordered_map<std::string, QuoteState> quotes;
    for (const auto& [user_id, position] : open) {
        ++report.evaluated;
        try {
            auto cached = quotes.find(position.key.asset_id);
            if (cached == quotes.end()) {
                cached = quotes.emplace(position.key.asset_id,
                                        fetch_quote(position.key.asset_id, now))
                             .first;
            }

            auto processed = process_position(user_id, position, cached->second, now);
            if (processed.is_error()) {
                ++report.errors;
                ERROR("Failed to close " << position.key.to_string() << " of " << user_id
                                         << ": " << processed.error()->to_string());
            } else if (processed.value()) {
                ++report.closed;
            } else {
                ++report.skipped;
            }
        } catch (const std::exception& e) {
            ++report.errors;
            ERROR("Monitoring " << position.key.to_string() << " of " << user_id
                                << " threw: " << e.what());
        }
    }

    DEBUG("Monitor cycle: evaluated " << report.evaluated << ", closed " << report.closed
                                      << ", skipped " << report.skipped << ", errors "
                                      << report.errors);

    if (registered_) {
        auto updated = StateManager::instance().update_metrics(
            config_.component_id, {{"evaluated", static_cast<double>(report.evaluated)},
                                   {"closed", static_cast<double>(report.closed)},
                                   {"skipped", static_cast<double>(report.skipped)},
                                   {"errors", static_cast<double>(report.errors)}});
        if (updated.is_error()) {
            WARN("Failed to update monitor metrics: " << updated.error()->what());
        }
    }
    return report;
}

Result<UnrealizedSummary> PositionMonitor::unrealized_summary(const std::string& user_id) const {
    auto portfolio = ledger_->snapshot(user_id);
    if (portfolio.is_error()) {
        return forward_error<UnrealizedSummary>(portfolio);
    }

    UnrealizedSummary summary;
    for (const auto& [key, position] : portfolio.value().positions) {
        UnrealizedPosition entry;
        entry.key = key;
        entry.symbol = position.symbol;
        entry.size_usd = position.size_usd;
        entry.entry_price = position.entry_price;
        entry.market_value = position.size_usd;

        if (auto last = mark(user_id, key)) {
            entry.mark_price = last->last_price;
            entry.unrealized_roi_pct =
                ExitRuleEngine::roi_percent(position.entry_price, last->last_price);
            entry.market_value = position.size_usd * (1.0 + entry.unrealized_roi_pct / 100.0);
            entry.unrealized_pnl_usd = entry.market_value - position.size_usd;
            entry.peak_roi_pct = last->peak_roi_pct;
        }

        summary.cost_basis += entry.size_usd;
        summary.market_value += entry.market_value;
        summary.positions.push_back(entry);
    }

    summary.unrealized_pnl_usd = summary.market_value - summary.cost_basis;
    if (summary.cost_basis > 0.0) {
        summary.unrealized_pnl_pct = summary.unrealized_pnl_usd / summary.cost_basis * 100.0;
    }
    return summary;
}

}  // namespace paper_ngin
