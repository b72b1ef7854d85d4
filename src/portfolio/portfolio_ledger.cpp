// src/portfolio/portfolio_ledger.cpp
#include "paper_ngin/portfolio/portfolio_ledger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "PortfolioLedger";

Result<Portfolio> portfolio_not_found(const std::string& user_id) {
    return make_error<Portfolio>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                 "No portfolio for user " + user_id, kComponent);
}

}  // namespace

PortfolioLedger::PortfolioLedger(LedgerConfig config) : config_(std::move(config)) {}

std::shared_ptr<PortfolioLedger::Slot> PortfolioLedger::find_slot(
    const std::string& user_id) const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(user_id);
    if (it == slots_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<Portfolio> PortfolioLedger::create_portfolio(const std::string& user_id,
                                                    double starting_capital, double reserve) {
    if (user_id.empty()) {
        return make_error<Portfolio>(ErrorCode::INVALID_ARGUMENT, "User ID cannot be empty",
                                     kComponent);
    }
    if (!std::isfinite(starting_capital) || starting_capital < 0.0 || !std::isfinite(reserve) ||
        reserve < 0.0) {
        return make_error<Portfolio>(ErrorCode::INVALID_ARGUMENT,
                                     "Starting capital and reserve must be non-negative",
                                     kComponent);
    }
    if (reserve > starting_capital) {
        return make_error<Portfolio>(ErrorCode::INVALID_ARGUMENT,
                                     "Reserve cannot exceed starting capital", kComponent);
    }

    auto slot = std::make_shared<Slot>();
    slot->portfolio.user_id = user_id;
    slot->portfolio.capital = starting_capital;
    slot->portfolio.reserve = reserve;
    slot->portfolio.starting_capital = starting_capital;
    slot->portfolio.created_at = std::chrono::system_clock::now();

    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    if (!slots_.emplace(user_id, slot).second) {
        return make_error<Portfolio>(ErrorCode::DUPLICATE_PORTFOLIO,
                                     "Portfolio already exists for user " + user_id, kComponent);
    }

    INFO("Created portfolio for " << user_id << " with capital " << starting_capital
                                  << " (reserve " << reserve << ")");
    return slot->portfolio;
}

Result<Portfolio> PortfolioLedger::get_or_create(const std::string& user_id) {
    if (auto slot = find_slot(user_id)) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->portfolio;
    }

    auto created = create_portfolio(user_id, config_.starting_capital,
                                    config_.starting_capital * config_.default_reserve_percent /
                                        100.0);
    if (created.is_error() && created.error()->code() == ErrorCode::DUPLICATE_PORTFOLIO) {
        // Lost the race against another first interaction
        return snapshot(user_id);
    }
    return created;
}

Result<Position> PortfolioLedger::open_position(const std::string& user_id,
                                                const PositionKey& key,
                                                const std::string& symbol, double size_usd,
                                                Price entry_price, const ExitConfig& exit_config,
                                                Timestamp opened_at) {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<Position>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                    "No portfolio for user " + user_id, kComponent);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Portfolio& portfolio = slot->portfolio;

    if (portfolio.corrupted) {
        return make_error<Position>(ErrorCode::CORRUPTED_STATE,
                                    "Portfolio of " + user_id + " is marked corrupted",
                                    kComponent);
    }
    if (key.asset_id.empty()) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT, "Asset ID cannot be empty",
                                    kComponent);
    }
    if (!std::isfinite(size_usd) || size_usd <= 0.0) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Position size must be positive", kComponent);
    }
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT, "Entry price must be positive",
                                    kComponent);
    }
    if (portfolio.positions.count(key)) {
        return make_error<Position>(ErrorCode::DUPLICATE_POSITION,
                                    "Position " + key.to_string() + " already open for " +
                                        user_id,
                                    kComponent);
    }
    if (portfolio.available() < size_usd) {
        return make_error<Position>(ErrorCode::INSUFFICIENT_FUNDS,
                                    "Available capital " + std::to_string(portfolio.available()) +
                                        " below size " + std::to_string(size_usd),
                                    kComponent);
    }

    Position position;
    position.key = key;
    position.symbol = symbol;
    position.entry_price = entry_price;
    position.size_usd = size_usd;
    position.opened_at = opened_at;
    position.exit_config = exit_config;
    position.status = PositionStatus::OPEN;

    portfolio.capital -= size_usd;
    portfolio.positions.emplace(key, position);
    ++portfolio.version;

    INFO("Opened " << key.to_string() << " for " << user_id << ": size " << size_usd
                   << " at " << entry_price << ", capital now " << portfolio.capital);

    check_integrity_locked(portfolio);
    return position;
}

Result<ClosedPosition> PortfolioLedger::close_position(const std::string& user_id,
                                                       const PositionKey& key, Price exit_price,
                                                       double realized_roi_pct, ExitReason reason,
                                                       Timestamp closed_at) {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<ClosedPosition>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                          "No portfolio for user " + user_id, kComponent);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Portfolio& portfolio = slot->portfolio;

    if (portfolio.corrupted) {
        return make_error<ClosedPosition>(ErrorCode::CORRUPTED_STATE,
                                          "Portfolio of " + user_id + " is marked corrupted",
                                          kComponent);
    }
    if (!std::isfinite(realized_roi_pct)) {
        return make_error<ClosedPosition>(ErrorCode::INVALID_ARGUMENT,
                                          "Realized ROI must be finite", kComponent);
    }

    auto it = portfolio.positions.find(key);
    if (it == portfolio.positions.end()) {
        return make_error<ClosedPosition>(ErrorCode::POSITION_NOT_FOUND,
                                          "No open position " + key.to_string() + " for " +
                                              user_id,
                                          kComponent);
    }

    if (realized_roi_pct < -100.0) {
        WARN("ROI " << realized_roi_pct << "% for " << key.to_string()
                    << " floored at -100%");
        realized_roi_pct = -100.0;
    }

    ClosedPosition closed;
    closed.position = it->second;
    closed.position.status = PositionStatus::CLOSED;
    closed.position.closed_at = closed_at;
    closed.position.exit_price = exit_price;
    closed.position.realized_roi_pct = realized_roi_pct;
    closed.position.exit_reason = reason;

    const double credit = closed.position.size_usd * (1.0 + realized_roi_pct / 100.0);
    closed.pnl_usd = credit - closed.position.size_usd;
    closed.hold_duration = std::max(
        std::chrono::seconds(0),
        std::chrono::duration_cast<std::chrono::seconds>(closed_at - closed.position.opened_at));

    portfolio.capital += credit;
    portfolio.positions.erase(it);
    portfolio.history.push_back(closed);
    portfolio.stats.record(closed);
    ++portfolio.version;

    INFO("Closed " << key.to_string() << " for " << user_id << " ("
                   << exit_reason_to_string(reason) << "): roi " << realized_roi_pct
                   << "%, pnl " << closed.pnl_usd << ", capital now " << portfolio.capital);

    check_integrity_locked(portfolio);
    return closed;
}

Result<double> PortfolioLedger::get_available_capital(const std::string& user_id) const {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<double>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                  "No portfolio for user " + user_id, kComponent);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->portfolio.available();
}

Result<Portfolio> PortfolioLedger::snapshot(const std::string& user_id) const {
    auto slot = find_slot(user_id);
    if (!slot) {
        return portfolio_not_found(user_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->portfolio;
}

std::vector<std::pair<std::string, Position>> PortfolioLedger::open_positions() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        slots.reserve(slots_.size());
        for (const auto& [_, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::vector<std::pair<std::string, Position>> result;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& [_, position] : slot->portfolio.positions) {
            result.emplace_back(slot->portfolio.user_id, position);
        }
    }
    return result;
}

std::vector<std::string> PortfolioLedger::user_ids() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, _] : slots_) {
        ids.push_back(id);
    }
    return ids;
}

bool PortfolioLedger::has_open_position(const std::string& user_id,
                                        const PositionKey& key) const {
    auto slot = find_slot(user_id);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->portfolio.positions.count(key) > 0;
}

std::unordered_map<std::string, uint64_t> PortfolioLedger::versions() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        for (const auto& [_, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::unordered_map<std::string, uint64_t> result;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result[slot->portfolio.user_id] = slot->portfolio.version;
    }
    return result;
}

Result<void> PortfolioLedger::restore(Portfolio portfolio) {
    if (portfolio.user_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Cannot restore a portfolio without user ID", kComponent);
    }

    const std::string user_id = portfolio.user_id;
    std::shared_ptr<Slot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(slots_mutex_);
        auto& entry = slots_[user_id];
        if (!entry) {
            entry = std::make_shared<Slot>();
        }
        slot = entry;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->portfolio = std::move(portfolio);
    if (!slot->portfolio.corrupted) {
        check_integrity_locked(slot->portfolio);
    }

    DEBUG("Restored portfolio for " << user_id << " at version " << slot->portfolio.version
                                    << " with " << slot->portfolio.positions.size()
                                    << " open positions");
    return Result<void>();
}

Result<void> PortfolioLedger::verify_integrity(const std::string& user_id) {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<void>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                "No portfolio for user " + user_id, kComponent);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    check_integrity_locked(slot->portfolio);
    if (slot->portfolio.corrupted) {
        return make_error<void>(ErrorCode::CORRUPTED_STATE,
                                "Portfolio of " + user_id + " failed the integrity check",
                                kComponent);
    }
    return Result<void>();
}

Result<void> PortfolioLedger::clear_corruption(const std::string& user_id) {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<void>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                "No portfolio for user " + user_id, kComponent);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->portfolio.corrupted) {
        slot->portfolio.corrupted = false;
        ++slot->portfolio.version;
        WARN("Corruption mark cleared for " << user_id);
    }
    return Result<void>();
}

Result<uint64_t> PortfolioLedger::advance_version(const std::string& user_id, uint64_t floor) {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<uint64_t>(ErrorCode::PORTFOLIO_NOT_FOUND,
                                    "No portfolio for user " + user_id, kComponent);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->portfolio.version = std::max(slot->portfolio.version, floor) + 1;
    return slot->portfolio.version;
}

Result<std::vector<ClosedPosition>> PortfolioLedger::history_page(const std::string& user_id,
                                                                  size_t page,
                                                                  size_t page_size) const {
    auto slot = find_slot(user_id);
    if (!slot) {
        return make_error<std::vector<ClosedPosition>>(
            ErrorCode::PORTFOLIO_NOT_FOUND, "No portfolio for user " + user_id, kComponent);
    }
    if (page_size == 0) {
        page_size = config_.page_size;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& history = slot->portfolio.history;

    std::vector<ClosedPosition> result;
    const size_t skip = page * page_size;
    if (skip >= history.size()) {
        return result;
    }

    // History is appended oldest first
    const size_t end = std::min(history.size(), skip + page_size);
    for (size_t i = skip; i < end; ++i) {
        result.push_back(history[history.size() - 1 - i]);
    }
    return result;
}

void PortfolioLedger::check_integrity_locked(Portfolio& portfolio) {
    const std::string violation = portfolio.integrity_violation();
    if (violation.empty()) {
        return;
    }
    if (!portfolio.corrupted) {
        portfolio.corrupted = true;
        FATAL("Portfolio of " << portfolio.user_id << " is corrupted: " << violation
                              << ". Mutations suspended until manual repair");
    }
}

}  // namespace paper_ngin
