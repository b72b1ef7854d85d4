// include/paper_ngin/portfolio/portfolio_ledger.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/portfolio/portfolio_types.hpp"

namespace paper_ngin {

/**
 * @brief Settings for portfolios created implicitly on first interaction
 */
struct LedgerConfig {
    double starting_capital{1000.0};
    double default_reserve_percent{0.0};
    size_t page_size{10};
};

/**
 * @brief Authoritative in-memory record of every user's capital and positions
 *
 * Each portfolio has its own mutex, so operations on different users never contend.
 * The map of portfolios is guarded separately and only held long enough to find a slot.
 * Every successful mutation increments the portfolio version.
 */
class PortfolioLedger {
public:
    explicit PortfolioLedger(LedgerConfig config = LedgerConfig());

    PortfolioLedger(const PortfolioLedger&) = delete;
    PortfolioLedger& operator=(const PortfolioLedger&) = delete;

    /**
     * @brief Create a portfolio for a new user
     * @param user_id User identifier
     * @param starting_capital Initial capital in USD
     * @param reserve Part of capital that can never be committed to positions
     * @return The new portfolio, INVALID_ARGUMENT or DUPLICATE_PORTFOLIO
     */
    Result<Portfolio> create_portfolio(const std::string& user_id, double starting_capital,
                                       double reserve);

    /**
     * @brief Return the user's portfolio, creating it from LedgerConfig if missing
     */
    Result<Portfolio> get_or_create(const std::string& user_id);

    /**
     * @brief Debit capital and record a new OPEN position
     *
     * Fails with INVALID_ARGUMENT (size or price not positive), DUPLICATE_POSITION,
     * INSUFFICIENT_FUNDS (capital - reserve below size), CORRUPTED_STATE or
     * PORTFOLIO_NOT_FOUND. On failure nothing changes.
     */
    Result<Position> open_position(const std::string& user_id, const PositionKey& key,
                                   const std::string& symbol, double size_usd, Price entry_price,
                                   const ExitConfig& exit_config, Timestamp opened_at);

    /**
     * @brief Close an OPEN position and credit size * (1 + roi / 100)
     *
     * ROI below -100% is floored at -100% so capital cannot go negative.
     * @return The history record appended, or POSITION_NOT_FOUND / CORRUPTED_STATE
     */
    Result<ClosedPosition> close_position(const std::string& user_id, const PositionKey& key,
                                          Price exit_price, double realized_roi_pct,
                                          ExitReason reason, Timestamp closed_at);

    /**
     * @brief capital - reserve, never negative
     */
    Result<double> get_available_capital(const std::string& user_id) const;

    /**
     * @brief Deep copy of a portfolio taken under its lock
     */
    Result<Portfolio> snapshot(const std::string& user_id) const;

    /**
     * @brief Copies of all OPEN positions across users
     */
    std::vector<std::pair<std::string, Position>> open_positions() const;

    std::vector<std::string> user_ids() const;

    bool has_open_position(const std::string& user_id, const PositionKey& key) const;

    /**
     * @brief Current version of every portfolio
     */
    std::unordered_map<std::string, uint64_t> versions() const;

    /**
     * @brief Install a portfolio loaded from the durable store, replacing any local copy
     *
     * A portfolio that fails the integrity check is installed but marked corrupted.
     */
    Result<void> restore(Portfolio portfolio);

    /**
     * @brief Check conservation and non-negativity
     *
     * On violation the portfolio is marked corrupted, a FATAL record is logged and
     * CORRUPTED_STATE is returned. Other users are unaffected.
     */
    Result<void> verify_integrity(const std::string& user_id);

    /**
     * @brief Operator hook to lift the corruption mark after a manual repair
     */
    Result<void> clear_corruption(const std::string& user_id);

    /**
     * @brief Raise the version above `floor` so the local copy supersedes a remote one
     * @return The new version
     */
    Result<uint64_t> advance_version(const std::string& user_id, uint64_t floor);

    /**
     * @brief One page of closed positions, newest first
     * @param page Zero-based page index
     * @param page_size Records per page, 0 for the configured default
     */
    Result<std::vector<ClosedPosition>> history_page(const std::string& user_id, size_t page,
                                                     size_t page_size = 0) const;

    const LedgerConfig& config() const {
        return config_;
    }

private:
    struct Slot {
        mutable std::mutex mutex;
        Portfolio portfolio;
    };

    std::shared_ptr<Slot> find_slot(const std::string& user_id) const;

    // Called with the slot mutex held
    void check_integrity_locked(Portfolio& portfolio);

    LedgerConfig config_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    mutable std::shared_mutex slots_mutex_;
};

}  // namespace paper_ngin
