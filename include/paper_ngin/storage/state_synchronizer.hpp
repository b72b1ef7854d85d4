// include/paper_ngin/storage/state_synchronizer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/periodic_worker.hpp"
#include "paper_ngin/live/trade_event_bus.hpp"
#include "paper_ngin/portfolio/portfolio_ledger.hpp"
#include "paper_ngin/storage/portfolio_store.hpp"

namespace paper_ngin {

struct SynchronizerConfig {
    std::chrono::seconds persist_interval{30};
    int retry_attempts{3};
    std::chrono::milliseconds retry_initial_delay{100};
    std::string component_id{"STATE_SYNCHRONIZER"};
};

enum class ConflictResolution {
    KEEP_LOCAL,  // Overwrite the stored copy with the ledger's
    TAKE_REMOTE  // Replace the ledger's copy with the stored one
};

/**
 * @brief A user whose stored portfolio changed behind the engine's back
 */
struct PendingConflict {
    std::string user_id;
    std::optional<Portfolio> remote;  // Empty if the stored copy has disappeared
    uint64_t local_version{0};
    Timestamp detected_at;
};

/**
 * @brief Keeps the durable store in step with the in-memory ledger
 *
 * Writes are optimistic: each save expects the version last written by this process. A
 * mismatch is never merged; the user is parked in pending_conflicts() until an operator
 * calls resolve_conflict(). Writes for one user are serialized; different users never
 * wait on each other's store I/O.
 */
class StateSynchronizer {
public:
    StateSynchronizer(SynchronizerConfig config, std::shared_ptr<PortfolioLedger> ledger,
                      std::shared_ptr<PortfolioStore> store,
                      std::shared_ptr<TradeEventBus> event_bus = nullptr);

    ~StateSynchronizer();

    StateSynchronizer(const StateSynchronizer&) = delete;
    StateSynchronizer& operator=(const StateSynchronizer&) = delete;

    /**
     * @brief Restore every stored portfolio into the ledger
     *
     * A portfolio that cannot be decoded (CORRUPTED_STATE or JSON_PARSE_ERROR) is quarantined:
     * the ledger gets a corrupted placeholder that refuses trading, the stored copy is never
     * overwritten, and loading carries on with the other users.
     * @return Number of portfolios loaded, or the error if listing users or a transient
     *         load failure outlasts the retries
     */
    Result<size_t> load_all();

    /**
     * @brief Write one user's portfolio if it changed since the last write
     * @return STORAGE_CONFLICT if the stored copy moved on or the user is parked,
     *         CORRUPTED_STATE if the user is quarantined
     */
    Result<void> persist(const std::string& user_id);

    /**
     * @brief Persist every user whose version changed
     * @return Number of users that failed
     */
    size_t persist_dirty();

    std::vector<PendingConflict> pending_conflicts() const;

    Result<void> resolve_conflict(const std::string& user_id, ConflictResolution resolution);

    /**
     * @brief Users whose stored portfolio could not be decoded at load time
     */
    std::vector<std::string> quarantined_users() const;

    /**
     * @brief Subscribe to position closes and start the periodic flush
     *
     * A close only wakes the flush thread, so the publisher never waits on the store.
     */
    Result<void> start();

    /**
     * @brief Stop the periodic flush and persist whatever is still dirty
     */
    void stop();

    bool is_running() const {
        return worker_.is_running();
    }

    std::optional<uint64_t> persisted_version(const std::string& user_id) const;

private:
    // Called with the user's write lock held
    Result<void> persist_locked(const std::string& user_id);

    std::shared_ptr<std::mutex> user_lock(const std::string& user_id);

    void quarantine(const std::string& user_id, const TradeError& error);

    Result<void> save_with_retry(const std::string& user_id, const Portfolio& portfolio,
                                 std::optional<uint64_t> expected_version);

    void park_conflict(const std::string& user_id, uint64_t local_version);

    std::string subscriber_id() const {
        return config_.component_id + "_persist";
    }

    SynchronizerConfig config_;
    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<PortfolioStore> store_;
    std::shared_ptr<TradeEventBus> event_bus_;

    PeriodicWorker worker_;
    bool registered_{false};

    // Guards the maps and sets below; never held across store I/O
    mutable std::mutex state_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> user_locks_;
    std::unordered_map<std::string, uint64_t> persisted_versions_;
    std::unordered_map<std::string, PendingConflict> conflicts_;
    std::set<std::string> quarantined_;
};

}  // namespace paper_ngin
