// src/storage/state_synchronizer.cpp
#include "paper_ngin/storage/state_synchronizer.hpp"

#include <algorithm>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/retry.hpp"
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "StateSynchronizer";

bool is_unreadable(ErrorCode code) {
    return code == ErrorCode::CORRUPTED_STATE || code == ErrorCode::JSON_PARSE_ERROR;
}
}  // namespace

StateSynchronizer::StateSynchronizer(SynchronizerConfig config,
                                     std::shared_ptr<PortfolioLedger> ledger,
                                     std::shared_ptr<PortfolioStore> store,
                                     std::shared_ptr<TradeEventBus> event_bus)
    : config_(std::move(config)),
      ledger_(std::move(ledger)),
      store_(std::move(store)),
      event_bus_(std::move(event_bus)),
      worker_("StateSynchronizer") {}

StateSynchronizer::~StateSynchronizer() {
    stop();
}

Result<size_t> StateSynchronizer::load_all() {
    auto users = utils::retry_with_backoff([this]() { return store_->list_users(); },
                                           config_.retry_attempts, config_.retry_initial_delay);
    if (users.is_error()) {
        ERROR("Failed to list stored portfolios: " << users.error()->what());
        return forward_error<size_t>(users);
    }

    size_t loaded = 0;
    for (const auto& user_id : users.value()) {
        auto stored = utils::retry_with_backoff([this, &user_id]() { return store_->load(user_id); },
                                                config_.retry_attempts,
                                                config_.retry_initial_delay);
        if (stored.is_error()) {
            if (is_unreadable(stored.error()->code())) {
                quarantine(user_id, *stored.error());
                continue;
            }
            ERROR("Failed to load portfolio of " << user_id << ": " << stored.error()->what());
            return forward_error<size_t>(stored);
        }
        if (!stored.value()) {
            continue;
        }

        const uint64_t version = stored.value()->version;
        auto restored = ledger_->restore(*stored.value());
        if (restored.is_error()) {
            return forward_error<size_t>(restored);
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        persisted_versions_[user_id] = version;
        ++loaded;
    }

    const size_t quarantined = quarantined_users().size();
    if (quarantined > 0) {
        ERROR(quarantined << " stored portfolios are quarantined and need manual repair");
    }
    INFO("Loaded " << loaded << " portfolios from the store");
    return loaded;
}

void StateSynchronizer::quarantine(const std::string& user_id, const TradeError& error) {
    FATAL("Stored portfolio of " << user_id << " cannot be decoded, quarantining it: "
                                 << error.what());

    // Placeholder keeps the user from trading on a fresh portfolio
    Portfolio placeholder;
    placeholder.user_id = user_id;
    placeholder.corrupted = true;
    placeholder.created_at = std::chrono::system_clock::now();
    auto restored = ledger_->restore(std::move(placeholder));
    if (restored.is_error()) {
        WARN("Could not install placeholder for " << user_id << ": "
                                                  << restored.error()->what());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    quarantined_.insert(user_id);
}

std::vector<std::string> StateSynchronizer::quarantined_users() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return std::vector<std::string>(quarantined_.begin(), quarantined_.end());
}

std::shared_ptr<std::mutex> StateSynchronizer::user_lock(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& entry = user_locks_[user_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

Result<void> StateSynchronizer::save_with_retry(const std::string& user_id,
                                                const Portfolio& portfolio,
                                                std::optional<uint64_t> expected_version) {
    return utils::retry_with_backoff(
        [this, &user_id, &portfolio, expected_version]() {
            return store_->save(user_id, portfolio, expected_version);
        },
        config_.retry_attempts, config_.retry_initial_delay);
}

void StateSynchronizer::park_conflict(const std::string& user_id, uint64_t local_version) {
    PendingConflict conflict;
    conflict.user_id = user_id;
    conflict.local_version = local_version;
    conflict.detected_at = std::chrono::system_clock::now();

    auto remote = store_->load(user_id);
    if (remote.is_error()) {
        WARN("Could not read the conflicting copy of " << user_id << ": "
                                                       << remote.error()->what());
    } else {
        conflict.remote = remote.value();
    }

    ERROR("Storage conflict for " << user_id << " at local version " << local_version
                                  << ", persistence suspended until resolved");
    std::lock_guard<std::mutex> lock(state_mutex_);
    conflicts_[user_id] = std::move(conflict);
}

Result<void> StateSynchronizer::persist_locked(const std::string& user_id) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (quarantined_.count(user_id)) {
            return make_error<void>(ErrorCode::CORRUPTED_STATE,
                                    "Portfolio of " + user_id + " is quarantined", kComponent);
        }
        if (conflicts_.count(user_id)) {
            return make_error<void>(ErrorCode::STORAGE_CONFLICT,
                                    "Persistence of " + user_id + " is suspended by a conflict",
                                    kComponent);
        }
    }

    auto snapshot = ledger_->snapshot(user_id);
    if (snapshot.is_error()) {
        return forward_error<void>(snapshot);
    }
    const Portfolio& portfolio = snapshot.value();

    std::optional<uint64_t> expected;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto persisted = persisted_versions_.find(user_id);
        if (persisted != persisted_versions_.end()) {
            if (persisted->second == portfolio.version) {
                return Result<void>();
            }
            expected = persisted->second;
        }
    }

    auto saved = save_with_retry(user_id, portfolio, expected);
    if (saved.is_error()) {
        if (saved.error()->code() == ErrorCode::STORAGE_CONFLICT) {
            park_conflict(user_id, portfolio.version);
        } else {
            ERROR("Failed to persist portfolio of " << user_id << ": "
                                                    << saved.error()->what());
        }
        return saved;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    persisted_versions_[user_id] = portfolio.version;
    return Result<void>();
}

Result<void> StateSynchronizer::persist(const std::string& user_id) {
    auto write_lock = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*write_lock);
    return persist_locked(user_id);
}

size_t StateSynchronizer::persist_dirty() {
    size_t failures = 0;
    for (const auto& [user_id, version] : ledger_->versions()) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (conflicts_.count(user_id) || quarantined_.count(user_id)) {
                continue;
            }
            auto persisted = persisted_versions_.find(user_id);
            if (persisted != persisted_versions_.end() && persisted->second == version) {
                continue;
            }
        }
        if (persist(user_id).is_error()) {
            ++failures;
        }
    }

    if (registered_) {
        double conflicts = 0.0;
        double quarantined = 0.0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            conflicts = static_cast<double>(conflicts_.size());
            quarantined = static_cast<double>(quarantined_.size());
        }
        auto updated = StateManager::instance().update_metrics(
            config_.component_id, {{"pending_conflicts", conflicts},
                                   {"quarantined_portfolios", quarantined},
                                   {"last_flush_failures", static_cast<double>(failures)}});
        if (updated.is_error()) {
            WARN("Failed to update synchronizer metrics: " << updated.error()->what());
        }
    }
    return failures;
}

std::vector<PendingConflict> StateSynchronizer::pending_conflicts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<PendingConflict> result;
    result.reserve(conflicts_.size());
    for (const auto& [_, conflict] : conflicts_) {
        result.push_back(conflict);
    }
    return result;
}

Result<void> StateSynchronizer::resolve_conflict(const std::string& user_id,
                                                 ConflictResolution resolution) {
    auto write_lock = user_lock(user_id);
    std::lock_guard<std::mutex> user_guard(*write_lock);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!conflicts_.count(user_id)) {
            return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                    "No pending conflict for " + user_id, kComponent);
        }
    }

    // Re-read: the stored copy may have moved again since the conflict was detected
    auto remote = store_->load(user_id);
    if (remote.is_error()) {
        return forward_error<void>(remote);
    }
    const std::optional<Portfolio>& stored = remote.value();

    if (resolution == ConflictResolution::TAKE_REMOTE) {
        if (!stored) {
            return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                    "No stored portfolio for " + user_id + " to take",
                                    kComponent);
        }
        auto restored = ledger_->restore(*stored);
        if (restored.is_error()) {
            return restored;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            persisted_versions_[user_id] = stored->version;
            conflicts_.erase(user_id);
        }
        WARN("Conflict for " << user_id << " resolved by taking stored version "
                             << stored->version);
        return Result<void>();
    }

    std::optional<uint64_t> expected;
    if (stored) {
        expected = stored->version;
    }
    auto advanced = ledger_->advance_version(user_id, expected.value_or(0));
    if (advanced.is_error()) {
        return forward_error<void>(advanced);
    }

    auto snapshot = ledger_->snapshot(user_id);
    if (snapshot.is_error()) {
        return forward_error<void>(snapshot);
    }

    auto saved = save_with_retry(user_id, snapshot.value(), expected);
    if (saved.is_error()) {
        ERROR("Failed to overwrite stored portfolio of " << user_id << ": "
                                                         << saved.error()->what());
        return saved;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        persisted_versions_[user_id] = snapshot.value().version;
        conflicts_.erase(user_id);
    }
    WARN("Conflict for " << user_id << " resolved by keeping local version "
                         << snapshot.value().version);
    return Result<void>();
}

std::optional<uint64_t> StateSynchronizer::persisted_version(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = persisted_versions_.find(user_id);
    if (it == persisted_versions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> StateSynchronizer::start() {
    if (!ledger_ || !store_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Synchronizer requires a ledger and a store", kComponent);
    }
    if (worker_.is_running()) {
        return Result<void>();
    }

    if (!registered_) {
        ComponentInfo info;
        info.type = ComponentType::STATE_SYNCHRONIZER;
        info.state = ComponentState::INITIALIZED;
        info.id = config_.component_id;
        info.last_update = std::chrono::system_clock::now();
        auto registered = StateManager::instance().register_component(info);
        if (registered.is_error()) {
            return registered;
        }
        registered_ = true;
    }

    if (event_bus_) {
        TradeSubscriberInfo subscriber;
        subscriber.id = subscriber_id();
        subscriber.event_types = {TradeEventType::POSITION_CLOSED};
        subscriber.callback = [this](const TradeEvent& event) {
            DEBUG("Position closed for " << event.user_id << ", waking the flush");
            worker_.trigger();
        };
        auto subscribed = event_bus_->subscribe(subscriber);
        if (subscribed.is_error()) {
            return subscribed;
        }
    }

    auto running = StateManager::instance().update_state(config_.component_id,
                                                         ComponentState::RUNNING);
    if (running.is_error()) {
        return running;
    }

    worker_.start(config_.persist_interval, [this] { persist_dirty(); });
    INFO("State synchronizer started with interval " << config_.persist_interval.count()
                                                     << "s");
    return Result<void>();
}

void StateSynchronizer::stop() {
    if (!worker_.is_running()) {
        return;
    }

    // Returns only once no close callback is still running
    if (event_bus_) {
        auto unsubscribed = event_bus_->unsubscribe(subscriber_id());
        if (unsubscribed.is_error()) {
            WARN("Failed to unsubscribe synchronizer: " << unsubscribed.error()->what());
        }
    }
    worker_.stop();

    const size_t failures = persist_dirty();
    if (failures > 0) {
        ERROR(failures << " portfolios could not be flushed on shutdown");
    }

    if (registered_) {
        auto stopped = StateManager::instance().update_state(config_.component_id,
                                                             ComponentState::STOPPED);
        if (stopped.is_error()) {
            WARN("Failed to mark synchronizer stopped: " << stopped.error()->what());
        }
        auto removed = StateManager::instance().unregister_component(config_.component_id);
        if (removed.is_error()) {
            WARN("Failed to unregister synchronizer: " << removed.error()->what());
        }
        registered_ = false;
    }
    INFO("State synchronizer stopped");
}

}  // namespace paper_ngin
