// include/paper_ngin/core/state_manager.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    PORTFOLIO_LEDGER,
    TRADE_EXECUTOR,
    POSITION_MONITOR,
    STATE_SYNCHRONIZER,
    PRICE_ORACLE,
    DATABASE
};

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type{ComponentType::PORTFOLIO_LEDGER};
    ComponentState state{ComponentState::INITIALIZED};
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Registry of long-running engine components and their lifecycle state
 *
 * Allowed transitions:
 *   INITIALIZED -> RUNNING | ERR_STATE
 *   RUNNING     -> PAUSED | STOPPED | ERR_STATE
 *   PAUSED      -> RUNNING | STOPPED | ERR_STATE
 *   ERR_STATE   -> INITIALIZED | STOPPED
 *   STOPPED     -> INITIALIZED
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    /**
     * @brief True when at least one component is registered and none is failed, paused or stopped
     */
    bool is_healthy() const;

    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    static bool is_valid_transition(ComponentState current, ComponentState next);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace paper_ngin
