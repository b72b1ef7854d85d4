// include/paper_ngin/live/trade_event_bus.hpp
#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/portfolio/portfolio_types.hpp"

namespace paper_ngin {

enum class TradeEventType { POSITION_OPENED, POSITION_CLOSED };

std::string trade_event_type_to_string(TradeEventType type);

/**
 * @brief Notification emitted when a position opens or closes
 * The close fields are only meaningful for POSITION_CLOSED.
 */
struct TradeEvent {
    TradeEventType type{TradeEventType::POSITION_OPENED};
    std::string user_id;
    Position position;
    Timestamp timestamp;
    double realized_roi_pct{0.0};
    double pnl_usd{0.0};
    ExitReason reason{ExitReason::NONE};
};

using TradeEventCallback = std::function<void(const TradeEvent&)>;

struct TradeSubscriberInfo {
    std::string id;
    std::vector<TradeEventType> event_types;
    std::vector<std::string> user_ids;  // Empty for every user
    TradeEventCallback callback;
};

/**
 * @brief Fan-out of trade events to subscribers
 *
 * Callbacks run on the publishing thread, outside the bus lock. An exception thrown by one
 * subscriber is logged and does not reach the publisher or other subscribers. Subscribers
 * must return quickly; slow work belongs on the subscriber's own thread.
 */
class TradeEventBus {
public:
    TradeEventBus() = default;
    TradeEventBus(const TradeEventBus&) = delete;
    TradeEventBus& operator=(const TradeEventBus&) = delete;

    /**
     * @brief Add or replace a subscription
     * @return INVALID_ARGUMENT for an empty id, no event types or a null callback
     */
    Result<void> subscribe(const TradeSubscriberInfo& subscriber_info);

    /**
     * @brief Remove a subscription and wait for its callbacks running on other threads
     *
     * Once this returns the callback is not running and will not be called again, so the
     * subscriber may be destroyed. Calling it from inside the subscriber's own callback
     * does not wait for that call.
     */
    Result<void> unsubscribe(const std::string& subscriber_id);

    void publish(const TradeEvent& event);

    size_t subscriber_count() const;

private:
    struct Subscription {
        std::vector<TradeEventType> event_types;
        std::vector<std::string> user_ids;
        TradeEventCallback callback;
        std::vector<std::thread::id> dispatching;  // Threads inside callback, under mutex_
    };

    static bool should_notify(const Subscription& sub, const TradeEvent& event);

    void finish_dispatch(Subscription& sub);

    std::unordered_map<std::string, std::shared_ptr<Subscription>> subscriptions_;
    mutable std::mutex mutex_;
    std::condition_variable dispatch_done_;
};

}  // namespace paper_ngin
