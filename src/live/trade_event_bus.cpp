// src/live/trade_event_bus.cpp
#include "paper_ngin/live/trade_event_bus.hpp"

#include <algorithm>
#include <utility>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

std::string trade_event_type_to_string(TradeEventType type) {
    switch (type) {
        case TradeEventType::POSITION_OPENED:
            return "POSITION_OPENED";
        case TradeEventType::POSITION_CLOSED:
            return "POSITION_CLOSED";
        default:
            return "UNKNOWN";
    }
}

Result<void> TradeEventBus::subscribe(const TradeSubscriberInfo& subscriber_info) {
    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "TradeEventBus");
    }
    if (subscriber_info.event_types.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Must subscribe to at least one event type", "TradeEventBus");
    }
    if (!subscriber_info.callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "TradeEventBus");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sub = std::make_shared<Subscription>();
        sub->event_types = subscriber_info.event_types;
        sub->user_ids = subscriber_info.user_ids;
        sub->callback = subscriber_info.callback;
        subscriptions_[subscriber_info.id] = std::move(sub);
    }

    DEBUG("Added trade event subscription " << subscriber_info.id << " for "
                                            << subscriber_info.event_types.size()
                                            << " event types");
    return Result<void>();
}

Result<void> TradeEventBus::unsubscribe(const std::string& subscriber_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(subscriber_id);
    if (it == subscriptions_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "TradeEventBus");
    }
    std::shared_ptr<Subscription> sub = it->second;
    subscriptions_.erase(it);

    const auto self = std::this_thread::get_id();
    dispatch_done_.wait(lock, [&sub, self] {
        return std::all_of(sub->dispatching.begin(), sub->dispatching.end(),
                           [self](const std::thread::id& id) { return id == self; });
    });
    return Result<void>();
}

void TradeEventBus::publish(const TradeEvent& event) {
    std::vector<std::pair<std::string, std::shared_ptr<Subscription>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto self = std::this_thread::get_id();
        for (const auto& [id, sub] : subscriptions_) {
            if (should_notify(*sub, event)) {
                sub->dispatching.push_back(self);
                targets.emplace_back(id, sub);
            }
        }
    }

    for (const auto& [id, sub] : targets) {
        try {
            sub->callback(event);
        } catch (const std::exception& e) {
            ERROR("Subscriber " << id << " failed on " << trade_event_type_to_string(event.type)
                                << " for " << event.user_id << ": " << e.what());
        }
        finish_dispatch(*sub);
    }
}

void TradeEventBus::finish_dispatch(Subscription& sub) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(sub.dispatching.begin(), sub.dispatching.end(),
                            std::this_thread::get_id());
        if (it != sub.dispatching.end()) {
            sub.dispatching.erase(it);
        }
    }
    dispatch_done_.notify_all();
}

size_t TradeEventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

bool TradeEventBus::should_notify(const Subscription& sub, const TradeEvent& event) {
    if (std::find(sub.event_types.begin(), sub.event_types.end(), event.type) ==
        sub.event_types.end()) {
        return false;
    }
    if (sub.user_ids.empty()) {
        return true;
    }
    return std::find(sub.user_ids.begin(), sub.user_ids.end(), event.user_id) !=
           sub.user_ids.end();
}

}  // namespace paper_ngin
