#include "event_bus.hpp"
#include "logger.hpp"
#include <vector>

namespace dagflow {

EventBus::EventBus(Logger* logger)
    : logger_(logger ? logger : &Logger::get_instance()), next_id_(1) {}

EventBus::SubscriptionId EventBus::subscribe(const std::string& event, Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_[id] = Subscription{event, std::move(listener)};
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

size_t EventBus::emit(const std::string& event, const nlohmann::json& payload) {
    // Snapshot so listeners may (un)subscribe while being notified
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.event == event || subscription.event == "*") {
                listeners.push_back(subscription.listener);
            }
        }
    }

    size_t delivered = 0;
    for (const auto& listener : listeners) {
        try {
            listener(event, payload);
            ++delivered;
        } catch (const std::exception& e) {
            LogContext ctx;
            if (payload.is_object()) {
                ctx.workflow_id = payload.value("workflowId", "");
                ctx.execution_id = payload.value("executionId", "");
            }
            logger_->log_warning(ctx, "Listener for " + event + " threw: " + e.what());
        }
    }
    return delivered;
}

size_t EventBus::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace dagflow
