/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe bus for execution lifecycle events
 */

#ifndef DAGFLOW_EVENT_BUS_HPP
#define DAGFLOW_EVENT_BUS_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace dagflow {

class Logger;

/**
 * @brief Lifecycle event names and their payload keys
 *
 * - STARTED:   {workflowId, executionId, triggeredBy}
 * - COMPLETED: {workflowId, executionId, result}
 * - FAILED:    {workflowId, executionId, error}
 */
namespace LifecycleEvent {
    constexpr const char* STARTED = "execution:started";
    constexpr const char* COMPLETED = "execution:completed";
    constexpr const char* FAILED = "execution:failed";
}

/**
 * @brief Delivers events to listeners on the emitting thread
 *
 * Listeners run in subscription order. A listener that throws is logged and
 * skipped; the remaining listeners still run and emit() never throws because
 * of a listener.
 *
 * Usage Example:
 *   @code
 *   EventBus bus;
 *   auto id = bus.subscribe(LifecycleEvent::COMPLETED, [](const std::string&, const nlohmann::json& payload) {
 *       std::cout << payload["executionId"] << std::endl;
 *   });
 *   ...
 *   bus.unsubscribe(id);
 *   @endcode
 */
class EventBus {
public:
    using Listener = std::function<void(const std::string& event, const nlohmann::json& payload)>;
    using SubscriptionId = uint64_t;

    /**
     * @param logger Logger for listener failures (defaults to the singleton)
     */
    explicit EventBus(Logger* logger = nullptr);

    /**
     * @brief Subscribe to one event name, or to every event with "*"
     *
     * @return Id to pass to unsubscribe()
     */
    SubscriptionId subscribe(const std::string& event, Listener listener);

    /**
     * @return true if the subscription existed
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Deliver an event to its listeners
     *
     * @return Number of listeners that ran without throwing
     */
    size_t emit(const std::string& event, const nlohmann::json& payload);

    size_t listener_count() const;

private:
    struct Subscription {
        std::string event;
        Listener listener;
    };

    Logger* logger_;
    mutable std::mutex mutex_;
    SubscriptionId next_id_;
    std::map<SubscriptionId, Subscription> subscriptions_;
};

} // namespace dagflow

#endif // DAGFLOW_EVENT_BUS_HPP
