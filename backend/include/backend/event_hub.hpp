#pragma once

#include <shared_data/events.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <variant>

/**
 * @brief Fans typed events out to registered observers.
 *
 * Handlers are called on the publishing thread, outside of the registry lock. A handler may therefore subscribe,
 * unsubscribe or publish itself.
 */
class EventHub
{
  public:
    using Handler = std::function<void(SharedData::Event const&)>;
    using SubscriptionId = int;

    EventHub() = default;
    EventHub(EventHub const&) = delete;
    EventHub& operator=(EventHub const&) = delete;
    EventHub(EventHub&&) = delete;
    EventHub& operator=(EventHub&&) = delete;

    SubscriptionId subscribe(Handler handler);

    /**
     * @brief Subscribes to one event type only.
     */
    template <typename EventT, typename FunctionT>
    SubscriptionId on(FunctionT&& handler)
    {
        return subscribe([handler = std::forward<FunctionT>(handler)](SharedData::Event const& event) {
            if (auto const* typed = std::get_if<EventT>(&event); typed != nullptr)
                handler(*typed);
        });
    }

    bool unsubscribe(SubscriptionId id);

    void publish(SharedData::Event const& event) const;

    /// Shorthand for publishing a StatusMessage.
    void message(
        std::string text,
        std::chrono::milliseconds duration,
        SharedData::MessageLevel level = SharedData::MessageLevel::Info) const;

    std::size_t subscriberCount() const;

  private:
    mutable std::mutex guard_{};
    std::map<SubscriptionId, Handler> handlers_{};
    SubscriptionId nextId_{0};
};
