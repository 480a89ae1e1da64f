#include <backend/event_hub.hpp>
#include <log/log.hpp>

#include <vector>

EventHub::SubscriptionId EventHub::subscribe(Handler handler)
{
    std::scoped_lock lock{guard_};
    const auto id = nextId_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

bool EventHub::unsubscribe(SubscriptionId id)
{
    std::scoped_lock lock{guard_};
    return handlers_.erase(id) > 0;
}

void EventHub::publish(SharedData::Event const& event) const
{
    std::vector<Handler> handlers;
    {
        std::scoped_lock lock{guard_};
        handlers.reserve(handlers_.size());
        for (auto const& [id, handler] : handlers_)
            handlers.push_back(handler);
    }

    for (auto const& handler : handlers)
    {
        try
        {
            handler(event);
        }
        catch (std::exception const& e)
        {
            Log::error("EventHub: Handler for '{}' threw: {}", SharedData::eventName(event), e.what());
        }
        catch (...)
        {
            Log::error("EventHub: Handler for '{}' threw an unknown error.", SharedData::eventName(event));
        }
    }
}

void EventHub::message(std::string text, std::chrono::milliseconds duration, SharedData::MessageLevel level) const
{
    publish(SharedData::StatusMessage{.text = std::move(text), .duration = duration, .level = level});
}

std::size_t EventHub::subscriberCount() const
{
    std::scoped_lock lock{guard_};
    return handlers_.size();
}
