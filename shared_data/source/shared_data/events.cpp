#include <shared_data/events.hpp>

namespace SharedData
{
    std::string_view eventName(Event const& event)
    {
        return std::visit(
            [](auto const& alternative) {
                return std::decay_t<decltype(alternative)>::eventName;
            },
            event);
    }

    void to_json(nlohmann::json& j, Event const& event)
    {
        nlohmann::json data;
        std::visit(
            [&data](auto const& alternative) {
                to_json(data, alternative);
            },
            event);
        j = nlohmann::json{
            {"event", std::string{eventName(event)}},
            {"data", std::move(data)},
        };
    }
}
