#include <harbor/stream/stream_event.hpp>

namespace Harbor
{
    StreamEvent toStreamEvent(SseEvent const& event)
    {
        StreamEvent result{.name = event.event, .payload = {}, .id = event.id};
        if (event.data.empty())
            return result;

        result.payload = nlohmann::json::parse(event.data, nullptr, false);
        if (result.payload.is_discarded())
            result.payload = event.data;
        return result;
    }

    std::optional<std::string> eventIdentity(StreamEvent const& event)
    {
        if (event.id && !event.id->empty())
            return event.id;

        if (event.name == StreamEvents::replay && event.payload.is_object())
        {
            auto message = event.payload.find("message");
            if (message != event.payload.end() && message->is_object())
            {
                auto id = message->find("id");
                if (id != message->end() && id->is_string())
                    return "replay:" + id->get<std::string>();
            }
        }
        return std::nullopt;
    }

    bool isTerminalEvent(std::string const& name)
    {
        return name == StreamEvents::complete || name == StreamEvents::stopped || name == StreamEvents::error;
    }

    std::optional<bool> generationStateOf(StreamEvent const& event)
    {
        if (isTerminalEvent(event.name))
            return false;
        if (event.name == StreamEvents::chunk)
            return true;

        if ((event.name == StreamEvents::init || event.name == StreamEvents::status) && event.payload.is_object())
        {
            auto state = event.payload.find("sessionState");
            if (state == event.payload.end() || !state->is_string())
                return std::nullopt;
            return state->get<std::string>() == "running";
        }
        return std::nullopt;
    }
}
