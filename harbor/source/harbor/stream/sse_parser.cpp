#include <harbor/stream/sse_parser.hpp>

namespace Harbor
{
    std::vector<SseEvent> SseParser::feed(std::string_view chunk)
    {
        std::vector<SseEvent> completed;
        for (char c : chunk)
        {
            if (skipLineFeed_)
            {
                skipLineFeed_ = false;
                if (c == '\n')
                    continue;
            }

            if (c == '\r' || c == '\n')
            {
                skipLineFeed_ = c == '\r';
                processLine(buffer_, completed);
                buffer_.clear();
                continue;
            }
            buffer_.push_back(c);
        }
        return completed;
    }

    void SseParser::reset()
    {
        buffer_.clear();
        skipLineFeed_ = false;
        id_.reset();
        event_.reset();
        data_.reset();
    }

    void SseParser::processLine(std::string_view line, std::vector<SseEvent>& completed)
    {
        if (line.empty())
            return dispatch(completed);

        // comment, e.g. ": ping"
        if (line.front() == ':')
            return;

        std::string_view field = line;
        std::string_view value{};
        if (const auto colon = line.find(':'); colon != std::string_view::npos)
        {
            field = line.substr(0, colon);
            value = line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ')
                value.remove_prefix(1);
        }

        if (field == "data")
        {
            if (data_)
            {
                data_->push_back('\n');
                data_->append(value);
            }
            else
                data_ = std::string{value};
        }
        else if (field == "event")
            event_ = std::string{value};
        else if (field == "id")
        {
            if (value.find('\0') == std::string_view::npos)
                id_ = std::string{value};
        }
        // "retry" and unknown fields are ignored.
    }

    void SseParser::dispatch(std::vector<SseEvent>& completed)
    {
        if (data_ || event_)
        {
            SseEvent event{};
            event.id = id_;
            if (event_ && !event_->empty())
                event.event = *event_;
            event.data = data_.value_or(std::string{});
            completed.push_back(std::move(event));
        }
        id_.reset();
        event_.reset();
        data_.reset();
    }
}
