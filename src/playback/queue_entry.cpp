#include "aurora/playback/queue_entry.hpp"

#include <sstream>
#include <stdexcept>

namespace aurora::playback {

queue_entry::queue_entry(dpp::snowflake requester,
                         dpp::snowflake channel,
                         std::unique_ptr<playback_handle> source)
    : m_requester(requester)
    , m_channel(channel)
    , m_source(std::move(source))
{
    if (!m_source) {
        throw std::invalid_argument("queue_entry needs a source");
    }
}

entry_info queue_entry::info() const
{
    entry_info i;
    i.title            = m_source->title();
    i.author           = m_source->author();
    i.requester        = m_requester;
    i.channel          = m_channel;
    i.duration_seconds = m_source->duration_seconds();
    return i;
}

std::string describe(const entry_info& info)
{
    std::ostringstream oss;
    oss << (info.title.empty() ? "Untitled" : info.title);
    if (!info.author.empty()) {
        oss << " by " << info.author;
    }
    if (info.duration_seconds.has_value() && *info.duration_seconds > 0) {
        oss << " [length: " << (*info.duration_seconds / 60) << "m "
            << (*info.duration_seconds % 60) << "s]";
    }
    return oss.str();
}

} // namespace aurora::playback
