#include "aurora/playback/registry.hpp"

namespace aurora::playback {

registry::registry(channel_options opts, notifier* events, log_sink log)
    : m_opts(opts)
    , m_events(events)
    , m_log(std::move(log))
{
}

std::shared_ptr<channel_state> registry::make_state(dpp::snowflake key) const
{
    return std::make_shared<channel_state>(key, m_opts, m_events, m_log);
}

std::shared_ptr<channel_state> registry::get_or_create(dpp::snowflake key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(key);
    if (it != m_states.end()) {
        return it->second;
    }

    auto state = make_state(key);
    state->start();
    m_states.emplace(key, state);
    return state;
}

std::shared_ptr<channel_state> registry::create_with(dpp::snowflake key,
                                                     std::unique_ptr<voice::transport_handle>&& transport)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(key);
    if (it != m_states.end()) {
        it->second->attach_transport(std::move(transport));
        return it->second;
    }

    auto state = make_state(key);
    state->attach_transport(std::move(transport));
    state->start();
    m_states.emplace(key, state);
    return state;
}

std::shared_ptr<channel_state> registry::find(dpp::snowflake key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(key);
    return it == m_states.end() ? nullptr : it->second;
}

std::shared_ptr<channel_state> registry::remove(dpp::snowflake key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(key);
    if (it == m_states.end()) {
        return nullptr;
    }
    auto state = std::move(it->second);
    m_states.erase(it);
    return state;
}

std::vector<std::shared_ptr<channel_state>> registry::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<channel_state>> out;
    out.reserve(m_states.size());
    for (auto& [key, state] : m_states) {
        out.push_back(std::move(state));
    }
    m_states.clear();
    return out;
}

std::size_t registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_states.size();
}

} // namespace aurora::playback
