#include "aurora/playback/channel_state.hpp"

#include <algorithm>
#include <sstream>

namespace aurora::playback {

channel_state::channel_state(dpp::snowflake key,
                             channel_options opts,
                             notifier* events,
                             log_sink log)
    : m_key(key)
    , m_opts(opts)
    , m_events(events)
    , m_log(std::move(log))
    , m_volume(std::clamp(opts.default_volume, 0.0f, 2.0f))
{
    log_to(m_log, dpp::ll_debug, "Created playback state for " + m_key.str());
}

channel_state::~channel_state()
{
    stop();
}

void channel_state::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_loop.joinable() || m_stopping) {
        return;
    }
    m_loop = std::thread([this] { run(); });
}

bool channel_state::enqueue(std::unique_ptr<queue_entry> entry)
{
    if (!entry) {
        return false;
    }

    event_payload payload;
    payload.entry = entry->info();
    payload.actor = entry->requester();
    const dpp::snowflake channel_id = entry->channel();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            log_to(m_log, dpp::ll_warning,
                   "Enqueue on stopped playback state " + m_key.str() + ", entry dropped");
            return false;
        }
        m_queue.push_back(std::move(entry));
        payload.position = m_queue.size();
    }
    m_cv.notify_all();

    std::ostringstream oss;
    oss << "Queued '" << payload.entry->title << "' for " << m_key
        << " (position " << payload.position << ")";
    log_to(m_log, dpp::ll_info, oss.str());

    announce(channel_id, event_kind::enqueued, payload);
    return true;
}

bool channel_state::is_playing_locked() const
{
    return m_current && !m_completed && !m_current->source().is_finished();
}

bool channel_state::is_playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return is_playing_locked();
}

bool channel_state::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!is_playing_locked() || m_paused) {
        return false;
    }
    if (!m_started) {
        m_paused = true;
        return true;
    }
    try {
        m_current->source().pause();
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning, "Pause failed for " + m_key.str() + ": " + e.what());
        return false;
    }
    m_paused = true;
    return true;
}

bool channel_state::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!is_playing_locked() || !m_paused) {
        return false;
    }
    if (!m_started) {
        m_paused = false;
        return true;
    }
    try {
        m_current->source().resume();
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning, "Resume failed for " + m_key.str() + ": " + e.what());
        return false;
    }
    m_paused = false;
    return true;
}

void channel_state::force_skip()
{
    std::shared_ptr<queue_entry> current;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_skip_votes.clear();
        if (!is_playing_locked()) {
            return;
        }
        if (!m_started) {
            m_skip_requested = true;
            log_to(m_log, dpp::ll_debug, "Skip requested before start on " + m_key.str());
            return;
        }
        current    = m_current;
        generation = m_generation;
    }
    log_to(m_log, dpp::ll_debug, "Skipping current entry on " + m_key.str());
    stop_source(current, generation);
}

vote_outcome channel_state::vote_skip(dpp::snowflake voter)
{
    vote_outcome out;
    std::shared_ptr<queue_entry> to_stop;
    std::uint64_t generation = 0;
    event_payload payload;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const queue_entry* current = is_playing_locked() ? m_current.get() : nullptr;
        out = arbitrate_skip(voter, m_skip_votes, current, m_opts.skip_quorum);

        if (out.kind == vote_kind::vote_recorded) {
            m_skip_votes.insert(voter);
        } else if (out.skips()) {
            m_skip_votes.clear();
            if (m_started) {
                to_stop    = m_current;
                generation = m_generation;
            } else {
                m_skip_requested = true;
            }
        }

        if (current != nullptr) {
            payload.entry = current->info();
        }
        payload.actor  = voter;
        payload.votes  = out.votes;
        payload.quorum = m_opts.skip_quorum;
    }

    std::ostringstream oss;
    oss << "Skip vote by " << voter << " on " << m_key << ": " << to_string(out.kind)
        << " (" << out.votes << "/" << m_opts.skip_quorum << ")";
    log_to(m_log, dpp::ll_debug, oss.str());

    if (payload.entry.has_value()) {
        if (out.kind == vote_kind::vote_recorded) {
            announce(payload.entry->channel, event_kind::vote_recorded, payload);
        } else if (out.skips()) {
            announce(payload.entry->channel, event_kind::skipped, payload);
        }
    }

    if (to_stop) {
        stop_source(to_stop, generation);
    }
    return out;
}

bool channel_state::set_volume(int percent)
{
    const float v = std::clamp(static_cast<float>(percent) / 100.0f, 0.0f, 2.0f);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_volume = v;
    if (!is_playing_locked()) {
        return false;
    }
    if (!m_started) {
        return true; // picked up by the loop when it starts the source
    }
    try {
        m_current->source().set_volume(v);
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning, "Volume change failed for " + m_key.str() + ": " + e.what());
        return false;
    }
    return true;
}

float channel_state::volume() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_volume;
}

void channel_state::stop()
{
    std::optional<entry_info> interrupted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
        m_queue.clear();
        m_skip_votes.clear();
        if (m_current && !m_completed) {
            interrupted = m_current->info();
        }
    }
    m_cv.notify_all();

    // The loop stops whatever it started before it exits.
    if (m_loop.joinable()) {
        if (m_loop.get_id() == std::this_thread::get_id()) {
            m_loop.detach();
        } else {
            m_loop.join();
        }
    }

    std::unique_ptr<voice::transport_handle> transport;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transport = std::move(m_transport);
    }
    if (transport) {
        try {
            transport->disconnect();
        } catch (const std::exception& e) {
            log_to(m_log, dpp::ll_warning,
                   "Ignoring disconnect failure for " + m_key.str() + ": " + e.what());
        }
    }

    log_to(m_log, dpp::ll_info, "Playback stopped for " + m_key.str());

    if (interrupted.has_value()) {
        event_payload payload;
        payload.entry = interrupted;
        announce(interrupted->channel, event_kind::stopped, payload);
    }
}

status_snapshot channel_state::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    status_snapshot s;
    s.queued = m_queue.size();
    s.votes  = m_skip_votes.size();
    if (m_current && !m_completed) {
        s.state   = m_paused ? playback_state::paused : playback_state::playing;
        s.current = m_current->info();
        s.started = m_started;
    }
    return s;
}

std::vector<entry_info> channel_state::upcoming() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<entry_info> out;
    out.reserve(m_queue.size());
    for (const auto& e : m_queue) {
        out.push_back(e->info());
    }
    return out;
}

bool channel_state::has_transport() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transport != nullptr;
}

void channel_state::attach_transport(std::unique_ptr<voice::transport_handle>&& transport)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_transport) {
        throw voice::transport_error(voice::transport_failure::already_connected_elsewhere,
                                     "Already connected to a voice channel for " + m_key.str());
    }
    m_transport = std::move(transport);
}

void channel_state::move_transport(dpp::snowflake voice_channel_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_transport) {
        throw voice::transport_error(voice::transport_failure::not_connected,
                                     "Not connected to voice for " + m_key.str());
    }
    m_transport->move(voice_channel_id);
}

void channel_state::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
        if (m_stopping) {
            break;
        }

        m_current = std::shared_ptr<queue_entry>(std::move(m_queue.front()));
        m_queue.pop_front();
        m_skip_votes.clear();
        m_completed      = false;
        m_started        = false;
        m_skip_requested = false;
        m_paused         = false;
        const std::uint64_t generation = ++m_generation;
        auto entry = m_current;
        lock.unlock();

        event_payload payload;
        payload.entry = entry->info();
        payload.actor = entry->requester();
        announce(entry->channel(), event_kind::now_playing, payload);

        log_to(m_log, dpp::ll_info, "Now playing '" + payload.entry->title + "' on " + m_key.str());

        lock.lock();
        const float volume = m_volume;
        lock.unlock();

        bool started = true;
        try {
            entry->source().set_volume(volume);
            entry->source().start([this, generation] { on_complete(generation); });
        } catch (const std::exception& e) {
            started = false;
            log_to(m_log, dpp::ll_warning,
                   "Source failed to start on " + m_key.str() + ": " + e.what());
        }

        lock.lock();
        m_started = true;
        if (!started) {
            m_completed = true;
        } else if (!m_completed && !m_stopping) {
            if (m_skip_requested) {
                lock.unlock();
                stop_source(entry, generation);
                lock.lock();
            } else {
                apply_pending_locked(*entry, volume);
            }
        }
        m_cv.wait(lock, [this] { return m_stopping || m_completed; });

        if (!m_completed) {
            // Cancelled mid-play: the source must not outlive the loop running.
            lock.unlock();
            stop_source(entry, generation);
            lock.lock();
        }

        m_current.reset();
        m_skip_votes.clear();
        m_paused         = false;
        m_started        = false;
        m_skip_requested = false;
        log_to(m_log, dpp::ll_debug, "Entry finished on " + m_key.str());

        if (m_stopping) {
            break;
        }
    }
}

void channel_state::apply_pending_locked(queue_entry& entry, float started_volume)
{
    try {
        if (m_volume != started_volume) {
            entry.source().set_volume(m_volume);
        }
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning, "Volume change failed for " + m_key.str() + ": " + e.what());
    }
    if (!m_paused) {
        return;
    }
    try {
        entry.source().pause();
    } catch (const std::exception& e) {
        m_paused = false;
        log_to(m_log, dpp::ll_warning, "Pause failed for " + m_key.str() + ": " + e.what());
    }
}

void channel_state::on_complete(std::uint64_t generation)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || m_completed) {
            return;
        }
        m_completed = true;
    }
    m_cv.notify_all();
}

void channel_state::stop_source(const std::shared_ptr<queue_entry>& entry, std::uint64_t generation)
{
    try {
        entry->source().stop();
    } catch (const std::exception& e) {
        // A source that cannot be stopped is treated as done.
        log_to(m_log, dpp::ll_warning,
               "Source stop failed on " + m_key.str() + ": " + e.what());
        on_complete(generation);
    }
}

void channel_state::announce(dpp::snowflake channel_id, event_kind kind, const event_payload& payload)
{
    if (m_events == nullptr) {
        return;
    }
    try {
        m_events->notify(channel_id, kind, payload);
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning,
               "Notifier failed for " + channel_id.str() + ": " + e.what());
    }
}

const char* to_string(playback_state state)
{
    switch (state) {
        case playback_state::idle:    return "idle";
        case playback_state::playing: return "playing";
        case playback_state::paused:  return "paused";
    }
    return "unknown";
}

} // namespace aurora::playback
