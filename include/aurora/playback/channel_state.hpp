#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>
#include <vector>

#include <dpp/dpp.h>

#include "aurora/log.hpp"
#include "aurora/playback/notifier.hpp"
#include "aurora/playback/queue_entry.hpp"
#include "aurora/playback/skip_arbitrator.hpp"
#include "aurora/voice/transport.hpp"

namespace aurora::playback {

enum class playback_state {
    idle,
    playing,
    paused
};

struct status_snapshot {
    playback_state            state = playback_state::idle;
    std::optional<entry_info> current;
    std::size_t               queued = 0;
    std::size_t               votes  = 0;
    bool                      started = false; // current source has been told to play
};

struct channel_options {
    std::size_t skip_quorum    = default_skip_quorum;
    float       default_volume = 1.0f;
};

/// Playback session of one channel: FIFO queue, the current entry, the skip
/// votes against it and the scheduling loop that advances the queue.
///
/// Every mutation happens under m_mutex. Source calls that may complete the
/// entry synchronously (stop) are made with the lock released, because the
/// completion callback takes the lock itself.
class channel_state {
public:
    channel_state(dpp::snowflake key,
                  channel_options opts,
                  notifier* events = nullptr,
                  log_sink log = {});
    ~channel_state();

    channel_state(const channel_state&) = delete;
    channel_state& operator=(const channel_state&) = delete;

    /// Launches the scheduling loop. Called once, by the registry.
    void start();

    /// False if the state has been stopped; the entry is then dropped.
    bool enqueue(std::unique_ptr<queue_entry> entry);

    bool is_playing() const;

    bool pause();
    bool resume();

    void force_skip();
    vote_outcome vote_skip(dpp::snowflake voter);

    /// Percent of nominal volume, clamped to 0-200. Returns true if it was
    /// applied to a playing entry; it is remembered for later entries either way.
    bool set_volume(int percent);

    /// Terminates the loop (stopping any started source), drops the queue and
    /// disconnects the transport. Never throws; second call is a no-op.
    void stop();

    status_snapshot status() const;
    std::vector<entry_info> upcoming() const;

    dpp::snowflake key() const { return m_key; }
    std::size_t skip_quorum() const { return m_opts.skip_quorum; }
    float volume() const;

    bool has_transport() const;
    /// Takes ownership only on success; throws transport_error (and leaves
    /// `transport` untouched) if this state is already connected.
    void attach_transport(std::unique_ptr<voice::transport_handle>&& transport);
    void move_transport(dpp::snowflake voice_channel_id);

private:
    void run();
    void on_complete(std::uint64_t generation);
    void stop_source(const std::shared_ptr<queue_entry>& entry, std::uint64_t generation);
    void announce(dpp::snowflake channel_id, event_kind kind, const event_payload& payload);
    bool is_playing_locked() const;
    void apply_pending_locked(queue_entry& entry, float started_volume);

    const dpp::snowflake m_key;
    const channel_options m_opts;
    notifier*             m_events;
    log_sink              m_log;

    mutable std::mutex       m_mutex;
    std::condition_variable  m_cv;

    std::deque<std::unique_ptr<queue_entry>> m_queue;
    std::shared_ptr<queue_entry>             m_current;
    std::unordered_set<dpp::snowflake>       m_skip_votes;

    std::uint64_t m_generation = 0; // bumped on every start, stale completions are ignored
    bool          m_completed  = false;
    // Until the loop has started the current source, pause, volume and skip
    // requests are only recorded and applied once start() returns.
    bool          m_started        = false;
    bool          m_skip_requested = false;
    bool          m_paused     = false;
    bool          m_stopping   = false;
    float         m_volume;

    std::unique_ptr<voice::transport_handle> m_transport;
    std::thread                              m_loop;
};

const char* to_string(playback_state state);

} // namespace aurora::playback
