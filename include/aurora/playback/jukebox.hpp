#pragma once

#include <memory>
#include <vector>

#include <dpp/dpp.h>

#include "aurora/log.hpp"
#include "aurora/playback/channel_state.hpp"
#include "aurora/playback/registry.hpp"
#include "aurora/voice/transport.hpp"

namespace aurora::playback {

/// The operations a command surface needs, keyed by channel id (the guild in
/// the Discord bot). Owns the registry; borrows the transport provider and
/// the notifier.
class jukebox {
public:
    jukebox(voice::transport_provider& transports,
            channel_options opts,
            notifier* events = nullptr,
            log_sink log = {});
    ~jukebox();

    jukebox(const jukebox&) = delete;
    jukebox& operator=(const jukebox&) = delete;

    /// Connects `key` to a voice channel. Throws voice::transport_error; a
    /// failed first connect leaves no state behind.
    void join(dpp::snowflake key, dpp::snowflake voice_channel_id);

    /// Moves an existing connection, or connects if there is none.
    void summon(dpp::snowflake key, dpp::snowflake voice_channel_id);

    bool is_connected(dpp::snowflake key) const;

    /// False if the session was stopped while the entry was on its way in.
    bool enqueue(dpp::snowflake key,
                 dpp::snowflake requester,
                 dpp::snowflake text_channel,
                 std::unique_ptr<playback_handle> source);

    bool pause(dpp::snowflake key);
    bool resume(dpp::snowflake key);

    /// Returns true if there was a session to stop. Never throws.
    bool stop(dpp::snowflake key);

    vote_outcome vote_skip(dpp::snowflake key, dpp::snowflake requester);
    bool set_volume(dpp::snowflake key, int percent);

    status_snapshot status(dpp::snowflake key) const;
    std::vector<entry_info> upcoming(dpp::snowflake key) const;

    /// Stops every session; used on shutdown.
    void unload();

    std::size_t skip_quorum() const { return m_opts.skip_quorum; }
    std::size_t sessions() const { return m_registry.size(); }

private:
    voice::transport_provider& m_transports;
    const channel_options      m_opts;
    log_sink                   m_log;
    registry                   m_registry;

    void discard(std::unique_ptr<voice::transport_handle> transport);
};

} // namespace aurora::playback
