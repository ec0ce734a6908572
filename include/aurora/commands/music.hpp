#pragma once

#include <dpp/dpp.h>
#include <string>
#include <vector>

#include "aurora/playback/jukebox.hpp"
#include "aurora/playback/source_resolver.hpp"

namespace aurora::music {

/// Build the music slash commands (/join, /summon, /play, /pause, /resume,
/// /stop, /skip, /volume, /playing, /queue).
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Dispatch a music slash command to the correct handler. Returns false if
/// the command is not a music command.
bool route_slashcommand(const dpp::slashcommand_t& ev,
                        playback::jukebox& box,
                        playback::source_resolver& resolver);

/// Reply text for a skip vote.
std::string describe_vote(const playback::vote_outcome& out, std::size_t quorum);

} // namespace aurora::music
