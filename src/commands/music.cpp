#include "aurora/commands/music.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <sstream>

namespace aurora::music {

namespace {

const char* const command_names[] = {
    "join", "summon", "play", "pause", "resume", "stop", "skip", "volume", "playing", "queue"
};

std::optional<dpp::snowflake> caller_voice_channel(const dpp::slashcommand_t& ev)
{
    dpp::guild* g = dpp::find_guild(ev.command.guild_id);
    if (g == nullptr) {
        return std::nullopt;
    }
    auto it = g->voice_members.find(ev.command.get_issuing_user().id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        return std::nullopt;
    }
    return it->second.channel_id;
}

std::string describe_transport_error(const voice::transport_error& e)
{
    switch (e.kind()) {
        case voice::transport_failure::already_connected_elsewhere:
            return "Already in a voice channel in this server.";
        case voice::transport_failure::not_a_voice_destination:
            return "That is not a voice channel.";
        case voice::transport_failure::not_connected:
            return "I'm not in a voice channel.";
        case voice::transport_failure::connect_failed:
            break;
    }
    return std::string("Could not join voice: ") + e.what();
}

/// Connect to the caller's channel unless already connected.
bool ensure_summoned(const dpp::slashcommand_t& ev, playback::jukebox& box, bool move_if_connected)
{
    const dpp::snowflake guild_id = ev.command.guild_id;
    if (!move_if_connected && box.is_connected(guild_id)) {
        return true;
    }

    auto channel = caller_voice_channel(ev);
    if (!channel.has_value()) {
        ev.edit_original_response(dpp::message("You are not in a voice channel."));
        return false;
    }

    try {
        box.summon(guild_id, *channel);
    } catch (const voice::transport_error& e) {
        ev.edit_original_response(dpp::message(describe_transport_error(e)));
        return false;
    }
    return true;
}

void cmd_join(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    ev.thinking();

    std::optional<dpp::snowflake> channel;
    auto param = ev.get_parameter("channel");
    if (std::holds_alternative<dpp::snowflake>(param)) {
        channel = std::get<dpp::snowflake>(param);
    } else {
        channel = caller_voice_channel(ev);
    }

    if (!channel.has_value()) {
        ev.edit_original_response(dpp::message("You are not in a voice channel."));
        return;
    }

    try {
        box.join(ev.command.guild_id, *channel);
    } catch (const voice::transport_error& e) {
        ev.edit_original_response(dpp::message(describe_transport_error(e)));
        return;
    }
    ev.edit_original_response(dpp::message("Ready to play audio in <#" + channel->str() + ">"));
}

void cmd_summon(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    ev.thinking();
    if (ensure_summoned(ev, box, /*move_if_connected=*/true)) {
        ev.edit_original_response(dpp::message("On my way."));
    }
}

void cmd_play(const dpp::slashcommand_t& ev, playback::jukebox& box, playback::source_resolver& resolver)
{
    ev.thinking();

    const std::string song = std::get<std::string>(ev.get_parameter("song"));

    if (!ensure_summoned(ev, box, /*move_if_connected=*/false)) {
        return;
    }

    std::unique_ptr<playback::playback_handle> source;
    try {
        source = resolver.resolve(ev.command.guild_id, song);
    } catch (const playback::resolution_error& e) {
        ev.edit_original_response(dpp::message(
            std::string("An error occurred while processing this request: ") + e.what()));
        return;
    }

    playback::entry_info info;
    info.title            = source->title();
    info.author           = source->author();
    info.duration_seconds = source->duration_seconds();

    const bool queued = box.enqueue(ev.command.guild_id,
                                    ev.command.get_issuing_user().id,
                                    ev.command.channel_id,
                                    std::move(source));

    if (!queued) {
        ev.edit_original_response(dpp::message(
            "Playback was stopped, " + playback::describe(info) + " was not queued."));
        return;
    }
    ev.edit_original_response(dpp::message("Enqueued " + playback::describe(info)));
}

void cmd_pause(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    ev.reply(box.pause(ev.command.guild_id) ? "Paused." : "Nothing is playing.");
}

void cmd_resume(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    ev.reply(box.resume(ev.command.guild_id) ? "Resumed." : "Nothing is paused.");
}

void cmd_stop(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    ev.thinking();
    box.stop(ev.command.guild_id);
    ev.edit_original_response(dpp::message("Stopped and left the voice channel."));
}

void cmd_skip(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    const auto out = box.vote_skip(ev.command.guild_id, ev.command.get_issuing_user().id);
    ev.reply(describe_vote(out, box.skip_quorum()));
}

void cmd_volume(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    const long int value = std::get<long int>(ev.get_parameter("value"));
    if (value < 0 || value > 200) {
        ev.reply("Volume must be between 0 and 200.");
        return;
    }
    if (box.set_volume(ev.command.guild_id, static_cast<int>(value))) {
        ev.reply("Set the volume to " + std::to_string(value) + "%");
    } else {
        ev.reply("Nothing is playing; the volume will apply to the next song.");
    }
}

void cmd_playing(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    const auto st = box.status(ev.command.guild_id);
    if (!st.current.has_value()) {
        ev.reply("Not playing any music right now.");
        return;
    }

    std::ostringstream oss;
    oss << (st.state == playback::playback_state::paused ? "Paused: " : "Now playing: ")
        << playback::describe(*st.current)
        << ", requested by <@" << st.current->requester << ">"
        << " [skips: " << st.votes << "/" << box.skip_quorum() << "]";
    ev.reply(oss.str());
}

void cmd_queue(const dpp::slashcommand_t& ev, playback::jukebox& box)
{
    constexpr std::size_t max_listed = 10;

    const auto upcoming = box.upcoming(ev.command.guild_id);
    if (upcoming.empty()) {
        ev.reply("The queue is empty.");
        return;
    }

    std::ostringstream oss;
    oss << "Up next:\n";
    for (std::size_t i = 0; i < upcoming.size() && i < max_listed; ++i) {
        oss << (i + 1) << ". " << playback::describe(upcoming[i]) << "\n";
    }
    if (upcoming.size() > max_listed) {
        oss << "...and " << (upcoming.size() - max_listed) << " more";
    }
    ev.reply(oss.str());
}

} // namespace

std::string describe_vote(const playback::vote_outcome& out, std::size_t quorum)
{
    switch (out.kind) {
        case playback::vote_kind::forced:
            return "Requester requested skipping song...";
        case playback::vote_kind::quorum_reached:
            return "Skip vote passed, skipping song...";
        case playback::vote_kind::vote_recorded:
            return "Skip vote added, currently at [" + std::to_string(out.votes) + "/" +
                   std::to_string(quorum) + "]";
        case playback::vote_kind::already_voted:
            return "You have already voted to skip this song.";
        case playback::vote_kind::nothing_playing:
            break;
    }
    return "Not playing any music right now.";
}

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    dpp::slashcommand join("join", "Join a voice channel", bot.me.id);
    join.add_option(
        dpp::command_option(dpp::co_channel, "channel", "Voice channel to join (defaults to yours)", false)
            .add_channel_type(dpp::CHANNEL_VOICE)
    );

    dpp::slashcommand summon("summon", "Summon the bot into your voice channel", bot.me.id);

    dpp::slashcommand play("play", "Play a song or add it to the queue", bot.me.id);
    play.add_option(
        dpp::command_option(dpp::co_string, "song", "URL or search terms", true)
    );

    dpp::slashcommand pause("pause", "Pause the current song", bot.me.id);
    dpp::slashcommand resume("resume", "Resume the current song", bot.me.id);
    dpp::slashcommand stop("stop", "Stop playing, clear the queue and leave voice", bot.me.id);
    dpp::slashcommand skip("skip", "Vote to skip the current song (the requester skips at once)", bot.me.id);

    dpp::slashcommand volume("volume", "Set the playback volume", bot.me.id);
    volume.add_option(
        dpp::command_option(dpp::co_integer, "value", "Volume in percent, 0 to 200", true)
    );

    dpp::slashcommand playing("playing", "Show the current song", bot.me.id);
    dpp::slashcommand queue("queue", "Show the queued songs", bot.me.id);

    return { join, summon, play, pause, resume, stop, skip, volume, playing, queue };
}

bool route_slashcommand(const dpp::slashcommand_t& ev,
                        playback::jukebox& box,
                        playback::source_resolver& resolver)
{
    const std::string name = ev.command.get_command_name();

    if (std::find(std::begin(command_names), std::end(command_names), name) == std::end(command_names)) {
        return false;
    }
    if (ev.command.guild_id.empty()) {
        ev.reply("Music commands only work in a server.");
        return true;
    }

    if (name == "join") {
        cmd_join(ev, box);
    } else if (name == "summon") {
        cmd_summon(ev, box);
    } else if (name == "play") {
        cmd_play(ev, box, resolver);
    } else if (name == "pause") {
        cmd_pause(ev, box);
    } else if (name == "resume") {
        cmd_resume(ev, box);
    } else if (name == "stop") {
        cmd_stop(ev, box);
    } else if (name == "skip") {
        cmd_skip(ev, box);
    } else if (name == "volume") {
        cmd_volume(ev, box);
    } else if (name == "playing") {
        cmd_playing(ev, box);
    } else if (name == "queue") {
        cmd_queue(ev, box);
    }
    return true;
}

} // namespace aurora::music
