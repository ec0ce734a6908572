#include <dpp/dpp.h>                // D++

#include <chrono>                   // watcher interval
#include <cstdlib>                  // EXIT_FAILURE
#include <iostream>                 // std::cerr
#include <unordered_set>            // Dev Team member IDs

#include "aurora/config.hpp"                    // Token, Lavalink, music settings
#include "aurora/lavalink/client.hpp"           // Lavalink connection
#include "aurora/lavalink/track_source.hpp"     // Lavalink-backed sources
#include "aurora/voice/discord_transport.hpp"   // Voice joins
#include "aurora/playback/jukebox.hpp"          // Per-guild playback
#include "aurora/commands/discord_notifier.hpp" // "Now playing" announcements
#include "aurora/commands/music.hpp"            // Music slash commands

int main(int argc, char** argv) {
    aurora::bot_config cfg;
    try {
        cfg = aurora::load_config(argc > 1 ? argv[1] : "aurora.json");
    } catch (const aurora::config_error& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (cfg.token.empty()) {
        std::cerr << "No bot token: set AURORA_TOKEN or \"token\" in the config file" << std::endl;
        return EXIT_FAILURE;
    }

    dpp::cluster bot(cfg.token, dpp::i_default_intents);
    bot.on_log(dpp::utility::cout_logger()); // D++ logger

    std::unordered_set<dpp::snowflake> dev_team;

    // ---------- Lavalink node ----------
    aurora::lavalink::node lavalink(bot, cfg.lavalink);
    aurora::lavalink::track_resolver resolver(lavalink, cfg.search_prefix);

    // ---------- Playback ----------
    aurora::voice::discord_transport transport(bot);
    aurora::commands::discord_notifier notifier(bot);

    aurora::playback::channel_options opts;
    opts.skip_quorum    = cfg.skip_quorum;
    opts.default_volume = cfg.default_volume;

    aurora::playback::jukebox box(
        transport, opts, &notifier,
        [&bot](dpp::loglevel level, const std::string& msg) { bot.log(level, msg); });

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&](const dpp::voice_state_update_t& ev) {
        lavalink.handle_voice_state_update(ev);
    });

    bot.on_voice_server_update([&](const dpp::voice_server_update_t& ev) {
        lavalink.handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&bot, &dev_team, &box, &resolver](const dpp::slashcommand_t& event) {
        if (aurora::music::route_slashcommand(event, box, resolver)) {
            return;
        }

        // ---------- /shutdown ----------
        if (event.command.get_command_name() == "shutdown") {
            if (dev_team.find(event.command.get_issuing_user().id) == dev_team.end()) {
                event.reply(dpp::message("You are not allowed to shut me down.").set_flags(dpp::m_ephemeral));
                return;
            }

            bot.log(dpp::ll_info, "Shutdown requested by " + event.command.get_issuing_user().id.str());
            event.reply("Shutting down...");

            bot.start_timer([&bot, &box](dpp::timer t) {
                bot.stop_timer(t);
                box.unload();
                bot.shutdown();
            }, 3);
        }
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &dev_team, &lavalink, &cfg](const dpp::ready_t& event) {
        (void)event;

        bot.log(dpp::ll_info, "Logged in as " + bot.me.username);

        // Load Dev Team members (allowed to /shutdown)
        bot.current_application_get([&bot, &dev_team](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error()) {
                bot.log(dpp::ll_warning, "Failed to fetch app info (shutdown unavailable)");
                return;
            }

            auto app = std::get<dpp::application>(cc.value);
            for (auto& member : app.team.members) {
                dev_team.insert(member.member_user.id);
            }
            if (!app.owner.id.empty()) {
                dev_team.insert(app.owner.id);
            }
            bot.log(dpp::ll_info, "Loaded " + std::to_string(dev_team.size()) + " Dev Team member(s)");
        });

        if (dpp::run_once<struct start_lavalink_watcher>()) {
            lavalink.start_watcher(std::chrono::milliseconds(cfg.watch_interval_ms));
        }

        // Slash commands
        if (dpp::run_once<struct register_bot_commands>()) {
            std::vector<dpp::slashcommand> all_cmds{
                dpp::slashcommand("shutdown", "Stop all playback and turn the bot off", bot.me.id)
            };

            auto music_cmds = aurora::music::make_commands(bot);
            all_cmds.insert(all_cmds.end(), music_cmds.begin(), music_cmds.end());

            bot.global_bulk_command_create(all_cmds);
            bot.log(dpp::ll_info, "Registered " + std::to_string(all_cmds.size()) + " slash commands");
        }
    });

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);

    box.unload();
    lavalink.stop_watcher();
    return 0;
}
