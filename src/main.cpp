#include <dpp/dpp.h>                // D++

#include <atomic>                   // std::atomic
#include <chrono>                   // Time
#include <csignal>                  // SIGINT, SIGTERM
#include <iostream>                 // std::cout, std::cerr
#include <memory>                   // std::unique_ptr
#include <thread>                   // std::this_thread

#include "ost/audio/source.hpp"             // Song -> frames, caches
#include "ost/cancel_token.hpp"             // Shutdown signal
#include "ost/commands/music.hpp"           // Slash commands
#include "ost/config.hpp"                   // Environment config
#include "ost/discord/messages.hpp"         // Now-playing embeds
#include "ost/discord/voice.hpp"            // D++ voice transport
#include "ost/fetch/ytdlp_fetcher.hpp"      // yt-dlp + ffmpeg + opus
#include "ost/guilds/presence_monitor.hpp"  // Empty channel watchdog
#include "ost/guilds/registry.hpp"          // Guild -> player
#include "ost/lavalink/client.hpp"          // Song lookup
#include "ost/metrics/metrics.hpp"          // Counters

namespace {

std::atomic<bool> g_stop_requested{false};

void on_signal(int)
{
    g_stop_requested = true;
}

} // namespace

int main() {
    std::vector<std::string> warnings;
    const ost::config cfg = ost::load_config_from_env(warnings);
    for (const auto& w : warnings) {
        std::cerr << "Config: " << w << std::endl;
    }
    if (cfg.discord_token.empty()) {
        return 1;
    }

    dpp::cluster bot(cfg.discord_token); // Default intents include voice states
    bot.on_log(dpp::utility::cout_logger()); // D++ logger

    ost::log_fn log = [&bot](dpp::loglevel level, const std::string& msg) { bot.log(level, msg); };

    // ---------- Engine ----------
    ost::metrics::counter_metrics metrics;
    ost::cancel_token shutdown;

    auto metadata_cache = ost::audio::make_metadata_cache(cfg.metadata_cache, &metrics, log);
    auto audio_cache    = ost::audio::make_frame_cache(cfg.audio_cache, &metrics, log);

    ost::fetch::ytdlp_fetcher fetcher(cfg.fetcher, log);
    ost::audio::audio_source source(fetcher, *metadata_cache, *audio_cache, log);
    ost::voice::frame_streamer streamer({}, log);

    ost::discord::dpp_voice_transport transport(bot);
    ost::discord::dpp_presence_query presence;
    ost::discord::dpp_notifier notifier(bot);

    std::unique_ptr<ost::player::playlist_store> store;
    if (cfg.playlist_store_dir.empty()) {
        store = std::make_unique<ost::player::memory_playlist_store>();
    } else {
        store = std::make_unique<ost::player::json_playlist_store>(cfg.playlist_store_dir, log);
    }

    ost::guilds::guild_registry registry(
        [&](dpp::snowflake guild_id) {
            return std::make_shared<ost::player::guild_player>(
                guild_id,
                ost::player::player_deps{source, transport, streamer, &notifier, store.get(), log});
        },
        log);

    ost::lavalink::search_client lookup(bot, cfg.lavalink);
    ost::music::interaction_storage interactions;
    ost::music::music_context music{registry, lookup, interactions, metrics};

    ost::guilds::presence_monitor monitor(
        registry, presence, shutdown,
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg.presence_interval), log);

    // ---------- Guild lifecycle ----------
    bot.on_guild_create([&registry](const dpp::guild_create_t& event) {
        if (event.created && !event.created->is_unavailable()) {
            registry.on_guild_join(event.created->id);
        }
    });

    bot.on_guild_delete([&registry](const dpp::guild_delete_t& event) {
        registry.on_guild_leave(event.deleted.id);
    });

    // ---------- Voice glue ----------
    bot.on_voice_ready([&transport](const dpp::voice_ready_t& event) {
        transport.handle_voice_ready(event);
    });

    // ---------- Commands ----------
    bot.on_slashcommand([&music](const dpp::slashcommand_t& event) {
        ost::music::route_slashcommand(event, music);
    });

    bot.on_select_click([&music](const dpp::select_click_t& event) {
        ost::music::route_select_click(event, music);
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &cfg, &monitor](const dpp::ready_t& event) {
        (void)event;

        std::cout << "Logged in as " << bot.me.username << "!" << std::endl;

        if (dpp::run_once<struct set_status>()) {
            bot.set_presence(dpp::presence(dpp::ps_online, dpp::at_listening, "/play"));
        }

        if (dpp::run_once<struct start_presence_monitor>()) {
            monitor.start();
        }

        if (dpp::run_once<struct register_bot_commands>()) {
            std::cout << "Registering slash commands..." << std::endl;
            ost::music::register_commands(bot, cfg.guild_id);
            std::cout << "Registered slash commands!" << std::endl;
        }
    });

    // ---------- Start bot ----------
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    bot.start(dpp::st_return);
    std::cout << "Bot is running. Press Ctrl-C to exit." << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down..." << std::endl;
    shutdown.cancel();
    registry.shutdown();
    bot.log(dpp::ll_info, "Final counters:\n" + metrics.summary());
    if (ost::music::registration_scope(cfg.guild_id) == ost::music::command_scope::guild &&
        ost::music::unregister_commands(bot, cfg.guild_id, std::chrono::seconds(5))) {
        std::cout << "Removed guild slash commands" << std::endl;
    }
    bot.shutdown();
    return 0;
}
