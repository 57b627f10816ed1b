#pragma once

#include <dpp/dpp.h>
#include <chrono>
#include <vector>

#include "ost/audio/lookup.hpp"
#include "ost/commands/interaction_storage.hpp"
#include "ost/guilds/registry.hpp"
#include "ost/metrics/metrics.hpp"

namespace ost::music {

struct music_context {
    guilds::guild_registry& registry;
    audio::song_lookup&     lookup;
    interaction_storage&    storage;
    metrics::metrics_sink&  metrics;
};

/// Custom id of the "add one song or the whole playlist" select menu.
constexpr const char* add_song_playlist_id = "add_song_playlist";

/// Build the music slash commands (/play, /skip, /stop, /list, /remove, /playing).
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

enum class command_scope { global, guild };

/// Commands are registered on a single guild when one is configured (they show
/// up at once and are removed again at exit), otherwise globally.
command_scope registration_scope(dpp::snowflake guild_id);

/// Register the music commands in the scope registration_scope() picks.
void register_commands(dpp::cluster& bot, dpp::snowflake guild_id);

/// Remove the commands register_commands() put on a guild, waiting up to
/// `timeout` for Discord to confirm. Global commands are left alone. False
/// when the request failed or timed out.
bool unregister_commands(dpp::cluster& bot, dpp::snowflake guild_id, std::chrono::milliseconds timeout);

/// Dispatch a music slash command to the correct handler.
void route_slashcommand(const dpp::slashcommand_t& ev, music_context& ctx);

/// Handle the add_song_playlist select menu.
void route_select_click(const dpp::select_click_t& ev, music_context& ctx);

} // namespace ost::music
