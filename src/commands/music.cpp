#include "ost/commands/music.hpp"

#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>

#include "ost/discord/messages.hpp"

namespace ost::music {

namespace {

const std::string not_in_voice = "You need to be in a voice channel to do that.";

std::optional<dpp::snowflake> user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return std::nullopt;
    }
    auto it = g->voice_members.find(user_id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        return std::nullopt;
    }
    return it->second.channel_id;
}

std::string member_name(const dpp::interaction& cmd)
{
    const std::string nick = cmd.member.get_nickname();
    if (!nick.empty()) {
        return nick;
    }
    const dpp::user& u = cmd.get_issuing_user();
    return u.global_name.empty() ? u.username : u.global_name;
}

dpp::message playlist_choice_message(const std::vector<audio::song>& songs)
{
    dpp::embed embed;
    embed.set_title("Found a playlist with " + std::to_string(songs.size()) + " songs")
         .set_description("Add only the first song, or the whole playlist?\n\n" +
                          discord::format_playlist(songs, 1500));

    dpp::message msg;
    msg.add_embed(embed);
    msg.add_component(
        dpp::component().add_component(
            dpp::component()
                .set_type(dpp::cot_selectmenu)
                .set_placeholder("Choose what to add")
                .set_id(add_song_playlist_id)
                .add_select_option(dpp::select_option("Add song", "song", "Only " + songs.front().title))
                .add_select_option(dpp::select_option("Add whole playlist", "playlist",
                                                      std::to_string(songs.size()) + " songs"))
        )
    );
    return msg;
}

// ---------- /play ----------
void handle_play(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const dpp::snowflake guild_id = ev.command.guild_id;
    const dpp::snowflake text_channel = ev.command.channel_id;

    auto voice_channel = user_voice_channel(guild_id, ev.command.get_issuing_user().id);
    if (!voice_channel) {
        ev.reply(dpp::message(not_in_voice).set_flags(dpp::m_ephemeral));
        return;
    }

    const std::string input = std::get<std::string>(ev.get_parameter("input"));
    const std::string requester = member_name(ev.command);

    ev.thinking();

    // Lookup and voice connect both block; keep them off the event thread.
    std::thread([ev, &ctx, guild_id, text_channel, channel = *voice_channel, input, requester]() {
        audio::lookup_result found = ctx.lookup.lookup_songs(input);
        if (!found.ok()) {
            ev.edit_original_response(dpp::message("Could not find anything for **" + input + "**."));
            return;
        }

        for (auto& s : found.songs) {
            s.requested_by = requester;
        }

        if (found.songs.size() > 1) {
            ctx.storage.save_song_list(text_channel, found.songs);
            ev.edit_original_response(playlist_choice_message(found.songs));
            return;
        }

        const audio::song s = found.songs.front();
        auto player = ctx.registry.get_or_create(guild_id);
        player::add_result added = player->add_song(text_channel, channel, s);
        if (!added.ok()) {
            ev.edit_original_response(dpp::message("Failed to add **" + s.title + "**: " + added.error_message));
            return;
        }

        dpp::message msg;
        msg.add_embed(discord::make_song_embed("Added to queue", s));
        ev.edit_original_response(msg);
    }).detach();
}

// ---------- /skip ----------
void handle_skip(const dpp::slashcommand_t& ev, music_context& ctx)
{
    auto player = ctx.registry.get_or_create(ev.command.guild_id);
    if (!player->get_played_song()) {
        ev.reply("Nothing is playing.");
        return;
    }
    player->skip_song();
    ev.reply("⏭️ Song skipped");
}

// ---------- /stop ----------
void handle_stop(const dpp::slashcommand_t& ev, music_context& ctx)
{
    ev.thinking();
    std::thread([ev, &ctx]() {
        ctx.registry.get_or_create(ev.command.guild_id)->stop();
        ev.edit_original_response(dpp::message("⏹️ Playback stopped"));
    }).detach();
}

// ---------- /list ----------
void handle_list(const dpp::slashcommand_t& ev, music_context& ctx)
{
    auto playlist = ctx.registry.get_or_create(ev.command.guild_id)->get_playlist();
    if (playlist.empty()) {
        ev.reply("🫙 The playlist is empty");
        return;
    }
    dpp::message msg;
    msg.add_embed(discord::make_playlist_embed(playlist));
    ev.reply(msg);
}

// ---------- /remove ----------
void handle_remove(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const int64_t position = std::get<int64_t>(ev.get_parameter("position"));

    auto player = ctx.registry.get_or_create(ev.command.guild_id);
    player::remove_result removed = player->remove_song(static_cast<int>(position));
    if (removed.code == errc::invalid_position) {
        ev.reply("🤷 Invalid position");
        return;
    }
    ev.reply("🗑️ Removed **" + removed.removed->human_name() + "** from the playlist");
}

// ---------- /playing ----------
void handle_playing(const dpp::slashcommand_t& ev, music_context& ctx)
{
    auto song = ctx.registry.get_or_create(ev.command.guild_id)->get_played_song();
    if (!song) {
        ev.reply("🔇 Nothing is playing right now...");
        return;
    }
    ev.reply("🎶 " + song->human_name());
}

} // namespace

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    dpp::slashcommand playCommand("play", "Play a song or add it to the queue", bot.me.id);
    playCommand.add_option(
        dpp::command_option(dpp::co_string, "input", "Song URL or search terms", true)
    );

    dpp::slashcommand skipCommand("skip", "Skip the current song", bot.me.id);
    dpp::slashcommand stopCommand("stop", "Stop playback, clear the queue and leave voice", bot.me.id);
    dpp::slashcommand listCommand("list", "Show the queued songs", bot.me.id);

    dpp::slashcommand removeCommand("remove", "Remove a song from the queue", bot.me.id);
    removeCommand.add_option(
        dpp::command_option(dpp::co_integer, "position", "Position in /list, starting at 1", true)
            .set_min_value(1)
    );

    dpp::slashcommand playingCommand("playing", "Show the song playing now", bot.me.id);

    return {playCommand, skipCommand, stopCommand, listCommand, removeCommand, playingCommand};
}

void route_slashcommand(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const std::string name = ev.command.get_command_name();

    if (name == "play") {
        ctx.metrics.command_used(name);
        handle_play(ev, ctx);
    } else if (name == "skip") {
        ctx.metrics.command_used(name);
        handle_skip(ev, ctx);
    } else if (name == "stop") {
        ctx.metrics.command_used(name);
        handle_stop(ev, ctx);
    } else if (name == "list") {
        ctx.metrics.command_used(name);
        handle_list(ev, ctx);
    } else if (name == "remove") {
        ctx.metrics.command_used(name);
        handle_remove(ev, ctx);
    } else if (name == "playing") {
        ctx.metrics.command_used(name);
        handle_playing(ev, ctx);
    }
}

void route_select_click(const dpp::select_click_t& ev, music_context& ctx)
{
    if (ev.custom_id != add_song_playlist_id) {
        return;
    }
    ctx.metrics.command_used(add_song_playlist_id);

    const dpp::snowflake guild_id = ev.command.guild_id;
    const dpp::snowflake text_channel = ev.command.channel_id;

    if (ev.values.empty()) {
        ev.reply("😨 Something went wrong...");
        return;
    }

    auto songs = ctx.storage.get_song_list(text_channel);
    if (songs.empty()) {
        ev.reply("That choice was already made.");
        return;
    }

    auto voice_channel = user_voice_channel(guild_id, ev.command.get_issuing_user().id);
    if (!voice_channel) {
        ev.reply(dpp::message(not_in_voice).set_flags(dpp::m_ephemeral));
        return;
    }

    ctx.storage.delete_song_list(text_channel);
    ev.thinking();

    std::thread([ev, &ctx, guild_id, text_channel, channel = *voice_channel, songs, choice = ev.values.front()]() {
        auto player = ctx.registry.get_or_create(guild_id);

        if (choice == "playlist") {
            std::size_t added = 0;
            for (const auto& s : songs) {
                player::add_result res = player->add_song(text_channel, channel, s);
                if (!res.ok()) {
                    std::cerr << "Failed to add " << s.url << ": " << res.error_message << std::endl;
                    continue;
                }
                ++added;
            }
            std::ostringstream oss;
            oss << "➕ Added " << added << " songs to the playlist";
            ev.edit_original_response(dpp::message(oss.str()));
            return;
        }

        const audio::song& s = songs.front();
        player::add_result res = player->add_song(text_channel, channel, s);
        if (!res.ok()) {
            ev.edit_original_response(dpp::message("Failed to add **" + s.title + "**: " + res.error_message));
            return;
        }
        dpp::message msg;
        msg.add_embed(discord::make_song_embed("Added to queue", s));
        ev.edit_original_response(msg);
    }).detach();
}

command_scope registration_scope(dpp::snowflake guild_id)
{
    return guild_id.empty() ? command_scope::global : command_scope::guild;
}

void register_commands(dpp::cluster& bot, dpp::snowflake guild_id)
{
    auto cmds = make_commands(bot);
    if (registration_scope(guild_id) == command_scope::global) {
        bot.global_bulk_command_create(cmds);
    } else {
        bot.guild_bulk_command_create(cmds, guild_id);
    }
}

bool unregister_commands(dpp::cluster& bot, dpp::snowflake guild_id, std::chrono::milliseconds timeout)
{
    if (registration_scope(guild_id) == command_scope::global) {
        return true;
    }

    // Overwriting with an empty set deletes every command of ours on the guild.
    auto prom = std::make_shared<std::promise<bool>>();
    auto fut  = prom->get_future();
    bot.guild_bulk_command_create({}, guild_id, [&bot, prom](const dpp::confirmation_callback_t& cb) {
        if (cb.is_error()) {
            bot.log(dpp::ll_warning, "Removing guild commands failed: " + cb.get_error().message);
        }
        prom->set_value(!cb.is_error());
    });

    if (fut.wait_for(timeout) != std::future_status::ready) {
        bot.log(dpp::ll_warning, "Timed out removing guild commands");
        return false;
    }
    return fut.get();
}

} // namespace ost::music
