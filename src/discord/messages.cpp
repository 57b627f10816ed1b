#include "ost/discord/messages.hpp"

namespace ost::discord {

namespace {

constexpr uint32_t embed_color = 0x1DB954;

} // namespace

dpp::embed make_song_embed(const std::string& heading, const audio::song& s)
{
    dpp::embed embed;
    embed.set_author(heading, "", "")
         .set_title(s.title)
         .set_url(s.url)
         .set_color(embed_color);

    if (s.duration.count() > 0) {
        embed.add_field("Duration", audio::format_duration(s.duration), true);
    }
    if (!s.requested_by.empty()) {
        embed.set_footer(dpp::embed_footer().set_text("Requested by " + s.requested_by));
    }
    if (s.thumbnail_url) {
        embed.set_thumbnail(*s.thumbnail_url);
    }
    return embed;
}

std::string format_playlist(const std::vector<audio::song>& songs, std::size_t max_chars)
{
    std::string out;
    for (std::size_t i = 0; i < songs.size(); ++i) {
        std::string line = std::to_string(i + 1) + ". " + songs[i].human_name() + "\n";
        if (out.size() + line.size() > max_chars) {
            out += "...";
            break;
        }
        out += line;
    }
    while (!out.empty() && out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

dpp::embed make_playlist_embed(const std::vector<audio::song>& songs)
{
    dpp::embed embed;
    embed.set_title("Playlist:")
         .set_description(format_playlist(songs))
         .set_color(embed_color);
    return embed;
}

dpp_notifier::dpp_notifier(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

void dpp_notifier::song_started(dpp::snowflake text_channel, const audio::song& s)
{
    if (text_channel.empty()) {
        return;
    }
    m_cluster.message_create(dpp::message(text_channel, make_song_embed("Now playing", s)));
}

void dpp_notifier::song_failed(dpp::snowflake text_channel,
                               const audio::song& s,
                               errc code,
                               const std::string& message)
{
    if (text_channel.empty()) {
        return;
    }
    m_cluster.log(dpp::ll_debug, "Reporting failure of '" + s.title + "': " + message);
    m_cluster.message_create(dpp::message(
        text_channel,
        "Could not play **" + s.title + "** (" + to_string(code) + "), skipping to the next song."));
}

} // namespace ost::discord
