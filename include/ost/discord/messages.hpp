#pragma once

#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "ost/audio/song.hpp"
#include "ost/player/notifier.hpp"

namespace ost::discord {

dpp::embed make_song_embed(const std::string& heading, const audio::song& s);
dpp::embed make_playlist_embed(const std::vector<audio::song>& songs);

// Numbered "1. Title (3:45)" lines, cut with "..." before max_chars.
std::string format_playlist(const std::vector<audio::song>& songs, std::size_t max_chars = 4000);

// Posts "now playing" and failure embeds into the text channel a song was
// requested from.
class dpp_notifier : public player::player_notifier {
public:
    explicit dpp_notifier(dpp::cluster& cluster);

    void song_started(dpp::snowflake text_channel, const audio::song& s) override;
    void song_failed(dpp::snowflake text_channel,
                     const audio::song& s,
                     errc code,
                     const std::string& message) override;

private:
    dpp::cluster& m_cluster;
};

} // namespace ost::discord
