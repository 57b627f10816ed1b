#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "ost/audio/lookup.hpp"

namespace ost::lavalink {

struct node_config {
    std::string host = "127.0.0.1";
    uint16_t    port = 2333;
    bool        https = false;
    std::string password;       // Lavalink password
    std::string search_prefix = "ytsearch:";
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

load_type parse_load_type(const std::string& value);

// Parses a /v4/loadtracks response body into songs. Search results are cut
// down to the best match; playlists and single tracks keep every entry.
audio::lookup_result parse_load_result(const std::string& body);

// Song lookup backed by a Lavalink v4 node's REST API. Only track loading is
// used; audio is fetched and streamed by the bot itself.
class search_client : public audio::song_lookup {
public:
    search_client(dpp::cluster& cluster, const node_config& cfg);

    audio::lookup_result lookup_songs(const std::string& query) override;

private:
    dpp::cluster& m_cluster;
    node_config   m_cfg;

    // Body of a successful GET, empty on any failure.
    std::string http_get(const std::string& urlpath) const;
};

} // namespace ost::lavalink
