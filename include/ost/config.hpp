#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "ost/cache/lru_cache.hpp"
#include "ost/fetch/ytdlp_fetcher.hpp"
#include "ost/lavalink/client.hpp"

namespace ost {

struct config {
    std::string                 discord_token;
    dpp::snowflake              guild_id;            // 0 = register commands globally
    lavalink::node_config       lavalink;
    fetch::ytdlp_config         fetcher;
    cache::cache_config         metadata_cache{4 * 1024 * 1024, std::chrono::hours(24)};
    cache::cache_config         audio_cache{256 * 1024 * 1024, std::chrono::seconds(0)};
    std::string                 playlist_store_dir;  // empty = in-memory store
    std::chrono::seconds        presence_interval{60};
};

// Reads the configuration from the environment. Values that are set but do
// not parse are left at their defaults and described in `warnings`.
config load_config_from_env(std::vector<std::string>& warnings);

} // namespace ost
