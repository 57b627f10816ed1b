#include "ost/config.hpp"

#include <cstdint>
#include <cstdlib>      // getenv
#include <limits>
#include <stdexcept>

namespace ost {

namespace {

std::string env_string(const char* name, const std::string& fallback = "")
{
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

template <typename Int>
void env_number(const char* name, Int& out, std::vector<std::string>& warnings)
{
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return;
    }
    const std::string text(value);
    // stoull accepts "-1" and wraps it.
    if (text.find('-') != std::string::npos) {
        warnings.push_back(std::string(name) + "='" + text + "' must not be negative, using default");
        return;
    }
    unsigned long long parsed = 0;
    try {
        std::size_t used = 0;
        parsed = std::stoull(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        warnings.push_back(std::string(name) + "='" + text + "' is not a number, using default");
        return;
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<Int>::max())) {
        warnings.push_back(std::string(name) + "='" + text + "' is out of range, using default");
        return;
    }
    out = static_cast<Int>(parsed);
}

} // namespace

config load_config_from_env(std::vector<std::string>& warnings)
{
    config cfg;

    // Same variable the bot always read its token from.
    cfg.discord_token = env_string("token", env_string("DISCORD_TOKEN"));
    if (cfg.discord_token.empty()) {
        warnings.push_back("No Discord token set (token / DISCORD_TOKEN)");
    }

    std::uint64_t guild = 0;
    env_number("GUILD_ID", guild, warnings);
    cfg.guild_id = guild;

    cfg.lavalink.host     = env_string("LAVALINK_HOST", cfg.lavalink.host);
    cfg.lavalink.password = env_string("LAVALINK_PASSWORD", "youshallnotpass");
    cfg.lavalink.https    = env_string("LAVALINK_HTTPS") == "true";
    env_number("LAVALINK_PORT", cfg.lavalink.port, warnings);

    cfg.fetcher.ytdlp_path  = env_string("YTDLP_PATH", cfg.fetcher.ytdlp_path);
    cfg.fetcher.ffmpeg_path = env_string("FFMPEG_PATH", cfg.fetcher.ffmpeg_path);

    env_number("METADATA_CACHE_BYTES", cfg.metadata_cache.capacity_bytes, warnings);
    env_number("AUDIO_CACHE_BYTES", cfg.audio_cache.capacity_bytes, warnings);

    std::uint64_t ttl = static_cast<std::uint64_t>(cfg.metadata_cache.ttl.count());
    env_number("CACHE_TTL_SECONDS", ttl, warnings);
    cfg.metadata_cache.ttl = std::chrono::seconds(ttl);

    std::uint64_t presence = static_cast<std::uint64_t>(cfg.presence_interval.count());
    env_number("PRESENCE_INTERVAL_SECONDS", presence, warnings);
    if (presence == 0) {
        warnings.push_back("PRESENCE_INTERVAL_SECONDS must be positive, using 60");
        presence = 60;
    }
    cfg.presence_interval = std::chrono::seconds(presence);

    cfg.playlist_store_dir = env_string("PLAYLIST_STORE_DIR");
    return cfg;
}

} // namespace ost
