#include <gtest/gtest.h>
#include <cstdlib>

#include "ost/config.hpp"

namespace {

const char* const config_vars[] = {
    "token", "DISCORD_TOKEN", "GUILD_ID", "LAVALINK_HOST", "LAVALINK_PORT", "LAVALINK_PASSWORD",
    "LAVALINK_HTTPS", "YTDLP_PATH", "FFMPEG_PATH", "METADATA_CACHE_BYTES", "AUDIO_CACHE_BYTES",
    "CACHE_TTL_SECONDS", "PRESENCE_INTERVAL_SECONDS", "PLAYLIST_STORE_DIR",
};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        for (const char* name : config_vars) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    std::vector<std::string> warnings;
    ost::config cfg = ost::load_config_from_env(warnings);

    EXPECT_TRUE(cfg.discord_token.empty());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(cfg.guild_id.empty());
    EXPECT_EQ(cfg.lavalink.host, "127.0.0.1");
    EXPECT_EQ(cfg.lavalink.port, 2333);
    EXPECT_FALSE(cfg.lavalink.https);
    EXPECT_EQ(cfg.presence_interval, std::chrono::seconds(60));
    EXPECT_TRUE(cfg.playlist_store_dir.empty());
}

TEST_F(ConfigTest, ReadsEveryVariable) {
    setenv("token", "abc.def", 1);
    setenv("GUILD_ID", "825407338755653642", 1);
    setenv("LAVALINK_HOST", "lavalink.internal", 1);
    setenv("LAVALINK_PORT", "443", 1);
    setenv("LAVALINK_HTTPS", "true", 1);
    setenv("LAVALINK_PASSWORD", "hunter2", 1);
    setenv("AUDIO_CACHE_BYTES", "1048576", 1);
    setenv("CACHE_TTL_SECONDS", "600", 1);
    setenv("PRESENCE_INTERVAL_SECONDS", "15", 1);
    setenv("PLAYLIST_STORE_DIR", "/var/lib/ostinato", 1);

    std::vector<std::string> warnings;
    ost::config cfg = ost::load_config_from_env(warnings);

    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(cfg.discord_token, "abc.def");
    EXPECT_EQ(static_cast<uint64_t>(cfg.guild_id), 825407338755653642ULL);
    EXPECT_EQ(cfg.lavalink.host, "lavalink.internal");
    EXPECT_EQ(cfg.lavalink.port, 443);
    EXPECT_TRUE(cfg.lavalink.https);
    EXPECT_EQ(cfg.lavalink.password, "hunter2");
    EXPECT_EQ(cfg.audio_cache.capacity_bytes, 1048576u);
    EXPECT_EQ(cfg.metadata_cache.ttl, std::chrono::seconds(600));
    EXPECT_EQ(cfg.presence_interval, std::chrono::seconds(15));
    EXPECT_EQ(cfg.playlist_store_dir, "/var/lib/ostinato");
}

TEST_F(ConfigTest, MalformedNumbersKeepDefaults) {
    setenv("token", "abc", 1);
    setenv("LAVALINK_PORT", "80a", 1);
    setenv("PRESENCE_INTERVAL_SECONDS", "0", 1);

    std::vector<std::string> warnings;
    ost::config cfg = ost::load_config_from_env(warnings);

    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_EQ(cfg.lavalink.port, 2333);
    EXPECT_EQ(cfg.presence_interval, std::chrono::seconds(60));
}

TEST_F(ConfigTest, NegativeAndOutOfRangeNumbersKeepDefaults) {
    setenv("token", "abc", 1);
    setenv("LAVALINK_PORT", "70000", 1);
    setenv("AUDIO_CACHE_BYTES", "-1", 1);
    setenv("CACHE_TTL_SECONDS", " -5", 1);

    std::vector<std::string> warnings;
    ost::config cfg = ost::load_config_from_env(warnings);

    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_NE(warnings[0].find("LAVALINK_PORT"), std::string::npos);
    EXPECT_NE(warnings[0].find("out of range"), std::string::npos);
    EXPECT_NE(warnings[1].find("negative"), std::string::npos);
    EXPECT_EQ(cfg.lavalink.port, 2333);
    EXPECT_EQ(cfg.audio_cache.capacity_bytes, ost::config{}.audio_cache.capacity_bytes);
    EXPECT_EQ(cfg.metadata_cache.ttl, ost::config{}.metadata_cache.ttl);
}

TEST_F(ConfigTest, LargestPortIsAccepted) {
    setenv("token", "abc", 1);
    setenv("LAVALINK_PORT", "65535", 1);

    std::vector<std::string> warnings;
    ost::config cfg = ost::load_config_from_env(warnings);

    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(cfg.lavalink.port, 65535);
}
