#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

#include "mocks/mock_engine.h"
#include "ost/guilds/registry.hpp"
#include "ost/metrics/metrics.hpp"

using namespace ost;
using ost::testing::make_song;
using ost::testing::mock_fetcher;
using ost::testing::mock_voice_transport;
using ost::testing::wait_until;

class GuildRegistryTest : public ::testing::Test {
protected:
    GuildRegistryTest()
    {
        streamer_cfg.frame_interval = std::chrono::milliseconds(2);
        fetcher.set_default_length(2000);
    }

    guilds::guild_registry::factory_fn factory()
    {
        return [this](dpp::snowflake guild_id) {
            if (static_cast<uint64_t>(guild_id) == static_cast<uint64_t>(slow_guild)) {
                slow_gate.wait();
            }
            ++created;
            return std::make_shared<player::guild_player>(
                guild_id, player::player_deps{source, transport, streamer, nullptr, &store, null_log()});
        };
    }

    metrics::counter_metrics               metrics;
    std::unique_ptr<audio::metadata_cache> metadata =
        audio::make_metadata_cache(cache::cache_config{}, &metrics, null_log());
    std::unique_ptr<audio::frame_cache>    frames =
        audio::make_frame_cache(cache::cache_config{}, &metrics, null_log());
    mock_fetcher                           fetcher;
    audio::audio_source                    source{fetcher, *metadata, *frames};
    voice::streamer_config                 streamer_cfg;
    voice::frame_streamer                  streamer{streamer_cfg};
    mock_voice_transport                   transport;
    player::memory_playlist_store          store;
    std::atomic<int>                       created{0};

    // Creating a player for slow_guild waits until slow_release is fulfilled.
    dpp::snowflake                         slow_guild{0};
    std::promise<void>                     slow_release;
    std::shared_future<void>               slow_gate = slow_release.get_future().share();
};

TEST_F(GuildRegistryTest, JoinCreatesOnePlayerPerGuild) {
    guilds::guild_registry registry(factory());
    registry.on_guild_join(dpp::snowflake(1));
    registry.on_guild_join(dpp::snowflake(2));
    registry.on_guild_join(dpp::snowflake(1));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(created, 2);
}

TEST_F(GuildRegistryTest, GetOrCreateReturnsTheSamePlayer) {
    guilds::guild_registry registry(factory());
    auto first  = registry.get_or_create(dpp::snowflake(1));
    auto second = registry.get_or_create(dpp::snowflake(1));
    EXPECT_EQ(first, second);
    EXPECT_EQ(created, 1);
}

TEST_F(GuildRegistryTest, ConcurrentGetOrCreateAgreesOnOnePlayer) {
    guilds::guild_registry registry(factory());
    std::vector<guilds::guild_registry::player_ptr> seen(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&registry, &seen, i]() { seen[i] = registry.get_or_create(dpp::snowflake(7)); });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& p : seen) {
        EXPECT_EQ(p, seen.front());
    }
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_GE(created, 1);

    // Players built by threads that lost the race were never started.
    ASSERT_TRUE(seen.front()->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a")).ok());
    ASSERT_TRUE(wait_until([&] { return seen.front()->state() == player::player_state::playing; }));
    EXPECT_EQ(transport.opens(), 1);
}

TEST_F(GuildRegistryTest, SlowPlayerCreationDoesNotBlockOtherGuilds) {
    slow_guild = dpp::snowflake(1);
    guilds::guild_registry registry(factory());

    std::thread slow([&registry]() { registry.get_or_create(dpp::snowflake(1)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::atomic<bool> other_done{false};
    std::thread other([&]() {
        registry.get_or_create(dpp::snowflake(2));
        other_done = true;
    });
    EXPECT_TRUE(wait_until([&] { return other_done.load(); }, std::chrono::milliseconds(1000)));

    slow_release.set_value();
    slow.join();
    other.join();
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(GuildRegistryTest, LeaveStopsAndDropsThePlayer) {
    guilds::guild_registry registry(factory());
    registry.on_guild_join(dpp::snowflake(1));
    auto p = registry.get_or_create(dpp::snowflake(1));
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a")).ok());
    ASSERT_TRUE(wait_until([&] { return p->state() == player::player_state::playing; }));

    registry.on_guild_leave(dpp::snowflake(1));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(p->state(), player::player_state::closed);
    EXPECT_EQ(transport.last_session()->closes(), 1);

    // Unknown guilds are ignored.
    registry.on_guild_leave(dpp::snowflake(99));
}

TEST_F(GuildRegistryTest, StoppedPlayerIsReplacedOnNextUse) {
    guilds::guild_registry registry(factory());
    auto old_player = registry.get_or_create(dpp::snowflake(1));
    old_player->stop();

    auto fresh = registry.get_or_create(dpp::snowflake(1));
    EXPECT_NE(fresh, old_player);
    EXPECT_EQ(fresh->state(), player::player_state::idle);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(created, 2);
    EXPECT_TRUE(fresh->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a")).ok());
}

TEST_F(GuildRegistryTest, GuildsAreIsolated) {
    guilds::guild_registry registry(factory());
    auto a = registry.get_or_create(dpp::snowflake(1));
    auto b = registry.get_or_create(dpp::snowflake(2));
    ASSERT_TRUE(a->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a")).ok());
    ASSERT_TRUE(b->add_song(dpp::snowflake(11), dpp::snowflake(21), make_song("u:b")).ok());
    ASSERT_TRUE(wait_until([&] { return a->state() == player::player_state::playing; }));
    ASSERT_TRUE(wait_until([&] { return b->state() == player::player_state::playing; }));

    a->stop();
    EXPECT_EQ(b->state(), player::player_state::playing);
    EXPECT_EQ(b->get_played_song()->url, "u:b");
}

TEST_F(GuildRegistryTest, ShutdownKeepsSavedQueues) {
    guilds::guild_registry registry(factory());
    auto p = registry.get_or_create(dpp::snowflake(1));
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a", "A")).ok());
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:b", "B")).ok());
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:c", "C")).ok());
    ASSERT_TRUE(wait_until([&] { return p->state() == player::player_state::playing; }));
    ASSERT_EQ(store.load(dpp::snowflake(1)).size(), 2u);

    registry.shutdown();
    EXPECT_EQ(p->state(), player::player_state::closed);

    auto saved = store.load(dpp::snowflake(1));
    ASSERT_EQ(saved.size(), 3u);
    EXPECT_EQ(saved[0].song.title, "A");
    EXPECT_EQ(saved[2].song.title, "C");
}

TEST_F(GuildRegistryTest, LeavingAGuildDropsItsSavedQueue) {
    guilds::guild_registry registry(factory());
    auto p = registry.get_or_create(dpp::snowflake(1));
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:a", "A")).ok());
    ASSERT_TRUE(p->add_song(dpp::snowflake(10), dpp::snowflake(20), make_song("u:b", "B")).ok());
    ASSERT_TRUE(wait_until([&] { return p->state() == player::player_state::playing; }));

    registry.on_guild_leave(dpp::snowflake(1));
    EXPECT_TRUE(store.load(dpp::snowflake(1)).empty());
}

TEST_F(GuildRegistryTest, ShutdownStopsEveryPlayer) {
    guilds::guild_registry registry(factory());
    auto a = registry.get_or_create(dpp::snowflake(1));
    auto b = registry.get_or_create(dpp::snowflake(2));

    registry.shutdown();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(a->state(), player::player_state::closed);
    EXPECT_EQ(b->state(), player::player_state::closed);

    // Idempotent.
    registry.shutdown();
}
