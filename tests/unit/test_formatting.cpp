#include <gtest/gtest.h>

#include "mocks/mock_engine.h"
#include "ost/audio/song.hpp"
#include "ost/discord/messages.hpp"
#include "ost/fetch/ytdlp_fetcher.hpp"

using namespace ost;
using ost::testing::make_song;

TEST(FormatDurationTest, MinutesAndHours) {
    EXPECT_EQ(audio::format_duration(std::chrono::seconds(0)), "0:00");
    EXPECT_EQ(audio::format_duration(std::chrono::seconds(213)), "3:33");
    EXPECT_EQ(audio::format_duration(std::chrono::seconds(3725)), "1:02:05");
    EXPECT_EQ(audio::format_duration(std::chrono::milliseconds(59999)), "0:59");
}

TEST(SongTest, HumanNameOmitsUnknownLength) {
    auto s = make_song("u:a", "Song");
    EXPECT_EQ(s.human_name(), "Song (1:30)");

    s.duration = std::chrono::milliseconds(0);
    EXPECT_EQ(s.human_name(), "Song");
}

TEST(FormatPlaylistTest, NumbersFromOneAndTruncates) {
    std::vector<audio::song> songs{make_song("u:a", "A"), make_song("u:b", "B"), make_song("u:c", "C")};
    EXPECT_EQ(discord::format_playlist(songs), "1. A (1:30)\n2. B (1:30)\n3. C (1:30)");

    // Room for the first two lines only.
    EXPECT_EQ(discord::format_playlist(songs, 26), "1. A (1:30)\n2. B (1:30)\n...");
    EXPECT_EQ(discord::format_playlist({}), "");
}

TEST(ShellQuoteTest, SingleQuotesSurviveTheShell) {
    EXPECT_EQ(fetch::shell_quote("https://example.com/a?b=c&d"), "'https://example.com/a?b=c&d'");
    EXPECT_EQ(fetch::shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(fetch::shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}
