#include <gtest/gtest.h>
#include <thread>

#include "mocks/mock_engine.h"
#include "ost/voice/streamer.hpp"

using namespace ost;
using ost::testing::make_frame;
using ost::testing::make_frames;
using ost::testing::mock_voice_session;

namespace {

voice::streamer_config fast_config(std::size_t lead = 2)
{
    voice::streamer_config cfg;
    cfg.frame_interval = std::chrono::milliseconds(2);
    cfg.lead_frames    = lead;
    return cfg;
}

} // namespace

TEST(FrameStreamerTest, SendsEveryFrameAtTheFrameCadence) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    audio::frame_reader reader(make_frames(30));
    cancel_token token;

    const auto started = std::chrono::steady_clock::now();
    auto res = streamer.stream(reader, session, token);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(res.outcome, voice::stream_outcome::completed);
    EXPECT_EQ(res.frames_sent, 30u);
    EXPECT_EQ(session.frames(), 30u);

    // 28 paced frames at 2 ms each, the two lead frames go out at once.
    EXPECT_GE(elapsed, std::chrono::milliseconds(27 * 2));

    // Frame 29 is due 27 intervals after the start of the schedule.
    auto times = session.send_times();
    ASSERT_EQ(times.size(), 30u);
    EXPECT_GE(times.back() - started, std::chrono::milliseconds(27 * 2));
}

TEST(FrameStreamerTest, EmptyReaderCompletesImmediately) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    audio::frame_reader reader(make_frames(0));
    cancel_token token;

    auto res = streamer.stream(reader, session, token);
    EXPECT_EQ(res.outcome, voice::stream_outcome::completed);
    EXPECT_EQ(res.frames_sent, 0u);
}

TEST(FrameStreamerTest, CancelStopsWithinOneFrameAndDiscardsPending) {
    voice::streamer_config cfg;
    cfg.frame_interval = std::chrono::milliseconds(20);
    cfg.lead_frames    = 2;
    voice::frame_streamer streamer(cfg);

    mock_voice_session session(dpp::snowflake(42));
    audio::frame_reader reader(make_frames(500));
    cancel_token token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto res = streamer.stream(reader, session, token);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(res.outcome, voice::stream_outcome::cancelled);
    EXPECT_LT(res.frames_sent, 500u);
    EXPECT_EQ(session.discards(), 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(100 + 200));
}

TEST(FrameStreamerTest, AlreadyCancelledTokenSendsNothing) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    audio::frame_reader reader(make_frames(10));
    cancel_token token;
    token.cancel();

    auto res = streamer.stream(reader, session, token);
    EXPECT_EQ(res.outcome, voice::stream_outcome::cancelled);
    EXPECT_EQ(res.frames_sent, 0u);
    EXPECT_EQ(session.frames(), 0u);
}

TEST(FrameStreamerTest, RejectedFrameIsTransportError) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    session.fail_from(3);
    audio::frame_reader reader(make_frames(10));
    cancel_token token;

    auto res = streamer.stream(reader, session, token);
    EXPECT_EQ(res.outcome, voice::stream_outcome::transport_error);
    EXPECT_EQ(res.frames_sent, 3u);
    EXPECT_EQ(session.discards(), 0);
}

TEST(FrameStreamerTest, WaitsForASlowProducer) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    auto buffer = std::make_shared<audio::frame_buffer>();
    audio::frame_reader reader(buffer);
    cancel_token token;

    std::thread producer([buffer]() {
        for (std::size_t i = 0; i < 12; ++i) {
            buffer->push(make_frame(i));
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        buffer->finish();
    });

    auto res = streamer.stream(reader, session, token);
    producer.join();

    EXPECT_EQ(res.outcome, voice::stream_outcome::completed);
    EXPECT_EQ(res.frames_sent, 12u);
    EXPECT_EQ(session.frames(), 12u);
}

TEST(FrameStreamerTest, ProducerFailureEndsTheStream) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    auto buffer = std::make_shared<audio::frame_buffer>();
    for (std::size_t i = 0; i < 3; ++i) {
        buffer->push(make_frame(i));
    }
    buffer->fail(errc::transcode_failed, "decoder died");
    audio::frame_reader reader(buffer);
    cancel_token token;

    auto res = streamer.stream(reader, session, token);
    EXPECT_EQ(res.outcome, voice::stream_outcome::source_error);
    EXPECT_EQ(res.frames_sent, 3u);
    EXPECT_EQ(session.discards(), 0);
}

TEST(FrameStreamerTest, CancelWhileWaitingForTheProducer) {
    voice::frame_streamer streamer(fast_config());
    mock_voice_session session(dpp::snowflake(42));
    auto buffer = std::make_shared<audio::frame_buffer>();
    buffer->push(make_frame(0));
    audio::frame_reader reader(buffer);
    cancel_token token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto res = streamer.stream(reader, session, token);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(res.outcome, voice::stream_outcome::cancelled);
    EXPECT_EQ(res.frames_sent, 1u);
    EXPECT_EQ(session.discards(), 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(30 + 200));
}

TEST(FrameReaderTest, WalksBufferInOrder) {
    audio::frame_reader reader(make_frames(3));
    EXPECT_EQ(reader.size(), 3u);
    for (std::uint8_t i = 0; i < 3; ++i) {
        const audio::audio_frame* f = reader.next();
        ASSERT_NE(f, nullptr);
        EXPECT_EQ(f->front(), i);
    }
    EXPECT_EQ(reader.next(), nullptr);
    EXPECT_EQ(reader.status(), audio::read_status::end);
    EXPECT_EQ(reader.position(), 3u);
}

TEST(FrameBufferTest, PushAfterTheEndIsIgnored) {
    audio::frame_buffer buffer;
    buffer.push(make_frame(0, 4));
    buffer.finish();
    buffer.push(make_frame(1, 4));
    buffer.fail(errc::transcode_failed, "late");

    EXPECT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer.byte_size(), 4u);
    EXPECT_EQ(buffer.error(), errc::ok);
}
