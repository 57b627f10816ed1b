#pragma once

#include <chrono>
#include <cstddef>

#include "ost/audio/frames.hpp"
#include "ost/cancel_token.hpp"
#include "ost/log.hpp"
#include "ost/voice/transport.hpp"

namespace ost::voice {

struct streamer_config {
    std::chrono::microseconds frame_interval = audio::frame_duration;
    std::size_t               lead_frames    = 5;  // sent up front to prime the transport
};

enum class stream_outcome {
    completed,
    cancelled,
    transport_error,
    source_error        // the frame producer failed part way through
};

struct stream_result {
    stream_outcome outcome = stream_outcome::completed;
    std::size_t    frames_sent = 0;
};

const char* to_string(stream_outcome outcome);

// Real-time pacer. Frame n is due at start + (n - lead_frames) * interval;
// deadlines are absolute so the clock never drifts, and a streamer that falls
// too far behind rebases instead of bursting. A producer that is slower than
// real time is absorbed the same way.
class frame_streamer {
public:
    explicit frame_streamer(const streamer_config& cfg = {}, log_fn log = null_log());

    stream_result stream(audio::frame_reader& frames,
                         voice_session& session,
                         const cancel_token& token) const;

    const streamer_config& config() const { return m_cfg; }

private:
    streamer_config m_cfg;
    log_fn          m_log;
};

} // namespace ost::voice
