#include "ost/voice/streamer.hpp"

#include <sstream>

namespace ost::voice {

const char* to_string(stream_outcome outcome)
{
    switch (outcome) {
        case stream_outcome::completed:       return "completed";
        case stream_outcome::cancelled:       return "cancelled";
        case stream_outcome::transport_error: return "transport error";
        case stream_outcome::source_error:    return "source error";
    }
    return "unknown";
}

frame_streamer::frame_streamer(const streamer_config& cfg, log_fn log)
    : m_cfg(cfg)
    , m_log(std::move(log))
{
}

stream_result frame_streamer::stream(audio::frame_reader& frames,
                                     voice_session& session,
                                     const cancel_token& token) const
{
    using clock = cancel_token::clock;

    const auto interval = std::chrono::duration_cast<clock::duration>(m_cfg.frame_interval);
    const auto max_lag  = interval * static_cast<clock::duration::rep>(m_cfg.lead_frames + 1);

    stream_result res;
    clock::time_point start = clock::now();
    std::size_t paced = 0;  // frames counted against the current schedule

    while (const audio::audio_frame* frame = frames.next(token)) {
        if (token.cancelled()) {
            session.discard_pending();
            res.outcome = stream_outcome::cancelled;
            return res;
        }

        if (paced >= m_cfg.lead_frames) {
            const auto due = start + interval * static_cast<clock::duration::rep>(paced - m_cfg.lead_frames);
            const auto now = clock::now();
            if (now - due > max_lag) {
                std::ostringstream oss;
                oss << "Streamer fell " << std::chrono::duration_cast<std::chrono::milliseconds>(now - due).count()
                    << " ms behind at frame " << res.frames_sent << ", rebasing";
                m_log(dpp::ll_debug, oss.str());
                start = now;
                paced = m_cfg.lead_frames;
            } else if (token.wait_until(due)) {
                session.discard_pending();
                res.outcome = stream_outcome::cancelled;
                return res;
            }
        }

        if (!session.send_frame(*frame)) {
            res.outcome = stream_outcome::transport_error;
            return res;
        }
        ++res.frames_sent;
        ++paced;
    }

    switch (frames.status()) {
        case audio::read_status::cancelled:
            session.discard_pending();
            res.outcome = stream_outcome::cancelled;
            break;
        case audio::read_status::failed:
            res.outcome = stream_outcome::source_error;
            break;
        default:
            res.outcome = stream_outcome::completed;
            break;
    }
    return res;
}

} // namespace ost::voice
