#pragma once

#include <cstddef>
#include <string>

#include "ost/audio/fetcher.hpp"
#include "ost/log.hpp"

namespace ost::fetch {

struct ytdlp_config {
    std::string ytdlp_path   = "yt-dlp";
    std::string ffmpeg_path  = "ffmpeg";
    int         bitrate      = 96000;     // Opus target bits per second
    std::size_t max_frames   = 50 * 60 * 30;   // half an hour of 20 ms frames
};

// Quotes a string for /bin/sh.
std::string shell_quote(const std::string& arg);

// yt-dlp resolves and downloads, ffmpeg decodes to 48 kHz stereo PCM, libopus
// cuts it into 20 ms packets that are handed out while the pipe is still
// running.
class ytdlp_fetcher : public audio::audio_fetcher {
public:
    explicit ytdlp_fetcher(const ytdlp_config& cfg = {}, log_fn log = null_log());

    audio::media_lookup identify(const audio::song& s) override;
    audio::fetch_result fetch(const audio::song& s, const std::string& media_id,
                              audio::frame_buffer& out, const cancel_token& stop) override;

private:
    ytdlp_config m_cfg;
    log_fn       m_log;
};

} // namespace ost::fetch
