#include "ost/fetch/ytdlp_fetcher.hpp"

#include <opus/opus.h>

#include <sys/wait.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <sstream>
#include <vector>

namespace ost::fetch {

namespace {

constexpr int         sample_rate       = 48000;
constexpr int         channels          = 2;
constexpr int         samples_per_frame = sample_rate / 50;     // 20 ms
constexpr std::size_t pcm_frame_bytes   = samples_per_frame * channels * sizeof(opus_int16);
constexpr int         max_packet_bytes  = 4000;

struct pipe_closer {
    void operator()(FILE* f) const { pclose(f); }
};

struct encoder_deleter {
    void operator()(OpusEncoder* enc) const { opus_encoder_destroy(enc); }
};

// pclose() exit status, or -1 if the child did not exit normally.
int close_pipe(std::unique_ptr<FILE, pipe_closer>& pipe)
{
    int status = pclose(pipe.release());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

} // namespace

std::string shell_quote(const std::string& arg)
{
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

ytdlp_fetcher::ytdlp_fetcher(const ytdlp_config& cfg, log_fn log)
    : m_cfg(cfg)
    , m_log(std::move(log))
{
}

audio::media_lookup ytdlp_fetcher::identify(const audio::song& s)
{
    audio::media_lookup res;

    const std::string cmd = m_cfg.ytdlp_path +
        " --no-playlist --no-warnings --print id -- " + shell_quote(s.url) + " 2>/dev/null";

    std::unique_ptr<FILE, pipe_closer> pipe(popen(cmd.c_str(), "r"));
    if (!pipe) {
        res.code = errc::lookup_failed;
        res.error_message = "cannot start " + m_cfg.ytdlp_path;
        return res;
    }

    std::string out;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), pipe.get())) {
        out += buf;
    }

    const int status = close_pipe(pipe);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' ')) {
        out.pop_back();
    }
    // Only the first line matters.
    auto nl = out.find('\n');
    if (nl != std::string::npos) {
        out.erase(nl);
    }

    if (status != 0 || out.empty()) {
        res.code = errc::lookup_failed;
        res.error_message = "yt-dlp could not identify " + s.url + " (exit " + std::to_string(status) + ")";
        return res;
    }

    res.media_id = out;
    return res;
}

audio::fetch_result ytdlp_fetcher::fetch(const audio::song& s, const std::string& media_id,
                                         audio::frame_buffer& out, const cancel_token& stop)
{
    audio::fetch_result res;

    int err = OPUS_OK;
    std::unique_ptr<OpusEncoder, encoder_deleter> enc(
        opus_encoder_create(sample_rate, channels, OPUS_APPLICATION_AUDIO, &err));
    if (err != OPUS_OK || !enc) {
        res.code = errc::transcode_failed;
        res.error_message = std::string("opus_encoder_create: ") + opus_strerror(err);
        return res;
    }
    opus_encoder_ctl(enc.get(), OPUS_SET_BITRATE(m_cfg.bitrate));

    const std::string cmd = m_cfg.ytdlp_path +
        " -q --no-playlist --no-warnings -f bestaudio -o - -- " + shell_quote(s.url) +
        " 2>/dev/null | " + m_cfg.ffmpeg_path +
        " -hide_banner -loglevel error -i pipe:0 -f s16le -ar 48000 -ac 2 pipe:1";

    m_log(dpp::ll_debug, "Transcoding " + media_id + ": " + cmd);

    std::unique_ptr<FILE, pipe_closer> pipe(popen(cmd.c_str(), "r"));
    if (!pipe) {
        res.code = errc::transcode_failed;
        res.error_message = "cannot start transcoder for " + media_id;
        return res;
    }

    std::vector<opus_int16> pcm(samples_per_frame * channels);
    unsigned char packet[max_packet_bytes];
    std::size_t produced = 0;
    bool truncated = false;

    while (true) {
        if (stop.cancelled()) {
            // The pipe closes on return; the pipeline dies on its next write.
            res.code = errc::cancelled;
            res.error_message = "transcoding of " + media_id + " stopped";
            return res;
        }

        std::fill(pcm.begin(), pcm.end(), 0);
        const std::size_t got = std::fread(pcm.data(), 1, pcm_frame_bytes, pipe.get());
        if (got == 0) {
            break;
        }

        const opus_int32 len = opus_encode(enc.get(), pcm.data(), samples_per_frame, packet, max_packet_bytes);
        if (len < 0) {
            res.code = errc::transcode_failed;
            res.error_message = std::string("opus_encode: ") + opus_strerror(len);
            return res;
        }
        out.push(audio::audio_frame(packet, packet + len));
        ++produced;

        if (got < pcm_frame_bytes) {
            break;
        }
        if (produced >= m_cfg.max_frames) {
            truncated = true;
            break;
        }
    }

    const int status = close_pipe(pipe);
    if (!truncated && status != 0) {
        res.code = errc::transcode_failed;
        res.error_message = "transcoder exited with status " + std::to_string(status);
        return res;
    }
    if (produced == 0) {
        res.code = errc::transcode_failed;
        res.error_message = "no audio decoded for " + media_id;
        return res;
    }

    if (truncated) {
        m_log(dpp::ll_warning, "'" + s.title + "' cut at " + std::to_string(m_cfg.max_frames) + " frames");
    }

    std::ostringstream oss;
    oss << "Transcoded " << media_id << " into " << produced
        << " frame(s), " << out.byte_size() << " bytes";
    m_log(dpp::ll_info, oss.str());
    return res;
}

} // namespace ost::fetch
