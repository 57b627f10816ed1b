#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ost/cancel_token.hpp"
#include "ost/error.hpp"

namespace ost::audio {

// Every frame covers the same 20 ms of audio (one Opus packet on Discord).
constexpr std::chrono::milliseconds frame_duration{20};

using audio_frame = std::vector<std::uint8_t>;

enum class read_status { frame, end, failed, cancelled };

// Frames of one song, filled by a producer while any number of readers stream
// them. Frames never move once pushed, so readers keep plain pointers to them.
// Only finished buffers go into the audio cache.
class frame_buffer {
public:
    frame_buffer() = default;
    frame_buffer(const frame_buffer&) = delete;
    frame_buffer& operator=(const frame_buffer&) = delete;

    // Producer side. push() after finish() or fail() is ignored.
    void push(audio_frame frame);
    void finish();
    void fail(errc code, std::string message);

    bool finished() const;
    errc error() const;
    std::string error_message() const;

    std::size_t size() const;
    std::size_t byte_size() const;

    // Waits until frame `index` exists, the producer is done, or `token` is
    // cancelled. `out` is set only for read_status::frame. A null token waits
    // for the producer without limit.
    read_status wait_frame(std::size_t index, const cancel_token* token, const audio_frame*& out) const;

private:
    mutable std::mutex              m_mutex;
    mutable std::condition_variable m_cv;
    std::deque<audio_frame>         m_frames;
    std::size_t                     m_bytes    = 0;
    bool                            m_finished = false;
    errc                            m_error    = errc::ok;
    std::string                     m_error_message;
};

// Pulls frames one at a time out of a shared buffer.
class frame_reader {
public:
    explicit frame_reader(std::shared_ptr<const frame_buffer> buffer);

    // Blocks while the producer is behind. nullptr at the end of the song, when
    // the producer failed, or once `token` is cancelled; status() says which.
    const audio_frame* next(const cancel_token& token);
    const audio_frame* next();

    read_status status() const { return m_status; }
    std::size_t position() const { return m_position; }
    // Frames produced so far.
    std::size_t size() const;

private:
    const audio_frame* advance(const cancel_token* token);

    std::shared_ptr<const frame_buffer> m_buffer;
    std::size_t                         m_position = 0;
    read_status                         m_status   = read_status::frame;
};

} // namespace ost::audio
