#include "ost/audio/frames.hpp"

namespace ost::audio {

namespace {

// A cancel_token cannot wake the buffer's condition variable, so token waits
// poll at a fraction of a frame.
constexpr std::chrono::milliseconds cancel_poll{2};

} // namespace

void frame_buffer::push(audio_frame frame)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_finished) {
            return;
        }
        m_bytes += frame.size();
        m_frames.push_back(std::move(frame));
    }
    m_cv.notify_all();
}

void frame_buffer::finish()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = true;
    }
    m_cv.notify_all();
}

void frame_buffer::fail(errc code, std::string message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_finished) {
            return;
        }
        m_finished      = true;
        m_error         = code;
        m_error_message = std::move(message);
    }
    m_cv.notify_all();
}

bool frame_buffer::finished() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished;
}

errc frame_buffer::error() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

std::string frame_buffer::error_message() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error_message;
}

std::size_t frame_buffer::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames.size();
}

std::size_t frame_buffer::byte_size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytes;
}

read_status frame_buffer::wait_frame(std::size_t index, const cancel_token* token, const audio_frame*& out) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        if (index < m_frames.size()) {
            out = &m_frames[index];
            return read_status::frame;
        }
        if (m_finished) {
            return m_error == errc::ok ? read_status::end : read_status::failed;
        }
        if (token == nullptr) {
            m_cv.wait(lock);
            continue;
        }
        if (token->cancelled()) {
            return read_status::cancelled;
        }
        m_cv.wait_for(lock, cancel_poll);
    }
}

frame_reader::frame_reader(std::shared_ptr<const frame_buffer> buffer)
    : m_buffer(std::move(buffer))
{
}

const audio_frame* frame_reader::next(const cancel_token& token)
{
    return advance(&token);
}

const audio_frame* frame_reader::next()
{
    return advance(nullptr);
}

const audio_frame* frame_reader::advance(const cancel_token* token)
{
    if (!m_buffer) {
        m_status = read_status::end;
        return nullptr;
    }
    const audio_frame* frame = nullptr;
    m_status = m_buffer->wait_frame(m_position, token, frame);
    if (m_status != read_status::frame) {
        return nullptr;
    }
    ++m_position;
    return frame;
}

std::size_t frame_reader::size() const
{
    return m_buffer ? m_buffer->size() : 0;
}

} // namespace ost::audio
