#include "ost/player/player.hpp"

#include <exception>
#include <sstream>

namespace ost::player {

const char* to_string(player_state state)
{
    switch (state) {
        case player_state::idle:    return "idle";
        case player_state::loading: return "loading";
        case player_state::playing: return "playing";
        case player_state::closed:  return "closed";
    }
    return "unknown";
}

guild_player::guild_player(dpp::snowflake guild_id, player_deps deps)
    : m_guild_id(guild_id)
    , m_deps(std::move(deps))
{
    if (m_deps.store) {
        auto restored = m_deps.store->load(m_guild_id);
        m_queue.assign(restored.begin(), restored.end());
    }
    log(dpp::ll_debug, "Player created");
}

guild_player::~guild_player()
{
    close(close_mode::leave_store);
    if (m_worker.joinable()) {
        if (m_worker.get_id() == std::this_thread::get_id()) {
            m_worker.detach();
        } else {
            m_worker.join();
        }
    }
}

void guild_player::start()
{
    m_worker = std::thread(&guild_player::run, this);
}

void guild_player::log(dpp::loglevel level, const std::string& msg) const
{
    m_deps.log(level, "[guild " + m_guild_id.str() + "] " + msg);
}

add_result guild_player::add_song(dpp::snowflake text_channel, dpp::snowflake voice_channel, audio::song s)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state == player_state::closed) {
        return {errc::player_closed, "player is closed"};
    }

    add_result opened = open_session_locked(lock, voice_channel);
    if (!opened.ok()) {
        return opened;
    }

    log(dpp::ll_info, "Queued '" + s.title + "' requested by " + s.requested_by);
    m_queue.push_back(queue_entry{std::move(s), text_channel, voice_channel});
    persist_locked();
    lock.unlock();

    m_cv.notify_all();
    return {};
}

add_result guild_player::open_session_locked(std::unique_lock<std::mutex>& lock, dpp::snowflake voice_channel)
{
    m_cv.wait(lock, [this] { return !m_opening; });
    if (m_state == player_state::closed) {
        return {errc::player_closed, "player is closed"};
    }
    if (m_session) {
        return {};
    }

    m_opening = true;
    lock.unlock();

    voice::open_result res;
    try {
        res = m_deps.transport.open(m_guild_id, voice_channel);
    } catch (const std::exception& e) {
        res.code          = errc::voice_unavailable;
        res.error_message = e.what();
    }

    lock.lock();
    m_opening = false;
    m_cv.notify_all();

    if (!res.ok()) {
        const std::string message = res.error_message.empty() ? "cannot join voice channel" : res.error_message;
        log(dpp::ll_warning, "Cannot open voice session on channel " + voice_channel.str() + ": " + message);
        return {errc::voice_unavailable, message};
    }

    if (m_state == player_state::closed) {
        // Stopped while connecting; this session was never published.
        lock.unlock();
        res.session->close();
        lock.lock();
        return {errc::player_closed, "player is closed"};
    }

    m_session = std::move(res.session);
    log(dpp::ll_info, "Voice session opened on channel " + voice_channel.str());
    return {};
}

void guild_player::skip_song()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_token) {
        return;
    }
    m_token->cancel();
    if (m_current) {
        log(dpp::ll_info, "Skipping '" + m_current->song.title + "'");
    }
}

void guild_player::stop()
{
    close(close_mode::discard_queue);
}

void guild_player::shutdown()
{
    close(close_mode::save_queue);
}

void guild_player::close(close_mode mode)
{
    std::shared_ptr<voice::voice_session> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::closed) {
            return;
        }
        m_state = player_state::closed;
        if (m_token) {
            m_token->cancel();
        }
        session = std::move(m_session);

        if (mode == close_mode::discard_queue) {
            m_queue.clear();
            persist_locked();
        } else if (mode == close_mode::save_queue) {
            // The interrupted song goes first so a restart plays it again.
            std::vector<queue_entry> entries;
            if (m_current) {
                entries.push_back(*m_current);
            }
            entries.insert(entries.end(), m_queue.begin(), m_queue.end());
            save_locked(entries);
        }
    }
    m_cv.notify_all();

    if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
        m_worker.join();
    }

    if (session) {
        session->close();
    }
    log(dpp::ll_info, mode == close_mode::save_queue ? "Player shut down" : "Player stopped");
}

remove_result guild_player::remove_song(int position)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (position < 1 || static_cast<std::size_t>(position) > m_queue.size()) {
        return {errc::invalid_position, std::nullopt};
    }

    auto it = m_queue.begin() + (position - 1);
    remove_result res{errc::ok, it->song};
    m_queue.erase(it);
    persist_locked();

    log(dpp::ll_info, "Removed '" + res.removed->title + "' from position " + std::to_string(position));
    return res;
}

std::vector<audio::song> guild_player::get_playlist() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<audio::song> songs;
    songs.reserve(m_queue.size());
    for (const auto& e : m_queue) {
        songs.push_back(e.song);
    }
    return songs;
}

std::optional<audio::song> guild_player::get_played_song() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current) {
        return std::nullopt;
    }
    return m_current->song;
}

player_state guild_player::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<dpp::snowflake> guild_player::voice_channel() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        return std::nullopt;
    }
    return m_session->channel_id();
}

void guild_player::persist_locked()
{
    save_locked(std::vector<queue_entry>(m_queue.begin(), m_queue.end()));
}

void guild_player::save_locked(const std::vector<queue_entry>& entries)
{
    if (!m_deps.store) {
        return;
    }
    try {
        m_deps.store->save(m_guild_id, entries);
    } catch (const std::exception& e) {
        log(dpp::ll_warning, std::string("Failed to persist queue: ") + e.what());
    }
}

void guild_player::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_cv.wait(lock, [this] {
            return m_state == player_state::closed ||
                   (m_state == player_state::idle && !m_queue.empty() && !m_opening);
        });
        if (m_state == player_state::closed) {
            break;
        }

        queue_entry entry = std::move(m_queue.front());
        m_queue.pop_front();
        persist_locked();

        play_entry(lock, std::move(entry));
    }
}

void guild_player::play_entry(std::unique_lock<std::mutex>& lock, queue_entry entry)
{
    auto current = std::make_shared<const queue_entry>(std::move(entry));
    auto token   = std::make_shared<cancel_token>();
    const audio::song& song = current->song;
    m_current = current;
    m_token   = token;
    m_state   = player_state::loading;

    errc        failure = errc::ok;
    std::string message;

    add_result opened = open_session_locked(lock, current->voice_channel);
    std::shared_ptr<voice::voice_session> session = m_session;

    if (!opened.ok()) {
        failure = opened.code;
        message = opened.error_message;
    } else {
        lock.unlock();

        audio::resolve_result resolved;
        try {
            resolved = m_deps.source.resolve(song, *token);
        } catch (const std::exception& e) {
            resolved.code          = errc::transcode_failed;
            resolved.error_message = e.what();
        }

        bool dead_session = false;
        if (!resolved.ok()) {
            failure = resolved.code;
            message = resolved.error_message;
        } else {
            lock.lock();
            const bool go = !token->cancelled() && m_state != player_state::closed;
            if (go) {
                m_state = player_state::playing;
            }
            lock.unlock();

            if (go) {
                log(dpp::ll_info, "Now playing '" + song.title + "'");
                if (m_deps.notifier) {
                    m_deps.notifier->song_started(current->text_channel, song);
                }

                audio::frame_reader reader(resolved.frames);
                voice::stream_result streamed;
                try {
                    streamed = m_deps.streamer.stream(reader, *session, *token);
                } catch (const std::exception& e) {
                    streamed.outcome = voice::stream_outcome::transport_error;
                    message          = e.what();
                }

                std::ostringstream oss;
                oss << "Stream of '" << song.title << "' ended: " << voice::to_string(streamed.outcome)
                    << " after " << streamed.frames_sent << "/" << reader.size() << " frame(s)";
                log(dpp::ll_debug, oss.str());

                if (streamed.outcome == voice::stream_outcome::transport_error) {
                    failure      = errc::transport_error;
                    dead_session = true;
                    if (message.empty()) {
                        message = "voice connection rejected a frame";
                    }
                } else if (streamed.outcome == voice::stream_outcome::source_error) {
                    failure = resolved.frames->error();
                    message = resolved.frames->error_message();
                }
            }
        }

        lock.lock();
        if (dead_session && m_session == session) {
            // The next song reopens voice on its own channel.
            m_session.reset();
            lock.unlock();
            session->close();
            log(dpp::ll_info, "Voice session dropped after a transport error");
            lock.lock();
        }
    }

    if (failure != errc::ok && failure != errc::cancelled && failure != errc::player_closed) {
        log(dpp::ll_warning, "Skipping '" + song.title + "': " + to_string(failure) + ": " + message);
        if (m_deps.notifier) {
            lock.unlock();
            m_deps.notifier->song_failed(current->text_channel, song, failure, message);
            lock.lock();
        }
    }

    m_current.reset();
    m_token.reset();
    if (m_state != player_state::closed) {
        m_state = player_state::idle;
    }
}

} // namespace ost::player
