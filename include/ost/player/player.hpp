#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <dpp/snowflake.h>

#include "ost/audio/song.hpp"
#include "ost/audio/source.hpp"
#include "ost/cancel_token.hpp"
#include "ost/error.hpp"
#include "ost/log.hpp"
#include "ost/player/notifier.hpp"
#include "ost/player/playlist_store.hpp"
#include "ost/voice/streamer.hpp"
#include "ost/voice/transport.hpp"

namespace ost::player {

enum class player_state {
    idle,
    loading,
    playing,
    closed
};

const char* to_string(player_state state);

struct add_result {
    errc        code = errc::ok;
    std::string error_message;

    bool ok() const { return code == errc::ok; }
};

struct remove_result {
    errc                       code = errc::ok;
    std::optional<audio::song> removed;

    bool ok() const { return code == errc::ok; }
};

// Everything a player talks to. The referenced objects outlive the player.
struct player_deps {
    audio::audio_source&    source;
    voice::voice_transport& transport;
    voice::frame_streamer&  streamer;
    player_notifier*        notifier = nullptr;
    playlist_store*         store    = nullptr;
    log_fn                  log      = null_log();
};

// One guild's queue and playback state machine. Every mutation goes through
// m_mutex; a single worker thread owns the idle -> loading -> playing cycle,
// so commands only ever hold the lock briefly and stay responsive while a
// song streams.
class guild_player {
public:
    // Reads the saved queue, if any. Nothing plays until start().
    guild_player(dpp::snowflake guild_id, player_deps deps);

    // Closes the voice session and joins the worker. The saved queue is left
    // as it was last written.
    ~guild_player();

    guild_player(const guild_player&) = delete;
    guild_player& operator=(const guild_player&) = delete;

    // Opens the voice session on first use, then enqueues. A session that
    // cannot be opened is reported as errc::voice_unavailable and nothing is
    // queued.
    add_result add_song(dpp::snowflake text_channel, dpp::snowflake voice_channel, audio::song s);

    // Cancels the current song; the worker moves on. No-op when idle.
    void skip_song();

    // Starts the worker. Call once.
    void start();

    // Terminal and idempotent. Drops the queue and its saved copy.
    void stop();

    // Terminal like stop(), for process exit: the playing song and the queue
    // are saved so the next player for this guild resumes them.
    void shutdown();

    // 1-based position within the pending queue (never the playing song).
    remove_result remove_song(int position);

    std::vector<audio::song> get_playlist() const;
    std::optional<audio::song> get_played_song() const;

    player_state state() const;
    std::optional<dpp::snowflake> voice_channel() const;
    dpp::snowflake guild_id() const { return m_guild_id; }

private:
    enum class close_mode { discard_queue, save_queue, leave_store };

    void close(close_mode mode);
    void run();
    void play_entry(std::unique_lock<std::mutex>& lock, queue_entry entry);
    // May release the lock while connecting.
    add_result open_session_locked(std::unique_lock<std::mutex>& lock, dpp::snowflake voice_channel);
    void persist_locked();
    void save_locked(const std::vector<queue_entry>& entries);
    void log(dpp::loglevel level, const std::string& msg) const;

    const dpp::snowflake m_guild_id;
    player_deps          m_deps;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    player_state            m_state = player_state::idle;
    std::deque<queue_entry> m_queue;

    std::shared_ptr<const queue_entry>     m_current;
    std::shared_ptr<cancel_token>          m_token;     // current song only
    std::shared_ptr<voice::voice_session> m_session;
    bool                                   m_opening = false;

    std::thread m_worker;
};

} // namespace ost::player
