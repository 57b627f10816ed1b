#pragma once

#include <memory>
#include <string>

#include <dpp/snowflake.h>

#include "ost/audio/frames.hpp"
#include "ost/error.hpp"

namespace ost::voice {

// One live voice connection for one guild.
class voice_session {
public:
    virtual ~voice_session() = default;

    // Queues one frame for playback. false means the connection is gone.
    virtual bool send_frame(const audio::audio_frame& frame) = 0;

    // Drops audio already handed over but not yet played (skip/stop).
    virtual void discard_pending() = 0;

    virtual void close() = 0;

    virtual dpp::snowflake channel_id() const = 0;
};

struct open_result {
    errc                           code = errc::ok;
    std::string                    error_message;
    std::shared_ptr<voice_session> session;

    bool ok() const { return code == errc::ok && session != nullptr; }
};

class voice_transport {
public:
    virtual ~voice_transport() = default;

    // errc::voice_unavailable when the channel cannot be joined.
    virtual open_result open(dpp::snowflake guild_id, dpp::snowflake channel_id) = 0;
};

} // namespace ost::voice
