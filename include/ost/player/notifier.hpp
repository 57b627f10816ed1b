#pragma once

#include <string>

#include <dpp/snowflake.h>

#include "ost/audio/song.hpp"
#include "ost/error.hpp"

namespace ost::player {

// User-visible messaging for things that happen off the command path.
class player_notifier {
public:
    virtual ~player_notifier() = default;

    virtual void song_started(dpp::snowflake text_channel, const audio::song& s) = 0;
    virtual void song_failed(dpp::snowflake text_channel,
                             const audio::song& s,
                             errc code,
                             const std::string& message) = 0;
};

} // namespace ost::player
