#pragma once

#include <string>

#include "ost/audio/frames.hpp"
#include "ost/audio/song.hpp"
#include "ost/cancel_token.hpp"
#include "ost/error.hpp"

namespace ost::audio {

struct media_lookup {
    errc        code = errc::ok;
    std::string error_message;
    std::string media_id;

    bool ok() const { return code == errc::ok; }
};

struct fetch_result {
    errc        code = errc::ok;
    std::string error_message;

    bool ok() const { return code == errc::ok; }
};

// External fetch/transcode collaborator. Only called on cache misses.
class audio_fetcher {
public:
    virtual ~audio_fetcher() = default;

    // Resolves the song to the provider's stable media id (errc::lookup_failed).
    virtual media_lookup identify(const song& s) = 0;

    // Downloads and transcodes the media, pushing each frame into `out` as soon
    // as it is encoded, and returns once the song is complete
    // (errc::transcode_failed). Returns early with errc::cancelled when `stop`
    // fires. The caller finishes or fails `out`.
    virtual fetch_result fetch(const song& s, const std::string& media_id,
                               frame_buffer& out, const cancel_token& stop) = 0;
};

} // namespace ost::audio
