#pragma once

#include <string>
#include <vector>

#include "ost/audio/song.hpp"
#include "ost/error.hpp"

namespace ost::audio {

struct lookup_result {
    errc              code = errc::ok;
    std::string       error_message;
    std::vector<song> songs;    // in provider order

    bool ok() const { return code == errc::ok; }
};

// Search / metadata provider. Used by the command layer; players only ever
// see songs it already resolved.
class song_lookup {
public:
    virtual ~song_lookup() = default;

    // errc::lookup_failed on provider errors and when nothing matched.
    virtual lookup_result lookup_songs(const std::string& query) = 0;
};

} // namespace ost::audio
