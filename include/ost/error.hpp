#pragma once

#include <string>

namespace ost {

// Error codes carried by every result struct in the engine.
enum class errc {
    ok,
    lookup_failed,
    transcode_failed,
    invalid_position,
    transport_error,
    voice_unavailable,
    player_closed,
    cancelled
};

const char* to_string(errc code);

} // namespace ost
