#include "ost/error.hpp"

namespace ost {

const char* to_string(errc code)
{
    switch (code) {
        case errc::ok:                return "ok";
        case errc::lookup_failed:     return "lookup failed";
        case errc::transcode_failed:  return "transcode failed";
        case errc::invalid_position:  return "invalid position";
        case errc::transport_error:   return "transport error";
        case errc::voice_unavailable: return "voice unavailable";
        case errc::player_closed:     return "player closed";
        case errc::cancelled:         return "cancelled";
    }
    return "unknown";
}

} // namespace ost
