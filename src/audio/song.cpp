#include "ost/audio/song.hpp"

#include <iomanip>
#include <sstream>

namespace ost::audio {

std::string format_duration(std::chrono::milliseconds duration)
{
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    const auto hours   = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ':' << std::setw(2) << std::setfill('0') << minutes;
    } else {
        oss << minutes;
    }
    oss << ':' << std::setw(2) << std::setfill('0') << seconds;
    return oss.str();
}

std::string song::human_name() const
{
    if (duration.count() <= 0) {
        return title;
    }
    return title + " (" + format_duration(duration) + ")";
}

} // namespace ost::audio
