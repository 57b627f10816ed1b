#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ost::audio {

struct song {
    std::string                url;          // identifier handed to the fetcher
    std::string                title;
    std::chrono::milliseconds  duration{0};
    std::optional<std::string> thumbnail_url;
    std::string                requested_by;

    // "Title (3:45)", or just the title for streams of unknown length.
    std::string human_name() const;
};

// m:ss, or h:mm:ss past the hour.
std::string format_duration(std::chrono::milliseconds duration);

} // namespace ost::audio
