#pragma once

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "ost/audio/fetcher.hpp"
#include "ost/audio/frames.hpp"
#include "ost/audio/song.hpp"
#include "ost/cache/lru_cache.hpp"
#include "ost/cancel_token.hpp"
#include "ost/error.hpp"
#include "ost/log.hpp"

namespace ost::audio {

using metadata_cache = cache::lru_cache<std::string>;
using frame_cache    = cache::lru_cache<std::shared_ptr<const frame_buffer>>;

struct resolve_result {
    errc                                code = errc::ok;
    std::string                         error_message;
    std::string                         media_id;
    std::shared_ptr<const frame_buffer> frames;

    bool ok() const { return code == errc::ok; }
};

// Canonical cache key for a song url or query: surrounding whitespace, the
// scheme, a leading "www.", any fragment and trailing slashes are dropped and
// the host is lowercased. Path and query keep their case.
std::string normalize_key(const std::string& url);

std::unique_ptr<metadata_cache> make_metadata_cache(const cache::cache_config& cfg,
                                                    metrics::metrics_sink* metrics,
                                                    log_fn log);
std::unique_ptr<frame_cache> make_frame_cache(const cache::cache_config& cfg,
                                              metrics::metrics_sink* metrics,
                                              log_fn log);

// Song -> frames. Caches first, fetcher on a miss, one fetch per key no matter
// how many callers ask at once.
class audio_source {
public:
    audio_source(audio_fetcher& fetcher,
                 metadata_cache& metadata,
                 frame_cache& frames,
                 log_fn log = null_log());

    // Stops running fetches and waits for their threads to finish.
    ~audio_source();

    audio_source(const audio_source&) = delete;
    audio_source& operator=(const audio_source&) = delete;

    // Blocks until the first frame is available, the fetch fails, or the token
    // is cancelled (errc::cancelled). On a cache miss the returned buffer is
    // still being filled. A cancelled caller does not abort the shared fetch;
    // a complete result still lands in the cache.
    resolve_result resolve(const song& s, const cancel_token& token);

    std::size_t in_flight() const;

private:
    resolve_result prepare(const std::string& key, const song& s, std::shared_ptr<frame_buffer>& pending);
    void run_fetch(std::string key, song s, std::shared_ptr<std::promise<resolve_result>> prom);
    void produce(const std::string& key, const song& s, const std::string& media_id,
                 const std::shared_ptr<frame_buffer>& pending);
    void end_flight();

    audio_fetcher&  m_fetcher;
    metadata_cache& m_metadata;
    frame_cache&    m_frames;
    log_fn          m_log;

    mutable std::mutex      m_flight_mutex;
    std::condition_variable m_flight_cv;
    std::unordered_map<std::string, std::shared_future<resolve_result>> m_in_flight;
    std::size_t             m_workers = 0;
    cancel_token            m_closing;
};

} // namespace ost::audio
