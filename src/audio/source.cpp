#include "ost/audio/source.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <sstream>
#include <thread>

namespace ost::audio {

namespace {

constexpr std::chrono::milliseconds wait_poll{2};

std::string trim(const std::string& s)
{
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last  = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

resolve_result failure(errc code, std::string message)
{
    resolve_result res;
    res.code          = code;
    res.error_message = std::move(message);
    return res;
}

} // namespace

std::string normalize_key(const std::string& url)
{
    std::string key = trim(url);

    auto scheme = key.find("://");
    if (scheme != std::string::npos && scheme < key.find_first_of("/?")) {
        key.erase(0, scheme + 3);
    }

    auto fragment = key.find('#');
    if (fragment != std::string::npos) {
        key.erase(fragment);
    }

    auto host_end = key.find_first_of("/?");
    if (host_end == std::string::npos) {
        host_end = key.size();
    }
    std::transform(key.begin(), key.begin() + host_end, key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key.compare(0, 4, "www.") == 0) {
        key.erase(0, 4);
    }

    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

std::unique_ptr<metadata_cache> make_metadata_cache(const cache::cache_config& cfg,
                                                    metrics::metrics_sink* metrics,
                                                    log_fn log)
{
    return std::make_unique<metadata_cache>(
        "metadata_cache", cfg,
        [](const std::string& key, const std::string& media_id) { return key.size() + media_id.size(); },
        metrics, std::move(log));
}

std::unique_ptr<frame_cache> make_frame_cache(const cache::cache_config& cfg,
                                              metrics::metrics_sink* metrics,
                                              log_fn log)
{
    return std::make_unique<frame_cache>(
        "audio_cache", cfg,
        [](const std::string& key, const std::shared_ptr<const frame_buffer>& buffer) {
            return key.size() + (buffer ? buffer->byte_size() : 0);
        },
        metrics, std::move(log));
}

audio_source::audio_source(audio_fetcher& fetcher,
                           metadata_cache& metadata,
                           frame_cache& frames,
                           log_fn log)
    : m_fetcher(fetcher)
    , m_metadata(metadata)
    , m_frames(frames)
    , m_log(std::move(log))
{
}

audio_source::~audio_source()
{
    m_closing.cancel();
    std::unique_lock<std::mutex> lock(m_flight_mutex);
    m_flight_cv.wait(lock, [this] { return m_workers == 0; });
}

std::size_t audio_source::in_flight() const
{
    std::lock_guard<std::mutex> lock(m_flight_mutex);
    return m_in_flight.size();
}

resolve_result audio_source::resolve(const song& s, const cancel_token& token)
{
    if (token.cancelled()) {
        return failure(errc::cancelled, "cancelled before resolve");
    }

    const std::string key = normalize_key(s.url);
    std::shared_future<resolve_result> fut;
    {
        std::lock_guard<std::mutex> lock(m_flight_mutex);
        auto it = m_in_flight.find(key);
        if (it != m_in_flight.end()) {
            fut = it->second;
            m_log(dpp::ll_debug, "Joining in-flight fetch for " + key);
        } else {
            auto prom = std::make_shared<std::promise<resolve_result>>();
            fut = prom->get_future().share();
            m_in_flight.emplace(key, fut);
            ++m_workers;
            std::thread(&audio_source::run_fetch, this, key, s, prom).detach();
        }
    }

    while (fut.wait_for(wait_poll) != std::future_status::ready) {
        if (token.cancelled()) {
            return failure(errc::cancelled, "cancelled while waiting for " + key);
        }
    }

    resolve_result res = fut.get();
    if (!res.ok()) {
        return res;
    }

    const audio_frame* first = nullptr;
    switch (res.frames->wait_frame(0, &token, first)) {
    case read_status::frame:
        return res;
    case read_status::cancelled:
        return failure(errc::cancelled, "cancelled while waiting for audio of " + key);
    case read_status::failed:
        return failure(res.frames->error(), res.frames->error_message());
    case read_status::end:
        break;
    }
    return failure(errc::transcode_failed, "no audio decoded for " + key);
}

void audio_source::run_fetch(std::string key, song s, std::shared_ptr<std::promise<resolve_result>> prom)
{
    resolve_result res;
    std::shared_ptr<frame_buffer> pending;
    try {
        res = prepare(key, s, pending);
    } catch (const std::exception& e) {
        res = failure(errc::lookup_failed, std::string("fetcher threw: ") + e.what());
        pending.reset();
    }

    if (!pending) {
        if (!res.ok()) {
            std::ostringstream oss;
            oss << "Resolving '" << s.title << "' (" << key << ") failed: "
                << to_string(res.code) << ": " << res.error_message;
            m_log(dpp::ll_warning, oss.str());
        }
        // Later callers must go through the caches again, not join a settled result.
        {
            std::lock_guard<std::mutex> lock(m_flight_mutex);
            m_in_flight.erase(key);
        }
        prom->set_value(std::move(res));
        end_flight();
        return;
    }

    // Waiters stream from the buffer while it fills; the key stays in flight
    // until the producer is done so nobody starts a second fetch.
    const std::string media_id = res.media_id;
    prom->set_value(std::move(res));
    produce(key, s, media_id, pending);
    end_flight();
}

void audio_source::produce(const std::string& key, const song& s, const std::string& media_id,
                           const std::shared_ptr<frame_buffer>& pending)
{
    fetch_result fetched;
    try {
        fetched = m_fetcher.fetch(s, media_id, *pending, m_closing);
    } catch (const std::exception& e) {
        fetched.code          = errc::transcode_failed;
        fetched.error_message = std::string("fetcher threw: ") + e.what();
    }
    if (fetched.ok() && pending->size() == 0) {
        fetched.code          = errc::transcode_failed;
        fetched.error_message = "fetcher produced no frames for " + media_id;
    }

    if (fetched.ok()) {
        pending->finish();
        std::ostringstream oss;
        oss << "Fetched " << pending->size() << " frame(s) for " << media_id;
        m_log(dpp::ll_info, oss.str());
    } else {
        pending->fail(fetched.code, fetched.error_message);
        std::ostringstream oss;
        oss << "Fetching '" << s.title << "' (" << key << ") failed after " << pending->size()
            << " frame(s): " << to_string(fetched.code) << ": " << fetched.error_message;
        m_log(dpp::ll_warning, oss.str());
    }

    // Cache insert and flight removal happen together, so a new caller either
    // joins this flight or finds the frames cached.
    std::lock_guard<std::mutex> lock(m_flight_mutex);
    if (fetched.ok()) {
        if (s.duration.count() > 0) {
            m_frames.put(media_id, pending);
        } else {
            m_log(dpp::ll_debug, "Not caching live stream " + media_id);
        }
    }
    m_in_flight.erase(key);
}

void audio_source::end_flight()
{
    // Notify under the lock: once it is released the destructor may run.
    std::lock_guard<std::mutex> lock(m_flight_mutex);
    --m_workers;
    m_flight_cv.notify_all();
}

resolve_result audio_source::prepare(const std::string& key, const song& s, std::shared_ptr<frame_buffer>& pending)
{
    resolve_result res;

    if (auto cached = m_metadata.get(key)) {
        res.media_id = *cached;
    } else {
        media_lookup lookup = m_fetcher.identify(s);
        if (!lookup.ok()) {
            return failure(lookup.code, lookup.error_message);
        }
        res.media_id = lookup.media_id;
        m_metadata.put(key, lookup.media_id);
    }

    if (auto cached = m_frames.get(res.media_id)) {
        m_log(dpp::ll_debug, "Audio cache hit for " + res.media_id);
        res.frames = *cached;
        return res;
    }

    pending    = std::make_shared<frame_buffer>();
    res.frames = pending;
    return res;
}

} // namespace ost::audio
