#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "ost/log.hpp"
#include "ost/metrics/metrics.hpp"

namespace ost::cache {

struct cache_config {
    std::size_t          capacity_bytes = 64 * 1024 * 1024;
    std::chrono::seconds ttl{0};    // 0 = entries never expire
};

// Byte-bounded LRU map. Each value's weight comes from the sizer; the sum of
// weights never exceeds capacity_bytes. Entries are replaced or evicted whole.
template <typename Value>
class lru_cache {
public:
    using clock    = std::chrono::steady_clock;
    using sizer_fn = std::function<std::size_t(const std::string&, const Value&)>;

    lru_cache(std::string name,
              const cache_config& cfg,
              sizer_fn sizer,
              metrics::metrics_sink* metrics = nullptr,
              log_fn log = null_log())
        : m_name(std::move(name))
        , m_cfg(cfg)
        , m_sizer(std::move(sizer))
        , m_metrics(metrics)
        , m_log(std::move(log))
    {
    }

    lru_cache(const lru_cache&) = delete;
    lru_cache& operator=(const lru_cache&) = delete;

    // Counts a hit or a miss and marks the entry as most recently used.
    std::optional<Value> get(const std::string& key)
    {
        std::optional<Value> found;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(key);
            if (it != m_index.end() && expired_locked(*it->second)) {
                erase_locked(it);
                it = m_index.end();
            }
            if (it != m_index.end()) {
                it->second->last_access = clock::now();
                m_entries.splice(m_entries.begin(), m_entries, it->second);
                found = it->second->value;
                ++m_hits;
            } else {
                ++m_misses;
            }
        }

        if (m_metrics) {
            if (found) {
                m_metrics->cache_hit(m_name);
            } else {
                m_metrics->cache_miss(m_name);
            }
        }
        return found;
    }

    // No counters, no recency update.
    std::optional<Value> peek(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(key);
        if (it == m_index.end() || expired_locked(*it->second)) {
            return std::nullopt;
        }
        return it->second->value;
    }

    // Returns false when the value alone is larger than the whole cache; the
    // cache is left untouched in that case.
    bool put(const std::string& key, Value value)
    {
        const std::size_t weight = m_sizer(key, value);
        if (weight > m_cfg.capacity_bytes) {
            std::ostringstream oss;
            oss << "Cache '" << m_name << "': entry " << key << " (" << weight
                << " bytes) exceeds capacity " << m_cfg.capacity_bytes << ", not cached";
            m_log(dpp::ll_warning, oss.str());
            return false;
        }

        std::size_t evicted = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(key);
            if (it != m_index.end()) {
                erase_locked(it);
            }

            while (!m_entries.empty() && m_bytes + weight > m_cfg.capacity_bytes) {
                auto victim = m_index.find(m_entries.back().key);
                erase_locked(victim);
                ++evicted;
            }

            const auto now = clock::now();
            m_entries.push_front(entry{key, std::move(value), weight, now, now});
            m_index.emplace(key, m_entries.begin());
            m_bytes += weight;
        }

        if (evicted > 0) {
            std::ostringstream oss;
            oss << "Cache '" << m_name << "' at capacity, evicted " << evicted
                << " entr" << (evicted == 1 ? "y" : "ies") << " for " << key;
            m_log(dpp::ll_debug, oss.str());
        }
        return true;
    }

    bool erase(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        erase_locked(it);
        return true;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        m_index.clear();
        m_bytes = 0;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    std::size_t bytes() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bytes;
    }

    std::size_t hits() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_hits;
    }

    std::size_t misses() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_misses;
    }

    std::size_t capacity() const { return m_cfg.capacity_bytes; }
    const std::string& name() const { return m_name; }

private:
    struct entry {
        std::string       key;
        Value             value;
        std::size_t       weight = 0;
        clock::time_point inserted;
        clock::time_point last_access;
    };

    using entry_list = std::list<entry>;
    using index_map  = std::unordered_map<std::string, typename entry_list::iterator>;

    bool expired_locked(const entry& e) const
    {
        return m_cfg.ttl.count() > 0 && clock::now() - e.inserted > m_cfg.ttl;
    }

    void erase_locked(typename index_map::iterator it)
    {
        m_bytes -= it->second->weight;
        m_entries.erase(it->second);
        m_index.erase(it);
    }

    std::string            m_name;
    cache_config           m_cfg;
    sizer_fn               m_sizer;
    metrics::metrics_sink* m_metrics;
    log_fn                 m_log;

    mutable std::mutex m_mutex;
    entry_list         m_entries;   // front = most recently used
    index_map          m_index;
    std::size_t        m_bytes  = 0;
    std::size_t        m_hits   = 0;
    std::size_t        m_misses = 0;
};

} // namespace ost::cache
