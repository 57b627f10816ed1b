#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace ost::metrics {

// Counter sink. The engine only ever increments; nothing it does depends on
// what the sink does with the numbers.
class metrics_sink {
public:
    virtual ~metrics_sink() = default;

    virtual void command_used(const std::string& command) = 0;
    virtual void cache_hit(const std::string& cache_name) = 0;
    virtual void cache_miss(const std::string& cache_name) = 0;
};

// In-process counters, readable for logging and tests.
class counter_metrics : public metrics_sink {
public:
    void command_used(const std::string& command) override;
    void cache_hit(const std::string& cache_name) override;
    void cache_miss(const std::string& cache_name) override;

    std::uint64_t commands(const std::string& command) const;
    std::uint64_t hits(const std::string& cache_name) const;
    std::uint64_t misses(const std::string& cache_name) const;

    // One line per counter, "name{label} value".
    std::string summary() const;

private:
    mutable std::mutex                   m_mutex;
    std::map<std::string, std::uint64_t> m_commands;
    std::map<std::string, std::uint64_t> m_hits;
    std::map<std::string, std::uint64_t> m_misses;
};

} // namespace ost::metrics
