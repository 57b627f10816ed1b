#include "ost/metrics/metrics.hpp"

#include <sstream>

namespace ost::metrics {

namespace {

std::uint64_t lookup(const std::map<std::string, std::uint64_t>& counters, const std::string& key)
{
    auto it = counters.find(key);
    return it == counters.end() ? 0 : it->second;
}

} // namespace

void counter_metrics::command_used(const std::string& command)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_commands[command];
}

void counter_metrics::cache_hit(const std::string& cache_name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_hits[cache_name];
}

void counter_metrics::cache_miss(const std::string& cache_name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_misses[cache_name];
}

std::uint64_t counter_metrics::commands(const std::string& command) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lookup(m_commands, command);
}

std::uint64_t counter_metrics::hits(const std::string& cache_name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lookup(m_hits, cache_name);
}

std::uint64_t counter_metrics::misses(const std::string& cache_name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lookup(m_misses, cache_name);
}

std::string counter_metrics::summary() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::ostringstream oss;
    for (const auto& [name, value] : m_commands) {
        oss << "command_usage{command=\"" << name << "\"} " << value << '\n';
    }
    for (const auto& [name, value] : m_hits) {
        oss << "cache_hits{cache=\"" << name << "\"} " << value << '\n';
    }
    for (const auto& [name, value] : m_misses) {
        oss << "cache_misses{cache=\"" << name << "\"} " << value << '\n';
    }
    return oss.str();
}

} // namespace ost::metrics
