#pragma once

#include <functional>
#include <string>

#include <dpp/misc-enum.h>      // dpp::loglevel

namespace ost {

// Log callback handed to the engine. main.cpp binds it to dpp::cluster::log.
using log_fn = std::function<void(dpp::loglevel, const std::string&)>;

// Sink that drops everything; used when no logger is wired.
inline log_fn null_log()
{
    return [](dpp::loglevel, const std::string&) {};
}

} // namespace ost
