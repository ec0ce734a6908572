#pragma once

#include <functional>
#include <string>

#include <dpp/dpp.h>

namespace aurora {

/// Where core components send their log lines. The bot binds this to
/// dpp::cluster::log; an empty sink drops everything.
using log_sink = std::function<void(dpp::loglevel, const std::string&)>;

inline void log_to(const log_sink& sink, dpp::loglevel level, const std::string& msg) {
    if (sink) {
        sink(level, msg);
    }
}

} // namespace aurora
