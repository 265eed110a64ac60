//
//  logging.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

namespace wordcue {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

bool parse_log_verbosity(std::string_view name, LogVerbosity &out) {
    if (name == "debug") {
        out = LogVerbosity::Debug;
    } else if (name == "info") {
        out = LogVerbosity::Info;
    } else if (name == "warn" || name == "warning") {
        out = LogVerbosity::Warn;
    } else if (name == "error") {
        out = LogVerbosity::Error;
    } else {
        return false;
    }
    return true;
}

}  // namespace wordcue
