#pragma once

#include <string>

namespace shipyard {

struct LogOptions {
    bool verbose = false;     // debug
    bool quiet = false;       // warnings and errors only
};

// Installs a stderr color logger named "shipyard" as the spdlog default.
// SHIPYARD_LOG_LEVEL (trace, debug, info, warn, error, off) overrides
// the level chosen from the options.
void init_logging(const LogOptions& options);

} // namespace shipyard
