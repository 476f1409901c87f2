#include "shipyard/logging.hpp"
#include "shipyard/platform.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace shipyard {

namespace {

spdlog::level::level_enum resolve_level(const LogOptions& options) {
    std::string env_level = safe_getenv("SHIPYARD_LOG_LEVEL");
    if (!env_level.empty()) {
        auto level = spdlog::level::from_str(env_level);
        // from_str maps unrecognised names to off; only honour "off" when asked for
        if (level != spdlog::level::off || env_level == "off") {
            return level;
        }
    }

    if (options.verbose) return spdlog::level::debug;
    if (options.quiet) return spdlog::level::warn;
    return spdlog::level::info;
}

} // namespace

void init_logging(const LogOptions& options) {
    auto logger = spdlog::get("shipyard");
    if (!logger) {
        logger = spdlog::stderr_color_mt("shipyard");
    }
    logger->set_pattern("%^%l%$: %v");
    logger->set_level(resolve_level(options));
    spdlog::set_default_logger(logger);
}

} // namespace shipyard
