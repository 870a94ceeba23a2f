// =============================================================================
// log.cpp - spdlog Level Mapping
// =============================================================================

#include "lendcore/log.hpp"

namespace lendcore::log {

bool set_level(std::string_view level) {
    spdlog::level::level_enum parsed;
    if (level == "trace") parsed = spdlog::level::trace;
    else if (level == "debug") parsed = spdlog::level::debug;
    else if (level == "info") parsed = spdlog::level::info;
    else if (level == "warn") parsed = spdlog::level::warn;
    else if (level == "error") parsed = spdlog::level::err;
    else if (level == "critical") parsed = spdlog::level::critical;
    else if (level == "off") parsed = spdlog::level::off;
    else return false;

    spdlog::set_level(parsed);
    return true;
}

} // namespace lendcore::log
