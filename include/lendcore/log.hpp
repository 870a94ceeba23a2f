#ifndef LENDCORE_LOG_HPP
#define LENDCORE_LOG_HPP

#include <string_view>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace lendcore::log {

// "trace", "debug", "info", "warn", "error", "critical" or "off".
// Returns false and leaves the level unchanged for anything else.
bool set_level(std::string_view level);

// Short form for log lines
inline std::string code(int32_t status) {
    return errors::to_string(status);
}

} // namespace lendcore::log

#endif // LENDCORE_LOG_HPP
