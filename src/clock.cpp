// =============================================================================
// clock.cpp - Wall Clock
// =============================================================================

#include "lendcore/clock.hpp"
#include <chrono>

namespace lendcore {

uint64_t SystemClock::now() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace lendcore
