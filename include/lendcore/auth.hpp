#ifndef LENDCORE_AUTH_HPP
#define LENDCORE_AUTH_HPP

#include <optional>
#include <shared_mutex>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// Authority - the deploying account allowed to change registry-level state
// =============================================================================

class Authority {
public:
    Authority() = default;
    explicit Authority(const Account& owner) : owner_(owner) {}

    // Non-copyable
    Authority(const Authority&) = delete;
    Authority& operator=(const Authority&) = delete;

    // Set once. Fails with ALREADY_INITIALIZED afterwards.
    int32_t initialize(const Account& owner);

    bool initialized() const;
    std::optional<Account> owner() const;

    // OK, NOT_INITIALIZED or UNAUTHORIZED
    int32_t require_owner(const Account& caller) const;

private:
    std::optional<Account> owner_;
    mutable std::shared_mutex mutex_;
};

} // namespace lendcore

#endif // LENDCORE_AUTH_HPP
