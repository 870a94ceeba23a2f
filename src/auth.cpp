// =============================================================================
// auth.cpp - Owning Authority
// =============================================================================

#include "lendcore/auth.hpp"
#include <mutex>

namespace lendcore {

int32_t Authority::initialize(const Account& owner) {
    std::unique_lock lock(mutex_);
    if (owner_) {
        return errors::ALREADY_INITIALIZED;
    }
    owner_ = owner;
    return errors::OK;
}

bool Authority::initialized() const {
    std::shared_lock lock(mutex_);
    return owner_.has_value();
}

std::optional<Account> Authority::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

int32_t Authority::require_owner(const Account& caller) const {
    std::shared_lock lock(mutex_);
    if (!owner_) return errors::NOT_INITIALIZED;
    if (*owner_ != caller) return errors::UNAUTHORIZED;
    return errors::OK;
}

} // namespace lendcore
