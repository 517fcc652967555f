// SHAREGOV - Access Control Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/ledger/access_control.h>

namespace sharegov {
namespace ledger {

bool OperatorRegistry::IsAuthorized(const HolderId& caller) const {
    if (allowAll_) {
        return IsValidHolderId(caller);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return operators_.count(caller) > 0;
}

bool OperatorRegistry::Add(const HolderId& op) {
    if (!IsValidHolderId(op)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return operators_.insert(op).second;
}

bool OperatorRegistry::Remove(const HolderId& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    return operators_.erase(op) > 0;
}

std::vector<HolderId> OperatorRegistry::GetOperators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<HolderId>(operators_.begin(), operators_.end());
}

size_t OperatorRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operators_.size();
}

} // namespace ledger
} // namespace sharegov
