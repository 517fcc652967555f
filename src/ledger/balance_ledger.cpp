// SHAREGOV - In-Memory Balance Ledger Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/ledger/balance_ledger.h>
#include <sharegov/util/logging.h>

namespace sharegov {
namespace ledger {

const MemoryBalanceLedger::Position* MemoryBalanceLedger::Find(
    const HolderId& holder, ShareClassId shareClass) const {
    auto it = positions_.find(Key(holder, shareClass));
    return it == positions_.end() ? nullptr : &it->second;
}

void MemoryBalanceLedger::EraseIfEmpty(std::map<Key, Position>::iterator it) {
    if (it->second.balance == 0 && it->second.locked == 0) {
        positions_.erase(it);
    }
}

Amount MemoryBalanceLedger::BalanceOf(const HolderId& holder, ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Position* position = Find(holder, shareClass);
    return position ? position->balance : 0;
}

Amount MemoryBalanceLedger::LockedOf(const HolderId& holder, ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Position* position = Find(holder, shareClass);
    return position ? position->locked : 0;
}

Amount MemoryBalanceLedger::TotalMinted(ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supply_.find(shareClass);
    return it == supply_.end() ? 0 : it->second;
}

bool MemoryBalanceLedger::Mint(const HolderId& holder, ShareClassId shareClass, Amount amount) {
    if (amount <= 0 || !AmountRange(amount) || !IsValidHolderId(holder)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Amount& supply = supply_[shareClass];
    if (supply > MAX_AMOUNT - amount) {
        return false;
    }
    supply += amount;
    positions_[Key(holder, shareClass)].balance += amount;

    LOG_TRACE(util::LogCategory::LEDGER) << "mint " << amount << " of class "
                                         << shareClass << " to " << holder;
    return true;
}

bool MemoryBalanceLedger::Burn(const HolderId& holder, ShareClassId shareClass, Amount amount) {
    if (amount <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(Key(holder, shareClass));
    if (it == positions_.end() || it->second.balance - it->second.locked < amount) {
        return false;
    }
    it->second.balance -= amount;
    supply_[shareClass] -= amount;
    EraseIfEmpty(it);
    return true;
}

bool MemoryBalanceLedger::Transfer(const HolderId& from, const HolderId& to,
                                   ShareClassId shareClass, Amount amount) {
    if (amount <= 0 || !IsValidHolderId(to)) {
        return false;
    }
    if (from == to) {
        return SpendableOf(from, shareClass) >= amount;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto src = positions_.find(Key(from, shareClass));
    if (src == positions_.end() || src->second.balance - src->second.locked < amount) {
        return false;
    }
    src->second.balance -= amount;
    positions_[Key(to, shareClass)].balance += amount;
    EraseIfEmpty(src);
    return true;
}

bool MemoryBalanceLedger::Lock(const HolderId& holder, ShareClassId shareClass, Amount amount) {
    if (amount <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(Key(holder, shareClass));
    if (it == positions_.end() || it->second.balance - it->second.locked < amount) {
        return false;
    }
    it->second.locked += amount;
    return true;
}

bool MemoryBalanceLedger::Unlock(const HolderId& holder, ShareClassId shareClass, Amount amount) {
    if (amount <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(Key(holder, shareClass));
    if (it == positions_.end() || it->second.locked < amount) {
        return false;
    }
    it->second.locked -= amount;
    return true;
}

size_t MemoryBalanceLedger::HolderCount(ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [key, position] : positions_) {
        if (key.second == shareClass && position.balance > 0) {
            ++count;
        }
    }
    return count;
}

size_t MemoryBalanceLedger::PositionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

std::vector<std::pair<HolderId, Amount>> MemoryBalanceLedger::GetHolders(
    ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<HolderId, Amount>> holders;
    for (const auto& [key, position] : positions_) {
        if (key.second == shareClass && position.balance > 0) {
            holders.emplace_back(key.first, position.balance);
        }
    }
    return holders;
}

} // namespace ledger
} // namespace sharegov
