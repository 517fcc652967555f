// SHAREGOV - Locked Balance Ledger Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/lock_ledger.h>

#include <algorithm>
#include <sstream>

namespace sharegov {
namespace governance {

std::string LockRecord::ToString() const {
    std::ostringstream oss;
    oss << "Lock(holder=" << holder
        << ", class=" << shareClass
        << ", amount=" << amount
        << ", unlock=" << unlockTime << ")";
    return oss.str();
}

const LockRecord* LockLedger::Get(const HolderId& holder, ShareClassId shareClass) const {
    auto it = locks_.find(Key(holder, shareClass));
    return it == locks_.end() ? nullptr : &it->second;
}

std::pair<Status, LockRecord> LockLedger::PrepareLock(const HolderId& holder,
                                                      ShareClassId shareClass,
                                                      Amount amount, Timestamp unlockTime,
                                                      Timestamp now) const {
    if (amount <= 0 || !AmountRange(amount)) {
        return {Status::InvalidAmount("lock amount must be positive"), LockRecord{}};
    }
    if (unlockTime <= now) {
        return {Status::InvalidDeadline("unlock time must be in the future"), LockRecord{}};
    }

    LockRecord record;
    record.holder = holder;
    record.shareClass = shareClass;
    if (const LockRecord* existing = Get(holder, shareClass)) {
        record = *existing;
        if (record.amount > MAX_AMOUNT - amount) {
            return {Status::InvalidAmount("locked amount overflows"), LockRecord{}};
        }
    }
    record.amount += amount;
    record.unlockTime = std::max(record.unlockTime, unlockTime);
    record.lockedAt = now;
    return {Status::Ok(), record};
}

std::pair<Status, LockRecord> LockLedger::PrepareUnlock(const HolderId& holder,
                                                        ShareClassId shareClass,
                                                        Amount amount, Timestamp now) const {
    if (amount <= 0) {
        return {Status::InvalidAmount("unlock amount must be positive"), LockRecord{}};
    }
    const LockRecord* existing = Get(holder, shareClass);
    if (!existing) {
        return {Status::InsufficientLocked("nothing locked for " + holder + " in class " +
                                           std::to_string(shareClass)), LockRecord{}};
    }
    if (!existing->IsUnlockable(now)) {
        return {Status::LockActive("locked until " + std::to_string(existing->unlockTime)),
                LockRecord{}};
    }
    if (amount > existing->amount) {
        return {Status::InsufficientLocked("only " + std::to_string(existing->amount) +
                                           " locked"), LockRecord{}};
    }

    LockRecord record = *existing;
    record.amount -= amount;
    return {Status::Ok(), record};
}

void LockLedger::Put(LockRecord record) {
    Key key(record.holder, record.shareClass);
    if (record.amount == 0) {
        locks_.erase(key);
        return;
    }
    locks_[key] = std::move(record);
}

std::vector<LockRecord> LockLedger::GetLocks(const HolderId& holder) const {
    std::vector<LockRecord> result;
    for (auto it = locks_.lower_bound(Key(holder, 0));
         it != locks_.end() && it->first.first == holder; ++it) {
        result.push_back(it->second);
    }
    return result;
}

Amount LockLedger::TotalLocked(ShareClassId shareClass) const {
    Amount total = 0;
    for (const auto& [key, record] : locks_) {
        if (key.second == shareClass) {
            total += record.amount;
        }
    }
    return total;
}

} // namespace governance
} // namespace sharegov
