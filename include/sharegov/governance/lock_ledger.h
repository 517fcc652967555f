// SHAREGOV - Locked Balance Ledger
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Escrow records owned by the governance engine: (holder, share class) ->
// locked amount and unlock time. The shares themselves are held in escrow
// by the balance ledger through its lock/unlock contract.

#ifndef SHAREGOV_GOVERNANCE_LOCK_LEDGER_H
#define SHAREGOV_GOVERNANCE_LOCK_LEDGER_H

#include <sharegov/governance/types.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Lock Record
// ============================================================================

struct LockRecord {
    HolderId holder;
    ShareClassId shareClass{0};
    Amount amount{0};

    /// Earliest time the amount may be unlocked
    Timestamp unlockTime{0};

    /// Time of the most recent lock
    Timestamp lockedAt{0};

    bool IsUnlockable(Timestamp now) const { return now >= unlockTime; }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, holder);
        Serialize(s, shareClass);
        Serialize(s, amount);
        Serialize(s, unlockTime);
        Serialize(s, lockedAt);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, holder);
        Unserialize(s, shareClass);
        Unserialize(s, amount);
        Unserialize(s, unlockTime);
        Unserialize(s, lockedAt);
    }
};

// ============================================================================
// Lock Ledger
// ============================================================================

/**
 * Lock records keyed by (holder, share class).
 *
 * A second lock on the same key adds to the amount and keeps the later
 * unlock time. A record is removed once its amount reaches zero. Not
 * internally synchronized.
 */
class LockLedger {
public:
    using Key = std::pair<HolderId, ShareClassId>;

    const LockRecord* Get(const HolderId& holder, ShareClassId shareClass) const;

    /**
     * Record that would result from locking amount more shares.
     * InvalidAmount if the amount is not positive or the sum overflows;
     * InvalidDeadline if unlockTime is not after now.
     */
    std::pair<Status, LockRecord> PrepareLock(const HolderId& holder, ShareClassId shareClass,
                                              Amount amount, Timestamp unlockTime,
                                              Timestamp now) const;

    /**
     * Record that would remain after unlocking amount shares (amount 0 means
     * the record is cleared). InvalidAmount; InsufficientLocked without a record
     * or if amount exceeds the locked amount; LockActive before the unlock
     * time.
     */
    std::pair<Status, LockRecord> PrepareUnlock(const HolderId& holder, ShareClassId shareClass,
                                                Amount amount, Timestamp now) const;

    /// Store a record, or erase the key when the record's amount is zero
    void Put(LockRecord record);

    /// All records of one holder
    std::vector<LockRecord> GetLocks(const HolderId& holder) const;

    /// Sum of locked amounts in a class
    Amount TotalLocked(ShareClassId shareClass) const;

    size_t Size() const { return locks_.size(); }
    void Clear() { locks_.clear(); }

private:
    std::map<Key, LockRecord> locks_;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_LOCK_LEDGER_H
