// SHAREGOV - Balance Ledger Interface
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// The governance engine reads share balances from a multi-asset ledger it
// does not own. This header defines that contract and a thread-safe
// in-memory reference ledger.

#ifndef SHAREGOV_LEDGER_BALANCE_LEDGER_H
#define SHAREGOV_LEDGER_BALANCE_LEDGER_H

#include <sharegov/core/serialize.h>
#include <sharegov/core/types.h>

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace sharegov {
namespace ledger {

// ============================================================================
// Balance Ledger Interface
// ============================================================================

/**
 * Multi-asset share ledger as seen by the governance engine.
 *
 * BalanceOf() is the holder's full position in a class and includes shares
 * held in escrow by Lock(). Escrowed shares cannot be transferred or burned
 * until Unlock() returns them to the spendable balance.
 */
class BalanceLedger {
public:
    virtual ~BalanceLedger() = default;

    /// Total shares held (spendable + locked)
    virtual Amount BalanceOf(const HolderId& holder, ShareClassId shareClass) const = 0;

    /// Shares currently held in escrow
    virtual Amount LockedOf(const HolderId& holder, ShareClassId shareClass) const = 0;

    /// Total minted supply of a class (net of burns)
    virtual Amount TotalMinted(ShareClassId shareClass) const = 0;

    /// Number of holders with a non-zero balance of a class
    virtual size_t HolderCount(ShareClassId shareClass) const = 0;

    /// Move spendable shares between holders; false if not enough spendable
    virtual bool Transfer(const HolderId& from, const HolderId& to,
                          ShareClassId shareClass, Amount amount) = 0;

    /// Move spendable shares into escrow; false if not enough spendable
    virtual bool Lock(const HolderId& holder, ShareClassId shareClass, Amount amount) = 0;

    /// Return escrowed shares to spendable; false if not enough locked
    virtual bool Unlock(const HolderId& holder, ShareClassId shareClass, Amount amount) = 0;

    /// Spendable shares (balance minus locked)
    Amount SpendableOf(const HolderId& holder, ShareClassId shareClass) const {
        return BalanceOf(holder, shareClass) - LockedOf(holder, shareClass);
    }
};

// ============================================================================
// In-Memory Reference Ledger
// ============================================================================

class MemoryBalanceLedger : public BalanceLedger {
public:
    MemoryBalanceLedger() = default;

    Amount BalanceOf(const HolderId& holder, ShareClassId shareClass) const override;
    Amount LockedOf(const HolderId& holder, ShareClassId shareClass) const override;
    Amount TotalMinted(ShareClassId shareClass) const override;
    size_t HolderCount(ShareClassId shareClass) const override;

    bool Transfer(const HolderId& from, const HolderId& to,
                  ShareClassId shareClass, Amount amount) override;
    bool Lock(const HolderId& holder, ShareClassId shareClass, Amount amount) override;
    bool Unlock(const HolderId& holder, ShareClassId shareClass, Amount amount) override;

    /// Create new shares for a holder; false on invalid amount or overflow
    bool Mint(const HolderId& holder, ShareClassId shareClass, Amount amount);

    /// Destroy spendable shares; false if not enough spendable
    bool Burn(const HolderId& holder, ShareClassId shareClass, Amount amount);

    /// Number of (holder, class) positions with a non-zero balance
    size_t PositionCount() const;

    /// Holders of a class with their balances, ordered by holder id
    std::vector<std::pair<HolderId, Amount>> GetHolders(ShareClassId shareClass) const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        std::lock_guard<std::mutex> lock(mutex_);
        WriteCompactSize(s, positions_.size());
        for (const auto& [key, position] : positions_) {
            Serialize(s, key.first);
            Serialize(s, key.second);
            Serialize(s, position.balance);
            Serialize(s, position.locked);
        }
    }

    /// Replace the ledger contents; supply totals are recomputed
    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        std::map<Key, Position> positions;
        std::map<ShareClassId, Amount> supply;
        uint64_t count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            Key key;
            Position position;
            Unserialize(s, key.first);
            Unserialize(s, key.second);
            Unserialize(s, position.balance);
            Unserialize(s, position.locked);
            if (!AmountRange(position.balance) || position.locked < 0 ||
                position.locked > position.balance) {
                throw std::ios_base::failure("MemoryBalanceLedger: invalid position");
            }
            supply[key.second] += position.balance;
            positions.emplace(std::move(key), position);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        positions_ = std::move(positions);
        supply_ = std::move(supply);
    }

private:
    using Key = std::pair<HolderId, ShareClassId>;

    struct Position {
        Amount balance{0};
        Amount locked{0};
    };

    const Position* Find(const HolderId& holder, ShareClassId shareClass) const;
    void EraseIfEmpty(std::map<Key, Position>::iterator it);

    std::map<Key, Position> positions_;
    std::map<ShareClassId, Amount> supply_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace sharegov

#endif // SHAREGOV_LEDGER_BALANCE_LEDGER_H
