// SHAREGOV - Access Control
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Authorization capability consulted by the governance engine before
// privileged operations (proposal creation, opening votes, finalization,
// fraction registration).

#ifndef SHAREGOV_LEDGER_ACCESS_CONTROL_H
#define SHAREGOV_LEDGER_ACCESS_CONTROL_H

#include <sharegov/core/types.h>

#include <mutex>
#include <set>
#include <vector>

namespace sharegov {
namespace ledger {

/// Decides whether a caller may perform privileged governance operations
class AccessControl {
public:
    virtual ~AccessControl() = default;

    virtual bool IsAuthorized(const HolderId& caller) const = 0;
};

/**
 * Allow-list of operator identities.
 *
 * An empty registry authorizes nobody unless it was built with
 * allowAll = true, which the CLI uses when no operator is configured.
 */
class OperatorRegistry : public AccessControl {
public:
    explicit OperatorRegistry(bool allowAll = false) : allowAll_(allowAll) {}

    bool IsAuthorized(const HolderId& caller) const override;

    /// Add an operator; false if invalid or already present
    bool Add(const HolderId& op);

    /// Remove an operator; false if not present
    bool Remove(const HolderId& op);

    std::vector<HolderId> GetOperators() const;
    size_t Size() const;

    bool AllowsAll() const { return allowAll_; }

private:
    mutable std::mutex mutex_;
    std::set<HolderId> operators_;
    bool allowAll_;
};

} // namespace ledger
} // namespace sharegov

#endif // SHAREGOV_LEDGER_ACCESS_CONTROL_H
