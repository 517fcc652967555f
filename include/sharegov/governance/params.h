// SHAREGOV - Governance Parameters
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Tunable engine limits and their configuration-file bindings.

#ifndef SHAREGOV_GOVERNANCE_PARAMS_H
#define SHAREGOV_GOVERNANCE_PARAMS_H

#include <sharegov/governance/types.h>
#include <sharegov/util/config.h>

#include <string>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Default maximum description length (bytes)
constexpr size_t DEFAULT_MAX_DESCRIPTION_LENGTH = 1024;

/// Hard ceiling for the configurable description length
constexpr size_t MAX_DESCRIPTION_LENGTH_LIMIT = 64 * 1024;

/// Default maximum number of named options on a proposal
constexpr size_t DEFAULT_MAX_OPTIONS = 16;

/// Hard ceiling for the configurable option count
constexpr size_t MAX_OPTIONS_LIMIT = 256;

/// Maximum length of a single option name
constexpr size_t MAX_OPTION_NAME_LENGTH = 64;

/// Default number of events kept in memory per kind
constexpr size_t DEFAULT_EVENT_RETENTION = 10000;

/// Default share class whose holders govern
constexpr ShareClassId DEFAULT_GOVERNANCE_CLASS = 1;

// ============================================================================
// Governance Parameters
// ============================================================================

struct GovernanceParams {
    /// Share class used when a proposal does not name one
    ShareClassId governanceClass{DEFAULT_GOVERNANCE_CLASS};

    size_t maxDescriptionLength{DEFAULT_MAX_DESCRIPTION_LENGTH};
    size_t maxOptions{DEFAULT_MAX_OPTIONS};

    /// Model used by callers that do not name one
    GovernanceModel defaultModel{GovernanceModel::SimpleMajority};

    /// Events kept in memory per kind (0 = unbounded)
    size_t eventRetention{DEFAULT_EVENT_RETENTION};

    /// Operator identities from repeated "operator" keys
    std::vector<HolderId> operators;

    /**
     * Read parameters from configuration.
     *
     * Missing keys keep their defaults. Returns an error naming the key for
     * values that fail to parse or fall outside their limits; out is left
     * unchanged on error.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              GovernanceParams& out);

    std::string ToString() const;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_PARAMS_H
