// SHAREGOV - Governance Types
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Status codes, governance models and vote choices shared by every
// governance component.

#ifndef SHAREGOV_GOVERNANCE_TYPES_H
#define SHAREGOV_GOVERNANCE_TYPES_H

#include <sharegov/core/serialize.h>
#include <sharegov/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace sharegov {
namespace governance {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    /// Unknown proposal or fraction id
    NotFound,

    /// Deadline (or unlock time) not in the future
    InvalidDeadline,

    /// Voting start is zero, not before the deadline, or already set
    InvalidWindow,

    VotingNotStarted,
    VotingClosed,
    AlreadyVoted,

    /// Voter holds none of the proposal's share class, or the class has no supply
    NoVotingWeight,

    /// Choice is not a declared option or does not match the proposal kind
    InvalidOption,

    /// Finalize called before the deadline has passed
    TooEarly,

    AlreadyFinalized,
    InsufficientBalance,
    InsufficientLocked,

    /// Caller rejected by the access-control collaborator
    Unauthorized,

    /// Malformed description or option list
    InvalidProposal,

    /// Non-positive or out-of-range amount
    InvalidAmount,

    /// Unlock attempted before the lock's unlock time
    LockActive,

    /// Attached database rejected the write or returned corrupt data
    StorageError,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Status - Result of governance operations
// ============================================================================

class Status {
public:
    Status() : code_(ErrorCode::OK) {}
    Status(ErrorCode code, std::string msg = "") : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(ErrorCode::NotFound, msg); }
    static Status InvalidDeadline(const std::string& msg = "") { return Status(ErrorCode::InvalidDeadline, msg); }
    static Status InvalidWindow(const std::string& msg = "") { return Status(ErrorCode::InvalidWindow, msg); }
    static Status VotingNotStarted(const std::string& msg = "") { return Status(ErrorCode::VotingNotStarted, msg); }
    static Status VotingClosed(const std::string& msg = "") { return Status(ErrorCode::VotingClosed, msg); }
    static Status AlreadyVoted(const std::string& msg = "") { return Status(ErrorCode::AlreadyVoted, msg); }
    static Status NoVotingWeight(const std::string& msg = "") { return Status(ErrorCode::NoVotingWeight, msg); }
    static Status InvalidOption(const std::string& msg = "") { return Status(ErrorCode::InvalidOption, msg); }
    static Status TooEarly(const std::string& msg = "") { return Status(ErrorCode::TooEarly, msg); }
    static Status AlreadyFinalized(const std::string& msg = "") { return Status(ErrorCode::AlreadyFinalized, msg); }
    static Status InsufficientBalance(const std::string& msg = "") { return Status(ErrorCode::InsufficientBalance, msg); }
    static Status InsufficientLocked(const std::string& msg = "") { return Status(ErrorCode::InsufficientLocked, msg); }
    static Status Unauthorized(const std::string& msg = "") { return Status(ErrorCode::Unauthorized, msg); }
    static Status InvalidProposal(const std::string& msg = "") { return Status(ErrorCode::InvalidProposal, msg); }
    static Status InvalidAmount(const std::string& msg = "") { return Status(ErrorCode::InvalidAmount, msg); }
    static Status LockActive(const std::string& msg = "") { return Status(ErrorCode::LockActive, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(ErrorCode::StorageError, msg); }

    bool ok() const { return code_ == ErrorCode::OK; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool Is(ErrorCode code) const { return code_ == code; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result = ErrorCodeToString(code_);
        if (!message_.empty()) {
            result += ": " + message_;
        }
        return result;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Governance Models
// ============================================================================

/// Decision rule applied to a tally
enum class GovernanceModel : uint8_t {
    /// affirmative > supply / 2
    SimpleMajority = 0,

    /// affirmative >= supply * 2 / 3
    Supermajority = 1,

    /// affirmative == supply (unanimity, not network consensus)
    Consensus = 2,
};

const char* GovernanceModelToString(GovernanceModel model);

/// Parse model name (case-insensitive, also accepts "majority" and "unanimous")
std::optional<GovernanceModel> ParseGovernanceModel(const std::string& str);

// ============================================================================
// Proposal State
// ============================================================================

/**
 * Lifecycle phase of a proposal.
 *
 * Closed is derived from the clock and never stored. A cancellation or veto
 * state would be added here and produced by LifecycleController::StateAt().
 */
enum class ProposalState : uint8_t {
    Created = 0,
    VotingOpen = 1,
    Closed = 2,
    Finalized = 3,
};

const char* ProposalStateToString(ProposalState state);

// ============================================================================
// Vote Weighting
// ============================================================================

enum class VoteWeighting : uint8_t {
    /// Every accepted vote counts 1
    PerHolder = 0,

    /// Every accepted vote counts the voter's balance at cast time
    ByBalance = 1,
};

const char* VoteWeightingToString(VoteWeighting weighting);
std::optional<VoteWeighting> ParseVoteWeighting(const std::string& str);

// ============================================================================
// Vote Choice
// ============================================================================

/// Boolean for binary proposals, option name for multi-option proposals
using VoteChoice = std::variant<bool, std::string>;

/// Option names binary proposals report their counts under
constexpr const char* YES_OPTION = "yes";
constexpr const char* NO_OPTION = "no";

inline bool IsBinaryChoice(const VoteChoice& choice) {
    return std::holds_alternative<bool>(choice);
}

/// "yes"/"no" for binary choices, the option name otherwise
std::string ChoiceToString(const VoteChoice& choice);

template<typename Stream>
void SerializeChoice(Stream& s, const VoteChoice& choice) {
    if (const bool* b = std::get_if<bool>(&choice)) {
        Serialize(s, static_cast<uint8_t>(0));
        Serialize(s, *b);
    } else {
        Serialize(s, static_cast<uint8_t>(1));
        Serialize(s, std::get<std::string>(choice));
    }
}

template<typename Stream>
void UnserializeChoice(Stream& s, VoteChoice& choice) {
    uint8_t tag = 0;
    Unserialize(s, tag);
    if (tag == 0) {
        bool b = false;
        Unserialize(s, b);
        choice = b;
    } else if (tag == 1) {
        std::string option;
        Unserialize(s, option);
        choice = std::move(option);
    } else {
        throw std::ios_base::failure("UnserializeChoice: unknown choice tag");
    }
}

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_TYPES_H
