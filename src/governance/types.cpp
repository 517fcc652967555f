// SHAREGOV - Governance Types Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/types.h>

#include <algorithm>
#include <cctype>

namespace sharegov {
namespace governance {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidDeadline: return "InvalidDeadline";
        case ErrorCode::InvalidWindow: return "InvalidWindow";
        case ErrorCode::VotingNotStarted: return "VotingNotStarted";
        case ErrorCode::VotingClosed: return "VotingClosed";
        case ErrorCode::AlreadyVoted: return "AlreadyVoted";
        case ErrorCode::NoVotingWeight: return "NoVotingWeight";
        case ErrorCode::InvalidOption: return "InvalidOption";
        case ErrorCode::TooEarly: return "TooEarly";
        case ErrorCode::AlreadyFinalized: return "AlreadyFinalized";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InsufficientLocked: return "InsufficientLocked";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidProposal: return "InvalidProposal";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::LockActive: return "LockActive";
        case ErrorCode::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

const char* GovernanceModelToString(GovernanceModel model) {
    switch (model) {
        case GovernanceModel::SimpleMajority: return "SimpleMajority";
        case GovernanceModel::Supermajority: return "Supermajority";
        case GovernanceModel::Consensus: return "Consensus";
        default: return "Unknown";
    }
}

std::optional<GovernanceModel> ParseGovernanceModel(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "simplemajority" || lower == "majority") return GovernanceModel::SimpleMajority;
    if (lower == "supermajority") return GovernanceModel::Supermajority;
    if (lower == "consensus" || lower == "unanimous") return GovernanceModel::Consensus;
    return std::nullopt;
}

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Created: return "Created";
        case ProposalState::VotingOpen: return "VotingOpen";
        case ProposalState::Closed: return "Closed";
        case ProposalState::Finalized: return "Finalized";
        default: return "Unknown";
    }
}

const char* VoteWeightingToString(VoteWeighting weighting) {
    switch (weighting) {
        case VoteWeighting::PerHolder: return "PerHolder";
        case VoteWeighting::ByBalance: return "ByBalance";
        default: return "Unknown";
    }
}

std::optional<VoteWeighting> ParseVoteWeighting(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "perholder" || lower == "holder") return VoteWeighting::PerHolder;
    if (lower == "bybalance" || lower == "balance") return VoteWeighting::ByBalance;
    return std::nullopt;
}

std::string ChoiceToString(const VoteChoice& choice) {
    if (const bool* b = std::get_if<bool>(&choice)) {
        return *b ? YES_OPTION : NO_OPTION;
    }
    return std::get<std::string>(choice);
}

} // namespace governance
} // namespace sharegov
