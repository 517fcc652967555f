// SHAREGOV - Proposal Store Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/proposal.h>
#include <sharegov/governance/params.h>
#include <sharegov/crypto/sha256.h>
#include <sharegov/util/time.h>

#include <algorithm>
#include <set>
#include <sstream>

namespace sharegov {
namespace governance {

// ============================================================================
// Proposal
// ============================================================================

std::optional<size_t> Proposal::OptionIndex(const std::string& name) const {
    auto it = std::find(options.begin(), options.end(), name);
    if (it == options.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - options.begin());
}

Hash256 Proposal::GetHash() const {
    DataStream ss;
    ss << *this;
    return SHA256Hash(ss);
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal(id=" << id
        << ", creator=" << creator
        << ", class=" << shareClass
        << ", kind=" << (IsMultiOption() ? "multi-option" : "binary")
        << ", deadline=" << util::FormatISO8601(deadline)
        << ", baseline=" << supplyBaseline
        << ", finalized=" << (finalized ? "true" : "false")
        << ")";
    return oss.str();
}

// ============================================================================
// Proposal Store
// ============================================================================

Status ProposalStore::ValidateContent(const std::string& description,
                                      const std::vector<std::string>& options,
                                      const ProposalLimits& limits) {
    if (description.empty()) {
        return Status::InvalidProposal("empty description");
    }
    if (description.size() > limits.maxDescriptionLength) {
        return Status::InvalidProposal("description longer than " +
                                       std::to_string(limits.maxDescriptionLength) + " bytes");
    }

    if (options.empty()) {
        return Status::Ok();
    }
    if (options.size() < 2) {
        return Status::InvalidProposal("multi-option proposal needs at least two options");
    }
    if (options.size() > limits.maxOptions) {
        return Status::InvalidProposal("more than " + std::to_string(limits.maxOptions) +
                                       " options");
    }

    std::set<std::string> seen;
    for (const auto& option : options) {
        if (option.empty() || option.size() > MAX_OPTION_NAME_LENGTH) {
            return Status::InvalidProposal("option names must be 1.." +
                                           std::to_string(MAX_OPTION_NAME_LENGTH) + " bytes");
        }
        if (!seen.insert(option).second) {
            return Status::InvalidProposal("duplicate option '" + option + "'");
        }
    }
    return Status::Ok();
}

bool ProposalStore::Add(Proposal proposal) {
    if (proposal.id != nextId_) {
        return false;
    }
    ProposalId id = proposal.id;
    proposals_.emplace(id, std::move(proposal));
    ++nextId_;
    return true;
}

void ProposalStore::Restore(Proposal proposal) {
    ProposalId id = proposal.id;
    proposals_[id] = std::move(proposal);
    nextId_ = std::max(nextId_, id + 1);
}

const Proposal* ProposalStore::Get(ProposalId id) const {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

Proposal* ProposalStore::GetMutable(ProposalId id) {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

std::vector<ProposalId> ProposalStore::GetIds() const {
    std::vector<ProposalId> ids;
    ids.reserve(proposals_.size());
    for (const auto& [id, proposal] : proposals_) {
        ids.push_back(id);
    }
    return ids;
}

void ProposalStore::Clear() {
    proposals_.clear();
    nextId_ = 1;
}

} // namespace governance
} // namespace sharegov
