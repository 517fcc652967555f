// SHAREGOV - Tally Engine Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/tally.h>
#include <sharegov/crypto/sha256.h>

#include <sstream>

namespace sharegov {
namespace governance {

// ============================================================================
// Tally Sheet / Decision
// ============================================================================

uint64_t TallySheet::TotalWeight() const {
    uint64_t total = yes + no;
    for (uint64_t count : optionCounts) {
        total += count;
    }
    return total;
}

std::string Decision::ToString() const {
    std::ostringstream oss;
    oss << "Decision(" << GovernanceModelToString(model)
        << ": " << (passed ? "PASSED" : "FAILED")
        << ", affirmative=" << affirmative
        << ", threshold=" << threshold
        << ", supply=" << totalSupply;
    if (winningOption) {
        oss << ", leading=" << *winningOption;
    } else {
        oss << ", yes=" << yes << ", no=" << no;
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// Tally Engine
// ============================================================================

const TallySheet* TallyEngine::Get(ProposalId id) const {
    auto it = sheets_.find(id);
    return it == sheets_.end() ? nullptr : &it->second;
}

void TallyEngine::Put(ProposalId id, TallySheet sheet) {
    sheets_[id] = std::move(sheet);
}

Status TallyEngine::ApplyVote(TallySheet& sheet, const Proposal& proposal,
                              const VoteChoice& choice, uint64_t weight) {
    if (proposal.IsMultiOption()) {
        const std::string* option = std::get_if<std::string>(&choice);
        if (!option) {
            return Status::InvalidOption("multi-option proposal needs an option name");
        }
        auto index = proposal.OptionIndex(*option);
        if (!index) {
            return Status::InvalidOption("unknown option '" + *option + "'");
        }
        if (sheet.optionCounts.size() != proposal.options.size()) {
            sheet.optionCounts.resize(proposal.options.size(), 0);
        }
        sheet.optionCounts[*index] += weight;
    } else {
        const bool* approve = std::get_if<bool>(&choice);
        if (!approve) {
            return Status::InvalidOption("binary proposal needs a yes/no vote");
        }
        if (*approve) {
            sheet.yes += weight;
        } else {
            sheet.no += weight;
        }
    }
    ++sheet.voteCount;
    return Status::Ok();
}

uint64_t TallyEngine::Threshold(GovernanceModel model, uint64_t totalSupply) {
    switch (model) {
        case GovernanceModel::SimpleMajority:
            return totalSupply / 2 + 1;
        case GovernanceModel::Supermajority:
            // floor(totalSupply * 2 / 3) without the multiplication overflowing
            return (totalSupply / 3) * 2 + ((totalSupply % 3) * 2) / 3;
        case GovernanceModel::Consensus:
        default:
            return totalSupply;
    }
}

bool TallyEngine::EvaluateModel(GovernanceModel model, uint64_t affirmative,
                                uint64_t totalSupply) {
    if (totalSupply == 0) {
        return false;
    }
    switch (model) {
        case GovernanceModel::SimpleMajority:
            return affirmative > totalSupply / 2;
        case GovernanceModel::Supermajority:
            return affirmative >= Threshold(model, totalSupply);
        case GovernanceModel::Consensus:
            return affirmative == totalSupply;
        default:
            return false;
    }
}

std::optional<size_t> TallyEngine::LeadingOption(const std::vector<uint64_t>& counts) {
    if (counts.empty()) {
        return std::nullopt;
    }
    size_t best = 0;
    for (size_t i = 1; i < counts.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return best;
}

TallySheet TallyEngine::FrozenSheet(const Proposal& proposal, uint64_t voteCount) {
    TallySheet sheet;
    if (proposal.IsMultiOption()) {
        sheet.optionCounts = proposal.finalOptionCounts;
    } else {
        sheet.yes = proposal.finalYes;
        sheet.no = proposal.finalNo;
    }
    sheet.voteCount = voteCount;
    return sheet;
}

std::pair<uint64_t, uint64_t> TallyEngine::YesNo(const Proposal& proposal,
                                                 const TallySheet& sheet) {
    if (!proposal.IsMultiOption()) {
        return {sheet.yes, sheet.no};
    }
    auto leading = LeadingOption(sheet.optionCounts);
    if (!leading) {
        return {0, 0};
    }
    uint64_t lead = sheet.optionCounts[*leading];
    return {lead, sheet.TotalWeight() - lead};
}

Decision TallyEngine::ComputeDecision(const Proposal& proposal, const TallySheet& sheet,
                                      GovernanceModel model) {
    const TallySheet source = proposal.finalized ? FrozenSheet(proposal, sheet.voteCount) : sheet;

    Decision decision;
    decision.model = model;
    decision.totalSupply = proposal.supplyBaseline > 0
                               ? static_cast<uint64_t>(proposal.supplyBaseline) : 0;
    decision.threshold = Threshold(model, decision.totalSupply);

    if (proposal.IsMultiOption()) {
        auto leading = LeadingOption(source.optionCounts);
        if (leading) {
            decision.affirmative = source.optionCounts[*leading];
            decision.winningOption = proposal.options[*leading];
        }
    } else {
        decision.affirmative = source.yes;
    }

    auto [yes, no] = YesNo(proposal, source);
    decision.yes = yes;
    decision.no = no;
    decision.passed = EvaluateModel(model, decision.affirmative, decision.totalSupply);
    return decision;
}

std::vector<std::pair<std::string, uint64_t>> TallyEngine::GetResults(const Proposal& proposal,
                                                                      const TallySheet& sheet) {
    std::vector<std::pair<std::string, uint64_t>> results;
    if (!proposal.IsMultiOption()) {
        results.emplace_back(YES_OPTION, sheet.yes);
        results.emplace_back(NO_OPTION, sheet.no);
        return results;
    }
    for (size_t i = 0; i < proposal.options.size(); ++i) {
        uint64_t count = i < sheet.optionCounts.size() ? sheet.optionCounts[i] : 0;
        results.emplace_back(proposal.options[i], count);
    }
    return results;
}

std::optional<uint64_t> TallyEngine::GetOptionCount(const Proposal& proposal,
                                                    const TallySheet& sheet,
                                                    const std::string& option) {
    if (!proposal.IsMultiOption()) {
        if (option == YES_OPTION) return sheet.yes;
        if (option == NO_OPTION) return sheet.no;
        return std::nullopt;
    }
    auto index = proposal.OptionIndex(option);
    if (!index) {
        return std::nullopt;
    }
    return *index < sheet.optionCounts.size() ? sheet.optionCounts[*index] : 0;
}

Hash256 TallyEngine::SnapshotDigest(ProposalId id, const TallySheet& sheet) {
    DataStream ss;
    ss << id << sheet;
    return SHA256Hash(ss);
}

} // namespace governance
} // namespace sharegov
