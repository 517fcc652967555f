// SHAREGOV - Vote Ledger Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/vote_ledger.h>
#include <sharegov/crypto/sha256.h>

#include <sstream>

namespace sharegov {
namespace governance {

Hash256 VoteRecord::GetHash() const {
    DataStream ss;
    ss << *this;
    return SHA256Hash(ss);
}

std::string VoteRecord::ToString() const {
    std::ostringstream oss;
    oss << "Vote(proposal=" << proposalId
        << ", voter=" << voter
        << ", choice=" << ChoiceToString(choice)
        << ", weight=" << weight
        << ", at=" << castAt << ")";
    return oss.str();
}

bool VoteLedger::HasVoted(ProposalId proposalId, const HolderId& voter) const {
    return votes_.count(Key(proposalId, voter)) > 0;
}

const VoteRecord* VoteLedger::Get(ProposalId proposalId, const HolderId& voter) const {
    auto it = votes_.find(Key(proposalId, voter));
    return it == votes_.end() ? nullptr : &it->second;
}

bool VoteLedger::Insert(VoteRecord record) {
    Key key(record.proposalId, record.voter);
    return votes_.emplace(std::move(key), std::move(record)).second;
}

std::vector<VoteRecord> VoteLedger::GetVotes(ProposalId proposalId) const {
    std::vector<VoteRecord> result;
    for (auto it = votes_.lower_bound(Key(proposalId, HolderId()));
         it != votes_.end() && it->first.first == proposalId; ++it) {
        result.push_back(it->second);
    }
    return result;
}

size_t VoteLedger::CountVotes(ProposalId proposalId) const {
    size_t count = 0;
    for (auto it = votes_.lower_bound(Key(proposalId, HolderId()));
         it != votes_.end() && it->first.first == proposalId; ++it) {
        ++count;
    }
    return count;
}

} // namespace governance
} // namespace sharegov
