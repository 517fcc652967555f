// SHAREGOV - Fraction Registry Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/fraction.h>

#include <algorithm>
#include <sstream>

namespace sharegov {
namespace governance {

std::string FractionRecord::ToString() const {
    std::ostringstream oss;
    oss << "Fraction(id=" << id
        << ", asset=" << assetId
        << ", class=" << shareClass
        << ", minted=" << totalMinted
        << ", owner=" << owner;
    if (HasVote()) {
        oss << ", proposal=" << proposalId;
    }
    oss << ")";
    return oss.str();
}

bool FractionRegistry::Add(FractionRecord record) {
    if (record.id != nextId_) {
        return false;
    }
    FractionId id = record.id;
    fractions_.emplace(id, std::move(record));
    ++nextId_;
    return true;
}

bool FractionRegistry::Update(const FractionRecord& record) {
    auto it = fractions_.find(record.id);
    if (it == fractions_.end()) {
        return false;
    }
    it->second = record;
    return true;
}

void FractionRegistry::Restore(FractionRecord record) {
    FractionId id = record.id;
    fractions_[id] = std::move(record);
    nextId_ = std::max(nextId_, id + 1);
}

const FractionRecord* FractionRegistry::Get(FractionId id) const {
    auto it = fractions_.find(id);
    return it == fractions_.end() ? nullptr : &it->second;
}

std::vector<FractionRecord> FractionRegistry::GetByAsset(AssetId assetId) const {
    std::vector<FractionRecord> result;
    for (const auto& [id, record] : fractions_) {
        if (record.assetId == assetId) {
            result.push_back(record);
        }
    }
    return result;
}

void FractionRegistry::Clear() {
    fractions_.clear();
    nextId_ = 1;
}

} // namespace governance
} // namespace sharegov
