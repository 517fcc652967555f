// SHAREGOV - Governance Database Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/governance_db.h>
#include <sharegov/util/logging.h>

#include <memory>

namespace sharegov {
namespace governance {

namespace {

std::string PrintableKey(const db::Slice& key) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2 + 1);
    if (!key.empty()) {
        out += key[0];
    }
    for (size_t i = 1; i < key.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(key[i]);
        out += HEX[c >> 4];
        out += HEX[c & 0x0f];
    }
    return out;
}

template<typename T>
bool Decode(const db::Slice& value, T& obj) {
    return db::DeserializeFromString(value.ToString(), obj);
}

} // namespace

GovernanceDB::GovernanceDB(db::Database& database) : db_(database) {}

// ============================================================================
// Keys
// ============================================================================

std::string GovernanceDB::ProposalKey(ProposalId id) {
    return db::KeyBuilder(db::prefix::PROPOSAL).Add(id).str();
}

std::string GovernanceDB::VoteKey(ProposalId id, const HolderId& voter) {
    return db::KeyBuilder(db::prefix::VOTE).Add(id).Add(voter).str();
}

std::string GovernanceDB::TallyKey(ProposalId id) {
    return db::KeyBuilder(db::prefix::TALLY).Add(id).str();
}

std::string GovernanceDB::LockKey(const HolderId& holder, ShareClassId shareClass) {
    return db::KeyBuilder(db::prefix::LOCK).Add(holder).Add(shareClass).str();
}

std::string GovernanceDB::FractionKey(FractionId id) {
    return db::KeyBuilder(db::prefix::FRACTION).Add(id).str();
}

std::string GovernanceDB::EventKey(EventKind kind, uint64_t sequence) {
    return db::KeyBuilder(db::prefix::EVENT)
        .Add(static_cast<uint8_t>(kind))
        .Add(sequence)
        .str();
}

std::string GovernanceDB::CounterKey(const std::string& name) {
    return db::MakeKey(db::prefix::META, name);
}

// ============================================================================
// Batch Builders
// ============================================================================

void GovernanceDB::WriteProposal(db::WriteBatch& batch, const Proposal& proposal) {
    batch.Put(ProposalKey(proposal.id), db::SerializeToString(proposal));
}

void GovernanceDB::WriteVote(db::WriteBatch& batch, const VoteRecord& vote) {
    batch.Put(VoteKey(vote.proposalId, vote.voter), db::SerializeToString(vote));
}

void GovernanceDB::WriteTally(db::WriteBatch& batch, ProposalId id, const TallySheet& sheet) {
    batch.Put(TallyKey(id), db::SerializeToString(sheet));
}

void GovernanceDB::WriteLock(db::WriteBatch& batch, const LockRecord& record) {
    std::string key = LockKey(record.holder, record.shareClass);
    if (record.amount == 0) {
        batch.Delete(key);
    } else {
        batch.Put(key, db::SerializeToString(record));
    }
}

void GovernanceDB::WriteFraction(db::WriteBatch& batch, const FractionRecord& record) {
    batch.Put(FractionKey(record.id), db::SerializeToString(record));
}

void GovernanceDB::WriteEvents(db::WriteBatch& batch,
                               const std::vector<GovernanceEvent>& events) {
    for (const auto& event : events) {
        batch.Put(EventKey(event.kind, event.sequence), db::SerializeToString(event));
    }
}

void GovernanceDB::WriteCounter(db::WriteBatch& batch, const std::string& name,
                                uint64_t value) {
    batch.Put(CounterKey(name), db::SerializeToString(value));
}

db::Status GovernanceDB::Commit(db::WriteBatch& batch, bool sync) {
    db::WriteOptions options;
    options.sync = sync;
    db::Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Governance batch of " << batch.Count()
                                         << " writes failed: " << status.ToString();
    }
    return status;
}

// ============================================================================
// Loading
// ============================================================================

db::Status GovernanceDB::LoadAll(GovernanceSnapshot& out) const {
    SHAREGOV_LOG_TIMER(util::LogCategory::DB, "GovernanceDB::LoadAll");

    GovernanceSnapshot snapshot;
    std::unique_ptr<db::Iterator> it = db_.NewIterator();

    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        db::Slice value = it->value();
        if (key.empty()) {
            continue;
        }

        bool ok = true;
        switch (key[0]) {
            case db::prefix::PROPOSAL: {
                Proposal proposal;
                ok = Decode(value, proposal);
                if (ok) snapshot.proposals.push_back(std::move(proposal));
                break;
            }
            case db::prefix::VOTE: {
                VoteRecord vote;
                ok = Decode(value, vote);
                if (ok) snapshot.votes.push_back(std::move(vote));
                break;
            }
            case db::prefix::TALLY: {
                TallySheet sheet;
                ok = Decode(value, sheet) && key.size() == 9;
                if (ok) {
                    ProposalId id = 0;
                    for (size_t i = 1; i < 9; ++i) {
                        id = (id << 8) | static_cast<unsigned char>(key[i]);
                    }
                    snapshot.tallies[id] = std::move(sheet);
                }
                break;
            }
            case db::prefix::LOCK: {
                LockRecord record;
                ok = Decode(value, record);
                if (ok) snapshot.locks.push_back(std::move(record));
                break;
            }
            case db::prefix::FRACTION: {
                FractionRecord record;
                ok = Decode(value, record);
                if (ok) snapshot.fractions.push_back(std::move(record));
                break;
            }
            case db::prefix::EVENT: {
                GovernanceEvent event;
                ok = Decode(value, event);
                if (ok) snapshot.events.push_back(std::move(event));
                break;
            }
            case db::prefix::META: {
                uint64_t counterValue = 0;
                ok = Decode(value, counterValue) && key.size() >= 2;
                if (ok) {
                    // MakeKey(prefix, name): prefix, length byte, name
                    snapshot.counters[std::string(key.data() + 2, key.size() - 2)] = counterValue;
                }
                break;
            }
            default:
                // Other prefixes belong to other subsystems
                break;
        }

        if (!ok) {
            return db::Status::Corruption("undecodable record at key " + PrintableKey(key));
        }
    }

    db::Status status = it->status();
    if (!status.ok()) {
        return status;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Loaded " << snapshot.proposals.size() << " proposals, "
                                     << snapshot.votes.size() << " votes, "
                                     << snapshot.locks.size() << " locks, "
                                     << snapshot.fractions.size() << " fractions, "
                                     << snapshot.events.size() << " events";
    out = std::move(snapshot);
    return db::Status::Ok();
}

} // namespace governance
} // namespace sharegov
