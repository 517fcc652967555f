// SHAREGOV - Governance Events
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Append-only event journal. Every event kind has its own sequence starting
// at 1. Observers are called after the engine has released its lock; a
// consumer that remembers the last sequence it saw can resume with
// GetEvents(kind, lastSeen) and receives every retained event again at
// least once.

#ifndef SHAREGOV_GOVERNANCE_EVENTS_H
#define SHAREGOV_GOVERNANCE_EVENTS_H

#include <sharegov/governance/params.h>
#include <sharegov/governance/types.h>

#include <array>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Event Kinds
// ============================================================================

enum class EventKind : uint8_t {
    ProposalCreated = 1,
    VotingStarted = 2,
    VoteCast = 3,
    ProposalFinalized = 4,
    FractionCreated = 5,
    TokensLocked = 6,
    TokensUnlocked = 7,
};

constexpr std::array<EventKind, 7> ALL_EVENT_KINDS = {
    EventKind::ProposalCreated, EventKind::VotingStarted, EventKind::VoteCast,
    EventKind::ProposalFinalized, EventKind::FractionCreated,
    EventKind::TokensLocked, EventKind::TokensUnlocked,
};

const char* EventKindToString(EventKind kind);
std::optional<EventKind> ParseEventKind(const std::string& str);

// ============================================================================
// Event Payloads
// ============================================================================

struct ProposalCreatedEvent {
    ProposalId proposalId{0};
    std::string description;
    Timestamp deadline{0};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, proposalId);
        Serialize(s, description);
        Serialize(s, deadline);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, proposalId);
        Unserialize(s, description);
        Unserialize(s, deadline);
    }
};

struct VotingStartedEvent {
    ProposalId proposalId{0};
    Timestamp start{0};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, proposalId);
        Serialize(s, start);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, proposalId);
        Unserialize(s, start);
    }
};

struct VoteCastEvent {
    ProposalId proposalId{0};
    HolderId voter;
    VoteChoice choice{false};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, proposalId);
        Serialize(s, voter);
        SerializeChoice(s, choice);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, proposalId);
        Unserialize(s, voter);
        UnserializeChoice(s, choice);
    }
};

struct ProposalFinalizedEvent {
    ProposalId proposalId{0};
    uint64_t yes{0};
    uint64_t no{0};

    /// Frozen option counts of multi-option proposals
    std::vector<uint64_t> optionCounts;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, proposalId);
        Serialize(s, yes);
        Serialize(s, no);
        Serialize(s, optionCounts);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, proposalId);
        Unserialize(s, yes);
        Unserialize(s, no);
        Unserialize(s, optionCounts);
    }
};

struct FractionCreatedEvent {
    FractionId fractionId{0};
    AssetId assetId{0};
    Amount amount{0};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, fractionId);
        Serialize(s, assetId);
        Serialize(s, amount);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, fractionId);
        Unserialize(s, assetId);
        Unserialize(s, amount);
    }
};

struct TokensLockedEvent {
    HolderId holder;
    ShareClassId shareClass{0};
    Amount amount{0};
    Timestamp unlockTime{0};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, holder);
        Serialize(s, shareClass);
        Serialize(s, amount);
        Serialize(s, unlockTime);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, holder);
        Unserialize(s, shareClass);
        Unserialize(s, amount);
        Unserialize(s, unlockTime);
    }
};

struct TokensUnlockedEvent {
    HolderId holder;
    ShareClassId shareClass{0};
    Amount amount{0};

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, holder);
        Serialize(s, shareClass);
        Serialize(s, amount);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, holder);
        Unserialize(s, shareClass);
        Unserialize(s, amount);
    }
};

/// Payload alternatives in EventKind order
using EventPayload = std::variant<
    ProposalCreatedEvent,
    VotingStartedEvent,
    VoteCastEvent,
    ProposalFinalizedEvent,
    FractionCreatedEvent,
    TokensLockedEvent,
    TokensUnlockedEvent
>;

/// Kind carried by a payload
EventKind KindOf(const EventPayload& payload);

// ============================================================================
// Governance Event
// ============================================================================

struct GovernanceEvent {
    EventKind kind{EventKind::ProposalCreated};

    /// Position within its kind, starting at 1
    uint64_t sequence{0};

    Timestamp timestamp{0};
    EventPayload payload;

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, static_cast<uint8_t>(kind));
        Serialize(s, sequence);
        Serialize(s, timestamp);
        std::visit([&s](const auto& p) { p.SerializeTo(s); }, payload);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        uint8_t kindByte = 0;
        Unserialize(s, kindByte);
        Unserialize(s, sequence);
        Unserialize(s, timestamp);
        switch (static_cast<EventKind>(kindByte)) {
            case EventKind::ProposalCreated: payload = ProposalCreatedEvent{}; break;
            case EventKind::VotingStarted: payload = VotingStartedEvent{}; break;
            case EventKind::VoteCast: payload = VoteCastEvent{}; break;
            case EventKind::ProposalFinalized: payload = ProposalFinalizedEvent{}; break;
            case EventKind::FractionCreated: payload = FractionCreatedEvent{}; break;
            case EventKind::TokensLocked: payload = TokensLockedEvent{}; break;
            case EventKind::TokensUnlocked: payload = TokensUnlockedEvent{}; break;
            default:
                throw std::ios_base::failure("GovernanceEvent: unknown kind");
        }
        kind = static_cast<EventKind>(kindByte);
        std::visit([&s](auto& p) { p.UnserializeFrom(s); }, payload);
    }
};

// ============================================================================
// Event Journal
// ============================================================================

class EventJournal {
public:
    using Observer = std::function<void(const GovernanceEvent&)>;
    using SubscriptionId = uint64_t;

    /// Keep at most `retention` events per kind in memory (0 = unbounded)
    explicit EventJournal(size_t retention = DEFAULT_EVENT_RETENTION);

    void SetRetention(size_t retention);
    size_t GetRetention() const;

    /// Last sequence assigned to a kind (0 if none)
    uint64_t LastSequence(EventKind kind) const;

    /**
     * Append an event with its sequence assigned to a pending batch.
     * Sequences account for events of the same kind already in the batch.
     */
    void Stage(std::vector<GovernanceEvent>& batch, EventPayload payload,
               Timestamp timestamp) const;

    /// Make staged events visible; their sequences must follow LastSequence()
    void Commit(const std::vector<GovernanceEvent>& events);

    /// Re-insert a persisted event and advance its kind's sequence
    void Restore(GovernanceEvent event);

    /// Retained events of a kind with sequence > afterSequence, oldest first
    std::vector<GovernanceEvent> GetEvents(EventKind kind, uint64_t afterSequence = 0,
                                           size_t limit = 0) const;

    /// Retained event count of a kind
    size_t Size(EventKind kind) const;

    SubscriptionId Subscribe(Observer observer);
    bool Unsubscribe(SubscriptionId id);
    size_t ObserverCount() const;

    /// Deliver events to every observer; must be called without the engine lock
    void Dispatch(const std::vector<GovernanceEvent>& events) const;

    void Clear();

private:
    void TrimLocked(std::deque<GovernanceEvent>& events);

    mutable std::mutex mutex_;
    std::map<EventKind, std::deque<GovernanceEvent>> events_;
    std::map<EventKind, uint64_t> lastSequence_;
    size_t retention_;

    std::map<SubscriptionId, Observer> observers_;
    SubscriptionId nextSubscription_{1};
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_EVENTS_H
