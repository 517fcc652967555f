// SHAREGOV - Governance Events Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/events.h>
#include <sharegov/util/logging.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <type_traits>

namespace sharegov {
namespace governance {

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::ProposalCreated: return "ProposalCreated";
        case EventKind::VotingStarted: return "VotingStarted";
        case EventKind::VoteCast: return "VoteCast";
        case EventKind::ProposalFinalized: return "ProposalFinalized";
        case EventKind::FractionCreated: return "FractionCreated";
        case EventKind::TokensLocked: return "TokensLocked";
        case EventKind::TokensUnlocked: return "TokensUnlocked";
        default: return "Unknown";
    }
}

std::optional<EventKind> ParseEventKind(const std::string& str) {
    std::string lower;
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (EventKind kind : ALL_EVENT_KINDS) {
        std::string name = EventKindToString(kind);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == lower) {
            return kind;
        }
    }
    return std::nullopt;
}

EventKind KindOf(const EventPayload& payload) {
    // Variant alternatives follow EventKind numbering
    return static_cast<EventKind>(payload.index() + 1);
}

std::string GovernanceEvent::ToString() const {
    std::ostringstream oss;
    oss << EventKindToString(kind) << "#" << sequence << "(";
    std::visit([&oss](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ProposalCreatedEvent>) {
            oss << "id=" << p.proposalId << ", deadline=" << p.deadline
                << ", description=\"" << p.description << "\"";
        } else if constexpr (std::is_same_v<T, VotingStartedEvent>) {
            oss << "id=" << p.proposalId << ", start=" << p.start;
        } else if constexpr (std::is_same_v<T, VoteCastEvent>) {
            oss << "id=" << p.proposalId << ", voter=" << p.voter
                << ", choice=" << ChoiceToString(p.choice);
        } else if constexpr (std::is_same_v<T, ProposalFinalizedEvent>) {
            oss << "id=" << p.proposalId << ", yes=" << p.yes << ", no=" << p.no;
        } else if constexpr (std::is_same_v<T, FractionCreatedEvent>) {
            oss << "fraction=" << p.fractionId << ", asset=" << p.assetId
                << ", amount=" << p.amount;
        } else if constexpr (std::is_same_v<T, TokensLockedEvent>) {
            oss << "holder=" << p.holder << ", class=" << p.shareClass
                << ", amount=" << p.amount << ", unlock=" << p.unlockTime;
        } else {
            oss << "holder=" << p.holder << ", class=" << p.shareClass
                << ", amount=" << p.amount;
        }
    }, payload);
    oss << ")";
    return oss.str();
}

// ============================================================================
// Event Journal
// ============================================================================

EventJournal::EventJournal(size_t retention) : retention_(retention) {}

void EventJournal::SetRetention(size_t retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    retention_ = retention;
    for (auto& [kind, events] : events_) {
        TrimLocked(events);
    }
}

size_t EventJournal::GetRetention() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retention_;
}

void EventJournal::TrimLocked(std::deque<GovernanceEvent>& events) {
    if (retention_ == 0) {
        return;
    }
    while (events.size() > retention_) {
        events.pop_front();
    }
}

uint64_t EventJournal::LastSequence(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastSequence_.find(kind);
    return it == lastSequence_.end() ? 0 : it->second;
}

void EventJournal::Stage(std::vector<GovernanceEvent>& batch, EventPayload payload,
                         Timestamp timestamp) const {
    GovernanceEvent event;
    event.kind = KindOf(payload);
    event.timestamp = timestamp;
    event.payload = std::move(payload);

    uint64_t sequence = LastSequence(event.kind);
    for (const auto& staged : batch) {
        if (staged.kind == event.kind) {
            sequence = std::max(sequence, staged.sequence);
        }
    }
    event.sequence = sequence + 1;
    batch.push_back(std::move(event));
}

void EventJournal::Commit(const std::vector<GovernanceEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& event : events) {
        uint64_t& last = lastSequence_[event.kind];
        last = std::max(last, event.sequence);
        auto& retained = events_[event.kind];
        retained.push_back(event);
        TrimLocked(retained);
    }
}

void EventJournal::Restore(GovernanceEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t& last = lastSequence_[event.kind];
    last = std::max(last, event.sequence);
    auto& retained = events_[event.kind];
    retained.push_back(std::move(event));
    TrimLocked(retained);
}

std::vector<GovernanceEvent> EventJournal::GetEvents(EventKind kind, uint64_t afterSequence,
                                                     size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GovernanceEvent> result;
    auto it = events_.find(kind);
    if (it == events_.end()) {
        return result;
    }
    for (const auto& event : it->second) {
        if (event.sequence <= afterSequence) {
            continue;
        }
        result.push_back(event);
        if (limit > 0 && result.size() >= limit) {
            break;
        }
    }
    return result;
}

size_t EventJournal::Size(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(kind);
    return it == events_.end() ? 0 : it->second.size();
}

EventJournal::SubscriptionId EventJournal::Subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextSubscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

bool EventJournal::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.erase(id) > 0;
}

size_t EventJournal::ObserverCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

void EventJournal::Dispatch(const std::vector<GovernanceEvent>& events) const {
    if (events.empty()) {
        return;
    }

    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }

    for (const auto& event : events) {
        LOG_TRACE(util::LogCategory::EVENTS) << event.ToString();
        for (const auto& observer : observers) {
            try {
                observer(event);
            } catch (const std::exception& e) {
                LOG_WARN(util::LogCategory::EVENTS) << "Observer failed on "
                                                    << EventKindToString(event.kind)
                                                    << "#" << event.sequence << ": " << e.what();
            } catch (...) {
                LOG_WARN(util::LogCategory::EVENTS) << "Observer failed on "
                                                    << EventKindToString(event.kind)
                                                    << "#" << event.sequence
                                                    << ": unknown exception";
            }
        }
    }
}

void EventJournal::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    lastSequence_.clear();
}

} // namespace governance
} // namespace sharegov
