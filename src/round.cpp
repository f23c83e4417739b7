#include "round.hpp"

#include <stdexcept>
#include <string>

namespace raffle {

void ParticipantRegistry::append(const Address& participant) {
    if (participant.empty()) {
        throw std::invalid_argument("participant address must not be empty");
    }
    entries_.push_back(participant);
}

const Address& ParticipantRegistry::at(std::size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("participant index " + std::to_string(index) +
                                " out of range for " + std::to_string(entries_.size()) +
                                " entries");
    }
    return entries_[index];
}

void ParticipantRegistry::clear() {
    entries_.clear();
}

RoundClock::RoundClock(Timestamp lastReset)
    : lastReset_(lastReset) {}

std::chrono::seconds RoundClock::elapsedSince(Timestamp now) const {
    if (now < lastReset_) {
        return std::chrono::seconds(0);
    }
    return now - lastReset_;
}

void RoundClock::reset(Timestamp now) {
    lastReset_ = now;
}

} // namespace raffle
