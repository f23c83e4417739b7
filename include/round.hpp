#pragma once

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace raffle {

// Entries of the current round in admission order. The same address may hold
// several slots; each slot is one ticket in the draw.
class ParticipantRegistry {
public:
    void append(const Address& participant);
    const Address& at(std::size_t index) const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<Address>& entries() const { return entries_; }
    void clear();

private:
    std::vector<Address> entries_;
};

class RoundClock {
public:
    explicit RoundClock(Timestamp lastReset);

    Timestamp lastReset() const { return lastReset_; }
    std::chrono::seconds elapsedSince(Timestamp now) const;
    void reset(Timestamp now);

private:
    Timestamp lastReset_;
};

struct WinnerRecord {
    Address winner;
    Amount amount = 0;
};

// Everything one raffle instance mutates; copied wholesale by RoundTransaction.
struct RaffleStorage {
    RoundState state = RoundState::OPEN;
    ParticipantRegistry participants;
    RoundClock clock;
    std::optional<WinnerRecord> recentWinner;

    explicit RaffleStorage(Timestamp deployedAt)
        : clock(deployedAt) {}
};

} // namespace raffle
