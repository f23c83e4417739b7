#pragma once

#include "types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace raffle {

enum class RaffleEventKind { ENTERED_RAFFLE, REQUESTED_DRAW, WINNER_PICKED };

struct RaffleEvent {
    RaffleEventKind kind;
    Address participant;
    RequestId requestId = 0;
    Amount amount = 0;
};

using RaffleEventCallback = std::function<void(const RaffleEvent& event)>;

std::string toString(RaffleEventKind kind);

// Canonical, length-prefixed encoding hashed into the log leaves.
std::string encodeEvent(const RaffleEvent& event);

// Append-only record of published notifications with a SHA-256 Merkle commitment.
class EventLog {
public:
    void append(const RaffleEvent& event);

    const std::vector<RaffleEvent>& events() const { return events_; }
    const std::vector<std::string>& leaves() const { return leaves_; }
    std::string leaf(std::size_t index) const;
    std::size_t size() const { return leaves_.size(); }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const RaffleEvent& event);
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& expectedRoot);

private:
    std::vector<RaffleEvent> events_;
    std::vector<std::string> leaves_;
};

} // namespace raffle
