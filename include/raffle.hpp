#pragma once

#include "config.hpp"
#include "event_log.hpp"
#include "fund_transfer.hpp"
#include "logger.hpp"
#include "randomness.hpp"
#include "round.hpp"
#include "time_source.hpp"
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace raffle {

struct UpkeepCheck {
    bool timeHasPassed = false;
    bool isOpen = false;
    bool hasBalance = false;
    bool hasPlayers = false;
    bool upkeepNeeded = false;
};

// Time-gated lottery round. Participants buy slots while OPEN; once the interval
// has elapsed an upkeep caller triggers a draw, which closes admissions until the
// randomness client answers and the pool has been paid to the winner.
//
// All operations are serialized on one recursive mutex. Read-only queries made from
// inside a payout (for example by the recipient) see the reset round; mutating calls
// made from there fail with ReentrantCallError.
class Raffle : public RandomnessConsumer {
public:
    Raffle(RaffleConfig config,
           RandomnessClient& randomness,
           FundTransfer& funds,
           const TimeSource& clock);

    void enterRaffle(const Address& participant, Amount stake);

    bool checkUpkeep() const;
    UpkeepCheck inspectUpkeep() const;

    // Throws UpkeepNotNeededError with the current balance, player count and state.
    RequestId performUpkeep();

    // Callbacks run after the state change they describe has been committed.
    void subscribe(RaffleEventCallback callback);

    static std::size_t selectWinnerIndex(const RandomWord& randomValue,
                                         std::size_t participantCount);

    const RaffleConfig& getConfig() const { return config_; }
    Amount getEntranceFee() const { return config_.entranceFee; }
    std::chrono::seconds getInterval() const { return config_.interval; }
    std::uint16_t getRequestConfirmations() const { return config_.request.requestConfirmations; }
    std::uint32_t getNumWords() const { return config_.request.numWords; }

    RoundState getRaffleState() const;
    std::size_t getNumberOfPlayers() const;
    Address getPlayer(std::size_t index) const;
    std::vector<Address> getPlayers() const;
    Timestamp getLastTimeStamp() const;
    std::optional<WinnerRecord> getRecentWinner() const;
    Amount getPooledBalance() const;
    // Full copy of the audit log, for proofs. Prefer the two accessors below for status.
    EventLog getEventLog() const;
    std::size_t getEventLogSize() const;
    std::string getEventLogRoot() const;

protected:
    void fulfillRandomWords(RequestId requestId,
                            const std::vector<RandomWord>& randomWords) override;

private:
    void fulfillRandomValue(RequestId requestId, const RandomWord& randomValue);
    UpkeepCheck inspectUpkeepLocked() const;
    void ensureNotPayingOut(const char* operation) const;
    void publish(const RaffleEvent& event);

    const RaffleConfig config_;
    RandomnessClient& randomness_;
    FundTransfer& funds_;
    const TimeSource& clock_;

    mutable std::recursive_mutex mutex_;
    RaffleStorage storage_;
    EventLog eventLog_;
    std::vector<RaffleEventCallback> subscribers_;
    bool payoutInFlight_;
    Logger log_;
};

} // namespace raffle
