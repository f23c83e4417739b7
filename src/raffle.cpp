#include "raffle.hpp"

#include "errors.hpp"
#include "round_transaction.hpp"

#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

const RaffleConfig& validated(const RaffleConfig& cfg) {
    validateConfig(cfg);
    return cfg;
}

class PayoutGuard {
public:
    explicit PayoutGuard(bool& flag)
        : flag_(flag) {
        flag_ = true;
    }
    ~PayoutGuard() { flag_ = false; }

    PayoutGuard(const PayoutGuard&) = delete;
    PayoutGuard& operator=(const PayoutGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

Raffle::Raffle(RaffleConfig config,
               RandomnessClient& randomness,
               FundTransfer& funds,
               const TimeSource& clock)
    : RandomnessConsumer(validated(config).randomnessClient)
    , config_(std::move(config))
    , randomness_(randomness)
    , funds_(funds)
    , clock_(clock)
    , storage_(clock.now())
    , payoutInFlight_(false)
    , log_(createLogger("raffle")) {
    if (randomness_.identity() != config_.randomnessClient) {
        throw std::invalid_argument("randomness client " + randomness_.identity() +
                                    " is not the configured fulfiller " +
                                    config_.randomnessClient);
    }
    if (funds_.custodian() != config_.custodyAccount) {
        throw std::invalid_argument("fund custody " + funds_.custodian() +
                                    " is not the configured custody account " +
                                    config_.custodyAccount);
    }
    log_->info("raffle deployed: entranceFee={} interval={}s custody={}",
               config_.entranceFee,
               config_.interval.count(),
               config_.custodyAccount);
}

void Raffle::enterRaffle(const Address& participant, Amount stake) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensureNotPayingOut("enterRaffle");
    if (stake < config_.entranceFee) {
        log_->debug("{} sent {} below the entrance fee", participant, stake);
        throw InsufficientStakeError(stake, config_.entranceFee);
    }
    if (storage_.state != RoundState::OPEN) {
        log_->debug("{} tried to enter while {}", participant, toString(storage_.state));
        throw RoundNotOpenError();
    }
    if (participant.empty()) {
        throw std::invalid_argument("participant address must not be empty");
    }

    funds_.collect(participant, stake);
    storage_.participants.append(participant);
    publish(RaffleEvent{ RaffleEventKind::ENTERED_RAFFLE, participant, 0, stake });
}

bool Raffle::checkUpkeep() const {
    return inspectUpkeep().upkeepNeeded;
}

UpkeepCheck Raffle::inspectUpkeep() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return inspectUpkeepLocked();
}

UpkeepCheck Raffle::inspectUpkeepLocked() const {
    UpkeepCheck check;
    check.timeHasPassed = storage_.clock.elapsedSince(clock_.now()) >= config_.interval;
    check.isOpen = storage_.state == RoundState::OPEN;
    check.hasBalance = funds_.heldBalance() > 0;
    check.hasPlayers = !storage_.participants.empty();
    check.upkeepNeeded = check.timeHasPassed && check.isOpen && check.hasBalance && check.hasPlayers;
    return check;
}

RequestId Raffle::performUpkeep() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensureNotPayingOut("performUpkeep");
    if (!inspectUpkeepLocked().upkeepNeeded) {
        Amount balance = funds_.heldBalance();
        log_->debug("upkeep not needed: balance={} players={} state={}",
                    balance,
                    storage_.participants.size(),
                    toString(storage_.state));
        throw UpkeepNotNeededError(balance, storage_.participants.size(), storage_.state);
    }

    // Admissions close before the request leaves this object.
    storage_.state = RoundState::CALCULATING;
    RequestId requestId = 0;
    try {
        requestId = randomness_.requestDraw(config_.request, *this);
    } catch (const std::exception& ex) {
        storage_.state = RoundState::OPEN;
        log_->error("randomness request rejected: {}", ex.what());
        throw;
    }

    log_->info("draw requested: requestId={} players={}", requestId, storage_.participants.size());
    publish(RaffleEvent{ RaffleEventKind::REQUESTED_DRAW, {}, requestId, 0 });
    return requestId;
}

void Raffle::fulfillRandomWords(RequestId requestId, const std::vector<RandomWord>& randomWords) {
    fulfillRandomValue(requestId, randomWords.front());
}

void Raffle::fulfillRandomValue(RequestId requestId, const RandomWord& randomValue) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensureNotPayingOut("fulfillRandomWords");
    if (storage_.state != RoundState::CALCULATING || storage_.participants.empty()) {
        log_->warn("fulfillment for request {} arrived while no draw is pending", requestId);
        throw UnknownRequestError(requestId);
    }

    const std::size_t index = selectWinnerIndex(randomValue, storage_.participants.size());
    const Address winner = storage_.participants.at(index);
    const Amount prize = funds_.heldBalance();

    RoundTransaction tx(storage_);
    RaffleStorage& staged = tx.storage();
    staged.recentWinner = WinnerRecord{ winner, prize };
    staged.clock.reset(clock_.now());
    staged.participants.clear();
    staged.state = RoundState::OPEN;
    tx.stage(RaffleEvent{ RaffleEventKind::WINNER_PICKED, winner, requestId, prize });

    bool paid = false;
    {
        PayoutGuard guard(payoutInFlight_);
        paid = funds_.transfer(winner, prize);
    }
    if (!paid) {
        tx.rollback();
        log_->error("payout of {} to {} failed; request {} stays pending", prize, winner, requestId);
        throw TransferFailedError(winner, prize);
    }

    for (const auto& event : tx.commit()) {
        publish(event);
    }
    log_->info("winner picked: {} (slot {}) won {} for request {}", winner, index, prize, requestId);
}

std::size_t Raffle::selectWinnerIndex(const RandomWord& randomValue, std::size_t participantCount) {
    if (participantCount == 0) {
        throw std::invalid_argument("cannot pick a winner from an empty round");
    }
    RandomWord slot = randomValue % RandomWord(participantCount);
    return static_cast<std::size_t>(slot);
}

void Raffle::subscribe(RaffleEventCallback callback) {
    if (!callback) {
        throw std::invalid_argument("event callback must be callable");
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

RoundState Raffle::getRaffleState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.state;
}

std::size_t Raffle::getNumberOfPlayers() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.participants.size();
}

Address Raffle::getPlayer(std::size_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.participants.at(index);
}

std::vector<Address> Raffle::getPlayers() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.participants.entries();
}

Timestamp Raffle::getLastTimeStamp() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.clock.lastReset();
}

std::optional<WinnerRecord> Raffle::getRecentWinner() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_.recentWinner;
}

Amount Raffle::getPooledBalance() const {
    return funds_.heldBalance();
}

EventLog Raffle::getEventLog() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return eventLog_;
}

std::size_t Raffle::getEventLogSize() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return eventLog_.size();
}

std::string Raffle::getEventLogRoot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return eventLog_.merkleRoot();
}

void Raffle::ensureNotPayingOut(const char* operation) const {
    if (payoutInFlight_) {
        throw ReentrantCallError(operation);
    }
}

void Raffle::publish(const RaffleEvent& event) {
    eventLog_.append(event);
    for (const auto& callback : subscribers_) {
        try {
            callback(event);
        } catch (const std::exception& ex) {
            // The state change is already committed; a broken observer cannot undo it.
            log_->error("{} subscriber failed: {}", toString(event.kind), ex.what());
        } catch (...) {
            log_->error("{} subscriber failed with a non-standard exception", toString(event.kind));
        }
    }
}

} // namespace raffle
