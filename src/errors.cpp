#include "errors.hpp"

#include <sstream>
#include <utility>

namespace raffle {

namespace {

std::string describeStake(Amount sent, Amount required) {
    std::ostringstream oss;
    oss << "Raffle__SendMoreToEnterRaffle: sent " << sent << ", entrance fee is " << required;
    return oss.str();
}

std::string describeUpkeep(Amount balance, std::size_t participants, RoundState state) {
    std::ostringstream oss;
    oss << "Raffle__UpkeepNotNeeded: balance=" << balance << " players=" << participants
        << " state=" << toString(state);
    return oss.str();
}

} // namespace

std::string toString(RoundState state) {
    switch (state) {
    case RoundState::OPEN:
        return "OPEN";
    case RoundState::CALCULATING:
        return "CALCULATING";
    }
    return "UNKNOWN";
}

InsufficientStakeError::InsufficientStakeError(Amount sent, Amount required)
    : RaffleError(describeStake(sent, required))
    , sent_(sent)
    , required_(required) {}

RoundNotOpenError::RoundNotOpenError()
    : RaffleError("Raffle__RaffleNotOpen: a draw is in progress") {}

UpkeepNotNeededError::UpkeepNotNeededError(Amount balance,
                                           std::size_t participants,
                                           RoundState state)
    : RaffleError(describeUpkeep(balance, participants, state))
    , balance_(balance)
    , participants_(participants)
    , state_(state) {}

ReentrantCallError::ReentrantCallError(const std::string& operation)
    : RaffleError(operation + " called while a payout is in flight") {}

TransferFailedError::TransferFailedError(Address recipient, Amount amount)
    : RaffleError("Raffle__TransferFailed: payout of " + std::to_string(amount) + " to " +
                  recipient + " was refused")
    , recipient_(std::move(recipient))
    , amount_(amount) {}

UnknownRequestError::UnknownRequestError(RequestId requestId)
    : RaffleError("nonexistent or already fulfilled request " + std::to_string(requestId))
    , requestId_(requestId) {}

UnauthorizedFulfillerError::UnauthorizedFulfillerError(Address caller, Address expected)
    : RaffleError("OnlyCoordinatorCanFulfill: have " + caller + ", want " + expected)
    , caller_(std::move(caller))
    , expected_(std::move(expected)) {}

InsufficientFundsError::InsufficientFundsError(Address account, Amount available, Amount requested)
    : RaffleError("account " + account + " holds " + std::to_string(available) + ", needs " +
                  std::to_string(requested))
    , account_(std::move(account))
    , available_(available)
    , requested_(requested) {}

} // namespace raffle
