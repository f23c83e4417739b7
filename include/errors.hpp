#pragma once

#include "types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace raffle {

class RaffleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InsufficientStakeError : public RaffleError {
public:
    InsufficientStakeError(Amount sent, Amount required);

    Amount sent() const { return sent_; }
    Amount required() const { return required_; }

private:
    Amount sent_;
    Amount required_;
};

class RoundNotOpenError : public RaffleError {
public:
    RoundNotOpenError();
};

// Carries the values that made the eligibility predicate false.
class UpkeepNotNeededError : public RaffleError {
public:
    UpkeepNotNeededError(Amount balance, std::size_t participants, RoundState state);

    Amount balance() const { return balance_; }
    std::size_t participants() const { return participants_; }
    RoundState state() const { return state_; }

private:
    Amount balance_;
    std::size_t participants_;
    RoundState state_;
};

class ReentrantCallError : public RaffleError {
public:
    explicit ReentrantCallError(const std::string& operation);
};

class TransferFailedError : public RaffleError {
public:
    TransferFailedError(Address recipient, Amount amount);

    const Address& recipient() const { return recipient_; }
    Amount amount() const { return amount_; }

private:
    Address recipient_;
    Amount amount_;
};

// Duplicate or unknown fulfillment, rejected at the randomness client boundary.
class UnknownRequestError : public RaffleError {
public:
    explicit UnknownRequestError(RequestId requestId);

    RequestId requestId() const { return requestId_; }

private:
    RequestId requestId_;
};

class UnauthorizedFulfillerError : public RaffleError {
public:
    UnauthorizedFulfillerError(Address caller, Address expected);

    const Address& caller() const { return caller_; }
    const Address& expected() const { return expected_; }

private:
    Address caller_;
    Address expected_;
};

class InsufficientFundsError : public RaffleError {
public:
    InsufficientFundsError(Address account, Amount available, Amount requested);

    const Address& account() const { return account_; }
    Amount available() const { return available_; }
    Amount requested() const { return requested_; }

private:
    Address account_;
    Amount available_;
    Amount requested_;
};

} // namespace raffle
