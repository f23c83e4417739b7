#pragma once

#include "types.hpp"

namespace raffle {

// Holds the pooled stake of a raffle and pays it out.
class FundTransfer {
public:
    virtual ~FundTransfer() = default;

    // Address holding the pool.
    virtual const Address& custodian() const = 0;

    // Takes `amount` from `payer` into custody; throws InsufficientFundsError.
    virtual void collect(const Address& payer, Amount amount) = 0;
    virtual Amount heldBalance() const = 0;
    // All-or-nothing: on false nothing moved.
    virtual bool transfer(const Address& recipient, Amount amount) = 0;
};

} // namespace raffle
