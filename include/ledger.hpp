#pragma once

#include "fund_transfer.hpp"
#include "logger.hpp"
#include "types.hpp"

#include <functional>
#include <map>
#include <mutex>

namespace raffle {

// Invoked before a payment is credited; returning false refuses it. Hooks may call
// back into whatever sent the payment.
using RecipientHook = std::function<bool(const Address& recipient, Amount amount)>;

// In-memory account book standing in for the chain's native balances.
class Ledger {
public:
    Ledger();

    void credit(const Address& account, Amount amount);
    Amount balanceOf(const Address& account) const;

    // Throws InsufficientFundsError when `from` cannot cover `amount`.
    void move(const Address& from, const Address& to, Amount amount);
    bool tryMove(const Address& from, const Address& to, Amount amount);

    void setRecipientHook(const Address& account, RecipientHook hook);
    void clearRecipientHook(const Address& account);
    bool acceptsPayment(const Address& recipient, Amount amount) const;

private:
    void moveLocked(const Address& from, const Address& to, Amount amount);

    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
    std::map<Address, RecipientHook> hooks_;
    Logger log_;
};

class CustodyAccount : public FundTransfer {
public:
    CustodyAccount(Ledger& ledger, Address custodian);

    void collect(const Address& payer, Amount amount) override;
    Amount heldBalance() const override;
    bool transfer(const Address& recipient, Amount amount) override;

    const Address& custodian() const override { return custodian_; }

private:
    Ledger& ledger_;
    Address custodian_;
    Logger log_;
};

} // namespace raffle
