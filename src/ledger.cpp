#include "ledger.hpp"

#include "errors.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

Amount checkedAdd(Amount balance, Amount amount) {
    if (amount > std::numeric_limits<Amount>::max() - balance) {
        throw std::overflow_error("ledger balance overflow");
    }
    return balance + amount;
}

} // namespace

Ledger::Ledger()
    : log_(createLogger("ledger")) {}

void Ledger::credit(const Address& account, Amount amount) {
    if (account.empty()) {
        throw std::invalid_argument("cannot credit an empty address");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[account];
    balance = checkedAdd(balance, amount);
}

Amount Ledger::balanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void Ledger::move(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    moveLocked(from, to, amount);
}

bool Ledger::tryMove(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        moveLocked(from, to, amount);
    } catch (const InsufficientFundsError& ex) {
        log_->debug("move of {} from {} to {} rejected: {}", amount, from, to, ex.what());
        return false;
    }
    return true;
}

void Ledger::moveLocked(const Address& from, const Address& to, Amount amount) {
    if (to.empty()) {
        throw std::invalid_argument("cannot pay an empty address");
    }
    auto it = balances_.find(from);
    Amount available = it == balances_.end() ? 0 : it->second;
    if (available < amount) {
        throw InsufficientFundsError(from, available, amount);
    }
    if (from == to) {
        return;
    }
    Amount credited = checkedAdd(balances_[to], amount);
    balances_[from] = available - amount;
    balances_[to] = credited;
}

void Ledger::setRecipientHook(const Address& account, RecipientHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_[account] = std::move(hook);
}

void Ledger::clearRecipientHook(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.erase(account);
}

bool Ledger::acceptsPayment(const Address& recipient, Amount amount) const {
    RecipientHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hooks_.find(recipient);
        if (it == hooks_.end()) {
            return true;
        }
        hook = it->second;
    }
    // Run without the lock so the hook can use the ledger.
    return hook(recipient, amount);
}

CustodyAccount::CustodyAccount(Ledger& ledger, Address custodian)
    : ledger_(ledger)
    , custodian_(std::move(custodian))
    , log_(createLogger("ledger")) {
    if (custodian_.empty()) {
        throw std::invalid_argument("custodian address must not be empty");
    }
}

void CustodyAccount::collect(const Address& payer, Amount amount) {
    ledger_.move(payer, custodian_, amount);
}

Amount CustodyAccount::heldBalance() const {
    return ledger_.balanceOf(custodian_);
}

bool CustodyAccount::transfer(const Address& recipient, Amount amount) {
    bool accepted = false;
    try {
        accepted = ledger_.acceptsPayment(recipient, amount);
    } catch (const std::exception& ex) {
        log_->warn("{} reverted a payment of {}: {}", recipient, amount, ex.what());
        return false;
    }
    if (!accepted) {
        log_->warn("{} refused a payment of {}", recipient, amount);
        return false;
    }
    if (!ledger_.tryMove(custodian_, recipient, amount)) {
        log_->warn("custody {} cannot cover a payment of {} to {}", custodian_, amount, recipient);
        return false;
    }
    return true;
}

} // namespace raffle
