#include "round_transaction.hpp"

#include <stdexcept>
#include <utility>

namespace raffle {

RoundTransaction::RoundTransaction(RaffleStorage& storage)
    : storage_(storage)
    , snapshot_(storage)
    , finished_(false) {}

RoundTransaction::~RoundTransaction() {
    if (!finished_) {
        rollback();
    }
}

RaffleStorage& RoundTransaction::storage() {
    if (finished_) {
        throw std::logic_error("round transaction already finished");
    }
    return storage_;
}

void RoundTransaction::stage(RaffleEvent event) {
    if (finished_) {
        throw std::logic_error("round transaction already finished");
    }
    staged_.push_back(std::move(event));
}

std::vector<RaffleEvent> RoundTransaction::commit() {
    if (finished_) {
        throw std::logic_error("round transaction already finished");
    }
    finished_ = true;
    return std::move(staged_);
}

void RoundTransaction::rollback() {
    if (finished_) {
        return;
    }
    storage_ = snapshot_;
    staged_.clear();
    finished_ = true;
}

} // namespace raffle
