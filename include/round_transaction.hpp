#pragma once

#include "event_log.hpp"
#include "round.hpp"

#include <vector>

namespace raffle {

// Undo log over RaffleStorage. Mutations are applied to the live storage so that
// re-entrant readers see them; the snapshot taken at construction is restored on
// rollback, or on destruction without commit. Events are staged and only handed
// back by commit().
class RoundTransaction {
public:
    explicit RoundTransaction(RaffleStorage& storage);
    ~RoundTransaction();

    RoundTransaction(const RoundTransaction&) = delete;
    RoundTransaction& operator=(const RoundTransaction&) = delete;

    RaffleStorage& storage();
    void stage(RaffleEvent event);

    std::vector<RaffleEvent> commit();
    void rollback();

    bool isOpen() const { return !finished_; }

private:
    RaffleStorage& storage_;
    RaffleStorage snapshot_;
    std::vector<RaffleEvent> staged_;
    bool finished_;
};

} // namespace raffle
