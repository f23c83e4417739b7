#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

const std::string kSuite = "raffle_fulfillment_test";

void fail(const std::string& msg) {
    raffle::test::fail(kSuite, msg);
}

raffle::RequestId startDraw(raffle::test::RaffleHarness& h) {
    h.warpPastInterval();
    return h.raffle->performUpkeep();
}

void fulfillmentNeedsAPendingRequest() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    h.warpPastInterval();
    for (raffle::RequestId id : { raffle::RequestId{ 0 }, raffle::RequestId{ 1 } }) {
        raffle::test::expectThrows<raffle::UnknownRequestError>(
            kSuite, "fulfill before upkeep", [&] { h.randomness.fulfill(id, 7); });
    }
    // Even a correctly identified caller cannot settle a round that never closed.
    raffle::test::expectThrows<raffle::UnknownRequestError>(kSuite, "direct fulfill while open", [&] {
        h.raffle->rawFulfillRandomWords("vrf-coordinator", 1, { 7 });
    });
    if (h.raffle->getNumberOfPlayers() != 1) {
        fail("stray fulfillment changed the round");
    }
}

void singlePlayerScenario() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    raffle::RequestId id = startDraw(h);

    h.randomness.fulfill(id, 7);

    auto winner = h.raffle->getRecentWinner();
    if (!winner || winner->winner != "alice" || winner->amount != 1) {
        fail("single player did not win the pool");
    }
    if (h.ledger.balanceOf("alice") != 1 || h.raffle->getPooledBalance() != 0) {
        fail("pool not paid out");
    }
    if (h.raffle->getRaffleState() != raffle::RoundState::OPEN || h.raffle->getNumberOfPlayers() != 0) {
        fail("round not reset");
    }
}

void sixEntryScenario() {
    const std::vector<std::string> players{ "p0", "p1", "p2", "p3", "p1", "p5" };
    const raffle::RandomWord value("78541660797044910968829902406342334108369226379826116161446442989268089806461");
    const std::size_t expected = static_cast<std::size_t>(value % 6);

    raffle::test::RaffleHarness h;
    for (const auto& player : players) {
        h.fundAndEnter(player, 1);
    }
    if (h.raffle->getPooledBalance() != 6) {
        fail("pool is not 6");
    }

    const std::string& expectedWinner = players[expected];
    raffle::Amount before = h.ledger.balanceOf(expectedWinner);
    raffle::RequestId id = startDraw(h);
    h.randomness.fulfill(id, value);

    auto winner = h.raffle->getRecentWinner();
    if (!winner || winner->winner != expectedWinner || winner->amount != 6) {
        fail("winner is not the slot at value mod 6");
    }
    if (h.ledger.balanceOf(expectedWinner) != before + 6) {
        fail("winner balance did not grow by the pool");
    }
    const auto& picked = h.events.back();
    if (picked.kind != raffle::RaffleEventKind::WINNER_PICKED || picked.participant != expectedWinner ||
        picked.amount != 6) {
        fail("WinnerPicked not emitted with winner and amount");
    }
}

void winnerSelectionIsDeterministic() {
    const raffle::RandomWord big = (raffle::RandomWord(1) << 255) + 11;
    for (std::size_t count = 1; count <= 9; ++count) {
        std::size_t first = raffle::Raffle::selectWinnerIndex(big, count);
        if (first != raffle::Raffle::selectWinnerIndex(big, count)) {
            fail("selection not deterministic");
        }
        if (first != static_cast<std::size_t>(big % count)) {
            fail("selection is not value mod count");
        }
    }
    if (raffle::Raffle::selectWinnerIndex(7, 1) != 0 || raffle::Raffle::selectWinnerIndex(7, 4) != 3) {
        fail("small value selection wrong");
    }
    raffle::test::expectThrows<std::invalid_argument>(
        kSuite, "empty round", [] { raffle::Raffle::selectWinnerIndex(7, 0); });
}

void resetsRoundAfterPayout() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    h.fundAndEnter("bob", 1);
    raffle::RequestId id = startDraw(h);
    h.clock.advance(std::chrono::seconds(12));
    const raffle::Timestamp fulfilledAt = h.clock.now();

    h.randomness.fulfill(id, 1);

    if (h.raffle->getLastTimeStamp() != fulfilledAt) {
        fail("round clock not moved to the fulfillment time");
    }
    if (h.raffle->checkUpkeep()) {
        fail("fresh round already eligible");
    }
    raffle::test::expectThrows<raffle::UnknownRequestError>(
        kSuite, "second fulfillment", [&] { h.randomness.fulfill(id, 1); });

    h.fundAndEnter("carol", 1);
    if (h.raffle->getNumberOfPlayers() != 1) {
        fail("new round does not admit players");
    }
}

void failedTransferRollsBack() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    h.fundAndEnter("bob", 1);
    raffle::RequestId id = startDraw(h);
    const raffle::Timestamp lastReset = h.raffle->getLastTimeStamp();
    const std::size_t eventsBefore = h.events.size();
    const std::size_t logBefore = h.raffle->getEventLog().size();

    // Index 1 is bob.
    h.ledger.setRecipientHook("bob", [](const raffle::Address&, raffle::Amount) { return false; });
    auto err = raffle::test::expectThrows<raffle::TransferFailedError>(
        kSuite, "refused payout", [&] { h.randomness.fulfill(id, 3); });
    if (err.recipient() != "bob" || err.amount() != 2) {
        fail("TransferFailed payload mismatch");
    }

    if (h.raffle->getRaffleState() != raffle::RoundState::CALCULATING) {
        fail("state not rolled back to CALCULATING");
    }
    if (h.raffle->getPlayers() != std::vector<raffle::Address>{ "alice", "bob" }) {
        fail("registry not restored");
    }
    if (h.raffle->getLastTimeStamp() != lastReset || h.raffle->getRecentWinner()) {
        fail("clock or winner record not restored");
    }
    if (h.raffle->getPooledBalance() != 2 || h.ledger.balanceOf("bob") != 0) {
        fail("funds moved despite the failure");
    }
    if (h.events.size() != eventsBefore || h.raffle->getEventLog().size() != logBefore) {
        fail("rolled back fulfillment published events");
    }
    if (!h.randomness.isPending(id)) {
        fail("request no longer pending after a failed delivery");
    }

    h.ledger.clearRecipientHook("bob");
    h.randomness.fulfill(id, 3);
    auto winner = h.raffle->getRecentWinner();
    if (!winner || winner->winner != "bob" || h.ledger.balanceOf("bob") != 2) {
        fail("retry did not pay the same winner");
    }
    if (h.raffle->getRaffleState() != raffle::RoundState::OPEN) {
        fail("retry did not reopen the round");
    }
}

void revertingRecipientIsTransferFailure() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    raffle::RequestId id = startDraw(h);

    h.ledger.setRecipientHook("alice", [](const raffle::Address&, raffle::Amount) -> bool {
        throw std::runtime_error("recipient reverted");
    });
    raffle::test::expectThrows<raffle::TransferFailedError>(
        kSuite, "reverting recipient", [&] { h.randomness.fulfill(id, 0); });
    if (h.raffle->getRaffleState() != raffle::RoundState::CALCULATING ||
        h.raffle->getNumberOfPlayers() != 1 || !h.randomness.isPending(id)) {
        fail("reverted payout was not rolled back");
    }

    // Re-entering without handling the rejection reverts the payment too.
    h.ledger.setRecipientHook("alice", [&](const raffle::Address&, raffle::Amount) {
        h.raffle->enterRaffle("alice", 1);
        return true;
    });
    raffle::test::expectThrows<raffle::TransferFailedError>(
        kSuite, "re-entering recipient", [&] { h.randomness.fulfill(id, 0); });
    if (h.raffle->getRaffleState() != raffle::RoundState::CALCULATING || !h.randomness.isPending(id)) {
        fail("re-entering recipient left the round settled");
    }

    h.ledger.clearRecipientHook("alice");
    h.randomness.fulfill(id, 0);
    if (h.ledger.balanceOf("alice") != 1) {
        fail("retry after a revert did not pay");
    }
}

void onlyTheCoordinatorMayFulfill() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    raffle::RequestId id = startDraw(h);

    auto err = raffle::test::expectThrows<raffle::UnauthorizedFulfillerError>(
        kSuite, "foreign caller", [&] { h.raffle->rawFulfillRandomWords("mallory", id, { 0 }); });
    if (err.caller() != "mallory" || err.expected() != "vrf-coordinator") {
        fail("OnlyCoordinatorCanFulfill payload mismatch");
    }
    if (h.raffle->getRaffleState() != raffle::RoundState::CALCULATING) {
        fail("foreign caller changed the state");
    }
}

void payoutSeesResetRound() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    raffle::RequestId id = startDraw(h);

    bool sawOpen = false;
    bool reentryRejected = false;
    h.ledger.setRecipientHook("alice", [&](const raffle::Address&, raffle::Amount) {
        sawOpen = h.raffle->getRaffleState() == raffle::RoundState::OPEN &&
                  h.raffle->getNumberOfPlayers() == 0;
        try {
            h.raffle->enterRaffle("alice", 1);
        } catch (const raffle::ReentrantCallError&) {
            reentryRejected = true;
        }
        return true;
    });

    h.randomness.fulfill(id, 0);
    if (!sawOpen) {
        fail("recipient observed a half-updated round");
    }
    if (!reentryRejected) {
        fail("re-entrant admission during payout was not rejected");
    }
    if (h.raffle->getNumberOfPlayers() != 0 || h.ledger.balanceOf("alice") != 1) {
        fail("re-entrant call left traces");
    }
}

void brokenObserverDoesNotUndoPayout() {
    raffle::test::RaffleHarness h;
    h.raffle->subscribe([](const raffle::RaffleEvent& event) {
        if (event.kind == raffle::RaffleEventKind::WINNER_PICKED) {
            throw std::runtime_error("observer crashed");
        }
    });
    h.raffle->subscribe([](const raffle::RaffleEvent& event) {
        if (event.kind == raffle::RaffleEventKind::WINNER_PICKED) {
            throw 42;
        }
    });
    h.fundAndEnter("alice", 1);
    raffle::RequestId id = startDraw(h);
    h.randomness.fulfill(id, 0);

    if (h.raffle->getRaffleState() != raffle::RoundState::OPEN || h.randomness.isPending(id)) {
        fail("observer failure leaked into the fulfillment");
    }
    if (h.events.back().kind != raffle::RaffleEventKind::WINNER_PICKED) {
        fail("observers registered earlier missed the event");
    }
}

} // namespace

int main() {
    fulfillmentNeedsAPendingRequest();
    singlePlayerScenario();
    sixEntryScenario();
    winnerSelectionIsDeterministic();
    resetsRoundAfterPayout();
    failedTransferRollsBack();
    onlyTheCoordinatorMayFulfill();
    payoutSeesResetRound();
    revertingRecipientIsTransferFailure();
    brokenObserverDoesNotUndoPayout();

    std::cout << kSuite << " passed" << std::endl;
    return 0;
}
