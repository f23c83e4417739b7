#include "event_log.hpp"
#include "test_support.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

const std::string kSuite = "event_log_test";

void fail(const std::string& msg) {
    raffle::test::fail(kSuite, msg);
}

raffle::RaffleEvent entered(const std::string& who) {
    return raffle::RaffleEvent{ raffle::RaffleEventKind::ENTERED_RAFFLE, who, 0, 1 };
}

void emptyLogHasNoRoot() {
    raffle::EventLog log;
    if (!log.merkleRoot().empty() || !log.merkleProof(0).empty() || !log.leaf(0).empty()) {
        fail("empty log produced commitments");
    }
    if (raffle::EventLog::verifyProof("", 0, {}, "")) {
        fail("empty proof verified");
    }
}

void proofsVerifyForEveryLeaf() {
    for (std::size_t count = 1; count <= 7; ++count) {
        raffle::EventLog log;
        for (std::size_t i = 0; i < count; ++i) {
            log.append(entered("player-" + std::to_string(i)));
        }
        const std::string root = log.merkleRoot();
        if (count == 1 && root != log.leaf(0)) {
            fail("single leaf log root is not the leaf");
        }
        for (std::size_t i = 0; i < count; ++i) {
            auto proof = log.merkleProof(i);
            if (!raffle::EventLog::verifyProof(log.leaf(i), i, proof, root)) {
                fail("proof failed for leaf " + std::to_string(i) + " of " + std::to_string(count));
            }
        }
    }
}

void tamperedLeafIsRejected() {
    raffle::EventLog log;
    log.append(entered("alice"));
    log.append(raffle::RaffleEvent{ raffle::RaffleEventKind::REQUESTED_DRAW, {}, 1, 0 });
    log.append(raffle::RaffleEvent{ raffle::RaffleEventKind::WINNER_PICKED, "alice", 0, 1 });

    const std::string root = log.merkleRoot();
    auto proof = log.merkleProof(2);
    auto forged = raffle::EventLog::hashEvent(
        raffle::RaffleEvent{ raffle::RaffleEventKind::WINNER_PICKED, "mallory", 0, 1 });
    if (raffle::EventLog::verifyProof(forged, 2, proof, root)) {
        fail("forged winner verified against the root");
    }
    if (raffle::EventLog::verifyProof(log.leaf(2), 1, proof, root)) {
        fail("proof verified at the wrong position");
    }

    log.append(entered("bob"));
    if (log.merkleRoot() == root) {
        fail("root did not change after append");
    }
}

void encodingsAreUnambiguous() {
    std::set<std::string> encodings{
        raffle::encodeEvent(entered("ab")),
        raffle::encodeEvent(entered("a")),
        raffle::encodeEvent(raffle::RaffleEvent{ raffle::RaffleEventKind::WINNER_PICKED, "a", 0, 1 }),
        raffle::encodeEvent(raffle::RaffleEvent{ raffle::RaffleEventKind::WINNER_PICKED, "a", 0, 11 }),
        raffle::encodeEvent(raffle::RaffleEvent{ raffle::RaffleEventKind::REQUESTED_DRAW, {}, 1, 0 }),
        raffle::encodeEvent(raffle::RaffleEvent{ raffle::RaffleEventKind::REQUESTED_DRAW, {}, 11, 0 }),
    };
    if (encodings.size() != 6) {
        fail("distinct events share an encoding");
    }
    if (raffle::toString(raffle::RaffleEventKind::WINNER_PICKED) != "WinnerPicked") {
        fail("event name mismatch");
    }
}

void raffleHistoryIsCommitted() {
    raffle::test::RaffleHarness h;
    h.fundAndEnter("alice", 1);
    h.fundAndEnter("bob", 1);
    h.warpPastInterval();
    raffle::RequestId id = h.raffle->performUpkeep();
    h.randomness.fulfill(id, 1);

    auto log = h.raffle->getEventLog();
    if (log.size() != h.events.size() || log.size() != 4) {
        fail("event log and subscribers disagree");
    }
    if (h.raffle->getEventLogSize() != 4 || h.raffle->getEventLogRoot() != log.merkleRoot()) {
        fail("log summary does not match the copy");
    }
    for (std::size_t i = 0; i < log.size(); ++i) {
        if (log.leaf(i) != raffle::EventLog::hashEvent(h.events[i])) {
            fail("log leaf does not match the published event");
        }
    }
    const auto& winner = log.events().back();
    if (winner.kind != raffle::RaffleEventKind::WINNER_PICKED || winner.participant != "bob") {
        fail("last logged event is not the winner");
    }
    if (!raffle::EventLog::verifyProof(log.leaf(3), 3, log.merkleProof(3), log.merkleRoot())) {
        fail("winner entry not provable");
    }
}

} // namespace

int main() {
    emptyLogHasNoRoot();
    proofsVerifyForEveryLeaf();
    tamperedLeafIsRejected();
    encodingsAreUnambiguous();
    raffleHistoryIsCommitted();

    std::cout << kSuite << " passed" << std::endl;
    return 0;
}
