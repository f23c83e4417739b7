#include "config.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "raffle.hpp"
#include "time_source.hpp"
#include "vrf.hpp"
#include "vrf_coordinator.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include <spdlog/cfg/env.h>

using namespace raffle;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  fund <address> <amount>    credit an account in the ledger\n"
              << "  enter <address> <amount>   buy a slot in the current round\n"
              << "  warp <seconds>             advance the simulated clock\n"
              << "  check                      evaluate the upkeep conditions\n"
              << "  upkeep                     trigger the draw\n"
              << "  fulfill <requestId>        answer a pending draw with VRF output\n"
              << "  refuse <address>           make an account reject payouts\n"
              << "  accept <address>           let an account receive payouts again\n"
              << "  status                     show round, pool and balances\n"
              << "  quit\n";
}

void printStatus(const Raffle& raffle, const Ledger& ledger, const TimeSource& clock) {
    auto players = raffle.getPlayers();
    std::cout << "State: " << toString(raffle.getRaffleState()) << "\n";
    std::cout << "Pool: " << raffle.getPooledBalance() << "  Entrance fee: " << raffle.getEntranceFee()
              << "\n";
    auto elapsed = clock.now() - raffle.getLastTimeStamp();
    std::cout << "Elapsed: " << elapsed.count() << "s of " << raffle.getInterval().count() << "s\n";
    std::cout << "Players (" << players.size() << "):\n";
    for (std::size_t i = 0; i < players.size(); ++i) {
        std::cout << "  [" << i << "] " << players[i] << "  balance " << ledger.balanceOf(players[i])
                  << "\n";
    }
    if (auto winner = raffle.getRecentWinner()) {
        std::cout << "Recent winner: " << winner->winner << " (" << winner->amount << ")\n";
    }
    std::cout << "Event log: " << raffle.getEventLogSize() << " entries, root "
              << raffle.getEventLogRoot() << "\n";
}

void printUpkeep(const UpkeepCheck& check) {
    std::cout << "timeHasPassed=" << check.timeHasPassed << " isOpen=" << check.isOpen
              << " hasBalance=" << check.hasBalance << " hasPlayers=" << check.hasPlayers
              << " => upkeepNeeded=" << check.upkeepNeeded << "\n";
}

} // namespace

int main() {
    spdlog::cfg::load_env_levels();

    RaffleConfig defaults;
    defaults.entranceFee = 1;
    RaffleConfig cfg;
    DeploymentScope scope;
    VrfKeyPair keys;
    try {
        cfg = loadConfigFromEnv(defaults);
        scope = resolveDeploymentScope("local-cli");
        const char* seedEnv = std::getenv("RAFFLE_VRF_SEED");
        keys = seedEnv ? deriveVrfKeypairFromSeed(seedEnv) : generateVrfKeypair();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    ManualTimeSource clock(std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now()));
    Ledger ledger;
    CustodyAccount custody(ledger, cfg.custodyAccount);
    VrfCoordinator coordinator(cfg.randomnessClient, keys, scope);
    Raffle raffle(cfg, coordinator, custody, clock);

    raffle.subscribe([](const RaffleEvent& event) {
        std::cout << "  event " << encodeEvent(event) << "\n";
    });

    std::cout << "Timed raffle on a simulated clock.\n";
    std::cout << "Coordinator VRF public key: " << coordinator.publicKey() << "\n";
    std::cout << "Deployment scope: " << scope.deploymentId;
    if (!scope.chainId.empty()) {
        std::cout << " | " << scope.chainId;
    }
    std::cout << " (set RAFFLE_DEPLOYMENT_ID/RAFFLE_CHAIN_ID to override)\n";
    printHelp();

    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "fund") {
                std::string address;
                Amount amount = 0;
                if (!(in >> address >> amount)) {
                    std::cout << "usage: fund <address> <amount>\n";
                    continue;
                }
                ledger.credit(address, amount);
                std::cout << address << " now holds " << ledger.balanceOf(address) << "\n";
            } else if (command == "enter") {
                std::string address;
                Amount amount = 0;
                if (!(in >> address >> amount)) {
                    std::cout << "usage: enter <address> <amount>\n";
                    continue;
                }
                raffle.enterRaffle(address, amount);
            } else if (command == "warp") {
                long long seconds = 0;
                if (!(in >> seconds)) {
                    std::cout << "usage: warp <seconds>\n";
                    continue;
                }
                clock.advance(std::chrono::seconds(seconds));
            } else if (command == "check") {
                printUpkeep(raffle.inspectUpkeep());
            } else if (command == "upkeep") {
                RequestId id = raffle.performUpkeep();
                std::cout << "Draw requested, requestId " << id << "\n";
            } else if (command == "fulfill") {
                RequestId id = 0;
                if (!(in >> id)) {
                    std::cout << "usage: fulfill <requestId>\n";
                    continue;
                }
                auto fulfillment = coordinator.fulfillRandomWords(id);
                std::cout << "VRF alpha: " << fulfillment.proof->alpha << "\n";
                std::cout << "VRF proof: " << fulfillment.proof->proofHex << "\n";
                std::cout << "VRF output: " << fulfillment.proof->outputHex << "\n";
                std::cout << "Random word: 0x" << toHex(fulfillment.randomWords.front()) << "\n";
            } else if (command == "refuse") {
                std::string address;
                if (!(in >> address)) {
                    std::cout << "usage: refuse <address>\n";
                    continue;
                }
                ledger.setRecipientHook(address, [](const Address&, Amount) { return false; });
            } else if (command == "accept") {
                std::string address;
                if (!(in >> address)) {
                    std::cout << "usage: accept <address>\n";
                    continue;
                }
                ledger.clearRecipientHook(address);
            } else if (command == "status") {
                printStatus(raffle, ledger, clock);
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const UpkeepNotNeededError& ex) {
            std::cout << "Upkeep not needed: balance " << ex.balance() << ", players "
                      << ex.participants() << ", state " << toString(ex.state()) << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Rejected: " << ex.what() << "\n";
        }
    }

    std::cout << "Bye.\n";
    return 0;
}
