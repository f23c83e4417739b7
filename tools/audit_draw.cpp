#include "raffle.hpp"
#include "vrf.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: audit_draw <publicKeyHex> <alpha> <vrfProofHex> <vrfOutputHex> <playerCount>\n";
        return 1;
    }

    raffle::VrfProof proof{ argv[2], argv[3], argv[4] };
    std::string publicKey = argv[1];
    std::size_t playerCount = 0;
    try {
        playerCount = static_cast<std::size_t>(std::stoull(argv[5]));
    } catch (const std::exception& ex) {
        std::cerr << "playerCount must be an unsigned integer: " << ex.what() << '\n';
        return 1;
    }
    if (playerCount == 0) {
        std::cerr << "playerCount must be positive\n";
        return 1;
    }

    bool ok = raffle::verifyVrfProof(proof, publicKey);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    auto words = raffle::expandRandomWords(proof.outputHex, 1);
    std::cout << "Random word: 0x" << raffle::toHex(words.front()) << '\n';
    std::cout << "Winning slot: " << raffle::Raffle::selectWinnerIndex(words.front(), playerCount)
              << " of " << playerCount << '\n';
    return 0;
}
