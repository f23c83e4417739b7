#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace raffle {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// Everything a third party needs to check a draw: the input, the proof and the
// output it commits to.
struct VrfProof {
    std::string alpha;
    std::string proofHex;
    std::string outputHex;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

class VrfProver {
public:
    VrfProver(std::string secretKeyHex, std::string publicKeyHex);
    ~VrfProver();

    VrfProver(const VrfProver&) = delete;
    VrfProver& operator=(const VrfProver&) = delete;

    VrfProof prove(const std::string& alpha) const;
    const std::string& publicKey() const { return publicKeyHex_; }

private:
    std::vector<unsigned char> secretKey_;
    std::string publicKeyHex_;
};

bool verifyVrfProof(const VrfProof& proof, const std::string& publicKeyHex);

std::string buildRequestAlpha(const std::string& deploymentId,
                              const std::string& chainId,
                              const std::string& keyHash,
                              std::uint64_t subscriptionId,
                              RequestId requestId,
                              std::uint64_t preSeed);

// Stretches one VRF output into `numWords` independent 256-bit words.
std::vector<RandomWord> expandRandomWords(const std::string& vrfOutputHex, std::uint32_t numWords);

std::string toHex(const RandomWord& word);

} // namespace raffle
