#include "vrf.hpp"

#include "picosha2.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sodium.h>

namespace raffle {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        unsigned int byte = 0;
        std::istringstream iss(hex.substr(i, 2));
        iss >> std::hex >> byte;
        if (iss.fail()) {
            throw std::invalid_argument("invalid hex digit in \"" + hex.substr(i, 2) + "\"");
        }
        out.push_back(static_cast<unsigned char>(byte));
    }
    return out;
}

std::string stripHexPrefix(const std::string& value) {
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        return value.substr(2);
    }
    return value;
}

constexpr std::string_view kVrfDomainTag = "timed-raffle:vrf:v1";

} // namespace

VrfKeyPair generateVrfKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey.data());

    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    sodium_memzero(secretKey.data(), secretKey.size());
    return pair;
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    auto seed = hexToBytes(stripHexPrefix(seedHex));
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }

    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    sodium_memzero(secretKey.data(), secretKey.size());
    sodium_memzero(seed.data(), seed.size());
    return pair;
}

VrfProver::VrfProver(std::string secretKeyHex, std::string publicKeyHex)
    : publicKeyHex_(std::move(publicKeyHex)) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    secretKey_ = hexToBytes(secretKeyHex);
    sodium_memzero(&secretKeyHex[0], secretKeyHex.size());
    if (secretKey_.size() != crypto_vrf_SECRETKEYBYTES) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
        throw std::invalid_argument("VRF secret key length invalid");
    }
    if (hexToBytes(publicKeyHex_).size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("VRF public key length invalid");
    }
}

VrfProver::~VrfProver() {
    if (!secretKey_.empty()) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
    }
}

VrfProof VrfProver::prove(const std::string& alpha) const {
    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(alpha.data()),
                         alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }

    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    VrfProof result{
        alpha,
        bytesToHex(proof.data(), proof.size()),
        bytesToHex(output.data(), output.size()),
    };
    if (!verifyVrfProof(result, publicKeyHex_)) {
        throw std::runtime_error("VRF proof does not verify with the prover's public key");
    }
    return result;
}

bool verifyVrfProof(const VrfProof& proof, const std::string& publicKeyHex) {
    if (!ensureSodiumReady()) {
        return false;
    }

    std::vector<unsigned char> proofBytes;
    std::vector<unsigned char> publicKey;
    std::vector<unsigned char> output;
    try {
        proofBytes = hexToBytes(proof.proofHex);
        publicKey = hexToBytes(publicKeyHex);
        output = hexToBytes(proof.outputHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (proofBytes.size() != crypto_vrf_PROOFBYTES ||
        output.size() != crypto_vrf_OUTPUTBYTES ||
        publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        return false;
    }

    std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_verify(recomputed.data(),
                          publicKey.data(),
                          proofBytes.data(),
                          reinterpret_cast<const unsigned char*>(proof.alpha.data()),
                          proof.alpha.size()) != 0) {
        return false;
    }
    return std::equal(recomputed.begin(), recomputed.end(), output.begin());
}

std::string buildRequestAlpha(const std::string& deploymentId,
                              const std::string& chainId,
                              const std::string& keyHash,
                              std::uint64_t subscriptionId,
                              RequestId requestId,
                              std::uint64_t preSeed) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for VRF domain separation");
    }
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << deploymentId;
    if (!chainId.empty()) {
        oss << "|" << chainId;
    }
    oss << "|" << stripHexPrefix(keyHash) << "|" << subscriptionId << "|" << requestId << ":"
        << preSeed;
    return oss.str();
}

std::vector<RandomWord> expandRandomWords(const std::string& vrfOutputHex, std::uint32_t numWords) {
    if (vrfOutputHex.empty()) {
        throw std::invalid_argument("VRF output must not be empty");
    }
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::ostringstream oss;
        oss << kVrfDomainTag << "|word|" << vrfOutputHex << ':' << i;
        const std::string input = oss.str();

        std::array<unsigned char, 32> digest{};
        picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());

        RandomWord word;
        boost::multiprecision::import_bits(word, digest.begin(), digest.end(), 8);
        words.push_back(word);
    }
    return words;
}

std::string toHex(const RandomWord& word) {
    std::ostringstream oss;
    oss << std::hex << word;
    return oss.str();
}

} // namespace raffle
