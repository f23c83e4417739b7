#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer");
    }
    std::size_t consumed = 0;
    std::uint64_t value = 0;
    try {
        value = std::stoull(text, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                    text + "\"");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " has trailing characters: \"" + text +
                                    "\"");
    }
    return value;
}

std::int64_t parseSigned(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    std::int64_t value = 0;
    try {
        value = std::stoll(text, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got \"" + text +
                                    "\"");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " has trailing characters: \"" + text +
                                    "\"");
    }
    return value;
}

bool isKeyHash(const std::string& value) {
    std::string digits = value;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() != 64) {
        return false;
    }
    return std::all_of(digits.begin(), digits.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

} // namespace

void validateRequestParameters(const RequestParameters& params) {
    if (!isKeyHash(params.keyHash)) {
        throw std::invalid_argument("keyHash must be 32 bytes of hex");
    }
    if (params.numWords == 0 || params.numWords > kMaxNumWords) {
        std::ostringstream oss;
        oss << "numWords must be within [1, " << kMaxNumWords << "], got " << params.numWords;
        throw std::invalid_argument(oss.str());
    }
    if (params.requestConfirmations > kMaxRequestConfirmations) {
        std::ostringstream oss;
        oss << "requestConfirmations (" << params.requestConfirmations
            << ") exceeds the maximum of " << kMaxRequestConfirmations;
        throw std::invalid_argument(oss.str());
    }
}

void validateConfig(const RaffleConfig& cfg) {
    if (cfg.entranceFee == 0) {
        throw std::invalid_argument("entranceFee must be positive");
    }
    if (cfg.interval.count() < 0) {
        throw std::invalid_argument("interval must not be negative");
    }
    if (cfg.randomnessClient.empty()) {
        throw std::invalid_argument("randomnessClient identity must not be empty");
    }
    if (cfg.custodyAccount.empty()) {
        throw std::invalid_argument("custodyAccount must not be empty");
    }
    validateRequestParameters(cfg.request);
}

RaffleConfig loadConfigFromEnv(RaffleConfig defaults) {
    RaffleConfig cfg = std::move(defaults);
    std::string value;

    if (readEnv("RAFFLE_ENTRANCE_FEE", value)) {
        cfg.entranceFee = parseUnsigned("RAFFLE_ENTRANCE_FEE", value);
    }
    if (readEnv("RAFFLE_INTERVAL_SECONDS", value)) {
        cfg.interval = std::chrono::seconds(parseSigned("RAFFLE_INTERVAL_SECONDS", value));
    }
    if (readEnv("RAFFLE_KEY_HASH", value)) {
        cfg.request.keyHash = value;
    }
    if (readEnv("RAFFLE_SUBSCRIPTION_ID", value)) {
        cfg.request.subscriptionId = parseUnsigned("RAFFLE_SUBSCRIPTION_ID", value);
    }
    if (readEnv("RAFFLE_CALLBACK_GAS_LIMIT", value)) {
        std::uint64_t gas = parseUnsigned("RAFFLE_CALLBACK_GAS_LIMIT", value);
        if (gas > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("RAFFLE_CALLBACK_GAS_LIMIT does not fit in 32 bits");
        }
        cfg.request.callbackGasLimit = static_cast<std::uint32_t>(gas);
    }
    if (readEnv("RAFFLE_COORDINATOR", value)) {
        cfg.randomnessClient = value;
    }
    if (readEnv("RAFFLE_CUSTODY_ACCOUNT", value)) {
        cfg.custodyAccount = value;
    }

    validateConfig(cfg);
    return cfg;
}

DeploymentScope resolveDeploymentScope(const std::string& fallbackDeploymentId) {
    DeploymentScope scope;
    if (!readEnv("RAFFLE_DEPLOYMENT_ID", scope.deploymentId)) {
        scope.deploymentId = trim(fallbackDeploymentId);
    }
    if (scope.deploymentId.empty()) {
        throw std::runtime_error(
            "VRF domain separation requires a deploymentId (set RAFFLE_DEPLOYMENT_ID)");
    }
    if (scope.deploymentId == "default") {
        throw std::runtime_error(
            "deploymentId cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"anvil\"");
    }
    readEnv("RAFFLE_CHAIN_ID", scope.chainId);
    return scope;
}

} // namespace raffle
