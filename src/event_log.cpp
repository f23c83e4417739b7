#include "event_log.hpp"

#include "picosha2.h"

#include <sstream>

namespace raffle {

namespace {

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

// An odd trailing node is paired with itself.
std::vector<std::string> foldLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
        const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
        next.push_back(hashPair(layer[i], right));
    }
    return next;
}

void appendField(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

} // namespace

std::string toString(RaffleEventKind kind) {
    switch (kind) {
    case RaffleEventKind::ENTERED_RAFFLE:
        return "EnteredRaffle";
    case RaffleEventKind::REQUESTED_DRAW:
        return "RequestedRaffleWinner";
    case RaffleEventKind::WINNER_PICKED:
        return "WinnerPicked";
    }
    return "Unknown";
}

std::string encodeEvent(const RaffleEvent& event) {
    std::ostringstream oss;
    oss << toString(event.kind) << '|';
    switch (event.kind) {
    case RaffleEventKind::ENTERED_RAFFLE:
        appendField(oss, event.participant);
        break;
    case RaffleEventKind::REQUESTED_DRAW:
        oss << event.requestId << ';';
        break;
    case RaffleEventKind::WINNER_PICKED:
        appendField(oss, event.participant);
        oss << event.amount << ';';
        break;
    }
    return oss.str();
}

void EventLog::append(const RaffleEvent& event) {
    leaves_.push_back(hashEvent(event));
    events_.push_back(event);
}

std::string EventLog::leaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::hashEvent(const RaffleEvent& event) {
    return sha256Hex(encodeEvent(event));
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }
    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        layer = foldLayer(layer);
    }
    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= layer.size()) {
            sibling = index;
        }
        proof.push_back(layer[sibling]);
        layer = foldLayer(layer);
        index /= 2;
    }
    return proof;
}

bool EventLog::verifyProof(const std::string& leafHash,
                           std::size_t leafIndex,
                           const std::vector<std::string>& proof,
                           const std::string& expectedRoot) {
    if (leafHash.empty() || expectedRoot.empty()) {
        return false;
    }
    std::string node = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return index == 0 && node == expectedRoot;
}

} // namespace raffle
