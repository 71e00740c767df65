#include "solana_tx.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

std::array<uint8_t, 32> decode_pubkey(const std::string& base58) {
    auto bytes = util::base58_decode(base58);
    if (bytes.size() != 32) {
        throw std::invalid_argument("Public key must decode to 32 bytes: " + base58);
    }
    std::array<uint8_t, 32> key{};
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

WireTransaction WireTransaction::parse(const std::vector<uint8_t>& bytes) {
    WireTransaction tx;
    size_t offset = 0;

    uint16_t count = util::decode_shortvec(bytes, offset);
    if (count == 0 || offset + static_cast<size_t>(count) * 64 > bytes.size()) {
        throw std::invalid_argument("Transaction signature section truncated");
    }
    tx.signatures_.resize(count);
    for (auto& sig : tx.signatures_) {
        std::copy(bytes.begin() + offset, bytes.begin() + offset + 64, sig.begin());
        offset += 64;
    }

    tx.message_.assign(bytes.begin() + offset, bytes.end());
    tx.locate_blockhash();
    return tx;
}

WireTransaction WireTransaction::from_message(std::vector<uint8_t> message, size_t signer_count) {
    WireTransaction tx;
    tx.signatures_.resize(signer_count);
    for (auto& sig : tx.signatures_) {
        sig.fill(0);
    }
    tx.message_ = std::move(message);
    tx.locate_blockhash();
    return tx;
}

void WireTransaction::locate_blockhash() {
    size_t offset = 0;
    if (message_.empty()) {
        throw std::invalid_argument("Empty transaction message");
    }
    // versioned messages carry a 0x80-tagged prefix byte
    if (message_[0] & 0x80) {
        offset++;
    }
    offset += 3;

    uint16_t accounts = util::decode_shortvec(message_, offset);
    offset += static_cast<size_t>(accounts) * 32;
    if (offset + 32 > message_.size()) {
        throw std::invalid_argument("Transaction message truncated before blockhash");
    }
    blockhash_offset_ = offset;
}

std::vector<uint8_t> WireTransaction::transfer_message(const std::array<uint8_t, 32>& from,
                                                       const std::array<uint8_t, 32>& to,
                                                       uint64_t lamports,
                                                       const std::array<uint8_t, 32>& recent_blockhash) {
    std::vector<uint8_t> msg;
    // 1 signer, 0 read-only signed, 1 read-only unsigned (system program)
    msg.push_back(1);
    msg.push_back(0);
    msg.push_back(1);

    util::encode_shortvec(msg, 3);
    msg.insert(msg.end(), from.begin(), from.end());
    msg.insert(msg.end(), to.begin(), to.end());
    msg.insert(msg.end(), size_t{32}, uint8_t{0});  // system program id

    msg.insert(msg.end(), recent_blockhash.begin(), recent_blockhash.end());

    util::encode_shortvec(msg, 1);
    msg.push_back(2);
    util::encode_shortvec(msg, 2);
    msg.push_back(0);
    msg.push_back(1);

    util::encode_shortvec(msg, 12);
    uint32_t transfer_ix = 2;
    for (int i = 0; i < 4; i++) {
        msg.push_back(static_cast<uint8_t>((transfer_ix >> (8 * i)) & 0xff));
    }
    for (int i = 0; i < 8; i++) {
        msg.push_back(static_cast<uint8_t>((lamports >> (8 * i)) & 0xff));
    }
    return msg;
}

void WireTransaction::set_recent_blockhash(const std::array<uint8_t, 32>& blockhash) {
    std::copy(blockhash.begin(), blockhash.end(), message_.begin() + blockhash_offset_);
}

std::array<uint8_t, 32> WireTransaction::recent_blockhash() const {
    std::array<uint8_t, 32> hash{};
    std::copy(message_.begin() + blockhash_offset_, message_.begin() + blockhash_offset_ + 32, hash.begin());
    return hash;
}

void WireTransaction::sign(const Keypair& keypair, size_t slot) {
    if (slot >= signatures_.size()) {
        throw std::invalid_argument("Signature slot out of range");
    }
    signatures_[slot] = keypair.sign(message_);
}

std::string WireTransaction::signature_base58(size_t slot) const {
    const auto& sig = signatures_.at(slot);
    return util::base58_encode(std::vector<uint8_t>(sig.begin(), sig.end()));
}

std::vector<uint8_t> WireTransaction::serialize() const {
    std::vector<uint8_t> out;
    util::encode_shortvec(out, static_cast<uint16_t>(signatures_.size()));
    for (const auto& sig : signatures_) {
        out.insert(out.end(), sig.begin(), sig.end());
    }
    out.insert(out.end(), message_.begin(), message_.end());
    return out;
}
