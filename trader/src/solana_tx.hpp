#pragma once

#include "keypair.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

constexpr const char* SOL_MINT = "So11111111111111111111111111111111111111112";
constexpr const char* JITO_TIP_ACCOUNT = "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU4";

// Wire-format transaction: short-vec of signature slots followed by the message
class WireTransaction {
public:
    // Throws std::invalid_argument on malformed input
    static WireTransaction parse(const std::vector<uint8_t>& bytes);
    static WireTransaction from_message(std::vector<uint8_t> message, size_t signer_count);

    // Legacy System Program transfer (instruction 2) from `from` to `to`
    static std::vector<uint8_t> transfer_message(const std::array<uint8_t, 32>& from,
                                                 const std::array<uint8_t, 32>& to,
                                                 uint64_t lamports,
                                                 const std::array<uint8_t, 32>& recent_blockhash);

    void set_recent_blockhash(const std::array<uint8_t, 32>& blockhash);
    std::array<uint8_t, 32> recent_blockhash() const;

    // Fee payer occupies slot 0
    void sign(const Keypair& keypair, size_t slot = 0);

    std::string signature_base58(size_t slot = 0) const;
    size_t signature_count() const { return signatures_.size(); }
    const std::vector<uint8_t>& message() const { return message_; }

    std::vector<uint8_t> serialize() const;

private:
    std::vector<std::array<uint8_t, 64>> signatures_;
    std::vector<uint8_t> message_;
    size_t blockhash_offset_ = 0;

    void locate_blockhash();
};

std::array<uint8_t, 32> decode_pubkey(const std::string& base58);
