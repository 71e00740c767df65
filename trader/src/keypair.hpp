#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

// Ed25519 signer for the trading wallet
class Keypair {
public:
    // solana-keygen JSON file: array of 64 bytes (seed followed by public key)
    static Keypair from_file(const std::string& path);

    // 64-byte secret key or 32-byte seed
    static Keypair from_bytes(const std::vector<uint8_t>& secret);

    const std::array<uint8_t, 32>& pubkey() const { return pubkey_; }
    std::string pubkey_base58() const;

    std::array<uint8_t, 64> sign(const std::vector<uint8_t>& message) const;

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };

    explicit Keypair(EVP_PKEY* key);

    std::shared_ptr<EVP_PKEY> key_;
    std::array<uint8_t, 32> pubkey_{};
};
