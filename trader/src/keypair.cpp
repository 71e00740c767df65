#include "keypair.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

Keypair::Keypair(EVP_PKEY* key)
    : key_(key, PkeyDeleter())
{
    size_t len = pubkey_.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), pubkey_.data(), &len) != 1 || len != pubkey_.size()) {
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
}

Keypair Keypair::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open keypair file: " + path);
    }

    std::vector<uint8_t> secret;
    try {
        auto j = nlohmann::json::parse(in);
        secret = j.get<std::vector<uint8_t>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid keypair file " + path + ": " + e.what());
    }

    auto keypair = from_bytes(secret);
    spdlog::info("Loaded trading wallet {}", keypair.pubkey_base58());
    return keypair;
}

Keypair Keypair::from_bytes(const std::vector<uint8_t>& secret) {
    if (secret.size() != 64 && secret.size() != 32) {
        throw std::runtime_error("Keypair must be 32 or 64 bytes, got " + std::to_string(secret.size()));
    }

    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret.data(), 32);
    if (!key) {
        throw std::runtime_error("Failed to load Ed25519 private key");
    }

    Keypair keypair(key);
    if (secret.size() == 64 &&
        !std::equal(keypair.pubkey_.begin(), keypair.pubkey_.end(), secret.begin() + 32)) {
        throw std::runtime_error("Keypair public key does not match secret seed");
    }
    return keypair;
}

std::string Keypair::pubkey_base58() const {
    return util::base58_encode(std::vector<uint8_t>(pubkey_.begin(), pubkey_.end()));
}

std::array<uint8_t, 64> Keypair::sign(const std::vector<uint8_t>& message) const {
    std::array<uint8_t, 64> signature{};
    size_t sig_len = signature.size();

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) != 1) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    return signature;
}
