#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace util {

namespace {
const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

TimePoint system_now() {
    return std::chrono::system_clock::now();
}

std::string current_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string to_iso8601(TimePoint tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme = dsn.find("://");
    auto at = dsn.find('@');
    if (scheme == std::string::npos || at == std::string::npos || at < scheme) {
        return dsn;
    }
    auto colon = dsn.find(':', scheme + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

bool is_valid_solana_address(const std::string& address) {
    if (address.size() < 32 || address.size() > 44) {
        return false;
    }
    for (char c : address) {
        if (std::strchr(BASE58_ALPHABET, c) == nullptr || c == '\0') {
            return false;
        }
    }
    return true;
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; i++) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string sha256_hex(const std::string& data, size_t prefix_bytes) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return hex_encode(digest, std::min<size_t>(prefix_bytes, SHA256_DIGEST_LENGTH));
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) zeros++;

    // base-256 to base-58, digits stored little-endian
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = zeros; i < data.size(); i++) {
        int carry = data[i];
        for (auto& d : digits) {
            carry += d << 8;
            d = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::vector<uint8_t> base58_decode(const std::string& str) {
    size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') ones++;

    std::vector<uint8_t> bytes;
    for (size_t i = ones; i < str.size(); i++) {
        const char* p = std::strchr(BASE58_ALPHABET, str[i]);
        if (p == nullptr || str[i] == '\0') {
            throw std::invalid_argument("Invalid base58 character");
        }
        int carry = static_cast<int>(p - BASE58_ALPHABET);
        for (auto& b : bytes) {
            carry += b * 58;
            b = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& str) {
    if (str.empty()) return {};
    if (str.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 length");
    }
    std::vector<uint8_t> out(3 * str.size() / 4);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(str.data()),
                              static_cast<int>(str.size()));
    if (len < 0) {
        throw std::invalid_argument("Invalid base64 data");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (str[str.size() - 1] == '=') padding++;
    if (str[str.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

void encode_shortvec(std::vector<uint8_t>& out, uint16_t value) {
    uint32_t rem = value;
    while (true) {
        uint8_t elem = rem & 0x7f;
        rem >>= 7;
        if (rem == 0) {
            out.push_back(elem);
            break;
        }
        out.push_back(elem | 0x80);
    }
}

uint16_t decode_shortvec(const std::vector<uint8_t>& data, size_t& offset) {
    uint32_t value = 0;
    for (int i = 0; i < 3; i++) {
        if (offset >= data.size()) {
            throw std::invalid_argument("Truncated short-vec length");
        }
        uint8_t elem = data[offset++];
        value |= static_cast<uint32_t>(elem & 0x7f) << (i * 7);
        if ((elem & 0x80) == 0) {
            return static_cast<uint16_t>(value);
        }
    }
    throw std::invalid_argument("Short-vec length overflow");
}

} // namespace util
