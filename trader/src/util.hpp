#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

namespace util {
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    TimePoint system_now();

    std::string current_iso8601();
    std::string to_iso8601(TimePoint tp);
    int64_t current_unix_seconds();

    std::string to_upper(std::string str);
    std::string redact_dsn(const std::string& dsn);
    bool is_valid_solana_address(const std::string& address);

    std::string sha256_hex(const std::string& data, size_t prefix_bytes = 32);
    std::string hex_encode(const uint8_t* data, size_t len);

    std::string base58_encode(const std::vector<uint8_t>& data);
    std::vector<uint8_t> base58_decode(const std::string& str);

    std::string base64_encode(const std::vector<uint8_t>& data);
    std::vector<uint8_t> base64_decode(const std::string& str);

    // Solana compact-u16 length prefix
    void encode_shortvec(std::vector<uint8_t>& out, uint16_t value);
    uint16_t decode_shortvec(const std::vector<uint8_t>& data, size_t& offset);
}
