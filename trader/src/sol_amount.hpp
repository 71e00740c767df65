#pragma once

#include <cstdint>
#include <string>

// Fixed-point SOL quantity held as lamports (9 decimals)
class SolAmount {
public:
    static constexpr int64_t LAMPORTS_PER_SOL = 1000000000;
    static constexpr int DECIMALS = 9;

    SolAmount() = default;

    static SolAmount from_lamports(int64_t lamports);
    static SolAmount parse(const std::string& text);

    int64_t lamports() const { return lamports_; }
    bool is_positive() const { return lamports_ > 0; }

    // Canonical decimal form, trailing zeros trimmed ("0.5", "1", "0.000001")
    std::string to_string() const;

    // Share of this amount in basis points, rounded down
    SolAmount percent_bps(int64_t bps) const;

    SolAmount operator+(const SolAmount& other) const { return from_lamports(lamports_ + other.lamports_); }
    SolAmount operator-(const SolAmount& other) const { return from_lamports(lamports_ - other.lamports_); }

    bool operator==(const SolAmount& other) const { return lamports_ == other.lamports_; }
    bool operator!=(const SolAmount& other) const { return lamports_ != other.lamports_; }
    bool operator<(const SolAmount& other) const { return lamports_ < other.lamports_; }
    bool operator<=(const SolAmount& other) const { return lamports_ <= other.lamports_; }
    bool operator>(const SolAmount& other) const { return lamports_ > other.lamports_; }
    bool operator>=(const SolAmount& other) const { return lamports_ >= other.lamports_; }

private:
    explicit SolAmount(int64_t lamports) : lamports_(lamports) {}

    int64_t lamports_ = 0;
};
