#include "sol_amount.hpp"
#include "errors.hpp"
#include <cctype>
#include <limits>

SolAmount SolAmount::from_lamports(int64_t lamports) {
    return SolAmount(lamports);
}

SolAmount SolAmount::parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        pos++;
    }

    int64_t whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (++whole_digits > 10) {
            throw TradeError(ErrorCode::ValidationFailed, "Amount out of range: " + text);
        }
        whole = whole * 10 + (text[pos] - '0');
        pos++;
    }

    int64_t frac = 0;
    int frac_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (++frac_digits > DECIMALS) {
                throw TradeError(ErrorCode::ValidationFailed,
                                 "Amount has more than 9 decimal places: " + text);
            }
            frac = frac * 10 + (text[pos] - '0');
            pos++;
        }
    }

    if (pos != text.size() || (whole_digits == 0 && frac_digits == 0)) {
        throw TradeError(ErrorCode::ValidationFailed, "Invalid amount: '" + text + "'");
    }

    for (int i = frac_digits; i < DECIMALS; i++) {
        frac *= 10;
    }

    if (whole > (std::numeric_limits<int64_t>::max() - frac) / LAMPORTS_PER_SOL) {
        throw TradeError(ErrorCode::ValidationFailed, "Amount out of range: " + text);
    }

    int64_t lamports = whole * LAMPORTS_PER_SOL + frac;
    return SolAmount(negative ? -lamports : lamports);
}

std::string SolAmount::to_string() const {
    int64_t abs = lamports_ < 0 ? -lamports_ : lamports_;
    std::string out = lamports_ < 0 ? "-" : "";
    out += std::to_string(abs / LAMPORTS_PER_SOL);

    std::string frac = std::to_string(abs % LAMPORTS_PER_SOL);
    frac.insert(0, DECIMALS - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    if (!frac.empty()) {
        out += "." + frac;
    }
    return out;
}

SolAmount SolAmount::percent_bps(int64_t bps) const {
    // split to keep lamports * bps inside int64
    int64_t high = (lamports_ / 10000) * bps;
    int64_t low = (lamports_ % 10000) * bps / 10000;
    return SolAmount(high + low);
}
