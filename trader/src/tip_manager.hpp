#pragma once

#include "signal.hpp"
#include "sol_amount.hpp"
#include <deque>
#include <mutex>

// Fee strategy: proposes a bundle tip for a trade
class TipStrategy {
public:
    virtual ~TipStrategy() = default;

    virtual SolAmount calculate_tip(Strategy strategy, const SolAmount& amount) = 0;
    virtual void record_landed_tip(const SolAmount& tip) = 0;
};

// Percentile over recently landed tips, with fixed multiples of the floor until warmed up
class TipManager : public TipStrategy {
public:
    static constexpr size_t MIN_SAMPLES = 10;
    static constexpr size_t MAX_HISTORY = 100;

    TipManager(SolAmount floor, SolAmount ceiling, int aggressive_percentile);

    SolAmount calculate_tip(Strategy strategy, const SolAmount& amount) override;
    void record_landed_tip(const SolAmount& tip) override;

    size_t sample_count() const;

private:
    SolAmount percentile(int pct) const;

    SolAmount floor_;
    SolAmount ceiling_;
    int aggressive_percentile_;

    mutable std::mutex mutex_;
    std::deque<SolAmount> history_;
};
