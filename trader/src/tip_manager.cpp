#include "tip_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

TipManager::TipManager(SolAmount floor, SolAmount ceiling, int aggressive_percentile)
    : floor_(floor)
    , ceiling_(ceiling)
    , aggressive_percentile_(std::clamp(aggressive_percentile, 0, 100))
{
}

SolAmount TipManager::calculate_tip(Strategy strategy, const SolAmount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    SolAmount tip;
    if (history_.size() < MIN_SAMPLES) {
        switch (strategy) {
            case Strategy::Conservative:
                tip = SolAmount::from_lamports(floor_.lamports() * 2);
                break;
            case Strategy::Aggressive:
                tip = SolAmount::from_lamports(floor_.lamports() * 3);
                break;
            case Strategy::Exit:
                tip = ceiling_;
                break;
        }
    } else {
        switch (strategy) {
            case Strategy::Conservative:
                tip = percentile(25);
                break;
            case Strategy::Aggressive:
                tip = percentile(aggressive_percentile_);
                break;
            case Strategy::Exit: {
                auto midpoint = SolAmount::from_lamports((floor_.lamports() + ceiling_.lamports()) / 2);
                tip = std::max(percentile(75), midpoint);
                break;
            }
        }
    }

    tip = std::min(std::max(tip, floor_), ceiling_);
    spdlog::debug("Tip for {} {} SOL: {} SOL ({} samples)",
                  to_string(strategy), amount.to_string(), tip.to_string(), history_.size());
    return tip;
}

void TipManager::record_landed_tip(const SolAmount& tip) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(tip);
    while (history_.size() > MAX_HISTORY) {
        history_.pop_front();
    }
}

size_t TipManager::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

SolAmount TipManager::percentile(int pct) const {
    std::vector<SolAmount> sorted(history_.begin(), history_.end());
    std::sort(sorted.begin(), sorted.end());
    size_t idx = static_cast<size_t>(pct) * (sorted.size() - 1) / 100;
    return sorted[idx];
}
