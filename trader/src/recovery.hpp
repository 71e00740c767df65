#pragma once

#include "chain.hpp"
#include "events.hpp"
#include "store.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

enum class RecoveryAction {
    MarkedClosed,
    RevertedToActive,
    StillPending,
    Skipped
};

std::string to_string(RecoveryAction action);

struct RecoveryConfig {
    std::chrono::seconds interval{30};
    std::chrono::seconds stuck_threshold{60};
};

// Resolves EXITING trades whose outcome never came back, using on-chain status as ground truth
class RecoveryManager {
public:
    RecoveryManager(const RecoveryConfig& config,
                    std::shared_ptr<TradeStore> store,
                    std::shared_ptr<RpcClient> rpc,
                    std::shared_ptr<EventSink> events);

    // One pass over stuck trades; returns how many were resolved
    int run_once();

    RecoveryAction recover(const Trade& trade);

    void run(std::atomic<bool>& running);

private:
    RecoveryConfig config_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<RpcClient> rpc_;
    std::shared_ptr<EventSink> events_;
};
