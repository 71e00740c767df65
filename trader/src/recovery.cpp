#include "recovery.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>

std::string to_string(RecoveryAction action) {
    switch (action) {
        case RecoveryAction::MarkedClosed: return "MARKED_CLOSED";
        case RecoveryAction::RevertedToActive: return "REVERTED_TO_ACTIVE";
        case RecoveryAction::StillPending: return "STILL_PENDING";
        case RecoveryAction::Skipped: return "SKIPPED";
    }
    return "UNKNOWN";
}

std::string to_string(OnChainStatus status) {
    switch (status) {
        case OnChainStatus::Confirmed: return "CONFIRMED";
        case OnChainStatus::NotFound: return "NOT_FOUND";
        case OnChainStatus::Indeterminate: return "INDETERMINATE";
    }
    return "UNKNOWN";
}

RecoveryManager::RecoveryManager(const RecoveryConfig& config,
                                 std::shared_ptr<TradeStore> store,
                                 std::shared_ptr<RpcClient> rpc,
                                 std::shared_ptr<EventSink> events)
    : config_(config)
    , store_(store)
    , rpc_(rpc)
    , events_(events)
{
}

RecoveryAction RecoveryManager::recover(const Trade& trade) {
    const auto& signature = trade.exit_tx_signature ? trade.exit_tx_signature : trade.tx_signature;
    if (!signature) {
        spdlog::warn("Stuck trade {} has no signature to check, leaving it EXITING", trade.trade_uuid);
        return RecoveryAction::Skipped;
    }

    try {
        if (util::base58_decode(*signature).size() != 64) {
            spdlog::warn("Stuck trade {} has malformed signature {}, leaving it EXITING",
                         trade.trade_uuid, *signature);
            return RecoveryAction::Skipped;
        }
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Stuck trade {} has unparseable signature {}: {}",
                     trade.trade_uuid, *signature, e.what());
        return RecoveryAction::Skipped;
    }

    auto on_chain = rpc_->get_signature_status(*signature);

    auto reconcile = [&](const std::string& actual, const std::string& discrepancy, RecoveryAction action) {
        try {
            store_->log_reconciliation({trade.trade_uuid, "EXITING", actual, discrepancy,
                                        signature, to_string(action)});
        } catch (const std::exception& e) {
            spdlog::error("Failed to write reconciliation for {}: {}", trade.trade_uuid, e.what());
        }
    };

    switch (on_chain) {
        case OnChainStatus::Confirmed: {
            auto updated = store_->update_status(trade.trade_uuid, StatusUpdate::closed());
            spdlog::info("Recovered trade {}: exit confirmed on-chain, marked CLOSED", trade.trade_uuid);
            reconcile("FOUND", "NONE", RecoveryAction::MarkedClosed);
            emit_trade_update(events_.get(), updated);
            return RecoveryAction::MarkedClosed;
        }
        case OnChainStatus::NotFound: {
            auto updated = store_->update_status(trade.trade_uuid, StatusUpdate::reverted_to_active());
            spdlog::warn("Recovered trade {}: exit {} never landed, reverted to ACTIVE",
                         trade.trade_uuid, *signature);
            reconcile("MISSING", "MISSING_TX", RecoveryAction::RevertedToActive);
            try {
                store_->log_config_change("position:" + trade.trade_uuid, "EXITING", "ACTIVE",
                                          "SYSTEM_RECOVERY", "Stuck position reverted to ACTIVE");
            } catch (const std::exception& e) {
                spdlog::error("Failed to audit recovery of {}: {}", trade.trade_uuid, e.what());
            }
            emit_trade_update(events_.get(), updated);
            return RecoveryAction::RevertedToActive;
        }
        case OnChainStatus::Indeterminate:
            break;
    }

    spdlog::debug("Trade {} outcome still indeterminate, retrying next pass", trade.trade_uuid);
    return RecoveryAction::StillPending;
}

int RecoveryManager::run_once() {
    auto stuck = store_->find_stuck_exiting(config_.stuck_threshold);
    if (stuck.empty()) {
        return 0;
    }

    spdlog::info("Recovery pass: {} trades stuck in EXITING", stuck.size());
    int resolved = 0;
    for (const auto& trade : stuck) {
        try {
            auto action = recover(trade);
            if (action == RecoveryAction::MarkedClosed || action == RecoveryAction::RevertedToActive) {
                resolved++;
            }
        } catch (const std::exception& e) {
            spdlog::error("Recovery of trade {} failed, state untouched: {}", trade.trade_uuid, e.what());
        }
    }
    return resolved;
}

void RecoveryManager::run(std::atomic<bool>& running) {
    spdlog::info("Starting recovery manager (interval {}s, stuck threshold {}s)",
                 config_.interval.count(), config_.stuck_threshold.count());

    while (running) {
        try {
            int resolved = run_once();
            if (resolved > 0) {
                spdlog::info("Recovery pass resolved {} trades", resolved);
            }
        } catch (const std::exception& e) {
            spdlog::error("Recovery pass error: {}", e.what());
        }

        for (int i = 0; i < config_.interval.count() && running; i++) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Recovery manager stopped");
}
