#pragma once

#include "signal.hpp"
#include "sol_amount.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class OnChainStatus {
    Confirmed,
    NotFound,
    Indeterminate
};

std::string to_string(OnChainStatus status);

struct HealthProbe {
    bool healthy = false;
    int64_t latency_ms = 0;
};

// JSON-RPC node. Failures surface as TradeError (RpcUnavailable, SubmitFailed, Timeout)
class RpcClient {
public:
    virtual ~RpcClient() = default;

    virtual std::string endpoint() const = 0;
    virtual std::string get_latest_blockhash() = 0;
    virtual std::string send_transaction(const std::string& tx_base64) = 0;

    // Never throws; anything short of a definite answer is Indeterminate
    virtual OnChainStatus get_signature_status(const std::string& signature) = 0;

    // A timeout reports unhealthy
    virtual HealthProbe probe_health() = 0;
};

// Bundle relay (block-engine style sendBundle endpoint)
class BundleRelay {
public:
    virtual ~BundleRelay() = default;

    virtual std::string name() const = 0;

    // Returns the bundle id; throws TradeError on rejection or transport failure
    virtual std::string submit_bundle(const std::vector<std::string>& transactions_base64) = 0;
};

struct SignedTransaction {
    std::string base64;
    std::string signature;
};

class TransactionBuilder {
public:
    virtual ~TransactionBuilder() = default;

    // Throws TradeError(BuildFailed)
    virtual SignedTransaction build_swap(const Signal& signal, const std::string& blockhash) = 0;
    virtual SignedTransaction build_tip(const SolAmount& tip, const std::string& blockhash) = 0;
};
