#pragma once

#include "chain.hpp"
#include "keypair.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Swap transactions from the Jupiter quote/swap API, re-signed with the trading wallet
class JupiterTransactionBuilder : public TransactionBuilder {
public:
    JupiterTransactionBuilder(const std::string& jupiter_base, const Keypair& keypair,
                              int slippage_bps, int timeout_ms = 5000);
    ~JupiterTransactionBuilder() override;

    JupiterTransactionBuilder(const JupiterTransactionBuilder&) = delete;
    JupiterTransactionBuilder& operator=(const JupiterTransactionBuilder&) = delete;

    SignedTransaction build_swap(const Signal& signal, const std::string& blockhash) override;
    SignedTransaction build_tip(const SolAmount& tip, const std::string& blockhash) override;

private:
    std::string jupiter_base_;
    Keypair keypair_;
    int slippage_bps_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex curl_mutex_;

    nlohmann::json get_quote(const Signal& signal);
    std::string get_swap_transaction(const nlohmann::json& quote);
    nlohmann::json http_request(const std::string& url, const std::string* post_body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
