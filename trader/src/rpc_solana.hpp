#pragma once

#include "chain.hpp"
#include "errors.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class SolanaRPC : public RpcClient {
public:
    SolanaRPC(const std::string& name, const std::string& rpc_url, int timeout_ms = 2000);
    ~SolanaRPC() override;

    SolanaRPC(const SolanaRPC&) = delete;
    SolanaRPC& operator=(const SolanaRPC&) = delete;

    std::string endpoint() const override { return rpc_url_; }
    std::string get_latest_blockhash() override;
    std::string send_transaction(const std::string& tx_base64) override;
    OnChainStatus get_signature_status(const std::string& signature) override;
    HealthProbe probe_health() override;

private:
    std::string name_;
    std::string rpc_url_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex curl_mutex_;

    // Transport failures come back as {"error": ..., "timeout": bool}
    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);
    void throw_on_error(const nlohmann::json& response, const std::string& method, ErrorCode code);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
