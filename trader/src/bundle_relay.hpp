#pragma once

#include "chain.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// sendBundle client for a block-engine compatible relay
class BundleRelayClient : public BundleRelay {
public:
    BundleRelayClient(const std::string& name, const std::string& base_url, int timeout_ms = 2000);
    ~BundleRelayClient() override;

    BundleRelayClient(const BundleRelayClient&) = delete;
    BundleRelayClient& operator=(const BundleRelayClient&) = delete;

    std::string name() const override { return name_; }
    std::string submit_bundle(const std::vector<std::string>& transactions_base64) override;

private:
    std::string name_;
    std::string bundles_url_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex curl_mutex_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
