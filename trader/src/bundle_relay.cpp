#include "bundle_relay.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

BundleRelayClient::BundleRelayClient(const std::string& name, const std::string& base_url, int timeout_ms)
    : name_(name)
    , bundles_url_(base_url + "/api/v1/bundles")
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    spdlog::info("Bundle relay {} -> {}", name_, bundles_url_);
}

BundleRelayClient::~BundleRelayClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t BundleRelayClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string BundleRelayClient::submit_bundle(const std::vector<std::string>& transactions_base64) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "sendBundle"},
        {"params", nlohmann::json::array({transactions_base64, {{"encoding", "base64"}}})}
    };

    std::string body = payload.dump();
    std::string response_string;
    long http_status = 0;
    CURLcode res;
    {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        curl_easy_setopt(curl_, CURLOPT_URL, bundles_url_.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

        struct curl_slist* headers = NULL;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        res = curl_easy_perform(curl_);
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status);
        curl_slist_free_all(headers);
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TradeError(ErrorCode::Timeout, fmt::format("sendBundle to {} timed out", name_));
    }
    if (res != CURLE_OK) {
        throw TradeError(ErrorCode::SubmitFailed,
                         fmt::format("sendBundle to {} failed: {}", name_, curl_easy_strerror(res)));
    }
    if (http_status >= 400) {
        throw TradeError(ErrorCode::SubmitFailed,
                         fmt::format("sendBundle to {} returned HTTP {}: {}", name_, http_status, response_string));
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw TradeError(ErrorCode::SubmitFailed,
                         fmt::format("Unparseable sendBundle response from {}: {}", name_, e.what()));
    }

    if (response.contains("error")) {
        throw TradeError(ErrorCode::SubmitFailed,
                         fmt::format("{} rejected bundle: {}", name_, response["error"].dump()));
    }

    const auto& result = response.value("result", nlohmann::json());
    if (result.is_string()) {
        return result.get<std::string>();
    }
    if (result.is_object()) {
        if (result.contains("bundleId")) return result["bundleId"].get<std::string>();
        if (result.contains("signature")) return result["signature"].get<std::string>();
    }
    throw TradeError(ErrorCode::SubmitFailed, fmt::format("{} returned no bundle id", name_));
}
