#include "rpc_solana.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

SolanaRPC::SolanaRPC(const std::string& name, const std::string& rpc_url, int timeout_ms)
    : name_(name)
    , rpc_url_(rpc_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    spdlog::info("Solana RPC {} -> {} (timeout {}ms)", name_, rpc_url_, timeout_ms_);
}

SolanaRPC::~SolanaRPC() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t SolanaRPC::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json SolanaRPC::make_request(const std::string& method, const nlohmann::json& params) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method}
    };
    if (!params.is_null()) {
        payload["params"] = params;
    }

    std::string body = payload.dump();
    std::string response_string;

    std::lock_guard<std::mutex> lock(curl_mutex_);
    curl_easy_setopt(curl_, CURLOPT_URL, rpc_url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        spdlog::error("RPC {} {} failed: {}", name_, method, curl_easy_strerror(res));
        return nlohmann::json{
            {"error", curl_easy_strerror(res)},
            {"timeout", res == CURLE_OPERATION_TIMEDOUT}
        };
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse RPC response from {}: {}", name_, e.what());
        return nlohmann::json{{"error", "Parse error"}, {"timeout", false}};
    }
}

void SolanaRPC::throw_on_error(const nlohmann::json& response, const std::string& method, ErrorCode code) {
    if (!response.contains("error")) {
        return;
    }
    if (response.value("timeout", false)) {
        throw TradeError(ErrorCode::Timeout, fmt::format("{} timed out on {}", method, name_));
    }
    throw TradeError(code, fmt::format("{} failed on {}: {}", method, name_, response["error"].dump()));
}

std::string SolanaRPC::get_latest_blockhash() {
    auto response = make_request("getLatestBlockhash", nlohmann::json::array({nlohmann::json{{"commitment", "confirmed"}}}));
    throw_on_error(response, "getLatestBlockhash", ErrorCode::RpcUnavailable);

    try {
        return response.at("result").at("value").at("blockhash").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw TradeError(ErrorCode::RpcUnavailable,
                         fmt::format("Unexpected getLatestBlockhash response from {}: {}", name_, e.what()));
    }
}

std::string SolanaRPC::send_transaction(const std::string& tx_base64) {
    auto response = make_request("sendTransaction", nlohmann::json::array({
        tx_base64,
        {{"encoding", "base64"}, {"skipPreflight", true}, {"maxRetries", 0}}
    }));
    throw_on_error(response, "sendTransaction", ErrorCode::SubmitFailed);

    if (!response.contains("result") || !response["result"].is_string()) {
        throw TradeError(ErrorCode::SubmitFailed,
                         fmt::format("sendTransaction on {} returned no signature", name_));
    }
    return response["result"].get<std::string>();
}

OnChainStatus SolanaRPC::get_signature_status(const std::string& signature) {
    auto response = make_request("getSignatureStatuses", nlohmann::json::array({
        nlohmann::json::array({signature}),
        {{"searchTransactionHistory", true}}
    }));

    if (response.contains("error")) {
        spdlog::warn("Signature lookup for {} inconclusive: {}", signature, response["error"].dump());
        return OnChainStatus::Indeterminate;
    }

    try {
        const auto& status = response.at("result").at("value").at(0);
        if (status.is_null()) {
            return OnChainStatus::NotFound;
        }
        // landed but reverted: the exit did not happen
        if (status.contains("err") && !status["err"].is_null()) {
            return OnChainStatus::NotFound;
        }
        auto level = status.value("confirmationStatus", "");
        if (level == "confirmed" || level == "finalized") {
            return OnChainStatus::Confirmed;
        }
        return OnChainStatus::Indeterminate;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unexpected getSignatureStatuses response for {}: {}", signature, e.what());
        return OnChainStatus::Indeterminate;
    }
}

HealthProbe SolanaRPC::probe_health() {
    auto start = std::chrono::steady_clock::now();
    auto response = make_request("getHealth", nullptr);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    HealthProbe probe;
    probe.latency_ms = elapsed;
    probe.healthy = response.contains("result") && response["result"] == "ok";
    return probe;
}
