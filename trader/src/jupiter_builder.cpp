#include "jupiter_builder.hpp"
#include "errors.hpp"
#include "solana_tx.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

JupiterTransactionBuilder::JupiterTransactionBuilder(const std::string& jupiter_base, const Keypair& keypair,
                                                     int slippage_bps, int timeout_ms)
    : jupiter_base_(jupiter_base)
    , keypair_(keypair)
    , slippage_bps_(slippage_bps)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

JupiterTransactionBuilder::~JupiterTransactionBuilder() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t JupiterTransactionBuilder::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json JupiterTransactionBuilder::http_request(const std::string& url, const std::string* post_body) {
    std::string response_string;
    long http_status = 0;
    CURLcode res;
    {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

        struct curl_slist* headers = NULL;
        if (post_body) {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, post_body->c_str());
        } else {
            curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        }
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        res = curl_easy_perform(curl_);
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status);
        curl_slist_free_all(headers);
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TradeError(ErrorCode::Timeout, "Jupiter request timed out");
    }
    if (res != CURLE_OK) {
        throw TradeError(ErrorCode::BuildFailed, fmt::format("Jupiter request failed: {}", curl_easy_strerror(res)));
    }
    if (http_status >= 400) {
        throw TradeError(ErrorCode::BuildFailed,
                         fmt::format("Jupiter returned HTTP {}: {}", http_status, response_string));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw TradeError(ErrorCode::BuildFailed, fmt::format("Unparseable Jupiter response: {}", e.what()));
    }
}

nlohmann::json JupiterTransactionBuilder::get_quote(const Signal& signal) {
    bool buy = signal.action == Action::Buy;
    std::string url = fmt::format("{}/quote?inputMint={}&outputMint={}&amount={}&slippageBps={}&swapMode={}",
                                  jupiter_base_,
                                  buy ? SOL_MINT : signal.mint(),
                                  buy ? signal.mint() : SOL_MINT,
                                  signal.amount.lamports(),
                                  slippage_bps_,
                                  buy ? "ExactIn" : "ExactOut");

    auto quote = http_request(url, nullptr);
    if (quote.contains("error")) {
        throw TradeError(ErrorCode::BuildFailed, "Jupiter quote error: " + quote["error"].dump());
    }
    return quote;
}

std::string JupiterTransactionBuilder::get_swap_transaction(const nlohmann::json& quote) {
    nlohmann::json request = {
        {"quoteResponse", quote},
        {"userPublicKey", keypair_.pubkey_base58()},
        {"wrapAndUnwrapSol", true},
        {"dynamicComputeUnitLimit", true},
        {"prioritizationFeeLamports", "auto"}
    };
    std::string body = request.dump();

    auto response = http_request(jupiter_base_ + "/swap", &body);
    if (!response.contains("swapTransaction") || !response["swapTransaction"].is_string()) {
        throw TradeError(ErrorCode::BuildFailed, "Jupiter swap response missing swapTransaction");
    }
    return response["swapTransaction"].get<std::string>();
}

SignedTransaction JupiterTransactionBuilder::build_swap(const Signal& signal, const std::string& blockhash) {
    auto quote = get_quote(signal);
    auto swap_b64 = get_swap_transaction(quote);

    try {
        auto tx = WireTransaction::parse(util::base64_decode(swap_b64));
        tx.set_recent_blockhash(decode_pubkey(blockhash));
        tx.sign(keypair_);

        spdlog::debug("Built swap for {}: {} -> {} ({} SOL)", signal.trade_uuid,
                      quote.value("inputMint", ""), quote.value("outputMint", ""), signal.amount.to_string());
        return {util::base64_encode(tx.serialize()), tx.signature_base58()};
    } catch (const std::exception& e) {
        throw TradeError(ErrorCode::BuildFailed,
                         fmt::format("Failed to prepare swap for {}: {}", signal.trade_uuid, e.what()));
    }
}

SignedTransaction JupiterTransactionBuilder::build_tip(const SolAmount& tip, const std::string& blockhash) {
    try {
        auto message = WireTransaction::transfer_message(keypair_.pubkey(),
                                                         decode_pubkey(JITO_TIP_ACCOUNT),
                                                         static_cast<uint64_t>(tip.lamports()),
                                                         decode_pubkey(blockhash));
        auto tx = WireTransaction::from_message(std::move(message), 1);
        tx.sign(keypair_);
        return {util::base64_encode(tx.serialize()), tx.signature_base58()};
    } catch (const std::exception& e) {
        throw TradeError(ErrorCode::BuildFailed, fmt::format("Failed to build tip transaction: {}", e.what()));
    }
}
