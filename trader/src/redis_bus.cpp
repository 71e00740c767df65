#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace {
using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;
}

RedisBus::RedisBus(const std::string& redis_url, const StreamNames& streams)
    : streams_(streams)
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may already exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_signals(const std::string& stream, const std::string& group,
                       const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;

    std::unordered_map<std::string, ItemStream> items;
    redis_->xreadgroup(group, consumer,
        stream, ">",
        std::chrono::milliseconds(block_ms),
        count,
        std::inserter(items, items.end()));

    for (const auto& entry : items) {
        for (const auto& item : entry.second) {
            if (!item.second) {
                continue;
            }
            auto it = item.second->find("data");
            if (it == item.second->end()) {
                results.emplace_back(item.first, nlohmann::json());
                continue;
            }
            try {
                results.emplace_back(item.first, nlohmann::json::parse(it->second));
            } catch (const std::exception& e) {
                spdlog::error("Failed to parse signal JSON {}: {}", item.first, e.what());
                results.emplace_back(item.first, nlohmann::json(it->second));
            }
        }
    }

    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message: {}", e.what());
    }
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();

    redis_->xadd(stream, "*", fields.begin(), fields.end());
    spdlog::debug("Published to {}", stream);
}

void RedisBus::notify(NotificationLevel level, const std::string& event,
                      const nlohmann::json& detail) {
    publish(streams_.notifications, {
        {"event", event},
        {"level", to_string(level)},
        {"detail", detail},
        {"ts", util::current_iso8601()}
    });
}

void RedisBus::broadcast_trade(const Trade& trade) {
    auto data = trade.to_json();
    data["ts"] = util::current_iso8601();
    publish(streams_.trade_updates, data);
}

void RedisBus::publish_rejection(const std::string& trade_uuid,
                                 const std::string& reason_code,
                                 const std::string& message) {
    publish(streams_.rejections, {
        {"trade_uuid", trade_uuid},
        {"reason", reason_code},
        {"message", message},
        {"ts", util::current_iso8601()}
    });
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        return false;
    }
}
