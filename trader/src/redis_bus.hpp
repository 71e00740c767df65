#pragma once

#include "events.hpp"
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

struct StreamNames {
    std::string notifications;
    std::string trade_updates;
    std::string rejections;
};

class RedisBus : public EventSink {
public:
    RedisBus(const std::string& redis_url, const StreamNames& streams);

    void create_consumer_group(const std::string& stream, const std::string& group);

    // Entries whose "data" field is not JSON come back as a string payload
    std::vector<std::pair<std::string, nlohmann::json>>
        read_signals(const std::string& stream, const std::string& group,
                     const std::string& consumer, int count = 10, int block_ms = 1000);

    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);

    // EventSink
    void notify(NotificationLevel level, const std::string& event,
                const nlohmann::json& detail) override;
    void broadcast_trade(const Trade& trade) override;
    void publish_rejection(const std::string& trade_uuid,
                           const std::string& reason_code,
                           const std::string& message) override;

    bool ping();

private:
    void publish(const std::string& stream, const nlohmann::json& data);

    std::shared_ptr<sw::redis::Redis> redis_;
    StreamNames streams_;
};
