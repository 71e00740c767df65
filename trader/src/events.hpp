#pragma once

#include "trade.hpp"
#include <string>
#include <nlohmann/json.hpp>

enum class NotificationLevel {
    Critical,
    Important,
    Info
};

std::string to_string(NotificationLevel level);

// Outbound events: operator notifications, trade updates, admission rejections
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void notify(NotificationLevel level, const std::string& event,
                        const nlohmann::json& detail) = 0;
    virtual void broadcast_trade(const Trade& trade) = 0;
    virtual void publish_rejection(const std::string& trade_uuid,
                                   const std::string& reason_code,
                                   const std::string& message) = 0;
};

// Fire-and-forget wrappers: a failing sink is logged and never reaches the caller
void emit_notification(EventSink* sink, NotificationLevel level,
                       const std::string& event, const nlohmann::json& detail);
void emit_trade_update(EventSink* sink, const Trade& trade);
void emit_rejection(EventSink* sink, const std::string& trade_uuid,
                    const std::string& reason_code, const std::string& message);
