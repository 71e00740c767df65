#include "events.hpp"
#include <spdlog/spdlog.h>

std::string to_string(NotificationLevel level) {
    switch (level) {
        case NotificationLevel::Critical: return "critical";
        case NotificationLevel::Important: return "important";
        case NotificationLevel::Info: return "info";
    }
    return "info";
}

void emit_notification(EventSink* sink, NotificationLevel level,
                       const std::string& event, const nlohmann::json& detail) {
    if (!sink) return;
    try {
        sink->notify(level, event, detail);
    } catch (const std::exception& e) {
        spdlog::warn("Notification {} not delivered: {}", event, e.what());
    }
}

void emit_trade_update(EventSink* sink, const Trade& trade) {
    if (!sink) return;
    try {
        sink->broadcast_trade(trade);
    } catch (const std::exception& e) {
        spdlog::warn("Trade update for {} not delivered: {}", trade.trade_uuid, e.what());
    }
}

void emit_rejection(EventSink* sink, const std::string& trade_uuid,
                    const std::string& reason_code, const std::string& message) {
    if (!sink) return;
    try {
        sink->publish_rejection(trade_uuid, reason_code, message);
    } catch (const std::exception& e) {
        spdlog::warn("Rejection for {} not delivered: {}", trade_uuid, e.what());
    }
}
