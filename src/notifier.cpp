#include "stockguard/notifier.hpp"
#include "stockguard/logging.hpp"

#include <google/protobuf/util/json_util.h>

namespace stockguard {

void LogNotifier::publish(const google::protobuf::Message& notification) {
    std::string body;
    auto status = google::protobuf::util::MessageToJsonString(notification, &body);
    if (!status.ok()) {
        log_warn("notifier", "notification_not_serializable",
                 {{"type", notification.GetTypeName()}});
        return;
    }
    log_info("notifier", "notification",
             {{"type", notification.GetTypeName()}, {"body", nlohmann::json::parse(body)}});
}

void notify(Notifier* notifier, const google::protobuf::Message& notification) {
    if (!notifier) return;
    try {
        notifier->publish(notification);
    } catch (const std::exception& e) {
        log_warn("notifier", "publish_failed",
                 {{"type", notification.GetTypeName()}, {"error", e.what()}});
    }
}

}  // namespace stockguard
