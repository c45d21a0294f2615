#pragma once

#include <string>
#include <google/protobuf/message.h>

namespace stockguard {

/**
 * Receives commit, release and order transition notifications once the
 * owning transaction has committed (order confirmation and shipping
 * emails hang off this). Delivery is fire-and-forget: the core never
 * depends on it for correctness.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void publish(const google::protobuf::Message& notification) = 0;
};

/**
 * Writes each notification to the structured log.
 */
class LogNotifier : public Notifier {
public:
    void publish(const google::protobuf::Message& notification) override;
};

/**
 * Publish without letting a dispatcher failure reach the caller.
 */
void notify(Notifier* notifier, const google::protobuf::Message& notification);

}  // namespace stockguard
