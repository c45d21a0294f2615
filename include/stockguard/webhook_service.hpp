#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "database.hpp"
#include "order_state_machine.hpp"
#include "types.hpp"

namespace stockguard {

enum class WebhookStatus { Pending, Processed, Error, Rejected };

const char* to_string(WebhookStatus status);
WebhookStatus parse_webhook_status(const std::string& value);

/**
 * One delivery of a payment provider notification, as stored.
 */
struct WebhookEvent {
    std::string id;
    std::string provider;
    std::string external_event_id;
    std::optional<std::string> order_id;
    std::string payload;
    std::optional<std::string> signature;
    std::optional<std::string> signature_hash;
    WebhookStatus status = WebhookStatus::Pending;
    int64_t retry_count = 0;
    std::optional<Timestamp> next_retry_at;
    bool archived = false;
    std::optional<std::string> error_message;
    Timestamp created_at;
    std::optional<Timestamp> processed_at;
};

enum class Receipt { Accepted, DuplicateIgnored, InvalidSignature };

const char* to_string(Receipt receipt);

struct ProcessResult {
    bool succeeded = false;
    std::string reason;
};

struct RetryBatchResult {
    int64_t processed = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;
};

struct RetryStats {
    int64_t pending_retries = 0;
    int64_t failed_webhooks = 0;
    int64_t archived_webhooks = 0;
};

struct WebhookOptions {
    int64_t max_retries = 5;
    std::chrono::seconds initial_backoff{60};
    std::chrono::seconds max_backoff{3600};
};

/**
 * Resolves the signing secret for a provider. An empty result means no
 * secret is configured and every delivery from that provider is rejected.
 */
using SecretResolver = std::function<std::string(const std::string& provider)>;

/**
 * Idempotent intake of payment provider webhooks.
 *
 * Deliveries are keyed by (provider, external event id). Each accepted event
 * is processed once on receipt; failures are persisted with a retry count and
 * a next-retry time, and the periodic retry sweep picks them up again until
 * they succeed or reach max_retries, at which point they are archived for an
 * operator.
 *
 * Payload (JSON):
 *   {"status": "completed" | "failed" | "pending", "orderId": "...",
 *    "amount": <minor units>, "paymentReference": "..."}
 */
class WebhookService {
public:
    WebhookService(std::shared_ptr<Database> db, OrderStateMachine& orders,
                   SecretResolver secrets, Clock clock, WebhookOptions options = {});

    /**
     * Verify, deduplicate, persist and process one delivery.
     *
     * Accepted is returned whatever the processing outcome; a failed attempt
     * is left for the retry sweep.
     *
     * @throws InvalidArgumentError if provider or external_event_id is empty
     */
    Receipt receive_event(const std::string& provider, const std::string& external_event_id,
                          const std::string& payload, const std::string& signature);

    /**
     * Apply a stored event to its order and record the outcome.
     * @throws NotFoundError if the event does not exist
     */
    ProcessResult process(const std::string& event_id);

    /**
     * Archive exhausted events, then reprocess up to `batch_size` due events,
     * oldest first.
     */
    RetryBatchResult retry_failed_webhooks(int64_t batch_size);

    RetryStats get_retry_stats();

    /**
     * @throws NotFoundError if the event does not exist
     */
    WebhookEvent get_event(const std::string& event_id);

    /**
     * Delay before the next attempt once `retry_count` attempts have failed:
     * initial_backoff doubled per earlier failure, capped at max_backoff.
     */
    std::chrono::seconds backoff_for(int64_t retry_count) const;

    const WebhookOptions& options() const { return options_; }

private:
    ProcessResult apply(const WebhookEvent& event);
    void record_outcome(const WebhookEvent& event, const ProcessResult& outcome);

    std::shared_ptr<Database> db_;
    OrderStateMachine& orders_;
    SecretResolver secrets_;
    Clock clock_;
    WebhookOptions options_;
};

}  // namespace stockguard
