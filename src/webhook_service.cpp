#include "stockguard/webhook_service.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <nlohmann/json.hpp>

#include "stockguard/errors.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/retry.hpp"
#include "stockguard/signature.hpp"
#include "stockguard/validation.hpp"

namespace stockguard {

namespace {

constexpr const char* kSelectEvent =
    "SELECT id, provider, external_event_id, order_id, payload, signature, signature_hash, "
    "status, retry_count, next_retry_at, archived, error_message, created_at, processed_at "
    "FROM webhook_events WHERE id = ?";

WebhookEvent read_event(const Statement& row) {
    WebhookEvent e;
    e.id = row.column_text(0);
    e.provider = row.column_text(1);
    e.external_event_id = row.column_text(2);
    e.order_id = row.column_optional_text(3);
    e.payload = row.column_text(4);
    e.signature = row.column_optional_text(5);
    e.signature_hash = row.column_optional_text(6);
    e.status = parse_webhook_status(row.column_text(7));
    e.retry_count = row.column_int(8);
    if (auto next = row.column_optional_int(9)) e.next_retry_at = from_millis(*next);
    e.archived = row.column_int(10) != 0;
    e.error_message = row.column_optional_text(11);
    e.created_at = from_millis(row.column_int(12));
    if (auto processed = row.column_optional_int(13)) e.processed_at = from_millis(*processed);
    return e;
}

// Best effort: the order link is informational and an unparsable payload is
// still stored so the failure can be inspected.
std::optional<std::string> peek_order_id(const std::string& payload) {
    auto body = nlohmann::json::parse(payload, nullptr, false);
    if (body.is_discarded() || !body.is_object()) return std::nullopt;
    auto it = body.find("orderId");
    if (it == body.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<int64_t> read_amount(const nlohmann::json& body) {
    auto it = body.find("amount");
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidArgumentError("Malformed amount in webhook payload");
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        int64_t value = 0;
        const char* end = text.data() + text.size();
        auto parsed = std::from_chars(text.data(), end, value);
        if (!text.empty() && text.front() != '-' && parsed.ec == std::errc() &&
            parsed.ptr == end) {
            return value;
        }
    }
    throw InvalidArgumentError("Malformed amount in webhook payload");
}

ProcessResult succeeded() { return ProcessResult{true, ""}; }
ProcessResult failed(std::string reason) { return ProcessResult{false, std::move(reason)}; }

}  // namespace

const char* to_string(WebhookStatus status) {
    switch (status) {
        case WebhookStatus::Pending: return "pending";
        case WebhookStatus::Processed: return "processed";
        case WebhookStatus::Error: return "error";
        case WebhookStatus::Rejected: return "rejected";
    }
    return "unknown";
}

WebhookStatus parse_webhook_status(const std::string& value) {
    if (value == "pending") return WebhookStatus::Pending;
    if (value == "processed") return WebhookStatus::Processed;
    if (value == "error") return WebhookStatus::Error;
    if (value == "rejected") return WebhookStatus::Rejected;
    throw InvalidArgumentError("Unknown webhook status: " + value);
}

const char* to_string(Receipt receipt) {
    switch (receipt) {
        case Receipt::Accepted: return "accepted";
        case Receipt::DuplicateIgnored: return "duplicate_ignored";
        case Receipt::InvalidSignature: return "invalid_signature";
    }
    return "unknown";
}

WebhookService::WebhookService(std::shared_ptr<Database> db, OrderStateMachine& orders,
                               SecretResolver secrets, Clock clock, WebhookOptions options)
    : db_(std::move(db)),
      orders_(orders),
      secrets_(std::move(secrets)),
      clock_(std::move(clock)),
      options_(options) {}

// =============================================================================
// Intake
// =============================================================================

Receipt WebhookService::receive_event(const std::string& provider,
                                      const std::string& external_event_id,
                                      const std::string& payload, const std::string& signature) {
    validation::require_not_empty(provider, "provider");
    validation::require_not_empty(external_event_id, "external_event_id");

    const std::string secret = secrets_(provider);
    if (secret.empty()) {
        log_warn("webhooks", "webhook_secret_missing", {{"provider", provider}});
    }
    const bool valid = signature::verify(secret, payload, signature);
    const std::optional<std::string> computed =
        secret.empty() ? std::nullopt
                       : std::optional<std::string>(signature::hmac_sha256_hex(secret, payload));

    WebhookEvent event;
    event.id = new_id();
    event.provider = provider;
    event.external_event_id = external_event_id;
    event.order_id = peek_order_id(payload);
    event.payload = payload;
    event.signature = signature;
    event.signature_hash = computed;
    event.status = valid ? WebhookStatus::Pending : WebhookStatus::Rejected;
    event.created_at = clock_();

    auto txn = db_->begin(Transaction::Mode::Immediate);
    if (valid) {
        std::optional<std::string> existing_id;
        {
            auto existing = txn->prepare(
                "SELECT id FROM webhook_events "
                "WHERE provider = ? AND external_event_id = ? AND status <> 'rejected'");
            existing.bind(1, provider).bind(2, external_event_id);
            if (existing.step()) existing_id = existing.column_text(0);
        }
        if (existing_id) {
            log_info("webhooks", "webhook_duplicate_ignored",
                     {{"provider", provider}, {"external_event_id", external_event_id},
                      {"existing_id", *existing_id}});
            return Receipt::DuplicateIgnored;
        }
    }

    try {
        txn->prepare("INSERT INTO webhook_events (id, provider, external_event_id, order_id, "
                     "payload, signature, signature_hash, status, created_at) "
                     "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)")
            .bind(1, event.id)
            .bind(2, provider)
            .bind(3, external_event_id)
            .bind_optional(4, event.order_id)
            .bind(5, payload)
            .bind_optional(6, event.signature)
            .bind_optional(7, event.signature_hash)
            .bind(8, std::string(to_string(event.status)))
            .bind(9, to_millis(event.created_at))
            .run();
    } catch (const ConstraintError&) {
        log_info("webhooks", "webhook_duplicate_ignored",
                 {{"provider", provider}, {"external_event_id", external_event_id}});
        return Receipt::DuplicateIgnored;
    }
    txn->commit();

    if (!valid) {
        log_warn("webhooks", "webhook_invalid_signature",
                 {{"event_id", event.id}, {"provider", provider},
                  {"external_event_id", external_event_id}});
        return Receipt::InvalidSignature;
    }

    log_info("webhooks", "webhook_received",
             {{"event_id", event.id}, {"provider", provider},
              {"external_event_id", external_event_id},
              {"order_id", event.order_id.value_or("")}});

    try {
        process(event.id);
    } catch (const StockguardError& e) {
        // The event stays pending; the retry sweep picks up stale pending events.
        log_error("webhooks", "webhook_outcome_not_recorded",
                  {{"event_id", event.id}, {"error", e.what()}});
    }
    return Receipt::Accepted;
}

// =============================================================================
// Processing
// =============================================================================

ProcessResult WebhookService::process(const std::string& event_id) {
    auto event = get_event(event_id);
    if (event.status == WebhookStatus::Rejected) {
        return failed("Event was rejected at intake");
    }
    if (event.status == WebhookStatus::Processed) return succeeded();

    ProcessResult outcome;
    try {
        outcome = apply(event);
    } catch (const nlohmann::json::exception& e) {
        outcome = failed(std::string("Malformed payload: ") + e.what());
    } catch (const StockguardError& e) {
        if (e.is_consistency_violation()) {
            log_error("webhooks", "webhook_consistency_violation",
                      {{"event_id", event.id}, {"error", e.what()}});
        }
        outcome = failed(e.what());
    } catch (const std::exception& e) {
        log_error("webhooks", "webhook_processing_fault",
                  {{"event_id", event.id}, {"error", e.what()}});
        outcome = failed(std::string("Processing fault: ") + e.what());
    }

    with_retry(RetryPolicy{}, "record_webhook_outcome",
               [&] { record_outcome(event, outcome); });
    return outcome;
}

ProcessResult WebhookService::apply(const WebhookEvent& event) {
    auto body = nlohmann::json::parse(event.payload);
    if (!body.is_object()) return failed("Payload is not a JSON object");

    const std::string status = body.value("status", "");
    const std::string order_id = body.value("orderId", "");
    const std::string reference = body.value("paymentReference", "");
    const std::string actor = "webhook:" + event.provider;

    if (status == "pending") return succeeded();
    if (order_id.empty()) return failed("Missing order ID");

    Order order = orders_.get_order(order_id);

    if (status == "completed") {
        if (order.paid_at) return succeeded();

        if (auto amount = read_amount(body)) {
            if (*amount != order.total_cents) {
                log_warn("webhooks", "webhook_amount_mismatch",
                         {{"event_id", event.id}, {"order_id", order_id},
                          {"amount", *amount}, {"total_cents", order.total_cents}});
                return failed("Amount mismatch");
            }
        }

        std::optional<std::string> note;
        if (!reference.empty()) note = "Payment reference " + reference;
        auto result = orders_.transition(order_id, OrderStatus::Paid, actor, note);
        if (!result.ok()) return failed(result.rejected->reason);
        return succeeded();
    }

    if (status == "failed") {
        if (order.status == OrderStatus::Cancelled) return succeeded();
        auto result = orders_.transition(order_id, OrderStatus::Cancelled, actor,
                                         std::string("Payment failed"));
        if (!result.ok()) return failed(result.rejected->reason);
        return succeeded();
    }

    return failed("Unsupported payment status: " + status);
}

void WebhookService::record_outcome(const WebhookEvent& event, const ProcessResult& outcome) {
    Timestamp now = clock_();
    auto txn = db_->begin(Transaction::Mode::Immediate);

    if (outcome.succeeded) {
        txn->prepare("UPDATE webhook_events SET status = 'processed', processed_at = ?, "
                     "next_retry_at = NULL, error_message = NULL "
                     "WHERE id = ? AND status IN ('pending', 'error')")
            .bind(1, to_millis(now))
            .bind(2, event.id)
            .run();
        txn->commit();
        log_info("webhooks", "webhook_processed",
                 {{"event_id", event.id}, {"provider", event.provider},
                  {"retry_count", event.retry_count}});
        return;
    }

    const int64_t retry_count = event.retry_count + 1;
    const bool exhausted = retry_count >= options_.max_retries;
    std::optional<int64_t> next_retry_at;
    if (!exhausted) next_retry_at = to_millis(now + backoff_for(retry_count));

    txn->prepare("UPDATE webhook_events SET status = 'error', retry_count = ?, "
                 "next_retry_at = ?, archived = ?, error_message = ? "
                 "WHERE id = ? AND status IN ('pending', 'error')")
        .bind(1, retry_count)
        .bind_optional(2, next_retry_at)
        .bind(3, static_cast<int64_t>(exhausted ? 1 : 0))
        .bind(4, outcome.reason)
        .bind(5, event.id)
        .run();
    txn->commit();

    if (exhausted) {
        log_warn("webhooks", "webhook_retry_limit_reached",
                 {{"event_id", event.id}, {"provider", event.provider},
                  {"retry_count", retry_count}, {"error", outcome.reason}});
    } else {
        log_info("webhooks", "webhook_processing_failed",
                 {{"event_id", event.id}, {"provider", event.provider},
                  {"retry_count", retry_count}, {"next_retry_at_ms", *next_retry_at},
                  {"error", outcome.reason}});
    }
}

std::chrono::seconds WebhookService::backoff_for(int64_t retry_count) const {
    auto delay = options_.initial_backoff;
    for (int64_t i = 1; i < retry_count && delay < options_.max_backoff; i++) delay *= 2;
    return std::min(delay, options_.max_backoff);
}

// =============================================================================
// Retry sweep
// =============================================================================

RetryBatchResult WebhookService::retry_failed_webhooks(int64_t batch_size) {
    validation::require_positive(batch_size, "batch_size");

    Timestamp now = clock_();
    std::vector<std::string> due;
    {
        auto txn = db_->begin(Transaction::Mode::Immediate);
        txn->prepare("UPDATE webhook_events SET archived = 1, next_retry_at = NULL, "
                     "error_message = ? "
                     "WHERE status = 'error' AND archived = 0 AND retry_count >= ?")
            .bind(1, "Max retry attempts (" + std::to_string(options_.max_retries) + ") reached")
            .bind(2, options_.max_retries)
            .run();
        int64_t archived = txn->changes();
        if (archived > 0) {
            log_warn("webhooks", "webhooks_archived", {{"count", archived}});
        }

        auto stmt = txn->prepare(
            "SELECT id FROM webhook_events "
            "WHERE archived = 0 AND retry_count < ? AND ("
            "  (status = 'error' AND (next_retry_at IS NULL OR next_retry_at <= ?)) OR "
            "  (status = 'pending' AND created_at <= ?)) "
            "ORDER BY created_at, rowid LIMIT ?");
        stmt.bind(1, options_.max_retries)
            .bind(2, to_millis(now))
            .bind(3, to_millis(now - options_.initial_backoff))
            .bind(4, batch_size);
        while (stmt.step()) due.push_back(stmt.column_text(0));
        txn->commit();
    }

    RetryBatchResult result;
    for (const auto& id : due) {
        auto outcome = process(id);
        result.processed++;
        if (outcome.succeeded) {
            result.succeeded++;
        } else {
            result.failed++;
        }
    }

    log_info("webhooks", "webhook_retry_batch_processed",
             {{"processed", result.processed}, {"succeeded", result.succeeded},
              {"failed", result.failed}});
    return result;
}

RetryStats WebhookService::get_retry_stats() {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    RetryStats stats;
    {
        auto stmt = txn->prepare(
            "SELECT "
            "  COALESCE(SUM(CASE WHEN status = 'error' AND archived = 0 AND retry_count < ? "
            "               THEN 1 ELSE 0 END), 0), "
            "  COALESCE(SUM(CASE WHEN status = 'error' AND archived = 0 THEN 1 ELSE 0 END), 0), "
            "  COALESCE(SUM(CASE WHEN archived = 1 THEN 1 ELSE 0 END), 0) "
            "FROM webhook_events");
        stmt.bind(1, options_.max_retries);
        if (stmt.step()) {
            stats.pending_retries = stmt.column_int(0);
            stats.failed_webhooks = stmt.column_int(1);
            stats.archived_webhooks = stmt.column_int(2);
        }
    }
    txn->commit();
    return stats;
}

WebhookEvent WebhookService::get_event(const std::string& event_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    std::optional<WebhookEvent> event;
    {
        auto stmt = txn->prepare(kSelectEvent);
        stmt.bind(1, event_id);
        if (stmt.step()) event = read_event(stmt);
    }
    txn->commit();
    if (!event) throw NotFoundError("Webhook event not found: " + event_id);
    return *event;
}

}  // namespace stockguard
