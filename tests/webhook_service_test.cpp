#include <gtest/gtest.h>
#include <map>
#include <nlohmann/json.hpp>
#include "stockguard/catalog.hpp"
#include "stockguard/checkout.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/notifier.hpp"
#include "stockguard/order_state_machine.hpp"
#include "stockguard/reservation_manager.hpp"
#include "stockguard/signature.hpp"
#include "stockguard/webhook_service.hpp"
#include "test_support.hpp"

using namespace stockguard;

class WebhookServiceTest : public test::DatabaseTest {
protected:
    void SetUp() override {
        test::DatabaseTest::SetUp();
        catalog_ = std::make_unique<Catalog>(db_);
        reservations_ = std::make_unique<ReservationManager>(
            db_, clock_.as_clock(), std::chrono::minutes(15), &notifier_);
        orders_ = std::make_unique<OrderStateMachine>(db_, *reservations_, clock_.as_clock(),
                                                      &notifier_);
        checkout_ = std::make_unique<Checkout>(db_, *reservations_, *orders_);
        webhooks_ = std::make_unique<WebhookService>(
            db_, *orders_,
            [this](const std::string& provider) {
                auto it = secrets_.find(provider);
                return it != secrets_.end() ? it->second : std::string();
            },
            clock_.as_clock());

        catalog_->register_product("sku-1", 10);
    }

    Order place(int64_t quantity) {
        OrderLine line;
        line.product_id = "sku-1";
        line.quantity = quantity;
        line.unit_price_cents = 1000;
        auto result = checkout_->place_order({"user-1", ""}, {line});
        EXPECT_TRUE(result.ok());
        return *result.order;
    }

    static std::string payload(const std::string& status, const std::string& order_id,
                               std::optional<int64_t> amount = std::nullopt) {
        nlohmann::json body = {{"provider", "telebirr"},
                               {"status", status},
                               {"orderId", order_id},
                               {"paymentReference", "ref-" + order_id}};
        if (amount) body["amount"] = *amount;
        return body.dump();
    }

    Receipt deliver(const std::string& external_event_id, const std::string& body,
                    const std::string& provider = "telebirr") {
        auto sig = signature::hmac_sha256_hex(secrets_.at(provider), body);
        return webhooks_->receive_event(provider, external_event_id, body, sig);
    }

    WebhookEvent stored(const std::string& external_event_id,
                        const std::string& provider = "telebirr") {
        auto txn = db_->begin(Transaction::Mode::Deferred);
        std::string id;
        {
            auto stmt = txn->prepare(
                "SELECT id FROM webhook_events "
                "WHERE provider = ? AND external_event_id = ? AND status <> 'rejected'");
            stmt.bind(1, provider).bind(2, external_event_id);
            EXPECT_TRUE(stmt.step());
            id = stmt.column_text(0);
        }
        txn->commit();
        return webhooks_->get_event(id);
    }

    int64_t count_events(const std::string& where) {
        auto txn = db_->begin(Transaction::Mode::Deferred);
        int64_t n = 0;
        {
            auto stmt = txn->prepare("SELECT COUNT(*) FROM webhook_events WHERE " + where);
            if (stmt.step()) n = stmt.column_int(0);
        }
        txn->commit();
        return n;
    }

    // Wait out the scheduled backoff of an event, then run the sweep.
    RetryBatchResult retry_when_due(const std::string& external_event_id) {
        auto event = stored(external_event_id);
        if (event.next_retry_at && *event.next_retry_at > clock_.now()) {
            clock_.advance(std::chrono::duration_cast<std::chrono::milliseconds>(
                *event.next_retry_at - clock_.now()));
        }
        return webhooks_->retry_failed_webhooks(10);
    }

    std::map<std::string, std::string> secrets_ = {{"telebirr", "tele-secret"},
                                                   {"cbe", "cbe-secret"}};
    test::RecordingNotifier notifier_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<ReservationManager> reservations_;
    std::unique_ptr<OrderStateMachine> orders_;
    std::unique_ptr<Checkout> checkout_;
    std::unique_ptr<WebhookService> webhooks_;
};

// =============================================================================
// ReceiveEvent Tests
// =============================================================================

TEST_F(WebhookServiceTest, CompletedPayment_ShouldMarkOrderPaid) {
    // Given a pending order for 3 units
    auto order = place(3);

    // When the provider reports the payment as completed
    auto receipt = deliver("evt-1", payload("completed", order.id, 3000));

    // Then the order is paid, stock committed and the event processed
    EXPECT_EQ(receipt, Receipt::Accepted);
    auto paid = orders_->get_order(order.id);
    EXPECT_EQ(paid.status, OrderStatus::Paid);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 7);

    auto event = stored("evt-1");
    EXPECT_EQ(event.status, WebhookStatus::Processed);
    EXPECT_EQ(event.order_id, std::optional<std::string>(order.id));
    EXPECT_TRUE(event.processed_at.has_value());
    EXPECT_EQ(event.retry_count, 0);

    auto history = orders_->history(order.id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].actor, "webhook:telebirr");
}

TEST_F(WebhookServiceTest, Redelivery_ShouldBeIgnored) {
    // Given a processed payment event
    auto order = place(3);
    auto body = payload("completed", order.id);
    ASSERT_EQ(deliver("evt-1", body), Receipt::Accepted);

    // When the provider delivers it again
    auto receipt = deliver("evt-1", body);

    // Then nothing is applied twice
    EXPECT_EQ(receipt, Receipt::DuplicateIgnored);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 7);
    EXPECT_EQ(count_events("1 = 1"), 1);
    EXPECT_EQ(orders_->history(order.id).size(), 1u);
}

TEST_F(WebhookServiceTest, SameEventIdFromAnotherProvider_ShouldNotBeDuplicate) {
    auto order = place(1);
    ASSERT_EQ(deliver("evt-1", payload("pending", order.id)), Receipt::Accepted);

    EXPECT_EQ(deliver("evt-1", payload("pending", order.id), "cbe"), Receipt::Accepted);
}

TEST_F(WebhookServiceTest, InvalidSignature_ShouldBeStoredAsRejectedWithoutEffect) {
    // Given a pending order
    auto order = place(3);
    auto body = payload("completed", order.id);

    // When a delivery arrives with a forged signature
    auto receipt = webhooks_->receive_event("telebirr", "evt-1", body,
                                            signature::hmac_sha256_hex("wrong", body));

    // Then it is kept for audit only
    EXPECT_EQ(receipt, Receipt::InvalidSignature);
    EXPECT_EQ(count_events("status = 'rejected'"), 1);
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Pending);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);

    // And the genuine delivery of the same event is still accepted
    EXPECT_EQ(deliver("evt-1", body), Receipt::Accepted);
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Paid);
}

TEST_F(WebhookServiceTest, ProviderWithoutSecret_ShouldBeRejected) {
    auto order = place(1);
    auto body = payload("completed", order.id);

    auto receipt = webhooks_->receive_event("awash", "evt-1", body,
                                            signature::hmac_sha256_hex("anything", body));

    EXPECT_EQ(receipt, Receipt::InvalidSignature);
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Pending);
}

TEST_F(WebhookServiceTest, MissingIdentity_ShouldThrow) {
    EXPECT_THROW(webhooks_->receive_event("", "evt-1", "{}", "sig"), InvalidArgumentError);
    EXPECT_THROW(webhooks_->receive_event("telebirr", "", "{}", "sig"), InvalidArgumentError);
}

// =============================================================================
// Process Tests
// =============================================================================

TEST_F(WebhookServiceTest, FailedPayment_ShouldCancelOrderAndReleaseStock) {
    auto order = place(4);

    ASSERT_EQ(deliver("evt-1", payload("failed", order.id)), Receipt::Accepted);

    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Cancelled);
    EXPECT_EQ(reservations_->get_reservation(order.lines[0].reservation_id).status,
              ReservationStatus::Released);
    EXPECT_EQ(stored("evt-1").status, WebhookStatus::Processed);
}

TEST_F(WebhookServiceTest, PendingPayment_ShouldChangeNothing) {
    auto order = place(2);

    ASSERT_EQ(deliver("evt-1", payload("pending", order.id)), Receipt::Accepted);

    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Pending);
    EXPECT_EQ(stored("evt-1").status, WebhookStatus::Processed);
}

TEST_F(WebhookServiceTest, CompletedForAlreadyPaidOrder_ShouldSucceed) {
    // Given an order already paid through the direct confirmation path
    auto order = place(2);
    ASSERT_TRUE(orders_->transition(order.id, OrderStatus::Paid, "checkout").ok());
    ASSERT_TRUE(orders_->transition(order.id, OrderStatus::Confirmed, "operator").ok());

    // When the provider's completion arrives late
    ASSERT_EQ(deliver("evt-1", payload("completed", order.id)), Receipt::Accepted);

    // Then it counts as applied and the order is left alone
    EXPECT_EQ(stored("evt-1").status, WebhookStatus::Processed);
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Confirmed);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 8);
}

TEST_F(WebhookServiceTest, AmountMismatch_ShouldFailAndScheduleRetry) {
    // Given a 2000 cent order
    auto order = place(2);

    // When the provider reports a different amount
    ASSERT_EQ(deliver("evt-1", payload("completed", order.id, 1500)), Receipt::Accepted);

    // Then the order is untouched and the event waits one initial backoff
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Pending);
    auto event = stored("evt-1");
    EXPECT_EQ(event.status, WebhookStatus::Error);
    EXPECT_EQ(event.retry_count, 1);
    EXPECT_EQ(event.error_message, std::optional<std::string>("Amount mismatch"));
    EXPECT_EQ(event.next_retry_at, std::optional<Timestamp>(clock_.now() + std::chrono::minutes(1)));
    EXPECT_FALSE(event.archived);
}

TEST_F(WebhookServiceTest, MalformedPayload_ShouldFailWithoutThrowing) {
    std::string body = "{not json";
    EXPECT_EQ(deliver("evt-1", body), Receipt::Accepted);

    auto event = stored("evt-1");
    EXPECT_EQ(event.status, WebhookStatus::Error);
    EXPECT_FALSE(event.order_id.has_value());
    ASSERT_TRUE(event.error_message.has_value());
    EXPECT_NE(event.error_message->find("Malformed payload"), std::string::npos);
}

TEST_F(WebhookServiceTest, AmountAsDigitString_ShouldBeCompared) {
    auto order = place(3);
    nlohmann::json body = {{"status", "completed"}, {"orderId", order.id}, {"amount", "3000"}};

    ASSERT_EQ(deliver("evt-1", body.dump()), Receipt::Accepted);

    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Paid);
    EXPECT_EQ(stored("evt-1").status, WebhookStatus::Processed);
}

TEST_F(WebhookServiceTest, OutOfRangeAmount_ShouldFailUntilArchived) {
    // Given a signed completion whose amount does not fit in 64 bits
    auto order = place(3);
    nlohmann::json body = {{"status", "completed"},
                           {"orderId", order.id},
                           {"amount", "99999999999999999999"}};

    // When it is received
    Receipt receipt = Receipt::DuplicateIgnored;
    ASSERT_NO_THROW(receipt = deliver("evt-1", body.dump()));

    // Then it is recorded as a failed attempt
    EXPECT_EQ(receipt, Receipt::Accepted);
    auto event = stored("evt-1");
    EXPECT_EQ(event.status, WebhookStatus::Error);
    EXPECT_EQ(event.retry_count, 1);
    ASSERT_TRUE(event.error_message.has_value());
    EXPECT_NE(event.error_message->find("Malformed amount"), std::string::npos);
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Pending);

    // And each sweep counts another attempt until the event is archived
    for (int attempt = 2; attempt <= 5; attempt++) {
        RetryBatchResult result;
        ASSERT_NO_THROW(result = retry_when_due("evt-1"));
        EXPECT_EQ(result.failed, 1);
    }
    EXPECT_TRUE(stored("evt-1").archived);
    EXPECT_EQ(webhooks_->get_retry_stats().archived_webhooks, 1);
}

TEST_F(WebhookServiceTest, FailingEvent_ShouldNotStarveNewerEventsInSweep) {
    // Given an old unparsable amount and a newer event for an order that arrives late
    auto order = place(1);
    nlohmann::json bad = {{"status", "completed"},
                          {"orderId", order.id},
                          {"amount", "-12"}};
    ASSERT_EQ(deliver("evt-1", bad.dump()), Receipt::Accepted);
    clock_.advance(std::chrono::seconds(1));
    ASSERT_EQ(deliver("evt-2", payload("failed", order.id)), Receipt::Accepted);
    ASSERT_EQ(stored("evt-2").status, WebhookStatus::Processed);
    ASSERT_EQ(deliver("evt-3", payload("completed", "o-missing")), Receipt::Accepted);

    // When the sweep runs once both failures are due
    clock_.advance(std::chrono::minutes(2));
    auto result = webhooks_->retry_failed_webhooks(10);

    // Then both were attempted
    EXPECT_EQ(result.processed, 2);
    EXPECT_EQ(stored("evt-1").retry_count, 2);
    EXPECT_EQ(stored("evt-3").retry_count, 2);
}

TEST_F(WebhookServiceTest, PaymentAfterReservationExpired_ShouldFailAndCancelOrder) {
    // Given a pending order whose hold expired
    auto order = place(3);
    clock_.advance(std::chrono::minutes(16));
    reservations_->expire_stale_reservations(clock_.now());

    // When the completion arrives
    ASSERT_EQ(deliver("evt-1", payload("completed", order.id)), Receipt::Accepted);

    // Then the order is cancelled for compensation and the event is left for an operator
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Cancelled);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
    EXPECT_EQ(notifier_.count("stockguard.v1.PaymentCompensationRequired"), 1u);
    EXPECT_EQ(stored("evt-1").status, WebhookStatus::Error);
}

// =============================================================================
// Retry Tests
// =============================================================================

TEST_F(WebhookServiceTest, BackoffSchedule_ShouldDoubleAndCap) {
    using std::chrono::seconds;
    EXPECT_EQ(webhooks_->backoff_for(1), seconds(60));
    EXPECT_EQ(webhooks_->backoff_for(2), seconds(120));
    EXPECT_EQ(webhooks_->backoff_for(3), seconds(240));
    EXPECT_EQ(webhooks_->backoff_for(4), seconds(480));
    EXPECT_EQ(webhooks_->backoff_for(5), seconds(960));
    EXPECT_EQ(webhooks_->backoff_for(6), seconds(1920));
    EXPECT_EQ(webhooks_->backoff_for(7), seconds(3600));
    EXPECT_EQ(webhooks_->backoff_for(30), seconds(3600));
}

TEST_F(WebhookServiceTest, RetrySweep_ShouldSkipEventsNotYetDue) {
    ASSERT_EQ(deliver("evt-1", payload("completed", "o-missing")), Receipt::Accepted);

    auto result = webhooks_->retry_failed_webhooks(10);

    EXPECT_EQ(result.processed, 0);
    EXPECT_EQ(stored("evt-1").retry_count, 1);
}

TEST_F(WebhookServiceTest, RetrySweep_ShouldApplyEventOnceOrderExists) {
    // Given a completion that raced ahead of its order
    ASSERT_EQ(deliver("evt-1", payload("completed", "o-late")), Receipt::Accepted);
    ASSERT_EQ(stored("evt-1").status, WebhookStatus::Error);
    {
        auto txn = db_->begin();
        txn->prepare("INSERT INTO orders (id, user_id, status, total_cents, created_at, "
                     "updated_at) VALUES ('o-late', 'user-1', 'pending', 0, ?, ?)")
            .bind(1, to_millis(clock_.now()))
            .bind(2, to_millis(clock_.now()))
            .run();
        txn->commit();
    }

    // When the retry sweep runs after the backoff
    auto result = retry_when_due("evt-1");

    // Then the event is applied
    EXPECT_EQ(result.processed, 1);
    EXPECT_EQ(result.succeeded, 1);
    EXPECT_EQ(orders_->get_order("o-late").status, OrderStatus::Paid);
    auto event = stored("evt-1");
    EXPECT_EQ(event.status, WebhookStatus::Processed);
    EXPECT_FALSE(event.error_message.has_value());
    EXPECT_FALSE(event.next_retry_at.has_value());
}

TEST_F(WebhookServiceTest, RetryCap_ShouldArchiveAfterFiveFailures) {
    // Given an event that can never succeed
    ASSERT_EQ(deliver("evt-1", payload("completed", "o-missing")), Receipt::Accepted);
    ASSERT_EQ(stored("evt-1").retry_count, 1);

    // When the sweep retries it each time it falls due
    for (int attempt = 2; attempt <= 5; attempt++) {
        auto result = retry_when_due("evt-1");
        EXPECT_EQ(result.processed, 1);
        EXPECT_EQ(result.failed, 1);
        EXPECT_EQ(stored("evt-1").retry_count, attempt);
    }

    // Then the fifth failure archives it and later sweeps ignore it
    auto event = stored("evt-1");
    EXPECT_TRUE(event.archived);
    EXPECT_EQ(event.status, WebhookStatus::Error);
    EXPECT_FALSE(event.next_retry_at.has_value());

    clock_.advance(std::chrono::hours(24));
    EXPECT_EQ(webhooks_->retry_failed_webhooks(10).processed, 0);

    auto stats = webhooks_->get_retry_stats();
    EXPECT_EQ(stats.pending_retries, 0);
    EXPECT_EQ(stats.failed_webhooks, 0);
    EXPECT_EQ(stats.archived_webhooks, 1);
}

TEST_F(WebhookServiceTest, RetrySweep_ShouldTakeOldestFirstUpToBatchSize) {
    // Given three failing events received a second apart
    for (const char* id : {"evt-1", "evt-2", "evt-3"}) {
        ASSERT_EQ(deliver(id, payload("completed", "o-missing")), Receipt::Accepted);
        clock_.advance(std::chrono::seconds(1));
    }
    clock_.advance(std::chrono::minutes(2));

    // When the sweep runs with a batch of two
    auto result = webhooks_->retry_failed_webhooks(2);

    // Then only the two oldest were retried
    EXPECT_EQ(result.processed, 2);
    EXPECT_EQ(stored("evt-1").retry_count, 2);
    EXPECT_EQ(stored("evt-2").retry_count, 2);
    EXPECT_EQ(stored("evt-3").retry_count, 1);
}

TEST_F(WebhookServiceTest, RetryStats_ShouldCountPendingFailedAndArchived) {
    // Given one retryable failure and one processed event
    auto order = place(1);
    ASSERT_EQ(deliver("evt-1", payload("completed", "o-missing")), Receipt::Accepted);
    ASSERT_EQ(deliver("evt-2", payload("completed", order.id)), Receipt::Accepted);

    // When I read the stats
    auto stats = webhooks_->get_retry_stats();

    // Then only the failure is counted
    EXPECT_EQ(stats.pending_retries, 1);
    EXPECT_EQ(stats.failed_webhooks, 1);
    EXPECT_EQ(stats.archived_webhooks, 0);
}
