#include <gtest/gtest.h>
#include "stockguard/catalog.hpp"
#include "stockguard/checkout.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/notifier.hpp"
#include "stockguard/order_state_machine.hpp"
#include "stockguard/reservation_manager.hpp"
#include "stockguard/stock_ledger.hpp"
#include "test_support.hpp"

using namespace stockguard;

namespace {

// Forward path of a successful order.
const std::vector<OrderStatus> kHappyPath = {
    OrderStatus::Pending,   OrderStatus::Paid,    OrderStatus::Confirmed,
    OrderStatus::Processing, OrderStatus::Fulfilled, OrderStatus::Shipped,
    OrderStatus::Delivered,
};

}  // namespace

class OrderStateMachineTest : public test::DatabaseTest {
protected:
    void SetUp() override {
        test::DatabaseTest::SetUp();
        catalog_ = std::make_unique<Catalog>(db_);
        ledger_ = std::make_unique<StockLedger>(db_);
        reservations_ = std::make_unique<ReservationManager>(
            db_, clock_.as_clock(), std::chrono::minutes(15), &notifier_);
        orders_ = std::make_unique<OrderStateMachine>(db_, *reservations_, clock_.as_clock(),
                                                      &notifier_);
        checkout_ = std::make_unique<Checkout>(db_, *reservations_, *orders_);
        catalog_->register_product("sku-1", 10);
        catalog_->register_product("sku-2", 10);
    }

    Order place(int64_t quantity, const std::string& product_id = "sku-1") {
        OrderLine line;
        line.product_id = product_id;
        line.quantity = quantity;
        line.unit_price_cents = 1250;
        auto result = checkout_->place_order({"user-1", ""}, {line});
        EXPECT_TRUE(result.ok());
        return *result.order;
    }

    Order advance(const std::string& order_id, OrderStatus target) {
        auto result = orders_->transition(order_id, target, "operator");
        EXPECT_TRUE(result.ok()) << "transition to " << to_string(target) << " rejected";
        return result.ok() ? *result.order : orders_->get_order(order_id);
    }

    // Walk the happy path until the order sits in `status`.
    Order walk_to(const std::string& order_id, OrderStatus status) {
        Order order = orders_->get_order(order_id);
        for (std::size_t i = 1; i < kHappyPath.size() && order.status != status; i++) {
            order = advance(order_id, kHappyPath[i]);
        }
        return order;
    }

    test::RecordingNotifier notifier_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<StockLedger> ledger_;
    std::unique_ptr<ReservationManager> reservations_;
    std::unique_ptr<OrderStateMachine> orders_;
    std::unique_ptr<Checkout> checkout_;
};

// =============================================================================
// Transition Table Tests
// =============================================================================

TEST_F(OrderStateMachineTest, TransitionTable_ShouldMatchAllowedEdges) {
    using S = OrderStatus;
    EXPECT_EQ(OrderStateMachine::legal_next(S::Pending), (std::vector<S>{S::Paid, S::Cancelled}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Paid),
              (std::vector<S>{S::Confirmed, S::Cancelled, S::Refunded}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Confirmed),
              (std::vector<S>{S::Processing, S::Cancelled}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Processing),
              (std::vector<S>{S::Fulfilled, S::Cancelled}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Fulfilled),
              (std::vector<S>{S::Shipped, S::Cancelled}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Shipped),
              (std::vector<S>{S::Delivered, S::Cancelled}));
    EXPECT_EQ(OrderStateMachine::legal_next(S::Delivered), (std::vector<S>{S::Refunded}));
    EXPECT_TRUE(OrderStateMachine::is_terminal(S::Cancelled));
    EXPECT_TRUE(OrderStateMachine::is_terminal(S::Refunded));
    EXPECT_FALSE(OrderStateMachine::is_terminal(S::Delivered));
}

TEST_F(OrderStateMachineTest, EveryLegalEdge_ShouldStampTimestampAndAppendAuditEvent) {
    catalog_->register_product("sku-1", 100);

    for (std::size_t i = 0; i < kHappyPath.size(); i++) {
        OrderStatus from = kHappyPath[i];
        for (OrderStatus to : OrderStateMachine::legal_next(from)) {
            // Given an order sitting in `from`
            auto order = place(1);
            walk_to(order.id, from);
            auto events_before = orders_->history(order.id).size();
            clock_.advance(std::chrono::seconds(1));

            // When it moves to `to`
            auto result = orders_->transition(order.id, to, "operator", std::string("edge test"));

            // Then the status, its timestamp and the audit trail all reflect the move
            ASSERT_TRUE(result.ok()) << to_string(from) << " -> " << to_string(to);
            EXPECT_EQ(result.order->status, to);
            EXPECT_EQ(result.order->timestamp_for(to), std::optional<Timestamp>(clock_.now()));
            EXPECT_EQ(result.order->updated_at, clock_.now());

            auto stored = orders_->get_order(order.id);
            EXPECT_EQ(stored.status, to);
            EXPECT_EQ(stored.timestamp_for(to), std::optional<Timestamp>(clock_.now()));

            auto history = orders_->history(order.id);
            ASSERT_EQ(history.size(), events_before + 1);
            EXPECT_EQ(history.back().previous_status, from);
            EXPECT_EQ(history.back().new_status, to);
            EXPECT_EQ(history.back().actor, "operator");
            EXPECT_EQ(history.back().note, std::optional<std::string>("edge test"));
        }
    }
}

TEST_F(OrderStateMachineTest, IllegalEdge_ShouldReturnLegalNextStatuses) {
    // Given a delivered order
    auto order = place(1);
    walk_to(order.id, OrderStatus::Delivered);
    auto events_before = orders_->history(order.id).size();

    // When an operator tries to cancel it
    auto result = orders_->transition(order.id, OrderStatus::Cancelled, "operator");

    // Then it is rejected with what is allowed instead
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.rejected->kind, InvalidTransition::Kind::IllegalEdge);
    EXPECT_EQ(result.rejected->current, OrderStatus::Delivered);
    EXPECT_EQ(result.rejected->requested, OrderStatus::Cancelled);
    EXPECT_EQ(result.rejected->legal_next, std::vector<OrderStatus>{OrderStatus::Refunded});
    EXPECT_EQ(orders_->get_order(order.id).status, OrderStatus::Delivered);
    EXPECT_EQ(orders_->history(order.id).size(), events_before);
}

TEST_F(OrderStateMachineTest, TerminalStatus_ShouldRejectEveryOtherTarget) {
    auto order = place(1);
    advance(order.id, OrderStatus::Cancelled);

    for (auto target : kAllOrderStatuses) {
        if (target == OrderStatus::Cancelled) continue;
        auto result = orders_->transition(order.id, target, "operator");
        ASSERT_FALSE(result.ok());
        EXPECT_TRUE(result.rejected->legal_next.empty());
    }
}

TEST_F(OrderStateMachineTest, EveryUnlistedTarget_ShouldBeRejectedWithoutAuditEvent) {
    catalog_->register_product("sku-1", 100);

    for (OrderStatus from : kAllOrderStatuses) {
        // Given an order sitting in `from`
        auto order = place(1);
        if (from == OrderStatus::Cancelled) {
            advance(order.id, OrderStatus::Cancelled);
        } else if (from == OrderStatus::Refunded) {
            walk_to(order.id, OrderStatus::Paid);
            advance(order.id, OrderStatus::Refunded);
        } else {
            walk_to(order.id, from);
        }
        ASSERT_EQ(orders_->get_order(order.id).status, from);
        auto events_before = orders_->history(order.id).size();

        for (OrderStatus to : kAllOrderStatuses) {
            if (to == from || OrderStateMachine::is_legal(from, to)) continue;

            // When any target outside the table is requested
            auto result = orders_->transition(order.id, to, "operator");

            // Then it is rejected with the legal next statuses and nothing is written
            ASSERT_FALSE(result.ok()) << to_string(from) << " -> " << to_string(to);
            EXPECT_EQ(result.rejected->kind, InvalidTransition::Kind::IllegalEdge);
            EXPECT_EQ(result.rejected->current, from);
            EXPECT_EQ(result.rejected->requested, to);
            EXPECT_EQ(result.rejected->legal_next, OrderStateMachine::legal_next(from));
        }

        EXPECT_EQ(orders_->get_order(order.id).status, from);
        EXPECT_EQ(orders_->history(order.id).size(), events_before) << to_string(from);
    }
}

TEST_F(OrderStateMachineTest, SameStatus_ShouldBeNoOp) {
    // Given a paid order
    auto order = place(2);
    auto paid = advance(order.id, OrderStatus::Paid);
    auto events_before = orders_->history(order.id).size();
    clock_.advance(std::chrono::minutes(1));

    // When the payment is applied again
    auto result = orders_->transition(order.id, OrderStatus::Paid, "webhook:telebirr");

    // Then nothing changes
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.order->paid_at, paid.paid_at);
    EXPECT_EQ(result.order->updated_at, paid.updated_at);
    EXPECT_EQ(orders_->history(order.id).size(), events_before);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 8);
}

TEST_F(OrderStateMachineTest, UnknownOrder_ShouldThrowNotFound) {
    EXPECT_THROW(orders_->transition("nope", OrderStatus::Paid, "operator"), NotFoundError);
    EXPECT_THROW(orders_->get_order("nope"), NotFoundError);
    EXPECT_THROW(orders_->history("nope"), NotFoundError);
}

// =============================================================================
// Reservation Side Effect Tests
// =============================================================================

TEST_F(OrderStateMachineTest, PendingToPaid_ShouldCommitReservations) {
    // Given a product with 10 units and a pending order reserving 3
    auto order = place(3);
    EXPECT_EQ(ledger_->available_stock("sku-1"), 7);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);

    // When the order is paid
    auto paid = advance(order.id, OrderStatus::Paid);

    // Then the reservation is committed and physical stock is 7
    EXPECT_EQ(paid.status, OrderStatus::Paid);
    EXPECT_TRUE(paid.paid_at.has_value());
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 7);
    EXPECT_EQ(ledger_->available_stock("sku-1"), 7);

    auto reservation = reservations_->get_reservation(order.lines[0].reservation_id);
    EXPECT_EQ(reservation.status, ReservationStatus::Committed);
    EXPECT_EQ(reservation.order_id, std::optional<std::string>(order.id));
    EXPECT_EQ(notifier_.count("stockguard.v1.ReservationCommitted"), 1u);
    EXPECT_EQ(notifier_.count("stockguard.v1.OrderStatusChanged"), 1u);
}

TEST_F(OrderStateMachineTest, PaidAfterDirectCommit_ShouldNotDeductTwice) {
    // Given a payment handler that already committed the reservation
    auto order = place(3);
    ASSERT_TRUE(reservations_->commit_reservation(order.lines[0].reservation_id, order.id));

    // When the order is moved to paid
    advance(order.id, OrderStatus::Paid);

    // Then stock was deducted once
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 7);
}

TEST_F(OrderStateMachineTest, PaidToCancelled_ShouldRestoreCommittedStock) {
    // Given a paid order for 3 units
    auto order = place(3);
    advance(order.id, OrderStatus::Paid);
    ASSERT_EQ(catalog_->physical_stock("sku-1"), 7);

    // When it is cancelled before fulfillment
    auto cancelled = advance(order.id, OrderStatus::Cancelled);

    // Then the units are back in stock
    EXPECT_EQ(cancelled.status, OrderStatus::Cancelled);
    EXPECT_TRUE(cancelled.cancelled_at.has_value());
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
    EXPECT_EQ(ledger_->available_stock("sku-1"), 10);
}

TEST_F(OrderStateMachineTest, ProcessingToCancelled_ShouldRestoreCommittedStock) {
    auto order = place(4);
    walk_to(order.id, OrderStatus::Processing);
    ASSERT_EQ(catalog_->physical_stock("sku-1"), 6);

    advance(order.id, OrderStatus::Cancelled);

    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
}

TEST_F(OrderStateMachineTest, ShippedToCancelled_ShouldNotRestoreStock) {
    // Given goods that already left the warehouse
    auto order = place(2);
    walk_to(order.id, OrderStatus::Shipped);

    // When the order is cancelled
    advance(order.id, OrderStatus::Cancelled);

    // Then physical stock stays deducted
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 8);
}

TEST_F(OrderStateMachineTest, PendingToCancelled_ShouldReleaseReservations) {
    auto order = place(4);
    ASSERT_EQ(ledger_->available_stock("sku-1"), 6);

    advance(order.id, OrderStatus::Cancelled);

    EXPECT_EQ(ledger_->available_stock("sku-1"), 10);
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
    EXPECT_EQ(reservations_->get_reservation(order.lines[0].reservation_id).status,
              ReservationStatus::Released);
}

TEST_F(OrderStateMachineTest, RefundFromPaid_ShouldRestoreStock) {
    auto order = place(3);
    advance(order.id, OrderStatus::Paid);

    auto refunded = advance(order.id, OrderStatus::Refunded);

    EXPECT_TRUE(refunded.refunded_at.has_value());
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
}

TEST_F(OrderStateMachineTest, RefundFromDelivered_ShouldNotRestoreStock) {
    auto order = place(3);
    walk_to(order.id, OrderStatus::Delivered);

    advance(order.id, OrderStatus::Refunded);

    EXPECT_EQ(catalog_->physical_stock("sku-1"), 7);
}

// =============================================================================
// Lost Reservation Compensation Tests
// =============================================================================

TEST_F(OrderStateMachineTest, PaidWithExpiredReservation_ShouldCancelAndRequestCompensation) {
    // Given a pending order whose reservation expired before payment landed
    auto order = place(3);
    clock_.advance(std::chrono::minutes(16));
    ASSERT_EQ(reservations_->expire_stale_reservations(clock_.now()), 1);

    // When the payment tries to move it to paid
    auto result = orders_->transition(order.id, OrderStatus::Paid, "webhook:telebirr");

    // Then the payment is refused, the order is cancelled and compensation is requested
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.rejected->kind, InvalidTransition::Kind::ReservationLost);
    EXPECT_EQ(result.rejected->requested, OrderStatus::Paid);
    EXPECT_EQ(result.rejected->current, OrderStatus::Cancelled);

    auto stored = orders_->get_order(order.id);
    EXPECT_EQ(stored.status, OrderStatus::Cancelled);
    EXPECT_FALSE(stored.paid_at.has_value());
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
    EXPECT_EQ(ledger_->available_stock("sku-1"), 10);
    EXPECT_EQ(notifier_.count("stockguard.v1.PaymentCompensationRequired"), 1u);

    auto history = orders_->history(order.id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].new_status, OrderStatus::Cancelled);
    EXPECT_TRUE(history[0].note.has_value());
}

TEST_F(OrderStateMachineTest, PaidWithOneLostLine_ShouldRollBackEveryCommit) {
    // Given a two-line order whose second reservation was released
    OrderLine first;
    first.product_id = "sku-1";
    first.quantity = 2;
    first.unit_price_cents = 500;
    OrderLine second;
    second.product_id = "sku-2";
    second.quantity = 1;
    second.unit_price_cents = 900;
    auto placed = checkout_->place_order({"user-1", ""}, {first, second});
    ASSERT_TRUE(placed.ok());
    reservations_->release_reservation(placed.order->lines[1].reservation_id);

    // When the order is paid
    auto result = orders_->transition(placed.order->id, OrderStatus::Paid, "operator");

    // Then no stock was deducted for either line and the first hold is released
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(catalog_->physical_stock("sku-1"), 10);
    EXPECT_EQ(catalog_->physical_stock("sku-2"), 10);
    EXPECT_EQ(reservations_->get_reservation(placed.order->lines[0].reservation_id).status,
              ReservationStatus::Released);
}
