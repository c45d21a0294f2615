#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "database.hpp"
#include "notifier.hpp"
#include "reservation_manager.hpp"
#include "types.hpp"

namespace stockguard {

/**
 * Legal order-status transitions and their side effects.
 *
 * The adjacency table is fixed:
 *
 *   pending    -> paid, cancelled
 *   paid       -> confirmed, cancelled, refunded
 *   confirmed  -> processing, cancelled
 *   processing -> fulfilled, cancelled
 *   fulfilled  -> shipped, cancelled
 *   shipped    -> delivered, cancelled
 *   delivered  -> refunded
 *   cancelled, refunded: terminal
 *
 * Every applied transition stamps the target status' timestamp and appends an
 * audit event in the same transaction. Entering `paid` commits the backing
 * reservations in that transaction too; entering `cancelled` releases the ones
 * still active and, before fulfillment, returns committed units to stock.
 */
class OrderStateMachine {
public:
    OrderStateMachine(std::shared_ptr<Database> db, ReservationManager& reservations,
                      Clock clock, Notifier* notifier = nullptr);

    static const std::vector<OrderStatus>& legal_next(OrderStatus from);
    static bool is_legal(OrderStatus from, OrderStatus to);
    static bool is_terminal(OrderStatus status);

    /**
     * Move an order to `target`.
     *
     * Re-applying the current status is a no-op that returns the order.
     * An illegal edge returns InvalidTransition with the legal next statuses.
     * If a backing reservation can no longer be committed on the way to
     * `paid`, nothing of the paid transition is applied; the order is
     * cancelled instead, a PaymentCompensationRequired notification goes out,
     * and the result carries InvalidTransition of kind ReservationLost.
     *
     * @throws NotFoundError if the order does not exist
     */
    TransitionResult transition(const std::string& order_id, OrderStatus target,
                                const std::string& actor,
                                const std::optional<std::string>& note = std::nullopt);

    /**
     * @throws NotFoundError if the order does not exist
     */
    Order get_order(const std::string& order_id);

    /**
     * Audit events for an order, oldest first.
     */
    std::vector<AuditEvent> history(const std::string& order_id);

    /**
     * Insert a pending order whose lines reference active reservations, and
     * link those reservations to it. Used by Checkout.
     */
    Order create_in(Transaction& txn, const std::string& user_id,
                    const std::vector<OrderLine>& lines);

    static std::optional<Order> find_in(Transaction& txn, const std::string& order_id);

private:
    struct Effects {
        std::vector<Reservation> committed;
        std::vector<Reservation> released;
        int64_t restocked_units = 0;
        std::string lost_reservation_id;
        AuditEvent event;
    };

    /**
     * Apply a legal transition on `txn`. Returns false when a reservation
     * could not be committed for `paid`; the caller must roll back.
     */
    bool apply_in(Transaction& txn, Order& order, OrderStatus target, const std::string& actor,
                  const std::optional<std::string>& note, Effects& effects);

    TransitionResult compensate_lost_reservation(const std::string& order_id,
                                                 const std::string& actor,
                                                 const std::string& reservation_id);

    void publish(const Effects& effects);

    std::shared_ptr<Database> db_;
    ReservationManager& reservations_;
    Clock clock_;
    Notifier* notifier_;
};

}  // namespace stockguard
