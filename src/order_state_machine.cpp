#include "stockguard/order_state_machine.hpp"

#include <map>

#include "stockguard/catalog.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/helpers.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/validation.hpp"

namespace stockguard {

namespace {

const std::map<OrderStatus, std::vector<OrderStatus>>& transition_table() {
    static const std::map<OrderStatus, std::vector<OrderStatus>> table = {
        {OrderStatus::Pending, {OrderStatus::Paid, OrderStatus::Cancelled}},
        {OrderStatus::Paid, {OrderStatus::Confirmed, OrderStatus::Cancelled, OrderStatus::Refunded}},
        {OrderStatus::Confirmed, {OrderStatus::Processing, OrderStatus::Cancelled}},
        {OrderStatus::Processing, {OrderStatus::Fulfilled, OrderStatus::Cancelled}},
        {OrderStatus::Fulfilled, {OrderStatus::Shipped, OrderStatus::Cancelled}},
        {OrderStatus::Shipped, {OrderStatus::Delivered, OrderStatus::Cancelled}},
        {OrderStatus::Delivered, {OrderStatus::Refunded}},
        {OrderStatus::Cancelled, {}},
        {OrderStatus::Refunded, {}},
    };
    return table;
}

// Committed units go back to stock only while the goods are still in the warehouse.
bool restores_stock(OrderStatus from, OrderStatus to) {
    if (to == OrderStatus::Cancelled) {
        return from == OrderStatus::Pending || from == OrderStatus::Paid ||
               from == OrderStatus::Confirmed || from == OrderStatus::Processing;
    }
    if (to == OrderStatus::Refunded) return from == OrderStatus::Paid;
    return false;
}

std::optional<Timestamp>& timestamp_slot(Order& order, OrderStatus status) {
    switch (status) {
        case OrderStatus::Paid: return order.paid_at;
        case OrderStatus::Confirmed: return order.confirmed_at;
        case OrderStatus::Processing: return order.processing_at;
        case OrderStatus::Fulfilled: return order.fulfilled_at;
        case OrderStatus::Shipped: return order.shipped_at;
        case OrderStatus::Delivered: return order.delivered_at;
        case OrderStatus::Cancelled: return order.cancelled_at;
        case OrderStatus::Refunded: return order.refunded_at;
        case OrderStatus::Pending: break;
    }
    throw InvalidArgumentError("No timestamp column for status pending");
}

std::optional<Timestamp> optional_time(const Statement& row, int column) {
    if (auto millis = row.column_optional_int(column)) return from_millis(*millis);
    return std::nullopt;
}

}  // namespace

OrderStateMachine::OrderStateMachine(std::shared_ptr<Database> db,
                                     ReservationManager& reservations, Clock clock,
                                     Notifier* notifier)
    : db_(std::move(db)),
      reservations_(reservations),
      clock_(std::move(clock)),
      notifier_(notifier) {}

const std::vector<OrderStatus>& OrderStateMachine::legal_next(OrderStatus from) {
    return transition_table().at(from);
}

bool OrderStateMachine::is_legal(OrderStatus from, OrderStatus to) {
    for (auto next : legal_next(from)) {
        if (next == to) return true;
    }
    return false;
}

bool OrderStateMachine::is_terminal(OrderStatus status) {
    return legal_next(status).empty();
}

// =============================================================================
// Transitions
// =============================================================================

TransitionResult OrderStateMachine::transition(const std::string& order_id, OrderStatus target,
                                               const std::string& actor,
                                               const std::optional<std::string>& note) {
    validation::require_not_empty(order_id, "order_id");
    validation::require_not_empty(actor, "actor");

    TransitionResult result;
    auto txn = db_->begin(Transaction::Mode::Immediate);
    auto order = find_in(*txn, order_id);
    if (!order) throw NotFoundError("Order not found: " + order_id);

    if (order->status == target) {
        txn->commit();
        result.order = std::move(order);
        return result;
    }

    if (!is_legal(order->status, target)) {
        txn->rollback();
        InvalidTransition rejected;
        rejected.kind = InvalidTransition::Kind::IllegalEdge;
        rejected.current = order->status;
        rejected.requested = target;
        rejected.legal_next = legal_next(order->status);
        rejected.reason = std::string("Cannot move order from ") + to_string(order->status) +
                          " to " + to_string(target);
        log_info("orders", "transition_rejected",
                 {{"order_id", order_id}, {"from", to_string(order->status)},
                  {"to", to_string(target)}, {"actor", actor}});
        result.rejected = std::move(rejected);
        return result;
    }

    Effects effects;
    if (!apply_in(*txn, *order, target, actor, note, effects)) {
        txn->rollback();
        return compensate_lost_reservation(order_id, actor, effects.lost_reservation_id);
    }
    txn->commit();

    log_info("orders", "order_transitioned",
             {{"order_id", order_id}, {"from", to_string(effects.event.previous_status)},
              {"to", to_string(target)}, {"actor", actor},
              {"restocked_units", effects.restocked_units}});
    publish(effects);

    result.order = std::move(order);
    return result;
}

bool OrderStateMachine::apply_in(Transaction& txn, Order& order, OrderStatus target,
                                 const std::string& actor,
                                 const std::optional<std::string>& note, Effects& effects) {
    const OrderStatus previous = order.status;

    if (target == OrderStatus::Paid) {
        for (const auto& line : order.lines) {
            auto reservation = ReservationManager::find_in(txn, line.reservation_id);
            if (!reservation) {
                throw ConsistencyError("Order " + order.id + " references missing reservation " +
                                       line.reservation_id);
            }
            // A payment handler may already have committed it for this order.
            if (reservation->status == ReservationStatus::Committed &&
                reservation->order_id == order.id) {
                continue;
            }
            auto committed = reservations_.commit_in(txn, line.reservation_id, order.id);
            if (!committed) {
                effects.lost_reservation_id = line.reservation_id;
                return false;
            }
            effects.committed.push_back(std::move(*committed));
        }
    }

    if (target == OrderStatus::Cancelled) {
        for (const auto& line : order.lines) {
            if (auto released = reservations_.release_in(txn, line.reservation_id)) {
                effects.released.push_back(std::move(*released));
            }
        }
    }

    if (restores_stock(previous, target)) {
        for (const auto& line : order.lines) {
            auto reservation = ReservationManager::find_in(txn, line.reservation_id);
            if (!reservation || reservation->status != ReservationStatus::Committed ||
                reservation->order_id != order.id) {
                continue;
            }
            if (!Catalog::adjust_in(txn, reservation->product_id, reservation->variant_id,
                                    reservation->quantity)) {
                throw ConsistencyError("Cannot restore stock for reservation " + reservation->id);
            }
            effects.restocked_units += reservation->quantity;
        }
    }

    Timestamp now = clock_();
    const std::string column = std::string(to_string(target)) + "_at";
    txn.prepare("UPDATE orders SET status = ?, updated_at = ?, " + column +
                " = ? WHERE id = ? AND status = ?")
        .bind(1, std::string(to_string(target)))
        .bind(2, to_millis(now))
        .bind(3, to_millis(now))
        .bind(4, order.id)
        .bind(5, std::string(to_string(previous)))
        .run();
    if (txn.changes() != 1) {
        throw ConsistencyError("Order " + order.id + " changed status during transition");
    }

    AuditEvent& event = effects.event;
    event.order_id = order.id;
    event.previous_status = previous;
    event.new_status = target;
    event.actor = actor;
    event.note = note;
    event.occurred_at = now;

    txn.prepare("INSERT INTO order_events (order_id, previous_status, new_status, actor, note, "
                "occurred_at) VALUES (?, ?, ?, ?, ?, ?)")
        .bind(1, event.order_id)
        .bind(2, std::string(to_string(previous)))
        .bind(3, std::string(to_string(target)))
        .bind(4, actor)
        .bind_optional(5, note)
        .bind(6, to_millis(now))
        .run();

    order.status = target;
    order.updated_at = now;
    timestamp_slot(order, target) = now;
    return true;
}

TransitionResult OrderStateMachine::compensate_lost_reservation(
    const std::string& order_id, const std::string& actor, const std::string& reservation_id) {
    const std::string reason = "Payment captured without secured stock: reservation " +
                               reservation_id + " is no longer active";
    log_warn("orders", "payment_without_reservation",
             {{"order_id", order_id}, {"reservation_id", reservation_id}, {"actor", actor}});

    auto txn = db_->begin(Transaction::Mode::Immediate);
    auto order = find_in(*txn, order_id);
    if (!order) throw NotFoundError("Order not found: " + order_id);

    const OrderStatus requested_from = order->status;
    Effects effects;
    bool cancelled = false;
    if (is_legal(order->status, OrderStatus::Cancelled)) {
        cancelled = apply_in(*txn, *order, OrderStatus::Cancelled, actor, reason, effects);
    }
    txn->commit();

    if (cancelled) publish(effects);

    v1::PaymentCompensationRequired compensation;
    compensation.set_order_id(order_id);
    compensation.set_reason(reason);
    compensation.set_total_cents(order->total_cents);
    notify(notifier_, compensation);

    InvalidTransition rejected;
    rejected.kind = InvalidTransition::Kind::ReservationLost;
    rejected.current = order->status;
    rejected.requested = OrderStatus::Paid;
    rejected.legal_next = legal_next(order->status);
    rejected.reason = reason;

    log_info("orders", "payment_compensation_required",
             {{"order_id", order_id}, {"from", to_string(requested_from)},
              {"status", to_string(order->status)}, {"total_cents", order->total_cents}});

    TransitionResult result;
    result.rejected = std::move(rejected);
    return result;
}

void OrderStateMachine::publish(const Effects& effects) {
    for (const auto& r : effects.committed) {
        v1::ReservationCommitted notification;
        notification.set_reservation_id(r.id);
        notification.set_order_id(r.order_id.value_or(""));
        notification.set_product_id(r.product_id);
        notification.set_variant_id(r.variant_id.value_or(""));
        notification.set_quantity(r.quantity);
        notify(notifier_, notification);
    }
    for (const auto& r : effects.released) {
        v1::ReservationReleased notification;
        notification.set_reservation_id(r.id);
        notification.set_order_id(r.order_id.value_or(""));
        notification.set_quantity(r.quantity);
        notify(notifier_, notification);
    }

    v1::OrderStatusChanged changed;
    *changed.mutable_event() = helpers::to_proto(effects.event);
    changed.set_restocked_units(effects.restocked_units);
    notify(notifier_, changed);
}

// =============================================================================
// Reads and creation
// =============================================================================

Order OrderStateMachine::get_order(const std::string& order_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    auto order = find_in(*txn, order_id);
    txn->commit();
    if (!order) throw NotFoundError("Order not found: " + order_id);
    return *order;
}

std::vector<AuditEvent> OrderStateMachine::history(const std::string& order_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    if (!find_in(*txn, order_id)) throw NotFoundError("Order not found: " + order_id);

    std::vector<AuditEvent> events;
    {
        auto stmt = txn->prepare(
            "SELECT previous_status, new_status, actor, note, occurred_at FROM order_events "
            "WHERE order_id = ? ORDER BY id");
        stmt.bind(1, order_id);
        while (stmt.step()) {
            AuditEvent event;
            event.order_id = order_id;
            event.previous_status = parse_order_status(stmt.column_text(0));
            event.new_status = parse_order_status(stmt.column_text(1));
            event.actor = stmt.column_text(2);
            event.note = stmt.column_optional_text(3);
            event.occurred_at = from_millis(stmt.column_int(4));
            events.push_back(std::move(event));
        }
    }
    txn->commit();
    return events;
}

Order OrderStateMachine::create_in(Transaction& txn, const std::string& user_id,
                                   const std::vector<OrderLine>& lines) {
    validation::require_not_empty(user_id, "user_id");
    validation::require_not_empty(lines, "lines");

    Order order;
    order.id = new_id();
    order.user_id = user_id;
    order.status = OrderStatus::Pending;
    order.lines = lines;
    order.created_at = clock_();
    order.updated_at = order.created_at;
    for (const auto& line : lines) {
        validation::require_not_empty(line.reservation_id, "reservation_id");
        validation::require_positive(line.quantity, "quantity");
        validation::require_non_negative(line.unit_price_cents, "unit_price_cents");
        order.total_cents += line.quantity * line.unit_price_cents;
    }

    txn.prepare("INSERT INTO orders (id, user_id, status, total_cents, created_at, updated_at) "
                "VALUES (?, ?, 'pending', ?, ?, ?)")
        .bind(1, order.id)
        .bind(2, user_id)
        .bind(3, order.total_cents)
        .bind(4, to_millis(order.created_at))
        .bind(5, to_millis(order.updated_at))
        .run();

    int64_t line_no = 0;
    for (const auto& line : lines) {
        txn.prepare("INSERT INTO order_lines (order_id, line_no, product_id, variant_id, "
                    "quantity, unit_price_cents, reservation_id) VALUES (?, ?, ?, ?, ?, ?, ?)")
            .bind(1, order.id)
            .bind(2, line_no++)
            .bind(3, line.product_id)
            .bind_optional(4, line.variant_id)
            .bind(5, line.quantity)
            .bind(6, line.unit_price_cents)
            .bind(7, line.reservation_id)
            .run();
        ReservationManager::link_order_in(txn, line.reservation_id, order.id);
    }

    log_info("orders", "order_created",
             {{"order_id", order.id}, {"user_id", user_id},
              {"lines", static_cast<int64_t>(lines.size())}, {"total_cents", order.total_cents}});
    return order;
}

std::optional<Order> OrderStateMachine::find_in(Transaction& txn, const std::string& order_id) {
    auto stmt = txn.prepare(
        "SELECT id, user_id, status, total_cents, created_at, updated_at, paid_at, confirmed_at, "
        "processing_at, fulfilled_at, shipped_at, delivered_at, cancelled_at, refunded_at "
        "FROM orders WHERE id = ?");
    stmt.bind(1, order_id);
    if (!stmt.step()) return std::nullopt;

    Order order;
    order.id = stmt.column_text(0);
    order.user_id = stmt.column_text(1);
    order.status = parse_order_status(stmt.column_text(2));
    order.total_cents = stmt.column_int(3);
    order.created_at = from_millis(stmt.column_int(4));
    order.updated_at = from_millis(stmt.column_int(5));
    order.paid_at = optional_time(stmt, 6);
    order.confirmed_at = optional_time(stmt, 7);
    order.processing_at = optional_time(stmt, 8);
    order.fulfilled_at = optional_time(stmt, 9);
    order.shipped_at = optional_time(stmt, 10);
    order.delivered_at = optional_time(stmt, 11);
    order.cancelled_at = optional_time(stmt, 12);
    order.refunded_at = optional_time(stmt, 13);

    auto lines = txn.prepare(
        "SELECT product_id, variant_id, quantity, unit_price_cents, reservation_id "
        "FROM order_lines WHERE order_id = ? ORDER BY line_no");
    lines.bind(1, order_id);
    while (lines.step()) {
        OrderLine line;
        line.product_id = lines.column_text(0);
        line.variant_id = lines.column_optional_text(1);
        line.quantity = lines.column_int(2);
        line.unit_price_cents = lines.column_int(3);
        line.reservation_id = lines.column_text(4);
        order.lines.push_back(std::move(line));
    }
    return order;
}

}  // namespace stockguard
