#include "stockguard/helpers.hpp"
#include "stockguard/errors.hpp"

namespace stockguard {
namespace helpers {

google::protobuf::Timestamp to_proto(Timestamp ts) {
    auto duration = ts.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp proto;
    proto.set_seconds(seconds.count());
    proto.set_nanos(static_cast<int32_t>(nanos.count()));
    return proto;
}

Timestamp from_proto(const google::protobuf::Timestamp& ts) {
    auto duration = std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(duration));
}

v1::ReservationStatus to_proto(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::Active: return v1::RESERVATION_ACTIVE;
        case ReservationStatus::Committed: return v1::RESERVATION_COMMITTED;
        case ReservationStatus::Released: return v1::RESERVATION_RELEASED;
        case ReservationStatus::Expired: return v1::RESERVATION_EXPIRED;
    }
    return v1::RESERVATION_STATUS_UNSPECIFIED;
}

v1::OrderStatus to_proto(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending: return v1::ORDER_PENDING;
        case OrderStatus::Paid: return v1::ORDER_PAID;
        case OrderStatus::Confirmed: return v1::ORDER_CONFIRMED;
        case OrderStatus::Processing: return v1::ORDER_PROCESSING;
        case OrderStatus::Fulfilled: return v1::ORDER_FULFILLED;
        case OrderStatus::Shipped: return v1::ORDER_SHIPPED;
        case OrderStatus::Delivered: return v1::ORDER_DELIVERED;
        case OrderStatus::Cancelled: return v1::ORDER_CANCELLED;
        case OrderStatus::Refunded: return v1::ORDER_REFUNDED;
    }
    return v1::ORDER_STATUS_UNSPECIFIED;
}

OrderStatus from_proto(v1::OrderStatus status) {
    switch (status) {
        case v1::ORDER_PENDING: return OrderStatus::Pending;
        case v1::ORDER_PAID: return OrderStatus::Paid;
        case v1::ORDER_CONFIRMED: return OrderStatus::Confirmed;
        case v1::ORDER_PROCESSING: return OrderStatus::Processing;
        case v1::ORDER_FULFILLED: return OrderStatus::Fulfilled;
        case v1::ORDER_SHIPPED: return OrderStatus::Shipped;
        case v1::ORDER_DELIVERED: return OrderStatus::Delivered;
        case v1::ORDER_CANCELLED: return OrderStatus::Cancelled;
        case v1::ORDER_REFUNDED: return OrderStatus::Refunded;
        default:
            throw InvalidArgumentError("Order status must be specified");
    }
}

v1::Reservation to_proto(const Reservation& reservation) {
    v1::Reservation proto;
    proto.set_id(reservation.id);
    proto.set_product_id(reservation.product_id);
    proto.set_variant_id(reservation.variant_id.value_or(""));
    proto.set_quantity(reservation.quantity);
    proto.set_status(to_proto(reservation.status));
    proto.set_user_id(reservation.user_id.value_or(""));
    proto.set_session_id(reservation.session_id.value_or(""));
    proto.set_order_id(reservation.order_id.value_or(""));
    *proto.mutable_created_at() = to_proto(reservation.created_at);
    *proto.mutable_expires_at() = to_proto(reservation.expires_at);
    if (reservation.closed_at) *proto.mutable_closed_at() = to_proto(*reservation.closed_at);
    return proto;
}

v1::Order to_proto(const Order& order) {
    v1::Order proto;
    proto.set_id(order.id);
    proto.set_user_id(order.user_id);
    proto.set_status(to_proto(order.status));
    for (const auto& line : order.lines) {
        auto* out = proto.add_lines();
        out->set_product_id(line.product_id);
        out->set_variant_id(line.variant_id.value_or(""));
        out->set_quantity(line.quantity);
        out->set_unit_price_cents(line.unit_price_cents);
        out->set_reservation_id(line.reservation_id);
    }
    proto.set_total_cents(order.total_cents);
    *proto.mutable_created_at() = to_proto(order.created_at);
    *proto.mutable_updated_at() = to_proto(order.updated_at);
    if (order.paid_at) *proto.mutable_paid_at() = to_proto(*order.paid_at);
    if (order.confirmed_at) *proto.mutable_confirmed_at() = to_proto(*order.confirmed_at);
    if (order.processing_at) *proto.mutable_processing_at() = to_proto(*order.processing_at);
    if (order.fulfilled_at) *proto.mutable_fulfilled_at() = to_proto(*order.fulfilled_at);
    if (order.shipped_at) *proto.mutable_shipped_at() = to_proto(*order.shipped_at);
    if (order.delivered_at) *proto.mutable_delivered_at() = to_proto(*order.delivered_at);
    if (order.cancelled_at) *proto.mutable_cancelled_at() = to_proto(*order.cancelled_at);
    if (order.refunded_at) *proto.mutable_refunded_at() = to_proto(*order.refunded_at);
    return proto;
}

v1::AuditEvent to_proto(const AuditEvent& event) {
    v1::AuditEvent proto;
    proto.set_order_id(event.order_id);
    proto.set_previous_status(to_proto(event.previous_status));
    proto.set_new_status(to_proto(event.new_status));
    proto.set_actor(event.actor);
    proto.set_note(event.note.value_or(""));
    *proto.mutable_occurred_at() = to_proto(event.occurred_at);
    return proto;
}

v1::InsufficientStock to_proto(const InsufficientStock& insufficient) {
    v1::InsufficientStock proto;
    proto.set_product_id(insufficient.product_id);
    proto.set_variant_id(insufficient.variant_id.value_or(""));
    proto.set_available(insufficient.available);
    proto.set_requested(insufficient.requested);
    return proto;
}

v1::InvalidTransition to_proto(const InvalidTransition& rejected) {
    v1::InvalidTransition proto;
    proto.set_current_status(to_proto(rejected.current));
    proto.set_requested_status(to_proto(rejected.requested));
    for (auto status : rejected.legal_next) {
        proto.add_legal_next_statuses(to_proto(status));
    }
    proto.set_reason(rejected.reason);
    proto.set_kind(rejected.kind == InvalidTransition::Kind::ReservationLost
                       ? v1::InvalidTransition::RESERVATION_LOST
                       : v1::InvalidTransition::ILLEGAL_EDGE);
    return proto;
}

OrderLine from_proto(const v1::OrderLine& line) {
    OrderLine out;
    out.product_id = line.product_id();
    out.variant_id = optional_string(line.variant_id());
    out.quantity = line.quantity();
    out.unit_price_cents = line.unit_price_cents();
    out.reservation_id = line.reservation_id();
    return out;
}

} // namespace helpers
} // namespace stockguard
