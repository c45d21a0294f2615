#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stockguard {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Source of "now". Injected everywhere time matters so sweeps and TTLs
 * can be driven deterministically.
 */
using Clock = std::function<Timestamp()>;

Clock system_clock();

int64_t to_millis(Timestamp ts);
Timestamp from_millis(int64_t millis);

/**
 * Random 128-bit identifier as 32 lowercase hex characters.
 */
std::string new_id();

// =============================================================================
// Reservations
// =============================================================================

enum class ReservationStatus { Active, Committed, Released, Expired };

const char* to_string(ReservationStatus status);
ReservationStatus parse_reservation_status(const std::string& value);

struct Reservation {
    std::string id;
    std::string product_id;
    std::optional<std::string> variant_id;
    int64_t quantity = 0;
    ReservationStatus status = ReservationStatus::Active;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::optional<std::string> order_id;
    Timestamp created_at;
    Timestamp expires_at;
    std::optional<Timestamp> closed_at;

    bool is_active() const { return status == ReservationStatus::Active; }
};

/**
 * Who holds a reservation: a signed-in user, an anonymous session, or both.
 */
struct Requester {
    std::string user_id;
    std::string session_id;
};

/**
 * Expected outcome when a hold cannot be granted. Not an error: the shopper
 * lost the race for the last units.
 */
struct InsufficientStock {
    std::string product_id;
    std::optional<std::string> variant_id;
    int64_t available = 0;
    int64_t requested = 0;
};

struct ReservationResult {
    std::optional<Reservation> reservation;
    std::optional<InsufficientStock> insufficient;

    bool ok() const { return reservation.has_value(); }
};

// =============================================================================
// Orders
// =============================================================================

enum class OrderStatus {
    Pending,
    Paid,
    Confirmed,
    Processing,
    Fulfilled,
    Shipped,
    Delivered,
    Cancelled,
    Refunded
};

constexpr OrderStatus kAllOrderStatuses[] = {
    OrderStatus::Pending,   OrderStatus::Paid,    OrderStatus::Confirmed,
    OrderStatus::Processing, OrderStatus::Fulfilled, OrderStatus::Shipped,
    OrderStatus::Delivered, OrderStatus::Cancelled, OrderStatus::Refunded,
};

const char* to_string(OrderStatus status);

/**
 * Parse a lowercase status name. Throws InvalidArgumentError for unknown names.
 */
OrderStatus parse_order_status(const std::string& value);

struct OrderLine {
    std::string product_id;
    std::optional<std::string> variant_id;
    int64_t quantity = 0;
    int64_t unit_price_cents = 0;
    std::string reservation_id;
};

struct Order {
    std::string id;
    std::string user_id;
    OrderStatus status = OrderStatus::Pending;
    std::vector<OrderLine> lines;
    int64_t total_cents = 0;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> paid_at;
    std::optional<Timestamp> confirmed_at;
    std::optional<Timestamp> processing_at;
    std::optional<Timestamp> fulfilled_at;
    std::optional<Timestamp> shipped_at;
    std::optional<Timestamp> delivered_at;
    std::optional<Timestamp> cancelled_at;
    std::optional<Timestamp> refunded_at;

    /**
     * The timestamp stamped when the order entered `status`. Pending has
     * none of its own; created_at plays that role.
     */
    std::optional<Timestamp> timestamp_for(OrderStatus status) const;
};

/**
 * One immutable row of an order's status history.
 */
struct AuditEvent {
    std::string order_id;
    OrderStatus previous_status = OrderStatus::Pending;
    OrderStatus new_status = OrderStatus::Pending;
    std::string actor;
    std::optional<std::string> note;
    Timestamp occurred_at;
};

/**
 * Rejected transition, surfaced to operators together with what they may do next.
 */
struct InvalidTransition {
    enum class Kind {
        // Target not reachable from the current status.
        IllegalEdge,
        // Payment arrived but a backing reservation was no longer active.
        ReservationLost
    };

    Kind kind = Kind::IllegalEdge;
    OrderStatus current = OrderStatus::Pending;
    OrderStatus requested = OrderStatus::Pending;
    std::vector<OrderStatus> legal_next;
    std::string reason;
};

struct TransitionResult {
    std::optional<Order> order;
    std::optional<InvalidTransition> rejected;

    bool ok() const { return order.has_value(); }
};

}  // namespace stockguard
