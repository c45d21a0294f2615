#include "stockguard/reservation_manager.hpp"

#include <algorithm>

#include "stockguard/catalog.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/helpers.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/stock_ledger.hpp"
#include "stockguard/validation.hpp"

namespace stockguard {

namespace {

constexpr const char* kSelectReservation =
    "SELECT id, product_id, variant_id, quantity, status, user_id, session_id, order_id, "
    "created_at, expires_at, closed_at FROM reservations WHERE id = ?";

Reservation read_reservation(const Statement& row) {
    Reservation r;
    r.id = row.column_text(0);
    r.product_id = row.column_text(1);
    r.variant_id = row.column_optional_text(2);
    r.quantity = row.column_int(3);
    r.status = parse_reservation_status(row.column_text(4));
    r.user_id = row.column_optional_text(5);
    r.session_id = row.column_optional_text(6);
    r.order_id = row.column_optional_text(7);
    r.created_at = from_millis(row.column_int(8));
    r.expires_at = from_millis(row.column_int(9));
    if (auto closed = row.column_optional_int(10)) r.closed_at = from_millis(*closed);
    return r;
}

bool exists_in(Transaction& txn, const std::string& reservation_id) {
    auto stmt = txn.prepare("SELECT 1 FROM reservations WHERE id = ?");
    stmt.bind(1, reservation_id);
    return stmt.step();
}

}  // namespace

ReservationManager::ReservationManager(std::shared_ptr<Database> db, Clock clock,
                                       std::chrono::seconds ttl, Notifier* notifier)
    : db_(std::move(db)), clock_(std::move(clock)), ttl_(ttl), notifier_(notifier) {}

// =============================================================================
// Public operations
// =============================================================================

ReservationResult ReservationManager::create_reservation(
    const std::string& product_id, const std::optional<std::string>& variant_id,
    int64_t quantity, const Requester& requester) {
    auto txn = db_->begin(Transaction::Mode::Immediate);
    auto result = create_in(*txn, product_id, variant_id, quantity, requester);
    if (!result.ok()) {
        txn->rollback();
        log_info("reservations", "insufficient_stock",
                 {{"product_id", product_id}, {"variant_id", variant_id.value_or("")},
                  {"requested", quantity}, {"available", result.insufficient->available}});
        return result;
    }
    txn->commit();

    log_info("reservations", "reservation_created",
             {{"reservation_id", result.reservation->id}, {"product_id", product_id},
              {"variant_id", variant_id.value_or("")}, {"quantity", quantity},
              {"expires_at_ms", to_millis(result.reservation->expires_at)}});
    return result;
}

bool ReservationManager::commit_reservation(const std::string& reservation_id,
                                            const std::string& order_id) {
    auto txn = db_->begin(Transaction::Mode::Immediate);
    auto committed = commit_in(*txn, reservation_id, order_id);
    if (!committed) return false;
    txn->commit();

    v1::ReservationCommitted notification;
    notification.set_reservation_id(committed->id);
    notification.set_order_id(order_id);
    notification.set_product_id(committed->product_id);
    notification.set_variant_id(committed->variant_id.value_or(""));
    notification.set_quantity(committed->quantity);
    notify(notifier_, notification);
    return true;
}

bool ReservationManager::release_reservation(const std::string& reservation_id) {
    auto txn = db_->begin(Transaction::Mode::Immediate);
    auto released = release_in(*txn, reservation_id);
    if (!released) return false;
    txn->commit();

    v1::ReservationReleased notification;
    notification.set_reservation_id(released->id);
    notification.set_order_id(released->order_id.value_or(""));
    notification.set_quantity(released->quantity);
    notify(notifier_, notification);
    return true;
}

int64_t ReservationManager::expire_stale_reservations(Timestamp now) {
    auto txn = db_->begin(Transaction::Mode::Immediate);
    txn->prepare("UPDATE reservations SET status = 'expired', closed_at = ? "
                 "WHERE status = 'active' AND expires_at <= ?")
        .bind(1, to_millis(now))
        .bind(2, to_millis(now))
        .run();
    int64_t expired = txn->changes();
    txn->commit();

    if (expired > 0) {
        log_info("reservations", "reservations_expired", {{"count", expired}});
        v1::ReservationsExpired notification;
        notification.set_count(expired);
        *notification.mutable_swept_at() = helpers::to_proto(now);
        notify(notifier_, notification);
    }
    return expired;
}

bool ReservationManager::extend_reservation(const std::string& reservation_id,
                                            std::chrono::seconds additional) {
    validation::require_positive(additional.count(), "additional");

    auto txn = db_->begin(Transaction::Mode::Immediate);
    txn->prepare("UPDATE reservations SET expires_at = expires_at + ? "
                 "WHERE id = ? AND status = 'active'")
        .bind(1, static_cast<int64_t>(
                     std::chrono::duration_cast<std::chrono::milliseconds>(additional).count()))
        .bind(2, reservation_id)
        .run();
    if (txn->changes() == 0) {
        if (!exists_in(*txn, reservation_id)) {
            throw NotFoundError("Reservation not found: " + reservation_id);
        }
        return false;
    }
    txn->commit();

    log_info("reservations", "reservation_extended",
             {{"reservation_id", reservation_id}, {"additional_seconds", additional.count()}});
    return true;
}

Reservation ReservationManager::get_reservation(const std::string& reservation_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    auto reservation = find_in(*txn, reservation_id);
    txn->commit();
    if (!reservation) throw NotFoundError("Reservation not found: " + reservation_id);
    return *reservation;
}

// =============================================================================
// Composable forms
// =============================================================================

ReservationResult ReservationManager::create_in(Transaction& txn, const std::string& product_id,
                                                const std::optional<std::string>& variant_id,
                                                int64_t quantity, const Requester& requester) {
    validation::require_not_empty(product_id, "product_id");
    validation::require_positive(quantity, "quantity");
    validation::require_any(requester.user_id, requester.session_id,
                            "User ID or session ID required");

    ReservationResult result;
    auto level = StockLedger::level_in(txn, product_id, variant_id);
    if (level.available() < quantity) {
        result.insufficient = InsufficientStock{product_id, variant_id,
                                                std::max<int64_t>(0, level.available()),
                                                quantity};
        return result;
    }

    Reservation r;
    r.id = new_id();
    r.product_id = product_id;
    r.variant_id = variant_id;
    r.quantity = quantity;
    r.status = ReservationStatus::Active;
    r.user_id = helpers::optional_string(requester.user_id);
    r.session_id = helpers::optional_string(requester.session_id);
    r.created_at = clock_();
    r.expires_at = r.created_at + ttl_;

    txn.prepare("INSERT INTO reservations (id, product_id, variant_id, quantity, status, "
                "user_id, session_id, created_at, expires_at) "
                "VALUES (?, ?, ?, ?, 'active', ?, ?, ?, ?)")
        .bind(1, r.id)
        .bind(2, r.product_id)
        .bind_optional(3, r.variant_id)
        .bind(4, r.quantity)
        .bind_optional(5, r.user_id)
        .bind_optional(6, r.session_id)
        .bind(7, to_millis(r.created_at))
        .bind(8, to_millis(r.expires_at))
        .run();

    result.reservation = std::move(r);
    return result;
}

std::optional<Reservation> ReservationManager::commit_in(Transaction& txn,
                                                         const std::string& reservation_id,
                                                         const std::string& order_id) {
    validation::require_not_empty(order_id, "order_id");

    auto reservation = find_in(txn, reservation_id);
    if (!reservation) throw NotFoundError("Reservation not found: " + reservation_id);

    if (!reservation->is_active()) {
        log_info("reservations", "commit_skipped",
                 {{"reservation_id", reservation_id}, {"order_id", order_id},
                  {"status", to_string(reservation->status)}});
        return std::nullopt;
    }

    if (reservation->order_id && *reservation->order_id != order_id) {
        log_error("reservations", "commit_order_mismatch",
                  {{"reservation_id", reservation_id}, {"order_id", order_id},
                   {"linked_order_id", *reservation->order_id}});
        throw ConsistencyError("Reservation " + reservation_id + " is linked to order " +
                               *reservation->order_id + ", not " + order_id);
    }

    if (!Catalog::adjust_in(txn, reservation->product_id, reservation->variant_id,
                            -reservation->quantity)) {
        log_error("reservations", "commit_exceeds_physical_stock",
                  {{"reservation_id", reservation_id}, {"product_id", reservation->product_id},
                   {"variant_id", reservation->variant_id.value_or("")},
                   {"quantity", reservation->quantity}});
        throw ConsistencyError("Physical stock cannot cover reservation " + reservation_id);
    }

    Timestamp now = clock_();
    txn.prepare("UPDATE reservations SET status = 'committed', order_id = ?, closed_at = ? "
                "WHERE id = ? AND status = 'active'")
        .bind(1, order_id)
        .bind(2, to_millis(now))
        .bind(3, reservation_id)
        .run();

    reservation->status = ReservationStatus::Committed;
    reservation->order_id = order_id;
    reservation->closed_at = now;

    log_info("reservations", "reservation_committed",
             {{"reservation_id", reservation_id}, {"order_id", order_id},
              {"quantity", reservation->quantity}});
    return reservation;
}

std::optional<Reservation> ReservationManager::release_in(Transaction& txn,
                                                          const std::string& reservation_id) {
    auto reservation = find_in(txn, reservation_id);
    if (!reservation) throw NotFoundError("Reservation not found: " + reservation_id);
    if (!reservation->is_active()) return std::nullopt;

    Timestamp now = clock_();
    txn.prepare("UPDATE reservations SET status = 'released', closed_at = ? "
                "WHERE id = ? AND status = 'active'")
        .bind(1, to_millis(now))
        .bind(2, reservation_id)
        .run();

    reservation->status = ReservationStatus::Released;
    reservation->closed_at = now;

    log_info("reservations", "reservation_released",
             {{"reservation_id", reservation_id}, {"quantity", reservation->quantity}});
    return reservation;
}

std::optional<Reservation> ReservationManager::find_in(Transaction& txn,
                                                       const std::string& reservation_id) {
    auto stmt = txn.prepare(kSelectReservation);
    stmt.bind(1, reservation_id);
    if (!stmt.step()) return std::nullopt;
    return read_reservation(stmt);
}

void ReservationManager::link_order_in(Transaction& txn, const std::string& reservation_id,
                                       const std::string& order_id) {
    txn.prepare("UPDATE reservations SET order_id = ? WHERE id = ? AND status = 'active'")
        .bind(1, order_id)
        .bind(2, reservation_id)
        .run();
    if (txn.changes() != 1) {
        throw ConsistencyError("Reservation " + reservation_id + " is not active");
    }
}

}  // namespace stockguard
