#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "database.hpp"
#include "notifier.hpp"
#include "types.hpp"

namespace stockguard {

/**
 * Time-bounded holds on stock.
 *
 * Invariant: for every product/variant, active reservations plus committed
 * deductions never exceed physical stock. Every check-and-write below runs in
 * one immediate transaction, so it holds the database write lock from the
 * availability read to the insert or update.
 *
 * Each public operation is a single attempt. A TransientError means the
 * transaction was rolled back and the call may be retried (see with_retry).
 *
 * Example:
 *   ReservationManager reservations(db, system_clock(), std::chrono::minutes(15));
 *   auto result = reservations.create_reservation("sku-1", std::nullopt, 2, {"user-7", ""});
 *   if (!result.ok()) show_remaining(result.insufficient->available);
 */
class ReservationManager {
public:
    ReservationManager(std::shared_ptr<Database> db, Clock clock, std::chrono::seconds ttl,
                       Notifier* notifier = nullptr);

    /**
     * Hold `quantity` units for the requester until now + TTL.
     *
     * @return the active reservation, or InsufficientStock with what is left
     * @throws InvalidArgumentError for a non-positive quantity or no requester
     * @throws NotFoundError if the product or variant does not exist
     */
    ReservationResult create_reservation(const std::string& product_id,
                                         const std::optional<std::string>& variant_id,
                                         int64_t quantity, const Requester& requester);

    /**
     * Turn an active reservation into a permanent stock deduction for `order_id`.
     *
     * @return false if the reservation is no longer active (late or repeated
     *         confirmation); stock is untouched in that case
     * @throws NotFoundError if the reservation does not exist
     * @throws ConsistencyError if it is linked to another order, or physical
     *         stock cannot cover it
     */
    bool commit_reservation(const std::string& reservation_id, const std::string& order_id);

    /**
     * @return false unless the reservation was active
     */
    bool release_reservation(const std::string& reservation_id);

    /**
     * Move every active reservation with expires_at <= now to expired.
     * @return number of reservations expired
     */
    int64_t expire_stale_reservations(Timestamp now);

    /**
     * Push the expiry of an active reservation forward.
     * @return false unless the reservation was active
     */
    bool extend_reservation(const std::string& reservation_id, std::chrono::seconds additional);

    /**
     * @throws NotFoundError if the reservation does not exist
     */
    Reservation get_reservation(const std::string& reservation_id);

    // Composable forms used by Checkout and the order state machine. They run
    // on the caller's transaction and leave notifications to the caller.

    ReservationResult create_in(Transaction& txn, const std::string& product_id,
                                const std::optional<std::string>& variant_id,
                                int64_t quantity, const Requester& requester);

    /**
     * @return the committed reservation, or nullopt if it was not active
     */
    std::optional<Reservation> commit_in(Transaction& txn, const std::string& reservation_id,
                                         const std::string& order_id);

    /**
     * @return the released reservation, or nullopt if it was not active
     */
    std::optional<Reservation> release_in(Transaction& txn, const std::string& reservation_id);

    static std::optional<Reservation> find_in(Transaction& txn, const std::string& reservation_id);

    /**
     * Link an active reservation to the order being created for it.
     */
    static void link_order_in(Transaction& txn, const std::string& reservation_id,
                              const std::string& order_id);

    std::chrono::seconds ttl() const { return ttl_; }
    Notifier* notifier() const { return notifier_; }

private:
    std::shared_ptr<Database> db_;
    Clock clock_;
    std::chrono::seconds ttl_;
    Notifier* notifier_;
};

}  // namespace stockguard
