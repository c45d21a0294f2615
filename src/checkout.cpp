#include "stockguard/checkout.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/validation.hpp"

namespace stockguard {

Checkout::Checkout(std::shared_ptr<Database> db, ReservationManager& reservations,
                   OrderStateMachine& orders)
    : db_(std::move(db)), reservations_(reservations), orders_(orders) {}

CheckoutResult Checkout::place_order(const Requester& requester, std::vector<OrderLine> lines) {
    validation::require_not_empty(requester.user_id, "user_id");
    validation::require_not_empty(lines, "lines");

    CheckoutResult result;
    auto txn = db_->begin(Transaction::Mode::Immediate);

    for (auto& line : lines) {
        auto reserved = reservations_.create_in(*txn, line.product_id, line.variant_id,
                                                line.quantity, requester);
        if (!reserved.ok()) {
            txn->rollback();
            log_info("checkout", "checkout_insufficient_stock",
                     {{"user_id", requester.user_id}, {"product_id", line.product_id},
                      {"variant_id", line.variant_id.value_or("")},
                      {"requested", line.quantity},
                      {"available", reserved.insufficient->available}});
            result.insufficient = std::move(reserved.insufficient);
            return result;
        }
        line.reservation_id = reserved.reservation->id;
    }

    result.order = orders_.create_in(*txn, requester.user_id, lines);
    txn->commit();

    log_info("checkout", "order_placed",
             {{"order_id", result.order->id}, {"user_id", requester.user_id},
              {"total_cents", result.order->total_cents}});
    return result;
}

}  // namespace stockguard
