#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "database.hpp"
#include "order_state_machine.hpp"
#include "reservation_manager.hpp"
#include "types.hpp"

namespace stockguard {

struct CheckoutResult {
    std::optional<Order> order;
    std::optional<InsufficientStock> insufficient;

    bool ok() const { return order.has_value(); }
};

/**
 * Turns a cart into a pending order.
 *
 * Every line is reserved and the order inserted in one immediate
 * transaction: either all lines are held and the order exists, or
 * nothing was written.
 */
class Checkout {
public:
    Checkout(std::shared_ptr<Database> db, ReservationManager& reservations,
             OrderStateMachine& orders);

    /**
     * Reserve every line for the requester and create the order.
     *
     * The reservation_id of each input line is ignored; it is filled from the
     * reservation created for that line.
     *
     * @return the pending order, or InsufficientStock for the first line
     *         that could not be held
     * @throws InvalidArgumentError if user_id is empty or there are no lines
     * @throws NotFoundError if a product or variant does not exist
     */
    CheckoutResult place_order(const Requester& requester, std::vector<OrderLine> lines);

private:
    std::shared_ptr<Database> db_;
    ReservationManager& reservations_;
    OrderStateMachine& orders_;
};

}  // namespace stockguard
