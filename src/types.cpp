#include "stockguard/types.hpp"
#include "stockguard/errors.hpp"

#include <random>

namespace stockguard {

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

int64_t to_millis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::string new_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char hex_chars[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(32);
    for (int half = 0; half < 2; half++) {
        uint64_t bits = rng();
        for (int i = 0; i < 16; i++) {
            hex.push_back(hex_chars[bits & 0x0f]);
            bits >>= 4;
        }
    }
    return hex;
}

const char* to_string(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::Active: return "active";
        case ReservationStatus::Committed: return "committed";
        case ReservationStatus::Released: return "released";
        case ReservationStatus::Expired: return "expired";
    }
    return "active";
}

ReservationStatus parse_reservation_status(const std::string& value) {
    if (value == "active") return ReservationStatus::Active;
    if (value == "committed") return ReservationStatus::Committed;
    if (value == "released") return ReservationStatus::Released;
    if (value == "expired") return ReservationStatus::Expired;
    throw StorageError("Unknown reservation status: " + value, 0);
}

const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending: return "pending";
        case OrderStatus::Paid: return "paid";
        case OrderStatus::Confirmed: return "confirmed";
        case OrderStatus::Processing: return "processing";
        case OrderStatus::Fulfilled: return "fulfilled";
        case OrderStatus::Shipped: return "shipped";
        case OrderStatus::Delivered: return "delivered";
        case OrderStatus::Cancelled: return "cancelled";
        case OrderStatus::Refunded: return "refunded";
    }
    return "pending";
}

OrderStatus parse_order_status(const std::string& value) {
    for (auto status : kAllOrderStatuses) {
        if (value == to_string(status)) return status;
    }
    throw InvalidArgumentError("Invalid order status: " + value);
}

std::optional<Timestamp> Order::timestamp_for(OrderStatus s) const {
    switch (s) {
        case OrderStatus::Pending: return created_at;
        case OrderStatus::Paid: return paid_at;
        case OrderStatus::Confirmed: return confirmed_at;
        case OrderStatus::Processing: return processing_at;
        case OrderStatus::Fulfilled: return fulfilled_at;
        case OrderStatus::Shipped: return shipped_at;
        case OrderStatus::Delivered: return delivered_at;
        case OrderStatus::Cancelled: return cancelled_at;
        case OrderStatus::Refunded: return refunded_at;
    }
    return std::nullopt;
}

}  // namespace stockguard
