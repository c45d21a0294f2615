#pragma once

#include <google/protobuf/timestamp.pb.h>
#include "stockguard/types.pb.h"
#include "types.hpp"

namespace stockguard {

/**
 * Conversions between the core's domain types and their wire messages.
 */
namespace helpers {

google::protobuf::Timestamp to_proto(Timestamp ts);
Timestamp from_proto(const google::protobuf::Timestamp& ts);

v1::ReservationStatus to_proto(ReservationStatus status);
v1::OrderStatus to_proto(OrderStatus status);

/**
 * Throws InvalidArgumentError for ORDER_STATUS_UNSPECIFIED or unknown values.
 */
OrderStatus from_proto(v1::OrderStatus status);

v1::Reservation to_proto(const Reservation& reservation);
v1::Order to_proto(const Order& order);
v1::AuditEvent to_proto(const AuditEvent& event);
v1::InsufficientStock to_proto(const InsufficientStock& insufficient);
v1::InvalidTransition to_proto(const InvalidTransition& rejected);

OrderLine from_proto(const v1::OrderLine& line);

/**
 * Empty proto strings mean "absent".
 */
inline std::optional<std::string> optional_string(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace helpers
} // namespace stockguard
