#pragma once

#include <string>
#include <vector>
#include "errors.hpp"

namespace stockguard {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw InvalidArgumentError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require that a collection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& field_name = "collection") {
    if (collection.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require that at least one of two identifiers is present.
 */
inline void require_any(const std::string& first, const std::string& second,
                        const std::string& message) {
    if (first.empty() && second.empty()) {
        throw InvalidArgumentError(message);
    }
}

} // namespace validation
} // namespace stockguard
