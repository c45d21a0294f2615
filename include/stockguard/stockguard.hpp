#pragma once

/**
 * Stockguard: inventory reservation and order fulfillment core.
 *
 * Main include file - includes all public headers.
 */

// Error types and validation
#include "errors.hpp"
#include "validation.hpp"

// Ambient stack
#include "config.hpp"
#include "logging.hpp"
#include "retry.hpp"

// Storage
#include "database.hpp"

// Domain types and wire conversions
#include "types.hpp"
#include "helpers.hpp"

// Components
#include "catalog.hpp"
#include "stock_ledger.hpp"
#include "reservation_manager.hpp"
#include "order_state_machine.hpp"
#include "checkout.hpp"
#include "signature.hpp"
#include "webhook_service.hpp"
#include "notifier.hpp"
#include "scheduler.hpp"
