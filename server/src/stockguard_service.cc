#include "stockguard_service.hpp"
#include "stockguard/helpers.hpp"
#include "stockguard/logging.hpp"

namespace stockguard {

namespace {

grpc::Status fault(const char* rpc, const StockguardError& e) {
    if (e.is_consistency_violation() || (!e.is_not_found() && !e.is_invalid_argument())) {
        log_error("server", "rpc_failed", {{"rpc", rpc}, {"error", e.what()}});
    } else {
        log_debug("server", "rpc_rejected", {{"rpc", rpc}, {"error", e.what()}});
    }
    return e.to_grpc_status();
}

v1::WebhookReceipt to_proto(Receipt receipt) {
    switch (receipt) {
        case Receipt::Accepted: return v1::WEBHOOK_ACCEPTED;
        case Receipt::DuplicateIgnored: return v1::WEBHOOK_DUPLICATE_IGNORED;
        case Receipt::InvalidSignature: return v1::WEBHOOK_INVALID_SIGNATURE;
    }
    return v1::WEBHOOK_RECEIPT_UNSPECIFIED;
}

}  // namespace

StockguardService::StockguardService(Catalog& catalog, StockLedger& ledger,
                                     ReservationManager& reservations, OrderStateMachine& orders,
                                     Checkout& checkout, WebhookService& webhooks,
                                     RetryPolicy retry)
    : catalog_(catalog),
      ledger_(ledger),
      reservations_(reservations),
      orders_(orders),
      checkout_(checkout),
      webhooks_(webhooks),
      retry_(retry) {}

// =============================================================================
// Catalog
// =============================================================================

grpc::Status StockguardService::RegisterProduct(grpc::ServerContext* /*context*/,
                                                const v1::RegisterProductRequest* request,
                                                v1::RegisterProductResponse* /*response*/) {
    try {
        with_retry(retry_, "register_product", [&] {
            if (request->variant_id().empty()) {
                catalog_.register_product(request->product_id(), request->physical_stock());
            } else {
                catalog_.register_variant(request->product_id(), request->variant_id(),
                                          request->physical_stock());
            }
        });
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("RegisterProduct", e);
    }
}

grpc::Status StockguardService::Restock(grpc::ServerContext* /*context*/,
                                        const v1::RestockRequest* request,
                                        v1::RestockResponse* response) {
    try {
        auto stock = with_retry(retry_, "restock", [&] {
            return catalog_.restock(request->product_id(),
                                    helpers::optional_string(request->variant_id()),
                                    request->quantity());
        });
        response->set_physical_stock(stock);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("Restock", e);
    }
}

grpc::Status StockguardService::GetAvailableStock(grpc::ServerContext* /*context*/,
                                                  const v1::GetAvailableStockRequest* request,
                                                  v1::GetAvailableStockResponse* response) {
    try {
        auto available = with_retry(retry_, "get_available_stock", [&] {
            return ledger_.available_stock(request->product_id(),
                                           helpers::optional_string(request->variant_id()));
        });
        response->set_available(available);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("GetAvailableStock", e);
    }
}

// =============================================================================
// Checkout and reservations
// =============================================================================

grpc::Status StockguardService::PlaceOrder(grpc::ServerContext* /*context*/,
                                           const v1::PlaceOrderRequest* request,
                                           v1::PlaceOrderResponse* response) {
    try {
        std::vector<OrderLine> lines;
        for (const auto& line : request->lines()) lines.push_back(helpers::from_proto(line));
        Requester requester{request->user_id(), request->session_id()};

        auto result = with_retry(retry_, "place_order",
                                 [&] { return checkout_.place_order(requester, lines); });
        if (result.ok()) {
            *response->mutable_order() = helpers::to_proto(*result.order);
        } else {
            *response->mutable_insufficient_stock() = helpers::to_proto(*result.insufficient);
        }
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("PlaceOrder", e);
    }
}

grpc::Status StockguardService::CreateReservation(grpc::ServerContext* /*context*/,
                                                  const v1::CreateReservationRequest* request,
                                                  v1::CreateReservationResponse* response) {
    try {
        Requester requester{request->user_id(), request->session_id()};
        auto result = with_retry(retry_, "create_reservation", [&] {
            return reservations_.create_reservation(
                request->product_id(), helpers::optional_string(request->variant_id()),
                request->quantity(), requester);
        });
        if (result.ok()) {
            *response->mutable_reservation() = helpers::to_proto(*result.reservation);
        } else {
            *response->mutable_insufficient_stock() = helpers::to_proto(*result.insufficient);
        }
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("CreateReservation", e);
    }
}

grpc::Status StockguardService::CommitReservation(grpc::ServerContext* /*context*/,
                                                  const v1::CommitReservationRequest* request,
                                                  v1::ReservationChangeResponse* response) {
    try {
        bool applied = with_retry(retry_, "commit_reservation", [&] {
            return reservations_.commit_reservation(request->reservation_id(),
                                                    request->order_id());
        });
        response->set_applied(applied);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("CommitReservation", e);
    }
}

grpc::Status StockguardService::ReleaseReservation(grpc::ServerContext* /*context*/,
                                                   const v1::ReleaseReservationRequest* request,
                                                   v1::ReservationChangeResponse* response) {
    try {
        bool applied = with_retry(retry_, "release_reservation", [&] {
            return reservations_.release_reservation(request->reservation_id());
        });
        response->set_applied(applied);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("ReleaseReservation", e);
    }
}

grpc::Status StockguardService::ExtendReservation(grpc::ServerContext* /*context*/,
                                                  const v1::ExtendReservationRequest* request,
                                                  v1::ReservationChangeResponse* response) {
    try {
        bool applied = with_retry(retry_, "extend_reservation", [&] {
            return reservations_.extend_reservation(
                request->reservation_id(), std::chrono::seconds(request->additional_seconds()));
        });
        response->set_applied(applied);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("ExtendReservation", e);
    }
}

// =============================================================================
// Orders
// =============================================================================

grpc::Status StockguardService::TransitionOrder(grpc::ServerContext* /*context*/,
                                                const v1::TransitionOrderRequest* request,
                                                v1::TransitionOrderResponse* response) {
    try {
        OrderStatus target = helpers::from_proto(request->target_status());
        auto result = with_retry(retry_, "transition_order", [&] {
            return orders_.transition(request->order_id(), target, request->actor(),
                                      helpers::optional_string(request->note()));
        });
        if (result.ok()) {
            *response->mutable_order() = helpers::to_proto(*result.order);
        } else {
            *response->mutable_invalid_transition() = helpers::to_proto(*result.rejected);
        }
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("TransitionOrder", e);
    }
}

grpc::Status StockguardService::GetOrder(grpc::ServerContext* /*context*/,
                                         const v1::GetOrderRequest* request,
                                         v1::GetOrderResponse* response) {
    try {
        auto order = with_retry(retry_, "get_order",
                                [&] { return orders_.get_order(request->order_id()); });
        auto history = with_retry(retry_, "order_history",
                                  [&] { return orders_.history(request->order_id()); });
        *response->mutable_order() = helpers::to_proto(order);
        for (const auto& event : history) *response->add_history() = helpers::to_proto(event);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("GetOrder", e);
    }
}

// =============================================================================
// Webhooks
// =============================================================================

grpc::Status StockguardService::ReceiveWebhook(grpc::ServerContext* /*context*/,
                                               const v1::ReceiveWebhookRequest* request,
                                               v1::ReceiveWebhookResponse* response) {
    try {
        auto receipt = with_retry(retry_, "receive_webhook", [&] {
            return webhooks_.receive_event(request->provider(), request->external_event_id(),
                                           request->payload(), request->signature());
        });
        response->set_receipt(to_proto(receipt));
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("ReceiveWebhook", e);
    } catch (const std::exception& e) {
        log_error("server", "rpc_failed", {{"rpc", "ReceiveWebhook"}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status StockguardService::GetWebhookRetryStats(
    grpc::ServerContext* /*context*/, const v1::GetWebhookRetryStatsRequest* /*request*/,
    v1::WebhookRetryStats* response) {
    try {
        auto stats = with_retry(retry_, "get_webhook_retry_stats",
                                [&] { return webhooks_.get_retry_stats(); });
        response->set_pending_retries(stats.pending_retries);
        response->set_failed_webhooks(stats.failed_webhooks);
        response->set_archived_webhooks(stats.archived_webhooks);
        return grpc::Status::OK;
    } catch (const StockguardError& e) {
        return fault("GetWebhookRetryStats", e);
    }
}

}  // namespace stockguard
