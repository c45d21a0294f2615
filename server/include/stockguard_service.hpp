#pragma once

#include <grpcpp/grpcpp.h>
#include "stockguard/service.grpc.pb.h"
#include "stockguard/catalog.hpp"
#include "stockguard/checkout.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/order_state_machine.hpp"
#include "stockguard/reservation_manager.hpp"
#include "stockguard/retry.hpp"
#include "stockguard/stock_ledger.hpp"
#include "stockguard/webhook_service.hpp"

namespace stockguard {

/**
 * gRPC front end. Translates requests into core calls; business outcomes go
 * back in the response, faults become a status via to_grpc_status().
 * Transient datastore failures are retried with `retry` before surfacing as
 * UNAVAILABLE.
 */
class StockguardService final : public v1::Stockguard::Service {
public:
    StockguardService(Catalog& catalog, StockLedger& ledger, ReservationManager& reservations,
                      OrderStateMachine& orders, Checkout& checkout, WebhookService& webhooks,
                      RetryPolicy retry = {});

    grpc::Status RegisterProduct(grpc::ServerContext* context,
                                 const v1::RegisterProductRequest* request,
                                 v1::RegisterProductResponse* response) override;

    grpc::Status Restock(grpc::ServerContext* context, const v1::RestockRequest* request,
                         v1::RestockResponse* response) override;

    grpc::Status GetAvailableStock(grpc::ServerContext* context,
                                   const v1::GetAvailableStockRequest* request,
                                   v1::GetAvailableStockResponse* response) override;

    grpc::Status PlaceOrder(grpc::ServerContext* context, const v1::PlaceOrderRequest* request,
                            v1::PlaceOrderResponse* response) override;

    grpc::Status CreateReservation(grpc::ServerContext* context,
                                   const v1::CreateReservationRequest* request,
                                   v1::CreateReservationResponse* response) override;

    grpc::Status CommitReservation(grpc::ServerContext* context,
                                   const v1::CommitReservationRequest* request,
                                   v1::ReservationChangeResponse* response) override;

    grpc::Status ReleaseReservation(grpc::ServerContext* context,
                                    const v1::ReleaseReservationRequest* request,
                                    v1::ReservationChangeResponse* response) override;

    grpc::Status ExtendReservation(grpc::ServerContext* context,
                                   const v1::ExtendReservationRequest* request,
                                   v1::ReservationChangeResponse* response) override;

    grpc::Status TransitionOrder(grpc::ServerContext* context,
                                 const v1::TransitionOrderRequest* request,
                                 v1::TransitionOrderResponse* response) override;

    grpc::Status GetOrder(grpc::ServerContext* context, const v1::GetOrderRequest* request,
                          v1::GetOrderResponse* response) override;

    grpc::Status ReceiveWebhook(grpc::ServerContext* context,
                                const v1::ReceiveWebhookRequest* request,
                                v1::ReceiveWebhookResponse* response) override;

    grpc::Status GetWebhookRetryStats(grpc::ServerContext* context,
                                      const v1::GetWebhookRetryStatsRequest* request,
                                      v1::WebhookRetryStats* response) override;

private:
    Catalog& catalog_;
    StockLedger& ledger_;
    ReservationManager& reservations_;
    OrderStateMachine& orders_;
    Checkout& checkout_;
    WebhookService& webhooks_;
    RetryPolicy retry_;
};

}  // namespace stockguard
