#include "stockguard_service.hpp"
#include "stockguard/config.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/notifier.hpp"
#include "stockguard/scheduler.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    using namespace stockguard;

    Config config;
    try {
        config = Config::from_env();
    } catch (const StockguardError& e) {
        log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }
    set_log_level(config.log_level);

    Database::Options db_options;
    db_options.path = config.db_path;
    db_options.pool_size = config.db_pool_size;
    db_options.busy_timeout = config.db_busy_timeout;

    std::shared_ptr<Database> db;
    try {
        db = std::make_shared<Database>(db_options);
    } catch (const StockguardError& e) {
        log_error("server", "database_unavailable",
                  {{"path", config.db_path}, {"error", e.what()}});
        return 1;
    }

    LogNotifier notifier;
    Clock clock = system_clock();

    Catalog catalog(db);
    StockLedger ledger(db);
    ReservationManager reservations(db, clock, config.reservation_ttl, &notifier);
    OrderStateMachine orders(db, reservations, clock, &notifier);
    Checkout checkout(db, reservations, orders);

    WebhookOptions webhook_options;
    webhook_options.max_retries = config.webhook_max_retries;
    webhook_options.initial_backoff = config.webhook_initial_backoff;
    webhook_options.max_backoff = config.webhook_max_backoff;
    WebhookService webhooks(
        db, orders, [&config](const std::string& provider) { return config.secret_for(provider); },
        clock, webhook_options);

    Scheduler scheduler;
    scheduler.add("reservation_expiry", config.expiry_sweep_interval,
                  [&] { reservations.expire_stale_reservations(clock()); });
    scheduler.add("webhook_retry", config.webhook_retry_interval, [&] {
        webhooks.retry_failed_webhooks(static_cast<int64_t>(config.webhook_batch_size));
    });

    StockguardService service(catalog, ledger, reservations, orders, checkout, webhooks);

    std::string server_address = "0.0.0.0:" + config.port;

    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        log_error("server", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    scheduler.start();

    log_info("server", "server_started",
             {{"port", config.port}, {"db_path", config.db_path},
              {"reservation_ttl_seconds", static_cast<int64_t>(config.reservation_ttl.count())}});

    server->Wait();

    scheduler.stop();

    return 0;
}
