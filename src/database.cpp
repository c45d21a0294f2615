#include "stockguard/database.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/logging.hpp"

#include <sqlite3.h>

namespace stockguard {

namespace {

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& context) {
    std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw TransientError(message);
        case SQLITE_CONSTRAINT:
            throw ConstraintError(message, rc);
        default:
            throw StorageError(message, rc);
    }
}

const char* kSchema[] = {
    R"(CREATE TABLE IF NOT EXISTS products (
        id    TEXT PRIMARY KEY,
        stock INTEGER NOT NULL CHECK (stock >= 0)
    ))",
    R"(CREATE TABLE IF NOT EXISTS variants (
        id         TEXT PRIMARY KEY,
        product_id TEXT NOT NULL REFERENCES products(id),
        stock      INTEGER NOT NULL CHECK (stock >= 0)
    ))",
    R"(CREATE TABLE IF NOT EXISTS reservations (
        id         TEXT PRIMARY KEY,
        product_id TEXT NOT NULL REFERENCES products(id),
        variant_id TEXT REFERENCES variants(id),
        quantity   INTEGER NOT NULL CHECK (quantity > 0),
        status     TEXT NOT NULL,
        user_id    TEXT,
        session_id TEXT,
        order_id   TEXT,
        created_at INTEGER NOT NULL,
        expires_at INTEGER NOT NULL,
        closed_at  INTEGER
    ))",
    R"(CREATE INDEX IF NOT EXISTS reservations_by_item
        ON reservations(product_id, variant_id, status))",
    R"(CREATE INDEX IF NOT EXISTS reservations_by_expiry
        ON reservations(status, expires_at))",
    R"(CREATE TABLE IF NOT EXISTS orders (
        id            TEXT PRIMARY KEY,
        user_id       TEXT NOT NULL,
        status        TEXT NOT NULL,
        total_cents   INTEGER NOT NULL,
        created_at    INTEGER NOT NULL,
        updated_at    INTEGER NOT NULL,
        paid_at       INTEGER,
        confirmed_at  INTEGER,
        processing_at INTEGER,
        fulfilled_at  INTEGER,
        shipped_at    INTEGER,
        delivered_at  INTEGER,
        cancelled_at  INTEGER,
        refunded_at   INTEGER
    ))",
    R"(CREATE TABLE IF NOT EXISTS order_lines (
        order_id         TEXT NOT NULL REFERENCES orders(id),
        line_no          INTEGER NOT NULL,
        product_id       TEXT NOT NULL,
        variant_id       TEXT,
        quantity         INTEGER NOT NULL CHECK (quantity > 0),
        unit_price_cents INTEGER NOT NULL,
        reservation_id   TEXT NOT NULL REFERENCES reservations(id),
        PRIMARY KEY (order_id, line_no)
    ))",
    R"(CREATE TABLE IF NOT EXISTS order_events (
        id              INTEGER PRIMARY KEY AUTOINCREMENT,
        order_id        TEXT NOT NULL REFERENCES orders(id),
        previous_status TEXT NOT NULL,
        new_status      TEXT NOT NULL,
        actor           TEXT NOT NULL,
        note            TEXT,
        occurred_at     INTEGER NOT NULL
    ))",
    R"(CREATE TABLE IF NOT EXISTS webhook_events (
        id                TEXT PRIMARY KEY,
        provider          TEXT NOT NULL,
        external_event_id TEXT NOT NULL,
        order_id          TEXT,
        payload           TEXT NOT NULL,
        signature         TEXT,
        signature_hash    TEXT,
        status            TEXT NOT NULL,
        retry_count       INTEGER NOT NULL DEFAULT 0,
        next_retry_at     INTEGER,
        archived          INTEGER NOT NULL DEFAULT 0,
        error_message     TEXT,
        created_at        INTEGER NOT NULL,
        processed_at      INTEGER
    ))",
    // Rejected deliveries are kept for audit and must not shadow a later valid one.
    R"(CREATE UNIQUE INDEX IF NOT EXISTS webhook_events_dedup
        ON webhook_events(provider, external_event_id) WHERE status <> 'rejected')",
    R"(CREATE INDEX IF NOT EXISTS webhook_events_retry
        ON webhook_events(status, archived, created_at))",
};

}  // namespace

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db), stmt_(nullptr), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        throw_sqlite(db_, rc, "prepare");
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind_optional(int index, const std::optional<std::string>& value) {
    if (!value || value->empty()) return bind_null(index);
    return bind(index, *value);
}

Statement& Statement::bind_optional(int index, const std::optional<int64_t>& value) {
    if (!value) return bind_null(index);
    return bind(index, *value);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step");
}

void Statement::run() {
    while (step()) {
    }
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::column_int(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<int64_t> Statement::column_optional_int(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_int(column);
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_text(column);
}

// =============================================================================
// Connection
// =============================================================================

Connection::Connection(const std::string& path, std::chrono::milliseconds busy_timeout) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "open " + path + ": " +
                              (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message, rc);
    }
    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
    try {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
        exec("PRAGMA foreign_keys=ON");
    } catch (const StockguardError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Connection::~Connection() {
    if (db_) sqlite3_close(db_);
}

void Connection::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw_sqlite(nullptr, rc, sql + ": " + message);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int64_t Connection::changes() const {
    return static_cast<int64_t>(sqlite3_changes(db_));
}

// =============================================================================
// ConnectionPool
// =============================================================================

PooledConnection::~PooledConnection() {
    if (pool_ && connection_) pool_->give_back(std::move(connection_));
}

ConnectionPool::ConnectionPool(std::string path, std::size_t size,
                               std::chrono::milliseconds busy_timeout)
    : path_(std::move(path)), size_(size == 0 ? 1 : size), busy_timeout_(busy_timeout) {}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_available_.wait(lk, [&] { return !idle_.empty() || opened_ < size_; });
    if (!idle_.empty()) {
        auto connection = std::move(idle_.back());
        idle_.pop_back();
        return PooledConnection(this, std::move(connection));
    }
    opened_++;
    lk.unlock();
    try {
        return PooledConnection(this, std::make_unique<Connection>(path_, busy_timeout_));
    } catch (...) {
        std::lock_guard<std::mutex> relock(mu_);
        opened_--;
        cv_available_.notify_one();
        throw;
    }
}

void ConnectionPool::give_back(std::unique_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lk(mu_);
    idle_.push_back(std::move(connection));
    cv_available_.notify_one();
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(ConnectionPool& pool, Mode mode)
    : connection_(pool.acquire()) {
    connection_->exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
    open_ = true;
}

Transaction::~Transaction() {
    if (!open_) return;
    try {
        connection_->exec("ROLLBACK");
    } catch (const StockguardError& e) {
        log_warn("database", "rollback_failed", {{"error", e.what()}});
    }
}

Statement Transaction::prepare(const std::string& sql) {
    return connection_->prepare(sql);
}

int64_t Transaction::changes() const {
    return connection_->changes();
}

void Transaction::commit() {
    connection_->exec("COMMIT");
    open_ = false;
    committed_ = true;
}

void Transaction::rollback() {
    if (!open_) return;
    open_ = false;
    connection_->exec("ROLLBACK");
}

// =============================================================================
// Database
// =============================================================================

Database::Database(Options options)
    : options_(std::move(options)),
      pool_(options_.path, options_.pool_size, options_.busy_timeout) {
    migrate();
}

std::unique_ptr<Transaction> Database::begin(Transaction::Mode mode) {
    return std::make_unique<Transaction>(pool_, mode);
}

void Database::migrate() {
    auto txn = begin(Transaction::Mode::Immediate);
    for (const char* statement : kSchema) {
        txn->prepare(statement).run();
    }
    txn->commit();
    log_debug("database", "schema_ready", {{"path", options_.path}});
}

}  // namespace stockguard
