#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace stockguard {

class ConnectionPool;

/**
 * A prepared statement bound to one connection. Parameter indexes are 1-based,
 * column indexes 0-based, as in the SQLite C API.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind_null(int index);

    /**
     * Bind the value, or NULL when absent. Empty strings are bound as NULL.
     */
    Statement& bind_optional(int index, const std::optional<std::string>& value);
    Statement& bind_optional(int index, const std::optional<int64_t>& value);

    /**
     * Advance to the next row. Returns false when the statement is done.
     * @throws TransientError when the database is busy or locked
     * @throws ConstraintError on a constraint violation
     * @throws StorageError on any other failure
     */
    bool step();

    /**
     * Run a statement that returns no rows.
     */
    void run();

    bool is_null(int column) const;
    int64_t column_int(int column) const;
    std::string column_text(int column) const;
    std::optional<int64_t> column_optional_int(int column) const;
    std::optional<std::string> column_optional_text(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

/**
 * One SQLite connection. Used by a single thread at a time.
 */
class Connection {
public:
    Connection(const std::string& path, std::chrono::milliseconds busy_timeout);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);
    int64_t changes() const;
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

/**
 * A connection on loan from the pool; returned when destroyed.
 */
class PooledConnection {
public:
    PooledConnection(ConnectionPool* pool, std::unique_ptr<Connection> connection)
        : pool_(pool), connection_(std::move(connection)) {}
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&& other) noexcept = default;
    PooledConnection& operator=(PooledConnection&&) = delete;

    Connection* operator->() const { return connection_.get(); }
    Connection& operator*() const { return *connection_; }

private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> connection_;
};

/**
 * Bounded set of connections to one database file. acquire() blocks while
 * every connection is on loan.
 */
class ConnectionPool {
public:
    ConnectionPool(std::string path, std::size_t size, std::chrono::milliseconds busy_timeout);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    PooledConnection acquire();

private:
    friend class PooledConnection;
    void give_back(std::unique_ptr<Connection> connection);

    const std::string path_;
    const std::size_t size_;
    const std::chrono::milliseconds busy_timeout_;

    std::mutex mu_;
    std::condition_variable cv_available_;
    std::vector<std::unique_ptr<Connection>> idle_;
    std::size_t opened_ = 0;
};

/**
 * A database transaction on a pooled connection.
 *
 * - Changes are invisible to other connections until commit()
 * - Immediate mode takes the write lock at BEGIN, so a read-then-write
 *   sequence inside it cannot interleave with another writer
 * - The destructor rolls back if commit() was not reached
 */
class Transaction {
public:
    enum class Mode { Deferred, Immediate };

    Transaction(ConnectionPool& pool, Mode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Statement prepare(const std::string& sql);

    /**
     * Rows modified by the most recent INSERT, UPDATE or DELETE.
     */
    int64_t changes() const;

    void commit();
    void rollback();
    bool is_committed() const { return committed_; }

private:
    PooledConnection connection_;
    bool open_ = false;
    bool committed_ = false;
};

/**
 * Entry point to the SQLite store: owns the pool and the schema.
 */
class Database {
public:
    struct Options {
        std::string path = "stockguard.db";
        std::size_t pool_size = 8;
        std::chrono::milliseconds busy_timeout{5000};
    };

    /**
     * Open (creating if needed) the database and apply the schema.
     */
    explicit Database(Options options);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * Begin a transaction. Writers must use Immediate.
     */
    std::unique_ptr<Transaction> begin(Transaction::Mode mode = Transaction::Mode::Immediate);

    const Options& options() const { return options_; }

private:
    void migrate();

    Options options_;
    ConnectionPool pool_;
};

}  // namespace stockguard
