// server/database.hpp
#pragma once
#include "config.hpp"
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqxx {
class connection;
}

// Text-format parameter; nullopt binds SQL NULL.
using SqlValue = std::optional<std::string>;
using SqlParams = std::vector<SqlValue>;

class SqlResult {
private:
    std::vector<std::string> column_names;
    std::vector<std::vector<SqlValue>> row_values;

public:
    SqlResult() = default;
    SqlResult(std::vector<std::string> columns, std::vector<std::vector<SqlValue>> rows);

    size_t size() const { return row_values.size(); }
    bool empty() const { return row_values.empty(); }
    const std::vector<std::string>& columns() const { return column_names; }

    // Throws StorageError when the column is not part of the result.
    const SqlValue& get(size_t row, const std::string& column) const;
    // As get(), but a NULL is a StorageError too.
    const std::string& text(size_t row, const std::string& column) const;
};

// Seam between the storage components and PostgreSQL. Each call is
// executed and committed on its own; there is no cross-call transaction.
class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;
    virtual SqlResult execute(const std::string& sql, const SqlParams& params = {}) = 0;
};

class ConnectionPool {
private:
    DatabaseConfig config;
    std::string conninfo;
    std::vector<std::unique_ptr<pqxx::connection>> idle;
    size_t open_count{0};
    std::mutex pool_mutex;
    std::condition_variable available;

    std::unique_ptr<pqxx::connection> open_connection();
    void release(std::unique_ptr<pqxx::connection> conn);

public:
    class Lease {
    private:
        ConnectionPool* pool;
        std::unique_ptr<pqxx::connection> conn;

    public:
        Lease(ConnectionPool* p, std::unique_ptr<pqxx::connection> c);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        ~Lease();

        pqxx::connection& connection() { return *conn; }
        // Drops the connection instead of returning it to the pool.
        void discard();
    };

    explicit ConnectionPool(const DatabaseConfig& cfg);
    ~ConnectionPool();

    // Waits at most acquire_timeout_ms; exhaustion raises UnavailableError.
    Lease acquire();

    // Start-up probe: retries with a growing delay (x1.5, capped at 10 s).
    void connect_with_retry();
    bool ping();

    size_t capacity() const { return config.pool_size; }
};

class PgExecutor : public SqlExecutor {
private:
    ConnectionPool& pool;

public:
    explicit PgExecutor(ConnectionPool& p) : pool(p) {}
    SqlResult execute(const std::string& sql, const SqlParams& params = {}) override;
};

// SQLSTATE classes the storage components react to.
namespace sqlstate {
constexpr const char* kUndefinedTable = "42P01";
constexpr const char* kDuplicateTable = "42P07";
constexpr const char* kUniqueViolation = "23505";
constexpr const char* kDuplicateObject = "42710";
constexpr const char* kNumericOutOfRange = "22003";
constexpr const char* kInvalidDatetimeFormat = "22007";
constexpr const char* kDatetimeOverflow = "22008";
constexpr const char* kInsufficientPrivilege = "42501";
}
