// server/database.cpp
#include "database.hpp"
#include "logger.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <pqxx/pqxx>

SqlResult::SqlResult(std::vector<std::string> columns, std::vector<std::vector<SqlValue>> rows)
    : column_names(std::move(columns)), row_values(std::move(rows)) {}

const SqlValue& SqlResult::get(size_t row, const std::string& column) const {
    if (row >= row_values.size()) {
        throw StorageError("Result row " + std::to_string(row) + " out of range");
    }
    auto it = std::find(column_names.begin(), column_names.end(), column);
    if (it == column_names.end()) {
        throw StorageError("Result has no column '" + column + "'");
    }
    return row_values[row][static_cast<size_t>(it - column_names.begin())];
}

const std::string& SqlResult::text(size_t row, const std::string& column) const {
    const SqlValue& v = get(row, column);
    if (!v) {
        throw StorageError("Unexpected NULL in column '" + column + "'");
    }
    return *v;
}

// ---------------------------------------------------------------------------

ConnectionPool::Lease::Lease(ConnectionPool* p, std::unique_ptr<pqxx::connection> c)
    : pool(p), conn(std::move(c)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool(other.pool), conn(std::move(other.conn)) {}

ConnectionPool::Lease::~Lease() {
    if (conn) {
        pool->release(std::move(conn));
    }
}

void ConnectionPool::Lease::discard() {
    if (!conn) return;
    conn.reset();
    std::lock_guard<std::mutex> lock(pool->pool_mutex);
    pool->open_count--;
    pool->available.notify_one();
}

ConnectionPool::ConnectionPool(const DatabaseConfig& cfg)
    : config(cfg) {
    // Engine-level statement timeout and UTC session for every connection
    conninfo = config.connection_string() +
               " options='-c statement_timeout=" + std::to_string(config.statement_timeout_ms) +
               " -c TimeZone=UTC'";
}

ConnectionPool::~ConnectionPool() = default;

std::unique_ptr<pqxx::connection> ConnectionPool::open_connection() {
    try {
        return std::make_unique<pqxx::connection>(conninfo);
    } catch (const pqxx::broken_connection& e) {
        throw UnavailableError(std::string("Database connection failed: ") + e.what());
    }
}

void ConnectionPool::release(std::unique_ptr<pqxx::connection> conn) {
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (conn->is_open()) {
        idle.push_back(std::move(conn));
    } else {
        open_count--;
    }
    available.notify_one();
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(pool_mutex);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config.acquire_timeout_ms);

    bool ready = available.wait_until(lock, deadline, [this] {
        return !idle.empty() || open_count < config.pool_size;
    });
    if (!ready) {
        throw UnavailableError("Database connection pool exhausted (" +
                               std::to_string(config.pool_size) + " connections busy)");
    }

    if (!idle.empty()) {
        auto conn = std::move(idle.back());
        idle.pop_back();
        return Lease(this, std::move(conn));
    }

    // Reserve the slot, then connect without holding the lock
    open_count++;
    lock.unlock();
    try {
        return Lease(this, open_connection());
    } catch (...) {
        std::lock_guard<std::mutex> relock(pool_mutex);
        open_count--;
        available.notify_one();
        throw;
    }
}

void ConnectionPool::connect_with_retry() {
    int delay = config.connect_delay_ms;
    for (int attempt = 1; attempt <= config.connect_retries; attempt++) {
        try {
            auto lease = acquire();
            pqxx::nontransaction tx(lease.connection());
            tx.exec("SELECT 1");
            Logger::success("Database connection established (" + config.host + ":" +
                            std::to_string(config.port) + "/" + config.name + ")");
            return;
        } catch (const std::exception& e) {
            if (attempt == config.connect_retries) {
                throw UnavailableError("Database unreachable after " +
                                       std::to_string(attempt) + " attempts: " + e.what());
            }
            Logger::warning("Database connection attempt " + std::to_string(attempt) +
                            " failed, retrying in " + std::to_string(delay) + "ms...");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            delay = std::min(static_cast<int>(delay * 1.5), 10000);
        }
    }
}

bool ConnectionPool::ping() {
    try {
        auto lease = acquire();
        pqxx::nontransaction tx(lease.connection());
        tx.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        Logger::warning(std::string("Database ping failed: ") + e.what());
        return false;
    }
}

// ---------------------------------------------------------------------------

SqlResult PgExecutor::execute(const std::string& sql, const SqlParams& params) {
    auto lease = pool.acquire();

    pqxx::result r;
    try {
        pqxx::work tx(lease.connection());
        if (params.empty()) {
            r = tx.exec(sql);
        } else {
            pqxx::params bound;
            for (const auto& p : params) {
                if (p) {
                    bound.append(*p);
                } else {
                    bound.append();
                }
            }
            r = tx.exec_params(sql, bound);
        }
        tx.commit();
    } catch (const pqxx::broken_connection& e) {
        lease.discard();
        throw UnavailableError(std::string("Database connection lost: ") + e.what());
    } catch (const pqxx::sql_error& e) {
        Logger::debug("SQL failed [" + e.sqlstate() + "]: " + e.query());
        throw StorageError(e.what(), e.sqlstate());
    } catch (const pqxx::failure& e) {
        throw StorageError(e.what());
    }

    std::vector<std::string> columns;
    columns.reserve(static_cast<size_t>(r.columns()));
    for (pqxx::row::size_type c = 0; c < r.columns(); ++c) {
        columns.emplace_back(r.column_name(c));
    }

    std::vector<std::vector<SqlValue>> rows;
    rows.reserve(static_cast<size_t>(r.size()));
    for (const auto& row : r) {
        std::vector<SqlValue> values;
        values.reserve(columns.size());
        for (const auto& field : row) {
            if (field.is_null()) {
                values.emplace_back(std::nullopt);
            } else {
                values.emplace_back(std::string(field.c_str()));
            }
        }
        rows.push_back(std::move(values));
    }

    return SqlResult(std::move(columns), std::move(rows));
}
