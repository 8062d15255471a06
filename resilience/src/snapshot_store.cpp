#include "botfleet/resilience/snapshot_store.hpp"
#include "botfleet/resilience/errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <stdexcept>

namespace botfleet {
namespace resilience {

namespace {

int64_t to_micros(WallTime t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

WallTime from_micros(int64_t us) {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(std::chrono::microseconds(us)));
}

bool is_unhealthy(const HealthSnapshot& snapshot) {
    return snapshot.metrics.status == HealthStatus::unhealthy ||
           snapshot.metrics.status == HealthStatus::suspended;
}

std::optional<BreakerState> parse_breaker_state(const std::string& name) {
    if (name == "closed") return BreakerState::closed;
    if (name == "open") return BreakerState::open;
    if (name == "half_open") return BreakerState::half_open;
    return std::nullopt;
}

} // namespace

// InMemorySnapshotStore

caf::expected<void> InMemorySnapshotStore::store_snapshot(const std::string& tenant_id,
                                                          const HealthSnapshot& snapshot,
                                                          WallTime timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    StoredSnapshot row;
    row.tenant_id = tenant_id;
    row.timestamp = timestamp;
    row.snapshot = snapshot;
    row.snapshot.metrics.tenant_id = tenant_id;
    rows_.push_back(std::move(row));
    return caf::unit;
}

caf::expected<void> InMemorySnapshotStore::store_batch(const std::vector<StoredSnapshot>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& row : rows) {
        rows_.push_back(row);
        rows_.back().snapshot.metrics.tenant_id = row.tenant_id;
    }
    return caf::unit;
}

caf::expected<std::vector<StoredSnapshot>> InMemorySnapshotStore::load_history(
    const std::string& tenant_id, WallTime since) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredSnapshot> result;
    for (const auto& row : rows_) {
        if (row.tenant_id == tenant_id && row.timestamp >= since) {
            result.push_back(row);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const StoredSnapshot& a, const StoredSnapshot& b) {
                         return a.timestamp < b.timestamp;
                     });
    return result;
}

caf::expected<std::vector<StoredSnapshot>> InMemorySnapshotStore::load_latest() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredSnapshot> result;
    if (rows_.empty()) {
        return result;
    }
    auto latest = std::max_element(rows_.begin(), rows_.end(),
                                   [](const StoredSnapshot& a, const StoredSnapshot& b) {
                                       return a.timestamp < b.timestamp;
                                   })->timestamp;
    for (const auto& row : rows_) {
        if (row.timestamp == latest) {
            result.push_back(row);
        }
    }
    return result;
}

caf::expected<std::vector<StoredSnapshot>> InMemorySnapshotStore::load_unhealthy_since(WallTime since) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredSnapshot> result;
    for (const auto& row : rows_) {
        if (row.timestamp >= since && is_unhealthy(row.snapshot)) {
            result.push_back(row);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const StoredSnapshot& a, const StoredSnapshot& b) {
                         return a.timestamp > b.timestamp;
                     });
    return result;
}

caf::expected<size_t> InMemorySnapshotStore::cleanup_older_than(WallTime cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = rows_.size();
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                               [cutoff](const StoredSnapshot& row) { return row.timestamp < cutoff; }),
                rows_.end());
    return before - rows_.size();
}

size_t InMemorySnapshotStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

// SqliteSnapshotStore

namespace {

constexpr const char* schema_sql =
    "CREATE TABLE IF NOT EXISTS health_snapshots ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " tenant_id TEXT NOT NULL,"
    " ts INTEGER NOT NULL,"
    " status TEXT NOT NULL,"
    " total_requests INTEGER NOT NULL,"
    " successful_requests INTEGER NOT NULL,"
    " failed_requests INTEGER NOT NULL,"
    " consecutive_failures INTEGER NOT NULL,"
    " error_rate REAL NOT NULL,"
    " avg_latency_ms REAL NOT NULL,"
    " latency_seeded INTEGER NOT NULL,"
    " last_success INTEGER,"
    " last_failure INTEGER,"
    " last_check INTEGER,"
    " is_rate_limited INTEGER NOT NULL,"
    " last_error_type TEXT NOT NULL,"
    " suspension_reason TEXT NOT NULL,"
    " breaker_state TEXT);"
    "CREATE INDEX IF NOT EXISTS idx_health_snapshots_ts ON health_snapshots(ts);"
    "CREATE INDEX IF NOT EXISTS idx_health_snapshots_tenant_ts"
    " ON health_snapshots(tenant_id, ts);";

constexpr const char* select_columns =
    "SELECT tenant_id, ts, status, total_requests, successful_requests, failed_requests,"
    " consecutive_failures, error_rate, avg_latency_ms, latency_seeded, last_success,"
    " last_failure, last_check, is_rate_limited, last_error_type, suspension_reason,"
    " breaker_state FROM health_snapshots ";

// RAII wrapper to ensure the statement is finalized
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
        }
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }
    void bind(int index, double value) { check(sqlite3_bind_double(stmt_, index, value)); }
    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }
    void bind(int index, const std::optional<WallTime>& value) {
        if (value) {
            bind(index, to_micros(*value));
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }
    void bind_null(int index) { check(sqlite3_bind_null(stmt_, index)); }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Statement execution failed: " + std::string(sqlite3_errmsg(db_)));
        }
        return false;
    }

    int64_t column_int(int col) const { return sqlite3_column_int64(stmt_, col); }
    double column_double(int col) const { return sqlite3_column_double(stmt_, col); }
    bool column_is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }
    std::optional<WallTime> column_time(int col) const {
        if (column_is_null(col)) {
            return std::nullopt;
        }
        return from_micros(column_int(col));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)));
        }
    }
};

StoredSnapshot read_row(const Statement& stmt) {
    StoredSnapshot row;
    row.tenant_id = stmt.column_text(0);
    row.timestamp = from_micros(stmt.column_int(1));

    auto& metrics = row.snapshot.metrics;
    metrics.tenant_id = row.tenant_id;
    metrics.status = parse_health_status(stmt.column_text(2)).value_or(HealthStatus::healthy);
    metrics.total_requests = static_cast<uint64_t>(stmt.column_int(3));
    metrics.successful_requests = static_cast<uint64_t>(stmt.column_int(4));
    metrics.failed_requests = static_cast<uint64_t>(stmt.column_int(5));
    metrics.consecutive_failures = static_cast<uint32_t>(stmt.column_int(6));
    metrics.error_rate = stmt.column_double(7);
    metrics.avg_latency_ms = stmt.column_double(8);
    metrics.latency_seeded = stmt.column_int(9) != 0;
    metrics.last_success = stmt.column_time(10);
    metrics.last_failure = stmt.column_time(11);
    metrics.last_check = stmt.column_time(12);
    metrics.is_rate_limited = stmt.column_int(13) != 0;
    metrics.last_error_type = stmt.column_text(14);
    metrics.suspension_reason = stmt.column_text(15);
    if (!stmt.column_is_null(16)) {
        row.snapshot.breaker_state = parse_breaker_state(stmt.column_text(16));
    }
    return row;
}

std::vector<StoredSnapshot> read_rows(Statement& stmt) {
    std::vector<StoredSnapshot> rows;
    while (stmt.step()) {
        rows.push_back(read_row(stmt));
    }
    return rows;
}

caf::error sqlite_error(const std::exception& e) {
    return make_error(ErrorCode::store_unavailable, std::string("snapshot store: ") + e.what());
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error(std::string(sql) + " failed: " + message);
    }
}

} // namespace

caf::expected<std::unique_ptr<SqliteSnapshotStore>> SqliteSnapshotStore::open(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return make_error(ErrorCode::store_unavailable,
                          "Failed to open database " + path + ": " + message);
    }

    char* err = nullptr;
    rc = sqlite3_exec(db, schema_sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        sqlite3_close(db);
        return make_error(ErrorCode::store_unavailable, "Failed to create schema: " + message);
    }
    return std::unique_ptr<SqliteSnapshotStore>(new SqliteSnapshotStore(db));
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteSnapshotStore::insert_row(const std::string& tenant_id, const HealthSnapshot& snapshot,
                                     WallTime timestamp) {
    Statement stmt(db_,
                   "INSERT INTO health_snapshots (tenant_id, ts, status, total_requests,"
                   " successful_requests, failed_requests, consecutive_failures, error_rate,"
                   " avg_latency_ms, latency_seeded, last_success, last_failure, last_check,"
                   " is_rate_limited, last_error_type, suspension_reason, breaker_state)"
                   " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    const auto& metrics = snapshot.metrics;
    stmt.bind(1, tenant_id);
    stmt.bind(2, to_micros(timestamp));
    stmt.bind(3, to_string(metrics.status));
    stmt.bind(4, static_cast<int64_t>(metrics.total_requests));
    stmt.bind(5, static_cast<int64_t>(metrics.successful_requests));
    stmt.bind(6, static_cast<int64_t>(metrics.failed_requests));
    stmt.bind(7, static_cast<int64_t>(metrics.consecutive_failures));
    stmt.bind(8, metrics.error_rate);
    stmt.bind(9, metrics.avg_latency_ms);
    stmt.bind(10, static_cast<int64_t>(metrics.latency_seeded ? 1 : 0));
    stmt.bind(11, metrics.last_success);
    stmt.bind(12, metrics.last_failure);
    stmt.bind(13, metrics.last_check);
    stmt.bind(14, static_cast<int64_t>(metrics.is_rate_limited ? 1 : 0));
    stmt.bind(15, metrics.last_error_type);
    stmt.bind(16, metrics.suspension_reason);
    if (snapshot.breaker_state) {
        stmt.bind(17, to_string(*snapshot.breaker_state));
    } else {
        stmt.bind_null(17);
    }
    stmt.step();
}

caf::expected<void> SqliteSnapshotStore::store_snapshot(const std::string& tenant_id,
                                                        const HealthSnapshot& snapshot,
                                                        WallTime timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        insert_row(tenant_id, snapshot, timestamp);
        return caf::unit;
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
}

caf::expected<void> SqliteSnapshotStore::store_batch(const std::vector<StoredSnapshot>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        exec(db_, "BEGIN IMMEDIATE");
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
    try {
        for (const auto& row : rows) {
            insert_row(row.tenant_id, row.snapshot, row.timestamp);
        }
        exec(db_, "COMMIT");
        return caf::unit;
    } catch (const std::exception& e) {
        std::string message = std::string("snapshot store: ") + e.what();
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            message += "; rollback failed: " + std::string(sqlite3_errmsg(db_));
        }
        return make_error(ErrorCode::store_unavailable, message);
    }
}

caf::expected<std::vector<StoredSnapshot>> SqliteSnapshotStore::load_history(
    const std::string& tenant_id, WallTime since) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Statement stmt(db_, std::string(select_columns) +
                                "WHERE tenant_id = ? AND ts >= ? ORDER BY ts ASC, id ASC");
        stmt.bind(1, tenant_id);
        stmt.bind(2, to_micros(since));
        return read_rows(stmt);
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
}

caf::expected<std::vector<StoredSnapshot>> SqliteSnapshotStore::load_latest() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Statement stmt(db_, std::string(select_columns) +
                                "WHERE ts = (SELECT MAX(ts) FROM health_snapshots) ORDER BY tenant_id");
        return read_rows(stmt);
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
}

caf::expected<std::vector<StoredSnapshot>> SqliteSnapshotStore::load_unhealthy_since(WallTime since) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Statement stmt(db_, std::string(select_columns) +
                                "WHERE ts >= ? AND status IN ('unhealthy', 'suspended')"
                                " ORDER BY ts DESC, id DESC");
        stmt.bind(1, to_micros(since));
        return read_rows(stmt);
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
}

caf::expected<size_t> SqliteSnapshotStore::cleanup_older_than(WallTime cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Statement stmt(db_, "DELETE FROM health_snapshots WHERE ts < ?");
        stmt.bind(1, to_micros(cutoff));
        stmt.step();
        return static_cast<size_t>(sqlite3_changes(db_));
    } catch (const std::exception& e) {
        return sqlite_error(e);
    }
}

} // namespace resilience
} // namespace botfleet
