#include "database_manager.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <map>
#include <mutex>
#include <type_traits>

namespace {

// Owns one prepared statement; every failure surfaces as PersistenceError.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw PersistenceError(fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    template <typename T>
    void bind(int index, const std::optional<T>& value) {
        if (value) {
            bind(index, *value);
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    // True while rows are available.
    bool step_row() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw PersistenceError(fmt::format("Statement failed: {}", sqlite3_errmsg(db_)));
    }

    void execute() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE) {
            throw PersistenceError(fmt::format("Statement failed: {}", sqlite3_errmsg(db_)));
        }
    }

    std::string text(int col) const {
        const auto* value = sqlite3_column_text(stmt_, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    int64_t int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    std::optional<int64_t> optional_int64(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_int64(stmt_, col);
    }

    std::optional<double> optional_double(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_double(stmt_, col);
    }

    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw PersistenceError(fmt::format("Failed to bind parameter: {}", sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

constexpr const char* kInsertPing = R"(
    INSERT INTO ping_history (target_name, host, timestamp, success, response_time_ms, error_kind)
    VALUES (?, ?, ?, ?, ?, ?)
)";

// Replays of the same event are idempotent; a stale open copy never reopens
// a closed row or lowers its count.
constexpr const char* kUpsertDisconnect = R"(
    INSERT INTO disconnect_events (target_name, host, start_time, end_time, disconnect_count)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT(target_name, start_time) DO UPDATE SET
        host = excluded.host,
        end_time = COALESCE(excluded.end_time, disconnect_events.end_time),
        disconnect_count = MAX(excluded.disconnect_count, disconnect_events.disconnect_count)
)";

// A newly opened event supersedes any row an earlier run left open, so a
// target never has more than one open row.
constexpr const char* kCloseStaleDisconnects = R"(
    UPDATE disconnect_events SET end_time = MAX(start_time, ?)
    WHERE target_name = ? AND end_time IS NULL AND start_time <> ?
)";

constexpr const char* kInsertStatistics = R"(
    INSERT INTO ping_statistics
        (target_name, host, timestamp, total_pings, successful_pings, failed_pings,
         success_rate, avg_response_time, min_response_time, max_response_time, last_status)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

} // namespace

class DatabaseManager::Impl {
public:
    explicit Impl(const std::string& db_path) : db_path_(db_path), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw PersistenceError("Failed to initialize database at " + db_path_);
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    bool initialize() {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            spdlog::error("Cannot open database: {}", db_ ? sqlite3_errmsg(db_) : "out of memory");
            return false;
        }

        sqlite3_busy_timeout(db_, 5000);
        exec_logged("PRAGMA journal_mode=WAL");

        if (!create_tables()) {
            return false;
        }

        spdlog::info("Database initialized at: {}", db_path_);
        return true;
    }

    void write_batch(const std::vector<PersistItem>& items) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (items.empty()) return;

        exec("BEGIN IMMEDIATE");
        try {
            Statement insert_ping(db_, kInsertPing);
            Statement upsert_disconnect(db_, kUpsertDisconnect);
            Statement close_stale(db_, kCloseStaleDisconnects);
            Statement insert_stats(db_, kInsertStatistics);

            for (const auto& item : items) {
                std::visit([&](const auto& record) {
                    using T = std::decay_t<decltype(record)>;
                    if constexpr (std::is_same_v<T, ProbeResult>) {
                        write_ping(insert_ping, record);
                    } else if constexpr (std::is_same_v<T, DisconnectEvent>) {
                        write_disconnect(upsert_disconnect, close_stale, record);
                    } else {
                        write_statistics(insert_stats, record);
                    }
                }, item);
            }

            exec("COMMIT");
        } catch (const std::exception&) {
            exec_logged("ROLLBACK");
            throw;
        }
    }

    std::vector<PingHistoryRow> ping_history(const std::string& target_name, int limit) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, R"(
            SELECT target_name, host, timestamp, success, response_time_ms, error_kind
            FROM ping_history
            WHERE target_name = ?
            ORDER BY timestamp DESC, id DESC
            LIMIT ?
        )");
        stmt.bind(1, target_name);
        stmt.bind(2, static_cast<int64_t>(limit));

        std::vector<PingHistoryRow> rows;
        while (stmt.step_row()) {
            PingHistoryRow row;
            row.target_name = stmt.text(0);
            row.host = stmt.text(1);
            row.timestamp_ms = stmt.int64(2);
            row.success = stmt.int64(3) != 0;
            row.response_time_ms = stmt.optional_double(4);
            row.error_kind = stmt.optional_text(5);
            rows.push_back(std::move(row));
        }
        return rows;
    }

    std::optional<StatisticsRow> latest_statistics(const std::string& target_name) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, R"(
            SELECT target_name, host, timestamp, total_pings, successful_pings, failed_pings,
                   success_rate, avg_response_time, min_response_time, max_response_time, last_status
            FROM ping_statistics
            WHERE target_name = ?
            ORDER BY timestamp DESC, id DESC
            LIMIT 1
        )");
        stmt.bind(1, target_name);

        if (!stmt.step_row()) {
            return std::nullopt;
        }
        StatisticsRow row;
        row.target_name = stmt.text(0);
        row.host = stmt.text(1);
        row.timestamp_ms = stmt.int64(2);
        row.total_pings = stmt.int64(3);
        row.successful_pings = stmt.int64(4);
        row.failed_pings = stmt.int64(5);
        row.success_rate = stmt.optional_double(6).value_or(0.0);
        row.avg_response_time = stmt.optional_double(7);
        row.min_response_time = stmt.optional_double(8);
        row.max_response_time = stmt.optional_double(9);
        row.last_status = stmt.text(10);
        return row;
    }

    std::vector<DisconnectRow> disconnects(const std::string& target_name, int limit) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, R"(
            SELECT target_name, host, start_time, end_time, disconnect_count
            FROM disconnect_events
            WHERE target_name = ?
            ORDER BY start_time DESC
            LIMIT ?
        )");
        stmt.bind(1, target_name);
        stmt.bind(2, static_cast<int64_t>(limit));

        std::vector<DisconnectRow> rows;
        while (stmt.step_row()) {
            DisconnectRow row;
            row.target_name = stmt.text(0);
            row.host = stmt.text(1);
            row.start_time_ms = stmt.int64(2);
            row.end_time_ms = stmt.optional_int64(3);
            row.disconnect_count = stmt.int64(4);
            rows.push_back(std::move(row));
        }
        return rows;
    }

    std::vector<TargetSummary> summarize_since(int64_t since_ms) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::map<std::string, TargetSummary> by_target;

        Statement pings(db_, R"(
            SELECT p.target_name, p.host, COUNT(*), SUM(p.success),
                   AVG(p.response_time_ms), MIN(p.response_time_ms), MAX(p.response_time_ms),
                   (SELECT l.success FROM ping_history l
                    WHERE l.target_name = p.target_name
                    ORDER BY l.timestamp DESC, l.id DESC LIMIT 1)
            FROM ping_history p
            WHERE p.timestamp > ?
            GROUP BY p.target_name
        )");
        pings.bind(1, since_ms);
        while (pings.step_row()) {
            TargetSummary summary;
            summary.target_name = pings.text(0);
            summary.host = pings.text(1);
            summary.pings = pings.int64(2);
            summary.successful_pings = pings.int64(3);
            summary.success_rate = summary.pings > 0
                ? static_cast<double>(summary.successful_pings) * 100.0 / static_cast<double>(summary.pings)
                : 0.0;
            summary.avg_response_time = pings.optional_double(4);
            summary.min_response_time = pings.optional_double(5);
            summary.max_response_time = pings.optional_double(6);
            summary.last_success = pings.int64(7) != 0;
            by_target[summary.target_name] = std::move(summary);
        }

        Statement events(db_, R"(
            SELECT target_name, host, COUNT(*), MAX(start_time)
            FROM disconnect_events
            WHERE start_time > ?
            GROUP BY target_name
        )");
        events.bind(1, since_ms);
        while (events.step_row()) {
            auto& summary = by_target[events.text(0)];
            if (summary.target_name.empty()) {
                summary.target_name = events.text(0);
                summary.host = events.text(1);
            }
            summary.disconnect_count = events.int64(2);
            summary.last_disconnect_ms = events.optional_int64(3);
        }

        std::vector<TargetSummary> result;
        result.reserve(by_target.size());
        for (auto& entry : by_target) {
            result.push_back(std::move(entry.second));
        }
        return result;
    }

    std::vector<StatisticsPoint> statistics_series(int64_t since_ms) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, R"(
            SELECT target_name, timestamp, avg_response_time, min_response_time, max_response_time
            FROM ping_statistics
            WHERE timestamp > ?
            ORDER BY target_name, timestamp, id
        )");
        stmt.bind(1, since_ms);

        std::vector<StatisticsPoint> points;
        while (stmt.step_row()) {
            StatisticsPoint point;
            point.target_name = stmt.text(0);
            point.timestamp_ms = stmt.int64(1);
            point.avg_response_time = stmt.optional_double(2);
            point.min_response_time = stmt.optional_double(3);
            point.max_response_time = stmt.optional_double(4);
            points.push_back(std::move(point));
        }
        return points;
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        // Simple health check - try to query sqlite_master
        const char* sql = "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    bool create_tables() {
        const char* create_ping_history = R"(
            CREATE TABLE IF NOT EXISTS ping_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                target_name TEXT NOT NULL,
                host TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                success INTEGER NOT NULL,
                response_time_ms REAL,
                error_kind TEXT
            )
        )";

        const char* create_disconnect_events = R"(
            CREATE TABLE IF NOT EXISTS disconnect_events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                target_name TEXT NOT NULL,
                host TEXT NOT NULL,
                start_time INTEGER NOT NULL,
                end_time INTEGER,
                disconnect_count INTEGER NOT NULL,
                UNIQUE(target_name, start_time)
            )
        )";

        const char* create_ping_statistics = R"(
            CREATE TABLE IF NOT EXISTS ping_statistics (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                target_name TEXT NOT NULL,
                host TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                total_pings INTEGER NOT NULL,
                successful_pings INTEGER NOT NULL,
                failed_pings INTEGER NOT NULL,
                success_rate REAL NOT NULL,
                avg_response_time REAL,
                min_response_time REAL,
                max_response_time REAL,
                last_status TEXT
            )
        )";

        const char* create_indices = R"(
            CREATE INDEX IF NOT EXISTS idx_ping_history_target_timestamp ON ping_history(target_name, timestamp);
            CREATE INDEX IF NOT EXISTS idx_disconnect_events_target ON disconnect_events(target_name, start_time);
            CREATE INDEX IF NOT EXISTS idx_ping_statistics_target_timestamp ON ping_statistics(target_name, timestamp);
        )";

        const std::pair<const char*, const char*> steps[] = {
            {"ping_history table", create_ping_history},
            {"disconnect_events table", create_disconnect_events},
            {"ping_statistics table", create_ping_statistics},
            {"indices", create_indices},
        };

        for (const auto& [what, sql] : steps) {
            char* err_msg = nullptr;
            if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                spdlog::error("Failed to create {}: {}", what, err_msg ? err_msg : "unknown error");
                sqlite3_free(err_msg);
                return false;
            }
        }
        return true;
    }

    static void write_ping(Statement& stmt, const ProbeResult& result) {
        stmt.reset();
        stmt.bind(1, result.target_name);
        stmt.bind(2, result.host);
        stmt.bind(3, to_epoch_ms(result.timestamp));
        stmt.bind(4, static_cast<int64_t>(result.success ? 1 : 0));
        stmt.bind(5, result.response_time_ms);
        if (result.error_kind) {
            stmt.bind(6, std::string(to_string(*result.error_kind)));
        } else {
            stmt.bind(6, std::optional<std::string>());
        }
        stmt.execute();
    }

    static void write_disconnect(Statement& stmt, Statement& close_stale, const DisconnectEvent& event) {
        const int64_t start_ms = to_epoch_ms(event.start_time);
        if (!event.end_time) {
            close_stale.reset();
            close_stale.bind(1, start_ms);
            close_stale.bind(2, event.target_name);
            close_stale.bind(3, start_ms);
            close_stale.execute();
        }

        stmt.reset();
        stmt.bind(1, event.target_name);
        stmt.bind(2, event.host);
        stmt.bind(3, start_ms);
        stmt.bind(4, event.end_time ? std::optional<int64_t>(to_epoch_ms(*event.end_time)) : std::nullopt);
        stmt.bind(5, static_cast<int64_t>(event.consecutive_failure_count));
        stmt.execute();
    }

    static void write_statistics(Statement& stmt, const StatsSnapshot& snapshot) {
        const auto& stats = snapshot.stats;
        stmt.reset();
        stmt.bind(1, stats.target_name);
        stmt.bind(2, snapshot.host);
        stmt.bind(3, to_epoch_ms(snapshot.taken_at));
        stmt.bind(4, static_cast<int64_t>(stats.ping_count));
        stmt.bind(5, static_cast<int64_t>(stats.success_count));
        stmt.bind(6, static_cast<int64_t>(stats.failure_count));
        stmt.bind(7, stats.success_rate());
        stmt.bind(8, stats.avg_rt);
        stmt.bind(9, stats.min_rt);
        stmt.bind(10, stats.max_rt);
        stmt.bind(11, std::string(to_string(stats.current_state)));
        stmt.execute();
    }

    void exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
            sqlite3_free(err_msg);
            throw PersistenceError(fmt::format("'{}' failed: {}", sql, message));
        }
    }

    void exec_logged(const char* sql) {
        try {
            exec(sql);
        } catch (const PersistenceError& e) {
            spdlog::warn("{}", e.what());
        }
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

// Public interface implementation
DatabaseManager::DatabaseManager(const std::string& db_path)
    : pImpl_(std::make_unique<Impl>(db_path)) {}

DatabaseManager::~DatabaseManager() = default;

void DatabaseManager::write_batch(const std::vector<PersistItem>& items) {
    pImpl_->write_batch(items);
}

std::vector<PingHistoryRow> DatabaseManager::ping_history(const std::string& target_name, int limit) const {
    return pImpl_->ping_history(target_name, limit);
}

std::optional<StatisticsRow> DatabaseManager::latest_statistics(const std::string& target_name) const {
    return pImpl_->latest_statistics(target_name);
}

std::vector<DisconnectRow> DatabaseManager::disconnects(const std::string& target_name, int limit) const {
    return pImpl_->disconnects(target_name, limit);
}

std::vector<TargetSummary> DatabaseManager::summarize_since(int64_t since_ms) const {
    return pImpl_->summarize_since(since_ms);
}

std::vector<StatisticsPoint> DatabaseManager::statistics_series(int64_t since_ms) const {
    return pImpl_->statistics_series(since_ms);
}

bool DatabaseManager::is_healthy() const {
    return pImpl_->is_healthy();
}
