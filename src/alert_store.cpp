#include "driftwatch/alert_store.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>

namespace driftwatch {

using nlohmann::json;

// Owns one prepared statement; finalized on scope exit
class AlertStore::Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }
    void bind_null(int index) { sqlite3_bind_null(stmt_, index); }

    // True while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
    }

    int64_t int_at(int column) const { return sqlite3_column_int64(stmt_, column); }
    bool is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }
    std::string text_at(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

namespace {

const char* kColumns =
    "id, type, severity, title, message, context, fingerprint, file_path, "
    "occurrence_count, created_at, last_notified_at, resolved, resolution_note, "
    "resolved_at, delivery_log";

std::string context_to_json(const std::map<std::string, std::string>& context) {
    return json(context).dump();
}

std::map<std::string, std::string> context_from_json(const std::string& text) {
    std::map<std::string, std::string> context;
    json j = json::parse(text, nullptr, false);
    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) {
                context[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return context;
}

std::string delivery_log_to_json(const std::map<std::string, DeliveryResult>& log) {
    json j = json::object();
    for (const auto& [channel, result] : log) {
        j[channel] = {
            {"success", result.success},
            {"reason", result.reason},
            {"delivered_at", to_millis(result.delivered_at)}
        };
    }
    return j.dump();
}

std::map<std::string, DeliveryResult> delivery_log_from_json(const std::string& text) {
    std::map<std::string, DeliveryResult> log;
    json j = json::parse(text, nullptr, false);
    if (!j.is_object()) {
        return log;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& entry = it.value();
        if (!entry.is_object()) {
            continue;
        }
        DeliveryResult result;
        result.success = entry.value("success", false);
        result.reason = entry.value("reason", std::string());
        result.delivered_at = from_millis(entry.value("delivered_at", int64_t{0}));
        log[it.key()] = result;
    }
    return log;
}

} // namespace

AlertStore::AlertStore(const std::string& db_path)
    : db_path_(db_path)
{
    if (db_path_ != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(db_path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open alert database " + db_path_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);
    create_schema();
    Logger::debug("Alert store opened at ", db_path_);
}

AlertStore::~AlertStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void AlertStore::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw StoreError("SQL error: " + message);
    }
}

void AlertStore::create_schema() {
    exec("CREATE TABLE IF NOT EXISTS alerts ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "type TEXT NOT NULL,"
         "severity INTEGER NOT NULL,"
         "title TEXT NOT NULL,"
         "message TEXT NOT NULL,"
         "context TEXT NOT NULL DEFAULT '{}',"
         "fingerprint TEXT NOT NULL,"
         "file_path TEXT NOT NULL DEFAULT '',"
         "occurrence_count INTEGER NOT NULL DEFAULT 1,"
         "created_at INTEGER NOT NULL,"
         "last_notified_at INTEGER,"
         "resolved INTEGER NOT NULL DEFAULT 0,"
         "resolution_note TEXT NOT NULL DEFAULT '',"
         "resolved_at INTEGER,"
         "delivery_log TEXT NOT NULL DEFAULT '{}')");
    exec("CREATE INDEX IF NOT EXISTS idx_alerts_fingerprint ON alerts(fingerprint)");
    exec("CREATE INDEX IF NOT EXISTS idx_alerts_resolved_severity ON alerts(resolved, severity)");
}

int64_t AlertStore::insert(const Alert& alert) {
    if (alert.fingerprint.empty()) {
        throw StoreError("Refusing to store an alert without a fingerprint");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO alerts (type, severity, title, message, context, fingerprint, file_path, "
        "occurrence_count, created_at, last_notified_at, resolved, resolution_note, resolved_at, "
        "delivery_log) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, to_string(alert.type));
    stmt.bind(2, static_cast<int64_t>(alert.severity));
    stmt.bind(3, alert.title);
    stmt.bind(4, alert.message);
    stmt.bind(5, context_to_json(alert.context));
    stmt.bind(6, alert.fingerprint);
    stmt.bind(7, alert.file_path);
    stmt.bind(8, static_cast<int64_t>(alert.occurrence_count));
    stmt.bind(9, to_millis(alert.created_at));
    if (alert.last_notified_at) stmt.bind(10, to_millis(*alert.last_notified_at)); else stmt.bind_null(10);
    stmt.bind(11, static_cast<int64_t>(alert.resolved ? 1 : 0));
    stmt.bind(12, alert.resolution_note);
    if (alert.resolved_at) stmt.bind(13, to_millis(*alert.resolved_at)); else stmt.bind_null(13);
    stmt.bind(14, delivery_log_to_json(alert.delivery_log));
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

void AlertStore::update(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "UPDATE alerts SET severity = ?, title = ?, message = ?, context = ?, "
        "occurrence_count = ?, last_notified_at = ?, resolved = ?, resolution_note = ?, "
        "resolved_at = ?, delivery_log = ? WHERE id = ?");
    stmt.bind(1, static_cast<int64_t>(alert.severity));
    stmt.bind(2, alert.title);
    stmt.bind(3, alert.message);
    stmt.bind(4, context_to_json(alert.context));
    stmt.bind(5, static_cast<int64_t>(alert.occurrence_count));
    if (alert.last_notified_at) stmt.bind(6, to_millis(*alert.last_notified_at)); else stmt.bind_null(6);
    stmt.bind(7, static_cast<int64_t>(alert.resolved ? 1 : 0));
    stmt.bind(8, alert.resolution_note);
    if (alert.resolved_at) stmt.bind(9, to_millis(*alert.resolved_at)); else stmt.bind_null(9);
    stmt.bind(10, delivery_log_to_json(alert.delivery_log));
    stmt.bind(11, alert.id);
    stmt.step();

    if (sqlite3_changes(db_) == 0) {
        throw StoreError("No alert with id " + std::to_string(alert.id));
    }
}

std::vector<Alert> AlertStore::select(const std::string& where_clause,
                                      const std::vector<std::string>& params,
                                      const std::string& tail) const {
    std::string sql = std::string("SELECT ") + kColumns + " FROM alerts";
    if (!where_clause.empty()) {
        sql += " WHERE " + where_clause;
    }
    sql += tail;

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, sql);
    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }

    std::vector<Alert> alerts;
    while (stmt.step()) {
        Alert alert;
        alert.id = stmt.int_at(0);
        alert.type = alert_type_from_string(stmt.text_at(1)).value_or(AlertType::DriftDetected);
        int severity = static_cast<int>(stmt.int_at(2));
        if (severity >= 0 && severity <= static_cast<int>(AlertSeverity::Critical)) {
            alert.severity = static_cast<AlertSeverity>(severity);
        }
        alert.title = stmt.text_at(3);
        alert.message = stmt.text_at(4);
        alert.context = context_from_json(stmt.text_at(5));
        alert.fingerprint = stmt.text_at(6);
        alert.file_path = stmt.text_at(7);
        alert.occurrence_count = static_cast<int>(stmt.int_at(8));
        alert.created_at = from_millis(stmt.int_at(9));
        if (!stmt.is_null(10)) alert.last_notified_at = from_millis(stmt.int_at(10));
        alert.resolved = stmt.int_at(11) != 0;
        alert.resolution_note = stmt.text_at(12);
        if (!stmt.is_null(13)) alert.resolved_at = from_millis(stmt.int_at(13));
        alert.delivery_log = delivery_log_from_json(stmt.text_at(14));
        alerts.push_back(std::move(alert));
    }
    return alerts;
}

std::optional<Alert> AlertStore::find(int64_t id) const {
    auto alerts = select("id = ?", {std::to_string(id)}, "");
    if (alerts.empty()) {
        return std::nullopt;
    }
    return alerts.front();
}

std::optional<Alert> AlertStore::find_open_by_fingerprint(const std::string& fingerprint) const {
    auto alerts = select("fingerprint = ? AND resolved = 0", {fingerprint}, " ORDER BY id DESC LIMIT 1");
    if (alerts.empty()) {
        return std::nullopt;
    }
    return alerts.front();
}

std::vector<Alert> AlertStore::query(const AlertFilter& filter) const {
    std::string where;
    std::vector<std::string> params;
    auto add = [&](const std::string& clause) {
        if (!where.empty()) where += " AND ";
        where += clause;
    };

    if (filter.type) {
        add("type = ?");
        params.push_back(to_string(*filter.type));
    }
    if (filter.min_severity) {
        add("severity >= ?");
        params.push_back(std::to_string(static_cast<int>(*filter.min_severity)));
    }
    if (filter.resolved) {
        add(*filter.resolved ? "resolved = 1" : "resolved = 0");
    }
    if (filter.file_path) {
        add("file_path = ?");
        params.push_back(*filter.file_path);
    }

    std::string tail = " ORDER BY created_at DESC, id DESC LIMIT " + std::to_string(filter.limit) +
                       " OFFSET " + std::to_string(filter.offset);
    return select(where, params, tail);
}

AlertSummary AlertStore::summarize(TimePoint now) const {
    AlertSummary summary;
    int64_t recent_cutoff = to_millis(now - std::chrono::hours(1));

    std::lock_guard<std::mutex> lock(mutex_);
    {
        Statement stmt(db_, "SELECT type, severity, resolved, created_at FROM alerts");
        while (stmt.step()) {
            ++summary.total;
            auto type = alert_type_from_string(stmt.text_at(0)).value_or(AlertType::DriftDetected);
            ++summary.by_type[type];
            if (stmt.int_at(2) == 0) {
                ++summary.total_unresolved;
                int severity = static_cast<int>(stmt.int_at(1));
                if (severity >= 0 && severity <= static_cast<int>(AlertSeverity::Critical)) {
                    ++summary.by_severity[static_cast<AlertSeverity>(severity)];
                }
            }
            if (stmt.int_at(3) >= recent_cutoff) {
                ++summary.recent_count;
            }
        }
    }
    {
        Statement stmt(db_,
            "SELECT file_path, COUNT(*) AS n FROM alerts WHERE resolved = 0 AND file_path != '' "
            "GROUP BY file_path ORDER BY n DESC, file_path ASC LIMIT 5");
        while (stmt.step()) {
            summary.top_files.emplace_back(stmt.text_at(0), static_cast<size_t>(stmt.int_at(1)));
        }
    }
    return summary;
}

size_t AlertStore::purge_resolved_before(TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM alerts WHERE resolved = 1 AND resolved_at IS NOT NULL AND resolved_at < ?");
    stmt.bind(1, to_millis(cutoff));
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

} // namespace driftwatch
