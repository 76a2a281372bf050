#pragma once

#include "driftwatch/alert.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace driftwatch {

// SQLite-backed alert persistence. Every call is serialized on one
// connection; failures throw StoreError.
class AlertStore {
public:
    // Pass ":memory:" for a private in-memory database
    explicit AlertStore(const std::string& db_path);
    ~AlertStore();

    AlertStore(const AlertStore&) = delete;
    AlertStore& operator=(const AlertStore&) = delete;

    // Assigns and returns the new id
    int64_t insert(const Alert& alert);
    void update(const Alert& alert);

    std::optional<Alert> find(int64_t id) const;
    std::optional<Alert> find_open_by_fingerprint(const std::string& fingerprint) const;

    // Newest first
    std::vector<Alert> query(const AlertFilter& filter) const;
    AlertSummary summarize(TimePoint now) const;

    // Returns the number of rows removed
    size_t purge_resolved_before(TimePoint cutoff);

    const std::string& path() const { return db_path_; }

private:
    class Statement;

    void exec(const char* sql);
    void create_schema();
    std::vector<Alert> select(const std::string& where_clause,
                              const std::vector<std::string>& params,
                              const std::string& tail) const;

    std::string db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace driftwatch
