#include <catch2/catch_test_macros.hpp>
#include "driftwatch/alert_store.hpp"
#include "driftwatch/errors.hpp"
#include <filesystem>

using namespace driftwatch;
using namespace std::chrono_literals;

namespace {

Alert make_alert(const std::string& fingerprint, AlertSeverity severity,
                 const std::string& file, TimePoint created) {
    Alert alert;
    alert.created_at = created;
    alert.type = AlertType::DriftDetected;
    alert.severity = severity;
    alert.title = "signature_mismatch in " + file;
    alert.message = "- calc differs";
    alert.fingerprint = fingerprint;
    alert.file_path = file;
    alert.context["file_path"] = file;
    return alert;
}

} // namespace

TEST_CASE("AlertStore persists alerts across reopen", "[store]") {
    auto dir = std::filesystem::temp_directory_path() / "driftwatch_store_test";
    std::filesystem::remove_all(dir);
    std::string db_path = (dir / "alerts.db").string();
    TimePoint now = from_millis(to_millis(std::chrono::system_clock::now()));

    int64_t id = 0;
    {
        AlertStore store(db_path);
        Alert alert = make_alert("fp-1", AlertSeverity::Error, "src/calc.py", now);
        alert.delivery_log["log"] = DeliveryResult{true, "", now};
        alert.delivery_log["email"] = DeliveryResult{false, "smtp down", now};
        id = store.insert(alert);
        REQUIRE(id > 0);
    }

    AlertStore reopened(db_path);
    auto loaded = reopened.find(id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->fingerprint == "fp-1");
    REQUIRE(loaded->severity == AlertSeverity::Error);
    REQUIRE(loaded->file_path == "src/calc.py");
    REQUIRE(loaded->context.at("file_path") == "src/calc.py");
    REQUIRE(to_millis(loaded->created_at) == to_millis(now));
    REQUIRE(loaded->delivery_log.size() == 2);
    REQUIRE(loaded->delivery_log.at("log").success);
    REQUIRE_FALSE(loaded->delivery_log.at("email").success);
    REQUIRE(loaded->delivery_log.at("email").reason == "smtp down");

    std::filesystem::remove_all(dir);
}

TEST_CASE("AlertStore updates and fingerprint lookup", "[store]") {
    AlertStore store(":memory:");
    TimePoint now = std::chrono::system_clock::now();

    Alert alert = make_alert("fp-1", AlertSeverity::Warning, "a.py", now);
    alert.id = store.insert(alert);

    SECTION("Open alert found by fingerprint") {
        auto open = store.find_open_by_fingerprint("fp-1");
        REQUIRE(open.has_value());
        REQUIRE(open->id == alert.id);
        REQUIRE_FALSE(store.find_open_by_fingerprint("fp-2").has_value());
    }

    SECTION("Resolved alerts are not open") {
        alert.resolved = true;
        alert.resolved_at = now;
        alert.resolution_note = "fixed";
        store.update(alert);
        REQUIRE_FALSE(store.find_open_by_fingerprint("fp-1").has_value());
        REQUIRE(store.find(alert.id)->resolution_note == "fixed");
    }

    SECTION("Update of an unknown id throws") {
        Alert ghost = alert;
        ghost.id = alert.id + 100;
        REQUIRE_THROWS_AS(store.update(ghost), StoreError);
    }

    SECTION("Empty fingerprint is rejected") {
        REQUIRE_THROWS_AS(store.insert(make_alert("", AlertSeverity::Info, "a.py", now)), StoreError);
    }
}

TEST_CASE("AlertStore queries and summaries", "[store]") {
    AlertStore store(":memory:");
    TimePoint now = std::chrono::system_clock::now();

    store.insert(make_alert("fp-1", AlertSeverity::Info, "a.py", now - 3h));
    store.insert(make_alert("fp-2", AlertSeverity::Error, "a.py", now - 2h));
    store.insert(make_alert("fp-3", AlertSeverity::Critical, "b.py", now - 1min));
    Alert resolved = make_alert("fp-4", AlertSeverity::Critical, "c.py", now - 30s);
    resolved.resolved = true;
    resolved.resolved_at = now - 10s;
    store.insert(resolved);

    SECTION("Newest first with limit and offset") {
        AlertFilter filter;
        auto all = store.query(filter);
        REQUIRE(all.size() == 4);
        REQUIRE(all[0].fingerprint == "fp-4");
        REQUIRE(all[3].fingerprint == "fp-1");

        filter.limit = 2;
        filter.offset = 1;
        auto page = store.query(filter);
        REQUIRE(page.size() == 2);
        REQUIRE(page[0].fingerprint == "fp-3");
    }

    SECTION("Filters") {
        AlertFilter filter;
        filter.min_severity = AlertSeverity::Error;
        filter.resolved = false;
        REQUIRE(store.query(filter).size() == 2);

        AlertFilter by_file;
        by_file.file_path = std::string("a.py");
        REQUIRE(store.query(by_file).size() == 2);

        AlertFilter by_type;
        by_type.type = AlertType::SecurityIssue;
        REQUIRE(store.query(by_type).empty());
    }

    SECTION("Summary") {
        AlertSummary summary = store.summarize(now);
        REQUIRE(summary.total == 4);
        REQUIRE(summary.total_unresolved == 3);
        REQUIRE(summary.recent_count == 2);
        REQUIRE(summary.by_type[AlertType::DriftDetected] == 4);
        REQUIRE(summary.by_severity[AlertSeverity::Critical] == 1);
        REQUIRE(summary.top_files.size() == 2);
        REQUIRE(summary.top_files[0].first == "a.py");
        REQUIRE(summary.top_files[0].second == 2);
    }

    SECTION("Purge removes only resolved alerts older than the cutoff") {
        REQUIRE(store.purge_resolved_before(now - 1min) == 0);
        REQUIRE(store.purge_resolved_before(now) == 1);
        REQUIRE(store.query(AlertFilter{}).size() == 3);
    }
}
