#include <catch2/catch_test_macros.hpp>
#include "driftwatch/alert_system.hpp"
#include "driftwatch/errors.hpp"
#include <atomic>
#include <thread>

using namespace driftwatch;
using namespace std::chrono_literals;

namespace {

class CountingChannel : public AlertChannel {
public:
    DeliveryResult send(const Alert& alert) override {
        ++count;
        last_title = alert.title;
        return {true, "", std::chrono::system_clock::now()};
    }

    std::atomic<int> count{0};
    std::string last_title;
};

class FailingChannel : public AlertChannel {
public:
    DeliveryResult send(const Alert&) override {
        throw ChannelDeliveryError("smtp connection refused");
    }
};

class IntThrowingChannel : public AlertChannel {
public:
    DeliveryResult send(const Alert&) override {
        throw 42;
    }
};

class SlowChannel : public AlertChannel {
public:
    DeliveryResult send(const Alert&) override {
        std::this_thread::sleep_for(300ms);
        return {true, "", std::chrono::system_clock::now()};
    }
};

// Manually advanced clock shared with the alert system
struct ManualClock {
    TimePoint now = from_millis(to_millis(std::chrono::system_clock::now()));

    AlertSystem::Clock function() {
        return [this]() { return now; };
    }
};

AlertEvent drift_event(AlertSeverity severity, const std::string& file = "src/calc.py") {
    AlertEvent event;
    event.type = AlertType::DriftDetected;
    event.severity = severity;
    event.title = "signature_mismatch in " + file;
    event.message = "- Signature of 'calc' differs";
    event.file_path = file;
    event.spec_reference = "specs/calculator.md";
    event.drift_type = "signature_mismatch";
    return event;
}

} // namespace

TEST_CASE("Repeated drift within the suppression window is delivered once", "[alerts]") {
    ManualClock clock;
    AlertSystemOptions options;
    options.default_suppression_window = 60s;
    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {}, options, clock.function());
    auto channel = std::make_shared<CountingChannel>();
    system.register_channel("log", channel);

    CreateResult first = system.create_alert(drift_event(AlertSeverity::Error));
    REQUIRE(first.outcome == CreateOutcome::Created);
    REQUIRE(system.flush() == 1);

    clock.now += 5s;
    CreateResult second = system.create_alert(drift_event(AlertSeverity::Error));
    REQUIRE(second.outcome == CreateOutcome::Suppressed);
    REQUIRE(second.alert.id == first.alert.id);
    REQUIRE(system.flush() == 0);

    REQUIRE(channel->count == 1);
    auto stored = system.get(first.alert.id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->occurrence_count == 2);
    REQUIRE(system.list().size() == 1);

    SECTION("Recurrence after the window is redelivered") {
        clock.now += 61s;
        CreateResult third = system.create_alert(drift_event(AlertSeverity::Error));
        REQUIRE(third.outcome == CreateOutcome::Redelivered);
        REQUIRE(system.flush() == 1);
        REQUIRE(channel->count == 2);
        REQUIRE(system.get(first.alert.id)->occurrence_count == 3);
    }

    SECTION("Recurrence after resolution opens a new alert") {
        REQUIRE(system.resolve(first.alert.id, "fixed upstream"));
        CreateResult reopened = system.create_alert(drift_event(AlertSeverity::Error));
        REQUIRE(reopened.outcome == CreateOutcome::Created);
        REQUIRE(reopened.alert.id != first.alert.id);
        REQUIRE(system.list().size() == 2);
    }

    SECTION("Severity escalates to the highest occurrence") {
        CreateResult escalated = system.create_alert(drift_event(AlertSeverity::Critical));
        REQUIRE(escalated.alert.severity == AlertSeverity::Critical);
    }
}

TEST_CASE("Rules route alerts by severity", "[alerts]") {
    AlertRule everything;
    everything.name = "everything";
    everything.channels = {"log"};

    AlertRule urgent;
    urgent.name = "urgent";
    urgent.min_severity = AlertSeverity::Warning;
    urgent.channels = {"webhook"};

    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {everything, urgent});
    auto log = std::make_shared<CountingChannel>();
    auto webhook = std::make_shared<CountingChannel>();
    system.register_channel("log", log);
    system.register_channel("webhook", webhook);

    SECTION("Info alert skips the webhook") {
        CreateResult created = system.create_alert(drift_event(AlertSeverity::Info));
        REQUIRE(system.channels_for(created.alert) == std::vector<std::string>{"log"});
        system.flush();
        REQUIRE(log->count == 1);
        REQUIRE(webhook->count == 0);
    }

    SECTION("Warning alert reaches both") {
        system.create_alert(drift_event(AlertSeverity::Warning));
        system.flush();
        REQUIRE(log->count == 1);
        REQUIRE(webhook->count == 1);
    }

    SECTION("Type filter") {
        AlertRule docs_only;
        docs_only.types = {AlertType::DocumentationStale};
        REQUIRE(docs_only.matches(AlertType::DocumentationStale, AlertSeverity::Info));
        REQUIRE_FALSE(docs_only.matches(AlertType::DriftDetected, AlertSeverity::Critical));
    }
}

TEST_CASE("Rule suppression windows override the default", "[alerts]") {
    AlertRule critical;
    critical.name = "critical";
    critical.min_severity = AlertSeverity::Critical;
    critical.channels = {"log"};
    critical.suppression_window = 3600s;

    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {critical});
    REQUIRE(system.suppression_window_for(AlertType::DriftDetected, AlertSeverity::Critical) == 3600s);
    REQUIRE(system.suppression_window_for(AlertType::DriftDetected, AlertSeverity::Error) == 300s);
}

TEST_CASE("Channel failures are isolated", "[alerts]") {
    AlertSystemOptions options;
    options.channel_timeout = 2000ms;
    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {}, options);
    auto log = std::make_shared<CountingChannel>();
    system.register_channel("log", log);

    SECTION("A throwing channel does not affect the others") {
        system.register_channel("email", std::make_shared<FailingChannel>());
        CreateResult created = system.create_alert(drift_event(AlertSeverity::Error));

        auto results = system.dispatch(created.alert);
        REQUIRE(results.size() == 2);
        REQUIRE(results.at("log").success);
        REQUIRE_FALSE(results.at("email").success);
        REQUIRE(results.at("email").reason.find("smtp connection refused") != std::string::npos);

        auto stored = system.get(created.alert.id);
        REQUIRE(stored->delivery_log.size() == 2);
        REQUIRE(stored->last_notified_at.has_value());
    }

    SECTION("A channel throwing a non-standard exception is recorded as failed") {
        system.register_channel("pager", std::make_shared<IntThrowingChannel>());
        CreateResult created = system.create_alert(drift_event(AlertSeverity::Error));

        std::map<std::string, DeliveryResult> results;
        REQUIRE_NOTHROW(results = system.dispatch(created.alert));
        REQUIRE(results.at("log").success);
        REQUIRE_FALSE(results.at("pager").success);
        REQUIRE(results.at("pager").reason == "unknown error");
        REQUIRE(system.get(created.alert.id)->delivery_log.size() == 2);
    }

    SECTION("A slow channel times out on its own") {
        system.register_channel("slow", std::make_shared<SlowChannel>(), 50ms);
        CreateResult created = system.create_alert(drift_event(AlertSeverity::Error));

        auto results = system.dispatch(created.alert);
        REQUIRE(results.at("log").success);
        REQUIRE_FALSE(results.at("slow").success);
        REQUIRE(results.at("slow").reason.find("timed out") != std::string::npos);
    }
}

TEST_CASE("Delivery to an unregistered channel is recorded", "[alerts]") {
    AlertRule rule;
    rule.name = "pager";
    rule.channels = {"pager"};
    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {rule});

    CreateResult created = system.create_alert(drift_event(AlertSeverity::Error));
    auto results = system.dispatch(created.alert);
    REQUIRE_FALSE(results.at("pager").success);
    REQUIRE(results.at("pager").reason == "channel not registered");
}

TEST_CASE("Resolve is idempotent", "[alerts]") {
    AlertSystem system(std::make_unique<AlertStore>(":memory:"), {});
    CreateResult created = system.create_alert(drift_event(AlertSeverity::Warning));

    REQUIRE(system.resolve(created.alert.id, "first"));
    REQUIRE(system.resolve(created.alert.id, "second"));
    REQUIRE(system.get(created.alert.id)->resolution_note == "first");
    REQUIRE_FALSE(system.resolve(created.alert.id + 42, "missing"));

    AlertSummary summary = system.summary();
    REQUIRE(summary.total == 1);
    REQUIRE(summary.total_unresolved == 0);
}

TEST_CASE("AlertSystem requires a store", "[alerts]") {
    REQUIRE_THROWS_AS(AlertSystem(nullptr, {}), ConfigError);
}

TEST_CASE("Rate limiter caps deliveries per channel", "[alerts]") {
    DeliveryRateLimiter limiter(2, 0);
    TimePoint now = std::chrono::system_clock::now();

    REQUIRE(limiter.try_acquire("hook", now));
    REQUIRE(limiter.try_acquire("hook", now));
    REQUIRE_FALSE(limiter.try_acquire("hook", now));
    REQUIRE(limiter.try_acquire("log", now));
    REQUIRE(limiter.try_acquire("hook", now + 61s));

    DeliveryRateLimiter unlimited(0, 0);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(unlimited.try_acquire("hook", now));
    }
}

TEST_CASE("Drift reports become one event per drift type", "[alerts]") {
    DriftReport report;
    report.file_path = "src/calc.py";
    report.spec_reference = "specs/calculator.md";
    report.spec_loaded = true;

    DriftItem mismatch;
    mismatch.drift_type = DriftType::SignatureMismatch;
    mismatch.severity = DriftSeverity::High;
    mismatch.element_id = "calc";
    mismatch.description = "calc differs";
    report.items.push_back(mismatch);

    DriftItem second = mismatch;
    second.element_id = "add";
    second.severity = DriftSeverity::Medium;
    report.items.push_back(second);

    DriftItem missing;
    missing.drift_type = DriftType::MissingImplementation;
    missing.severity = DriftSeverity::High;
    missing.element_id = "sub";
    report.items.push_back(missing);

    auto events = events_from_report(report);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].drift_type == "missing_implementation");
    REQUIRE(events[1].drift_type == "signature_mismatch");
    REQUIRE(events[1].severity == AlertSeverity::Error);
    REQUIRE(events[1].title == "signature_mismatch in src/calc.py (2 items)");
    REQUIRE(events[1].context.at("element_ids") == "calc,add");

    auto items = drift_items_from_json(events[1].context.at("items"));
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].element_id == "calc");

    REQUIRE(AlertSystem::fingerprint(events[0]) != AlertSystem::fingerprint(events[1]));
    REQUIRE(events_from_report(DriftReport{}).empty());
}
