#pragma once

#include "driftwatch/alert.hpp"
#include "driftwatch/alert_channels.hpp"
#include "driftwatch/alert_store.hpp"
#include "driftwatch/drift_detector.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace driftwatch {

struct AlertRule {
    std::string name;
    std::set<AlertType> types;      // Empty matches every type
    AlertSeverity min_severity = AlertSeverity::Info;
    std::vector<std::string> channels;
    std::optional<std::chrono::seconds> suppression_window;

    bool matches(AlertType type, AlertSeverity severity) const;
};

struct AlertSystemOptions {
    std::chrono::seconds default_suppression_window{300};
    std::chrono::milliseconds channel_timeout{5000};
    int max_per_minute = 0;     // Per channel; 0 is unlimited
    int max_per_hour = 0;
};

enum class CreateOutcome {
    Created,
    Suppressed,
    Redelivered
};

std::string to_string(CreateOutcome outcome);

struct CreateResult {
    CreateOutcome outcome = CreateOutcome::Created;
    Alert alert;
};

// Sliding-window delivery limits per channel
class DeliveryRateLimiter {
public:
    DeliveryRateLimiter(int max_per_minute, int max_per_hour);

    // Records the delivery and returns true when it is within limits
    bool try_acquire(const std::string& channel, TimePoint now);

private:
    int max_per_minute_;
    int max_per_hour_;
    std::map<std::string, std::deque<TimePoint>> history_;
    std::mutex mutex_;
};

class AlertSystem {
public:
    using Clock = std::function<TimePoint()>;

    AlertSystem(std::unique_ptr<AlertStore> store,
                std::vector<AlertRule> rules,
                AlertSystemOptions options = {},
                Clock clock = nullptr);

    void register_channel(const std::string& name,
                          std::shared_ptr<AlertChannel> channel,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Deduplicate by fingerprint, persist, and queue for dispatch
    CreateResult create_alert(const AlertEvent& event);

    // Deliver to every subscribed channel concurrently; one channel's
    // failure or timeout never affects another's entry
    std::map<std::string, DeliveryResult> dispatch(const Alert& alert);

    // Dispatch everything queued by create_alert; returns the number of alerts sent
    size_t flush();
    size_t pending() const;

    // Idempotent; false for an unknown id
    bool resolve(int64_t id, const std::string& note);

    std::vector<Alert> list(const AlertFilter& filter = {}) const;
    std::optional<Alert> get(int64_t id) const;
    AlertSummary summary() const;

    // Remove resolved alerts older than the given age; returns rows removed
    size_t purge_resolved(std::chrono::hours older_than);

    // Channel names subscribed to this alert's type and severity
    std::vector<std::string> channels_for(const Alert& alert) const;
    std::chrono::seconds suppression_window_for(AlertType type, AlertSeverity severity) const;

    static std::string fingerprint(const AlertEvent& event);

private:
    struct RegisteredChannel {
        std::shared_ptr<AlertChannel> channel;
        std::chrono::milliseconds timeout;
    };

    void enqueue(int64_t id);

    std::unique_ptr<AlertStore> store_;
    std::vector<AlertRule> rules_;
    AlertSystemOptions options_;
    Clock clock_;
    DeliveryRateLimiter rate_limiter_;

    std::map<std::string, RegisteredChannel> channels_;
    mutable std::mutex channels_mutex_;

    std::vector<int64_t> pending_;
    mutable std::mutex pending_mutex_;

    // Serializes check-and-insert, resolve and delivery bookkeeping
    std::mutex writer_mutex_;
};

// One event per drift type present in the report, carrying its items as
// JSON in the context so suggestions can be rebuilt later
std::vector<AlertEvent> events_from_report(const DriftReport& report);

} // namespace driftwatch
