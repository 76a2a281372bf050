#pragma once

#include "driftwatch/drift_detector.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace driftwatch {

using TimePoint = std::chrono::system_clock::time_point;

enum class AlertType {
    DriftDetected,
    QualityDegradation,
    SecurityIssue,
    PerformanceRegression,
    DependencyUpdate,
    ComplexityIncrease,
    CoverageDrop,
    DocumentationStale,
    BuildFailure,
    TestFailure
};

enum class AlertSeverity {
    Info,
    Warning,
    Error,
    Critical
};

std::string to_string(AlertType type);
std::string to_string(AlertSeverity severity);
std::optional<AlertType> alert_type_from_string(const std::string& text);
std::optional<AlertSeverity> alert_severity_from_string(const std::string& text);

AlertSeverity to_alert_severity(DriftSeverity severity);
AlertType to_alert_type(DriftType type);

struct DeliveryResult {
    bool success = false;
    std::string reason;
    TimePoint delivered_at{};
};

struct Alert {
    int64_t id = 0;
    TimePoint created_at{};
    AlertType type = AlertType::DriftDetected;
    AlertSeverity severity = AlertSeverity::Info;
    std::string title;
    std::string message;
    std::map<std::string, std::string> context;
    std::string fingerprint;
    std::string file_path;
    int occurrence_count = 1;
    std::optional<TimePoint> last_notified_at;
    bool resolved = false;
    std::string resolution_note;
    std::optional<TimePoint> resolved_at;
    std::map<std::string, DeliveryResult> delivery_log;   // channel name -> latest result
};

// Input to AlertSystem::create_alert
struct AlertEvent {
    AlertType type = AlertType::DriftDetected;
    AlertSeverity severity = AlertSeverity::Info;
    std::string title;
    std::string message;
    std::string file_path;
    std::string spec_reference;
    std::string drift_type;
    std::map<std::string, std::string> context;
};

struct AlertFilter {
    std::optional<AlertType> type;
    std::optional<AlertSeverity> min_severity;
    std::optional<bool> resolved;
    std::optional<std::string> file_path;
    size_t limit = 100;
    size_t offset = 0;
};

struct AlertSummary {
    size_t total = 0;
    size_t total_unresolved = 0;
    size_t recent_count = 0;   // Created within the last hour
    std::map<AlertType, size_t> by_type;
    std::map<AlertSeverity, size_t> by_severity;   // Unresolved only
    std::vector<std::pair<std::string, size_t>> top_files;
};

int64_t to_millis(TimePoint time);
TimePoint from_millis(int64_t millis);

// JSON text for a single alert, used by the file and webhook channels
std::string alert_to_json(const Alert& alert);

// Items serialized into an alert context and back
std::string drift_items_to_json(const std::vector<DriftItem>& items);
std::vector<DriftItem> drift_items_from_json(const std::string& text);

} // namespace driftwatch
