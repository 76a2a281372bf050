#include "driftwatch/alert.hpp"
#include "driftwatch/logger.hpp"
#include <nlohmann/json.hpp>

namespace driftwatch {

using nlohmann::json;

namespace {

struct TypeName {
    AlertType type;
    const char* name;
};

const TypeName kTypeNames[] = {
    {AlertType::DriftDetected,         "drift_detected"},
    {AlertType::QualityDegradation,    "quality_degradation"},
    {AlertType::SecurityIssue,         "security_issue"},
    {AlertType::PerformanceRegression, "performance_regression"},
    {AlertType::DependencyUpdate,      "dependency_update"},
    {AlertType::ComplexityIncrease,    "complexity_increase"},
    {AlertType::CoverageDrop,          "coverage_drop"},
    {AlertType::DocumentationStale,    "documentation_stale"},
    {AlertType::BuildFailure,          "build_failure"},
    {AlertType::TestFailure,           "test_failure"},
};

} // namespace

std::string to_string(AlertType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "drift_detected";
}

std::string to_string(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Info:     return "info";
        case AlertSeverity::Warning:  return "warning";
        case AlertSeverity::Error:    return "error";
        case AlertSeverity::Critical: return "critical";
    }
    return "info";
}

std::optional<AlertType> alert_type_from_string(const std::string& text) {
    for (const auto& entry : kTypeNames) {
        if (text == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<AlertSeverity> alert_severity_from_string(const std::string& text) {
    if (text == "info") return AlertSeverity::Info;
    if (text == "warning") return AlertSeverity::Warning;
    if (text == "error") return AlertSeverity::Error;
    if (text == "critical") return AlertSeverity::Critical;
    return std::nullopt;
}

AlertSeverity to_alert_severity(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::Info:
        case DriftSeverity::Low:      return AlertSeverity::Info;
        case DriftSeverity::Medium:   return AlertSeverity::Warning;
        case DriftSeverity::High:     return AlertSeverity::Error;
        case DriftSeverity::Critical: return AlertSeverity::Critical;
    }
    return AlertSeverity::Info;
}

AlertType to_alert_type(DriftType type) {
    switch (type) {
        case DriftType::DocumentationStale: return AlertType::DocumentationStale;
        case DriftType::DependencyDrift:    return AlertType::DependencyUpdate;
        default:                            return AlertType::DriftDetected;
    }
}

int64_t to_millis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_millis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::string alert_to_json(const Alert& alert) {
    json deliveries = json::object();
    for (const auto& [channel, result] : alert.delivery_log) {
        deliveries[channel] = {
            {"success", result.success},
            {"reason", result.reason},
            {"delivered_at", to_millis(result.delivered_at)}
        };
    }

    json j = {
        {"id", alert.id},
        {"created_at", to_millis(alert.created_at)},
        {"type", to_string(alert.type)},
        {"severity", to_string(alert.severity)},
        {"title", alert.title},
        {"message", alert.message},
        {"context", alert.context},
        {"fingerprint", alert.fingerprint},
        {"file_path", alert.file_path},
        {"occurrence_count", alert.occurrence_count},
        {"resolved", alert.resolved},
        {"resolution_note", alert.resolution_note},
        {"delivery_log", deliveries}
    };
    j["last_notified_at"] = alert.last_notified_at ? json(to_millis(*alert.last_notified_at)) : json(nullptr);
    j["resolved_at"] = alert.resolved_at ? json(to_millis(*alert.resolved_at)) : json(nullptr);
    return j.dump();
}

std::string drift_items_to_json(const std::vector<DriftItem>& items) {
    json array = json::array();
    for (const auto& item : items) {
        json j = {
            {"drift_type", to_string(item.drift_type)},
            {"severity", to_string(item.severity)},
            {"description", item.description},
            {"confidence", item.confidence},
            {"element_id", item.element_id},
            {"expected", item.expected},
            {"actual", item.actual},
            {"public_api", item.public_api}
        };
        j["line"] = item.line_number ? json(*item.line_number) : json(nullptr);
        array.push_back(std::move(j));
    }
    return array.dump();
}

std::vector<DriftItem> drift_items_from_json(const std::string& text) {
    std::vector<DriftItem> items;
    json array = json::parse(text, nullptr, false);
    if (array.is_discarded() || !array.is_array()) {
        Logger::debug("Alert context carries no readable drift items");
        return items;
    }

    for (const auto& j : array) {
        if (!j.is_object()) {
            continue;
        }
        auto type = drift_type_from_string(j.value("drift_type", std::string()));
        auto severity = drift_severity_from_string(j.value("severity", std::string()));
        if (!type || !severity) {
            continue;
        }
        DriftItem item;
        item.drift_type = *type;
        item.severity = *severity;
        item.description = j.value("description", std::string());
        item.confidence = j.value("confidence", 0.0);
        item.element_id = j.value("element_id", std::string());
        item.expected = j.value("expected", std::string());
        item.actual = j.value("actual", std::string());
        item.public_api = j.value("public_api", false);
        if (j.contains("line") && j["line"].is_number_integer()) {
            item.line_number = j["line"].get<int>();
        }
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace driftwatch
