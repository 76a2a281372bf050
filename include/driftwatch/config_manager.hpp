#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace driftwatch {

struct MonitorConfig {
    double scan_interval = 30.0;   // Seconds, fractional allowed
    std::vector<std::string> watch_patterns;   // Empty watches every file
    std::vector<std::string> ignore_patterns = {".git", ".driftwatch", "build", "node_modules"};
    double max_cpu_percent = 50.0;
    double max_memory_mb = 512.0;
    int batch_size = 50;
    std::vector<std::string> enabled_checks = {
        "missing_implementation", "signature_mismatch", "behavior_deviation",
        "documentation_stale", "dependency_drift", "api_breaking_change"
    };
    int queue_capacity = 1024;
    std::string overflow_policy = "drop_oldest";
    int worker_threads = 2;
    bool watch_filesystem = true;
    double poll_interval = 2.0;
    bool scan_on_start = true;
    int max_retries = 3;
    bool suggest_on_alert = false;

    TYPICONF_DEFINE_FIELDS(MonitorConfig,
        TYPICONF_FIELD(scan_interval),
        TYPICONF_FIELD(watch_patterns),
        TYPICONF_FIELD(ignore_patterns),
        TYPICONF_FIELD(max_cpu_percent),
        TYPICONF_FIELD(max_memory_mb),
        TYPICONF_FIELD(batch_size),
        TYPICONF_FIELD(enabled_checks),
        TYPICONF_FIELD(queue_capacity),
        TYPICONF_FIELD(overflow_policy),
        TYPICONF_FIELD(worker_threads),
        TYPICONF_FIELD(watch_filesystem),
        TYPICONF_FIELD(poll_interval),
        TYPICONF_FIELD(scan_on_start),
        TYPICONF_FIELD(max_retries),
        TYPICONF_FIELD(suggest_on_alert)
    )
};

struct WeightsConfig {
    double missing_implementation = 0.9;
    double signature_mismatch = 0.85;
    double behavior_deviation = 0.7;
    double documentation_stale = 0.6;
    double dependency_drift = 0.8;
    double api_breaking_change = 0.95;

    TYPICONF_DEFINE_FIELDS(WeightsConfig,
        TYPICONF_FIELD(missing_implementation),
        TYPICONF_FIELD(signature_mismatch),
        TYPICONF_FIELD(behavior_deviation),
        TYPICONF_FIELD(documentation_stale),
        TYPICONF_FIELD(dependency_drift),
        TYPICONF_FIELD(api_breaking_change)
    )
};

struct DriftConfig {
    double min_confidence = 0.5;
    WeightsConfig weights;

    TYPICONF_DEFINE_FIELDS(DriftConfig,
        TYPICONF_FIELD(min_confidence),
        TYPICONF_FIELD(weights)
    )
};

struct ChannelConfig {
    std::string name;
    std::string kind;               // log, file, console, webhook, email
    std::string path;               // file
    std::string url;                // webhook, email (smtp:// or smtps://)
    std::vector<std::string> headers;   // webhook, "Name: value"
    std::vector<std::string> recipients;   // email
    std::string sender = "driftwatch@localhost";
    std::string username;           // email, SMTP login
    std::string password;
    std::string color_scheme = "default";   // console
    int timeout_ms = 0;             // 0 uses alerts.channel_timeout_ms

    TYPICONF_DEFINE_FIELDS(ChannelConfig,
        TYPICONF_FIELD(name),
        TYPICONF_FIELD(kind),
        TYPICONF_FIELD(path),
        TYPICONF_FIELD(url),
        TYPICONF_FIELD(headers),
        TYPICONF_FIELD(recipients),
        TYPICONF_FIELD(sender),
        TYPICONF_FIELD(username),
        TYPICONF_FIELD(password),
        TYPICONF_FIELD(color_scheme),
        TYPICONF_FIELD(timeout_ms)
    )
};

struct AlertRuleConfig {
    std::string name;
    std::vector<std::string> types;     // Empty matches every type
    std::string min_severity = "info";
    std::vector<std::string> channels;
    int suppression_window = 0;         // Seconds; 0 uses the default window

    TYPICONF_DEFINE_FIELDS(AlertRuleConfig,
        TYPICONF_FIELD(name),
        TYPICONF_FIELD(types),
        TYPICONF_FIELD(min_severity),
        TYPICONF_FIELD(channels),
        TYPICONF_FIELD(suppression_window)
    )
};

struct AlertsConfig {
    std::string db_path = ".driftwatch/alerts.db";
    int default_suppression_window = 300;   // Seconds
    int channel_timeout_ms = 5000;
    int max_per_minute = 0;     // 0 is unlimited
    int max_per_hour = 0;
    std::vector<ChannelConfig> channels;
    std::vector<AlertRuleConfig> rules;

    TYPICONF_DEFINE_FIELDS(AlertsConfig,
        TYPICONF_FIELD(db_path),
        TYPICONF_FIELD(default_suppression_window),
        TYPICONF_FIELD(channel_timeout_ms),
        TYPICONF_FIELD(max_per_minute),
        TYPICONF_FIELD(max_per_hour),
        TYPICONF_FIELD(channels),
        TYPICONF_FIELD(rules)
    )
};

struct SuggestionsConfig {
    int enricher_timeout_ms = 10000;
    int max_suggestions = 20;

    TYPICONF_DEFINE_FIELDS(SuggestionsConfig,
        TYPICONF_FIELD(enricher_timeout_ms),
        TYPICONF_FIELD(max_suggestions)
    )
};

struct SourcesConfig {
    std::string spec_catalog = ".driftwatch/specs.json";
    std::string signature_index = ".driftwatch/signatures.json";

    TYPICONF_DEFINE_FIELDS(SourcesConfig,
        TYPICONF_FIELD(spec_catalog),
        TYPICONF_FIELD(signature_index)
    )
};

struct DriftWatchConfig {
    std::string version = "1.0";
    std::string project_path = ".";
    std::string log_level = "info";
    MonitorConfig monitor;
    DriftConfig drift;
    AlertsConfig alerts;
    SuggestionsConfig suggestions;
    SourcesConfig sources;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(DriftWatchConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(project_path),
        TYPICONF_FIELD(log_level),
        TYPICONF_FIELD(monitor),
        TYPICONF_FIELD(drift),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(suggestions),
        TYPICONF_FIELD(sources)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed
    bool check_and_reload();

    // Access configuration
    const DriftWatchConfig& get_config() const { return config_; }
    const std::string& config_path() const { return config_path_; }
    const std::string& last_error() const { return last_error_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    DriftWatchConfig config_;
    std::filesystem::file_time_type last_modified_;
    std::string last_error_;
};

} // namespace driftwatch
