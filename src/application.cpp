#include "driftwatch/application.hpp"
#include "driftwatch/alert_channels.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>

namespace driftwatch {

DetectorOptions to_detector_options(const DriftConfig& drift, const MonitorConfig& monitor) {
    DetectorOptions options;
    options.min_confidence = drift.min_confidence;
    options.weights.missing_implementation = drift.weights.missing_implementation;
    options.weights.signature_mismatch = drift.weights.signature_mismatch;
    options.weights.behavior_deviation = drift.weights.behavior_deviation;
    options.weights.documentation_stale = drift.weights.documentation_stale;
    options.weights.dependency_drift = drift.weights.dependency_drift;
    options.weights.api_breaking_change = drift.weights.api_breaking_change;
    for (const auto& check : monitor.enabled_checks) {
        auto type = drift_type_from_string(check);
        if (!type) {
            throw ConfigError("Unknown check '" + check + "'");
        }
        options.enabled_checks.insert(*type);
    }
    return options;
}

AlertSystemOptions to_alert_options(const AlertsConfig& alerts) {
    AlertSystemOptions options;
    options.default_suppression_window = std::chrono::seconds(alerts.default_suppression_window);
    options.channel_timeout = std::chrono::milliseconds(alerts.channel_timeout_ms);
    options.max_per_minute = alerts.max_per_minute;
    options.max_per_hour = alerts.max_per_hour;
    return options;
}

std::vector<AlertRule> to_alert_rules(const AlertsConfig& alerts) {
    std::vector<AlertRule> rules;
    for (const auto& config : alerts.rules) {
        AlertRule rule;
        rule.name = config.name;
        auto severity = alert_severity_from_string(config.min_severity);
        if (!severity) {
            throw ConfigError("Rule '" + config.name + "' has unknown min_severity '" + config.min_severity + "'");
        }
        rule.min_severity = *severity;
        for (const auto& name : config.types) {
            auto type = alert_type_from_string(name);
            if (!type) {
                throw ConfigError("Rule '" + config.name + "' has unknown alert type '" + name + "'");
            }
            rule.types.insert(*type);
        }
        rule.channels = config.channels;
        if (config.suppression_window > 0) {
            rule.suppression_window = std::chrono::seconds(config.suppression_window);
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

RealignmentOptions to_realignment_options(const SuggestionsConfig& suggestions) {
    RealignmentOptions options;
    options.enricher_timeout = std::chrono::milliseconds(suggestions.enricher_timeout_ms);
    options.max_suggestions = static_cast<size_t>(suggestions.max_suggestions);
    return options;
}

Application::Application(const std::string& config_path)
    : config_path_(config_path)
    , config_manager_(config_path)
{
}

std::string Application::project_file(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(config().project_path) / p).string();
}

bool Application::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        std::cerr << "Failed to load configuration from " << config_path_ << "\n";
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    const auto& config = config_manager_.get_config();
    LogLevel level = LogLevel::Info;
    parse_log_level(config.log_level, level);
    Logger::set_level(level);

    // Initialize components
    try {
        specs_ = std::make_shared<SpecificationCatalog>(project_file(config.sources.spec_catalog));
        try {
            specs_->load();
        } catch (const SpecLoadError& e) {
            Logger::warning(e.what(), "; files will be reported as having no specification");
        }
        signatures_ = std::make_shared<SignatureIndex>(project_file(config.sources.signature_index));
        detector_ = std::make_shared<DriftDetector>(to_detector_options(config.drift, config.monitor));

        auto store = std::make_unique<AlertStore>(project_file(config.alerts.db_path));
        alerts_ = std::make_shared<AlertSystem>(std::move(store), to_alert_rules(config.alerts),
                                                to_alert_options(config.alerts));
        for (ChannelConfig channel : config.alerts.channels) {
            if (channel.kind == "file") {
                channel.path = project_file(channel.path);
            }
            std::optional<std::chrono::milliseconds> timeout;
            if (channel.timeout_ms > 0) {
                timeout = std::chrono::milliseconds(channel.timeout_ms);
            }
            alerts_->register_channel(channel.name, create_channel(channel, config.alerts.channel_timeout_ms), timeout);
        }

        realignment_ = std::make_shared<RealignmentEngine>(to_realignment_options(config.suggestions));
    } catch (const Error& e) {
        std::cerr << "Failed to initialize: " << e.what() << "\n";
        return false;
    }

    return true;
}

int Application::run() {
    if (!alerts_) {
        std::cerr << "Application not initialized. Call initialize() first.\n";
        return 1;
    }

    const auto& config = config_manager_.get_config();

    MonitorDependencies deps;
    deps.specs = specs_;
    deps.signatures = signatures_;
    deps.alerts = alerts_;
    deps.detector = detector_;
    deps.realignment = realignment_;

    std::unique_ptr<MonitorHandle> handle;
    try {
        handle = ContinuousMonitor(deps).start(config.project_path, config.monitor);
    } catch (const ConfigError& e) {
        std::cerr << "Cannot start monitoring: " << e.what() << "\n";
        return 1;
    }

    std::cout << "driftwatch started. Monitoring " << config.project_path
              << " with config: " << config_path_ << "\n";
    std::cout << "Press Ctrl+C to exit.\n\n";

    running_ = true;
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));

        if (specs_->check_and_reload()) {
            Logger::info("Specification catalog reloaded");
        }
        if (config_manager_.check_and_reload()) {
            Logger::warning("Configuration file changed; restart driftwatch to apply it");
        }
    }

    handle->stop();
    MonitorStatus status = handle->status();
    std::cout << "Scans: " << status.scans_completed
              << ", files checked: " << status.files_checked
              << ", alerts created: " << status.alerts_created
              << ", suppressed: " << status.alerts_suppressed
              << ", failures: " << status.scan_failures << "\n";
    return 0;
}

void Application::stop() {
    running_ = false;
}

int Application::check(const std::string& file_path) {
    auto spec = specs_->find(file_path);
    SignatureSet current;
    try {
        current = signatures_->extract(file_path);
    } catch (const ScanError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    DriftReport report = detector_->check(file_path, current, spec.get());
    for (const auto& notice : report.notices) {
        std::cout << notice << "\n";
    }
    if (report.empty()) {
        std::cout << file_path << ": no drift\n";
        return 0;
    }

    std::cout << file_path << " against " << report.spec_reference << ":\n";
    for (const auto& item : report.items) {
        std::cout << "  [" << to_string(item.severity) << "] " << to_string(item.drift_type)
                  << " " << item.element_id << " (confidence " << std::fixed << std::setprecision(2)
                  << item.confidence << ")\n";
        std::cout << "      " << item.description << "\n";
    }
    return 2;
}

int Application::list_alerts(bool include_resolved) {
    AlertFilter filter;
    if (!include_resolved) {
        filter.resolved = false;
    }

    auto alerts = alerts_->list(filter);
    if (alerts.empty()) {
        std::cout << "No alerts.\n";
        return 0;
    }

    ConsoleChannel console;
    for (const auto& alert : alerts) {
        std::cout << console.format(alert) << (alert.resolved ? " [resolved]" : "") << "\n";
    }
    return 0;
}

int Application::resolve(int64_t id, const std::string& note) {
    if (!alerts_->resolve(id, note)) {
        std::cerr << "No alert with id " << id << "\n";
        return 1;
    }
    std::cout << "Alert #" << id << " resolved.\n";
    return 0;
}

int Application::summary() {
    AlertSummary summary = alerts_->summary();
    std::cout << "Total alerts:      " << summary.total << "\n";
    std::cout << "Unresolved:        " << summary.total_unresolved << "\n";
    std::cout << "Created last hour: " << summary.recent_count << "\n";

    if (!summary.by_severity.empty()) {
        std::cout << "\nUnresolved by severity:\n";
        for (const auto& [severity, count] : summary.by_severity) {
            std::cout << "  " << std::left << std::setw(10) << to_string(severity) << count << "\n";
        }
    }
    if (!summary.by_type.empty()) {
        std::cout << "\nBy type:\n";
        for (const auto& [type, count] : summary.by_type) {
            std::cout << "  " << std::left << std::setw(24) << to_string(type) << count << "\n";
        }
    }
    if (!summary.top_files.empty()) {
        std::cout << "\nFiles with most open alerts:\n";
        for (const auto& [file, count] : summary.top_files) {
            std::cout << "  " << count << "  " << file << "\n";
        }
    }
    return 0;
}

int Application::suggest(int64_t id) {
    auto alert = alerts_->get(id);
    if (!alert) {
        std::cerr << "No alert with id " << id << "\n";
        return 1;
    }

    auto suggestions = realignment_->suggest_for_alert(*alert);
    std::cout << "Suggestions for alert #" << id << " (" << alert->title << "):\n";
    int rank = 1;
    for (const auto& s : suggestions) {
        std::cout << std::setw(3) << rank++ << ". [P" << s.priority << " E" << s.effort << "] "
                  << s.title << " (" << to_string(s.category) << ")\n";
        std::cout << "       " << s.description << "\n";
    }
    return 0;
}

} // namespace driftwatch
