#pragma once

#include "driftwatch/alert_system.hpp"
#include "driftwatch/config_manager.hpp"
#include "driftwatch/continuous_monitor.hpp"
#include "driftwatch/drift_detector.hpp"
#include "driftwatch/realignment_engine.hpp"
#include "driftwatch/specification.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace driftwatch {

// Builds the core components from a config file and backs the CLI commands
class Application {
public:
    explicit Application(const std::string& config_path);

    // Load and validate configuration, then create all components
    bool initialize();

    // Monitor until stop() is called; returns the process exit code
    int run();

    // Safe to call from a signal handler
    void stop();

    int check(const std::string& file_path);
    int list_alerts(bool include_resolved);
    int resolve(int64_t id, const std::string& note);
    int summary();
    int suggest(int64_t id);

    const DriftWatchConfig& config() const { return config_manager_.get_config(); }

private:
    std::string project_file(const std::string& path) const;

    std::string config_path_;
    ConfigManager config_manager_;
    std::shared_ptr<SpecificationCatalog> specs_;
    std::shared_ptr<SignatureIndex> signatures_;
    std::shared_ptr<DriftDetector> detector_;
    std::shared_ptr<AlertSystem> alerts_;
    std::shared_ptr<RealignmentEngine> realignment_;

    std::atomic<bool> running_{false};
};

// Config to component option conversions
DetectorOptions to_detector_options(const DriftConfig& drift, const MonitorConfig& monitor);
AlertSystemOptions to_alert_options(const AlertsConfig& alerts);
std::vector<AlertRule> to_alert_rules(const AlertsConfig& alerts);
RealignmentOptions to_realignment_options(const SuggestionsConfig& suggestions);

} // namespace driftwatch
