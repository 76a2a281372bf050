#include <catch2/catch_test_macros.hpp>
#include "driftwatch/config_manager.hpp"
#include <filesystem>
#include <fstream>

namespace {

std::string write_config(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    out.close();
    return path.string();
}

} // namespace

TEST_CASE("ConfigManager loads valid YAML", "[config]") {
    const char* test_config = R"(
version: "1.0"
project_path: "/tmp/project"
log_level: debug

monitor:
  scan_interval: 0.5   # seconds
  watch_patterns: ["*.py", "src/*.cpp"]
  ignore_patterns:
    - ".git"
    - "build"
  max_cpu_percent: 40
  max_memory_mb: 256.5
  batch_size: 10
  enabled_checks: [signature_mismatch, missing_implementation]
  overflow_policy: block
  worker_threads: 4
  watch_filesystem: false
  suggest_on_alert: yes

drift:
  min_confidence: 0.6
  weights:
    behavior_deviation: 0.75

alerts:
  db_path: "alerts.db"
  default_suppression_window: 60
  channels:
    - name: log
      kind: log
    - name: hook
      kind: webhook
      url: "http://localhost:9000/alerts"
      headers:
        - "X-Token: abc"
      timeout_ms: 2000
  rules:
    - name: loud
      types: [drift_detected, documentation_stale]
      min_severity: warning
      channels: [hook, log]
      suppression_window: 120

suggestions:
  max_suggestions: 5

sources:
  spec_catalog: "specs.json"
)";

    std::string path = write_config("driftwatch_test_config.yaml", test_config);

    driftwatch::ConfigManager manager(path);
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.project_path == "/tmp/project");
    REQUIRE(config.log_level == "debug");

    SECTION("Monitor section") {
        REQUIRE(config.monitor.scan_interval == 0.5);
        REQUIRE(config.monitor.watch_patterns == std::vector<std::string>{"*.py", "src/*.cpp"});
        REQUIRE(config.monitor.ignore_patterns == std::vector<std::string>{".git", "build"});
        REQUIRE(config.monitor.max_cpu_percent == 40.0);
        REQUIRE(config.monitor.max_memory_mb == 256.5);
        REQUIRE(config.monitor.batch_size == 10);
        REQUIRE(config.monitor.enabled_checks.size() == 2);
        REQUIRE(config.monitor.overflow_policy == "block");
        REQUIRE(config.monitor.worker_threads == 4);
        REQUIRE_FALSE(config.monitor.watch_filesystem);
        REQUIRE(config.monitor.suggest_on_alert);
        REQUIRE(config.monitor.queue_capacity == 1024);
    }

    SECTION("Drift weights keep defaults for unset entries") {
        REQUIRE(config.drift.min_confidence == 0.6);
        REQUIRE(config.drift.weights.behavior_deviation == 0.75);
        REQUIRE(config.drift.weights.signature_mismatch == 0.85);
    }

    SECTION("Channels and rules") {
        REQUIRE(config.alerts.default_suppression_window == 60);
        REQUIRE(config.alerts.channels.size() == 2);
        REQUIRE(config.alerts.channels[1].name == "hook");
        REQUIRE(config.alerts.channels[1].kind == "webhook");
        REQUIRE(config.alerts.channels[1].url == "http://localhost:9000/alerts");
        REQUIRE(config.alerts.channels[1].headers == std::vector<std::string>{"X-Token: abc"});
        REQUIRE(config.alerts.channels[1].timeout_ms == 2000);

        REQUIRE(config.alerts.rules.size() == 1);
        const auto& rule = config.alerts.rules[0];
        REQUIRE(rule.name == "loud");
        REQUIRE(rule.types == std::vector<std::string>{"drift_detected", "documentation_stale"});
        REQUIRE(rule.min_severity == "warning");
        REQUIRE(rule.channels == std::vector<std::string>{"hook", "log"});
        REQUIRE(rule.suppression_window == 120);
    }

    SECTION("Other sections") {
        REQUIRE(config.suggestions.max_suggestions == 5);
        REQUIRE(config.suggestions.enricher_timeout_ms == 10000);
        REQUIRE(config.sources.spec_catalog == "specs.json");
        REQUIRE(config.sources.signature_index == ".driftwatch/signatures.json");
    }

    std::string error;
    REQUIRE(manager.validate_config(error));
}

TEST_CASE("ConfigManager rejects malformed files", "[config]") {
    SECTION("Missing file") {
        driftwatch::ConfigManager manager("/nonexistent/driftwatch.yaml");
        REQUIRE_FALSE(manager.load());
        REQUIRE_FALSE(manager.last_error().empty());
    }

    SECTION("Non-numeric value") {
        std::string path = write_config("driftwatch_bad_number.yaml", "monitor:\n  batch_size: lots\n");
        driftwatch::ConfigManager manager(path);
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.last_error().find("monitor.batch_size") != std::string::npos);
    }

    SECTION("Broken indentation") {
        std::string path = write_config("driftwatch_bad_indent.yaml", "monitor:\n  batch_size: 5\n      stray: 1\n");
        driftwatch::ConfigManager manager(path);
        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager validates values", "[config]") {
    auto validate = [](const std::string& body) {
        std::string path = write_config("driftwatch_validate.yaml", body);
        driftwatch::ConfigManager manager(path);
        REQUIRE(manager.load());
        std::string error;
        bool ok = manager.validate_config(error);
        return std::make_pair(ok, error);
    };

    SECTION("Defaults are valid") {
        REQUIRE(validate("version: \"1.0\"\n").first);
    }

    SECTION("Non-positive scan interval") {
        auto [ok, error] = validate("monitor:\n  scan_interval: 0\n");
        REQUIRE_FALSE(ok);
        REQUIRE(error.find("scan_interval") != std::string::npos);
    }

    SECTION("Unknown check name") {
        auto [ok, error] = validate("monitor:\n  enabled_checks: [signature_mismatch, spelling]\n");
        REQUIRE_FALSE(ok);
        REQUIRE(error.find("spelling") != std::string::npos);
    }

    SECTION("Unknown overflow policy") {
        REQUIRE_FALSE(validate("monitor:\n  overflow_policy: discard\n").first);
    }

    SECTION("Weights outside [0, 1]") {
        REQUIRE_FALSE(validate("drift:\n  weights:\n    signature_mismatch: 1.5\n").first);
    }

    SECTION("Rule referencing an unknown channel") {
        auto [ok, error] = validate(
            "alerts:\n"
            "  channels:\n"
            "    - name: log\n"
            "      kind: log\n"
            "  rules:\n"
            "    - name: r\n"
            "      channels: [pager]\n");
        REQUIRE_FALSE(ok);
        REQUIRE(error.find("pager") != std::string::npos);
    }

    SECTION("Webhook without url") {
        REQUIRE_FALSE(validate("alerts:\n  channels:\n    - name: hook\n      kind: webhook\n").first);
    }

    SECTION("Unknown log level") {
        REQUIRE_FALSE(validate("log_level: loud\n").first);
    }
}

TEST_CASE("MonitorConfig defaults", "[config]") {
    driftwatch::MonitorConfig config;
    REQUIRE(config.scan_interval == 30.0);
    REQUIRE(config.batch_size == 50);
    REQUIRE(config.enabled_checks.size() == 6);
    REQUIRE(config.overflow_policy == "drop_oldest");
}
