#include <catch2/catch_test_macros.hpp>
#include "driftwatch/alert_channels.hpp"
#include "driftwatch/errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace driftwatch;

namespace {

Alert sample_alert() {
    Alert alert;
    alert.id = 12;
    alert.created_at = std::chrono::system_clock::now();
    alert.type = AlertType::DriftDetected;
    alert.severity = AlertSeverity::Critical;
    alert.title = "api_breaking_change in src/calc.py";
    alert.message = "- Public element 'calc' was removed";
    alert.file_path = "src/calc.py";
    alert.fingerprint = "abc";
    alert.occurrence_count = 3;
    return alert;
}

} // namespace

TEST_CASE("FileChannel appends one JSON object per alert", "[channels]") {
    auto path = std::filesystem::temp_directory_path() / "driftwatch_channel_test.jsonl";
    std::filesystem::remove(path);

    FileChannel channel(path.string());
    REQUIRE(channel.send(sample_alert()).success);
    REQUIRE(channel.send(sample_alert()).success);

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        auto j = nlohmann::json::parse(line);
        REQUIRE(j.at("id") == 12);
        REQUIRE(j.at("severity") == "critical");
        REQUIRE(j.at("occurrence_count") == 3);
        REQUIRE(j.at("last_notified_at").is_null());
        ++lines;
    }
    REQUIRE(lines == 2);

    std::filesystem::remove(path);
}

TEST_CASE("ConsoleChannel formatting", "[channels]") {
    Alert alert = sample_alert();

    ConsoleChannel mono("mono");
    std::string line = mono.format(alert);
    REQUIRE(line.find("CRITICAL #12 api_breaking_change in src/calc.py (x3)") != std::string::npos);
    REQUIRE(line.find("\033[") == std::string::npos);

    ConsoleChannel colored;
    REQUIRE(colored.format(alert).find("\033[1;31m") != std::string::npos);
}

TEST_CASE("EmailChannel composes a plain-text SMTP message", "[channels]") {
    EmailChannel channel("smtp://localhost:25", "", "", "driftwatch@localhost",
                         {"dev@example.com", "ops@example.com"}, 1000);
    std::string message = channel.compose(sample_alert());

    REQUIRE(message.find("From: driftwatch@localhost\r\n") == 0);
    REQUIRE(message.find("To: dev@example.com, ops@example.com\r\n") != std::string::npos);
    REQUIRE(message.find("Subject: [driftwatch CRITICAL] api_breaking_change in src/calc.py\r\n") != std::string::npos);
    REQUIRE(message.find("Occurrences: 3") != std::string::npos);
}

TEST_CASE("EmailChannel reports an unreachable SMTP server", "[channels]") {
    EmailChannel channel("smtp://127.0.0.1:1", "", "", "driftwatch@localhost", {"dev@example.com"}, 1000);

    DeliveryResult result = channel.send(sample_alert());
    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.reason.empty());
}

TEST_CASE("create_channel builds channels from configuration", "[channels]") {
    ChannelConfig config;
    config.name = "out";

    SECTION("Known kinds") {
        config.kind = "log";
        REQUIRE(dynamic_cast<LogChannel*>(create_channel(config, 5000).get()) != nullptr);
        config.kind = "console";
        REQUIRE(dynamic_cast<ConsoleChannel*>(create_channel(config, 5000).get()) != nullptr);
        config.kind = "webhook";
        config.url = "http://127.0.0.1:9/alerts";
        REQUIRE(dynamic_cast<WebhookChannel*>(create_channel(config, 5000).get()) != nullptr);
        config.kind = "email";
        config.recipients = {"dev@example.com"};
        REQUIRE(dynamic_cast<EmailChannel*>(create_channel(config, 5000).get()) != nullptr);
    }

    SECTION("Missing settings") {
        config.kind = "file";
        REQUIRE_THROWS_AS(create_channel(config, 5000), ConfigError);
        config.kind = "email";
        REQUIRE_THROWS_AS(create_channel(config, 5000), ConfigError);
        config.kind = "pager";
        REQUIRE_THROWS_AS(create_channel(config, 5000), ConfigError);
    }
}
