#pragma once

#include "driftwatch/alert.hpp"
#include "driftwatch/config_manager.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace driftwatch {

// Transport for delivered alerts. Implementations may throw
// ChannelDeliveryError; the alert system records it against the channel.
class AlertChannel {
public:
    virtual ~AlertChannel() = default;
    virtual DeliveryResult send(const Alert& alert) = 0;
};

// Writes through the driftwatch logger at a level derived from severity
class LogChannel : public AlertChannel {
public:
    DeliveryResult send(const Alert& alert) override;
};

// Appends one JSON object per line
class FileChannel : public AlertChannel {
public:
    explicit FileChannel(const std::string& path);

    DeliveryResult send(const Alert& alert) override;

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
};

// Colored single-line summary on stdout
class ConsoleChannel : public AlertChannel {
public:
    explicit ConsoleChannel(const std::string& color_scheme = "default");

    DeliveryResult send(const Alert& alert) override;

    std::string format(const Alert& alert) const;

private:
    std::string color_code(AlertSeverity severity) const;
    std::string reset_color() const;

    std::string color_scheme_;
};

// HTTP POST of the alert JSON
class WebhookChannel : public AlertChannel {
public:
    WebhookChannel(std::string url, std::vector<std::string> headers, long timeout_ms);

    DeliveryResult send(const Alert& alert) override;

private:
    std::string url_;
    std::vector<std::string> headers_;
    long timeout_ms_;
};

// Sends a plain-text message over SMTP
class EmailChannel : public AlertChannel {
public:
    EmailChannel(std::string smtp_url,
                 std::string username,
                 std::string password,
                 std::string sender,
                 std::vector<std::string> recipients,
                 long timeout_ms);

    DeliveryResult send(const Alert& alert) override;

    // RFC 5322 message with CRLF line endings
    std::string compose(const Alert& alert) const;

private:
    std::string smtp_url_;
    std::string username_;
    std::string password_;
    std::string sender_;
    std::vector<std::string> recipients_;
    long timeout_ms_;
};

// Throws ConfigError for an unknown kind or missing settings
std::shared_ptr<AlertChannel> create_channel(const ChannelConfig& config, long default_timeout_ms);

std::string format_timestamp(TimePoint time);

} // namespace driftwatch
