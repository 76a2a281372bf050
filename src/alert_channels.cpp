#include "driftwatch/alert_channels.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace driftwatch {

std::string format_timestamp(TimePoint time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static DeliveryResult delivered(const std::string& reason = "delivered") {
    return {true, reason, std::chrono::system_clock::now()};
}

DeliveryResult LogChannel::send(const Alert& alert) {
    LogLevel level = LogLevel::Info;
    switch (alert.severity) {
        case AlertSeverity::Info:     level = LogLevel::Info;    break;
        case AlertSeverity::Warning:  level = LogLevel::Warning; break;
        case AlertSeverity::Error:
        case AlertSeverity::Critical: level = LogLevel::Error;   break;
    }
    Logger::write(level, "ALERT #", alert.id, " [", to_string(alert.severity), "] ",
                  alert.title, " (", alert.file_path, ", seen ", alert.occurrence_count, "x)");
    return delivered();
}

FileChannel::FileChannel(const std::string& path)
    : path_(path)
{
    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        Logger::warning("Failed to open alert log file: ", path_);
    }
}

DeliveryResult FileChannel::send(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        file_.open(path_, std::ios::app);
        if (!file_.is_open()) {
            throw ChannelDeliveryError("Cannot open " + path_);
        }
    }

    file_ << alert_to_json(alert) << "\n";
    file_.flush();
    if (!file_) {
        file_.close();
        throw ChannelDeliveryError("Write to " + path_ + " failed");
    }
    return delivered();
}

ConsoleChannel::ConsoleChannel(const std::string& color_scheme)
    : color_scheme_(color_scheme)
{
}

std::string ConsoleChannel::color_code(AlertSeverity severity) const {
    if (color_scheme_ == "mono") {
        return "";
    }

    switch (severity) {
        case AlertSeverity::Info:     return "\033[36m";  // Cyan
        case AlertSeverity::Warning:  return "\033[33m";  // Yellow
        case AlertSeverity::Error:    return "\033[31m";  // Red
        case AlertSeverity::Critical: return "\033[1;31m";  // Bold red
        default:                      return "\033[0m";   // Reset
    }
}

std::string ConsoleChannel::reset_color() const {
    if (color_scheme_ == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string ConsoleChannel::format(const Alert& alert) const {
    std::string severity = to_string(alert.severity);
    for (char& c : severity) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    std::ostringstream oss;
    oss << "[" << format_timestamp(alert.created_at) << "] "
        << color_code(alert.severity) << severity << reset_color()
        << " #" << alert.id << " " << alert.title;
    if (alert.occurrence_count > 1) {
        oss << " (x" << alert.occurrence_count << ")";
    }
    return oss.str();
}

DeliveryResult ConsoleChannel::send(const Alert& alert) {
    std::cout << format(alert) << std::endl;
    return delivered();
}

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

// Feeds a composed message to libcurl's SMTP upload
struct UploadSource {
    const std::string* data;
    size_t offset;
};

size_t read_message(char* buffer, size_t size, size_t nmemb, void* userdata) {
    auto* source = static_cast<UploadSource*>(userdata);
    size_t remaining = source->data->size() - source->offset;
    size_t count = std::min(remaining, size * nmemb);
    if (count > 0) {
        std::memcpy(buffer, source->data->data() + source->offset, count);
        source->offset += count;
    }
    return count;
}

} // namespace

WebhookChannel::WebhookChannel(std::string url, std::vector<std::string> headers, long timeout_ms)
    : url_(std::move(url))
    , headers_(std::move(headers))
    , timeout_ms_(timeout_ms)
{
    ensure_curl_initialized();
}

DeliveryResult WebhookChannel::send(const Alert& alert) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw ChannelDeliveryError("curl_easy_init failed");
    }

    curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& header : headers_) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(raw_headers, &curl_slist_free_all);

    std::string body = alert_to_json(alert);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return {false, curl_easy_strerror(rc), std::chrono::system_clock::now()};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return {false, "HTTP " + std::to_string(status), std::chrono::system_clock::now()};
    }
    return delivered("HTTP " + std::to_string(status));
}

EmailChannel::EmailChannel(std::string smtp_url,
                           std::string username,
                           std::string password,
                           std::string sender,
                           std::vector<std::string> recipients,
                           long timeout_ms)
    : smtp_url_(std::move(smtp_url))
    , username_(std::move(username))
    , password_(std::move(password))
    , sender_(std::move(sender))
    , recipients_(std::move(recipients))
    , timeout_ms_(timeout_ms)
{
    ensure_curl_initialized();
}

std::string EmailChannel::compose(const Alert& alert) const {
    std::string severity = to_string(alert.severity);
    for (char& c : severity) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    std::ostringstream oss;
    oss << "From: " << sender_ << "\r\n";
    oss << "To: ";
    for (size_t i = 0; i < recipients_.size(); ++i) {
        oss << (i ? ", " : "") << recipients_[i];
    }
    oss << "\r\n";
    oss << "Subject: [driftwatch " << severity << "] " << alert.title << "\r\n";
    oss << "Content-Type: text/plain; charset=utf-8\r\n\r\n";

    std::istringstream body(alert.message);
    std::string line;
    while (std::getline(body, line)) {
        oss << line << "\r\n";
    }
    oss << "\r\n";
    oss << "Alert:       #" << alert.id << "\r\n";
    oss << "File:        " << alert.file_path << "\r\n";
    oss << "Type:        " << to_string(alert.type) << "\r\n";
    oss << "Occurrences: " << alert.occurrence_count << "\r\n";
    oss << "Created:     " << format_timestamp(alert.created_at) << "\r\n";
    return oss.str();
}

DeliveryResult EmailChannel::send(const Alert& alert) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw ChannelDeliveryError("curl_easy_init failed");
    }

    curl_slist* raw_recipients = nullptr;
    for (const auto& recipient : recipients_) {
        raw_recipients = curl_slist_append(raw_recipients, ("<" + recipient + ">").c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipient_list(raw_recipients, &curl_slist_free_all);

    std::string message = compose(alert);
    UploadSource source{&message, 0};
    std::string mail_from = "<" + sender_ + ">";

    curl_easy_setopt(curl.get(), CURLOPT_URL, smtp_url_.c_str());
    if (!username_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, username_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, password_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
    }
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mail_from.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipient_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_message);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &source);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return {false, curl_easy_strerror(rc), std::chrono::system_clock::now()};
    }
    return delivered();
}

std::shared_ptr<AlertChannel> create_channel(const ChannelConfig& config, long default_timeout_ms) {
    long timeout_ms = config.timeout_ms > 0 ? config.timeout_ms : default_timeout_ms;

    if (config.kind == "log") {
        return std::make_shared<LogChannel>();
    }
    if (config.kind == "file") {
        if (config.path.empty()) {
            throw ConfigError("File channel '" + config.name + "' needs a path");
        }
        return std::make_shared<FileChannel>(config.path);
    }
    if (config.kind == "console") {
        return std::make_shared<ConsoleChannel>(config.color_scheme);
    }
    if (config.kind == "webhook") {
        if (config.url.empty()) {
            throw ConfigError("Webhook channel '" + config.name + "' needs a url");
        }
        return std::make_shared<WebhookChannel>(config.url, config.headers, timeout_ms);
    }
    if (config.kind == "email") {
        if (config.recipients.empty()) {
            throw ConfigError("Email channel '" + config.name + "' needs recipients");
        }
        std::string url = config.url.empty() ? "smtp://localhost:25" : config.url;
        return std::make_shared<EmailChannel>(url, config.username, config.password,
                                              config.sender, config.recipients, timeout_ms);
    }
    throw ConfigError("Unknown channel kind '" + config.kind + "' for '" + config.name + "'");
}

} // namespace driftwatch
