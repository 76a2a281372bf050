#include "driftwatch/alert_system.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/hashing.hpp"
#include "driftwatch/logger.hpp"
#include "driftwatch/worker_pool.hpp"
#include <algorithm>
#include <future>
#include <sstream>

namespace driftwatch {

bool AlertRule::matches(AlertType type, AlertSeverity severity) const {
    if (severity < min_severity) {
        return false;
    }
    return types.empty() || types.count(type) > 0;
}

std::string to_string(CreateOutcome outcome) {
    switch (outcome) {
        case CreateOutcome::Created:     return "created";
        case CreateOutcome::Suppressed:  return "suppressed";
        case CreateOutcome::Redelivered: return "redelivered";
    }
    return "created";
}

DeliveryRateLimiter::DeliveryRateLimiter(int max_per_minute, int max_per_hour)
    : max_per_minute_(max_per_minute)
    , max_per_hour_(max_per_hour)
{
}

bool DeliveryRateLimiter::try_acquire(const std::string& channel, TimePoint now) {
    if (max_per_minute_ <= 0 && max_per_hour_ <= 0) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = history_[channel];
    while (!history.empty() && now - history.front() >= std::chrono::hours(1)) {
        history.pop_front();
    }

    if (max_per_hour_ > 0 && history.size() >= static_cast<size_t>(max_per_hour_)) {
        return false;
    }
    if (max_per_minute_ > 0) {
        auto recent = std::count_if(history.begin(), history.end(), [&](TimePoint sent) {
            return now - sent < std::chrono::minutes(1);
        });
        if (recent >= max_per_minute_) {
            return false;
        }
    }

    history.push_back(now);
    return true;
}

AlertSystem::AlertSystem(std::unique_ptr<AlertStore> store,
                         std::vector<AlertRule> rules,
                         AlertSystemOptions options,
                         Clock clock)
    : store_(std::move(store))
    , rules_(std::move(rules))
    , options_(options)
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); }))
    , rate_limiter_(options.max_per_minute, options.max_per_hour)
{
    if (!store_) {
        throw ConfigError("AlertSystem requires an alert store");
    }
}

void AlertSystem::register_channel(const std::string& name,
                                   std::shared_ptr<AlertChannel> channel,
                                   std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    channels_[name] = {std::move(channel), timeout.value_or(options_.channel_timeout)};
}

std::string AlertSystem::fingerprint(const AlertEvent& event) {
    return sha256_hex({to_string(event.type), event.file_path, event.spec_reference, event.drift_type});
}

std::chrono::seconds AlertSystem::suppression_window_for(AlertType type, AlertSeverity severity) const {
    std::optional<std::chrono::seconds> window;
    for (const auto& rule : rules_) {
        if (rule.suppression_window && rule.matches(type, severity)) {
            window = window ? std::max(*window, *rule.suppression_window) : *rule.suppression_window;
        }
    }
    return window.value_or(options_.default_suppression_window);
}

std::vector<std::string> AlertSystem::channels_for(const Alert& alert) const {
    std::vector<std::string> names;

    if (rules_.empty()) {
        // Without rules every registered channel is subscribed
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (const auto& [name, registered] : channels_) {
            names.push_back(name);
        }
        return names;
    }

    for (const auto& rule : rules_) {
        if (!rule.matches(alert.type, alert.severity)) {
            continue;
        }
        for (const auto& channel : rule.channels) {
            if (std::find(names.begin(), names.end(), channel) == names.end()) {
                names.push_back(channel);
            }
        }
    }
    return names;
}

void AlertSystem::enqueue(int64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (std::find(pending_.begin(), pending_.end(), id) == pending_.end()) {
        pending_.push_back(id);
    }
}

size_t AlertSystem::pending() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

CreateResult AlertSystem::create_alert(const AlertEvent& event) {
    CreateResult result;
    std::string print = fingerprint(event);
    TimePoint now = clock_();

    std::lock_guard<std::mutex> lock(writer_mutex_);

    if (auto existing = store_->find_open_by_fingerprint(print)) {
        Alert alert = std::move(*existing);
        alert.occurrence_count += 1;
        alert.severity = std::max(alert.severity, event.severity);
        if (!event.message.empty()) {
            alert.message = event.message;
        }
        for (const auto& [key, value] : event.context) {
            alert.context[key] = value;
        }

        TimePoint reference = alert.last_notified_at.value_or(alert.created_at);
        auto window = suppression_window_for(alert.type, alert.severity);
        store_->update(alert);

        if (now - reference < window) {
            Logger::debug("Suppressed repeat of alert #", alert.id, " (", alert.occurrence_count, " occurrences)");
            result.outcome = CreateOutcome::Suppressed;
        } else {
            Logger::info("Alert #", alert.id, " recurred outside its suppression window, redelivering");
            result.outcome = CreateOutcome::Redelivered;
            enqueue(alert.id);
        }
        result.alert = std::move(alert);
        return result;
    }

    Alert alert;
    alert.created_at = now;
    alert.type = event.type;
    alert.severity = event.severity;
    alert.title = event.title;
    alert.message = event.message;
    alert.context = event.context;
    alert.fingerprint = print;
    alert.file_path = event.file_path;
    alert.occurrence_count = 1;
    alert.id = store_->insert(alert);

    Logger::info("Alert #", alert.id, " created [", to_string(alert.severity), "] ", alert.title);
    enqueue(alert.id);

    result.outcome = CreateOutcome::Created;
    result.alert = std::move(alert);
    return result;
}

std::map<std::string, DeliveryResult> AlertSystem::dispatch(const Alert& alert) {
    struct InFlight {
        std::string name;
        std::future<DeliveryResult> result;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::milliseconds timeout;
    };

    std::map<std::string, DeliveryResult> log;
    std::vector<InFlight> in_flight;
    auto started = std::chrono::steady_clock::now();

    for (const auto& name : channels_for(alert)) {
        RegisteredChannel registered;
        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            auto it = channels_.find(name);
            if (it == channels_.end()) {
                log[name] = {false, "channel not registered", clock_()};
                continue;
            }
            registered = it->second;
        }

        if (!rate_limiter_.try_acquire(name, clock_())) {
            log[name] = {false, "rate limited", clock_()};
            continue;
        }

        // Each channel gets its own copy and its own thread
        auto channel = registered.channel;
        Alert copy = alert;
        in_flight.push_back({name,
                             run_detached([channel, copy]() { return channel->send(copy); }),
                             started + registered.timeout,
                             registered.timeout});
    }

    for (auto& task : in_flight) {
        if (task.result.wait_until(task.deadline) != std::future_status::ready) {
            log[task.name] = {false, "timed out after " + std::to_string(task.timeout.count()) + " ms", clock_()};
            Logger::warning("Channel '", task.name, "' timed out delivering alert #", alert.id);
            continue;
        }
        try {
            log[task.name] = task.result.get();
        } catch (const std::exception& e) {
            log[task.name] = {false, e.what(), clock_()};
            Logger::warning("Channel '", task.name, "' failed for alert #", alert.id, ": ", e.what());
        } catch (...) {
            log[task.name] = {false, "unknown error", clock_()};
            Logger::warning("Channel '", task.name, "' failed for alert #", alert.id, ": unknown error");
        }
    }

    if (alert.id == 0) {
        return log;
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto stored = store_->find(alert.id);
    if (!stored) {
        return log;
    }
    for (const auto& [name, result] : log) {
        stored->delivery_log[name] = result;
    }
    stored->last_notified_at = clock_();
    store_->update(*stored);
    return log;
}

size_t AlertSystem::flush() {
    std::vector<int64_t> ids;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        ids.swap(pending_);
    }

    size_t sent = 0;
    for (int64_t id : ids) {
        auto alert = store_->find(id);
        if (!alert) {
            Logger::debug("Queued alert #", id, " no longer exists");
            continue;
        }
        dispatch(*alert);
        ++sent;
    }
    return sent;
}

bool AlertSystem::resolve(int64_t id, const std::string& note) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto alert = store_->find(id);
    if (!alert) {
        return false;
    }
    if (alert->resolved) {
        return true;
    }

    alert->resolved = true;
    alert->resolution_note = note;
    alert->resolved_at = clock_();
    store_->update(*alert);
    Logger::info("Alert #", id, " resolved");
    return true;
}

std::vector<Alert> AlertSystem::list(const AlertFilter& filter) const {
    return store_->query(filter);
}

std::optional<Alert> AlertSystem::get(int64_t id) const {
    return store_->find(id);
}

AlertSummary AlertSystem::summary() const {
    return store_->summarize(clock_());
}

size_t AlertSystem::purge_resolved(std::chrono::hours older_than) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    size_t removed = store_->purge_resolved_before(clock_() - older_than);
    if (removed > 0) {
        Logger::info("Purged ", removed, " resolved alerts");
    }
    return removed;
}

std::vector<AlertEvent> events_from_report(const DriftReport& report) {
    std::vector<AlertEvent> events;
    std::map<DriftType, std::vector<DriftItem>> groups;
    for (const auto& item : report.items) {
        groups[item.drift_type].push_back(item);
    }

    for (const auto& [type, items] : groups) {
        DriftSeverity severity = DriftSeverity::Info;
        std::string element_ids;
        std::ostringstream message;
        for (const auto& item : items) {
            severity = std::max(severity, item.severity);
            element_ids += (element_ids.empty() ? "" : ",") + item.element_id;
            message << "- " << item.description << "\n";
        }

        AlertEvent event;
        event.type = to_alert_type(type);
        event.severity = to_alert_severity(severity);
        event.file_path = report.file_path;
        event.spec_reference = report.spec_reference;
        event.drift_type = to_string(type);
        event.title = to_string(type) + " in " + report.file_path +
                      (items.size() > 1 ? " (" + std::to_string(items.size()) + " items)" : "");
        event.message = message.str();
        event.context = {
            {"file_path", report.file_path},
            {"spec_reference", report.spec_reference},
            {"drift_type", to_string(type)},
            {"element_ids", element_ids},
            {"items", drift_items_to_json(items)}
        };
        events.push_back(std::move(event));
    }
    return events;
}

} // namespace driftwatch
