#include "driftwatch/continuous_monitor.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <future>
#include <limits>

namespace driftwatch {

ContinuousMonitor::ContinuousMonitor(MonitorDependencies dependencies)
    : deps_(std::move(dependencies))
{
}

void ContinuousMonitor::validate(const std::string& project_path, const MonitorConfig& config) {
    std::error_code ec;
    if (project_path.empty() || !std::filesystem::is_directory(project_path, ec)) {
        throw ConfigError("Project path is not a directory: '" + project_path + "'");
    }
    if (config.scan_interval <= 0.0) {
        throw ConfigError("scan_interval must be positive");
    }
    if (config.batch_size <= 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (config.queue_capacity <= 0) {
        throw ConfigError("queue_capacity must be positive");
    }
    if (config.worker_threads <= 0) {
        throw ConfigError("worker_threads must be positive");
    }
    if (config.max_cpu_percent <= 0.0 || config.max_memory_mb <= 0.0) {
        throw ConfigError("Resource budgets must be positive");
    }
    if (config.watch_filesystem && config.poll_interval <= 0.0) {
        throw ConfigError("poll_interval must be positive");
    }
    if (config.max_retries < 0) {
        throw ConfigError("max_retries must not be negative");
    }
    if (!overflow_policy_from_string(config.overflow_policy)) {
        throw ConfigError("Unknown overflow policy '" + config.overflow_policy + "'");
    }
    for (const auto& check : config.enabled_checks) {
        if (!drift_type_from_string(check)) {
            throw ConfigError("Unknown check '" + check + "'");
        }
    }
}

std::unique_ptr<MonitorHandle> ContinuousMonitor::start(const std::string& project_path,
                                                        const MonitorConfig& config,
                                                        std::unique_ptr<ChangeSource> source) const {
    validate(project_path, config);
    if (!deps_.specs || !deps_.signatures || !deps_.alerts) {
        throw ConfigError("ContinuousMonitor needs a specification provider, a signature extractor and an alert system");
    }

    MonitorDependencies deps = deps_;
    if (!deps.sampler) {
        deps.sampler = create_resource_sampler();
    }
    if (!deps.detector) {
        DetectorOptions options;
        for (const auto& check : config.enabled_checks) {
            options.enabled_checks.insert(*drift_type_from_string(check));
        }
        deps.detector = std::make_shared<DriftDetector>(options);
    }

    if (!source && config.watch_filesystem) {
        auto interval = std::chrono::milliseconds(static_cast<long long>(config.poll_interval * 1000.0));
        source = std::make_unique<DirectoryPoller>(project_path, config.watch_patterns, config.ignore_patterns,
                                                   interval, config.scan_on_start);
    }

    auto policy = *overflow_policy_from_string(config.overflow_policy);
    auto handle = std::make_unique<MonitorHandle>(MonitorHandle::CreationKey{}, project_path, config,
                                                  std::move(deps), std::move(source), policy);
    handle->start();
    return handle;
}

void ContinuousMonitor::stop(MonitorHandle& handle) const {
    handle.stop();
}

MonitorStatus ContinuousMonitor::status(const MonitorHandle& handle) const {
    return handle.status();
}

MonitorHandle::MonitorHandle(CreationKey,
                             std::string project_path,
                             MonitorConfig config,
                             MonitorDependencies dependencies,
                             std::unique_ptr<ChangeSource> source,
                             OverflowPolicy policy)
    : project_path_(std::move(project_path))
    , config_(std::move(config))
    , deps_(std::move(dependencies))
    , queue_(std::make_unique<ChangeQueue>(static_cast<size_t>(config_.queue_capacity), policy))
    , source_(std::move(source))
    , pool_(std::make_unique<WorkerPool>(static_cast<size_t>(config_.worker_threads)))
{
    for (const auto& check : config_.enabled_checks) {
        enabled_checks_.insert(*drift_type_from_string(check));
    }
}

MonitorHandle::~MonitorHandle() {
    stop();
}

void MonitorHandle::start() {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.running = true;
    }
    scheduler_ = std::thread([this]() { scheduler_loop(); });
    if (source_) {
        source_->start(*queue_);
    }
    Logger::info("Monitoring ", project_path_, " every ", config_.scan_interval, "s");
}

void MonitorHandle::stop() {
    std::call_once(stop_once_, [this]() {
        stop_requested_ = true;
        queue_->notify();
        if (scheduler_.joinable()) {
            scheduler_.join();
        }

        // Unblocks producers waiting for space before joining them
        queue_->close();
        if (source_) {
            source_->stop();
        }

        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.running = false;
        Logger::info("Stopped monitoring ", project_path_);
    });
}

void MonitorHandle::request_scan() {
    queue_->notify();
}

MonitorStatus MonitorHandle::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    MonitorStatus snapshot = status_;
    snapshot.pending_changes = queue_->size() + retries_.size();
    snapshot.dropped_changes = queue_->dropped();
    return snapshot;
}

bool MonitorHandle::over_budget() {
    ResourceUsage usage = deps_.sampler->sample();
    bool over = usage.cpu_percent > config_.max_cpu_percent || usage.memory_mb > config_.max_memory_mb;

    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.last_cpu_percent = usage.cpu_percent;
    status_.last_memory_mb = usage.memory_mb;
    status_.throttled = over;
    if (over) {
        ++status_.deferred_ticks;
        Logger::warning("Resource budget exceeded (cpu ", usage.cpu_percent, "%, memory ",
                        usage.memory_mb, " MB), deferring scan");
    }
    return over;
}

void MonitorHandle::scheduler_loop() {
    const auto tick = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config_.scan_interval));
    const size_t batch_size = static_cast<size_t>(config_.batch_size);

    auto next_tick = std::chrono::steady_clock::now() + tick;
    bool throttled = false;

    while (!stop_requested_) {
        // After a deferral only the next tick may trigger a scan
        size_t threshold = throttled ? std::numeric_limits<size_t>::max() : batch_size;
        queue_->wait_for_batch(threshold, next_tick);
        if (stop_requested_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            next_tick = now + tick;
        } else if (throttled) {
            continue;
        }

        try {
            throttled = over_budget();
            if (throttled) {
                continue;
            }

            auto batch = collect_batch();
            if (batch.empty()) {
                continue;
            }
            run_batch(batch);
        } catch (const std::exception& e) {
            Logger::error("Scan cycle failed: ", e.what());
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.last_error = e.what();
        } catch (...) {
            Logger::error("Scan cycle failed: unknown error");
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.last_error = "unknown error";
        }
    }

    // Deliver anything created by the final batch
    try {
        deps_.alerts->flush();
    } catch (const std::exception& e) {
        Logger::error("Failed to flush alerts on shutdown: ", e.what());
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = e.what();
    } catch (...) {
        Logger::error("Failed to flush alerts on shutdown: unknown error");
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = "unknown error";
    }
}

std::vector<ChangeEvent> MonitorHandle::collect_batch() {
    const size_t batch_size = static_cast<size_t>(config_.batch_size);
    std::vector<std::string> order;
    std::map<std::string, ChangeEvent> latest;

    auto take = [&](ChangeEvent event) {
        auto it = latest.find(event.path);
        if (it == latest.end()) {
            order.push_back(event.path);
            latest.emplace(event.path, std::move(event));
        } else {
            it->second = std::move(event);
        }
    };

    // Files that failed last cycle go first
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        for (const auto& [path, retry] : retries_) {
            if (order.size() >= batch_size) {
                break;
            }
            take(retry.event);
        }
    }

    if (order.size() < batch_size) {
        for (auto& event : queue_->drain(batch_size - order.size())) {
            take(std::move(event));
        }
    }

    std::vector<ChangeEvent> batch;
    batch.reserve(order.size());
    for (const auto& path : order) {
        batch.push_back(std::move(latest[path]));
    }
    return batch;
}

DriftReport MonitorHandle::scan_file(const ChangeEvent& event) {
    std::shared_ptr<const Specification> spec;
    try {
        spec = deps_.specs->find(event.path);
    } catch (const SpecLoadError& e) {
        DriftReport report;
        report.file_path = event.path;
        report.notices.push_back(std::string("Specification unavailable: ") + e.what());
        return report;
    }

    SignatureSet current;
    if (event.kind != ChangeKind::Deleted) {
        current = deps_.signatures->extract(event.path);
    }

    DriftReport report = deps_.detector->check(event.path, current, spec.get());

    if (!enabled_checks_.empty()) {
        report.items.erase(std::remove_if(report.items.begin(), report.items.end(), [this](const DriftItem& item) {
            return enabled_checks_.count(item.drift_type) == 0;
        }), report.items.end());
    }

    if (spec && event.kind != ChangeKind::Deleted) {
        deps_.detector->ensure_baseline(event.path, current, *spec);
    }
    return report;
}

void MonitorHandle::record_failure(const ChangeEvent& event, const std::string& message) {
    Logger::error("Scan of ", event.path, " failed: ", message);

    std::lock_guard<std::mutex> lock(status_mutex_);
    ++status_.scan_failures;
    status_.last_error = message;

    auto& retry = retries_[event.path];
    retry.event = event;
    retry.attempts += 1;
    if (retry.attempts > config_.max_retries) {
        Logger::warning("Giving up on ", event.path, " after ", config_.max_retries, " retries");
        retries_.erase(event.path);
    }
}

void MonitorHandle::forward(const DriftReport& report) {
    bool alerted = false;
    for (const auto& event : events_from_report(report)) {
        CreateResult result = deps_.alerts->create_alert(event);

        std::lock_guard<std::mutex> lock(status_mutex_);
        switch (result.outcome) {
            case CreateOutcome::Created:     ++status_.alerts_created; alerted = true; break;
            case CreateOutcome::Redelivered: ++status_.alerts_redelivered; alerted = true; break;
            case CreateOutcome::Suppressed:  ++status_.alerts_suppressed; break;
        }
    }

    if (alerted && config_.suggest_on_alert && deps_.realignment) {
        auto suggestions = deps_.realignment->suggest(report, deps_.enricher);
        if (deps_.on_suggestions) {
            deps_.on_suggestions(report, suggestions);
        } else {
            Logger::info(suggestions.size(), " suggestions for ", report.file_path,
                         suggestions.empty() ? "" : ", top: " + suggestions.front().title);
        }
    }
}

void MonitorHandle::run_batch(const std::vector<ChangeEvent>& batch) {
    Logger::debug("Scanning batch of ", batch.size(), " files");

    std::vector<std::pair<ChangeEvent, std::future<DriftReport>>> tasks;
    tasks.reserve(batch.size());
    for (const auto& event : batch) {
        tasks.emplace_back(event, pool_->submit([this, event]() { return scan_file(event); }));
    }

    for (auto& [event, future] : tasks) {
        DriftReport report;
        try {
            report = future.get();
        } catch (const std::exception& e) {
            record_failure(event, e.what());
            continue;
        } catch (...) {
            record_failure(event, "unknown error");
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            ++status_.files_checked;
            retries_.erase(event.path);
            if (!report.empty()) {
                ++status_.drift_reports;
            }
        }

        for (const auto& notice : report.notices) {
            Logger::info(notice);
        }
        if (report.empty()) {
            continue;
        }

        try {
            forward(report);
        } catch (const std::exception& e) {
            Logger::error("Failed to raise alerts for ", report.file_path, ": ", e.what());
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.last_error = e.what();
        } catch (...) {
            Logger::error("Failed to raise alerts for ", report.file_path, ": unknown error");
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.last_error = "unknown error";
        }
    }

    try {
        deps_.alerts->flush();
    } catch (const std::exception& e) {
        Logger::error("Alert dispatch failed: ", e.what());
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = e.what();
    } catch (...) {
        Logger::error("Alert dispatch failed: unknown error");
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = "unknown error";
    }

    std::lock_guard<std::mutex> lock(status_mutex_);
    ++status_.scans_completed;
    status_.last_scan_at = std::chrono::system_clock::now();
}

} // namespace driftwatch
