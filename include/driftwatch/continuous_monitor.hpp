#pragma once

#include "driftwatch/alert_system.hpp"
#include "driftwatch/change_source.hpp"
#include "driftwatch/config_manager.hpp"
#include "driftwatch/drift_detector.hpp"
#include "driftwatch/realignment_engine.hpp"
#include "driftwatch/resource_sampler.hpp"
#include "driftwatch/specification.hpp"
#include "driftwatch/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace driftwatch {

struct MonitorStatus {
    bool running = false;
    std::optional<std::chrono::system_clock::time_point> last_scan_at;
    std::string last_error;
    bool throttled = false;

    uint64_t scans_completed = 0;
    uint64_t files_checked = 0;
    uint64_t drift_reports = 0;
    uint64_t alerts_created = 0;
    uint64_t alerts_redelivered = 0;
    uint64_t alerts_suppressed = 0;
    uint64_t scan_failures = 0;
    uint64_t deferred_ticks = 0;
    size_t pending_changes = 0;
    uint64_t dropped_changes = 0;
    double last_cpu_percent = 0.0;
    double last_memory_mb = 0.0;
};

using SuggestionCallback = std::function<void(const DriftReport&, const std::vector<Suggestion>&)>;

// Collaborators shared by every session started from one ContinuousMonitor
struct MonitorDependencies {
    std::shared_ptr<const SpecificationProvider> specs;
    std::shared_ptr<SignatureExtractor> signatures;
    std::shared_ptr<AlertSystem> alerts;
    std::shared_ptr<DriftDetector> detector;        // Created from the config when null
    std::shared_ptr<ResourceSampler> sampler;       // Platform sampler when null
    std::shared_ptr<RealignmentEngine> realignment; // Optional
    std::shared_ptr<SuggestionEnricher> enricher;   // Optional
    SuggestionCallback on_suggestions;
};

// One monitoring session. Owns the scheduler thread, the change queue and
// the change source; destroying the handle stops the session.
class MonitorHandle {
    // Only ContinuousMonitor can mint one, so only it can construct a handle
    class CreationKey {
        friend class ContinuousMonitor;
        explicit CreationKey() = default;
    };

public:
    MonitorHandle(CreationKey key,
                  std::string project_path,
                  MonitorConfig config,
                  MonitorDependencies dependencies,
                  std::unique_ptr<ChangeSource> source,
                  OverflowPolicy policy);
    ~MonitorHandle();

    MonitorHandle(const MonitorHandle&) = delete;
    MonitorHandle& operator=(const MonitorHandle&) = delete;

    MonitorStatus status() const;

    // Finish the in-flight batch, flush alerts and join threads. Idempotent.
    void stop();

    // Any producer may feed events here
    ChangeQueue& changes() { return *queue_; }

    // Wake the scheduler without waiting for the next tick
    void request_scan();

    const std::string& project_path() const { return project_path_; }
    const MonitorConfig& config() const { return config_; }

private:
    friend class ContinuousMonitor;

    struct Retry {
        ChangeEvent event;
        int attempts = 0;
    };

    struct FileResult {
        ChangeEvent event;
        DriftReport report;
    };

    void start();
    void scheduler_loop();
    bool over_budget();
    std::vector<ChangeEvent> collect_batch();
    void run_batch(const std::vector<ChangeEvent>& batch);
    DriftReport scan_file(const ChangeEvent& event);
    void forward(const DriftReport& report);
    void record_failure(const ChangeEvent& event, const std::string& message);

    const std::string project_path_;
    const MonitorConfig config_;
    MonitorDependencies deps_;
    std::set<DriftType> enabled_checks_;

    std::unique_ptr<ChangeQueue> queue_;
    std::unique_ptr<ChangeSource> source_;
    std::unique_ptr<WorkerPool> pool_;
    std::map<std::string, Retry> retries_;   // Guarded by status_mutex_

    std::thread scheduler_;
    std::atomic<bool> stop_requested_{false};
    std::once_flag stop_once_;

    MonitorStatus status_;
    mutable std::mutex status_mutex_;
};

class ContinuousMonitor {
public:
    explicit ContinuousMonitor(MonitorDependencies dependencies);

    // Throws ConfigError before any thread starts
    std::unique_ptr<MonitorHandle> start(const std::string& project_path,
                                         const MonitorConfig& config,
                                         std::unique_ptr<ChangeSource> source = nullptr) const;

    void stop(MonitorHandle& handle) const;
    MonitorStatus status(const MonitorHandle& handle) const;

    static void validate(const std::string& project_path, const MonitorConfig& config);

private:
    MonitorDependencies deps_;
};

} // namespace driftwatch
