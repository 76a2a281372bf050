#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace driftwatch {

enum class ChangeKind {
    Created,
    Modified,
    Deleted
};

std::string to_string(ChangeKind kind);

struct ChangeEvent {
    std::string path;   // Relative to the project root
    ChangeKind kind = ChangeKind::Modified;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

enum class OverflowPolicy {
    Block,
    DropOldest
};

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& text);

// Bounded queue between change producers and the scheduler
class ChangeQueue {
public:
    explicit ChangeQueue(size_t capacity, OverflowPolicy policy = OverflowPolicy::DropOldest);

    // Returns false once the queue is closed
    bool push(ChangeEvent event);

    // Non-blocking; removes up to max_events in arrival order
    std::vector<ChangeEvent> drain(size_t max_events);

    // Wait until at least threshold events are queued, the deadline passes,
    // or the queue is closed. Returns true if the threshold was reached.
    bool wait_for_batch(size_t threshold, std::chrono::steady_clock::time_point deadline);

    // Wake any waiter without closing
    void notify();

    void close();
    bool closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    const size_t capacity_;
    const OverflowPolicy policy_;
    std::deque<ChangeEvent> events_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
    bool notified_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

// Producer of change events; runs independently of the scheduler
class ChangeSource {
public:
    virtual ~ChangeSource() = default;
    virtual void start(ChangeQueue& queue) = 0;
    virtual void stop() = 0;
};

// True if a relative path passes the watch patterns and no ignore pattern
// matches it or one of its directories
bool should_watch(const std::string& relative_path,
                  const std::vector<std::string>& watch_patterns,
                  const std::vector<std::string>& ignore_patterns);

// Polls the project tree, reporting files whose content hash changed
class DirectoryPoller : public ChangeSource {
public:
    DirectoryPoller(std::string root,
                    std::vector<std::string> watch_patterns,
                    std::vector<std::string> ignore_patterns,
                    std::chrono::milliseconds interval,
                    bool report_initial_files);
    ~DirectoryPoller() override;

    void start(ChangeQueue& queue) override;
    void stop() override;

    // One pass over the tree
    std::vector<ChangeEvent> poll();

private:
    struct Entry {
        std::filesystem::file_time_type modified;
        std::string content_hash;
    };

    void run(ChangeQueue& queue);

    std::string root_;
    std::vector<std::string> watch_patterns_;
    std::vector<std::string> ignore_patterns_;
    std::chrono::milliseconds interval_;
    bool report_initial_files_;
    bool first_pass_ = true;
    std::map<std::string, Entry> known_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace driftwatch
