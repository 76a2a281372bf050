#include "driftwatch/change_source.hpp"
#include "driftwatch/hashing.hpp"
#include "driftwatch/logger.hpp"
#include "driftwatch/specification.hpp"
#include <set>

namespace driftwatch {

std::string to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created:  return "created";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted:  return "deleted";
    }
    return "modified";
}

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& text) {
    if (text == "block") return OverflowPolicy::Block;
    if (text == "drop_oldest") return OverflowPolicy::DropOldest;
    return std::nullopt;
}

ChangeQueue::ChangeQueue(size_t capacity, OverflowPolicy policy)
    : capacity_(capacity == 0 ? 1 : capacity)
    , policy_(policy)
{
}

bool ChangeQueue::push(ChangeEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    if (events_.size() >= capacity_) {
        if (policy_ == OverflowPolicy::Block) {
            not_full_.wait(lock, [this]() { return closed_ || events_.size() < capacity_; });
            if (closed_) {
                return false;
            }
        } else {
            events_.pop_front();
            ++dropped_;
        }
    }

    events_.push_back(std::move(event));
    lock.unlock();
    not_empty_.notify_all();
    return true;
}

std::vector<ChangeEvent> ChangeQueue::drain(size_t max_events) {
    std::vector<ChangeEvent> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!events_.empty() && out.size() < max_events) {
            out.push_back(std::move(events_.front()));
            events_.pop_front();
        }
    }
    if (!out.empty()) {
        not_full_.notify_all();
    }
    return out;
}

bool ChangeQueue::wait_for_batch(size_t threshold, std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_until(lock, deadline, [&]() {
        return closed_ || notified_ || events_.size() >= threshold;
    });
    notified_ = false;
    return events_.size() >= threshold;
}

void ChangeQueue::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notified_ = true;
    }
    not_empty_.notify_all();
}

void ChangeQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

bool ChangeQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ChangeQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t ChangeQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

bool should_watch(const std::string& relative_path,
                  const std::vector<std::string>& watch_patterns,
                  const std::vector<std::string>& ignore_patterns) {
    std::filesystem::path path(relative_path);

    for (const auto& pattern : ignore_patterns) {
        if (path_matches(relative_path, pattern)) {
            return false;
        }
        // Ignore patterns also apply to every directory on the way down
        for (const auto& component : path.parent_path()) {
            if (path_matches(component.string(), pattern)) {
                return false;
            }
        }
    }

    if (watch_patterns.empty()) {
        return true;
    }
    for (const auto& pattern : watch_patterns) {
        if (path_matches(relative_path, pattern)) {
            return true;
        }
    }
    return false;
}

DirectoryPoller::DirectoryPoller(std::string root,
                                 std::vector<std::string> watch_patterns,
                                 std::vector<std::string> ignore_patterns,
                                 std::chrono::milliseconds interval,
                                 bool report_initial_files)
    : root_(std::move(root))
    , watch_patterns_(std::move(watch_patterns))
    , ignore_patterns_(std::move(ignore_patterns))
    , interval_(interval)
    , report_initial_files_(report_initial_files)
{
}

DirectoryPoller::~DirectoryPoller() {
    stop();
}

std::vector<ChangeEvent> DirectoryPoller::poll() {
    namespace fs = std::filesystem;
    std::vector<ChangeEvent> events;
    std::set<std::string> seen;

    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::warning("Cannot scan ", root_, ": ", ec.message());
        return events;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::debug("Directory walk error under ", root_, ": ", ec.message());
            ec.clear();
            continue;
        }

        std::string relative = fs::relative(it->path(), root_, ec).generic_string();
        if (ec) {
            ec.clear();
            continue;
        }

        if (it->is_directory(ec)) {
            bool ignored = false;
            for (const auto& pattern : ignore_patterns_) {
                if (path_matches(relative, pattern)) {
                    ignored = true;
                    break;
                }
            }
            if (ignored) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || !should_watch(relative, watch_patterns_, ignore_patterns_)) {
            continue;
        }

        seen.insert(relative);
        auto modified = it->last_write_time(ec);
        if (ec) {
            ec.clear();
            continue;
        }

        auto known_it = known_.find(relative);
        if (known_it == known_.end()) {
            Entry entry{modified, {}};
            try {
                entry.content_hash = file_sha256_hex(it->path().string());
            } catch (const std::exception& e) {
                Logger::debug("Hash failed for ", relative, ": ", e.what());
            }
            known_.emplace(relative, std::move(entry));
            if (!first_pass_ || report_initial_files_) {
                events.push_back({relative, ChangeKind::Created, std::chrono::system_clock::now()});
            }
            continue;
        }

        if (known_it->second.modified == modified) {
            continue;
        }
        known_it->second.modified = modified;

        // Only report a modification when the content actually changed
        std::string hash;
        try {
            hash = file_sha256_hex(it->path().string());
        } catch (const std::exception& e) {
            Logger::debug("Hash failed for ", relative, ": ", e.what());
        }
        if (!hash.empty() && hash == known_it->second.content_hash) {
            continue;
        }
        known_it->second.content_hash = hash;
        events.push_back({relative, ChangeKind::Modified, std::chrono::system_clock::now()});
    }

    for (auto known_it = known_.begin(); known_it != known_.end(); ) {
        if (seen.count(known_it->first) == 0) {
            events.push_back({known_it->first, ChangeKind::Deleted, std::chrono::system_clock::now()});
            known_it = known_.erase(known_it);
        } else {
            ++known_it;
        }
    }

    first_pass_ = false;
    return events;
}

void DirectoryPoller::start(ChangeQueue& queue) {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this, &queue]() { run(queue); });
    Logger::info("Watching ", root_, " every ", interval_.count(), " ms");
}

void DirectoryPoller::stop() {
    {
        // Flip under the wait mutex so the poll thread cannot miss the wakeup
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DirectoryPoller::run(ChangeQueue& queue) {
    while (running_) {
        for (auto& event : poll()) {
            Logger::debug("Change: ", to_string(event.kind), " ", event.path);
            if (!queue.push(std::move(event))) {
                return;
            }
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

} // namespace driftwatch
