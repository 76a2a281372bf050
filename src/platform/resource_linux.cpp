#include "driftwatch/resource_sampler.hpp"
#include "driftwatch/logger.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace driftwatch {

class LinuxResourceSampler : public ResourceSampler {
public:
    LinuxResourceSampler() {
        ticks_per_second_ = sysconf(_SC_CLK_TCK);
        if (ticks_per_second_ <= 0) {
            ticks_per_second_ = 100;
        }
        // Get initial CPU stats
        prev_ticks_ = read_cpu_ticks();
        prev_time_ = std::chrono::steady_clock::now();
    }

    ResourceUsage sample() override {
        ResourceUsage usage;

        unsigned long long ticks = read_cpu_ticks();
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - prev_time_).count();

        if (elapsed > 0.0 && ticks >= prev_ticks_) {
            double cpu_seconds = static_cast<double>(ticks - prev_ticks_) / ticks_per_second_;
            usage.cpu_percent = 100.0 * cpu_seconds / elapsed;
        }
        prev_ticks_ = ticks;
        prev_time_ = now;

        usage.memory_mb = read_resident_mb();
        return usage;
    }

private:
    // utime + stime of this process, in clock ticks
    unsigned long long read_cpu_ticks() {
        std::ifstream stat_file("/proc/self/stat");
        std::string content;
        std::getline(stat_file, content);

        // The command name may contain spaces; fields resume after ')'
        size_t close = content.rfind(')');
        if (close == std::string::npos) {
            Logger::debug("Unexpected /proc/self/stat format");
            return prev_ticks_;
        }

        std::istringstream iss(content.substr(close + 2));
        std::string field;
        unsigned long long utime = 0, stime = 0;
        // state is field 3; utime and stime are fields 14 and 15
        for (int index = 3; index <= 13; ++index) {
            iss >> field;
        }
        iss >> utime >> stime;
        return utime + stime;
    }

    double read_resident_mb() {
        std::ifstream status_file("/proc/self/status");
        std::string line;
        while (std::getline(status_file, line)) {
            if (line.rfind("VmRSS:", 0) == 0) {
                std::istringstream iss(line.substr(6));
                unsigned long long kb = 0;
                iss >> kb;
                return static_cast<double>(kb) / 1024.0;
            }
        }
        return 0.0;
    }

    long ticks_per_second_ = 100;
    unsigned long long prev_ticks_ = 0;
    std::chrono::steady_clock::time_point prev_time_;
};

std::unique_ptr<ResourceSampler> create_linux_resource_sampler() {
    return std::make_unique<LinuxResourceSampler>();
}

} // namespace driftwatch
