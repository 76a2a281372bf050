#pragma once

#include <memory>

namespace driftwatch {

struct ResourceUsage {
    double cpu_percent = 0.0;   // Of one core, since the previous sample
    double memory_mb = 0.0;     // Resident set size
};

class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;
    virtual ResourceUsage sample() = 0;
};

// Factory function
std::unique_ptr<ResourceSampler> create_resource_sampler();

} // namespace driftwatch
