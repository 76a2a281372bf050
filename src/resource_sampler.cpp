#include "driftwatch/resource_sampler.hpp"

namespace driftwatch {

// Platform-specific implementations are in platform/ subdirectory

#ifdef __linux__
    std::unique_ptr<ResourceSampler> create_resource_sampler() {
        extern std::unique_ptr<ResourceSampler> create_linux_resource_sampler();
        return create_linux_resource_sampler();
    }
#else
    #error "Unsupported platform"
#endif

} // namespace driftwatch
