// BatchCollapse - Coalescing retention timer
// Platform timer factory

#include "batchcollapse/pal/timer_pal.hpp"

#if defined(__linux__)
#include "batchcollapse/pal/linux/linux_timer_pal.hpp"
#endif

namespace batchcollapse {
namespace pal {

std::shared_ptr<ITimerPAL> createPlatformTimer() {
#if defined(__linux__)
    return std::make_shared<linux::LinuxTimerPAL>();
#else
    return nullptr;
#endif
}

} // namespace pal
} // namespace batchcollapse
