#include "ResourceLimiter.hpp"
#include "core/common/Logger.hpp"
#include "core/security/SandboxTypes.hpp"

#ifdef Q_OS_UNIX
#include "platform/linux/PosixResourceLimiter.hpp"
#endif

namespace Attest {

ResourceLimits ResourceLimits::fromConfig(const SandboxConfig& config) {
    ResourceLimits limits;
    limits.cpuSeconds = config.maxCpuSeconds;
    limits.memoryBytes = config.maxMemoryBytes;
    limits.processes = config.maxProcesses;
    limits.fileBytes = config.maxFileBytes;
    return limits;
}

LimitPlan NullResourceLimiter::plan(const ResourceLimits& limits) const {
    Q_UNUSED(limits)
    LimitPlan plan;
    plan.skipped = {
        QStringLiteral("cpu"), QStringLiteral("memory"),
        QStringLiteral("processes"), QStringLiteral("file_size")
    };
    ATTEST_WARN("Resource limits not supported on this platform; running without caps");
    return plan;
}

std::unique_ptr<ResourceLimiter> createResourceLimiter() {
#ifdef Q_OS_UNIX
    auto posix = std::make_unique<PosixResourceLimiter>();
    if (posix->isSupported()) {
        return posix;
    }
#endif
    return std::make_unique<NullResourceLimiter>();
}

} // namespace Attest
