#include "PosixResourceLimiter.hpp"
#include "core/common/Logger.hpp"

#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace Attest {

namespace {

// glibc types the resource argument as an enum in C++, other libcs use int
using RlimitResource = decltype(RLIMIT_CPU);

struct LimitRequest {
    RlimitResource resource;
    qint64 value;
    const char* label;
};

} // namespace

bool PosixResourceLimiter::isSupported() const {
    struct rlimit current;
    return ::getrlimit(RLIMIT_CPU, &current) == 0;
}

LimitPlan PosixResourceLimiter::plan(const ResourceLimits& limits) const {
    const LimitRequest requests[] = {
        {RLIMIT_CPU, limits.cpuSeconds, "cpu"},
        {RLIMIT_AS, limits.memoryBytes, "memory"},
        {RLIMIT_NPROC, limits.processes, "processes"},
        {RLIMIT_FSIZE, limits.fileBytes, "file_size"},
    };

    LimitPlan plan;
    for (const auto& request : requests) {
        if (request.value <= 0) {
            ATTEST_DEBUG("Resource limit {} disabled by configuration", request.label);
            plan.skipped.append(QString::fromLatin1(request.label));
            continue;
        }

        struct rlimit current;
        if (::getrlimit(request.resource, &current) != 0) {
            ATTEST_WARN("Resource limit {} unsupported ({}); skipping", request.label, std::strerror(errno));
            plan.skipped.append(QString::fromLatin1(request.label));
            continue;
        }

        rlim_t value = static_cast<rlim_t>(request.value);
        // An unprivileged child cannot raise its hard limit
        if (current.rlim_max != RLIM_INFINITY && value > current.rlim_max) {
            ATTEST_INFO("Resource limit {} clamped from {} to inherited hard limit {}",
                        request.label, request.value, static_cast<quint64>(current.rlim_max));
            value = current.rlim_max;
        }

        LimitEntry& entry = plan.entries[plan.count++];
        entry.resource = static_cast<int>(request.resource);
        entry.value = static_cast<quint64>(value);
        entry.label = request.label;
        plan.applied.append(QString::fromLatin1(request.label));
    }

    ATTEST_DEBUG("Resource limits planned: CPU={}s, Memory={}B, Processes={}, FileSize={}B",
                 limits.cpuSeconds, limits.memoryBytes, limits.processes, limits.fileBytes);
    return plan;
}

void PosixResourceLimiter::apply(const LimitPlan& plan) const noexcept {
    for (std::size_t i = 0; i < plan.count; ++i) {
        const LimitEntry& entry = plan.entries[i];
        struct rlimit limit;
        limit.rlim_cur = static_cast<rlim_t>(entry.value);
        limit.rlim_max = static_cast<rlim_t>(entry.value);
        if (::setrlimit(static_cast<RlimitResource>(entry.resource), &limit) != 0) {
            // Only async-signal-safe calls are allowed here; report on the child's stderr
            static const char prefix[] = "attest: setrlimit failed for ";
            ssize_t written = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
            written = ::write(STDERR_FILENO, entry.label, std::strlen(entry.label));
            written = ::write(STDERR_FILENO, "\n", 1);
            (void)written;
        }
    }
}

} // namespace Attest
