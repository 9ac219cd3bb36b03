#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <array>
#include <cstddef>
#include <memory>

namespace Attest {

struct SandboxConfig;

struct ResourceLimits {
    qint64 cpuSeconds = 0;
    qint64 memoryBytes = 0;
    qint64 processes = 0;
    qint64 fileBytes = 0;

    static ResourceLimits fromConfig(const SandboxConfig& config);
};

struct LimitEntry {
    int resource = 0;
    quint64 value = 0;
    const char* label = "";
};

// Precomputed in the parent; the child only walks entries[0..count).
struct LimitPlan {
    std::array<LimitEntry, 4> entries{};
    std::size_t count = 0;
    QStringList applied;
    QStringList skipped;
};

/**
 * @brief Best-effort resource caps for a child process
 *
 * plan() runs in the parent and may log; it decides which limits the
 * platform supports and clamps values the child could not set. apply() runs
 * between fork and exec and must stay async-signal-safe. A limit the platform
 * lacks is skipped, never turned into a launch failure.
 */
class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    virtual QString name() const = 0;
    virtual bool isSupported() const = 0;
    virtual LimitPlan plan(const ResourceLimits& limits) const = 0;
    virtual void apply(const LimitPlan& plan) const noexcept = 0;
};

class NullResourceLimiter : public ResourceLimiter {
public:
    QString name() const override { return QStringLiteral("none"); }
    bool isSupported() const override { return false; }
    LimitPlan plan(const ResourceLimits& limits) const override;
    void apply(const LimitPlan&) const noexcept override {}
};

// Picks the POSIX limiter when getrlimit works here, NullResourceLimiter otherwise
std::unique_ptr<ResourceLimiter> createResourceLimiter();

} // namespace Attest
