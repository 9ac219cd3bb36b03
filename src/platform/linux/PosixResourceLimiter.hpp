#pragma once

#include "platform/ResourceLimiter.hpp"

namespace Attest {

// setrlimit() based caps: RLIMIT_CPU, RLIMIT_AS, RLIMIT_NPROC, RLIMIT_FSIZE,
// each with soft == hard so there is no grace period.
class PosixResourceLimiter : public ResourceLimiter {
public:
    QString name() const override { return QStringLiteral("posix-rlimit"); }
    bool isSupported() const override;
    LimitPlan plan(const ResourceLimits& limits) const override;
    void apply(const LimitPlan& plan) const noexcept override;
};

} // namespace Attest
