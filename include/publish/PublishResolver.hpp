#pragma once

#include "publish/ServiceProbe.hpp"
#include "transfer/types.hpp"

#include <chrono>

namespace d8::publish {

class PublishResolver {
public:
    PublishResolver();
    explicit PublishResolver(std::chrono::milliseconds probeTimeout);

    // Explicit decisions return immediately. Otherwise runs both probes and throws
    // AmbiguousPublishError when reachability cannot be decided.
    bool resolve(const concurrency::Context& ctx, const transfer::PublishDecision& decision, ServiceProbe& probe) const;

    bool detect(const concurrency::Context& ctx, ServiceProbe& probe) const;

private:
    std::chrono::milliseconds probeTimeout_;
};

}
