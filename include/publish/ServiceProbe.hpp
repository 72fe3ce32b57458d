#pragma once

#include "concurrency/Context.hpp"

#include <string>

namespace d8::publish {

struct ServiceIdentity {
    std::string uid;
    std::string clusterIP;
};

// Reads the well-known cluster service twice: once through the configured API
// endpoint, once straight at its ClusterIP.
class ServiceProbe {
public:
    virtual ~ServiceProbe() = default;

    virtual ServiceIdentity viaApiServer(const concurrency::Context& ctx) = 0;
    virtual ServiceIdentity viaClusterIP(const concurrency::Context& ctx, const ServiceIdentity& first) = 0;
};

}
