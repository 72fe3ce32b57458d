#pragma once

#include "http/HttpClient.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace d8::transfer {

enum class VolumeMode { Filesystem, Block };

VolumeMode parseVolumeMode(std::string_view s);
std::string to_string(VolumeMode mode);

struct TransferSession {
    std::string baseURL;
    VolumeMode volumeMode = VolumeMode::Filesystem;
    std::unique_ptr<http::HttpClient> httpClient;
    std::string namespace_;
    std::string resourceName;
};

struct PublishDecision {
    bool explicit_ = false;
    bool value = false;
};

// Backed by the Kubernetes collaborator in the CLI; tests supply fakes.
class TransferEndpointProvider {
public:
    virtual ~TransferEndpointProvider() = default;
    virtual TransferSession prepare(const concurrency::Context& ctx, const std::string& name,
                                    const std::string& namespace_, bool publish) = 0;
};

}
