#include "remote_cluster.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace {

std::string required_annotation(const Secret& secret, const std::string& key) {
    auto it = secret.annotations.find(key);
    if (it == secret.annotations.end() || it->second.empty()) {
        throw std::runtime_error(fmt::format("secret should contain remote cluster annotation: {}", key));
    }
    return it->second;
}

} // namespace

bool is_remote_cluster_secret(const Secret& secret) {
    return secret.type == kMirrorSecretType;
}

RemoteClusterDescriptor parse_remote_cluster_secret(const Secret& secret) {
    auto config = secret.data.find(kConfigKeyName);
    if (config == secret.data.end() || config->second.empty()) {
        throw std::runtime_error(fmt::format("secret of type {} should contain key {}", kMirrorSecretType, kConfigKeyName));
    }

    RemoteClusterDescriptor descriptor;
    descriptor.cluster_name = required_annotation(secret, kRemoteClusterNameAnnotation);
    descriptor.cluster_domain = required_annotation(secret, kRemoteClusterDomainAnnotation);
    descriptor.namespace_ = required_annotation(secret, kRemoteClusterLinkerdNamespaceAnnotation);
    descriptor.api_config = config->second;
    return descriptor;
}
