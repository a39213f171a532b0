#pragma once

#include "cluster_client.hpp"
#include <string>

inline const std::string kMirrorSecretType = "mirror.linkerd.io/remote-kubeconfig";
inline const std::string kConfigKeyName = "kubeconfig";
inline const std::string kRemoteClusterNameAnnotation = "mirror.linkerd.io/cluster-name";
inline const std::string kRemoteClusterDomainAnnotation = "mirror.linkerd.io/remote-cluster-domain";
inline const std::string kRemoteClusterLinkerdNamespaceAnnotation = "mirror.linkerd.io/remote-cluster-l5d-ns";

// How to reach a linked remote cluster
struct RemoteClusterDescriptor {
    std::string cluster_name;
    std::string namespace_;       // control-plane namespace on the remote side
    std::string cluster_domain;
    std::string api_config;       // kubeconfig document, passed through untouched
};

bool is_remote_cluster_secret(const Secret& secret);

// Throws std::runtime_error naming the missing key or annotation
RemoteClusterDescriptor parse_remote_cluster_secret(const Secret& secret);
