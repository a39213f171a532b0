#pragma once

#include "cluster_client.hpp"
#include "control_plane_config.hpp"
#include "remote_cluster.hpp"
#include "trust_chain.hpp"
#include <memory>
#include <optional>
#include <vector>

// Populated by the kubernetes-api, kubernetes-version, linkerd-existence and
// linkerd-cni-plugin categories
struct ClusterDiscovery {
    std::shared_ptr<ClusterClient> client;
    std::optional<ServerVersion> version;
    std::vector<Pod> control_plane_pods;
    std::optional<ControlPlaneConfig> config;
    std::optional<DaemonSet> cni_daemon_set;
};

// Populated by "certificate config is valid"
struct IdentityDiscovery {
    std::optional<trust::Cred> issuer;
    std::vector<trust::Certificate> trust_anchors;
};

// Populated by the linkerd-multicluster category, in check order
struct MulticlusterDiscovery {
    bool source_cluster = false;
    std::string service_mirror_namespace;
    std::vector<RemoteClusterDescriptor> remotes;
};

// Everything checks learn about the cluster during a run. Later checks read
// what earlier checks wrote; the orchestrator owns the only instance.
struct DiscoveryContext {
    ClusterDiscovery cluster;
    IdentityDiscovery identity;
    MulticlusterDiscovery multicluster;
};
