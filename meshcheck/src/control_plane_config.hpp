#pragma once

#include "cluster_client.hpp"
#include <string>
#include <nlohmann/json.hpp>

inline const std::string kIssuerSchemeLinkerd = "linkerd.io/tls";
inline const std::string kIssuerSchemeKubernetes = "kubernetes.io/tls";

inline const std::string kLinkerdConfigMapName = "linkerd-config";

// Parsed control-plane values, as stored in the linkerd-config ConfigMap
struct ControlPlaneConfig {
    std::string uid;
    std::string identity_trust_anchors_pem;
    std::string issuer_scheme = kIssuerSchemeLinkerd;
    bool high_availability = false;
    bool cni_enabled = false;

    static ControlPlaneConfig from_json(const nlohmann::json& values);
};

// Reads and parses linkerd-config from the given namespace. Throws
// ClusterApiError if the ConfigMap is missing and std::runtime_error if its
// values cannot be parsed.
ControlPlaneConfig fetch_control_plane_config(ClusterClient& client, const std::string& ns);
