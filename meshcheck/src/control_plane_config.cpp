#include "control_plane_config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ControlPlaneConfig ControlPlaneConfig::from_json(const nlohmann::json& values) {
    ControlPlaneConfig cfg;

    cfg.identity_trust_anchors_pem = values.value("identityTrustAnchorsPEM", "");
    cfg.high_availability = values.value("highAvailability", false);
    cfg.cni_enabled = values.value("cniEnabled", false);

    if (values.contains("identity") && values["identity"].contains("issuer")) {
        const auto& issuer = values["identity"]["issuer"];
        std::string scheme = issuer.value("scheme", "");
        if (!scheme.empty()) {
            cfg.issuer_scheme = scheme;
        }
    }

    return cfg;
}

ControlPlaneConfig fetch_control_plane_config(ClusterClient& client, const std::string& ns) {
    ConfigMap cm = client.get_config_map(ns, kLinkerdConfigMapName);

    auto it = cm.data.find("values");
    if (it == cm.data.end() || it->second.empty()) {
        spdlog::debug("{}/{} has no values, using defaults", ns, kLinkerdConfigMapName);
        ControlPlaneConfig cfg;
        cfg.uid = cm.uid;
        return cfg;
    }

    nlohmann::json values;
    try {
        values = nlohmann::json::parse(it->second);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("could not parse " + kLinkerdConfigMapName + " values: " + e.what());
    }

    ControlPlaneConfig cfg = ControlPlaneConfig::from_json(values);
    cfg.uid = cm.uid;
    return cfg;
}
