#pragma once

#include "cluster_client.hpp"
#include "public_api_client.hpp"
#include "trust_chain.hpp"
#include <string>
#include <vector>
#include <optional>

namespace multicluster {

inline const std::string kServiceMirrorComponentSelector =
    "linkerd.io/control-plane-component=linkerd-service-mirror";
inline const std::string kServiceMirrorClusterRoleName = "linkerd-service-mirror-access-local-resources";
inline const std::string kServiceMirrorRoleName = "linkerd-service-mirror-read-remote-creds";

inline const std::string kMirroredResourceLabel = "mirror.linkerd.io/mirrored-service";
inline const std::string kGatewayNameAnnotation = "mirror.linkerd.io/gateway-name";

inline const std::string kGatewayTimeWindow = "1m";

struct ExpectedPolicy {
    std::vector<std::string> resources;
    std::vector<std::string> verbs;
};

const std::vector<ExpectedPolicy>& expected_cluster_role_policies();
const std::vector<ExpectedPolicy>& expected_role_policies();
const std::vector<std::string>& expected_remote_service_verbs();

// Every expected policy must be covered by one rule. A rule whose sorted
// resources equal the expected resources is preferred; otherwise a rule whose
// resources are a superset is accepted. The verbs of the chosen rule must
// equal the expected verbs. Returns one line per gap.
std::vector<std::string> compare_rules(const std::string& kind,
                                       const RbacRole& role,
                                       const std::vector<ExpectedPolicy>& expected);

// "expected get,list,watch, got get,list" when the sorted sets differ
std::optional<std::string> compare_permissions(std::vector<std::string> expected,
                                               std::vector<std::string> actual);

// Both sides hold the same set of anchor signatures
bool anchors_agree(const std::vector<trust::Certificate>& local,
                   const std::vector<trust::Certificate>& remote);

struct GatewayPartition {
    std::vector<GatewayStatus> alive;
    std::vector<GatewayStatus> dead;
};

GatewayPartition partition_gateways(const std::vector<GatewayStatus>& gateways);

std::string describe_gateway(const GatewayStatus& gateway);

// One entry per mirror service that is exported again, and per exported
// traffic split apex routing to a mirror service
std::vector<std::string> find_daisy_chains(const std::vector<Service>& services,
                                           const std::vector<TrafficSplit>& traffic_splits);

// Indents each message by depth * 4 spaces, one per line
std::string join_errors(const std::vector<std::string>& errors, int depth);

} // namespace multicluster
