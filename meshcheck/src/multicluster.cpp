#include "multicluster.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <set>

namespace multicluster {

namespace {

bool is_superset(const std::vector<std::string>& sorted_actual, const std::vector<std::string>& sorted_expected) {
    return std::includes(sorted_actual.begin(), sorted_actual.end(),
                         sorted_expected.begin(), sorted_expected.end());
}

const Service* find_service(const std::vector<Service>& services,
                            const std::string& ns,
                            const std::string& name) {
    for (const auto& svc : services) {
        if (svc.namespace_ == ns && svc.name == name) {
            return &svc;
        }
    }
    return nullptr;
}

bool is_mirror(const Service& svc) {
    return svc.labels.count(kMirroredResourceLabel) > 0;
}

bool is_exported(const Service& svc) {
    return svc.annotations.count(kGatewayNameAnnotation) > 0;
}

bool is_zero_weight(const std::string& weight) {
    return weight == "0" || weight == "0m";
}

} // namespace

const std::vector<ExpectedPolicy>& expected_cluster_role_policies() {
    static const std::vector<ExpectedPolicy> policies = {
        {{"endpoints", "services"}, {"list", "get", "watch", "create", "delete", "update"}},
        {{"namespaces"}, {"create", "list", "get", "watch"}},
    };
    return policies;
}

const std::vector<ExpectedPolicy>& expected_role_policies() {
    static const std::vector<ExpectedPolicy> policies = {
        {{"secrets"}, {"list", "get", "watch"}},
    };
    return policies;
}

const std::vector<std::string>& expected_remote_service_verbs() {
    static const std::vector<std::string> verbs = {"get", "list", "watch"};
    return verbs;
}

std::vector<std::string> compare_rules(const std::string& kind,
                                       const RbacRole& role,
                                       const std::vector<ExpectedPolicy>& expected) {
    std::vector<std::string> problems;

    for (const auto& policy : expected) {
        auto want_resources = util::sorted(policy.resources);
        auto want_verbs = util::sorted(policy.verbs);

        const PolicyRule* exact = nullptr;
        const PolicyRule* superset = nullptr;
        for (const auto& rule : role.rules) {
            auto have = util::sorted(rule.resources);
            if (have == want_resources) {
                exact = &rule;
                break;
            }
            if (!superset && is_superset(have, want_resources)) {
                superset = &rule;
            }
        }

        const PolicyRule* match = exact ? exact : superset;
        if (!match) {
            problems.push_back(fmt::format("* {} {}: missing rule for resources [{}] with verbs [{}]",
                                           kind, role.name,
                                           util::join(want_resources, ","),
                                           util::join(want_verbs, ",")));
            continue;
        }

        auto have_verbs = util::sorted(match->verbs);
        if (have_verbs != want_verbs) {
            problems.push_back(fmt::format("* {} {}: rule for resources [{}] expected verbs [{}], got [{}]",
                                           kind, role.name,
                                           util::join(want_resources, ","),
                                           util::join(want_verbs, ","),
                                           util::join(have_verbs, ",")));
        }
    }
    return problems;
}

std::optional<std::string> compare_permissions(std::vector<std::string> expected,
                                               std::vector<std::string> actual) {
    std::sort(expected.begin(), expected.end());
    std::sort(actual.begin(), actual.end());

    std::string expected_str = util::join(expected, ",");
    std::string actual_str = util::join(actual, ",");
    if (expected_str != actual_str) {
        return fmt::format("expected {}, got {}", expected_str, actual_str);
    }
    return std::nullopt;
}

bool anchors_agree(const std::vector<trust::Certificate>& local,
                   const std::vector<trust::Certificate>& remote) {
    std::set<std::string> local_signatures;
    for (const auto& cert : local) {
        local_signatures.insert(cert.signature());
    }
    std::set<std::string> remote_signatures;
    for (const auto& cert : remote) {
        remote_signatures.insert(cert.signature());
    }
    return local_signatures == remote_signatures;
}

GatewayPartition partition_gateways(const std::vector<GatewayStatus>& gateways) {
    GatewayPartition partition;
    for (const auto& gw : gateways) {
        if (gw.alive) {
            partition.alive.push_back(gw);
        } else {
            partition.dead.push_back(gw);
        }
    }
    return partition;
}

std::string describe_gateway(const GatewayStatus& gateway) {
    return fmt::format("\t* cluster: [{}], gateway: [{}/{}]",
                       gateway.cluster_name, gateway.namespace_, gateway.name);
}

std::vector<std::string> find_daisy_chains(const std::vector<Service>& services,
                                           const std::vector<TrafficSplit>& traffic_splits) {
    std::vector<std::string> chains;

    for (const auto& svc : services) {
        if (is_mirror(svc) && is_exported(svc)) {
            chains.push_back(fmt::format("mirror service {}.{} is exported", svc.name, svc.namespace_));
        }
    }

    for (const auto& ts : traffic_splits) {
        const Service* apex = find_service(services, ts.namespace_, ts.service);
        if (!apex || !is_exported(*apex)) {
            continue;
        }
        for (const auto& backend : ts.backends) {
            if (is_zero_weight(backend.weight)) {
                continue;
            }
            const Service* target = find_service(services, ts.namespace_, backend.service);
            if (target && is_mirror(*target)) {
                chains.push_back(fmt::format("exported service {}.{} routes to mirror service {}.{} via traffic split {}",
                                             apex->name, apex->namespace_,
                                             target->name, target->namespace_, ts.name));
            }
        }
    }
    return chains;
}

std::string join_errors(const std::vector<std::string>& errors, int depth) {
    return util::indent_lines(errors, depth);
}

} // namespace multicluster
