#include "health_checker.hpp"
#include "multicluster.hpp"
#include "remote_cluster.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    const std::string kNotCheckingMulticluster = "not checking muticluster";
    const std::string kNoRemoteClusters = "no remote clusters";
}

Category HealthChecker::multicluster_category() {
    return Category(categories::kMulticluster, {
        Checker("service mirror controller is running")
            .with_hint_anchor("l5d-multicluster-service-mirror-running")
            .with_retry_deadline(options_.retry_deadline)
            .surface_error_on_retry()
            .with_check([this](CheckContext& ctx) { return check_service_mirror_controller(ctx.state); }),
        Checker("service mirror controller has required permissions")
            .with_hint_anchor("l5d-multicluster-source-rbac-correct")
            .with_check([this](CheckContext& ctx) { return check_service_mirror_rbac(ctx.state); }),
        Checker("remote cluster access credentials are valid")
            .with_hint_anchor("l5d-smc-remote-remote-clusters-access")
            .with_check([this](CheckContext& ctx) { return check_remote_cluster_connectivity(ctx); }),
        Checker("clusters share trust anchors")
            .with_hint_anchor("l5d-multicluster-clusters-share-anchors")
            .with_check([this](CheckContext& ctx) { return check_remote_cluster_anchors(ctx); }),
        Checker("all remote gateways are alive")
            .with_hint_anchor("l5d-multicluster-remote-gateways-alive")
            .with_check([this](CheckContext& ctx) {
                if (!options_.multicluster && !ctx.state.multicluster.source_cluster) {
                    return CheckOutcome::skip(kNotCheckingMulticluster);
                }
                return check_remote_gateways();
            }),
        Checker("multicluster daisy chaining is avoided")
            .with_hint_anchor("l5d-multicluster-daisy-chaining")
            .warning()
            .with_check([this](CheckContext& ctx) {
                if (!options_.multicluster && !ctx.state.multicluster.source_cluster) {
                    return CheckOutcome::skip(kNotCheckingMulticluster);
                }
                return check_daisy_chains(ctx.state);
            }),
    });
}

std::optional<CheckOutcome> HealthChecker::require_service_mirror(const DiscoveryContext& state) const {
    if (state.multicluster.source_cluster) {
        return std::nullopt;
    }
    if (options_.multicluster) {
        return CheckOutcome::fail("service mirror controller is not present");
    }
    return CheckOutcome::skip(kNotCheckingMulticluster);
}

CheckOutcome HealthChecker::check_service_mirror_controller(DiscoveryContext& state) {
    auto deployments = client(state).list_deployments("", multicluster::kServiceMirrorComponentSelector);

    if (deployments.size() > 1) {
        return CheckOutcome::fail("There are more than one service mirror controllers");
    }
    if (deployments.empty()) {
        state.multicluster.source_cluster = false;
        if (options_.multicluster) {
            return CheckOutcome::fail("Service mirror controller is not present");
        }
        return CheckOutcome::skip(kNotCheckingMulticluster);
    }

    const auto& controller = deployments.front();
    if (controller.available_replicas < 1) {
        return CheckOutcome::fail(fmt::format("Service mirror controller is not available: {}/{}",
                                              controller.namespace_, controller.name));
    }

    state.multicluster.source_cluster = true;
    state.multicluster.service_mirror_namespace = controller.namespace_;
    return CheckOutcome::ok();
}

CheckOutcome HealthChecker::check_service_mirror_rbac(DiscoveryContext& state) {
    if (auto precondition = require_service_mirror(state)) {
        return *precondition;
    }

    std::vector<std::string> problems;
    try {
        auto role = client(state).get_cluster_role(multicluster::kServiceMirrorClusterRoleName);
        auto gaps = multicluster::compare_rules("ClusterRole", role, multicluster::expected_cluster_role_policies());
        problems.insert(problems.end(), gaps.begin(), gaps.end());
    } catch (const ClusterApiError& e) {
        problems.push_back(fmt::format("* ClusterRole {}: {}", multicluster::kServiceMirrorClusterRoleName, e.what()));
    }

    try {
        auto role = client(state).get_role(state.multicluster.service_mirror_namespace, multicluster::kServiceMirrorRoleName);
        auto gaps = multicluster::compare_rules("Role", role, multicluster::expected_role_policies());
        problems.insert(problems.end(), gaps.begin(), gaps.end());
    } catch (const ClusterApiError& e) {
        problems.push_back(fmt::format("* Role {}: {}", multicluster::kServiceMirrorRoleName, e.what()));
    }

    if (!problems.empty()) {
        return CheckOutcome::fail(multicluster::join_errors(problems, 1));
    }
    return CheckOutcome::ok();
}

CheckOutcome HealthChecker::check_remote_cluster_connectivity(CheckContext& ctx) {
    auto& state = ctx.state;
    if (auto precondition = require_service_mirror(state)) {
        return *precondition;
    }

    state.multicluster.remotes.clear();
    std::vector<std::string> errors;
    std::vector<std::string> clusters;

    for (const auto& secret : client(state).list_secrets(state.multicluster.service_mirror_namespace)) {
        if (!is_remote_cluster_secret(secret)) {
            continue;
        }

        RemoteClusterDescriptor descriptor;
        try {
            descriptor = parse_remote_cluster_secret(secret);
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("* secret: [{}/{}]: could not parse config secret: {}",
                                         secret.namespace_, secret.name, e.what()));
            continue;
        }

        std::shared_ptr<ClusterClient> remote;
        try {
            remote = connect_remote(descriptor, ctx);
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("* secret: [{}/{}] cluster: [{}]: unable to parse api config: {}",
                                         secret.namespace_, secret.name, descriptor.cluster_name, e.what()));
            continue;
        }

        std::vector<std::string> verbs;
        try {
            for (const auto& verb : multicluster::expected_remote_service_verbs()) {
                if (remote->can_perform(ResourceAccess{verb, "", "", "v1", "services"})) {
                    verbs.push_back(verb);
                }
            }
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("* failed to connect to API for cluster: [{}]: {}",
                                         descriptor.cluster_name, e.what()));
            continue;
        }

        if (auto err = multicluster::compare_permissions(multicluster::expected_remote_service_verbs(), verbs)) {
            errors.push_back(fmt::format("* cluster: [{}]: Insufficient Service permissions: {}",
                                         descriptor.cluster_name, *err));
            continue;
        }

        spdlog::debug("Remote cluster {} is reachable", descriptor.cluster_name);
        clusters.push_back("\t* " + descriptor.cluster_name);
        state.multicluster.remotes.push_back(descriptor);
    }

    if (!errors.empty()) {
        return CheckOutcome::fail(multicluster::join_errors(errors, 2));
    }
    if (clusters.empty()) {
        return CheckOutcome::skip(kNoRemoteClusters);
    }
    return CheckOutcome::verbose(util::join(clusters, "\n"));
}

CheckOutcome HealthChecker::check_remote_cluster_anchors(CheckContext& ctx) {
    auto& state = ctx.state;
    if (auto precondition = require_service_mirror(state)) {
        return *precondition;
    }
    if (state.multicluster.remotes.empty()) {
        return CheckOutcome::skip(kNoRemoteClusters);
    }

    const auto& local_config = control_plane_config(state);
    std::vector<trust::Certificate> local_anchors;
    try {
        local_anchors = trust::decode_pem_certificates(local_config.identity_trust_anchors_pem);
    } catch (const std::runtime_error& e) {
        return CheckOutcome::fail(fmt::format("Cannot parse source trust anchors: {}", e.what()));
    }

    std::vector<std::string> problems;
    std::vector<std::string> clusters;
    for (const auto& remote : state.multicluster.remotes) {
        ControlPlaneConfig remote_config;
        try {
            auto remote_client = connect_remote(remote, ctx);
            remote_config = fetch_control_plane_config(*remote_client, remote.namespace_);
        } catch (const std::exception& e) {
            problems.push_back(fmt::format("* {}: unable to fetch anchors: {}", remote.cluster_name, e.what()));
            continue;
        }

        std::vector<trust::Certificate> remote_anchors;
        try {
            remote_anchors = trust::decode_pem_certificates(remote_config.identity_trust_anchors_pem);
        } catch (const std::runtime_error&) {
            problems.push_back(fmt::format("* {}: cannot parse trust anchors", remote.cluster_name));
            continue;
        }

        if (!multicluster::anchors_agree(local_anchors, remote_anchors)) {
            problems.push_back("* " + remote.cluster_name);
            continue;
        }
        clusters.push_back("\t* " + remote.cluster_name);
    }

    if (!problems.empty()) {
        return CheckOutcome::fail("Problematic clusters:\n    " + util::join(problems, "\n    "));
    }
    return CheckOutcome::verbose(util::join(clusters, "\n"));
}

CheckOutcome HealthChecker::check_remote_gateways() {
    if (!public_api_) {
        return CheckOutcome::fail("public API client is not configured (set PUBLIC_API_ADDR)");
    }

    auto gateways = public_api_->gateways(multicluster::kGatewayTimeWindow);
    if (gateways.empty()) {
        return CheckOutcome::skip("no remote gateways");
    }

    auto partition = multicluster::partition_gateways(gateways);
    if (!partition.dead.empty()) {
        std::vector<std::string> dead;
        for (const auto& gw : partition.dead) {
            dead.push_back(multicluster::describe_gateway(gw));
        }
        return CheckOutcome::fail("Some gateways are not alive:\n" + util::join(dead, "\n"));
    }

    std::vector<std::string> alive;
    for (const auto& gw : partition.alive) {
        alive.push_back(multicluster::describe_gateway(gw));
    }
    return CheckOutcome::verbose(util::join(alive, "\n"));
}

CheckOutcome HealthChecker::check_daisy_chains(DiscoveryContext& state) {
    auto services = client(state).list_services("", "");
    auto traffic_splits = client(state).list_traffic_splits("");

    auto chains = multicluster::find_daisy_chains(services, traffic_splits);
    if (!chains.empty()) {
        return CheckOutcome::fail("daisy-chained services detected:\n    " + util::join(chains, "\n    "));
    }
    return CheckOutcome::ok();
}
