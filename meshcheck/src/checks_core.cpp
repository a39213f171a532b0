#include "health_checker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <map>

namespace {
    const std::string kControlPlaneComponentLabel = "linkerd.io/control-plane-component";
    const std::string kLinkerdCNIResourceName = "linkerd-cni";
    const std::string kCNIDisabledSkipReason = "skipping check because CNI is not enabled";
    const std::string kExtensionAPIServerAuthConfigMap = "extension-apiserver-authentication";
    const std::string kRequestHeaderClientCAFileKey = "requestheader-client-ca-file";

    const int kMinimumKubernetesMajor = 1;
    const int kMinimumKubernetesMinor = 21;

    const std::vector<std::string> kHAControlPlaneComponents = {
        "linkerd-destination",
        "linkerd-identity",
        "linkerd-proxy-injector",
    };

    // Cluster-scoped kinds an install creates
    const std::vector<ResourceAccess> kNonNamespacedResources = {
        {"create", "", "rbac.authorization.k8s.io", "v1", "clusterroles"},
        {"create", "", "rbac.authorization.k8s.io", "v1", "clusterrolebindings"},
        {"create", "", "apiextensions.k8s.io", "v1", "customresourcedefinitions"},
        {"create", "", "admissionregistration.k8s.io", "v1", "mutatingwebhookconfigurations"},
        {"create", "", "admissionregistration.k8s.io", "v1", "validatingwebhookconfigurations"},
    };

    std::optional<std::string> authorization_error(ClusterClient& client, const ResourceAccess& access) {
        if (client.can_perform(access)) {
            return std::nullopt;
        }
        if (access.group.empty()) {
            return fmt::format("not authorized to access {}", access.resource);
        }
        return fmt::format("not authorized to access {}.{}", access.resource, access.group);
    }

    // linkerd-<component>-<replicaset hash>-<pod hash>, grouped by component
    std::map<std::string, std::vector<const Pod*>> running_pods_by_component(const std::vector<Pod>& pods) {
        std::map<std::string, std::vector<const Pod*>> grouped;
        for (const auto& pod : pods) {
            if (pod.phase != "Running" || !util::starts_with(pod.name, "linkerd-")) {
                continue;
            }
            auto parts = util::split(pod.name, '-');
            if (parts.size() < 4) {
                continue;
            }
            std::vector<std::string> component(parts.begin() + 1, parts.end() - 2);
            grouped[util::join(component, "-")].push_back(&pod);
        }
        return grouped;
    }
}

std::optional<std::string> validate_control_plane_pods(const std::vector<Pod>& pods) {
    auto grouped = running_pods_by_component(pods);

    for (const std::string name : {"destination", "identity", "proxy-injector"}) {
        auto it = grouped.find(name);
        if (it == grouped.end()) {
            return fmt::format("No running pods for \"linkerd-{}\"", name);
        }

        std::optional<std::string> not_ready;
        bool ready = false;
        for (const Pod* pod : it->second) {
            bool containers_ready = true;
            for (const auto& container : pod->container_statuses) {
                if (!container.ready) {
                    not_ready = fmt::format("pod/{} container {} is not ready", pod->name, container.name);
                    containers_ready = false;
                }
            }
            if (containers_ready) {
                ready = true;
                break;
            }
        }
        if (!ready) {
            return not_ready;
        }
    }
    return std::nullopt;
}

Category HealthChecker::kubernetes_api_category() {
    return Category(categories::kKubernetesAPI, {
        Checker("can initialize the client")
            .with_hint_anchor("k8s-api")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                ctx.state.cluster.client = clients_->create_local();
                return CheckOutcome::ok();
            }),
        Checker("can query the Kubernetes API")
            .with_hint_anchor("k8s-api")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                ctx.state.cluster.version = client(ctx.state).server_version();
                spdlog::debug("Kubernetes server version {}", ctx.state.cluster.version->git_version);
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::kubernetes_version_category() {
    return Category(categories::kKubernetesVersion, {
        Checker("is running the minimum Kubernetes API version")
            .with_hint_anchor("k8s-version")
            .with_check([](CheckContext& ctx) {
                const auto& version = ctx.state.cluster.version;
                if (!version) {
                    return CheckOutcome::fail("Kubernetes version is unknown");
                }
                bool too_old = version->major < kMinimumKubernetesMajor ||
                    (version->major == kMinimumKubernetesMajor && version->minor < kMinimumKubernetesMinor);
                if (too_old) {
                    return CheckOutcome::fail(fmt::format(
                        "Kubernetes is on version [{}.{}], but version [{}.{}.0] or more recent is required",
                        version->major, version->minor, kMinimumKubernetesMajor, kMinimumKubernetesMinor));
                }
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::pre_install_category() {
    auto can = [this](const std::string& verb, const std::string& group,
                      const std::string& version, const std::string& resource) -> CheckFunc {
        return [this, access = ResourceAccess{verb, options_.control_plane_namespace, group, version, resource}]
            (CheckContext& ctx) {
                if (auto err = authorization_error(client(ctx.state), access)) {
                    return CheckOutcome::fail(*err);
                }
                return CheckOutcome::ok();
            };
    };

    return Category(categories::kPreInstall, {
        Checker("control plane namespace does not already exist")
            .with_hint_anchor("pre-ns")
            .with_check([this](CheckContext& ctx) {
                if (client(ctx.state).namespace_exists(options_.control_plane_namespace)) {
                    return CheckOutcome::fail(fmt::format("The \"{}\" namespace already exists",
                                                          options_.control_plane_namespace));
                }
                return CheckOutcome::ok();
            }),
        Checker("can create non-namespaced resources")
            .with_hint_anchor("pre-k8s-cluster-k8s")
            .with_check([this](CheckContext& ctx) {
                std::vector<std::string> errors;
                for (const auto& access : kNonNamespacedResources) {
                    if (auto err = authorization_error(client(ctx.state), access)) {
                        errors.push_back(*err);
                    }
                }
                if (!errors.empty()) {
                    return CheckOutcome::fail(util::join(errors, "\n"));
                }
                return CheckOutcome::ok();
            }),
        Checker("can create ServiceAccounts").with_hint_anchor("pre-k8s").with_check(can("create", "", "v1", "serviceaccounts")),
        Checker("can create Services").with_hint_anchor("pre-k8s").with_check(can("create", "", "v1", "services")),
        Checker("can create Deployments").with_hint_anchor("pre-k8s").with_check(can("create", "apps", "v1", "deployments")),
        Checker("can create CronJobs").with_hint_anchor("pre-k8s").with_check(can("create", "batch", "v1", "cronjobs")),
        Checker("can create ConfigMaps").with_hint_anchor("pre-k8s").with_check(can("create", "", "v1", "configmaps")),
        Checker("can create Secrets").with_hint_anchor("pre-k8s").with_check(can("create", "", "v1", "secrets")),
        Checker("can read Secrets").with_hint_anchor("pre-k8s").with_check(can("get", "", "v1", "secrets")),
        Checker("can read extension-apiserver-authentication configmap")
            .with_hint_anchor("pre-k8s")
            .with_check([this](CheckContext& ctx) {
                auto cm = client(ctx.state).get_config_map("kube-system", kExtensionAPIServerAuthConfigMap);
                auto it = cm.data.find(kRequestHeaderClientCAFileKey);
                if (it == cm.data.end() || it->second.empty()) {
                    return CheckOutcome::fail(fmt::format("--{} is not configured", kRequestHeaderClientCAFileKey));
                }
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::control_plane_existence_category() {
    return Category(categories::kControlPlaneExistence, {
        Checker("'linkerd-config' config map exists")
            .with_hint_anchor("l5d-existence-linkerd-config")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                ctx.state.cluster.config = fetch_control_plane_config(client(ctx.state), options_.control_plane_namespace);
                return CheckOutcome::ok();
            }),
        Checker("control plane pods are ready")
            .with_hint_anchor("l5d-api-control-ready")
            .with_retry_deadline(options_.retry_deadline)
            .surface_error_on_retry()
            .fatal()
            .with_check([this](CheckContext& ctx) {
                ctx.state.cluster.control_plane_pods =
                    client(ctx.state).list_pods(options_.control_plane_namespace, kControlPlaneComponentLabel);
                if (auto err = validate_control_plane_pods(ctx.state.cluster.control_plane_pods)) {
                    return CheckOutcome::fail(*err);
                }
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::config_category() {
    return Category(categories::kConfig, {
        Checker("control plane Namespace exists")
            .with_hint_anchor("l5d-existence-ns")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                if (!client(ctx.state).namespace_exists(options_.control_plane_namespace)) {
                    return CheckOutcome::fail(fmt::format("The \"{}\" namespace does not exist",
                                                          options_.control_plane_namespace));
                }
                return CheckOutcome::ok();
            }),
        Checker("control plane ClusterRoles exist")
            .with_hint_anchor("l5d-existence-cr")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                std::vector<std::string> missing;
                for (const auto& component : {"identity", "proxy-injector"}) {
                    auto name = fmt::format("linkerd-{}-{}", options_.control_plane_namespace, component);
                    try {
                        client(ctx.state).get_cluster_role(name);
                    } catch (const ClusterApiError& e) {
                        if (!e.not_found()) {
                            throw;
                        }
                        missing.push_back(name);
                    }
                }
                if (!missing.empty()) {
                    return CheckOutcome::fail("missing ClusterRoles: " + util::join(util::sorted(missing), ", "));
                }
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::cni_plugin_category() {
    auto fetch_daemon_set = [this](CheckContext& ctx) -> std::optional<CheckOutcome> {
        try {
            ctx.state.cluster.cni_daemon_set = client(ctx.state).get_daemon_set(options_.cni_namespace, kLinkerdCNIResourceName);
        } catch (const ClusterApiError& e) {
            if (e.not_found()) {
                return CheckOutcome::fail("missing DaemonSet: " + kLinkerdCNIResourceName);
            }
            throw;
        }
        return std::nullopt;
    };

    return Category(categories::kCNIPlugin, {
        Checker("cni plugin DaemonSet exists")
            .with_hint_anchor("cni-plugin-ds-exists")
            .fatal()
            .with_check([this, fetch_daemon_set](CheckContext& ctx) {
                if (!control_plane_config(ctx.state).cni_enabled) {
                    return CheckOutcome::skip(kCNIDisabledSkipReason);
                }
                if (auto failed = fetch_daemon_set(ctx)) {
                    return *failed;
                }
                return CheckOutcome::ok();
            }),
        Checker("cni plugin pod is running on all nodes")
            .with_hint_anchor("cni-plugin-ready")
            .with_retry_deadline(options_.retry_deadline)
            .surface_error_on_retry()
            .fatal()
            .with_check([this, fetch_daemon_set](CheckContext& ctx) {
                if (!control_plane_config(ctx.state).cni_enabled) {
                    return CheckOutcome::skip(kCNIDisabledSkipReason);
                }
                if (auto failed = fetch_daemon_set(ctx)) {
                    return *failed;
                }
                const auto& ds = *ctx.state.cluster.cni_daemon_set;
                if (ds.desired_number_scheduled != ds.number_ready) {
                    return CheckOutcome::fail(fmt::format("number ready: {}, number scheduled: {}",
                                                          ds.number_ready, ds.desired_number_scheduled));
                }
                return CheckOutcome::ok();
            }),
    });
}

Category HealthChecker::control_plane_api_category() {
    return Category(categories::kControlPlaneAPI, {
        Checker("control plane self-check")
            .with_hint_anchor("l5d-api-control-api")
            .fatal()
            .with_retry_deadline(options_.retry_deadline)
            .with_rpc_check([this](CheckContext&) {
                if (!public_api_) {
                    return SelfCheckBatch::skip(kNoPublicApi);
                }
                return SelfCheckBatch(public_api_->self_check());
            }),
    });
}

Category HealthChecker::ha_category() {
    return Category(categories::kHA, {
        Checker("multiple replicas of control plane pods")
            .with_hint_anchor("l5d-control-plane-replicas")
            .with_retry_deadline(options_.retry_deadline)
            .warning()
            .with_check([this](CheckContext& ctx) {
                if (!control_plane_config(ctx.state).high_availability) {
                    return CheckOutcome::skip("not run for non HA installs");
                }
                std::vector<std::string> faulty;
                for (const auto& component : kHAControlPlaneComponents) {
                    auto deployment = client(ctx.state).get_deployment(options_.control_plane_namespace, component);
                    if (deployment.available_replicas <= 1) {
                        faulty.push_back(component);
                    }
                }
                if (!faulty.empty()) {
                    return CheckOutcome::fail(fmt::format("not enough replicas available for [{}]",
                                                          util::join(faulty, " ")));
                }
                return CheckOutcome::ok();
            }),
    });
}
