#include <catch2/catch_test_macros.hpp>
#include "../src/kube_client.hpp"
#include "../src/control_plane_config.hpp"
#include "../src/remote_cluster.hpp"
#include "../src/util.hpp"
#include "fake_cluster.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

TEST_CASE("Kubeconfig parsing", "[kube]") {
    nlohmann::json kubeconfig = {
        {"apiVersion", "v1"},
        {"kind", "Config"},
        {"current-context", "east"},
        {"clusters", {
            {{"name", "west"}, {"cluster", {{"server", "https://west.example:6443"}}}},
            {{"name", "east"}, {"cluster", {
                {"server", "https://east.example:6443"},
                {"certificate-authority-data", "LS0tLS1CRUdJTg=="},
            }}},
        }},
        {"contexts", {
            {{"name", "east"}, {"context", {{"cluster", "east"}, {"user", "mirror"}}}},
        }},
        {"users", {
            {{"name", "mirror"}, {"user", {{"token", "s3cr3t"}}}},
        }},
    };

    SECTION("Resolves the current context") {
        auto conn = parse_kubeconfig(kubeconfig.dump());
        REQUIRE(conn.server == "https://east.example:6443");
        REQUIRE(conn.token == "s3cr3t");
        REQUIRE(conn.ca_data == "-----BEGIN");
        REQUIRE_FALSE(conn.insecure_skip_verify);
    }

    SECTION("Unknown context") {
        kubeconfig["current-context"] = "north";
        REQUIRE_THROWS_AS(parse_kubeconfig(kubeconfig.dump()), std::runtime_error);
    }

    SECTION("Cluster without a server") {
        kubeconfig["clusters"][1]["cluster"].erase("server");
        REQUIRE_THROWS_AS(parse_kubeconfig(kubeconfig.dump()), std::runtime_error);
    }

    SECTION("Not JSON") {
        REQUIRE_THROWS_AS(parse_kubeconfig("apiVersion: v1\nkind: Config"), std::runtime_error);
    }
}

TEST_CASE("API object decoding", "[kube]") {
    SECTION("Base64 payloads") {
        REQUIRE(KubeDecoder::base64_decode("aGVsbG8=") == "hello");
        REQUIRE(KubeDecoder::base64_decode("aGVsbG8h") == "hello!");
        REQUIRE(KubeDecoder::base64_decode("aGVs\nbG8=") == "hello");
        REQUIRE(KubeDecoder::base64_decode("") == "");
        REQUIRE_THROWS_AS(KubeDecoder::base64_decode("abc"), std::runtime_error);
    }

    SECTION("Server version strips provider suffixes") {
        auto v = KubeDecoder::server_version({{"major", "1"}, {"minor", "27+"}, {"gitVersion", "v1.27.3-eks"}});
        REQUIRE(v.major == 1);
        REQUIRE(v.minor == 27);
        REQUIRE(v.git_version == "v1.27.3-eks");
    }

    SECTION("Pods") {
        auto pod = KubeDecoder::pod({
            {"metadata", {{"name", "linkerd-identity-6b78ff444f-jwp47"}, {"namespace", "linkerd"},
                          {"labels", {{"linkerd.io/control-plane-component", "identity"}}}}},
            {"status", {
                {"phase", "Running"},
                {"containerStatuses", {
                    {{"name", "identity"}, {"ready", true}, {"state", {{"running", {{"startedAt", "2024-01-01T00:00:00Z"}}}}}},
                    {{"name", "linkerd-proxy"}, {"ready", false}, {"state", {{"waiting", {{"reason", "CrashLoopBackOff"}}}}}},
                }},
            }},
        });
        REQUIRE(pod.phase == "Running");
        REQUIRE(pod.labels.at("linkerd.io/control-plane-component") == "identity");
        REQUIRE(pod.container_statuses.size() == 2);
        REQUIRE(pod.container_statuses[0].ready);
        REQUIRE(pod.container_statuses[1].state == "waiting");
        REQUIRE(pod.container_statuses[1].reason == "CrashLoopBackOff");
    }

    SECTION("Secrets are decoded") {
        auto secret = KubeDecoder::secret({
            {"metadata", {{"name", "cluster-credentials-east"}, {"namespace", "linkerd-multicluster"},
                          {"annotations", {{kRemoteClusterNameAnnotation, "east"}}}}},
            {"type", kMirrorSecretType},
            {"data", {{"kubeconfig", "e30="}}},
        });
        REQUIRE(secret.type == kMirrorSecretType);
        REQUIRE(secret.data.at("kubeconfig") == "{}");
        REQUIRE(secret.annotations.at(kRemoteClusterNameAnnotation) == "east");
    }

    SECTION("Traffic split weights accept numbers and quantities") {
        auto ts = KubeDecoder::traffic_split({
            {"metadata", {{"name", "web-split"}, {"namespace", "shop"}}},
            {"spec", {{"service", "web"}, {"backends", {
                {{"service", "web-v1"}, {"weight", 900}},
                {{"service", "web-east"}, {"weight", "100m"}},
            }}}},
        });
        REQUIRE(ts.service == "web");
        REQUIRE(ts.backends.size() == 2);
        REQUIRE(ts.backends[0].weight == "900");
        REQUIRE(ts.backends[1].weight == "100m");
    }

    SECTION("Roles") {
        auto r = KubeDecoder::role({
            {"metadata", {{"name", "linkerd-service-mirror-read-remote-creds"}, {"namespace", "linkerd-multicluster"}}},
            {"rules", {{{"apiGroups", nlohmann::json::array({""})},
                         {"resources", nlohmann::json::array({"secrets"})},
                         {"verbs", {"list", "get", "watch"}}}}},
        });
        REQUIRE(r.rules.size() == 1);
        REQUIRE(r.rules[0].resources == std::vector<std::string>{"secrets"});
        REQUIRE(r.rules[0].verbs.size() == 3);
    }

    SECTION("Deployments and DaemonSets") {
        auto d = KubeDecoder::deployment({
            {"metadata", {{"name", "linkerd-destination"}, {"namespace", "linkerd"}}},
            {"spec", {{"replicas", 3}}},
            {"status", {{"availableReplicas", 2}}},
        });
        REQUIRE(d.replicas == 3);
        REQUIRE(d.available_replicas == 2);

        auto ds = KubeDecoder::daemon_set({
            {"metadata", {{"name", "linkerd-cni"}, {"namespace", "linkerd-cni"}}},
            {"status", {{"desiredNumberScheduled", 4}, {"numberReady", 4}}},
        });
        REQUIRE(ds.desired_number_scheduled == 4);
        REQUIRE(ds.number_ready == 4);
    }

    SECTION("API services") {
        nlohmann::json available = {
            {"type", "Available"}, {"status", "False"},
            {"reason", "FailedDiscoveryCheck"}, {"message", "no response from tap"},
        };
        auto svc = KubeDecoder::api_service({
            {"metadata", {{"name", "v1alpha1.tap.linkerd.io"}}},
            {"spec", {{"caBundle", "aGVsbG8="}}},
            {"status", {{"conditions", nlohmann::json::array({available})}}},
        });
        REQUIRE(svc.name == "v1alpha1.tap.linkerd.io");
        REQUIRE(svc.ca_bundle == "hello");
        REQUIRE(svc.available->status == "False");
        REQUIRE(svc.available->reason == "FailedDiscoveryCheck");

        auto pending = KubeDecoder::api_service({{"metadata", {{"name", "v1alpha1.tap.linkerd.io"}}}});
        REQUIRE_FALSE(pending.available);
    }
}

TEST_CASE("Request deadlines", "[kube]") {
    auto now = std::chrono::steady_clock::now();

    SECTION("Timeout is cut to the time left") {
        REQUIRE(util::bounded_timeout_ms(std::chrono::milliseconds(30000), std::nullopt, now) == 30000);
        REQUIRE(util::bounded_timeout_ms(std::chrono::milliseconds(30000), now + std::chrono::milliseconds(250), now) == 250);
        REQUIRE(util::bounded_timeout_ms(std::chrono::milliseconds(100), now + std::chrono::seconds(5), now) == 100);
        REQUIRE(util::bounded_timeout_ms(std::chrono::milliseconds(100), now - std::chrono::seconds(1), now) <= 0);
    }

    SECTION("Nothing is sent once the deadline has passed") {
        KubeApiConnection conn;
        conn.server = "http://127.0.0.1:1";
        KubeClient client(conn, 1000);
        client.set_deadline(now - std::chrono::seconds(1));
        try {
            client.server_version();
            FAIL("request sent after its deadline");
        } catch (const ClusterApiError& e) {
            REQUIRE(std::string(e.what()) == "request to /version not sent: deadline exceeded");
            REQUIRE(e.status() == 0);
        }
    }
}

TEST_CASE("Remote cluster secrets", "[kube][multicluster]") {
    Secret secret;
    secret.name = "cluster-credentials-east";
    secret.type = kMirrorSecretType;
    secret.data[kConfigKeyName] = "{}";
    secret.annotations = {
        {kRemoteClusterNameAnnotation, "east"},
        {kRemoteClusterDomainAnnotation, "cluster.local"},
        {kRemoteClusterLinkerdNamespaceAnnotation, "linkerd"},
    };

    SECTION("Complete secret") {
        REQUIRE(is_remote_cluster_secret(secret));
        auto descriptor = parse_remote_cluster_secret(secret);
        REQUIRE(descriptor.cluster_name == "east");
        REQUIRE(descriptor.cluster_domain == "cluster.local");
        REQUIRE(descriptor.namespace_ == "linkerd");
        REQUIRE(descriptor.api_config == "{}");
    }

    SECTION("Other secret types are not links") {
        secret.type = "Opaque";
        REQUIRE_FALSE(is_remote_cluster_secret(secret));
    }

    SECTION("Missing kubeconfig") {
        secret.data.clear();
        REQUIRE_THROWS_AS(parse_remote_cluster_secret(secret), std::runtime_error);
    }

    SECTION("Missing annotation names the key") {
        secret.annotations.erase(kRemoteClusterDomainAnnotation);
        try {
            parse_remote_cluster_secret(secret);
            FAIL("secret without domain accepted");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) ==
                    "secret should contain remote cluster annotation: mirror.linkerd.io/remote-cluster-domain");
        }
    }
}

TEST_CASE("Control plane configuration", "[kube]") {
    FakeClusterClient cluster;
    ConfigMap cm;
    cm.name = kLinkerdConfigMapName;
    cm.namespace_ = "linkerd";
    cm.uid = "0f9c";

    SECTION("Values are parsed") {
        cm.data["values"] = nlohmann::json{
            {"identityTrustAnchorsPEM", "-----BEGIN CERTIFICATE-----"},
            {"highAvailability", true},
            {"cniEnabled", true},
            {"identity", {{"issuer", {{"scheme", "kubernetes.io/tls"}}}}},
        }.dump();
        cluster.config_maps = {cm};

        auto cfg = fetch_control_plane_config(cluster, "linkerd");
        REQUIRE(cfg.uid == "0f9c");
        REQUIRE(cfg.identity_trust_anchors_pem == "-----BEGIN CERTIFICATE-----");
        REQUIRE(cfg.high_availability);
        REQUIRE(cfg.cni_enabled);
        REQUIRE(cfg.issuer_scheme == kIssuerSchemeKubernetes);
    }

    SECTION("Defaults when values are absent") {
        cluster.config_maps = {cm};
        auto cfg = fetch_control_plane_config(cluster, "linkerd");
        REQUIRE(cfg.issuer_scheme == kIssuerSchemeLinkerd);
        REQUIRE(cfg.identity_trust_anchors_pem.empty());
        REQUIRE_FALSE(cfg.high_availability);
    }

    SECTION("Malformed values") {
        cm.data["values"] = "{not json";
        cluster.config_maps = {cm};
        REQUIRE_THROWS_AS(fetch_control_plane_config(cluster, "linkerd"), std::runtime_error);
    }

    SECTION("Missing ConfigMap") {
        try {
            fetch_control_plane_config(cluster, "linkerd");
            FAIL("missing ConfigMap accepted");
        } catch (const ClusterApiError& e) {
            REQUIRE(e.not_found());
        }
    }
}
