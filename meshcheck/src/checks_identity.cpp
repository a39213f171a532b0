#include "health_checker.hpp"
#include "issuer_certs.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace {
    const std::string kProxyInjectorWebhookConfigName = "linkerd-proxy-injector-webhook-config";
    const std::string kSPValidatorWebhookConfigName = "linkerd-sp-validator-webhook-config";
    const std::string kPolicyValidatorWebhookConfigName = "linkerd-policy-validator-webhook-config";

    const std::string kProxyInjectorTLSSecretName = "linkerd-proxy-injector-k8s-tls";
    const std::string kProxyInjectorOldTLSSecretName = "linkerd-proxy-injector-tls";
    const std::string kSPValidatorTLSSecretName = "linkerd-sp-validator-k8s-tls";
    const std::string kSPValidatorOldTLSSecretName = "linkerd-sp-validator-tls";
    const std::string kPolicyValidatorTLSSecretName = "linkerd-policy-validator-k8s-tls";

    const std::string kTapAPIServiceName = "v1alpha1.tap.linkerd.io";
    const std::string kTapTLSSecretName = "linkerd-tap-k8s-tls";
    const std::string kTapOldTLSSecretName = "linkerd-tap-tls";
    const std::string kTapNotInstalled = "tap not installed";

    const trust::Cred& issuer_of(const DiscoveryContext& state) {
        if (!state.identity.issuer) {
            throw std::runtime_error("issuer credentials are not loaded");
        }
        return *state.identity.issuer;
    }

    // Lists every anchor the check rejects, or nullopt when all pass
    template <typename Check>
    std::optional<std::string> failing_anchors(const std::vector<trust::Certificate>& anchors, Check check) {
        std::vector<std::string> failing;
        for (const auto& anchor : anchors) {
            if (auto err = check(anchor)) {
                failing.push_back(anchor.describe() + " " + *err);
            }
        }
        if (failing.empty()) {
            return std::nullopt;
        }
        return util::join(failing, "\n\t");
    }
}

Category HealthChecker::identity_category() {
    return Category(categories::kIdentity, {
        Checker("certificate config is valid")
            .with_hint_anchor("l5d-identity-cert-config-valid")
            .fatal()
            .with_check([this](CheckContext& ctx) {
                auto creds = load_identity_credentials(client(ctx.state), control_plane_config(ctx.state),
                                                       options_.control_plane_namespace);
                ctx.state.identity.issuer = creds.issuer;
                ctx.state.identity.trust_anchors = creds.trust_anchors;
                return CheckOutcome::ok();
            }),
        Checker("trust anchors are using supported crypto algorithm")
            .with_hint_anchor("l5d-identity-trustAnchors-use-supported-crypto")
            .fatal()
            .with_check([](CheckContext& ctx) {
                auto invalid = failing_anchors(ctx.state.identity.trust_anchors, [](const trust::Certificate& c) {
                    return trust::check_algorithm_requirements(c, trust::CertRole::TrustAnchor);
                });
                return invalid ? CheckOutcome::fail("Invalid trustAnchors:\n\t" + *invalid) : CheckOutcome::ok();
            }),
        Checker("trust anchors are within their validity period")
            .with_hint_anchor("l5d-identity-trustAnchors-are-time-valid")
            .fatal()
            .with_check([](CheckContext& ctx) {
                auto invalid = failing_anchors(ctx.state.identity.trust_anchors, [](const trust::Certificate& c) {
                    return trust::check_validity_period(c);
                });
                return invalid ? CheckOutcome::fail("Invalid anchors:\n\t" + *invalid) : CheckOutcome::ok();
            }),
        Checker("trust anchors are valid for at least 60 days")
            .with_hint_anchor("l5d-identity-trustAnchors-not-expiring-soon")
            .warning()
            .with_check([](CheckContext& ctx) {
                auto expiring = failing_anchors(ctx.state.identity.trust_anchors, [](const trust::Certificate& c) {
                    return trust::check_expiring_soon(c);
                });
                return expiring ? CheckOutcome::fail("Anchors expiring soon:\n\t" + *expiring) : CheckOutcome::ok();
            }),
        Checker("issuer cert is using supported crypto algorithm")
            .with_hint_anchor("l5d-identity-issuer-cert-uses-supported-crypto")
            .fatal()
            .with_check([](CheckContext& ctx) {
                auto err = trust::check_algorithm_requirements(issuer_of(ctx.state).certificate, trust::CertRole::Issuer);
                if (!err) {
                    return CheckOutcome::ok();
                }
                return CheckOutcome::fail(util::starts_with(*err, "issuer certificate") ? *err : "issuer certificate " + *err);
            }),
        Checker("issuer cert is within its validity period")
            .with_hint_anchor("l5d-identity-issuer-cert-is-time-valid")
            .fatal()
            .with_check([](CheckContext& ctx) {
                auto err = trust::check_validity_period(issuer_of(ctx.state).certificate);
                return err ? CheckOutcome::fail("issuer certificate is " + *err) : CheckOutcome::ok();
            }),
        Checker("issuer cert is valid for at least 60 days")
            .with_hint_anchor("l5d-identity-issuer-cert-not-expiring-soon")
            .warning()
            .with_check([](CheckContext& ctx) {
                auto err = trust::check_expiring_soon(issuer_of(ctx.state).certificate);
                return err ? CheckOutcome::fail("issuer certificate " + *err) : CheckOutcome::ok();
            }),
        Checker("issuer cert is issued by the trust anchor")
            .with_hint_anchor("l5d-identity-issuer-cert-issued-by-trust-anchor")
            .with_check([](CheckContext& ctx) {
                auto err = trust::verify_chain(issuer_of(ctx.state), ctx.state.identity.trust_anchors, "");
                return err ? CheckOutcome::fail(*err) : CheckOutcome::ok();
            }),
    });
}

Checker HealthChecker::webhook_cert_check(const std::string& component,
                                          WebhookKind kind,
                                          const std::string& webhook_name,
                                          const std::string& secret_name,
                                          const std::optional<std::string>& legacy_secret_name,
                                          bool skip_when_missing) {
    const std::string skip_reason = component + " not installed";

    return Checker(component + " webhook has valid cert")
        .with_hint_anchor("l5d-" + component + "-webhook-cert-valid")
        .fatal()
        .with_check([=](CheckContext& ctx) {
            std::vector<trust::Certificate> anchors;
            try {
                anchors = fetch_webhook_ca_bundle(client(ctx.state), kind, webhook_name);
            } catch (const ClusterApiError& e) {
                if (skip_when_missing && e.not_found()) {
                    return CheckOutcome::skip(skip_reason);
                }
                throw;
            }

            std::optional<trust::Cred> cred;
            try {
                cred = fetch_webhook_creds(client(ctx.state), options_.control_plane_namespace,
                                           secret_name, legacy_secret_name);
            } catch (const ClusterApiError& e) {
                if (skip_when_missing && e.not_found()) {
                    return CheckOutcome::skip(skip_reason);
                }
                throw;
            }

            std::string identity_name = fmt::format("linkerd-{}.{}.svc", component, options_.control_plane_namespace);
            if (auto err = check_cert_and_anchors(*cred, anchors, identity_name)) {
                return CheckOutcome::fail(*err);
            }
            return CheckOutcome::ok();
        });
}

Checker HealthChecker::webhook_expiry_check(const std::string& component,
                                            const std::string& secret_name,
                                            const std::optional<std::string>& legacy_secret_name,
                                            bool skip_when_missing) {
    const std::string skip_reason = component + " not installed";

    return Checker(component + " cert is valid for at least 60 days")
        .with_hint_anchor("l5d-" + component + "-webhook-cert-not-expiring-soon")
        .warning()
        .with_check([=](CheckContext& ctx) {
            std::optional<trust::Cred> cred;
            try {
                cred = fetch_webhook_creds(client(ctx.state), options_.control_plane_namespace,
                                           secret_name, legacy_secret_name);
            } catch (const ClusterApiError& e) {
                if (skip_when_missing && e.not_found()) {
                    return CheckOutcome::skip(skip_reason);
                }
                throw;
            }

            if (auto err = check_cert_and_anchors_expiring_soon(*cred)) {
                return CheckOutcome::fail(*err);
            }
            return CheckOutcome::ok();
        });
}

Checker HealthChecker::tap_cert_check() {
    return Checker("tap API server has valid cert")
        .with_hint_anchor("l5d-tap-cert-valid")
        .fatal()
        .with_check([this](CheckContext& ctx) {
            std::vector<trust::Certificate> anchors;
            std::optional<trust::Cred> cred;
            try {
                anchors = fetch_api_service_ca_bundle(client(ctx.state), kTapAPIServiceName);
                cred = fetch_webhook_creds(client(ctx.state), options_.viz_namespace,
                                           kTapTLSSecretName, kTapOldTLSSecretName);
            } catch (const ClusterApiError& e) {
                if (e.not_found()) {
                    return CheckOutcome::skip(kTapNotInstalled);
                }
                throw;
            }

            std::string identity_name = fmt::format("tap.{}.svc", options_.viz_namespace);
            if (auto err = check_cert_and_anchors(*cred, anchors, identity_name)) {
                return CheckOutcome::fail(*err);
            }
            return CheckOutcome::ok();
        });
}

Checker HealthChecker::tap_expiry_check() {
    return Checker("tap API server cert is valid for at least 60 days")
        .with_hint_anchor("l5d-tap-cert-not-expiring-soon")
        .warning()
        .with_check([this](CheckContext& ctx) {
            std::optional<trust::Cred> cred;
            try {
                cred = fetch_webhook_creds(client(ctx.state), options_.viz_namespace,
                                           kTapTLSSecretName, kTapOldTLSSecretName);
            } catch (const ClusterApiError& e) {
                if (e.not_found()) {
                    return CheckOutcome::skip(kTapNotInstalled);
                }
                throw;
            }

            if (auto err = check_cert_and_anchors_expiring_soon(*cred)) {
                return CheckOutcome::fail(*err);
            }
            return CheckOutcome::ok();
        });
}

Checker HealthChecker::tap_api_service_check() {
    return Checker("tap API service is running")
        .with_hint_anchor("l5d-tap-api")
        .warning()
        .with_retry_deadline(options_.retry_deadline)
        .with_check([this](CheckContext& ctx) {
            ApiService svc;
            try {
                svc = client(ctx.state).get_api_service(kTapAPIServiceName);
            } catch (const ClusterApiError& e) {
                if (e.not_found()) {
                    return CheckOutcome::skip(kTapNotInstalled);
                }
                throw;
            }

            if (!svc.available) {
                return CheckOutcome::fail(fmt::format("{} service not available", kTapAPIServiceName));
            }
            if (svc.available->status != "True") {
                return CheckOutcome::fail(fmt::format("{}: {}", svc.available->reason, svc.available->message));
            }
            return CheckOutcome::ok();
        });
}

Category HealthChecker::webhooks_category() {
    return Category(categories::kWebhooksAndAPISvcTLS, {
        webhook_cert_check("proxy-injector", WebhookKind::Mutating, kProxyInjectorWebhookConfigName,
                           kProxyInjectorTLSSecretName, kProxyInjectorOldTLSSecretName, false),
        webhook_expiry_check("proxy-injector", kProxyInjectorTLSSecretName, kProxyInjectorOldTLSSecretName, false),
        webhook_cert_check("sp-validator", WebhookKind::Validating, kSPValidatorWebhookConfigName,
                           kSPValidatorTLSSecretName, kSPValidatorOldTLSSecretName, false),
        webhook_expiry_check("sp-validator", kSPValidatorTLSSecretName, kSPValidatorOldTLSSecretName, false),
        webhook_cert_check("policy-validator", WebhookKind::Validating, kPolicyValidatorWebhookConfigName,
                           kPolicyValidatorTLSSecretName, std::nullopt, true),
        webhook_expiry_check("policy-validator", kPolicyValidatorTLSSecretName, std::nullopt, true),
        tap_cert_check(),
        tap_expiry_check(),
        tap_api_service_check(),
    });
}
