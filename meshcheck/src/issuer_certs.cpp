#include "issuer_certs.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

std::string require_key(const Secret& secret,
                        const std::string& key,
                        const std::string& what,
                        const std::string& scheme) {
    auto it = secret.data.find(key);
    if (it == secret.data.end()) {
        throw std::runtime_error(fmt::format(
            "key {} containing the {} needs to exist in secret {} if the issuer scheme is {}",
            key, what, secret.name, scheme));
    }
    return it->second;
}

trust::Cred creds_from_keys(ClusterClient& client,
                            const std::string& ns,
                            const std::string& secret_name,
                            const std::string& crt_key,
                            const std::string& key_key) {
    Secret secret = client.get_secret(ns, secret_name);

    auto crt = secret.data.find(crt_key);
    if (crt == secret.data.end()) {
        throw std::runtime_error(fmt::format("key {} needs to exist in secret {}", crt_key, secret_name));
    }
    auto key = secret.data.find(key_key);
    if (key == secret.data.end()) {
        throw std::runtime_error(fmt::format("key {} needs to exist in secret {}", key_key, secret_name));
    }

    return trust::validate_and_create_creds(crt->second, key->second);
}

std::vector<std::string> invalid_certificates(
    const std::vector<trust::Certificate>& certs,
    std::optional<std::string> (*check)(const trust::Certificate&, std::chrono::system_clock::time_point)) {
    std::vector<std::string> invalid;
    auto now = std::chrono::system_clock::now();
    for (const auto& cert : certs) {
        if (auto err = check(cert, now)) {
            invalid.push_back(cert.describe() + " " + *err);
        }
    }
    return invalid;
}

} // namespace

IssuerCertData fetch_issuer_data(ClusterClient& client,
                                 const std::string& trust_anchors,
                                 const std::string& ns) {
    Secret secret = client.get_secret(ns, kIdentityIssuerSecretName);

    IssuerCertData data;
    data.trust_anchors = trust_anchors;
    data.issuer_crt = require_key(secret, kIdentityIssuerCrtName, "issuer certificate", kIssuerSchemeLinkerd);
    data.issuer_key = require_key(secret, kIdentityIssuerKeyName, "issuer key", kIssuerSchemeLinkerd);
    return data;
}

IssuerCertData fetch_external_issuer_data(ClusterClient& client, const std::string& ns) {
    Secret secret = client.get_secret(ns, kIdentityIssuerSecretName);

    IssuerCertData data;
    data.trust_anchors = require_key(secret, kIdentityIssuerTrustAnchorsNameExternal, "trust anchors", kIssuerSchemeKubernetes);
    data.issuer_crt = require_key(secret, kTLSCertKey, "issuer certificate", kIssuerSchemeKubernetes);
    data.issuer_key = require_key(secret, kTLSPrivateKeyKey, "issuer key", kIssuerSchemeKubernetes);
    return data;
}

IdentityCredentials load_identity_credentials(ClusterClient& client,
                                              const ControlPlaneConfig& config,
                                              const std::string& ns) {
    IssuerCertData data;
    if (config.issuer_scheme.empty() || config.issuer_scheme == kIssuerSchemeLinkerd) {
        data = fetch_issuer_data(client, config.identity_trust_anchors_pem, ns);
    } else {
        data = fetch_external_issuer_data(client, ns);
    }

    trust::Cred issuer = trust::validate_and_create_creds(data.issuer_crt, data.issuer_key);
    auto anchors = trust::decode_pem_certificates(data.trust_anchors);

    spdlog::debug("Loaded issuer {} and {} trust anchor(s)", issuer.certificate.subject_common_name(), anchors.size());
    return IdentityCredentials{issuer, anchors};
}

trust::Cred fetch_creds_from_secret(ClusterClient& client, const std::string& ns, const std::string& secret_name) {
    return creds_from_keys(client, ns, secret_name, kTLSCertKey, kTLSPrivateKeyKey);
}

trust::Cred fetch_creds_from_old_secret(ClusterClient& client, const std::string& ns, const std::string& secret_name) {
    return creds_from_keys(client, ns, secret_name, kIdentityIssuerCrtName, kIdentityIssuerKeyName);
}

trust::Cred fetch_webhook_creds(ClusterClient& client,
                                const std::string& ns,
                                const std::string& secret_name,
                                const std::optional<std::string>& legacy_secret_name) {
    try {
        return fetch_creds_from_secret(client, ns, secret_name);
    } catch (const ClusterApiError& e) {
        if (!e.not_found() || !legacy_secret_name) {
            throw;
        }
        spdlog::debug("Secret {}/{} not found, trying {}", ns, secret_name, *legacy_secret_name);
    }
    return fetch_creds_from_old_secret(client, ns, *legacy_secret_name);
}

std::vector<trust::Certificate> fetch_webhook_ca_bundle(ClusterClient& client,
                                                        WebhookKind kind,
                                                        const std::string& webhook_name) {
    return trust::decode_pem_certificates(client.webhook_ca_bundle(kind, webhook_name));
}

std::vector<trust::Certificate> fetch_api_service_ca_bundle(ClusterClient& client, const std::string& name) {
    return trust::decode_pem_certificates(client.get_api_service(name).ca_bundle);
}

std::optional<std::string> check_cert_and_anchors(const trust::Cred& cred,
                                                  const std::vector<trust::Certificate>& anchors,
                                                  const std::string& identity_name) {
    auto expired = invalid_certificates(anchors, &trust::check_validity_period);
    if (!expired.empty()) {
        return "anchors not within their validity period:\n\t" + util::join(expired, "\n\t");
    }

    if (auto err = trust::check_validity_period(cred.certificate)) {
        return "certificate is " + *err;
    }

    if (auto err = trust::verify_chain(cred, anchors, identity_name)) {
        return "cert is not issued by the trust anchor: " + *err;
    }
    return std::nullopt;
}

std::optional<std::string> check_cert_and_anchors_expiring_soon(const trust::Cred& cred) {
    auto expiring = invalid_certificates(cred.trust_chain, &trust::check_expiring_soon);
    if (!expiring.empty()) {
        return "Anchors expiring soon:\n\t" + util::join(expiring, "\n\t");
    }

    if (auto err = trust::check_expiring_soon(cred.certificate)) {
        return "certificate " + *err;
    }
    return std::nullopt;
}
