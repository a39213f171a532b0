#pragma once

#include "cluster_client.hpp"
#include "control_plane_config.hpp"
#include "trust_chain.hpp"
#include <string>
#include <vector>
#include <optional>

inline const std::string kIdentityIssuerSecretName = "linkerd-identity-issuer";
inline const std::string kIdentityIssuerCrtName = "crt.pem";
inline const std::string kIdentityIssuerKeyName = "key.pem";
inline const std::string kIdentityIssuerTrustAnchorsNameExternal = "ca.crt";
inline const std::string kTLSCertKey = "tls.crt";
inline const std::string kTLSPrivateKeyKey = "tls.key";

// Raw issuer material as read from linkerd-identity-issuer
struct IssuerCertData {
    std::string trust_anchors;
    std::string issuer_crt;
    std::string issuer_key;
};

// linkerd.io/tls scheme: certificate and key in the secret, anchors from the
// control-plane configuration
IssuerCertData fetch_issuer_data(ClusterClient& client,
                                 const std::string& trust_anchors,
                                 const std::string& ns);

// kubernetes.io/tls scheme: anchors, certificate and key all in the secret
IssuerCertData fetch_external_issuer_data(ClusterClient& client, const std::string& ns);

struct IdentityCredentials {
    trust::Cred issuer;
    std::vector<trust::Certificate> trust_anchors;
};

// Picks the scheme from the configuration, then parses and validates the
// issuer credential and the trust anchors
IdentityCredentials load_identity_credentials(ClusterClient& client,
                                              const ControlPlaneConfig& config,
                                              const std::string& ns);

// Credentials stored under tls.crt/tls.key
trust::Cred fetch_creds_from_secret(ClusterClient& client, const std::string& ns, const std::string& secret_name);

// Credentials stored under the older crt.pem/key.pem names
trust::Cred fetch_creds_from_old_secret(ClusterClient& client, const std::string& ns, const std::string& secret_name);

// Tries the canonical secret first and, when it does not exist and a legacy
// name is given, the legacy secret. Other errors propagate.
trust::Cred fetch_webhook_creds(ClusterClient& client,
                                const std::string& ns,
                                const std::string& secret_name,
                                const std::optional<std::string>& legacy_secret_name);

std::vector<trust::Certificate> fetch_webhook_ca_bundle(ClusterClient& client,
                                                        WebhookKind kind,
                                                        const std::string& webhook_name);

std::vector<trust::Certificate> fetch_api_service_ca_bundle(ClusterClient& client, const std::string& name);

// Anchors and certificate are within their validity period, and the
// certificate chains to the anchors for identity_name
std::optional<std::string> check_cert_and_anchors(const trust::Cred& cred,
                                                  const std::vector<trust::Certificate>& anchors,
                                                  const std::string& identity_name);

std::optional<std::string> check_cert_and_anchors_expiring_soon(const trust::Cred& cred);
