#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <openssl/x509.h>
#include <openssl/evp.h>

namespace trust {

inline constexpr int kExpirationWarningThresholdDays = 60;

// Shared, immutable handle to a parsed X.509 certificate
class Certificate {
public:
    explicit Certificate(X509* cert);  // takes ownership

    X509* get() const { return cert_.get(); }

    std::string subject_common_name() const;
    std::string serial_number() const;
    std::chrono::system_clock::time_point not_before() const;
    std::chrono::system_clock::time_point not_after() const;
    std::string signature() const;

    // "* <serial> <common name>", the form used when listing certificates
    std::string describe() const;

private:
    std::shared_ptr<X509> cert_;
};

// Certificate, the intermediates that followed it in the PEM bundle, and its key
struct Cred {
    Certificate certificate;
    std::vector<Certificate> trust_chain;
    std::shared_ptr<EVP_PKEY> private_key;
};

enum class CertRole {
    TrustAnchor,
    Issuer
};

// Throws std::runtime_error when the input holds no parsable certificate
std::vector<Certificate> decode_pem_certificates(const std::string& pem);
Certificate decode_pem_certificate(const std::string& pem);

// Parses the certificate chain and key, and checks the key belongs to the
// leaf certificate. Throws std::runtime_error on any mismatch.
Cred validate_and_create_creds(const std::string& crt_pem, const std::string& key_pem);

// Each check returns an error message, or nullopt when the certificate passes

std::optional<std::string> check_algorithm_requirements(const Certificate& cert, CertRole role);

std::optional<std::string> check_validity_period(
    const Certificate& cert,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

std::optional<std::string> check_expiring_soon(
    const Certificate& cert,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// Verifies the leaf (with its intermediates) chains to one of the anchors and,
// when expected_name is non-empty, that it was issued for that name.
std::optional<std::string> verify_chain(const Certificate& leaf,
                                        const std::vector<Certificate>& intermediates,
                                        const std::vector<Certificate>& anchors,
                                        const std::string& expected_name);

std::optional<std::string> verify_chain(const Cred& cred,
                                        const std::vector<Certificate>& anchors,
                                        const std::string& expected_name);

// Anchors are compared by signature so that re-encoded PEM still matches
bool same_signature(const Certificate& a, const Certificate& b);

} // namespace trust
