#include "trust_chain.hpp"
#include "util.hpp"
#include <openssl/pem.h>
#include <openssl/err.h>
#include <openssl/bn.h>
#include <openssl/objects.h>
#include <openssl/ec.h>
#include <openssl/core_names.h>
#include <openssl/x509v3.h>
#include <fmt/format.h>
#include <stdexcept>
#include <ctime>
#include <utility>

namespace trust {

namespace {

std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

std::shared_ptr<BIO> memory_bio(const std::string& data) {
    BIO* bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!bio) {
        throw std::runtime_error("failed to allocate BIO: " + last_openssl_error());
    }
    return std::shared_ptr<BIO>(bio, BIO_free);
}

std::chrono::system_clock::time_point asn1_to_time_point(const ASN1_TIME* t) {
    std::tm tm{};
    if (!t || ASN1_TIME_to_tm(t, &tm) != 1) {
        throw std::runtime_error("invalid certificate time field");
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string key_algorithm_name(int base_id) {
    switch (base_id) {
        case EVP_PKEY_EC: return "ECDSA";
        case EVP_PKEY_RSA: return "RSA";
        case EVP_PKEY_DSA: return "DSA";
        case EVP_PKEY_ED25519: return "Ed25519";
        default: {
            const char* sn = OBJ_nid2sn(base_id);
            return sn ? sn : "unknown";
        }
    }
}

std::string signature_algorithm_name(const X509* cert) {
    const char* ln = OBJ_nid2ln(X509_get_signature_nid(cert));
    return ln ? ln : "unknown";
}

// NIST name of the key's curve ("P-256"), or the OpenSSL group name when the
// curve has none
std::pair<int, std::string> ec_curve(EVP_PKEY* key) {
    char group[80] = {0};
    size_t len = 0;
    if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, group, sizeof(group), &len) != 1) {
        ERR_clear_error();
        return {NID_undef, "unknown"};
    }
    int nid = OBJ_txt2nid(group);
    const char* nist = nid != NID_undef ? EC_curve_nid2nist(nid) : nullptr;
    return {nid, nist ? nist : group};
}

std::optional<std::string> check_ecdsa_requirements(X509* cert, EVP_PKEY* key) {
    auto curve = ec_curve(key);
    if (curve.first != NID_X9_62_prime256v1) {
        return fmt::format("must use P-256 curve for public key, instead {} was used", curve.second);
    }
    int sig = X509_get_signature_nid(cert);
    if (sig != NID_ecdsa_with_SHA256 && sig != NID_sha256WithRSAEncryption) {
        return fmt::format("must be signed by an ECDSA P-256 key, instead {} was used",
                           signature_algorithm_name(cert));
    }
    return std::nullopt;
}

std::optional<std::string> check_rsa_requirements(X509* cert, EVP_PKEY* key) {
    int bits = EVP_PKEY_bits(key);
    if (bits != 2048 && bits != 4096) {
        return fmt::format("RSA must use at least 2084 bit public key, instead {} bit public key was used", bits);
    }
    if (X509_get_signature_nid(cert) != NID_sha256WithRSAEncryption) {
        return fmt::format("must be signed by an RSA 2048/4096 bit key, instead {} was used",
                           signature_algorithm_name(cert));
    }
    return std::nullopt;
}

} // namespace

Certificate::Certificate(X509* cert)
    : cert_(cert, X509_free)
{
    if (!cert_) {
        throw std::invalid_argument("null certificate");
    }
}

std::string Certificate::subject_common_name() const {
    X509_NAME* subject = X509_get_subject_name(cert_.get());
    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) {
        return "";
    }
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) {
        return "";
    }
    std::string cn(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return cn;
}

std::string Certificate::serial_number() const {
    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert_.get()), nullptr);
    if (!bn) {
        return "";
    }
    char* dec = BN_bn2dec(bn);
    std::string serial = dec ? dec : "";
    OPENSSL_free(dec);
    BN_free(bn);
    return serial;
}

std::chrono::system_clock::time_point Certificate::not_before() const {
    return asn1_to_time_point(X509_get0_notBefore(cert_.get()));
}

std::chrono::system_clock::time_point Certificate::not_after() const {
    return asn1_to_time_point(X509_get0_notAfter(cert_.get()));
}

std::string Certificate::signature() const {
    const ASN1_BIT_STRING* sig = nullptr;
    const X509_ALGOR* alg = nullptr;
    X509_get0_signature(&sig, &alg, cert_.get());
    if (!sig) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(sig)),
                       static_cast<size_t>(ASN1_STRING_length(sig)));
}

std::string Certificate::describe() const {
    return fmt::format("* {} {}", serial_number(), subject_common_name());
}

std::vector<Certificate> decode_pem_certificates(const std::string& pem) {
    auto bio = memory_bio(pem);
    std::vector<Certificate> certs;

    while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        certs.emplace_back(cert);
    }
    // Reading past the last block always leaves a "no start line" error queued
    ERR_clear_error();

    if (certs.empty()) {
        throw std::runtime_error("failed to decode PEM certificate");
    }
    return certs;
}

Certificate decode_pem_certificate(const std::string& pem) {
    return decode_pem_certificates(pem).front();
}

Cred validate_and_create_creds(const std::string& crt_pem, const std::string& key_pem) {
    auto certs = decode_pem_certificates(crt_pem);

    auto bio = memory_bio(key_pem);
    EVP_PKEY* raw_key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw_key) {
        throw std::runtime_error("failed to decode PEM key: " + last_openssl_error());
    }
    std::shared_ptr<EVP_PKEY> key(raw_key, EVP_PKEY_free);

    if (X509_check_private_key(certs.front().get(), key.get()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("tls: private key does not match public key");
    }

    Cred cred{certs.front(), {}, key};
    cred.trust_chain.assign(certs.begin() + 1, certs.end());
    return cred;
}

std::optional<std::string> check_algorithm_requirements(const Certificate& cert, CertRole role) {
    EVP_PKEY* key = X509_get0_pubkey(cert.get());
    if (!key) {
        return std::string("could not read public key: ") + last_openssl_error();
    }

    int base_id = EVP_PKEY_base_id(key);
    if (base_id == EVP_PKEY_EC) {
        return check_ecdsa_requirements(cert.get(), key);
    }

    if (role == CertRole::Issuer) {
        return fmt::format("issuer certificate must use ECDSA for public key algorithm, instead {} was used",
                           key_algorithm_name(base_id));
    }

    if (base_id == EVP_PKEY_RSA) {
        return check_rsa_requirements(cert.get(), key);
    }
    return fmt::format("trust anchor must use ECDSA or RSA for public key algorithm, instead {} was used",
                       key_algorithm_name(base_id));
}

std::optional<std::string> check_validity_period(const Certificate& cert,
                                                 std::chrono::system_clock::time_point now) {
    if (cert.not_before() > now) {
        return "not valid before: " + util::format_rfc3339(cert.not_before());
    }
    if (cert.not_after() < now) {
        return "not valid anymore. Expired on " + util::format_rfc3339(cert.not_after());
    }
    return std::nullopt;
}

std::optional<std::string> check_expiring_soon(const Certificate& cert,
                                               std::chrono::system_clock::time_point now) {
    auto threshold = now + std::chrono::hours(24 * kExpirationWarningThresholdDays);
    if (threshold > cert.not_after()) {
        return "will expire on " + util::format_rfc3339(cert.not_after());
    }
    return std::nullopt;
}

std::optional<std::string> verify_chain(const Certificate& leaf,
                                        const std::vector<Certificate>& intermediates,
                                        const std::vector<Certificate>& anchors,
                                        const std::string& expected_name) {
    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store(X509_STORE_new(), X509_STORE_free);
    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx(X509_STORE_CTX_new(), X509_STORE_CTX_free);
    std::unique_ptr<STACK_OF(X509), void (*)(STACK_OF(X509)*)> untrusted(
        sk_X509_new_null(), [](STACK_OF(X509)* s) { sk_X509_free(s); });

    if (!store || !ctx || !untrusted) {
        return "failed to allocate verification context: " + last_openssl_error();
    }

    for (const auto& anchor : anchors) {
        // X509_STORE_add_cert takes its own reference
        if (X509_STORE_add_cert(store.get(), anchor.get()) != 1) {
            ERR_clear_error();
        }
    }
    for (const auto& cert : intermediates) {
        sk_X509_push(untrusted.get(), cert.get());
    }

    if (X509_STORE_CTX_init(ctx.get(), store.get(), leaf.get(), untrusted.get()) != 1) {
        return "failed to initialise verification context: " + last_openssl_error();
    }

    X509_VERIFY_PARAM* param = X509_STORE_CTX_get0_param(ctx.get());
    X509_VERIFY_PARAM_set_flags(param, X509_V_FLAG_PARTIAL_CHAIN);
    if (!expected_name.empty()) {
        X509_VERIFY_PARAM_set1_host(param, expected_name.c_str(), expected_name.size());
    }

    if (X509_verify_cert(ctx.get()) != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        ERR_clear_error();
        if (err == X509_V_ERR_HOSTNAME_MISMATCH) {
            return fmt::format("x509: certificate is not valid for {}", expected_name);
        }
        return fmt::format("x509: {}", X509_verify_cert_error_string(err));
    }
    return std::nullopt;
}

std::optional<std::string> verify_chain(const Cred& cred,
                                        const std::vector<Certificate>& anchors,
                                        const std::string& expected_name) {
    return verify_chain(cred.certificate, cred.trust_chain, anchors, expected_name);
}

bool same_signature(const Certificate& a, const Certificate& b) {
    return a.signature() == b.signature();
}

} // namespace trust
