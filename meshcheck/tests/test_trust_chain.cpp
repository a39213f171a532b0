#include <catch2/catch_test_macros.hpp>
#include "../src/trust_chain.hpp"
#include "test_certs.hpp"
#include <stdexcept>

using testcerts::KeyType;
using testcerts::kDay;

TEST_CASE("PEM decoding", "[trust]") {
    auto root = testcerts::self_signed({"root.linkerd.cluster.local", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 42});
    auto other = testcerts::self_signed({"second-root", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 43});

    SECTION("Bundles decode in order") {
        auto certs = trust::decode_pem_certificates(root.cert_pem() + other.cert_pem());
        REQUIRE(certs.size() == 2);
        REQUIRE(certs[0].subject_common_name() == "root.linkerd.cluster.local");
        REQUIRE(certs[0].serial_number() == "42");
        REQUIRE(certs[1].describe() == "* 43 second-root");
    }

    SECTION("Garbage is rejected") {
        REQUIRE_THROWS_AS(trust::decode_pem_certificates("not a certificate"), std::runtime_error);
        REQUIRE_THROWS_AS(trust::decode_pem_certificates(""), std::runtime_error);
    }

    SECTION("Signature comparison survives re-encoding") {
        auto first = trust::decode_pem_certificate(root.cert_pem());
        auto second = trust::decode_pem_certificate("\n" + root.cert_pem() + "\n");
        REQUIRE(trust::same_signature(first, second));
        REQUIRE_FALSE(trust::same_signature(first, other.certificate()));
    }
}

TEST_CASE("Credential validation", "[trust]") {
    auto root = testcerts::self_signed({"root", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 1});
    auto issuer = testcerts::issue({"issuer", KeyType::EcdsaP256, true, {}, -3600, 300 * kDay, 2}, root);

    SECTION("Matching key and trailing chain") {
        auto cred = trust::validate_and_create_creds(issuer.cert_pem() + root.cert_pem(), issuer.key_pem());
        REQUIRE(cred.certificate.subject_common_name() == "issuer");
        REQUIRE(cred.trust_chain.size() == 1);
        REQUIRE(cred.private_key);
    }

    SECTION("Mismatched key") {
        try {
            trust::validate_and_create_creds(issuer.cert_pem(), root.key_pem());
            FAIL("mismatched key accepted");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) == "tls: private key does not match public key");
        }
    }

    SECTION("Unparsable key") {
        REQUIRE_THROWS_AS(trust::validate_and_create_creds(issuer.cert_pem(), "garbage"), std::runtime_error);
    }
}

TEST_CASE("Algorithm requirements", "[trust]") {
    auto check = [](KeyType type, trust::CertRole role) {
        auto cert = testcerts::self_signed({"subject", type, true, {}, -3600, 365 * kDay, 5});
        return trust::check_algorithm_requirements(cert.certificate(), role);
    };

    SECTION("ECDSA P-256 passes for both roles") {
        REQUIRE_FALSE(check(KeyType::EcdsaP256, trust::CertRole::TrustAnchor));
        REQUIRE_FALSE(check(KeyType::EcdsaP256, trust::CertRole::Issuer));
    }

    SECTION("Other curves are rejected") {
        REQUIRE(check(KeyType::EcdsaP384, trust::CertRole::TrustAnchor) ==
                std::optional<std::string>("must use P-256 curve for public key, instead P-384 was used"));
    }

    SECTION("256-bit curves other than P-256 are rejected") {
        auto expected = std::optional<std::string>("must use P-256 curve for public key, instead secp256k1 was used");
        REQUIRE(check(KeyType::EcdsaSecp256k1, trust::CertRole::TrustAnchor) == expected);
        REQUIRE(check(KeyType::EcdsaSecp256k1, trust::CertRole::Issuer) == expected);
    }

    SECTION("RSA anchors must be 2048 or 4096 bits") {
        REQUIRE_FALSE(check(KeyType::Rsa2048, trust::CertRole::TrustAnchor));
        REQUIRE(check(KeyType::Rsa1024, trust::CertRole::TrustAnchor) ==
                std::optional<std::string>("RSA must use at least 2084 bit public key, instead 1024 bit public key was used"));
    }

    SECTION("Issuers must use ECDSA") {
        REQUIRE(check(KeyType::Rsa2048, trust::CertRole::Issuer) ==
                std::optional<std::string>("issuer certificate must use ECDSA for public key algorithm, instead RSA was used"));
    }

    SECTION("Anchors must use ECDSA or RSA") {
        REQUIRE(check(KeyType::Ed25519, trust::CertRole::TrustAnchor) ==
                std::optional<std::string>("trust anchor must use ECDSA or RSA for public key algorithm, instead Ed25519 was used"));
    }
}

TEST_CASE("Validity windows", "[trust]") {
    auto now = std::chrono::system_clock::now();

    SECTION("Current certificate") {
        auto cert = testcerts::self_signed({"ok", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 1}).certificate();
        REQUIRE_FALSE(trust::check_validity_period(cert, now));
        REQUIRE_FALSE(trust::check_expiring_soon(cert, now));
    }

    SECTION("Not yet valid") {
        auto cert = testcerts::self_signed({"future", KeyType::EcdsaP256, true, {}, 2 * kDay, 365 * kDay, 1}).certificate();
        auto err = trust::check_validity_period(cert, now);
        REQUIRE(err);
        REQUIRE(err->rfind("not valid before: ", 0) == 0);
    }

    SECTION("Expired") {
        auto cert = testcerts::self_signed({"past", KeyType::EcdsaP256, true, {}, -30 * kDay, -kDay, 1}).certificate();
        auto err = trust::check_validity_period(cert, now);
        REQUIRE(err);
        REQUIRE(err->rfind("not valid anymore. Expired on ", 0) == 0);
        REQUIRE(err->back() == 'Z');
    }

    SECTION("Expiring within sixty days") {
        auto cert = testcerts::self_signed({"soon", KeyType::EcdsaP256, true, {}, -3600, 59 * kDay, 1}).certificate();
        REQUIRE_FALSE(trust::check_validity_period(cert, now));
        auto err = trust::check_expiring_soon(cert, now);
        REQUIRE(err);
        REQUIRE(err->rfind("will expire on ", 0) == 0);
    }

    SECTION("Expiring just after sixty days") {
        auto cert = testcerts::self_signed({"later", KeyType::EcdsaP256, true, {}, -3600, 61 * kDay, 1}).certificate();
        REQUIRE_FALSE(trust::check_expiring_soon(cert, now));
    }
}

TEST_CASE("Chain verification", "[trust]") {
    auto root = testcerts::self_signed({"root", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 1});
    auto intermediate = testcerts::issue({"intermediate", KeyType::EcdsaP256, true, {}, -3600, 300 * kDay, 2}, root);
    auto leaf = testcerts::issue({"linkerd-proxy-injector.linkerd.svc", KeyType::EcdsaP256, false,
                                  {"linkerd-proxy-injector.linkerd.svc"}, -3600, 90 * kDay, 3}, intermediate);
    std::vector<trust::Certificate> anchors = {root.certificate()};

    SECTION("Leaf with intermediate chains to the root") {
        REQUIRE_FALSE(trust::verify_chain(leaf.certificate(), {intermediate.certificate()}, anchors,
                                          "linkerd-proxy-injector.linkerd.svc"));
    }

    SECTION("Missing intermediate") {
        auto err = trust::verify_chain(leaf.certificate(), {}, anchors, "");
        REQUIRE(err);
        REQUIRE(err->rfind("x509: ", 0) == 0);
    }

    SECTION("Wrong name") {
        REQUIRE(trust::verify_chain(leaf.certificate(), {intermediate.certificate()}, anchors, "linkerd-sp-validator.linkerd.svc") ==
                std::optional<std::string>("x509: certificate is not valid for linkerd-sp-validator.linkerd.svc"));
    }

    SECTION("Unrelated anchor") {
        auto stranger = testcerts::self_signed({"stranger", KeyType::EcdsaP256, true, {}, -3600, 365 * kDay, 9});
        REQUIRE(trust::verify_chain(intermediate.certificate(), {}, {stranger.certificate()}, ""));
    }

    SECTION("Credential overload uses the bundled chain") {
        auto cred = trust::validate_and_create_creds(leaf.cert_pem() + intermediate.cert_pem(), leaf.key_pem());
        REQUIRE_FALSE(trust::verify_chain(cred, anchors, "linkerd-proxy-injector.linkerd.svc"));
    }
}
