/**
 * @file OpenSslCredentialGenerator.cpp
 * @brief EC P-256 key pair and self-signed X.509 client certificate via OpenSSL
 *
 * The cloud accepts any self-signed certificate whose CN equals the device
 * id; the certificate is uploaded during registration and the private key
 * never leaves the certs directory.
 *
 * @date 2025
 * @version 1.0
 */

#include "OpenSslCredentialGenerator.hpp"
#include "../core/Errors.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <memory>

namespace nrfsim {

namespace {

struct BioDeleter { void operator()(BIO* p) const { BIO_free_all(p); } };
struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

std::string drainBio(BIO* bio) {
    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);
    if (bufferPtr == nullptr || bufferPtr->length == 0) {
        return "";
    }
    return std::string(bufferPtr->data, bufferPtr->length);
}

} // namespace

std::string OpenSslCredentialGenerator::lastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

ports::GeneratedCredentials OpenSslCredentialGenerator::generate(const std::string& commonName) {
    // Key pair on prime256v1
    PkeyCtxPtr keyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!keyCtx ||
        EVP_PKEY_keygen_init(keyCtx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(keyCtx.get(), NID_X9_62_prime256v1) <= 0) {
        throw ProvisioningError("EC key context setup failed: " + lastOpenSslError());
    }

    EVP_PKEY* rawKey = nullptr;
    if (EVP_PKEY_keygen(keyCtx.get(), &rawKey) <= 0) {
        throw ProvisioningError("EC key generation failed: " + lastOpenSslError());
    }
    PkeyPtr key(rawKey);

    X509Ptr cert(X509_new());
    if (!cert) {
        throw ProvisioningError("X509 allocation failed: " + lastOpenSslError());
    }

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60L * 24L * kValidityDays);

    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        throw ProvisioningError("Cannot attach public key: " + lastOpenSslError());
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                   -1, -1, 0) != 1) {
        throw ProvisioningError("Cannot set certificate CN: " + lastOpenSslError());
    }
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw ProvisioningError("Certificate signing failed: " + lastOpenSslError());
    }

    BioPtr keyBio(BIO_new(BIO_s_mem()));
    BioPtr certBio(BIO_new(BIO_s_mem()));
    if (!keyBio || !certBio) {
        throw ProvisioningError("BIO allocation failed: " + lastOpenSslError());
    }

    if (PEM_write_bio_PrivateKey(keyBio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1 ||
        PEM_write_bio_X509(certBio.get(), cert.get()) != 1) {
        throw ProvisioningError("PEM encoding failed: " + lastOpenSslError());
    }

    ports::GeneratedCredentials credentials;
    credentials.privateKeyPem = drainBio(keyBio.get());
    credentials.certificatePem = drainBio(certBio.get());
    return credentials;
}

bool OpenSslCredentialGenerator::isValidCertificate(const std::string& pem) const {
    if (pem.empty()) {
        return false;
    }
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return false;
    }
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    ERR_clear_error();
    return cert != nullptr;
}

bool OpenSslCredentialGenerator::isValidPrivateKey(const std::string& pem) const {
    if (pem.empty()) {
        return false;
    }
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return false;
    }
    PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    ERR_clear_error();
    return key != nullptr;
}

} // namespace nrfsim
