#include "CertificateStore.hpp"
#include "Errors.hpp"
#include "OwnerOnlyFile.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace nrfsim {

namespace {

const char* kRegenerateHint = " (delete the device's files in the certs directory to regenerate)";

} // namespace

CertificateStore::CertificateStore(fs::path certsDir,
                                   std::shared_ptr<ports::ICredentialGenerator> generator,
                                   std::shared_ptr<IHttpClient> http)
    : certsDir_(std::move(certsDir))
    , generator_(std::move(generator))
    , http_(std::move(http)) {
}

fs::path CertificateStore::keyPath(const std::string& deviceId) const {
    return certsDir_ / (deviceId + ".key.pem");
}

fs::path CertificateStore::certPath(const std::string& deviceId) const {
    return certsDir_ / (deviceId + ".cert.pem");
}

fs::path CertificateStore::caPath() const {
    return certsDir_ / kRootCaFile;
}

std::optional<CertificateBundle> CertificateStore::loadOrNone(const std::string& deviceId) {
    std::error_code ec;
    bool haveKey = fs::exists(keyPath(deviceId), ec);
    bool haveCert = fs::exists(certPath(deviceId), ec);

    if (!haveKey && !haveCert) {
        return std::nullopt;
    }
    if (haveKey != haveCert) {
        throw ProvisioningError("Incomplete credentials for " + deviceId + ": " +
                                (haveKey ? "certificate" : "private key") + " missing" +
                                kRegenerateHint);
    }

    auto keyPem = readFile(keyPath(deviceId));
    auto certPem = readFile(certPath(deviceId));
    if (!keyPem || !certPem) {
        throw ProvisioningError("Cannot read cached credentials for " + deviceId);
    }
    if (!generator_->isValidPrivateKey(*keyPem)) {
        throw ProvisioningError("Corrupt private key " + keyPath(deviceId).string() + kRegenerateHint);
    }
    if (!generator_->isValidCertificate(*certPem)) {
        throw ProvisioningError("Corrupt certificate " + certPath(deviceId).string() + kRegenerateHint);
    }

    CertificateBundle bundle;
    bundle.privateKeyPem = *keyPem;
    bundle.certificatePem = *certPem;
    bundle.rootCaPem = ensureRootCa();
    bundle.keyPath = keyPath(deviceId).string();
    bundle.certPath = certPath(deviceId).string();
    bundle.caPath = caPath().string();

    std::cout << "[Certs] Reusing credentials for " << deviceId << std::endl;
    return bundle;
}

CertificateBundle CertificateStore::createAndPersist(const std::string& deviceId) {
    ensureDirectory();

    // Root CA first: no key is written if the download fails
    std::string rootCa = ensureRootCa();

    std::cout << "[Certs] Generating device key pair and self-signed certificate..." << std::endl;
    ports::GeneratedCredentials generated = generator_->generate(deviceId);

    writeSecretFile(keyPath(deviceId), generated.privateKeyPem);
    writeSecretFile(certPath(deviceId), generated.certificatePem);

    std::cout << "[Certs] Key:  " << keyPath(deviceId).string() << std::endl;
    std::cout << "[Certs] Cert: " << certPath(deviceId).string() << std::endl;

    CertificateBundle bundle;
    bundle.privateKeyPem = std::move(generated.privateKeyPem);
    bundle.certificatePem = std::move(generated.certificatePem);
    bundle.rootCaPem = std::move(rootCa);
    bundle.keyPath = keyPath(deviceId).string();
    bundle.certPath = certPath(deviceId).string();
    bundle.caPath = caPath().string();
    return bundle;
}

CertificateBundle CertificateStore::ensureBundle(const std::string& deviceId) {
    auto bundle = loadOrNone(deviceId);
    if (bundle) {
        return *bundle;
    }
    return createAndPersist(deviceId);
}

std::string CertificateStore::ensureRootCa() {
    auto cached = readFile(caPath());
    if (cached) {
        if (generator_->isValidCertificate(*cached)) {
            return *cached;
        }
        std::cerr << "[Certs] Cached root CA does not parse, downloading again" << std::endl;
    }

    ensureDirectory();
    std::cout << "[Certs] Downloading Amazon Root CA 1..." << std::endl;

    HttpRequest request;
    request.method = "GET";
    request.url = kRootCaUrl;

    auto response = http_->send(request);
    if (!response) {
        throw ProvisioningError(std::string("Root CA unreachable at ") + kRootCaUrl + ": " + http_->lastError());
    }
    if (!response->ok()) {
        throw ProvisioningError("Root CA download failed with HTTP " + std::to_string(response->statusCode));
    }
    if (!generator_->isValidCertificate(response->body)) {
        throw ProvisioningError("Downloaded root CA is not a PEM certificate");
    }

    writeSecretFile(caPath(), response->body);
    std::cout << "[Certs] Saved: " << caPath().string() << std::endl;
    return response->body;
}

void CertificateStore::ensureDirectory() const {
    std::error_code ec;
    fs::create_directories(certsDir_, ec);
    if (ec) {
        throw ProvisioningError("Cannot create certs directory " + certsDir_.string() + ": " + ec.message());
    }
}

void CertificateStore::writeSecretFile(const fs::path& path, const std::string& content) const {
    writeOwnerOnlyFile(path, content);
}

std::optional<std::string> CertificateStore::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace nrfsim
