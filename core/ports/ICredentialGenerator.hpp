#pragma once

#include <string>

namespace nrfsim::ports {

struct GeneratedCredentials {
    std::string privateKeyPem;
    std::string certificatePem;
};

// Produces a fresh key pair and self-signed client certificate
class ICredentialGenerator {
public:
    virtual ~ICredentialGenerator() = default;

    // Throws ProvisioningError when the crypto backend fails
    virtual GeneratedCredentials generate(const std::string& commonName) = 0;

    // True if the PEM text parses as a certificate
    virtual bool isValidCertificate(const std::string& pem) const = 0;

    // True if the PEM text parses as a private key
    virtual bool isValidPrivateKey(const std::string& pem) const = 0;
};

} // namespace nrfsim::ports
