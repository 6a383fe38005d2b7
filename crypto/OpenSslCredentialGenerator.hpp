#pragma once

#include "../core/ports/ICredentialGenerator.hpp"
#include <string>

namespace nrfsim {

class OpenSslCredentialGenerator : public ports::ICredentialGenerator {
public:
    static constexpr int kValidityDays = 3650;

    ports::GeneratedCredentials generate(const std::string& commonName) override;

    bool isValidCertificate(const std::string& pem) const override;
    bool isValidPrivateKey(const std::string& pem) const override;

private:
    static std::string lastOpenSslError();
};

} // namespace nrfsim
