/**
 * @file CertificateStore.hpp
 * @brief Device key pair, self-signed certificate and root CA trust anchor
 *
 * Loading and creating are separate steps so the caller decides when
 * generation happens:
 * @code
 *   auto bundle = store.loadOrNone(deviceId);
 *   if (!bundle) {
 *       bundle = store.createAndPersist(deviceId);
 *   }
 * @endcode
 * ensureBundle() is that composition. All files live in one directory,
 * keyed by device id, and are written owner read/write only.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "DeviceSessionContext.hpp"
#include "IHttpClient.hpp"
#include "ports/ICredentialGenerator.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace nrfsim {

class CertificateStore {
public:
    static constexpr const char* kRootCaUrl = "https://www.amazontrust.com/repository/AmazonRootCA1.pem";
    static constexpr const char* kRootCaFile = "AmazonRootCA1.pem";

    CertificateStore(std::filesystem::path certsDir,
                     std::shared_ptr<ports::ICredentialGenerator> generator,
                     std::shared_ptr<IHttpClient> http);

    /**
     * @brief Read a previously persisted bundle
     * @return std::nullopt when no key or certificate exists for deviceId
     * @throws ProvisioningError if only part of the bundle exists, a file
     *         cannot be read, or a PEM does not parse
     */
    std::optional<CertificateBundle> loadOrNone(const std::string& deviceId);

    /**
     * @brief Generate a new key pair and certificate, write them, attach the root CA
     * @throws ProvisioningError on crypto, download or write failure
     */
    CertificateBundle createAndPersist(const std::string& deviceId);

    /// loadOrNone, falling back to createAndPersist
    CertificateBundle ensureBundle(const std::string& deviceId);

    /**
     * @brief Cached root CA PEM, downloading it on first use
     * @throws ProvisioningError if the CA is neither cached nor reachable
     */
    std::string ensureRootCa();

    std::filesystem::path keyPath(const std::string& deviceId) const;
    std::filesystem::path certPath(const std::string& deviceId) const;
    std::filesystem::path caPath() const;
    const std::filesystem::path& directory() const { return certsDir_; }

private:
    void ensureDirectory() const;
    void writeSecretFile(const std::filesystem::path& path, const std::string& content) const;
    static std::optional<std::string> readFile(const std::filesystem::path& path);

    std::filesystem::path certsDir_;
    std::shared_ptr<ports::ICredentialGenerator> generator_;
    std::shared_ptr<IHttpClient> http_;
};

} // namespace nrfsim
