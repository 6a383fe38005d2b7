#pragma once

#include <filesystem>
#include <string>

namespace nrfsim {

/**
 * @brief Replace the contents of path, creating it with mode 0600
 *
 * The file never exists with wider permissions, not even between creation
 * and the first write. An existing file is narrowed to 0600 before it is
 * truncated.
 *
 * @throws ProvisioningError if the file cannot be opened or fully written
 */
void writeOwnerOnlyFile(const std::filesystem::path& path, const std::string& content);

} // namespace nrfsim
