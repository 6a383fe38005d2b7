#include "OwnerOnlyFile.hpp"
#include "Errors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nrfsim {

namespace {

std::string errnoText() {
    return std::strerror(errno);
}

class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    // Close now so that deferred write errors are reported
    int release() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

} // namespace

void writeOwnerOnlyFile(const std::filesystem::path& path, const std::string& content) {
    FdGuard fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR));
    if (fd.get() < 0) {
        throw ProvisioningError("Cannot write " + path.string() + ": " + errnoText());
    }

    // O_CREAT leaves the mode of an existing file alone
    if (::fchmod(fd.get(), S_IRUSR | S_IWUSR) != 0 || ::ftruncate(fd.get(), 0) != 0) {
        throw ProvisioningError("Cannot prepare " + path.string() + ": " + errnoText());
    }

    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd.get(), data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ProvisioningError("Failed writing " + path.string() + ": " + errnoText());
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (fd.release() != 0) {
        throw ProvisioningError("Failed writing " + path.string() + ": " + errnoText());
    }
}

} // namespace nrfsim
