/**
 * StagedWriter.cpp
 *
 * POSIX implementation: O_EXCL creation, fsync before rename, directory
 * fsync after rename.
 */

#include "StagedWriter.hpp"
#include "DownloadTask.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace qsde::core::transfer {

namespace {

constexpr int kCreateAttempts = 8;

TransferError ioError(const std::string& what, const fs::path& path, int err) {
    return TransferError(ErrorClass::LocalResource,
                         what + " " + path.string() + ": " + std::strerror(err));
}

void syncDirectory(const fs::path& dir) {
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        Logger::instance().warn("Cannot open {} to flush metadata: {}", target.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        Logger::instance().warn("Directory flush failed for {}: {}", target.string(), std::strerror(errno));
    }
    ::close(fd);
}

} // namespace

StagedWriter StagedWriter::open(const fs::path& destination) {
    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        fs::path staged = utils::PathUtils::stagedPathFor(destination);
        int fd = ::open(staged.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd >= 0) {
            return StagedWriter(destination, std::move(staged), fd);
        }
        if (errno != EEXIST) {
            throw ioError("cannot create staged file", staged, errno);
        }
    }
    throw TransferError(ErrorClass::LocalResource,
                        "no unique staged file name available for " + destination.string());
}

StagedWriter::StagedWriter(fs::path destination, fs::path stagedPath, int fd)
    : m_destination(std::move(destination))
    , m_stagedPath(std::move(stagedPath))
    , m_fd(fd) {}

StagedWriter::~StagedWriter() {
    abort();
}

StagedWriter::StagedWriter(StagedWriter&& other) noexcept
    : m_destination(std::move(other.m_destination))
    , m_stagedPath(std::move(other.m_stagedPath))
    , m_fd(std::exchange(other.m_fd, -1))
    , m_bytesWritten(other.m_bytesWritten)
    , m_published(other.m_published) {
    other.m_stagedPath.clear();
}

StagedWriter& StagedWriter::operator=(StagedWriter&& other) noexcept {
    if (this != &other) {
        abort();
        m_destination = std::move(other.m_destination);
        m_stagedPath = std::move(other.m_stagedPath);
        m_fd = std::exchange(other.m_fd, -1);
        m_bytesWritten = other.m_bytesWritten;
        m_published = other.m_published;
        other.m_stagedPath.clear();
    }
    return *this;
}

void StagedWriter::write(std::string_view bytes) {
    if (m_fd < 0) {
        throw std::logic_error("StagedWriter::write on a closed writer");
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(m_fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ioError("write failed on", m_stagedPath, errno);
        }
        written += static_cast<size_t>(n);
    }
    m_bytesWritten += written;
}

void StagedWriter::publish() {
    if (m_published) {
        return;
    }
    if (m_fd < 0) {
        throw std::logic_error("StagedWriter::publish on a closed writer");
    }

    if (::fsync(m_fd) != 0) {
        int err = errno;
        abort();
        throw ioError("flush failed on", m_stagedPath, err);
    }
    if (::close(std::exchange(m_fd, -1)) != 0) {
        int err = errno;
        abort();
        throw ioError("close failed on", m_stagedPath, err);
    }

    if (::rename(m_stagedPath.c_str(), m_destination.c_str()) != 0) {
        int err = errno;
        abort();
        throw ioError("cannot publish to", m_destination, err);
    }

    m_published = true;
    syncDirectory(m_destination.parent_path());
}

void StagedWriter::abort() noexcept {
    closeDescriptor();
    if (m_published || m_stagedPath.empty()) {
        return;
    }
    if (::unlink(m_stagedPath.c_str()) != 0 && errno != ENOENT) {
        Logger::instance().warn("Cannot remove staged file {}: {}", m_stagedPath.string(), std::strerror(errno));
    }
    m_stagedPath.clear();
}

void StagedWriter::closeDescriptor() noexcept {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

} // namespace qsde::core::transfer
