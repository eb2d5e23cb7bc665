#pragma once

/**
 * StagedWriter.hpp
 *
 * Writes a byte stream to a temporary sibling of the destination and
 * either publishes it with an atomic rename or discards it.
 */

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace qsde::core::transfer {

namespace fs = std::filesystem;

/**
 * StagedWriter - exclusive owner of one staged file
 *
 * The staged file lives in the destination's directory under a unique
 * name, so the destination path only ever appears through rename(2) of a
 * complete file. Destroying a writer that was not published removes the
 * staged file.
 */
class StagedWriter {
public:
    /**
     * Create a new staged file for a destination
     * @param destination Final path
     * @return Writer owning the staged file
     * @throws TransferError (LocalResource) if the file cannot be created
     */
    static StagedWriter open(const fs::path& destination);

    ~StagedWriter();

    StagedWriter(StagedWriter&& other) noexcept;
    StagedWriter& operator=(StagedWriter&& other) noexcept;

    StagedWriter(const StagedWriter&) = delete;
    StagedWriter& operator=(const StagedWriter&) = delete;

    /**
     * Append bytes to the staged file
     * @throws TransferError (LocalResource) on I/O errors
     * @throws std::logic_error if the writer is no longer open
     */
    void write(std::string_view bytes);

    /**
     * Flush the staged file and rename it over the destination.
     * On failure the staged file is removed and the destination is left as
     * it was.
     * @throws TransferError (LocalResource)
     */
    void publish();

    /**
     * Close and delete the staged file. Idempotent; no-op after publish().
     */
    void abort() noexcept;

    bool isOpen() const { return m_fd >= 0; }
    bool isPublished() const { return m_published; }
    uint64_t bytesWritten() const { return m_bytesWritten; }
    const fs::path& stagedPath() const { return m_stagedPath; }
    const fs::path& destination() const { return m_destination; }

private:
    StagedWriter(fs::path destination, fs::path stagedPath, int fd);

    void closeDescriptor() noexcept;

private:
    fs::path m_destination;
    fs::path m_stagedPath;
    int m_fd{-1};
    uint64_t m_bytesWritten{0};
    bool m_published{false};
};

} // namespace qsde::core::transfer
