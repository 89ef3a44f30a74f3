#pragma once

/**
 * ZipArchive / ZipWriter - thin C++ wrappers over the miniz ZIP reader and writer.
 *
 * Metadata caches are ordinary ZIP files, so these are all the archive
 * support MetadataCache needs.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cdjmeta::data {

/**
 * ZIP archive reader. Not thread-safe; callers share one instance under a lock.
 */
class ZipArchive {
public:
    ZipArchive();
    ~ZipArchive();

    // Non-copyable, movable
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;
    ZipArchive(ZipArchive&& other) noexcept;
    ZipArchive& operator=(ZipArchive&& other) noexcept;

    /**
     * Open a ZIP archive from a file path
     * @param path Path to the ZIP file
     * @return true if successful
     */
    bool open(const std::string& path);

    void close();

    bool isOpen() const;

    size_t getEntryCount() const;

    bool exists(const std::string& filename) const;

    /**
     * Extract a file to memory
     * @param filename Path within the archive
     * @return File contents, or nothing if there is no such entry
     * @throws std::runtime_error if the entry exists but cannot be read or inflated
     */
    std::optional<std::vector<uint8_t>> extractToMemory(const std::string& filename) const;

    /**
     * List all files in the archive, leaving out directory entries.
     */
    std::vector<std::string> listFiles() const;

    /**
     * Description of the most recent miniz failure, for log messages.
     */
    std::string lastError() const;

    const std::string& getPath() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
};

/**
 * ZIP archive writer. Entries are deflated as they are added; the central
 * directory is written by finish(). Destroying an unfinished writer releases
 * the file without finishing it.
 */
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * Create (or truncate) the archive file.
     * @return true if successful
     */
    bool open(const std::string& path);

    bool isOpen() const;

    /**
     * Add one entry holding the given bytes.
     * @return true if successful
     */
    bool addEntry(const std::string& name, std::span<const uint8_t> data);

    /**
     * Write the central directory and close the file.
     * @return true if the archive was completed successfully
     */
    bool finish();

    /**
     * Release the file without writing the central directory.
     */
    void abandon();

    std::string lastError() const;

    const std::string& getPath() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
};

} // namespace cdjmeta::data
