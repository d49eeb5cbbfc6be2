/**
 * Tar archives for the copy-in/copy-out protocol
 *
 * The runtime only accepts and returns tar streams at the container
 * boundary, so every file transfer is packed and unpacked here.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

struct archive;

namespace sandkit::docker {

enum class EntryType {
    FILE,
    DIRECTORY,
    SYMLINK,
    OTHER
};

struct TarEntry {
    std::string path;          // As stored, relative ("a/b.txt", "a/")
    EntryType type = EntryType::FILE;
    unsigned mode = 0644;
    std::string content;       // FILE only
    std::string link_target;   // SYMLINK only
};

// Builds an uncompressed (pax-restricted ustar) tar in memory
class TarWriter {
public:
    TarWriter();
    ~TarWriter();

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    // Adds "path/" as a directory entry
    void add_directory(const std::string& path, unsigned mode = 0755);

    // Adds every ancestor of path ("a", "a/b" for "a/b/c") as directories
    void add_parents(const std::string& path, unsigned mode = 0755);

    void add_file(const std::string& path, const std::string& content, unsigned mode = 0644);

    void add_symlink(const std::string& path, const std::string& target);

    // Finalize and return the archive bytes. The writer is unusable afterwards.
    std::string finish();

private:
    struct archive* archive_;
    std::string buffer_;
    bool finished_ = false;

    static ssize_t write_callback(struct archive* a, void* client_data,
                                  const void* buffer, size_t length);
};

// Parse every entry of an uncompressed tar held in memory.
// Throws ArchiveError on malformed input.
std::vector<TarEntry> read_tar(const std::string& data);

// Convenience: single-file archive
std::string pack_file(const std::string& path, const std::string& content, unsigned mode = 0644);

} // namespace sandkit::docker
