#include "docker/archive.hpp"
#include "docker/errors.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <sys/types.h>

namespace sandkit::docker {

namespace {

constexpr size_t READ_CHUNK = 1 << 16;

using EntryPtr = std::unique_ptr<struct archive_entry, void (*)(struct archive_entry*)>;

EntryPtr new_entry(const std::string& path, mode_t type, unsigned mode, int64_t size) {
    EntryPtr entry(archive_entry_new(), archive_entry_free);
    if (!entry) {
        throw ArchiveError("archive_entry_new() failed");
    }
    archive_entry_set_pathname(entry.get(), path.c_str());
    archive_entry_set_filetype(entry.get(), type);
    archive_entry_set_perm(entry.get(), mode);
    archive_entry_set_size(entry.get(), size);
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    return entry;
}

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

std::string strip_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

// ============================================================================
// TarWriter
// ============================================================================

TarWriter::TarWriter()
    : archive_(archive_write_new()) {
    if (!archive_) {
        throw ArchiveError("archive_write_new() failed");
    }
    if (archive_write_set_format_pax_restricted(archive_) != ARCHIVE_OK ||
        archive_write_add_filter_none(archive_) != ARCHIVE_OK ||
        archive_write_set_bytes_in_last_block(archive_, 1) != ARCHIVE_OK ||
        archive_write_open(archive_, this, nullptr, &TarWriter::write_callback, nullptr) != ARCHIVE_OK) {
        std::string msg = archive_message(archive_);
        archive_write_free(archive_);
        throw ArchiveError("cannot open tar writer: " + msg);
    }
}

TarWriter::~TarWriter() {
    if (archive_) {
        archive_write_free(archive_);
    }
}

ssize_t TarWriter::write_callback(struct archive*, void* client_data,
                                  const void* buffer, size_t length) {
    auto* self = static_cast<TarWriter*>(client_data);
    self->buffer_.append(static_cast<const char*>(buffer), length);
    return static_cast<ssize_t>(length);
}

void TarWriter::add_directory(const std::string& path, unsigned mode) {
    if (finished_) throw ArchiveError("tar writer already finished");

    auto entry = new_entry(strip_trailing_slashes(path) + "/", AE_IFDIR, mode, 0);
    if (archive_write_header(archive_, entry.get()) != ARCHIVE_OK) {
        throw ArchiveError(std::string("archive_write_header() - ") + archive_message(archive_));
    }
}

void TarWriter::add_parents(const std::string& path, unsigned mode) {
    size_t pos = 0;
    while ((pos = path.find('/', pos)) != std::string::npos) {
        if (pos > 0) {
            add_directory(path.substr(0, pos), mode);
        }
        pos++;
    }
}

void TarWriter::add_file(const std::string& path, const std::string& content, unsigned mode) {
    if (finished_) throw ArchiveError("tar writer already finished");

    auto entry = new_entry(path, AE_IFREG, mode, static_cast<int64_t>(content.size()));
    if (archive_write_header(archive_, entry.get()) != ARCHIVE_OK) {
        throw ArchiveError(std::string("archive_write_header() - ") + archive_message(archive_));
    }

    size_t offset = 0;
    while (offset < content.size()) {
        la_ssize_t n = archive_write_data(archive_, content.data() + offset, content.size() - offset);
        if (n <= 0) {
            throw ArchiveError(std::string("archive_write_data() - ") + archive_message(archive_));
        }
        offset += static_cast<size_t>(n);
    }
}

void TarWriter::add_symlink(const std::string& path, const std::string& target) {
    if (finished_) throw ArchiveError("tar writer already finished");

    auto entry = new_entry(path, AE_IFLNK, 0777, 0);
    archive_entry_set_symlink(entry.get(), target.c_str());
    if (archive_write_header(archive_, entry.get()) != ARCHIVE_OK) {
        throw ArchiveError(std::string("archive_write_header() - ") + archive_message(archive_));
    }
}

std::string TarWriter::finish() {
    if (finished_) throw ArchiveError("tar writer already finished");
    finished_ = true;
    if (archive_write_close(archive_) != ARCHIVE_OK) {
        throw ArchiveError(std::string("archive_write_close() - ") + archive_message(archive_));
    }
    return std::move(buffer_);
}

// ============================================================================
// Reading
// ============================================================================

std::vector<TarEntry> read_tar(const std::string& data) {
    std::vector<TarEntry> entries;
    if (data.empty()) {
        return entries;
    }

    std::unique_ptr<struct archive, int (*)(struct archive*)> in(archive_read_new(), archive_read_free);
    if (!in) {
        throw ArchiveError("archive_read_new() failed");
    }
    archive_read_support_format_tar(in.get());
    archive_read_support_filter_none(in.get());

    if (archive_read_open_memory(in.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw ArchiveError(std::string("archive_read_open_memory() - ") + archive_message(in.get()));
    }

    while (true) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(in.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw ArchiveError(std::string("archive_read_next_header() - ") + archive_message(in.get()));
        }

        TarEntry out;
        out.path = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        out.mode = archive_entry_perm(entry);
        switch (archive_entry_filetype(entry)) {
            case AE_IFREG: out.type = EntryType::FILE; break;
            case AE_IFDIR: out.type = EntryType::DIRECTORY; break;
            case AE_IFLNK:
                out.type = EntryType::SYMLINK;
                if (archive_entry_symlink(entry)) out.link_target = archive_entry_symlink(entry);
                break;
            default: out.type = EntryType::OTHER; break;
        }

        if (out.type == EntryType::FILE) {
            if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
                out.content.reserve(static_cast<size_t>(archive_entry_size(entry)));
            }
            char buf[READ_CHUNK];
            la_ssize_t n;
            while ((n = archive_read_data(in.get(), buf, sizeof(buf))) > 0) {
                out.content.append(buf, static_cast<size_t>(n));
            }
            if (n < 0) {
                throw ArchiveError(std::string("archive_read_data() - ") + archive_message(in.get()));
            }
        }

        entries.push_back(std::move(out));
    }

    return entries;
}

std::string pack_file(const std::string& path, const std::string& content, unsigned mode) {
    TarWriter writer;
    writer.add_parents(path);
    writer.add_file(path, content, mode);
    return writer.finish();
}

} // namespace sandkit::docker
