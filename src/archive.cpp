#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const {
        if (e) {
            archive_entry_free(e);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

namespace {

constexpr time_t FIXED_MTIME = 315532800; // 1980-01-01, earliest zip timestamp

la_ssize_t append_to_string(struct archive*, void* client_data, const void* buffer, size_t length) {
    static_cast<std::string*>(client_data)->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

std::string archive_error(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "";
}

std::string write_members(ArchiveWriteHandle a, const std::vector<ArchiveMember>& members) {
    std::string out;
    archive_write_set_bytes_per_block(a.get(), 0); // no padding after the last entry
    if (archive_write_open(a.get(), &out, nullptr, append_to_string, nullptr) != ARCHIVE_OK) {
        throw PipkinException(string_format("error.archive_write_failed", archive_error(a.get())));
    }

    for (const auto& member : members) {
        ArchiveEntryHandle entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), member.path.c_str());
        archive_entry_set_mtime(entry.get(), FIXED_MTIME, 0);
        if (member.is_dir) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
            archive_entry_set_size(entry.get(), 0);
        } else {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), member.mode);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(member.content.size()));
        }

        if (archive_write_header(a.get(), entry.get()) != ARCHIVE_OK) {
            throw PipkinException(string_format("error.archive_write_failed", archive_error(a.get())));
        }
        if (!member.is_dir && !member.content.empty()) {
            if (archive_write_data(a.get(), member.content.data(), member.content.size()) < 0) {
                throw PipkinException(string_format("error.archive_write_failed", archive_error(a.get())));
            }
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw PipkinException(string_format("error.archive_write_failed", archive_error(a.get())));
    }
    return out;
}

} // anonymous namespace

std::vector<ArchiveMember> read_archive(std::string_view bytes) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        throw PipkinException(string_format("error.archive_read_failed", archive_error(a.get())));
    }

    std::vector<ArchiveMember> members;
    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        ArchiveMember member;
        member.path = archive_entry_pathname(entry);
        member.is_dir = archive_entry_filetype(entry) == AE_IFDIR;
        member.mode = archive_entry_perm(entry);

        if (!member.is_dir) {
            char buffer[8192];
            la_ssize_t n;
            while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
                member.content.append(buffer, static_cast<size_t>(n));
            }
            if (n < 0) {
                throw PipkinException(string_format("error.archive_read_failed", archive_error(a.get())));
            }
        }
        members.push_back(std::move(member));
    }

    if (r != ARCHIVE_EOF) {
        throw PipkinException(string_format("error.archive_read_failed", archive_error(a.get())));
    }
    return members;
}

std::string write_zip(const std::vector<ArchiveMember>& members) {
    ArchiveWriteHandle a(archive_write_new());
    archive_write_set_format_zip(a.get());
    return write_members(std::move(a), members);
}

std::string write_tar_gz(const std::vector<ArchiveMember>& members) {
    ArchiveWriteHandle a(archive_write_new());
    archive_write_add_filter_gzip(a.get());
    archive_write_set_format_pax_restricted(a.get());
    return write_members(std::move(a), members);
}
