#pragma once

#include <string>
#include <string_view>
#include <vector>

struct ArchiveMember {
    std::string path;
    std::string content;
    bool is_dir = false;
    int mode = 0644;
};

// Any format and compression libarchive recognises. Throws PipkinException.
std::vector<ArchiveMember> read_archive(std::string_view bytes);

// In-memory archive writers with fixed timestamps. Throw PipkinException.
std::string write_zip(const std::vector<ArchiveMember>& members);
std::string write_tar_gz(const std::vector<ArchiveMember>& members);
