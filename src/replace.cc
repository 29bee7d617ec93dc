// replace.cc - Backup and atomic replacement of a rewritten file

#include "replace.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "mmap.h"

namespace ruleaudit {

static bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

static std::string dir_of(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

static std::string base_of(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string backup_name(const std::string& path, unsigned n) {
    if (n <= 1) return path + ".bak";
    return path + "-" + std::to_string(n) + ".bak";
}

// Copy for file systems without hard links. O_EXCL keeps an existing
// backup intact; returns false with errno == EEXIST in that case.
static bool copy_exclusive(const std::string& from, const std::string& to, mode_t mode) {
    std::string content;
    if (!read_file(from, content)) return false;

    int fd = ::open(to.c_str(), O_WRONLY | O_CREAT | O_EXCL, mode);
    if (fd < 0) return false;
    bool ok = write_all(fd, content.data(), content.size()) && ::fsync(fd) == 0;
    ::close(fd);
    if (!ok) ::unlink(to.c_str());
    return ok;
}

bool create_backup(const std::string& path, std::string& backup_path) {
    struct stat st;
    if (::stat(path.c_str(), &st) < 0) {
        std::cerr << "Failed to stat: " << path << " (" << strerror(errno) << ")\n";
        return false;
    }

    for (unsigned n = 1;; ++n) {
        std::string candidate = backup_name(path, n);
        if (::link(path.c_str(), candidate.c_str()) == 0) {
            backup_path = candidate;
            return true;
        }
        if (errno == EEXIST) continue;

        if (copy_exclusive(path, candidate, st.st_mode & 07777)) {
            backup_path = candidate;
            return true;
        }
        if (errno == EEXIST) continue;

        std::cerr << "Failed to back up " << path << " to " << candidate
                  << " (" << strerror(errno) << ")\n";
        return false;
    }
}

bool replace_with_backup(const std::string& path, const std::string& content,
                         std::string& backup_path) {
    struct stat st;
    if (::stat(path.c_str(), &st) < 0) {
        std::cerr << "Failed to stat: " << path << " (" << strerror(errno) << ")\n";
        return false;
    }

    std::string tmpl = dir_of(path) + "/" + base_of(path) + "XXXXXX";
    std::vector<char> temp_name(tmpl.begin(), tmpl.end());
    temp_name.push_back('\0');

    int fd = ::mkstemp(temp_name.data());
    if (fd < 0) {
        std::cerr << "Failed to create temp file in " << dir_of(path)
                  << " (" << strerror(errno) << ")\n";
        return false;
    }

    bool ok = ::fchmod(fd, st.st_mode & 07777) == 0 &&
              write_all(fd, content.data(), content.size()) &&
              ::fsync(fd) == 0;
    if (::close(fd) < 0) ok = false;
    if (!ok) {
        std::cerr << "Failed to write temp file " << temp_name.data()
                  << " (" << strerror(errno) << ")\n";
        ::unlink(temp_name.data());
        return false;
    }

    if (!create_backup(path, backup_path)) {
        ::unlink(temp_name.data());
        return false;
    }

    if (::rename(temp_name.data(), path.c_str()) < 0) {
        std::cerr << "Failed to replace " << path << " (" << strerror(errno) << ")\n";
        ::unlink(temp_name.data());
        return false;
    }
    return true;
}

} // namespace ruleaudit
