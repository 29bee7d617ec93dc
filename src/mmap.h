// mmap.h - Memory-mapped file reading and raw line splitting
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_MMAP_H
#define RULEAUDIT_MMAP_H

#include <cstddef>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace ruleaudit {

//=============================================================================
// MappedFile - Memory-mapped file input
//=============================================================================

struct MappedFile {
    int fd = -1;
    char* data = nullptr;
    size_t size = 0;
    std::string path;

    bool open_read(const char* p) {
        path = p;
        fd = ::open(p, O_RDONLY);
        if (fd < 0) return false;

        struct stat st;
        if (fstat(fd, &st) < 0) { close(); return false; }
        size = st.st_size;

        if (size == 0) {
            data = nullptr;
            return true;
        }

        data = static_cast<char*>(mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0));
        if (data == MAP_FAILED) { data = nullptr; close(); return false; }

        madvise(data, size, MADV_SEQUENTIAL);
        return true;
    }

    std::string_view view() const {
        return data ? std::string_view(data, size) : std::string_view();
    }

    void close() {
        if (data) { munmap(data, size); data = nullptr; }
        if (fd >= 0) { ::close(fd); fd = -1; }
    }

    ~MappedFile() { close(); }

    // Non-copyable, moveable
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept
        : fd(other.fd), data(other.data), size(other.size), path(std::move(other.path)) {
        other.fd = -1;
        other.data = nullptr;
        other.size = 0;
    }
};

//=============================================================================
// Line Splitting
//=============================================================================

// Split text into lines, each keeping its terminator ("\n" or "\r\n").
// The last line has no terminator if the text does not end with one.
inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = (nl == std::string_view::npos) ? text.size() : nl + 1;
        lines.emplace_back(text.substr(pos, end - pos));
        pos = end;
    }
    return lines;
}

// Read a whole file as raw UTF-8 bytes
inline bool read_file(const std::string& path, std::string& out) {
    MappedFile in;
    if (!in.open_read(path.c_str())) return false;
    std::string_view v = in.view();
    out.assign(v.data(), v.size());
    return true;
}

} // namespace ruleaudit

#endif // RULEAUDIT_MMAP_H
