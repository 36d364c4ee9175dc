// mmap_file.hpp - read-only memory mapped files
// bilder und textfiles werden komplett gelesen, mmap spart den read-loop,
// read_all kopiert das mapping trotzdem einmal in einen string
// windows und linux version weil die apis komplett anders sind
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <fstream>
#include <iterator>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace mmapfile {

class MappedFile {
public:
    MappedFile() = default;
    explicit MappedFile(const std::string& path) { open(path); }
    ~MappedFile() { close(); }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    // false bei fehler UND bei leerem file, mmap mit size 0 geht nich
    bool open(const std::string& path) {
        close();
#ifdef _WIN32
        file_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                            OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
        if (file_ == INVALID_HANDLE_VALUE) return false;

        LARGE_INTEGER file_size;
        if (!GetFileSizeEx(file_, &file_size) || file_size.QuadPart == 0) {
            close();
            return false;
        }
        size_ = static_cast<size_t>(file_size.QuadPart);

        mapping_ = CreateFileMappingA(file_, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!mapping_) {
            close();
            return false;
        }
        data_ = MapViewOfFile(mapping_, FILE_MAP_READ, 0, 0, 0);
        if (!data_) {
            close();
            return false;
        }
#else
        fd_ = ::open(path.c_str(), O_RDONLY);
        if (fd_ < 0) return false;

        struct stat st;
        if (fstat(fd_, &st) < 0 || st.st_size == 0) {
            close();
            return false;
        }
        size_ = static_cast<size_t>(st.st_size);

        void* mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (mapped == MAP_FAILED) {
            close();
            return false;
        }
        data_ = mapped;
        madvise(data_, size_, MADV_SEQUENTIAL);
#endif
        return true;
    }

    void close() {
#ifdef _WIN32
        if (data_) UnmapViewOfFile(data_);
        if (mapping_) CloseHandle(mapping_);
        if (file_ != INVALID_HANDLE_VALUE) CloseHandle(file_);
        mapping_ = nullptr;
        file_ = INVALID_HANDLE_VALUE;
#else
        if (data_) munmap(data_, size_);
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
#endif
        data_ = nullptr;
        size_ = 0;
    }

    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }

private:
    void* data_ = nullptr;
    size_t size_ = 0;

#ifdef _WIN32
    HANDLE file_ = INVALID_HANDLE_VALUE;
    HANDLE mapping_ = nullptr;
#else
    int fd_ = -1;
#endif
};

// ganzes file als bytes holen, mmap zuerst, ifstream als fallback
// (leere files, pipes, komische filesysteme)
inline bool read_all(const std::string& path, std::string& out) {
    MappedFile mapped;
    if (mapped.open(path)) {
        out.assign(reinterpret_cast<const char*>(mapped.data()), mapped.size());
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace mmapfile
