#include "fs/FileSystem.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fmt/core.h>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace d8::fs {

namespace {

std::string errnoMessage() {
    return std::error_code(errno, std::generic_category()).message();
}

std::runtime_error sysError(const std::string& op, const std::filesystem::path& path) {
    return std::runtime_error(fmt::format("{} {}: {}", op, path.string(), errnoMessage()));
}

void writeAll(const int fd, std::string_view data, const std::string& name) {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("write {}: {}", name, errnoMessage()));
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

class FdWriter : public FileWriter {
public:
    FdWriter(const int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}
    ~FdWriter() override { if (fd_ >= 0) ::close(fd_); }

    void write(const std::string_view data) override { writeAll(fd_, data, path_.string()); }

    void close() override {
        if (fd_ < 0) return;
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) throw sysError("close", path_);
    }

private:
    int fd_;
    std::filesystem::path path_;
};

class FdReader : public RandomAccessFile {
public:
    FdReader(const int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}
    ~FdReader() override { ::close(fd_); }

    std::size_t readAt(char* buf, const std::size_t n, const uint64_t offset) override {
        for (;;) {
            const ssize_t r = ::pread(fd_, buf, n, static_cast<off_t>(offset));
            if (r >= 0) return static_cast<std::size_t>(r);
            if (errno != EINTR) throw sysError("read", path_);
        }
    }

private:
    int fd_;
    std::filesystem::path path_;
};

}

std::unique_ptr<FileWriter> LocalFileSystem::createFile(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw sysError("create", path);
    return std::make_unique<FdWriter>(fd, path);
}

std::unique_ptr<RandomAccessFile> LocalFileSystem::openForRead(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw sysError("open", path);
    return std::make_unique<FdReader>(fd, path);
}

void LocalFileSystem::mkdirAll(const std::filesystem::path& path) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) throw std::runtime_error(fmt::format("create dir {}: {}", path.string(), ec.message()));
}

FileInfo LocalFileSystem::stat(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) throw sysError("stat", path);
    if (!S_ISREG(st.st_mode))
        throw std::runtime_error(fmt::format("stat {}: not a regular file", path.string()));
    return {
        .size = static_cast<uint64_t>(st.st_size),
        .mode = static_cast<mode_t>(st.st_mode & 07777),
        .uid = st.st_uid,
        .gid = st.st_gid,
    };
}

void StdoutWriter::write(const std::string_view data) { writeAll(STDOUT_FILENO, data, "stdout"); }

void StdoutWriter::close() {}

}
