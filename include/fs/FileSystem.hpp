#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <sys/types.h>

namespace d8::fs {

struct FileInfo {
    uint64_t size = 0;
    mode_t mode = 0; // permission bits only
    uid_t uid = 0;
    gid_t gid = 0;
};

class FileWriter {
public:
    virtual ~FileWriter() = default;
    virtual void write(std::string_view data) = 0;
    virtual void close() = 0;
};

class RandomAccessFile {
public:
    virtual ~RandomAccessFile() = default;
    // Reads up to n bytes at offset without moving any shared cursor.
    virtual std::size_t readAt(char* buf, std::size_t n, uint64_t offset) = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual std::unique_ptr<FileWriter> createFile(const std::filesystem::path& path) = 0;
    virtual std::unique_ptr<RandomAccessFile> openForRead(const std::filesystem::path& path) = 0;
    virtual void mkdirAll(const std::filesystem::path& path) = 0;
    virtual FileInfo stat(const std::filesystem::path& path) = 0;
};

class LocalFileSystem : public FileSystem {
public:
    std::unique_ptr<FileWriter> createFile(const std::filesystem::path& path) override;
    std::unique_ptr<RandomAccessFile> openForRead(const std::filesystem::path& path) override;
    void mkdirAll(const std::filesystem::path& path) override;
    FileInfo stat(const std::filesystem::path& path) override;
};

// Used when a download has no destination path.
class StdoutWriter : public FileWriter {
public:
    void write(std::string_view data) override;
    void close() override;
};

}
