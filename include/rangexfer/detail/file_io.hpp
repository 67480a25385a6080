#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace rangexfer::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// Download destination. Positional writes let workers fill disjoint regions without a lock.
// Failures throw TransferError(OutputWriteFailure).
class OutputFile {
public:
    OutputFile(const std::filesystem::path& path, bool truncate);

    void resize(std::int64_t size);
    void writeAt(std::int64_t offset, const char* data, std::size_t size);
    void sync();
    // Flushes written data (not metadata) to stable storage. Safe to call while other threads write.
    void syncData();
    void close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    FilePtr file_;
};

// Upload source, opened read-only. Failures throw TransferError(SourceReadFailure).
class SourceFile {
public:
    explicit SourceFile(const std::filesystem::path& path);

    [[nodiscard]] std::int64_t size() const noexcept { return size_; }
    // Reads up to `size` bytes at `offset`; returns the count actually read.
    std::size_t readAt(std::int64_t offset, char* buffer, std::size_t size) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    FilePtr file_;
    std::int64_t size_{0};
};

} // namespace rangexfer::detail
