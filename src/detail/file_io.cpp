#include "rangexfer/detail/file_io.hpp"

#include "rangexfer/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <sys/types.h>
#include <unistd.h>

namespace rangexfer::detail {

namespace {

std::string describeErrno(const char* what, const std::filesystem::path& path) {
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

} // namespace

OutputFile::OutputFile(const std::filesystem::path& path, bool truncate) : path_(path) {
    if (!truncate) {
        file_.reset(std::fopen(path_.c_str(), "rb+"));
    }
    if (!file_) {
        file_.reset(std::fopen(path_.c_str(), "wb+"));
    }
    if (!file_) {
        throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Cannot create destination file", path_));
    }
}

void OutputFile::resize(std::int64_t size) {
    if (!file_ || ftruncate(fileno(file_.get()), static_cast<off_t>(size)) == -1) {
        throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Cannot resize destination file", path_));
    }
}

void OutputFile::writeAt(std::int64_t offset, const char* data, std::size_t size) {
    if (!file_) {
        throw TransferError(ErrorKind::OutputWriteFailure, "Destination file " + path_.string() + " is closed");
    }
    const int fd = fileno(file_.get());
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = pwrite(fd, data + written, size - written, static_cast<off_t>(offset) + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Failed to write output file", path_));
        }
        written += static_cast<std::size_t>(n);
    }
}

void OutputFile::sync() {
    if (!file_ || fsync(fileno(file_.get())) != 0) {
        throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Failed to flush output file", path_));
    }
}

void OutputFile::syncData() {
    if (!file_ || fdatasync(fileno(file_.get())) != 0) {
        throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Failed to sync output file", path_));
    }
}

void OutputFile::close() {
    if (file_ && std::fclose(file_.release()) != 0) {
        throw TransferError(ErrorKind::OutputWriteFailure, describeErrno("Failed to close output file", path_));
    }
}

SourceFile::SourceFile(const std::filesystem::path& path) : path_(path) {
    file_.reset(std::fopen(path_.c_str(), "rb"));
    if (!file_) {
        throw TransferError(ErrorKind::SourceReadFailure, describeErrno("Cannot open source file", path_));
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw TransferError(ErrorKind::SourceReadFailure,
                            fmt::format("Cannot size source file {}: {}", path_.string(), ec.message()));
    }
    size_ = static_cast<std::int64_t>(size);
}

std::size_t SourceFile::readAt(std::int64_t offset, char* buffer, std::size_t size) const {
    const int fd = fileno(file_.get());
    std::size_t total = 0;
    while (total < size) {
        const ssize_t n = pread(fd, buffer + total, size - total, static_cast<off_t>(offset) + static_cast<off_t>(total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError(ErrorKind::SourceReadFailure, describeErrno("Failed to read source file", path_));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

} // namespace rangexfer::detail
