#include "rangexfer/progress_store.hpp"

#include "rangexfer/detail/file_io.hpp"
#include "rangexfer/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>

#define LOG_SC_STORE "[STORE] "

namespace rangexfer {

namespace {

constexpr int kRecordVersion = 2;

std::filesystem::path temporaryPath(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

bool isBound(const nlohmann::json& entry, const char* key, std::int64_t expected) {
    const auto it = entry.find(key);
    return it != entry.end() && it->is_number_integer() && it->get<std::int64_t>() == expected;
}

void discard(const std::filesystem::path& path, const char* reason) {
    spdlog::warn(LOG_SC_STORE "{}: {} {}, starting over", toString(ErrorKind::CorruptProgressRecord),
                 path.string(), reason);
}

} // namespace

ProgressStore::ProgressStore(std::filesystem::path record_path,
                             Direction direction,
                             std::int64_t total_size,
                             std::vector<TransferRange> layout)
    : path_(std::move(record_path)),
      direction_(direction),
      total_size_(total_size),
      layout_(std::move(layout)) {}

std::filesystem::path ProgressStore::recordPathFor(const std::filesystem::path& artifact) {
    auto record = artifact;
    record += ".rxprogress";
    return record;
}

PersistedProgress ProgressStore::load() const noexcept {
    PersistedProgress progress;
    try {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return progress;
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            discard(path_, "cannot be read");
            return progress;
        }

        const auto record = nlohmann::json::parse(in, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            discard(path_, "is not valid JSON");
            return progress;
        }

        const auto version = record.find("version");
        const auto direction = record.find("direction");
        const auto total = record.find("total_size");
        const auto ranges = record.find("ranges");
        if (version == record.end() || !version->is_number_integer() || *version != kRecordVersion ||
            direction == record.end() || !direction->is_string() ||
            total == record.end() || !total->is_number_integer() ||
            ranges == record.end() || !ranges->is_array()) {
            discard(path_, "is malformed");
            return progress;
        }

        if (direction->get<std::string>() != toString(direction_) ||
            total->get<std::int64_t>() != total_size_ || ranges->size() != layout_.size()) {
            discard(path_, "belongs to a different transfer plan");
            return progress;
        }

        // Every range must sit exactly where the current plan puts it.
        for (std::size_t index = 0; index < layout_.size(); ++index) {
            const auto& entry = (*ranges)[index];
            if (!entry.is_object() || !isBound(entry, "start", layout_[index].start) ||
                !isBound(entry, "end", layout_[index].end)) {
                discard(path_, "belongs to a different range layout");
                return progress;
            }
        }

        for (std::size_t index = 0; index < layout_.size(); ++index) {
            const auto completed = (*ranges)[index].find("completed");
            if (completed == (*ranges)[index].end() || !completed->is_number_integer() ||
                completed->get<std::int64_t>() < 0 || completed->get<std::int64_t>() > layout_[index].length()) {
                spdlog::warn(LOG_SC_STORE "{}: dropping unreadable entry for range {} from {}",
                             toString(ErrorKind::CorruptProgressRecord), index, path_.string());
                continue;
            }
            progress[index] = completed->get<std::int64_t>();
        }
    } catch (const std::exception& ex) {
        spdlog::warn(LOG_SC_STORE "{}: {} unusable ({}), starting over", toString(ErrorKind::CorruptProgressRecord),
                     path_.string(), ex.what());
        progress.clear();
    }
    return progress;
}

bool ProgressStore::save(const std::vector<TransferRange>& ranges, const std::function<void()>& flush_data) const {
    if (flush_data) {
        try {
            flush_data();
        } catch (const TransferError& ex) {
            spdlog::warn(LOG_SC_STORE "Keeping previous record {}: {}", path_.string(), ex.what());
            return false;
        }
    }

    nlohmann::json record;
    record["version"] = kRecordVersion;
    record["direction"] = toString(direction_);
    record["total_size"] = total_size_;
    auto entries = nlohmann::json::array();
    for (const auto& range : ranges) {
        entries.push_back({{"start", range.start}, {"end", range.end}, {"completed", range.completed}});
    }
    record["ranges"] = std::move(entries);
    const std::string text = record.dump();

    const auto tmp = temporaryPath(path_);
    detail::FilePtr file{std::fopen(tmp.c_str(), "wb")};
    if (!file) {
        spdlog::warn(LOG_SC_STORE "Cannot create {}: {}", tmp.string(), std::strerror(errno));
        return false;
    }

    const bool written = std::fwrite(text.data(), 1, text.size(), file.get()) == text.size() &&
                         std::fflush(file.get()) == 0 &&
                         fsync(fileno(file.get())) == 0;
    const int write_errno = errno;
    file.reset();

    std::error_code ec;
    if (!written) {
        spdlog::warn(LOG_SC_STORE "Cannot write {}: {}", tmp.string(), std::strerror(write_errno));
        std::filesystem::remove(tmp, ec);
        return false;
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        spdlog::warn(LOG_SC_STORE "Cannot replace {}: {}", path_.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }

    spdlog::trace(LOG_SC_STORE "Checkpoint {} ({} ranges)", path_.string(), ranges.size());
    return true;
}

void ProgressStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(temporaryPath(path_), ec);
    if (std::filesystem::remove(path_, ec)) {
        spdlog::debug(LOG_SC_STORE "Removed progress record {}", path_.string());
    } else if (ec) {
        spdlog::warn(LOG_SC_STORE "Cannot remove {}: {}", path_.string(), ec.message());
    }
}

} // namespace rangexfer
