#pragma once

#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <vector>

namespace rangexfer {

using PersistedProgress = std::map<std::size_t, std::int64_t>;

// Durable range-index -> completed-bytes record kept next to the transfer artifact.
// The record carries the range layout it was written for and only loads into the same layout.
class ProgressStore {
public:
    ProgressStore(std::filesystem::path record_path,
                  Direction direction,
                  std::int64_t total_size,
                  std::vector<TransferRange> layout);

    [[nodiscard]] static std::filesystem::path recordPathFor(const std::filesystem::path& artifact);

    // Missing, unreadable or mismatched records load as empty progress.
    [[nodiscard]] PersistedProgress load() const noexcept;
    // Replaces the whole record atomically. `flush_data` runs first and must make every byte the
    // record claims durable; if it throws TransferError the previous record is kept.
    // Returns false if the record could not be written.
    [[nodiscard]] bool save(const std::vector<TransferRange>& ranges,
                            const std::function<void()>& flush_data = {}) const;
    void clear() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    Direction direction_;
    std::int64_t total_size_;
    std::vector<TransferRange> layout_;
};

} // namespace rangexfer
