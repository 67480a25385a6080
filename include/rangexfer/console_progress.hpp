#pragma once

#include "progress.hpp"

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace rangexfer {

// Single redrawn status line for the command line tool.
class ConsoleProgress {
public:
    ConsoleProgress(std::string name, std::ostream& out);

    void update(const ProgressSample& sample);
    void finish();

    [[nodiscard]] static std::string formatLine(const std::string& name, const ProgressSample& sample);
    [[nodiscard]] static std::string formatSize(std::int64_t bytes);
    [[nodiscard]] static std::string formatRate(double bytes_per_second);

private:
    std::string name_;
    std::ostream& out_;
    std::mutex mutex_;
    std::size_t last_width_{0};
    bool drawn_{false};
};

} // namespace rangexfer
