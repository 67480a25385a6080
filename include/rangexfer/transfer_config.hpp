#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rangexfer {

struct TransferConfig {
    int workers{8};
    std::size_t block_size{64 * 1024};
    int max_retries{3};
    std::chrono::milliseconds retry_delay{500};
    int probe_retries{3};
    std::chrono::milliseconds progress_interval{100};
    std::chrono::milliseconds checkpoint_interval{1000};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds low_speed_time{30};
    std::int64_t min_upload_range{1024 * 1024};
    std::string user_agent{"rangexfer/1.0"};
};

} // namespace rangexfer
