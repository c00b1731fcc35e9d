#ifndef DIASPORA_SHARD_DRIVER_CONFIG_HPP
#define DIASPORA_SHARD_DRIVER_CONFIG_HPP

#include <diaspora/Metadata.hpp>
#include <chrono>
#include <string>

namespace shard {

struct ShardConfig {

    std::string               stream_name;
    std::chrono::milliseconds backoff{200};            // wait after an empty fetch
    size_t                    max_cursor_renewals = 3;  // per fetch
    std::chrono::milliseconds throttle_backoff{1000};  // wait after ThroughputExceeded
    size_t                    max_buffered_batches = 64;
    size_t                    num_threads = 0;          // 0 means one per partition
    std::string               log_level = "info";

    // Default configuration
    ShardConfig() = default;

    explicit ShardConfig(std::string stream)
    : stream_name(std::move(stream)) {}

    // Parse configuration from Diaspora metadata JSON string.
    // stream_name falls back to the DIASPORA_SHARD_STREAM_NAME environment variable.
    static ShardConfig fromMetadata(const diaspora::Metadata& metadata);
};

}

#endif
