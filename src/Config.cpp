#include "shard/Config.hpp"
#include "shard/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace shard {

ShardConfig ShardConfig::fromMetadata(const diaspora::Metadata& metadata) {
    ShardConfig config;

    try {
        const auto& json = metadata.json();

        if (json.contains("stream_name")) {
            config.stream_name = json["stream_name"].get<std::string>();
        } else if (const char* env = std::getenv("DIASPORA_SHARD_STREAM_NAME")) {
            config.stream_name = env;
        }

        if (json.contains("backoff_ms")) {
            config.backoff = std::chrono::milliseconds{json["backoff_ms"].get<int64_t>()};
        }

        if (json.contains("max_cursor_renewals")) {
            config.max_cursor_renewals = json["max_cursor_renewals"].get<size_t>();
        }

        if (json.contains("throttle_backoff_ms")) {
            config.throttle_backoff = std::chrono::milliseconds{json["throttle_backoff_ms"].get<int64_t>()};
        }

        if (json.contains("max_buffered_batches")) {
            config.max_buffered_batches = json["max_buffered_batches"].get<size_t>();
        }

        if (json.contains("num_threads")) {
            config.num_threads = json["num_threads"].get<size_t>();
        }

        if (json.contains("log_level")) {
            config.log_level = json["log_level"].get<std::string>();
            if (spdlog::level::from_str(config.log_level) == spdlog::level::off
                && config.log_level != "off") {
                throw ConfigurationError{
                    "Invalid log_level: " + config.log_level +
                    ". Valid values are: trace, debug, info, warning, error, critical, off"
                };
            }
        }

    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError{
            "Invalid type in ShardConfig metadata: " + std::string(e.what())
        };
    }

    if (config.backoff.count() < 0 || config.throttle_backoff.count() < 0) {
        throw ConfigurationError{"backoff_ms and throttle_backoff_ms must not be negative"};
    }
    if (config.max_buffered_batches == 0) {
        throw ConfigurationError{"max_buffered_batches must be at least 1"};
    }

    return config;
}

}
