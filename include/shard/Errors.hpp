#ifndef DIASPORA_SHARD_DRIVER_ERRORS_HPP
#define DIASPORA_SHARD_DRIVER_ERRORS_HPP

#include <diaspora/Exception.hpp>
#include <string>

namespace shard {

/**
 * Base class of every error raised by the shard driver. Carries the
 * stream name and partition id the error relates to (either may be empty).
 */
class Error : public diaspora::Exception {

    std::string m_stream_name;
    std::string m_partition_id;

    static std::string withContext(const std::string& message,
                                   const std::string& stream_name,
                                   const std::string& partition_id) {
        std::string result = message;
        if(!stream_name.empty() || !partition_id.empty()) {
            result += " [stream=" + stream_name;
            if(!partition_id.empty()) result += ", partition=" + partition_id;
            result += "]";
        }
        return result;
    }

    public:

    Error(const std::string& message,
          std::string stream_name = {},
          std::string partition_id = {})
    : diaspora::Exception{withContext(message, stream_name, partition_id)}
    , m_stream_name{std::move(stream_name)}
    , m_partition_id{std::move(partition_id)} {}

    const std::string& streamName() const {
        return m_stream_name;
    }

    const std::string& partitionId() const {
        return m_partition_id;
    }
};

// Partition listing returned no partitions.
class DiscoveryError : public Error {
    public:
    using Error::Error;
};

// Unsupported or invalid settings, raised before any I/O.
class ConfigurationError : public Error {
    public:
    using Error::Error;
};

// The cursor token outlived its service-side lifetime.
class ExpiredCursorError : public Error {
    public:
    using Error::Error;
};

// Service-side rate limiting; the caller decides when to retry.
class ThroughputExceededError : public Error {
    public:
    using Error::Error;
};

class TransportError : public Error {
    public:
    using Error::Error;
};

class MalformedCheckpointError : public Error {
    public:
    using Error::Error;
};

}

#endif
