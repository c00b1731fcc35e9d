#ifndef DIASPORA_SHARD_DRIVER_STREAM_CLIENT_HPP
#define DIASPORA_SHARD_DRIVER_STREAM_CLIENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shard {

struct Partition {
    std::string id;
};

struct Record {
    std::string       sequence_number;
    std::string       partition_key;
    std::vector<char> payload;
    int64_t           arrival_timestamp = 0;
};

struct PartitionPage {
    std::vector<Partition>     partitions;
    std::optional<std::string> next_token;
};

struct FetchResult {
    std::vector<Record>        records;
    std::optional<std::string> next_token; // empty once the partition is closed
};

enum class CursorMode {
    TrimHorizon,
    AfterSequenceNumber,
    AtTimestamp
};

struct CursorRequest {
    std::string stream_name;
    std::string partition_id;
    CursorMode  mode = CursorMode::TrimHorizon;
    std::string sequence_number; // AfterSequenceNumber only
    int64_t     timestamp = 0;   // AtTimestamp only
};

/**
 * @brief Operations consumed from the partitioned log service.
 *
 * Implementations wrap the actual wire protocol and credentials. They must
 * throw ExpiredCursorError when a cursor token outlived its lifetime and
 * ThroughputExceededError when the service throttles the caller; any other
 * exception is treated as a transport failure.
 */
class StreamClient {

    public:

    virtual ~StreamClient() = default;

    virtual PartitionPage listPartitions(
            const std::string& stream_name,
            const std::optional<std::string>& continuation_token) = 0;

    /**
     * @return a cursor token, or nothing if the partition has no position
     * left to read from (closed and drained).
     */
    virtual std::optional<std::string> getCursor(const CursorRequest& request) = 0;

    /**
     * Consumes the token. The token must not be used again.
     */
    virtual FetchResult fetchRecords(const std::string& cursor_token) = 0;
};

}

#endif
