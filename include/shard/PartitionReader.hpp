#ifndef DIASPORA_SHARD_DRIVER_PARTITION_READER_HPP
#define DIASPORA_SHARD_DRIVER_PARTITION_READER_HPP

#include <shard/CancellationToken.hpp>
#include <shard/Checkpoint.hpp>
#include <shard/Config.hpp>
#include <shard/PartitionCursor.hpp>
#include <shard/Position.hpp>
#include <shard/StreamClient.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shard {

/**
 * @brief Records emitted by one fetch of one partition, with the checkpoint
 * to persist once they have been processed.
 */
struct Batch {
    std::string         partition_id;
    std::vector<Record> records;
    CheckpointState     checkpoint;
};

/**
 * @brief Fetch loop over a single partition.
 *
 * Not thread-safe: a reader is driven by one task at a time.
 */
class PartitionReader {

    public:

    using Clock = std::chrono::steady_clock;

    enum class State {
        Uninitialized,
        Ready,
        Fetching,
        Backoff,
        Stopped,
        Failed
    };

    /**
     * @brief Reader over a fresh split. The cursor is acquired at the split's
     * start position on the first poll().
     *
     * @throws ConfigurationError if the start position is Latest or None.
     */
    PartitionReader(std::shared_ptr<StreamClient> client,
                    ShardConfig config,
                    Split split);

    /**
     * @brief Reader resuming strictly after a checkpoint.
     *
     * @throws MalformedCheckpointError if the checkpoint does not belong to
     * the configured stream or has no partition id.
     */
    PartitionReader(std::shared_ptr<StreamClient> client,
                    ShardConfig config,
                    const CheckpointState& checkpoint,
                    Position end_position = Position::None());

    PartitionReader(const PartitionReader&) = delete;
    PartitionReader& operator=(const PartitionReader&) = delete;

    /**
     * @brief Performs at most one fetch (renewing an expired cursor as
     * needed) and returns what it emitted. While backing off after an empty
     * fetch, returns an empty batch without contacting the service.
     *
     * @throws ThroughputExceededError (reader stays usable).
     * @throws TransportError, ExpiredCursorError after too many renewals
     * (reader is Failed).
     */
    Batch poll();

    /**
     * @brief Polls until records are emitted, honoring backoff and the
     * cancellation token. Returns nothing once the reader stopped or the
     * token was cancelled.
     */
    std::optional<Batch> next(CancellationToken& cancel);

    CheckpointState snapshot() const;

    State state() const {
        return m_state;
    }

    bool terminated() const {
        return m_state == State::Stopped || m_state == State::Failed;
    }

    Clock::time_point backoffDeadline() const {
        return m_backoff_until;
    }

    const std::string& partitionId() const {
        return m_split.partition_id;
    }

    const std::string& latestSequenceNumber() const {
        return m_latest_sequence_number;
    }

    const std::optional<std::string>& cursorToken() const {
        return m_cursor.token();
    }

    private:

    const std::shared_ptr<StreamClient> m_client;
    const ShardConfig                   m_config;
    const Split                         m_split;
    PartitionCursor                     m_cursor;
    State                               m_state = State::Uninitialized;
    std::string                         m_latest_sequence_number;
    Clock::time_point                   m_backoff_until;

    void initialize();
    void renewCursor();
    FetchResult fetchWithRenewal();
    bool reachedEnd(const std::string& sequence_number) const;
    void stop(const char* reason);
};

const char* toString(PartitionReader::State state);

}

#endif
