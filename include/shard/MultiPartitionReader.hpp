#ifndef DIASPORA_SHARD_DRIVER_MULTI_PARTITION_READER_HPP
#define DIASPORA_SHARD_DRIVER_MULTI_PARTITION_READER_HPP

#include <shard/CancellationToken.hpp>
#include <shard/Checkpoint.hpp>
#include <shard/Config.hpp>
#include <shard/PartitionReader.hpp>
#include <shard/StreamClient.hpp>
#include <shard/ThreadPool.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shard {

/**
 * @brief Reads several partitions concurrently and merges their batches.
 *
 * Each partition is driven by its own task on an internal thread pool. A task
 * performs one fetch, then resubmits itself, immediately or after the
 * partition's backoff delay. Order is preserved within a partition, batches of
 * different partitions interleave arbitrarily.
 */
class MultiPartitionReader {

    struct Output {
        std::optional<Batch> batch;
        std::exception_ptr   error;
    };

    const std::shared_ptr<StreamClient>           m_client;
    const ShardConfig                             m_config;
    std::vector<std::unique_ptr<PartitionReader>> m_readers;
    CancellationToken                             m_cancel;

    // partition id -> current cursor token, one writer per entry
    mutable std::mutex                            m_tokens_mutex;
    std::unordered_map<std::string, std::string>  m_cursor_tokens;

    mutable std::mutex                            m_queue_mutex;
    std::condition_variable                       m_queue_cv;
    std::deque<Output>                            m_queue;
    size_t                                        m_running_partitions = 0;
    std::unordered_map<std::string, CheckpointState> m_delivered;

    // Declared last so that it is destroyed (and joined) first.
    std::unique_ptr<ShardThreadPool>              m_thread_pool;

    void schedule(size_t index, std::chrono::milliseconds delay);
    void runPartition(size_t index);
    void publishToken(const PartitionReader& reader);
    void finishPartition();

    public:

    /**
     * @param splits non-empty set of partitions to read.
     * @param checkpoints restored states; a split whose partition has a
     * checkpoint resumes right after it, keeping the split's end position.
     *
     * @throws ConfigurationError if splits is empty or contains duplicates.
     */
    MultiPartitionReader(std::shared_ptr<StreamClient> client,
                         ShardConfig config,
                         std::vector<Split> splits,
                         const std::vector<CheckpointState>& checkpoints = {});

    ~MultiPartitionReader();

    MultiPartitionReader(const MultiPartitionReader&) = delete;
    MultiPartitionReader& operator=(const MultiPartitionReader&) = delete;

    /**
     * @brief Waits up to timeout for the next batch. Rethrows the error of a
     * partition that failed. Returns nothing on timeout, after stop(), or
     * once every partition stopped and all batches were delivered.
     */
    std::optional<Batch> next(std::chrono::milliseconds timeout);

    std::optional<Batch> tryNext() {
        return next(std::chrono::milliseconds{0});
    }

    /**
     * @brief Cancels all partition tasks. Fetches in flight complete, their
     * batches are discarded.
     */
    void stop();

    /**
     * @brief True after stop(), or once every partition stopped and all
     * batches were delivered.
     */
    bool finished() const;

    /**
     * @brief Checkpoints of the batches delivered by next(), one per
     * partition that delivered at least one batch or was restored.
     */
    std::vector<CheckpointState> snapshot() const;

    std::optional<std::string> cursorToken(const std::string& partition_id) const;

    size_t numPartitions() const {
        return m_readers.size();
    }

    const std::string& streamName() const {
        return m_config.stream_name;
    }
};

}

#endif
