#ifndef DIASPORA_SHARD_DRIVER_CONSUMER_HPP
#define DIASPORA_SHARD_DRIVER_CONSUMER_HPP

#include <shard/Checkpoint.hpp>
#include <shard/MultiPartitionReader.hpp>
#include <shard/ThreadPool.hpp>
#include <shard/TopicHandle.hpp>

#include <diaspora/Consumer.hpp>

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <unordered_map>

namespace shard {

template<typename T> struct FutureState;

class ShardConsumer final : public diaspora::ConsumerInterface {

    struct PendingRecord {
        Record      record;
        std::string partition_id;
    };

    const std::string                       m_name;
    const diaspora::BatchSize               m_batch_size;
    const diaspora::MaxNumBatches           m_max_num_batches;
    const std::shared_ptr<ShardThreadPool>  m_thread_pool;
    const std::shared_ptr<ShardTopicHandle> m_topic;
    const diaspora::DataAllocator           m_data_allocator;
    const diaspora::DataSelector            m_data_selector;
    const std::shared_ptr<CheckpointTable>  m_checkpoints;
    const std::unique_ptr<MultiPartitionReader> m_reader;

    mutable std::mutex                           m_pending_mutex;
    std::deque<PendingRecord>                    m_pending;
    std::exception_ptr                           m_error;
    std::unordered_map<std::string, diaspora::EventID> m_next_event_ids;

    // pull() tasks still queued or running on m_thread_pool
    struct PullTasks {
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    alive = true;
        size_t                  running = 0;
    };
    const std::shared_ptr<PullTasks> m_tasks = std::make_shared<PullTasks>();

    void deliverNext(FutureState<std::optional<diaspora::Event>>& state);
    diaspora::Event makeEvent(const PendingRecord& pending, diaspora::EventID id);

    public:

    ShardConsumer(
        std::string name,
        diaspora::BatchSize batch_size,
        diaspora::MaxNumBatches max_num_batches,
        std::shared_ptr<ShardThreadPool> thread_pool,
        std::shared_ptr<ShardTopicHandle> topic,
        diaspora::DataAllocator data_allocator,
        diaspora::DataSelector data_selector,
        std::vector<Split> splits,
        const std::vector<CheckpointState>& checkpoints);

    ~ShardConsumer();

    const std::string& name() const override {
        return m_name;
    }

    diaspora::BatchSize batchSize() const override {
        return m_batch_size;
    }

    diaspora::MaxNumBatches maxNumBatches() const override {
        return m_max_num_batches;
    }

    std::shared_ptr<diaspora::ThreadPoolInterface> threadPool() const override {
        return m_thread_pool;
    }

    std::shared_ptr<diaspora::TopicHandleInterface> topic() const override;

    const diaspora::DataAllocator& dataAllocator() const override {
        return m_data_allocator;
    }

    const diaspora::DataSelector& dataSelector() const override {
        return m_data_selector;
    }

    void process(diaspora::EventProcessor processor,
                 int timeout_ms,
                 diaspora::NumEvents maxEvents,
                 std::shared_ptr<diaspora::ThreadPoolInterface> threadPool) override;

    void unsubscribe() override;

    /**
     * Next record of any partition, or nothing if none arrived within the
     * configured backoff interval. A failed partition surfaces its error here.
     * A record is only taken off the consumer once a waiter receives it, so
     * a pull whose wait() timed out loses nothing.
     */
    diaspora::Future<std::optional<diaspora::Event>> pull() override;

    /**
     * Positions of the acknowledged events, one per partition.
     */
    std::vector<CheckpointState> checkpoints() const {
        return m_checkpoints->states();
    }

    bool finished() const;
};

}

#endif
