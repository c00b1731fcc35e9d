#ifndef DIASPORA_SHARD_DRIVER_TOPIC_HANDLE_HPP
#define DIASPORA_SHARD_DRIVER_TOPIC_HANDLE_HPP

#include <diaspora/TopicHandle.hpp>
#include <shard/Config.hpp>
#include <shard/Position.hpp>
#include <shard/StreamClient.hpp>

#include <vector>
#include <memory>
#include <unordered_map>

namespace shard {

class ShardDriver;

/**
 * A stream of the log service, seen as a read-only diaspora topic whose
 * partitions are the stream's partitions at the time it was opened.
 */
class ShardTopicHandle final : public diaspora::TopicHandleInterface,
                               public std::enable_shared_from_this<ShardTopicHandle> {

    const std::string                          m_name;
    const std::vector<Split>                   m_splits;
    const std::vector<diaspora::PartitionInfo> m_pinfo;
    const ShardConfig                          m_config;
    const std::shared_ptr<StreamClient>        m_client;
    const std::shared_ptr<ShardDriver>         m_driver;

    std::unordered_map<std::string, size_t>    m_partition_index;

    public:

    ShardTopicHandle(
        std::string name,
        std::vector<Split> splits,
        ShardConfig config,
        std::shared_ptr<StreamClient> client,
        std::shared_ptr<ShardDriver> driver);

    const std::string& name() const override {
        return m_name;
    }

    std::shared_ptr<diaspora::DriverInterface> driver() const override;

    const std::vector<diaspora::PartitionInfo>& partitions() const override {
        return m_pinfo;
    }

    diaspora::Validator validator() const override {
        return diaspora::Validator();
    }

    diaspora::PartitionSelector selector() const override {
        return diaspora::PartitionSelector();
    }

    diaspora::Serializer serializer() const override {
        return diaspora::Serializer();
    }

    const std::vector<Split>& splits() const {
        return m_splits;
    }

    const diaspora::PartitionInfo& partitionInfo(const std::string& partition_id) const;

    const ShardConfig& config() const {
        return m_config;
    }

    const std::shared_ptr<StreamClient>& client() const {
        return m_client;
    }

    /**
     * Streams are read-only through this driver.
     */
    std::shared_ptr<diaspora::ProducerInterface>
        makeProducer(std::string_view name,
                     diaspora::BatchSize batch_size,
                     diaspora::MaxNumBatches max_batch,
                     diaspora::Ordering ordering,
                     std::shared_ptr<diaspora::ThreadPoolInterface> thread_pool,
                     diaspora::Metadata options) override;

    /**
     * Creates a consumer over the targeted partition indices (all partitions
     * if targets is empty). Recognized options:
     * - "start_position": position of partitions without checkpoint (default earliest)
     * - "end_positions": {"<partition_id>": "<sequence_number>", ...}
     * - "checkpoints": [checkpoint, ...] to resume from
     */
    std::shared_ptr<diaspora::ConsumerInterface>
        makeConsumer(std::string_view name,
                     diaspora::BatchSize batch_size,
                     diaspora::MaxNumBatches max_batch,
                     std::shared_ptr<diaspora::ThreadPoolInterface> thread_pool,
                     diaspora::DataAllocator data_allocator,
                     diaspora::DataSelector data_selector,
                     const std::vector<size_t>& targets,
                     diaspora::Metadata options) override;
};

}

#endif
