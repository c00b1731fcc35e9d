#include "shard/TopicHandle.hpp"
#include "shard/Checkpoint.hpp"
#include "shard/Consumer.hpp"
#include "shard/Driver.hpp"
#include "shard/Errors.hpp"
#include <nlohmann/json.hpp>

namespace shard {

static std::vector<diaspora::PartitionInfo> makePartitionInfo(const std::vector<Split>& splits) {
    std::vector<diaspora::PartitionInfo> pinfo;
    pinfo.reserve(splits.size());
    for (const auto& split : splits) {
        nlohmann::json json = {{"partition_id", split.partition_id}};
        pinfo.push_back(diaspora::PartitionInfo{json.dump()});
    }
    return pinfo;
}

ShardTopicHandle::ShardTopicHandle(
    std::string name,
    std::vector<Split> splits,
    ShardConfig config,
    std::shared_ptr<StreamClient> client,
    std::shared_ptr<ShardDriver> driver)
: m_name{std::move(name)}
, m_splits{std::move(splits)}
, m_pinfo{makePartitionInfo(m_splits)}
, m_config(std::move(config))
, m_client{std::move(client)}
, m_driver{std::move(driver)}
{
    for (size_t i = 0; i < m_splits.size(); ++i) {
        m_partition_index[m_splits[i].partition_id] = i;
    }
}

std::shared_ptr<diaspora::DriverInterface> ShardTopicHandle::driver() const {
    return m_driver;
}

const diaspora::PartitionInfo& ShardTopicHandle::partitionInfo(const std::string& partition_id) const {
    auto it = m_partition_index.find(partition_id);
    if (it == m_partition_index.end())
        throw Error{"Unknown partition", m_name, partition_id};
    return m_pinfo[it->second];
}

std::shared_ptr<diaspora::ProducerInterface>
ShardTopicHandle::makeProducer(std::string_view name,
        diaspora::BatchSize batch_size,
        diaspora::MaxNumBatches max_batch,
        diaspora::Ordering ordering,
        std::shared_ptr<diaspora::ThreadPoolInterface> thread_pool,
        diaspora::Metadata options) {
    (void)name;
    (void)batch_size;
    (void)max_batch;
    (void)ordering;
    (void)thread_pool;
    (void)options;
    throw ConfigurationError{"Producing is not supported by the shard driver", m_name};
}

std::shared_ptr<diaspora::ConsumerInterface>
ShardTopicHandle::makeConsumer(std::string_view name,
        diaspora::BatchSize batch_size,
        diaspora::MaxNumBatches max_batch,
        std::shared_ptr<diaspora::ThreadPoolInterface> thread_pool,
        diaspora::DataAllocator data_allocator,
        diaspora::DataSelector data_selector,
        const std::vector<size_t>& targets,
        diaspora::Metadata options) {
    if(!thread_pool) thread_pool = m_driver->makeThreadPool(diaspora::ThreadCount{0});
    auto simple_thread_pool = std::dynamic_pointer_cast<ShardThreadPool>(thread_pool);
    if(!simple_thread_pool)
        throw diaspora::Exception{"ThreadPool should be an instance of ShardThreadPool"};

    std::vector<Split> splits;
    if(targets.empty()) {
        splits = m_splits;
    } else {
        for(auto index : targets) {
            if(index >= m_splits.size())
                throw diaspora::Exception{"Invalid partition index " + std::to_string(index)};
            splits.push_back(m_splits[index]);
        }
    }

    std::vector<CheckpointState> checkpoints;
    try {
        const auto& json = options.json();

        auto start = Position::Earliest();
        if(json.contains("start_position"))
            start = Position::fromJson(json["start_position"]);
        for(auto& split : splits) split.start_position = start;

        if(json.contains("end_positions")) {
            const auto& ends = json["end_positions"];
            for(auto& split : splits) {
                if(ends.contains(split.partition_id))
                    split.end_position = Position::AtSequenceNumber(
                        ends[split.partition_id].get<std::string>());
            }
        }

        if(json.contains("checkpoints")) {
            for(const auto& entry : json["checkpoints"]) {
                auto checkpoint = CheckpointState::fromJson(entry);
                if(checkpoint.stream_name != m_name)
                    throw MalformedCheckpointError{
                        "Checkpoint belongs to stream \"" + checkpoint.stream_name + "\"",
                        m_name, checkpoint.partition_id
                    };
                checkpoints.push_back(std::move(checkpoint));
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError{
            "Invalid type in consumer options: " + std::string(e.what()), m_name
        };
    }

    return std::make_shared<ShardConsumer>(
            std::string{name}, batch_size, max_batch, simple_thread_pool,
            shared_from_this(), std::move(data_allocator),
            std::move(data_selector), std::move(splits), checkpoints);
}

}
