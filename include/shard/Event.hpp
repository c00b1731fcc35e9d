#ifndef DIASPORA_SHARD_DRIVER_EVENT_HPP
#define DIASPORA_SHARD_DRIVER_EVENT_HPP

#include <shard/Checkpoint.hpp>
#include <diaspora/Event.hpp>
#include <memory>

namespace shard {

/**
 * One record of a partition. Acknowledging it commits its position to the
 * consumer's checkpoint table.
 */
class ShardEvent : public diaspora::EventInterface {

    diaspora::Metadata               m_metadata;
    diaspora::DataView               m_data;
    diaspora::PartitionInfo          m_partition;
    diaspora::EventID                m_id;
    CheckpointState                  m_checkpoint;
    std::shared_ptr<CheckpointTable> m_checkpoints;

    public:

    ShardEvent(diaspora::Metadata metadata,
               diaspora::DataView data,
               diaspora::PartitionInfo partition,
               diaspora::EventID id,
               CheckpointState checkpoint,
               std::shared_ptr<CheckpointTable> checkpoints)
    : m_metadata(std::move(metadata))
    , m_data(std::move(data))
    , m_partition(std::move(partition))
    , m_id(id)
    , m_checkpoint(std::move(checkpoint))
    , m_checkpoints(std::move(checkpoints)) {}

    const diaspora::Metadata& metadata() const override {
        return m_metadata;
    }

    const diaspora::DataView& data() const override {
        return m_data;
    }

    diaspora::PartitionInfo partition() const override {
        return m_partition;
    }

    diaspora::EventID id() const override {
        return m_id;
    }

    const CheckpointState& checkpoint() const {
        return m_checkpoint;
    }

    void acknowledge() const override {
        if(m_checkpoints) m_checkpoints->commit(m_checkpoint);
    }

};

}

#endif
