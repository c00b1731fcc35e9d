#ifndef DIASPORA_SHARD_DRIVER_PARTITION_DISCOVERY_HPP
#define DIASPORA_SHARD_DRIVER_PARTITION_DISCOVERY_HPP

#include <shard/Position.hpp>
#include <shard/StreamClient.hpp>
#include <memory>
#include <string>
#include <vector>

namespace shard {

/**
 * @brief Lists the partitions of a stream.
 */
class PartitionDiscovery {

    const std::shared_ptr<StreamClient> m_client;
    const std::string                   m_stream_name;

    public:

    PartitionDiscovery(std::shared_ptr<StreamClient> client,
                       std::string stream_name);

    /**
     * @brief Follows continuation tokens until the last page and returns
     * one split per partition, with start and end positions set to None.
     *
     * @throws DiscoveryError if any page reports no partitions.
     * @throws TransportError if the listing call fails.
     */
    std::vector<Split> listSplits();

    const std::string& streamName() const {
        return m_stream_name;
    }
};

}

#endif
