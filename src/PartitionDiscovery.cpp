#include "shard/PartitionDiscovery.hpp"
#include "shard/Errors.hpp"
#include "Logger.hpp"
#include <iterator>

namespace shard {

PartitionDiscovery::PartitionDiscovery(
    std::shared_ptr<StreamClient> client,
    std::string stream_name)
: m_client(std::move(client))
, m_stream_name{std::move(stream_name)}
{}

std::vector<Split> PartitionDiscovery::listSplits() {
    std::optional<std::string> next_token;
    std::vector<Partition>     partitions;
    size_t                     num_pages = 0;

    do {
        PartitionPage page;
        try {
            page = m_client->listPartitions(m_stream_name, next_token);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw TransportError{
                "Failed to list partitions: " + std::string(e.what()),
                m_stream_name
            };
        }
        ++num_pages;

        if (page.partitions.empty()) {
            throw DiscoveryError{"no partitions in stream " + m_stream_name, m_stream_name};
        }
        partitions.insert(partitions.end(),
                          std::make_move_iterator(page.partitions.begin()),
                          std::make_move_iterator(page.partitions.end()));
        next_token = std::move(page.next_token);
    } while (next_token);

    logger()->info("discovered {} partition(s) in stream {} over {} page(s)",
                 partitions.size(), m_stream_name, num_pages);

    std::vector<Split> splits;
    splits.reserve(partitions.size());
    for (auto& partition : partitions) {
        splits.push_back(Split{std::move(partition.id), Position::None(), Position::None()});
    }
    return splits;
}

}
