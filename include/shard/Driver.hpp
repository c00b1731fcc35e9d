#ifndef DIASPORA_SHARD_DRIVER_DRIVER_HPP
#define DIASPORA_SHARD_DRIVER_DRIVER_HPP

#include <diaspora/Driver.hpp>
#include <shard/Config.hpp>
#include <shard/StreamClient.hpp>
#include <shard/ThreadPool.hpp>
#include <shard/TopicHandle.hpp>

#include <functional>
#include <mutex>
#include <unordered_map>

namespace shard {

/**
 * Diaspora driver exposing the streams of a partitioned log service as
 * read-only topics. Registered under the name "shard".
 */
class ShardDriver : public diaspora::DriverInterface,
                    public std::enable_shared_from_this<ShardDriver> {

    public:

    using ClientFactory = std::function<std::shared_ptr<StreamClient>(const diaspora::Metadata&)>;

    private:

    const ShardConfig                   m_config;
    const std::shared_ptr<StreamClient> m_client;

    std::shared_ptr<diaspora::ThreadPoolInterface> m_default_thread_pool =
        std::make_shared<ShardThreadPool>(diaspora::ThreadCount{0});

    mutable std::mutex m_topics_mutex;
    mutable std::unordered_map<std::string, std::shared_ptr<ShardTopicHandle>> m_topics;

    static ClientFactory& clientFactory();

    public:

    ShardDriver(ShardConfig config, std::shared_ptr<StreamClient> client);

    void createTopic(std::string_view name,
                     const diaspora::Metadata& options,
                     std::shared_ptr<diaspora::ValidatorInterface> validator,
                     std::shared_ptr<diaspora::PartitionSelectorInterface> selector,
                     std::shared_ptr<diaspora::SerializerInterface> serializer) override;

    /**
     * Discovers the partitions of the stream on first access. An empty name
     * opens the stream named in the configuration.
     */
    std::shared_ptr<diaspora::TopicHandleInterface> openTopic(std::string_view name) const override;

    bool topicExists(std::string_view name) const override;

    std::shared_ptr<diaspora::ThreadPoolInterface> defaultThreadPool() const override {
        return m_default_thread_pool;
    }

    std::shared_ptr<diaspora::ThreadPoolInterface> makeThreadPool(diaspora::ThreadCount count) const override {
        return std::make_shared<ShardThreadPool>(count);
    }

    const ShardConfig& config() const {
        return m_config;
    }

    /**
     * Installs the function used by create() to build the service client.
     */
    static void setClientFactory(ClientFactory factory);

    static std::shared_ptr<diaspora::DriverInterface> create(const diaspora::Metadata& options);
};

}

#endif
