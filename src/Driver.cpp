#include "shard/Driver.hpp"
#include "shard/Errors.hpp"
#include "shard/PartitionDiscovery.hpp"
#include "Logger.hpp"

namespace shard {

DIASPORA_REGISTER_DRIVER(_, shard, ShardDriver);

ShardDriver::ShardDriver(ShardConfig config, std::shared_ptr<StreamClient> client)
: m_config(std::move(config))
, m_client(std::move(client))
{
    if (!m_client) {
        throw ConfigurationError{"ShardDriver requires a stream client", m_config.stream_name};
    }
}

ShardDriver::ClientFactory& ShardDriver::clientFactory() {
    static ClientFactory factory;
    return factory;
}

void ShardDriver::setClientFactory(ClientFactory factory) {
    clientFactory() = std::move(factory);
}

std::shared_ptr<diaspora::DriverInterface> ShardDriver::create(const diaspora::Metadata& options) {
    auto config = ShardConfig::fromMetadata(options);
    logger()->set_level(spdlog::level::from_str(config.log_level));

    auto& factory = clientFactory();
    if (!factory) {
        throw ConfigurationError{
            "No stream client factory registered, call ShardDriver::setClientFactory first",
            config.stream_name
        };
    }
    auto client = factory(options);
    return std::make_shared<ShardDriver>(std::move(config), std::move(client));
}

void ShardDriver::createTopic(std::string_view name,
                              const diaspora::Metadata& options,
                              std::shared_ptr<diaspora::ValidatorInterface> validator,
                              std::shared_ptr<diaspora::PartitionSelectorInterface> selector,
                              std::shared_ptr<diaspora::SerializerInterface> serializer) {
    (void)options;
    (void)validator;
    (void)selector;
    (void)serializer;
    throw ConfigurationError{
        "Streams are managed by the log service and cannot be created by the shard driver",
        std::string{name}
    };
}

std::shared_ptr<diaspora::TopicHandleInterface> ShardDriver::openTopic(std::string_view name) const {
    std::string stream_name = name.empty() ? m_config.stream_name : std::string{name};
    if (stream_name.empty()) {
        throw ConfigurationError{"No stream name given and none configured"};
    }

    std::unique_lock lock(m_topics_mutex);
    auto it = m_topics.find(stream_name);
    if (it != m_topics.end()) return it->second;

    PartitionDiscovery discovery{m_client, stream_name};
    auto splits = discovery.listSplits();

    ShardConfig config = m_config;
    config.stream_name = stream_name;

    auto topic = std::make_shared<ShardTopicHandle>(
        stream_name,
        std::move(splits),
        std::move(config),
        m_client,
        std::const_pointer_cast<ShardDriver>(shared_from_this())
    );
    m_topics.emplace(stream_name, topic);
    return topic;
}

bool ShardDriver::topicExists(std::string_view name) const {
    try {
        openTopic(name);
        return true;
    } catch (const DiscoveryError& e) {
        logger()->debug("stream {} not readable: {}", std::string{name}, e.what());
        return false;
    }
}

}
