#ifndef DIASPORA_SHARD_DRIVER_PARTITION_CURSOR_HPP
#define DIASPORA_SHARD_DRIVER_PARTITION_CURSOR_HPP

#include <shard/Position.hpp>
#include <shard/StreamClient.hpp>
#include <memory>
#include <optional>
#include <string>

namespace shard {

/**
 * @brief Holds the single-use cursor token of one partition and knows how
 * to obtain a new one, either from a start position or after a sequence number.
 */
class PartitionCursor {

    const std::shared_ptr<StreamClient> m_client;
    const std::string                   m_stream_name;
    const std::string                   m_partition_id;
    std::optional<std::string>          m_token;

    std::optional<std::string> request(const CursorRequest& req);

    public:

    PartitionCursor(std::shared_ptr<StreamClient> client,
                    std::string stream_name,
                    std::string partition_id);

    /**
     * @brief Throws ConfigurationError if the position cannot be used as a
     * start position (Latest or None).
     */
    static void checkStartPosition(const Position& start,
                                   const std::string& stream_name,
                                   const std::string& partition_id);

    /**
     * @brief Earliest maps to the trim horizon, SequenceNumber to the
     * position right after it, Timestamp to the first record at or after it.
     */
    const std::optional<std::string>& acquire(const Position& start);

    /**
     * @brief Replaces the current token with one positioned strictly after
     * the given sequence number.
     */
    const std::optional<std::string>& renew(const std::string& after_sequence_number);

    /**
     * @brief Installs the token returned by a fetch (nothing if the partition closed).
     */
    void advance(std::optional<std::string> next_token) {
        m_token = std::move(next_token);
    }

    const std::optional<std::string>& token() const {
        return m_token;
    }

    const std::string& partitionId() const {
        return m_partition_id;
    }
};

}

#endif
