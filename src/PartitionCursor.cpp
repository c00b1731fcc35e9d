#include "shard/PartitionCursor.hpp"
#include "shard/Errors.hpp"
#include "Logger.hpp"

namespace shard {

PartitionCursor::PartitionCursor(
    std::shared_ptr<StreamClient> client,
    std::string stream_name,
    std::string partition_id)
: m_client(std::move(client))
, m_stream_name{std::move(stream_name)}
, m_partition_id{std::move(partition_id)}
{}

void PartitionCursor::checkStartPosition(const Position& start,
                                         const std::string& stream_name,
                                         const std::string& partition_id) {
    switch(start.kind) {
        case Position::Kind::Earliest:
        case Position::Kind::SequenceNumber:
        case Position::Kind::Timestamp:
            return;
        default:
            throw ConfigurationError{
                "Unsupported start position " + start.toString() +
                ", expected earliest, sequence_number or timestamp",
                stream_name, partition_id
            };
    }
}

const std::optional<std::string>& PartitionCursor::acquire(const Position& start) {
    checkStartPosition(start, m_stream_name, m_partition_id);

    CursorRequest req;
    req.stream_name  = m_stream_name;
    req.partition_id = m_partition_id;
    if(start.kind == Position::Kind::Earliest) {
        req.mode = CursorMode::TrimHorizon;
    } else if(start.kind == Position::Kind::SequenceNumber) {
        req.mode = CursorMode::AfterSequenceNumber;
        req.sequence_number = start.sequence_number;
    } else {
        req.mode = CursorMode::AtTimestamp;
        req.timestamp = start.timestamp;
    }

    logger()->debug("acquiring cursor for {}/{} at {}",
                  m_stream_name, m_partition_id, start.toString());
    m_token = request(req);
    return m_token;
}

const std::optional<std::string>& PartitionCursor::renew(const std::string& after_sequence_number) {
    CursorRequest req;
    req.stream_name     = m_stream_name;
    req.partition_id    = m_partition_id;
    req.mode            = CursorMode::AfterSequenceNumber;
    req.sequence_number = after_sequence_number;

    logger()->debug("renewing cursor for {}/{} after sequence number {}",
                  m_stream_name, m_partition_id, after_sequence_number);
    m_token = request(req);
    return m_token;
}

std::optional<std::string> PartitionCursor::request(const CursorRequest& req) {
    try {
        return m_client->getCursor(req);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw TransportError{
            "Failed to get cursor: " + std::string(e.what()),
            m_stream_name, m_partition_id
        };
    }
}

}
