#include "shard/PartitionReader.hpp"
#include "shard/Errors.hpp"
#include "Logger.hpp"

namespace shard {

const char* toString(PartitionReader::State state) {
    switch(state) {
        case PartitionReader::State::Uninitialized: return "uninitialized";
        case PartitionReader::State::Ready:         return "ready";
        case PartitionReader::State::Fetching:      return "fetching";
        case PartitionReader::State::Backoff:       return "backoff";
        case PartitionReader::State::Stopped:       return "stopped";
        case PartitionReader::State::Failed:        return "failed";
    }
    return "unknown";
}

PartitionReader::PartitionReader(
    std::shared_ptr<StreamClient> client,
    ShardConfig config,
    Split split)
: m_client(std::move(client))
, m_config(std::move(config))
, m_split(std::move(split))
, m_cursor(m_client, m_config.stream_name, m_split.partition_id)
{
    PartitionCursor::checkStartPosition(
        m_split.start_position, m_config.stream_name, m_split.partition_id);
    // Starting after a sequence number is equivalent to having consumed it.
    if(m_split.start_position.isSequenceNumber())
        m_latest_sequence_number = m_split.start_position.sequence_number;
}

static Split splitFromCheckpoint(const CheckpointState& checkpoint,
                                 const std::string& stream_name,
                                 Position end_position) {
    if(checkpoint.partition_id.empty())
        throw MalformedCheckpointError{"Checkpoint has an empty partition_id", stream_name};
    if(checkpoint.stream_name != stream_name)
        throw MalformedCheckpointError{
            "Checkpoint belongs to stream \"" + checkpoint.stream_name + "\"",
            stream_name, checkpoint.partition_id
        };
    Split split;
    split.partition_id   = checkpoint.partition_id;
    split.start_position = checkpoint.sequence_number.empty()
                         ? Position::Earliest()
                         : Position::AtSequenceNumber(checkpoint.sequence_number);
    split.end_position   = std::move(end_position);
    return split;
}

PartitionReader::PartitionReader(
    std::shared_ptr<StreamClient> client,
    ShardConfig config,
    const CheckpointState& checkpoint,
    Position end_position)
: m_client(std::move(client))
, m_config(std::move(config))
, m_split(splitFromCheckpoint(checkpoint, m_config.stream_name, std::move(end_position)))
, m_cursor(m_client, m_config.stream_name, m_split.partition_id)
, m_latest_sequence_number(checkpoint.sequence_number)
{}

CheckpointState PartitionReader::snapshot() const {
    return CheckpointState{m_config.stream_name, m_split.partition_id, m_latest_sequence_number};
}

void PartitionReader::renewCursor() {
    if(m_latest_sequence_number.empty())
        m_cursor.acquire(m_split.start_position);
    else
        m_cursor.renew(m_latest_sequence_number);
}

void PartitionReader::initialize() {
    renewCursor();
    if(!m_cursor.token()) {
        stop("no cursor available");
        return;
    }
    m_state = State::Ready;
}

FetchResult PartitionReader::fetchWithRenewal() {
    size_t renewals = 0;
    while(true) {
        try {
            return m_client->fetchRecords(*m_cursor.token());
        } catch (const ExpiredCursorError&) {
            if(renewals == m_config.max_cursor_renewals) {
                throw ExpiredCursorError{
                    "Cursor still expired after " + std::to_string(renewals) + " renewal(s)",
                    m_config.stream_name, m_split.partition_id
                };
            }
            ++renewals;
            renewCursor();
            if(!m_cursor.token()) return FetchResult{};
        }
    }
}

bool PartitionReader::reachedEnd(const std::string& sequence_number) const {
    const auto& end = m_split.end_position;
    return end.isSequenceNumber()
        && compareSequenceNumbers(sequence_number, end.sequence_number) >= 0;
}

void PartitionReader::stop(const char* reason) {
    m_state = State::Stopped;
    logger()->info("partition {}/{} stopped ({}), last sequence number \"{}\"",
                 m_config.stream_name, m_split.partition_id, reason, m_latest_sequence_number);
}

Batch PartitionReader::poll() {
    if(terminated()) {
        throw Error{
            std::string{"Partition reader is "} + toString(m_state),
            m_config.stream_name, m_split.partition_id
        };
    }

    Batch batch;
    batch.partition_id = m_split.partition_id;

    if(m_state == State::Backoff) {
        if(Clock::now() < m_backoff_until) {
            batch.checkpoint = snapshot();
            return batch;
        }
        m_state = State::Ready;
    }

    FetchResult result;
    try {
        if(m_state == State::Uninitialized) {
            initialize();
            if(terminated()) {
                batch.checkpoint = snapshot();
                return batch;
            }
        }
        m_state = State::Fetching;
        result = fetchWithRenewal();
    } catch (const ThroughputExceededError& e) {
        m_state = m_cursor.token() ? State::Ready : State::Uninitialized;
        logger()->warn("throughput exceeded on {}/{}: {}",
                     m_config.stream_name, m_split.partition_id, e.what());
        throw;
    } catch (const Error& e) {
        m_state = State::Failed;
        logger()->error("partition {}/{} failed: {}",
                      m_config.stream_name, m_split.partition_id, e.what());
        throw;
    } catch (const std::exception& e) {
        m_state = State::Failed;
        logger()->error("partition {}/{} failed: {}",
                      m_config.stream_name, m_split.partition_id, e.what());
        throw TransportError{
            "Failed to fetch records: " + std::string(e.what()),
            m_config.stream_name, m_split.partition_id
        };
    }

    m_cursor.advance(std::move(result.next_token));
    const bool empty_fetch = result.records.empty();

    for(auto& record : result.records) {
        if(!m_latest_sequence_number.empty()
        && compareSequenceNumbers(record.sequence_number, m_latest_sequence_number) <= 0) {
            logger()->warn("dropping record {} from {}/{}, not after {}",
                         record.sequence_number, m_config.stream_name,
                         m_split.partition_id, m_latest_sequence_number);
            continue;
        }
        if(reachedEnd(record.sequence_number)) {
            stop("reached end position");
            break;
        }
        m_latest_sequence_number = record.sequence_number;
        batch.records.push_back(std::move(record));
    }
    batch.checkpoint = snapshot();

    if(m_state == State::Stopped) return batch;

    if(!m_cursor.token()) {
        stop("partition closed");
        return batch;
    }

    if(empty_fetch) {
        m_state = State::Backoff;
        m_backoff_until = Clock::now() + m_config.backoff;
        return batch;
    }

    m_state = State::Ready;
    return batch;
}

std::optional<Batch> PartitionReader::next(CancellationToken& cancel) {
    while(!terminated()) {
        if(cancel.cancelled()) return std::nullopt;
        if(m_state == State::Backoff) {
            auto remaining = m_backoff_until - Clock::now();
            if(remaining > Clock::duration::zero() && cancel.waitFor(remaining))
                return std::nullopt;
        }
        auto batch = poll();
        if(!batch.records.empty()) return batch;
    }
    return std::nullopt;
}

}
