#include "shard/MultiPartitionReader.hpp"
#include "shard/Errors.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace shard {

MultiPartitionReader::MultiPartitionReader(
    std::shared_ptr<StreamClient> client,
    ShardConfig config,
    std::vector<Split> splits,
    const std::vector<CheckpointState>& checkpoints)
: m_client(std::move(client))
, m_config(std::move(config))
{
    if(splits.empty()) {
        throw ConfigurationError{
            "MultiPartitionReader requires at least one split", m_config.stream_name
        };
    }

    std::unordered_map<std::string, const CheckpointState*> restored;
    for(const auto& checkpoint : checkpoints)
        restored[checkpoint.partition_id] = &checkpoint;

    std::unordered_set<std::string> seen;
    m_readers.reserve(splits.size());
    for(auto& split : splits) {
        if(!seen.insert(split.partition_id).second) {
            throw ConfigurationError{
                "Partition assigned twice", m_config.stream_name, split.partition_id
            };
        }
        auto it = restored.find(split.partition_id);
        if(it != restored.end()) {
            m_readers.push_back(std::make_unique<PartitionReader>(
                m_client, m_config, *it->second, split.end_position));
        } else {
            m_readers.push_back(std::make_unique<PartitionReader>(
                m_client, m_config, std::move(split)));
        }
        auto state = m_readers.back()->snapshot();
        if(!state.sequence_number.empty())
            m_delivered[state.partition_id] = std::move(state);
    }
    m_running_partitions = m_readers.size();

    size_t num_threads = m_config.num_threads ? m_config.num_threads : m_readers.size();
    m_thread_pool = std::make_unique<ShardThreadPool>(diaspora::ThreadCount{num_threads});

    logger()->debug("reading {} partition(s) of stream {} with {} thread(s)",
                  m_readers.size(), m_config.stream_name, num_threads);

    for(size_t i = 0; i < m_readers.size(); ++i)
        schedule(i, std::chrono::milliseconds{0});
}

MultiPartitionReader::~MultiPartitionReader() {
    stop();
    m_thread_pool.reset();
}

void MultiPartitionReader::schedule(size_t index, std::chrono::milliseconds delay) {
    if(m_cancel.cancelled()) return;
    auto work = [this, index]() { runPartition(index); };
    if(delay.count() <= 0)
        m_thread_pool->pushWork(std::move(work));
    else
        m_thread_pool->pushWorkAfter(delay, std::move(work));
}

void MultiPartitionReader::publishToken(const PartitionReader& reader) {
    std::unique_lock lock{m_tokens_mutex};
    const auto& token = reader.cursorToken();
    if(token)
        m_cursor_tokens[reader.partitionId()] = *token;
    else
        m_cursor_tokens.erase(reader.partitionId());
}

void MultiPartitionReader::finishPartition() {
    {
        std::unique_lock lock{m_queue_mutex};
        m_running_partitions -= 1;
    }
    m_queue_cv.notify_all();
}

void MultiPartitionReader::runPartition(size_t index) {
    if(m_cancel.cancelled()) return;
    auto& reader = *m_readers[index];

    {
        std::unique_lock lock{m_queue_mutex};
        if(m_queue.size() >= m_config.max_buffered_batches) {
            lock.unlock();
            schedule(index, std::max(m_config.backoff, std::chrono::milliseconds{10}));
            return;
        }
    }

    Batch batch;
    try {
        batch = reader.poll();
    } catch (const ThroughputExceededError&) {
        publishToken(reader);
        schedule(index, m_config.throttle_backoff);
        return;
    } catch (const std::exception&) {
        publishToken(reader);
        {
            std::unique_lock lock{m_queue_mutex};
            m_queue.push_back(Output{std::nullopt, std::current_exception()});
            m_running_partitions -= 1;
        }
        m_queue_cv.notify_all();
        return;
    }
    publishToken(reader);

    if(!batch.records.empty()) {
        {
            std::unique_lock lock{m_queue_mutex};
            m_queue.push_back(Output{std::move(batch), nullptr});
        }
        m_queue_cv.notify_all();
    }

    if(reader.terminated()) {
        finishPartition();
        return;
    }

    std::chrono::milliseconds delay{0};
    if(reader.state() == PartitionReader::State::Backoff) {
        auto remaining = reader.backoffDeadline() - PartitionReader::Clock::now();
        delay = std::chrono::ceil<std::chrono::milliseconds>(remaining);
    }
    schedule(index, delay);
}

std::optional<Batch> MultiPartitionReader::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock{m_queue_mutex};
    m_queue_cv.wait_for(lock, timeout, [this] {
        return !m_queue.empty() || m_running_partitions == 0 || m_cancel.cancelled();
    });
    if(m_cancel.cancelled() || m_queue.empty()) return std::nullopt;

    auto output = std::move(m_queue.front());
    m_queue.pop_front();
    if(output.error) std::rethrow_exception(output.error);

    m_delivered[output.batch->partition_id] = output.batch->checkpoint;
    return std::move(output.batch);
}

void MultiPartitionReader::stop() {
    m_cancel.cancel();
    {
        std::unique_lock lock{m_queue_mutex};
    }
    m_queue_cv.notify_all();
}

bool MultiPartitionReader::finished() const {
    if(m_cancel.cancelled()) return true;
    std::unique_lock lock{m_queue_mutex};
    return m_running_partitions == 0 && m_queue.empty();
}

std::vector<CheckpointState> MultiPartitionReader::snapshot() const {
    std::vector<CheckpointState> result;
    {
        std::unique_lock lock{m_queue_mutex};
        result.reserve(m_delivered.size());
        for(const auto& [id, state] : m_delivered) result.push_back(state);
    }
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.partition_id < rhs.partition_id;
    });
    return result;
}

std::optional<std::string> MultiPartitionReader::cursorToken(const std::string& partition_id) const {
    std::unique_lock lock{m_tokens_mutex};
    auto it = m_cursor_tokens.find(partition_id);
    if(it == m_cursor_tokens.end()) return std::nullopt;
    return it->second;
}

}
