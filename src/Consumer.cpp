#include "shard/Consumer.hpp"
#include "shard/Driver.hpp"
#include "shard/Event.hpp"
#include "shard/TopicHandle.hpp"
#include "FutureState.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstring>
#include <algorithm>

namespace shard {

ShardConsumer::ShardConsumer(
        std::string name,
        diaspora::BatchSize batch_size,
        diaspora::MaxNumBatches max_num_batches,
        std::shared_ptr<ShardThreadPool> thread_pool,
        std::shared_ptr<ShardTopicHandle> topic,
        diaspora::DataAllocator data_allocator,
        diaspora::DataSelector data_selector,
        std::vector<Split> splits,
        const std::vector<CheckpointState>& checkpoints)
: m_name{std::move(name)}
, m_batch_size(batch_size)
, m_max_num_batches(max_num_batches)
, m_thread_pool(std::move(thread_pool))
, m_topic(std::move(topic))
, m_data_allocator{std::move(data_allocator)}
, m_data_selector{std::move(data_selector)}
, m_checkpoints{std::make_shared<CheckpointTable>()}
, m_reader{std::make_unique<MultiPartitionReader>(
        m_topic->client(), m_topic->config(), std::move(splits), checkpoints)}
{
    for(const auto& checkpoint : checkpoints) {
        if(!checkpoint.sequence_number.empty()) m_checkpoints->commit(checkpoint);
    }
}

ShardConsumer::~ShardConsumer() {
    m_reader->stop();
    std::unique_lock lock{m_tasks->mutex};
    m_tasks->alive = false;
    m_tasks->cv.wait(lock, [this] { return m_tasks->running == 0; });
}

std::shared_ptr<diaspora::TopicHandleInterface> ShardConsumer::topic() const {
      return m_topic;
}

void ShardConsumer::unsubscribe() {
    m_reader->stop();
}

bool ShardConsumer::finished() const {
    std::unique_lock lock{m_pending_mutex};
    return m_pending.empty() && !m_error && m_reader->finished();
}

void ShardConsumer::process(
        diaspora::EventProcessor processor,
        int timeout_ms,
        diaspora::NumEvents maxEvents,
        std::shared_ptr<diaspora::ThreadPoolInterface> threadPool) {
    if(!threadPool) threadPool = m_topic->driver()->defaultThreadPool();
    size_t                  pending_events = 0;
    std::mutex              pending_mutex;
    std::condition_variable pending_cv;
    std::exception_ptr      error;
    try {
        size_t processed = 0;
        while(processed < maxEvents.value) {
            auto event = pull().wait(timeout_ms);
            if(!event) {
                if(finished()) break;
                continue;
            }
            ++processed;
            {
                std::unique_lock lock{pending_mutex};
                pending_events += 1;
            }
            threadPool->pushWork([&, event=std::move(*event)]() {
                    processor(event);
                    std::unique_lock lock{pending_mutex};
                    pending_events -= 1;
                    if(pending_events == 0)
                    pending_cv.notify_all();
                    });
        }
    } catch(const diaspora::StopEventProcessor&) {
    } catch(const diaspora::Exception&) {
        error = std::current_exception();
    }
    {
        std::unique_lock lock{pending_mutex};
        while(pending_events) pending_cv.wait(lock);
    }
    if(error) std::rethrow_exception(error);
}

static void copyPayload(const std::vector<char>& payload,
                        const diaspora::DataDescriptor& descriptor,
                        diaspora::DataView& data_view) {
    auto desc_segments = descriptor.flatten();
    auto view_segments = data_view.segments();

    size_t view_seg_idx = 0;
    size_t view_seg_offset = 0;

    for (const auto& desc_seg : desc_segments) {
        if (desc_seg.offset + desc_seg.size > payload.size()) {
            throw diaspora::Exception{
                "Requested segment [" + std::to_string(desc_seg.offset) + ", " +
                std::to_string(desc_seg.offset + desc_seg.size) + ") exceeds payload size " +
                std::to_string(payload.size())
            };
        }

        size_t src_offset = desc_seg.offset;
        size_t remaining = desc_seg.size;

        while (remaining > 0) {
            if (view_seg_idx >= view_segments.size()) {
                throw diaspora::Exception{
                    "DataView has insufficient capacity for descriptor segments"
                };
            }

            auto& view_seg = view_segments[view_seg_idx];
            size_t available = view_seg.size - view_seg_offset;
            size_t chunk = std::min(remaining, available);

            std::memcpy(static_cast<char*>(const_cast<void*>(view_seg.ptr)) + view_seg_offset,
                        payload.data() + src_offset, chunk);

            remaining -= chunk;
            src_offset += chunk;
            view_seg_offset += chunk;

            if (view_seg_offset >= view_seg.size) {
                view_seg_idx++;
                view_seg_offset = 0;
            }
        }
    }
}

diaspora::Event ShardConsumer::makeEvent(const PendingRecord& pending, diaspora::EventID id) {
    const auto& record = pending.record;

    nlohmann::json json = {
        {"stream_name", m_topic->name()},
        {"partition_id", pending.partition_id},
        {"sequence_number", record.sequence_number},
        {"partition_key", record.partition_key},
        {"arrival_timestamp", record.arrival_timestamp}
    };
    diaspora::Metadata metadata{json.dump()};

    diaspora::DataDescriptor full_descriptor("", record.payload.size());
    diaspora::DataDescriptor selected_descriptor = full_descriptor;
    if (m_data_selector) {
        selected_descriptor = m_data_selector(metadata, full_descriptor);
    }

    diaspora::DataView allocated_view;
    if (m_data_allocator) {
        allocated_view = m_data_allocator(metadata, selected_descriptor);
        copyPayload(record.payload, selected_descriptor, allocated_view);
    }

    CheckpointState checkpoint{m_topic->name(), pending.partition_id, record.sequence_number};

    return diaspora::Event(std::make_shared<ShardEvent>(
        std::move(metadata),
        allocated_view,
        m_topic->partitionInfo(pending.partition_id),
        id,
        std::move(checkpoint),
        m_checkpoints
    ));
}

void ShardConsumer::deliverNext(FutureState<std::optional<diaspora::Event>>& state) {
    std::unique_lock lock{m_pending_mutex};
    if (m_pending.empty() && !m_error) {
        try {
            auto batch = m_reader->next(m_topic->config().backoff);
            if (batch) {
                for (auto& record : batch->records) {
                    m_pending.push_back(PendingRecord{std::move(record), batch->partition_id});
                }
            }
        } catch (const diaspora::Exception&) {
            m_error = std::current_exception();
        }
    }

    if (m_pending.empty()) {
        if (!m_error) {
            state.offer(std::optional<diaspora::Event>{});
            return;
        }
        // kept until a waiter receives it
        try {
            std::rethrow_exception(m_error);
        } catch (const diaspora::Exception& ex) {
            logger()->error("consumer {} failed to pull: {}", m_name, ex.what());
            if (state.offer(ex)) m_error = nullptr;
        }
        return;
    }

    const auto& front = m_pending.front();
    auto& next_id = m_next_event_ids[front.partition_id];
    if (state.offer(std::optional<diaspora::Event>{makeEvent(front, next_id)})) {
        ++next_id;
        m_pending.pop_front();
    }
}

diaspora::Future<std::optional<diaspora::Event>> ShardConsumer::pull() {
    auto state = std::make_shared<FutureState<std::optional<diaspora::Event>>>();
    auto tasks = m_tasks;

    m_thread_pool->pushWork([this, state, tasks]() {
        {
            std::unique_lock lock{tasks->mutex};
            if (!tasks->alive) {
                state->offer(std::optional<diaspora::Event>{});
                return;
            }
            tasks->running += 1;
        }
        try {
            deliverNext(*state);
        } catch (const diaspora::Exception& ex) {
            logger()->error("consumer {} failed to pull: {}", m_name, ex.what());
            state->offer(ex);
        }
        {
            std::unique_lock lock{tasks->mutex};
            tasks->running -= 1;
        }
        tasks->cv.notify_all();
    });

    return {
        [state](int timeout_ms) { return state->wait(timeout_ms); },
        [state] { return state->test(); }
    };
}

}
