#ifndef DIASPORA_SHARD_DRIVER_TESTS_FAKE_STREAM_CLIENT_HPP
#define DIASPORA_SHARD_DRIVER_TESTS_FAKE_STREAM_CLIENT_HPP

#include <shard/Errors.hpp>
#include <shard/StreamClient.hpp>
#include <gmock/gmock.h>

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace shard {
namespace test {

class MockStreamClient : public StreamClient {
    public:
    MOCK_METHOD(PartitionPage, listPartitions,
                (const std::string&, const std::optional<std::string>&), (override));
    MOCK_METHOD(std::optional<std::string>, getCursor, (const CursorRequest&), (override));
    MOCK_METHOD(FetchResult, fetchRecords, (const std::string&), (override));
};

/**
 * In-memory log service. Cursor tokens are single use: fetching with a token
 * that was already consumed fails as a transport error would.
 */
class FakeStreamClient : public StreamClient {

    public:

    using Clock = std::chrono::steady_clock;

    void addPartition(const std::string& id, const std::vector<std::string>& sequence_numbers = {}) {
        std::unique_lock lock{m_mutex};
        m_order.push_back(id);
        auto& partition = m_partitions[id];
        for(const auto& seq : sequence_numbers) appendLocked(partition, seq);
    }

    void append(const std::string& id, const std::string& sequence_number) {
        std::unique_lock lock{m_mutex};
        appendLocked(m_partitions.at(id), sequence_number);
    }

    void closePartition(const std::string& id) {
        std::unique_lock lock{m_mutex};
        m_partitions.at(id).closed = true;
    }

    void setMaxRecordsPerFetch(size_t n) {
        std::unique_lock lock{m_mutex};
        m_max_records_per_fetch = n;
    }

    void setFetchDelay(const std::string& id, std::chrono::milliseconds delay) {
        std::unique_lock lock{m_mutex};
        m_partitions.at(id).fetch_delay = delay;
    }

    // Every token issued so far fails with ExpiredCursorError.
    void expireOutstandingCursors() {
        std::unique_lock lock{m_mutex};
        for(const auto& [token, cursor] : m_cursors) m_expired.insert(token);
    }

    void expireAllCursors(bool value) {
        std::unique_lock lock{m_mutex};
        m_expire_everything = value;
    }

    void throttleNextFetches(size_t n) {
        std::unique_lock lock{m_mutex};
        m_throttled_fetches = n;
    }

    void failNextFetch(std::string message) {
        std::unique_lock lock{m_mutex};
        m_failure = std::move(message);
    }

    std::vector<CursorRequest> cursorRequests() const {
        std::unique_lock lock{m_mutex};
        return m_cursor_requests;
    }

    std::vector<Clock::time_point> fetchTimes(const std::string& id) const {
        std::unique_lock lock{m_mutex};
        auto it = m_fetch_times.find(id);
        if(it == m_fetch_times.end()) return {};
        return it->second;
    }

    size_t listCalls() const {
        std::unique_lock lock{m_mutex};
        return m_list_calls;
    }

    PartitionPage listPartitions(const std::string&,
                                 const std::optional<std::string>&) override {
        std::unique_lock lock{m_mutex};
        ++m_list_calls;
        PartitionPage page;
        for(const auto& id : m_order) page.partitions.push_back(Partition{id});
        return page;
    }

    std::optional<std::string> getCursor(const CursorRequest& request) override {
        std::unique_lock lock{m_mutex};
        m_cursor_requests.push_back(request);
        auto it = m_partitions.find(request.partition_id);
        if(it == m_partitions.end())
            throw std::runtime_error("unknown partition " + request.partition_id);
        const auto& records = it->second.records;

        size_t index = 0;
        switch(request.mode) {
            case CursorMode::TrimHorizon:
                break;
            case CursorMode::AfterSequenceNumber:
                while(index < records.size()
                   && std::stoull(records[index].sequence_number) <= std::stoull(request.sequence_number))
                    ++index;
                break;
            case CursorMode::AtTimestamp:
                while(index < records.size()
                   && records[index].arrival_timestamp < request.timestamp)
                    ++index;
                break;
        }
        if(it->second.closed && index >= records.size()) return std::nullopt;
        return issue(request.partition_id, index);
    }

    FetchResult fetchRecords(const std::string& token) override {
        std::chrono::milliseconds delay{0};
        {
            std::unique_lock lock{m_mutex};
            auto it = m_cursors.find(token);
            if(it != m_cursors.end()) delay = m_partitions.at(it->second.partition_id).fetch_delay;
        }
        if(delay.count() > 0) std::this_thread::sleep_for(delay);

        std::unique_lock lock{m_mutex};
        auto it = m_cursors.find(token);
        if(it == m_cursors.end())
            throw std::runtime_error("unknown or already used cursor token " + token);
        auto cursor = it->second;
        m_fetch_times[cursor.partition_id].push_back(Clock::now());

        if(m_failure) {
            auto message = *m_failure;
            m_failure.reset();
            throw std::runtime_error(message);
        }
        if(m_throttled_fetches > 0) {
            --m_throttled_fetches;
            throw ThroughputExceededError{"rate exceeded"};
        }
        if(m_expire_everything || m_expired.count(token)) {
            throw ExpiredCursorError{"cursor expired"};
        }
        m_cursors.erase(it);

        auto& partition = m_partitions.at(cursor.partition_id);
        FetchResult result;
        size_t index = cursor.index;
        while(index < partition.records.size() && result.records.size() < m_max_records_per_fetch) {
            result.records.push_back(partition.records[index]);
            ++index;
        }
        if(!(partition.closed && index >= partition.records.size()))
            result.next_token = issue(cursor.partition_id, index);
        return result;
    }

    private:

    struct PartitionData {
        std::vector<Record>       records;
        bool                      closed = false;
        std::chrono::milliseconds fetch_delay{0};
    };

    struct Cursor {
        std::string partition_id;
        size_t      index;
    };

    mutable std::mutex                                           m_mutex;
    std::vector<std::string>                                     m_order;
    std::unordered_map<std::string, PartitionData>               m_partitions;
    std::unordered_map<std::string, Cursor>                      m_cursors;
    std::set<std::string>                                        m_expired;
    std::vector<CursorRequest>                                   m_cursor_requests;
    std::map<std::string, std::vector<Clock::time_point>>        m_fetch_times;
    std::optional<std::string>                                   m_failure;
    size_t                                                       m_max_records_per_fetch = 100;
    size_t                                                       m_throttled_fetches = 0;
    size_t                                                       m_token_counter = 0;
    size_t                                                       m_list_calls = 0;
    bool                                                         m_expire_everything = false;

    static void appendLocked(PartitionData& partition, const std::string& seq) {
        Record record;
        record.sequence_number = seq;
        record.partition_key = "key-" + seq;
        record.payload.assign(seq.begin(), seq.end());
        record.arrival_timestamp = 1000 + static_cast<int64_t>(partition.records.size());
        partition.records.push_back(std::move(record));
    }

    std::string issue(const std::string& partition_id, size_t index) {
        auto token = "tok-" + std::to_string(++m_token_counter);
        m_cursors.emplace(token, Cursor{partition_id, index});
        return token;
    }
};

}
}

#endif
