#ifndef DIASPORA_SHARD_DRIVER_THREAD_POOL_HPP
#define DIASPORA_SHARD_DRIVER_THREAD_POOL_HPP

#include <diaspora/Exception.hpp>
#include <diaspora/ThreadPool.hpp>

#include <queue>
#include <vector>
#include <thread>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <limits>

namespace shard {

/**
 * Priority thread pool with support for work that becomes runnable after a
 * delay. Delayed work waits in a timer queue, not on a worker thread.
 */
class ShardThreadPool final : public diaspora::ThreadPoolInterface {

    using Clock = std::chrono::steady_clock;

    struct Work {

        uint64_t              priority;
        uint64_t              seq;
        std::function<void()> func;

        Work(uint64_t p, uint64_t s, std::function<void()> f)
        : priority(p)
        , seq(s)
        , func{std::move(f)} {}

        // FIFO among equal priorities
        friend bool operator<(const Work& lhs, const Work& rhs) {
            if(lhs.priority != rhs.priority) return lhs.priority < rhs.priority;
            return lhs.seq > rhs.seq;
        }
    };

    struct DelayedWork {

        Clock::time_point     deadline;
        uint64_t              priority;
        std::function<void()> func;

        DelayedWork(Clock::time_point d, uint64_t p, std::function<void()> f)
        : deadline(d)
        , priority(p)
        , func{std::move(f)} {}

        // earliest deadline on top
        friend bool operator<(const DelayedWork& lhs, const DelayedWork& rhs) {
            return lhs.deadline > rhs.deadline;
        }
    };

    std::vector<std::thread>         m_threads;
    std::priority_queue<Work>        m_queue;
    std::priority_queue<DelayedWork> m_delayed;
    mutable std::mutex               m_queue_mtx;
    std::condition_variable          m_queue_cv;
    std::atomic<bool>                m_must_stop = false;
    uint64_t                         m_next_seq = 0;

    // Must be called with m_queue_mtx held.
    void promoteDueWork() {
        auto now = Clock::now();
        while(!m_delayed.empty() && m_delayed.top().deadline <= now) {
            auto& top = m_delayed.top();
            m_queue.emplace(top.priority, m_next_seq++, top.func);
            m_delayed.pop();
        }
    }

    public:

    ShardThreadPool(diaspora::ThreadCount count) {
        m_threads.reserve(count.count);
        for(size_t i = 0; i < count.count; ++i) {
            m_threads.emplace_back([this]() {
                while(!m_must_stop) {
                    std::unique_lock<std::mutex> lock{m_queue_mtx};
                    promoteDueWork();
                    if(m_queue.empty()) {
                        if(m_must_stop) break;
                        if(m_delayed.empty())
                            m_queue_cv.wait(lock);
                        else
                            m_queue_cv.wait_until(lock, m_delayed.top().deadline);
                        continue;
                    }
                    auto work = m_queue.top();
                    m_queue.pop();
                    lock.unlock();
                    work.func();
                }
            });
        }
    }

    ~ShardThreadPool() {
        {
            std::unique_lock<std::mutex> lock{m_queue_mtx};
            m_must_stop = true;
        }
        m_queue_cv.notify_all();
        for(auto& th : m_threads) th.join();
    }

    diaspora::ThreadCount threadCount() const override {
        return diaspora::ThreadCount{m_threads.size()};
    }

    void pushWork(std::function<void()> func,
                  uint64_t priority = std::numeric_limits<uint64_t>::max()) override {
        if(m_threads.size() == 0) {
            func();
        } else {
            {
                std::unique_lock<std::mutex> lock{m_queue_mtx};
                m_queue.emplace(priority, m_next_seq++, std::move(func));
            }
            m_queue_cv.notify_one();
        }
    }

    /**
     * Schedules func to run once the delay has elapsed. Requires at least
     * one worker thread, since an inline pool would have to sleep.
     */
    void pushWorkAfter(std::chrono::milliseconds delay,
                       std::function<void()> func,
                       uint64_t priority = std::numeric_limits<uint64_t>::max()) {
        if(m_threads.size() == 0)
            throw diaspora::Exception{"Delayed work requires a ShardThreadPool with at least one thread"};
        {
            std::unique_lock<std::mutex> lock{m_queue_mtx};
            m_delayed.emplace(Clock::now() + delay, priority, std::move(func));
        }
        // wake everyone so the sleeper with the longest timeout re-evaluates
        m_queue_cv.notify_all();
    }

    size_t size() const override {
        std::unique_lock<std::mutex> lock{m_queue_mtx};
        return m_queue.size() + m_delayed.size();
    }
};

}

#endif
