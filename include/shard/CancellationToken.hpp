#ifndef DIASPORA_SHARD_DRIVER_CANCELLATION_TOKEN_HPP
#define DIASPORA_SHARD_DRIVER_CANCELLATION_TOKEN_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace shard {

/**
 * Cooperative stop signal. waitFor() returns early once cancel() is called.
 */
class CancellationToken {

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    bool                    m_cancelled = false;

    public:

    void cancel() {
        {
            std::unique_lock lock{m_mutex};
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool cancelled() const {
        std::unique_lock lock{m_mutex};
        return m_cancelled;
    }

    /**
     * @return true if cancelled before the duration elapsed.
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock lock{m_mutex};
        return m_cv.wait_for(lock, duration, [this] { return m_cancelled; });
    }
};

}

#endif
