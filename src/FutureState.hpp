#ifndef DIASPORA_SHARD_DRIVER_FUTURE_STATE_H
#define DIASPORA_SHARD_DRIVER_FUTURE_STATE_H

#include <diaspora/Exception.hpp>
#include <mutex>
#include <condition_variable>
#include <variant>

namespace shard {

template<typename T>
struct FutureState {

    std::mutex                           mutex;
    std::condition_variable              cv;
    std::variant<T, diaspora::Exception> value;
    bool                                 is_set = false;
    bool                                 abandoned = false;

    template<typename U>
    void set(U u) {
        {
            std::unique_lock lock{mutex};
            if(is_set) throw diaspora::Exception{"Promise already set"};
            value = std::move(u);
            is_set = true;
        }
        cv.notify_all();
    }

    // Like set(), but refuses the value if the waiter already gave up.
    template<typename U>
    bool offer(U u) {
        {
            std::unique_lock lock{mutex};
            if(abandoned) return false;
            if(is_set) throw diaspora::Exception{"Promise already set"};
            value = std::move(u);
            is_set = true;
        }
        cv.notify_all();
        return true;
    }

    // A timeout abandons the state and returns a default-constructed T.
    T wait(int timeout_ms) {
        std::unique_lock lock{mutex};
        if(timeout_ms > 0)
            cv.wait_for(lock, std::chrono::milliseconds{timeout_ms}, [this] { return is_set; });
        else
            cv.wait(lock, [this] { return is_set; });
        if(!is_set) {
            abandoned = true;
            return T{};
        }
        if(std::holds_alternative<T>(value))
            return std::get<T>(value);
        else
            throw std::get<diaspora::Exception>(value);
    }

    bool test() {
        std::unique_lock lock{mutex};
        return is_set;
    }
};

}

#endif
