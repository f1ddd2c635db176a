#ifndef BIG_FACTORIAL_COMPLETION_CHANNEL_HPP
#define BIG_FACTORIAL_COMPLETION_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace big_factorial {

enum class receive_status {
    message,
    timeout,
    closed,
};

// Many workers send, exactly one orchestrator receives.
// Messages sent after `close()` are dropped: by then nobody is listening.
template <typename M>
class completion_channel {

public:

    completion_channel() = default;
    completion_channel(const completion_channel &) = delete;
    completion_channel & operator=(const completion_channel &) = delete;

    void send(M message){

        {
            std::lock_guard<std::mutex> lock(mutex);

            if(closed){
                return;
            }

            messages.push_back(std::move(message));
        }

        message_available.notify_one();

    }

    // waits until there is a message, the deadline passes, or the channel is closed and drained
    template <typename Clock, typename Duration>
    receive_status receive_until(const std::chrono::time_point<Clock, Duration> & deadline, std::optional<M> & message){

        std::unique_lock<std::mutex> lock(mutex);

        bool ready = message_available.wait_until(lock, deadline, [this](){
            return !messages.empty() || closed;
        });

        if(!ready){
            return receive_status::timeout;
        }

        if(messages.empty()){
            return receive_status::closed;
        }

        message.emplace(std::move(messages.front()));
        messages.pop_front();

        return receive_status::message;

    }

    template <typename Rep, typename Period>
    receive_status receive_for(const std::chrono::duration<Rep, Period> & timeout, std::optional<M> & message){
        return receive_until(std::chrono::steady_clock::now() + timeout, message);
    }

    void close(){

        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }

        message_available.notify_all();

    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

private:

    mutable std::mutex mutex;
    std::condition_variable message_available;
    std::deque<M> messages;
    bool closed = false;

};

}

#endif
