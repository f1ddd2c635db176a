#ifndef BIG_FACTORIAL_WORKER_POOL_HPP
#define BIG_FACTORIAL_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace big_factorial {

// A fixed number of threads running jobs in the order they were submitted.
//
// On destruction jobs that have not started yet are dropped, idle threads are
// joined and threads still busy with a job are detached: a job that never
// returns must not keep the caller waiting. Everything such a thread touches is
// kept alive by `shared_state`, so jobs have to own (or share) what they use.
class worker_pool {

public:

    explicit worker_pool(size_t threads);
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool & operator=(const worker_pool &) = delete;

    void submit(std::function<void()> job);

    // one more thread, for when a job holds on to its thread for longer than it should
    void add_worker();

    size_t size() const;

    // threads currently running a job
    size_t busy() const;

    // jobs submitted but not picked up by a thread yet
    size_t queued() const;

private:

    struct shared_state {
        std::mutex mutex;
        std::condition_variable job_available;
        std::deque<std::function<void()>> jobs;
        std::vector<bool> busy;
        bool stopping = false;
    };

    static void worker_main(std::shared_ptr<shared_state> state, size_t worker_idx);

    std::shared_ptr<shared_state> state;
    std::vector<std::thread> workers;

};

}

#endif
