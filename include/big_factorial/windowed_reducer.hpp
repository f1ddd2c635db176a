#ifndef BIG_FACTORIAL_WINDOWED_REDUCER_HPP
#define BIG_FACTORIAL_WINDOWED_REDUCER_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <big_factorial/completion_channel.hpp>
#include <big_factorial/config.hpp>
#include <big_factorial/errors.hpp>
#include <big_factorial/numeric_traits.hpp>
#include <big_factorial/progress.hpp>
#include <big_factorial/range_product.hpp>
#include <big_factorial/window_ledger.hpp>
#include <big_factorial/worker_pool.hpp>

namespace big_factorial {

// what a worker hands back when it is done with a window
template <typename T>
struct completion_notice {
    uint64_t window_start;
    unsigned attempt;
    std::optional<T> partial_product; // empty if the worker failed
    std::string failure;
    bool started = false; // sent when the worker picks the window up, before any result
};

struct reduction_stats {
    uint64_t windows_total = 0;
    uint64_t windows_dispatched = 0;
    uint64_t windows_folded = 0;
    uint64_t redispatches = 0;
    uint64_t discarded_notices = 0;
    size_t max_in_flight = 0;
};

// the work a single window stands for; `attempt` starts at 1
template <typename T>
struct range_product_job {
    T operator()(uint64_t from, uint64_t to, unsigned) const {
        return range_product<T>(from, to);
    }
};

// number of windows [1, n] splits into
inline uint64_t count_windows(uint64_t n, uint64_t window_size){
    BIG_FACTORIAL_ASSERT(window_size > 0);
    return n / window_size + (n % window_size != 0 ? 1 : 0);
}

// Multiplies [1, n] together by splitting it into windows of `window_size`
// numbers and keeping at most `concurrency` of them with the workers.
// Results are folded in whatever order they arrive.
//
// A window that fails, or does not report back within `window_timeout` of a
// worker picking it up, is dispatched again, up to `max_redispatches` times.
// A stalled worker is left running and the pool gets a thread for its
// replacement. Past `max_redispatches` we terminate.
template <typename T, typename Job = range_product_job<T>>
class windowed_reducer {

public:

    using notice_type = completion_notice<T>;
    using channel_type = completion_channel<notice_type>;
    using ledger_type = window_ledger<T>;
    using clock = typename ledger_type::clock;

    explicit windowed_reducer(reducer_config config_, Job job_ = Job())
        : config(std::move(config_))
        , job(std::move(job_))
    {}

    T reduce(uint64_t n){

        if(std::optional<std::string> problem = check_config(config)){
            BIG_FACTORIAL_USER_ERR("invalid configuration: " << *problem);
        }

        run_stats = reduction_stats{};
        run_stats.windows_total = count_windows(n, config.window_size);

        ledger_type ledger;

        // shared with the workers, a worker we gave up on may still send to it after we return
        std::shared_ptr<channel_type> channel = std::make_shared<channel_type>();

        worker_pool pool(config.concurrency);

        uint64_t next_start = 1;
        bool all_issued = n < next_start;

        while(!all_issued || !ledger.empty()){

            // hand out new windows

            while(!all_issued && ledger.in_flight() < config.concurrency){

                // `next_start + window_size - 1` may not fit into 64 bits
                uint64_t window_end = n;
                if(n - next_start >= config.window_size){
                    window_end = next_start + config.window_size - 1;
                }

                ledger.issue(next_start, window_end, clock::now() + config.window_timeout);
                dispatch(pool, channel, next_start, window_end, 1);

                run_stats.windows_dispatched += 1;
                run_stats.max_in_flight = std::max(run_stats.max_in_flight, ledger.in_flight());

                if(window_end == n){
                    all_issued = true;
                }else{
                    next_start = window_end + 1;
                }

            }

            // wait for one of them to come back

            std::optional<typename clock::time_point> deadline = ledger.earliest_deadline();
            BIG_FACTORIAL_ASSERT(deadline.has_value());

            std::optional<notice_type> notice = std::nullopt;

            switch(channel->receive_until(*deadline, notice)){

                case receive_status::message:
                    collect(pool, channel, ledger, std::move(*notice));
                    break;

                case receive_status::timeout:
                    for(const auto & late : ledger.expired(clock::now())){
                        BIG_FACTORIAL_WARN("window [" << late.start << ", " << late.end << "] did not report back within " << config.window_timeout.count() << "ms (attempt " << late.attempt << ")");
                        // the stalled worker keeps its thread, the replacement gets a new one
                        pool.add_worker();
                        redispatch(pool, channel, ledger, late.start);
                    }
                    break;

                case receive_status::closed:
                    BIG_FACTORIAL_ERR("completion channel closed with " << ledger.in_flight() << " windows still in flight");

            }

            if(config.verbose){
                print_progress(std::cout, run_stats.windows_folded, run_stats.windows_total, all_issued, pool.busy(), pool.size());
            }

        }

        channel->close();

        return ledger.take_accumulator();

    }

    const reduction_stats & stats() const {
        return run_stats;
    }

    const reducer_config & get_config() const {
        return config;
    }

private:

    void dispatch(worker_pool & pool, const std::shared_ptr<channel_type> & channel, uint64_t start, uint64_t end, unsigned attempt){

        pool.submit(
            [job = this->job, channel, start, end, attempt](){

                channel->send(notice_type{start, attempt, std::nullopt, "", true});

                notice_type notice{start, attempt, std::nullopt, "", false};

                try{
                    notice.partial_product.emplace(job(start, end, attempt));
                }catch(const std::exception & e){
                    notice.failure = e.what();
                }

                channel->send(std::move(notice));

            }
        );

    }

    void redispatch(worker_pool & pool, const std::shared_ptr<channel_type> & channel, ledger_type & ledger, uint64_t start){

        const auto * w = ledger.find(start);
        BIG_FACTORIAL_ASSERT(w != nullptr);

        if(w->attempt > config.max_redispatches){
            BIG_FACTORIAL_ERR("window [" << w->start << ", " << w->end << "] still has no result after " << w->attempt << " attempts, giving up");
        }

        const auto & again = ledger.reissue(start, clock::now() + config.window_timeout);
        dispatch(pool, channel, again.start, again.end, again.attempt);

        run_stats.redispatches += 1;

    }

    void collect(worker_pool & pool, const std::shared_ptr<channel_type> & channel, ledger_type & ledger, notice_type notice){

        if(notice.started){

            // the deadline counts from when a worker actually begins, not from when the job was queued
            const auto * w = ledger.find(notice.window_start);
            if(w != nullptr && w->attempt == notice.attempt){
                ledger.restart_deadline(notice.window_start, clock::now() + config.window_timeout);
            }

            return;

        }

        if(notice.partial_product){

            // the first result for a window wins, whichever attempt it came from
            if(ledger.fold(notice.window_start, std::move(*notice.partial_product))){
                run_stats.windows_folded += 1;
            }else{
                run_stats.discarded_notices += 1;
            }

            return;

        }

        const auto * w = ledger.find(notice.window_start);

        // an attempt we already replaced, or a window that is already done
        if(w == nullptr || w->attempt != notice.attempt){
            run_stats.discarded_notices += 1;
            return;
        }

        BIG_FACTORIAL_WARN("window [" << w->start << ", " << w->end << "] failed on attempt " << w->attempt << ": " << notice.failure);

        redispatch(pool, channel, ledger, notice.window_start);

    }

    reducer_config config;
    Job job;
    reduction_stats run_stats;

};

// factorial of n, computed by `num_threads` workers in windows of WINDOW_SIZE_DEFAULT numbers
template <typename T>
T parallel_factorial(uint64_t n, uint8_t num_threads){

    reducer_config config;
    config.concurrency = num_threads;

    windowed_reducer<T> reducer(config);
    return reducer.reduce(n);

}

template <typename T>
T parallel_factorial(uint64_t n, const reducer_config & config){
    windowed_reducer<T> reducer(config);
    return reducer.reduce(n);
}

}

#endif
