#include <big_factorial/worker_pool.hpp>

#include <algorithm>
#include <utility>

#include <big_factorial/errors.hpp>

using namespace std;

namespace big_factorial {

worker_pool::worker_pool(size_t threads)
    : state(make_shared<shared_state>())
{

    BIG_FACTORIAL_ASSERT(threads > 0);

    state->busy.assign(threads, false);

    workers.reserve(threads);

    for(size_t worker_idx = 0; worker_idx < threads; ++worker_idx){
        workers.push_back(
            thread(worker_main, state, worker_idx)
        );
    }

}

void worker_pool::add_worker(){

    size_t worker_idx = 0;

    {
        lock_guard<mutex> lock(state->mutex);
        BIG_FACTORIAL_ASSERT(!state->stopping);
        worker_idx = state->busy.size();
        state->busy.push_back(false);
    }

    workers.push_back(
        thread(worker_main, state, worker_idx)
    );

}

worker_pool::~worker_pool(){

    vector<bool> busy_at_stop;

    {
        lock_guard<mutex> lock(state->mutex);

        state->stopping = true;
        state->jobs.clear();

        // nobody can pick up a new job from here on, so this can't change for the better
        busy_at_stop = state->busy;
    }

    state->job_available.notify_all();

    for(size_t worker_idx = 0; worker_idx < workers.size(); ++worker_idx){

        if(busy_at_stop[worker_idx]){
            workers[worker_idx].detach();
        }else{
            workers[worker_idx].join();
        }

    }

}

void worker_pool::submit(function<void()> job){

    {
        lock_guard<mutex> lock(state->mutex);
        BIG_FACTORIAL_ASSERT(!state->stopping);
        state->jobs.push_back(move(job));
    }

    state->job_available.notify_one();

}

size_t worker_pool::size() const {
    return workers.size();
}

size_t worker_pool::busy() const {
    lock_guard<mutex> lock(state->mutex);
    return count(state->busy.begin(), state->busy.end(), true);
}

size_t worker_pool::queued() const {
    lock_guard<mutex> lock(state->mutex);
    return state->jobs.size();
}

void worker_pool::worker_main(shared_ptr<shared_state> state, size_t worker_idx){

    while(true){

        function<void()> job;

        {
            unique_lock<mutex> lock(state->mutex);

            state->job_available.wait(lock, [&state](){
                return state->stopping || !state->jobs.empty();
            });

            if(state->stopping){
                return;
            }

            job = move(state->jobs.front());
            state->jobs.pop_front();

            state->busy[worker_idx] = true;
        }

        job();

        {
            lock_guard<mutex> lock(state->mutex);
            state->busy[worker_idx] = false;
        }

    }

}

}
