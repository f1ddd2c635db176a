#ifndef BIG_FACTORIAL_WINDOW_LEDGER_HPP
#define BIG_FACTORIAL_WINDOW_LEDGER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <big_factorial/errors.hpp>
#include <big_factorial/numeric_traits.hpp>

namespace big_factorial {

// The windows that are out with the workers, and the product of everything that came back.
//
// Only the orchestrator's loop holds one of these. Workers never get a reference
// to it, so none of this needs locking.
template <typename T>
class window_ledger {

public:

    using clock = std::chrono::steady_clock;

    struct window {
        uint64_t start;
        uint64_t end;
        unsigned attempt;
        clock::time_point deadline;
    };

    void issue(uint64_t start, uint64_t end, clock::time_point deadline){

        BIG_FACTORIAL_ASSERT(start <= end);

        bool inserted = windows.emplace(start, window{start, end, 1, deadline}).second;
        if(!inserted){
            BIG_FACTORIAL_ERR("window starting at " << start << " was issued twice");
        }

    }

    // the window goes out again, results of earlier attempts are still accepted
    const window & reissue(uint64_t start, clock::time_point deadline){

        auto it = windows.find(start);
        if(it == windows.end()){
            BIG_FACTORIAL_ERR("window starting at " << start << " is not in flight and can't be reissued");
        }

        it->second.attempt += 1;
        it->second.deadline = deadline;

        return it->second;

    }

    void restart_deadline(uint64_t start, clock::time_point deadline){

        auto it = windows.find(start);
        if(it == windows.end()){
            BIG_FACTORIAL_ERR("window starting at " << start << " is not in flight, its deadline can't be restarted");
        }

        it->second.deadline = deadline;

    }

    // Multiplies `partial` into the accumulator if the window is still in flight.
    // Returns false (and changes nothing) for windows that were already folded or never issued.
    bool fold(uint64_t start, T partial){

        auto it = windows.find(start);
        if(it == windows.end()){
            return false;
        }

        windows.erase(it);

        product = numeric_traits<T>::multiply(product, partial);

        return true;

    }

    const window * find(uint64_t start) const {

        auto it = windows.find(start);
        if(it == windows.end()){
            return nullptr;
        }

        return &it->second;

    }

    std::vector<window> expired(clock::time_point now) const {

        std::vector<window> late = {};

        for(const auto & [start, w] : windows){
            if(w.deadline <= now){
                late.push_back(w);
            }
        }

        return late;

    }

    std::optional<clock::time_point> earliest_deadline() const {

        std::optional<clock::time_point> earliest = std::nullopt;

        for(const auto & [start, w] : windows){
            if(!earliest || w.deadline < *earliest){
                earliest = w.deadline;
            }
        }

        return earliest;

    }

    size_t in_flight() const {
        return windows.size();
    }

    bool empty() const {
        return windows.empty();
    }

    const T & accumulator() const {
        return product;
    }

    T take_accumulator(){
        T result = std::move(product);
        product = numeric_identity<T>();
        return result;
    }

private:

    std::map<uint64_t, window> windows;
    T product = numeric_identity<T>();

};

}

#endif
