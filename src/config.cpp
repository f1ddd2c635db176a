#include <big_factorial/config.hpp>

using namespace std;

namespace big_factorial {

optional<string> check_config(const reducer_config & config){

    if(config.concurrency <= 0){
        return "the number of threads must be at least 1";
    }

    if(config.concurrency > CONCURRENCY_MAX){
        return "the number of threads must be at most " + to_string(CONCURRENCY_MAX);
    }

    if(config.window_size <= 0){
        return "the window size must be at least 1";
    }

    if(config.window_timeout.count() <= 0){
        return "the window timeout must be a positive number of milliseconds";
    }

    return nullopt;

}

}
