#ifndef BIG_FACTORIAL_PROGRESS_HPP
#define BIG_FACTORIAL_PROGRESS_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace big_factorial {

void print_progress(std::ostream & os, uint64_t windows_folded, uint64_t windows_total, bool waiting_for_last_threads_to_finish, size_t threads, size_t threads_max);

}

#endif
