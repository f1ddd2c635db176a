#include <big_factorial/progress.hpp>

#include <iomanip>
#include <ios>

using namespace std;

namespace big_factorial {

void print_progress(ostream & os, uint64_t windows_folded, uint64_t windows_total, bool waiting_for_last_threads_to_finish, size_t threads, size_t threads_max){

    float folded_percent = 100.0f;
    if(windows_total > 0){
        folded_percent = 100.0f * static_cast<float>(windows_folded) / static_cast<float>(windows_total);
    }

    ios_base::fmtflags flags = os.flags();
    streamsize precision = os.precision();

    os << fixed << setprecision(2);

    os << "progress: ";
    os << folded_percent << "%";
    if(waiting_for_last_threads_to_finish){
        os << " (waiting for last threads to finish)";
    }
    os << " [windows folded: " << windows_folded << " / " << windows_total << "]";
    os << " [threads: " << threads << " / " << threads_max << "]" << endl;

    os.flags(flags);
    os.precision(precision);

}

}
