#include <big_factorial/cli.hpp>

#include <charconv>
#include <chrono>
#include <limits>
#include <sstream>
#include <system_error>

using namespace std;

namespace big_factorial {

// parses the whole of `text` as an unsigned number no larger than `max`
static bool parse_unsigned(const string & text, uint64_t max, uint64_t & value){

    if(text.empty()){
        return false;
    }

    uint64_t parsed = 0;
    from_chars_result res = from_chars(text.data(), text.data() + text.size(), parsed);

    if(res.ec != errc() || res.ptr != text.data() + text.size()){
        return false;
    }

    if(parsed > max){
        return false;
    }

    value = parsed;
    return true;

}

optional<string> parse_args(const vector<string> & args, cli_options & options){

    bool got_x = false;

    for(size_t arg_idx = 0; arg_idx < args.size(); ++arg_idx){

        string arg = args.at(arg_idx);

        // `--name=value` is the same as `--name value`
        optional<string> inline_value = nullopt;
        if(arg.rfind("--", 0) == 0){
            size_t eq = arg.find('=');
            if(eq != string::npos){
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto take_value = [&](string & value) -> bool {
            if(inline_value){
                value = *inline_value;
                return true;
            }
            if(arg_idx + 1 >= args.size()){
                return false;
            }
            arg_idx += 1;
            value = args.at(arg_idx);
            return true;
        };

        string value;

        if(arg == "-h" || arg == "--help"){

            options.show_help = true;

        }else if(arg == "-V" || arg == "--version"){

            options.show_version = true;

        }else if(arg == "-f" || arg == "--full-output"){

            options.full_output = true;

        }else if(arg == "-v" || arg == "--verbose"){

            options.reducer.verbose = true;

        }else if(arg == "--sequential"){

            options.sequential = true;

        }else if(arg == "-n" || arg == "--num-threads"){

            uint64_t threads = 0;
            if(!take_value(value)){
                return "`" + arg + "` needs a value";
            }
            if(!parse_unsigned(value, CONCURRENCY_MAX, threads)){
                return "invalid number of threads `" + value + "`, expected a number from 0 to " + to_string(CONCURRENCY_MAX);
            }
            options.reducer.concurrency = threads;

        }else if(arg == "--window-size"){

            if(!take_value(value)){
                return "`" + arg + "` needs a value";
            }
            if(!parse_unsigned(value, numeric_limits<uint64_t>::max(), options.reducer.window_size)){
                return "invalid window size `" + value + "`";
            }

        }else if(arg == "--timeout-ms"){

            uint64_t timeout_ms = 0;
            if(!take_value(value)){
                return "`" + arg + "` needs a value";
            }
            if(!parse_unsigned(value, numeric_limits<int64_t>::max(), timeout_ms)){
                return "invalid timeout `" + value + "`";
            }
            options.reducer.window_timeout = chrono::milliseconds(static_cast<int64_t>(timeout_ms));

        }else if(arg == "--max-redispatches"){

            uint64_t redispatches = 0;
            if(!take_value(value)){
                return "`" + arg + "` needs a value";
            }
            if(!parse_unsigned(value, numeric_limits<unsigned>::max(), redispatches)){
                return "invalid redispatch count `" + value + "`";
            }
            options.reducer.max_redispatches = static_cast<unsigned>(redispatches);

        }else if(arg == "--backend"){

            if(!take_value(value)){
                return "`" + arg + "` needs a value";
            }
            if(value == "gmp"){
                options.backend = number_backend::gmp;
            }else if(value == "boost"){
                options.backend = number_backend::boost;
            }else{
                return "invalid backend `" + value + "`, only `gmp` and `boost` are supported";
            }

        }else if(!arg.empty() && arg.at(0) == '-'){

            return "unknown option `" + arg + "`";

        }else{

            if(got_x){
                return "unexpected argument `" + arg + "`, only one number can be given";
            }
            if(!parse_unsigned(arg, numeric_limits<uint64_t>::max(), options.x)){
                return "invalid number `" + arg + "`";
            }
            got_x = true;

        }

    }

    if(!got_x && !options.show_help && !options.show_version){
        return "missing the number to calculate the factorial of";
    }

    return nullopt;

}

string usage(const string & program){

    ostringstream out;

    out << "Usage: " << program << " [OPTIONS] <X>" << endl;
    out << endl;
    out << "Arguments:" << endl;
    out << "  <X>  Number to calculate the factorial of" << endl;
    out << endl;
    out << "Options:" << endl;
    out << "  -n, --num-threads <N>       Number of threads to use for the calculation [default: " << CONCURRENCY_DEFAULT << "]" << endl;
    out << "  -f, --full-output           Show full output" << endl;
    out << "      --window-size <W>       Numbers multiplied by a single thread at a time [default: " << WINDOW_SIZE_DEFAULT << "]" << endl;
    out << "      --timeout-ms <MS>       Dispatch a window again if it takes longer than this [default: " << WINDOW_TIMEOUT_DEFAULT.count() << "]" << endl;
    out << "      --max-redispatches <R>  Give up on a window after dispatching it again this many times [default: " << MAX_REDISPATCHES_DEFAULT << "]" << endl;
    out << "      --backend <gmp|boost>   Big number implementation [default: gmp]" << endl;
    out << "      --sequential            Use a single thread, without windows" << endl;
    out << "  -v, --verbose               Print progress" << endl;
    out << "  -h, --help                  Print help" << endl;
    out << "  -V, --version               Print version" << endl;

    return out.str();

}

}
