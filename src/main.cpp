#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <big_factorial/big_natural.hpp>
#include <big_factorial/cli.hpp>
#include <big_factorial/errors.hpp>
#include <big_factorial/format.hpp>
#include <big_factorial/range_product.hpp>
#include <big_factorial/windowed_reducer.hpp>

#ifndef BIG_FACTORIAL_VERSION
#define BIG_FACTORIAL_VERSION "UNKNOWN"
#endif

using namespace std;
using namespace big_factorial;

template <typename T>
T calculate(const cli_options & options){

    if(options.sequential){
        return factorial<T>(options.x);
    }

    return parallel_factorial<T>(options.x, options.reducer);

}

template <typename T>
void calculate_and_print(const cli_options & options){

    T large_fac = calculate<T>(options);

    if(options.full_output){
        cout << format_result(options.x, format_full(large_fac)) << endl;
    }else{
        cout << format_result(options.x, format_sci(sci_mantissa_and_exponent(large_fac))) << endl;
    }

}

int main(int argc, char * * argv){

    string program = argc > 0 ? argv[0] : "big-factorial";

    vector<string> args = {};
    for(int arg_idx = 1; arg_idx < argc; ++arg_idx){
        args.push_back(argv[arg_idx]);
    }

    cli_options options = {};

    if(optional<string> problem = parse_args(args, options)){
        BIG_FACTORIAL_USER_ERR(
            *problem << endl <<
            endl <<
            usage(program)
        );
    }

    if(options.show_help){
        cout << usage(program);
        return 0;
    }

    if(options.show_version){
        cout << "big-factorial " << BIG_FACTORIAL_VERSION << endl;
        return 0;
    }

    if(optional<string> problem = check_config(options.reducer)){
        BIG_FACTORIAL_USER_ERR(*problem);
    }

    switch(options.backend){

        case number_backend::gmp:
            calculate_and_print<big_natural>(options);
            break;

        case number_backend::boost:
            calculate_and_print<boost::multiprecision::cpp_int>(options);
            break;

    }

    return 0;
}
