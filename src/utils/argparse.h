/*
 *  author: Suhas Vittal
 *  date:   28 October 2024
 * */

#ifndef ARGPARSE_h
#define ARGPARSE_h

#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <stdlib.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * `std::stoull` with base 0, except that a leading '-' is rejected instead
 * of silently wrapping around. Throws `std::invalid_argument` or
 * `std::out_of_range`.
 * */
unsigned long long parse_unsigned(const std::string&);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

struct ArgParseResult {
    std::string help_;
    std::unordered_map<std::string, std::string> arg_parse_data_;
    /*
     * Arguments that followed "--", in order.
     * */
    std::vector<std::string> trailing_;

    ArgParseResult(void) =default;
    ArgParseResult(const ArgParseResult&) =default;

    template <class T>
    inline void operator()(std::string_view arg_name, T& arg_value_ref) {
        auto it = arg_parse_data_.find(std::string(arg_name));
        if (it == arg_parse_data_.end()) {
            std::cerr << "Unknown argument \"" << arg_name << "\"\n"
                << help_;
            exit(1);
        }
        const std::string& value = it->second;
        std::string typenamestr;
        try {
            if constexpr ( std::is_integral<T>::value ) {
                if constexpr (std::is_same<T, bool>::value) {
                    typenamestr = "bool";
                    arg_value_ref = value != "";
                } else if constexpr (std::is_unsigned<T>::value) {
                    // Base 0 so that addresses can be given in hex.
                    typenamestr = "uint64_t";
                    arg_value_ref = static_cast<T>( parse_unsigned(value) );
                } else {
                    typenamestr = "int64_t";
                    arg_value_ref = static_cast<T>( std::stoll(value, nullptr, 0) );
                }
            } else if constexpr ( std::is_floating_point<T>::value ) {
                typenamestr = "double";
                arg_value_ref = static_cast<T>( std::stod(value) );
            } else {
                typenamestr = "std::string";
                // Assume `T = std::string`.
                arg_value_ref = value;
            }
        } catch (const std::logic_error&) {
            // `std::invalid_argument` and `std::out_of_range` from the `sto*` family.
            std::cerr << "Could not parse data for " << arg_name << " as type \"" << typenamestr << "\"\n"
                << help_;
            exit(1);
        }
    }
};

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Parses `argv`. Regarding arguments:
 *  (1) `required`: the first `required.size()` args in `argv` are treated as required arguments. If they
 *      do not exist, `parse_args` prints usage to stderr and exits with code 1.
 *  (2) `optional`: all optional arguments must be provided as a 3-tuple:
 *      (i) flag (-<flag> is used to match the optional argument).
 *      (ii) description
 *      (iii) default value
 *          --> if an optional argument is just a flag (set/unset), then the default value should be the empty
 *              string. It is assumed to be false by default.
 *  A non-flag option always takes the next argument as its value, even if it starts with '-'.
 *  Arguments after "--" are not parsed and are kept in `ArgParseResult::trailing_`.
 *  Unknown options are an error.
 *  Returns `ArgParseResult` (see usage above: arguments can be retrieved
 *  via `ArgParseResult(<argument>, <variable>)`.
 *      i.e. ArgParseResult pp = parse_args(...)
 *           pp("foo", bar);
 *      `bar` can be any type.
 * */
ArgParseResult parse_args(
        int argc,
        char** argv,
        std::initializer_list<std::string_view> required,
        std::initializer_list< std::tuple<std::string_view, std::string_view, std::string_view> > optional);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // ARGPARSE_h
