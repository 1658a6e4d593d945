/*
 *  author: Suhas Vittal
 *  date:   28 October 2024
 * */

#include "utils/argparse.h"

#include <iomanip>
#include <sstream>
#include <unordered_set>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

using OptionalArgument = std::tuple<std::string_view, std::string_view, std::string_view>;

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#define PRINT_HELP_AND_DIE  std::cerr << out.help_; exit(1)

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

unsigned long long
parse_unsigned(const std::string& s) {
    size_t ii = s.find_first_not_of(" \t");
    if (ii != std::string::npos && s[ii] == '-') {
        throw std::invalid_argument("negative value: " + s);
    }
    size_t n;
    unsigned long long x = std::stoull(s, &n, 0);
    if (n != s.size()) {
        throw std::invalid_argument("trailing characters: " + s);
    }
    return x;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

ArgParseResult
parse_args(int argc,
        char** argv,
        std::initializer_list<std::string_view> required,
        std::initializer_list<OptionalArgument> optional)
{
    // For simplicity, decrement argc:
    --argc;

    ArgParseResult out;
    // Create help string.
    std::stringstream ss;
    ss << "usage: " << argv[0];
    for (const std::string_view& s : required) {
        ss << " <" << s << ">";
    }
    ss << " [ options ]\n"
       << "------------------------------------------------- Available Options -------------------------------------------------\n";
    for (const auto& [ flag, desc, default_value ] : optional) {
        std::string descs = "\"" + std::string(desc) + "\"";
        std::string defs = default_value.empty() ? "" : "default: " + std::string(default_value);
        ss << "\t-" << std::setw(12) << std::left << flag
            << std::setw(48) << std::left << descs
            << std::setw(16) << std::left << defs << "\n";
    }
    out.help_ = ss.str();
    // Get required arguments
    if (argc < static_cast<int>(required.size())) {
        PRINT_HELP_AND_DIE;
    }

    int ii = 1;
    for (const auto& arg : required) {
        out.arg_parse_data_[std::string(arg)] = std::string(argv[ii]);
        ++ii;
    }
    // Setup optional argument defaults. Options without a default are flags.
    std::unordered_set<std::string> flags;
    for (const auto& [ flag, desc, default_value ] : optional) {
        out.arg_parse_data_[std::string(flag)] = default_value;
        if (default_value.empty()) flags.insert(std::string(flag));
    }
    // Parse optional arguments.
    while (ii <= argc) {
        // Everything after "--" is passed through untouched.
        if (std::string_view(argv[ii]) == "--") {
            for (++ii; ii <= argc; ii++) out.trailing_.emplace_back(argv[ii]);
            break;
        }
        // Check that this is indeed an option.
        if (argv[ii][0] != '-') {
            std::cerr << "Expected option but got \"" << argv[ii] << "\".\n";
            PRINT_HELP_AND_DIE;
        }
        std::string opt(argv[ii]+1);
        ++ii;
        if (!out.arg_parse_data_.count(opt)) {
            std::cerr << "Unknown option \"-" << opt << "\".\n";
            PRINT_HELP_AND_DIE;
        }
        // Now get value.
        if (flags.count(opt)) {
            out.arg_parse_data_[opt] = "y";
        } else {
            if (ii > argc) {
                std::cerr << "Expected value for argument \"-" << opt << "\" but reached end.\n";
                PRINT_HELP_AND_DIE;
            }
            // Values may start with '-' (e.g. options forwarded to another program).
            out.arg_parse_data_[opt] = argv[ii];
            ++ii;
        }
    }
    return out;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
