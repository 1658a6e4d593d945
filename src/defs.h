/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef CONSTANTS_h
#define CONSTANTS_h

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <stdint.h>
#include <stddef.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr size_t ADDRESS_WIDTH = 8*sizeof(uint64_t);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Enum declarations.
 * */
enum class MissingFieldPolicy   { ZERO_FILL, ERROR };
enum class DecoderStatus        { OK, MISSING_FIELD };
enum class AcquireStatus {
    OK,
    MISSING_DEPENDENCY,
    BUILD_FAILED,
    EXEC_FAILED,
    EMPTY_OUTPUT,
    FILE_ERROR
};

inline std::string_view
missing_field_policy_name(MissingFieldPolicy p) {
    if (p == MissingFieldPolicy::ZERO_FILL) return "Zero Fill";
    if (p == MissingFieldPolicy::ERROR)     return "Error";
    return "Unknown Missing Field Policy";
}

inline std::string_view
acquire_status_name(AcquireStatus s) {
    if (s == AcquireStatus::OK)                 return "ok";
    if (s == AcquireStatus::MISSING_DEPENDENCY) return "missing dependency";
    if (s == AcquireStatus::BUILD_FAILED)       return "build failed";
    if (s == AcquireStatus::EXEC_FAILED)        return "execution failed";
    if (s == AcquireStatus::EMPTY_OUTPUT)       return "empty output";
    if (s == AcquireStatus::FILE_ERROR)         return "file error";
    return "unknown";
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * DRAMA tool definitions. These can be overridden at the command line.
 * */
#ifndef DRAMA_DEFAULT_DIR
#define DRAMA_DEFAULT_DIR "drama"
#endif

constexpr std::string_view DRAMA_MAKE_TARGET = "all";
constexpr std::string_view DRAMA_BINARY = "./drama_tool";
/*
 * Programs that must be on `PATH` before DRAMA can be built.
 * */
constexpr std::string_view DRAMA_DEPENDENCIES[] = { "make", "gcc" };

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

template <class NUMBER> inline void
PRINT_STAT(std::ostream& out, std::string name, NUMBER value) {
    out << std::setw(24) << std::left << name << "\t" << value << "\n";
}

template <class NUMBER> inline void
PRINT_STAT(std::ostream& out, std::string_view header, std::string name, NUMBER value) {
    return PRINT_STAT(out, std::string(header) + "_" + name, value);
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

inline std::string
FMT_HEX(uint64_t x) {
    std::ostringstream ss;
    ss << "0x" << std::hex << x;
    return ss.str();
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif
