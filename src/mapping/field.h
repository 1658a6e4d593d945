/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef MAPPING_FIELD_h
#define MAPPING_FIELD_h

#include "defs.h"

#include <string>
#include <unordered_map>

#include <stdint.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * A field occupies bits [offset, offset+width) of a physical address.
 * */
struct FieldSpec {
    uint64_t offset =0;
    uint64_t width  =0;

    bool operator==(const FieldSpec&) const =default;
};

/*
 * Canonical field name (e.g. "row") -> bit range.
 * */
using FieldMapping = std::unordered_map<std::string, FieldSpec>;

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr std::string_view FIELD_ROW    = "row";
constexpr std::string_view FIELD_COLUMN = "column";
constexpr std::string_view FIELD_BANK   = "bank";

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * `MASK(0)` is 0 and any width of at least `ADDRESS_WIDTH` gives all ones.
 * */
inline constexpr uint64_t
MASK(uint64_t width) {
    return width >= ADDRESS_WIDTH ? ~0ull : ((1ull << width) - 1);
}

/*
 * Bits past bit 63 do not exist and read as 0, so an offset of 64 or more
 * always yields 0.
 * */
inline constexpr uint64_t
extract_bits(uint64_t x, uint64_t offset, uint64_t width) {
    if (offset >= ADDRESS_WIDTH) {
        return 0;
    }
    return (x >> offset) & MASK(width);
}

inline constexpr uint64_t
extract_bits(uint64_t x, const FieldSpec& f) {
    return extract_bits(x, f.offset, f.width);
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

void print_mapping(std::ostream&, const FieldMapping&);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // MAPPING_FIELD_h
