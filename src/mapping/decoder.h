/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef MAPPING_DECODER_h
#define MAPPING_DECODER_h

#include "mapping/field.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <stdint.h>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

struct DRAMCoordinates {
    uint64_t row    =0;
    uint64_t column =0;
    uint64_t bank   =0;

    bool operator==(const DRAMCoordinates&) const =default;
};

struct DecodedField {
    std::string name;
    uint64_t    value;
};

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Splits physical addresses into fields. A decoder is built once by
 * `make_decoder` and never changes afterwards, so a single instance can be
 * shared by any number of threads.
 * */
class AddressDecoder {
private:
    /*
     * Resolved (name, bit range) pairs in declared order.
     * */
    std::vector<std::pair<std::string, FieldSpec>> fields_;
    /*
     * Positions of row/column/bank in `fields_`, or `NOT_DECLARED`.
     * */
    size_t row_idx_;
    size_t col_idx_;
    size_t bank_idx_;
public:
    AddressDecoder(void);
    AddressDecoder(std::vector<std::pair<std::string, FieldSpec>>);

    DRAMCoordinates             decode(uint64_t addr) const;
    std::vector<DecodedField>   decode_fields(uint64_t addr) const;

    void print_config(std::ostream&) const;

    const std::vector<std::pair<std::string, FieldSpec>>& fields(void) const { return fields_; }
private:
    uint64_t get(size_t idx, uint64_t addr) const;
};

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

const std::vector<std::string>& default_field_order(void);

/*
 * Resolves every name in `fields` from `m`, in order. If a name is missing:
 *  (1) `ZERO_FILL`: it gets an empty range and always decodes to 0.
 *  (2) `ERROR`: returns `MISSING_FIELD`, appends the missing names to
 *      `missing` (if given), and leaves `out` untouched.
 * */
DecoderStatus make_decoder(const FieldMapping& m,
                            AddressDecoder& out,
                            MissingFieldPolicy=MissingFieldPolicy::ZERO_FILL,
                            const std::vector<std::string>& fields=default_field_order(),
                            std::vector<std::string>* missing=nullptr);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // MAPPING_DECODER_h
