/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include "mapping/decoder.h"

#include <iostream>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr size_t NOT_DECLARED = static_cast<size_t>(-1);

inline size_t
find_field(const std::vector<std::pair<std::string, FieldSpec>>& fields, std::string_view name) {
    for (size_t i = 0; i < fields.size(); i++) {
        if (fields[i].first == name) return i;
    }
    return NOT_DECLARED;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

AddressDecoder::AddressDecoder()
    :row_idx_(NOT_DECLARED),
    col_idx_(NOT_DECLARED),
    bank_idx_(NOT_DECLARED)
{}

AddressDecoder::AddressDecoder(std::vector<std::pair<std::string, FieldSpec>> fields)
    :fields_(std::move(fields)),
    row_idx_(find_field(fields_, FIELD_ROW)),
    col_idx_(find_field(fields_, FIELD_COLUMN)),
    bank_idx_(find_field(fields_, FIELD_BANK))
{}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

DRAMCoordinates
AddressDecoder::decode(uint64_t addr) const {
    return { get(row_idx_, addr), get(col_idx_, addr), get(bank_idx_, addr) };
}

std::vector<DecodedField>
AddressDecoder::decode_fields(uint64_t addr) const {
    std::vector<DecodedField> out;
    out.reserve(fields_.size());
    for (const auto& [ name, spec ] : fields_) {
        out.push_back({ name, extract_bits(addr, spec) });
    }
    return out;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

void
AddressDecoder::print_config(std::ostream& out) const {
    for (const auto& [ name, spec ] : fields_) {
        PRINT_STAT(out, "DECODER_" + name + "_OFFSET", spec.offset);
        PRINT_STAT(out, "DECODER_" + name + "_WIDTH", spec.width);
    }
    out << "\n";
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

uint64_t
AddressDecoder::get(size_t idx, uint64_t addr) const {
    return idx == NOT_DECLARED ? 0 : extract_bits(addr, fields_[idx].second);
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

const std::vector<std::string>&
default_field_order() {
    static const std::vector<std::string> ORDER = {
        std::string(FIELD_ROW),
        std::string(FIELD_COLUMN),
        std::string(FIELD_BANK)
    };
    return ORDER;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

DecoderStatus
make_decoder(const FieldMapping& m,
                AddressDecoder& out,
                MissingFieldPolicy policy,
                const std::vector<std::string>& fields,
                std::vector<std::string>* missing)
{
    std::vector<std::pair<std::string, FieldSpec>> resolved;
    resolved.reserve(fields.size());

    bool any_missing = false;
    for (const std::string& name : fields) {
        auto it = m.find(name);
        if (it != m.end()) {
            resolved.emplace_back(name, it->second);
            continue;
        }
        if (policy == MissingFieldPolicy::ERROR) {
            any_missing = true;
            if (missing != nullptr) missing->push_back(name);
        } else {
#ifdef DEBUG_MAPPING
            std::cerr << "[ debug mapping ] " << name << " not in mapping, decodes to 0\n";
#endif
            resolved.emplace_back(name, FieldSpec{});
        }
    }
    if (any_missing) {
        return DecoderStatus::MISSING_FIELD;
    }
    out = AddressDecoder(std::move(resolved));
    return DecoderStatus::OK;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
