/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include "mapping/parser.h"

#include <iostream>
#include <limits>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

constexpr std::string_view BITS_KEYWORD = " bits ";
constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

inline bool
is_line_break(char c) {
    return c == '\n' || c == '\r' || c == '\v' || c == '\f'
        || c == '\x1c' || c == '\x1d' || c == '\x1e';
}

inline bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

/*
 * Reads a run of decimal digits from the front of `s`. Values that do not
 * fit in 64 bits saturate. Returns the number of characters consumed.
 * */
size_t
read_decimal(std::string_view s, uint64_t& out) {
    size_t ii = 0;
    out = 0;
    while (ii < s.size() && is_digit(s[ii])) {
        uint64_t d = static_cast<uint64_t>(s[ii] - '0');
        out = (out > (U64_MAX-d)/10) ? U64_MAX : 10*out + d;
        ++ii;
    }
    return ii;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

const LabelVocabulary&
default_vocabulary() {
    static const LabelVocabulary VOCAB = {
        { "Row",    std::string(FIELD_ROW) },
        { "Column", std::string(FIELD_COLUMN) },
        { "Bank",   std::string(FIELD_BANK) }
    };
    return VOCAB;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

bool
parse_line(std::string_view line, const LabelVocabulary& vocab, std::string& name_out, FieldSpec& spec_out) {
    for (const auto& [ label, name ] : vocab) {
        if (label.empty() || !line.starts_with(label)) {
            continue;
        }
        std::string_view rest = line.substr(label.size());
        if (!rest.starts_with(BITS_KEYWORD)) {
            continue;
        }
        rest.remove_prefix(BITS_KEYWORD.size());

        uint64_t start, end;
        size_t n = read_decimal(rest, start);
        if (n == 0 || n >= rest.size() || rest[n] != '-') {
            continue;
        }
        rest.remove_prefix(n+1);
        if (read_decimal(rest, end) == 0) {
            continue;
        }
        // Descending ranges are not records.
        if (start > end) {
            continue;
        }
        uint64_t span = end - start;
        name_out = name;
        spec_out = { start, span == U64_MAX ? U64_MAX : span+1 };
        return true;
    }
    return false;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

FieldMapping
parse_mapping(std::string_view text, const LabelVocabulary& vocab) {
    FieldMapping out;

    std::string name;
    FieldSpec spec;

    size_t ii = 0;
    while (ii <= text.size()) {
        size_t jj = ii;
        while (jj < text.size() && !is_line_break(text[jj])) {
            ++jj;
        }
        if (parse_line(text.substr(ii, jj-ii), vocab, name, spec)) {
            out[name] = spec;
#ifdef DEBUG_MAPPING
            std::cerr << "[ debug mapping ] " << name << " <- offset " << spec.offset
                << ", width " << spec.width << "\n";
#endif
        }
        if (jj == text.size()) {
            break;
        }
        // "\r\n" is a single break.
        if (text[jj] == '\r' && jj+1 < text.size() && text[jj+1] == '\n') {
            ++jj;
        }
        ii = jj+1;
    }
    return out;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

bool
parse_vocabulary(std::string_view s, LabelVocabulary& out) {
    if (s.empty()) {
        return false;
    }
    LabelVocabulary vocab;
    while (true) {
        size_t comma = s.find(',');
        std::string_view entry = s.substr(0, comma);

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0 || eq+1 == entry.size()) {
            std::cerr << "Malformed label entry \"" << entry << "\" (expected Label=name).\n";
            return false;
        }
        vocab.emplace_back( std::string(entry.substr(0, eq)), std::string(entry.substr(eq+1)) );

        if (comma == std::string_view::npos) {
            break;
        }
        s.remove_prefix(comma+1);
    }
    out = std::move(vocab);
    return true;
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
