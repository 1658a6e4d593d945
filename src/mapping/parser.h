/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#ifndef MAPPING_PARSER_h
#define MAPPING_PARSER_h

#include "mapping/field.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Report label (as printed by the tool) -> canonical field name. Labels are
 * tried in order and the first one whose full pattern matches wins.
 * */
using LabelVocabulary = std::vector<std::pair<std::string, std::string>>;

const LabelVocabulary& default_vocabulary(void);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
/*
 * Parses a line-oriented report. Recognized lines look like
 *
 *      <Label> bits <start>-<end>[anything]
 *
 * where `start` and `end` are decimal and `start <= end`. Each such line
 * records `offset = start, width = end-start+1` under the label's canonical
 * name; later lines win. Every other line is skipped, so this never fails.
 * */
FieldMapping parse_mapping(std::string_view text, const LabelVocabulary& =default_vocabulary());

/*
 * Tries to match a single line (no line terminator). Returns false if the
 * line is not a recognized record.
 * */
bool parse_line(std::string_view line,
        const LabelVocabulary& vocab,
        std::string& name_out,
        FieldSpec& spec_out);

/*
 * Parses "Label=name,Label=name,...". Returns false (and leaves `out`
 * untouched) if any entry is malformed.
 * */
bool parse_vocabulary(std::string_view s, LabelVocabulary& out);

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

#endif  // MAPPING_PARSER_h
