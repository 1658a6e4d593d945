/*
 *  author: Suhas Vittal
 *  date:   19 October 2026
 * */

#include "mapping/field.h"

#include <algorithm>
#include <vector>

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////

void
print_mapping(std::ostream& out, const FieldMapping& m) {
    // Sort so that output does not depend on hash order.
    std::vector<std::string> names;
    for (const auto& [ name, spec ] : m) names.push_back(name);
    std::sort(names.begin(), names.end());

    for (const std::string& name : names) {
        const FieldSpec& f = m.at(name);
        std::string range = f.width == 0
                            ? "(empty)"
                            : std::to_string(f.offset) + "-" + std::to_string(f.offset + f.width - 1);
        PRINT_STAT(out, "MAPPING", name, range);
    }
}

////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////
