#include <cassert>

#include "mapping/parser.h"

// A single well-formed record: offset is the low bit, width counts both ends.

int main() {
  FieldMapping m = parse_mapping("Row bits 10-15\n");
  assert(m.size() == 1);
  assert(m.count("row") == 1);
  assert(m.at("row").offset == 10);
  assert(m.at("row").width == 6);

  // One-bit field.
  FieldMapping b = parse_mapping("Bank bits 7-7");
  assert(b.at("bank") == (FieldSpec{7, 1}));

  // All three default labels, canonical names are lowercase.
  FieldMapping all = parse_mapping("Row bits 14-29\nColumn bits 2-13\nBank bits 30-32\n");
  assert(all.size() == 3);
  assert(all.at("row") == (FieldSpec{14, 16}));
  assert(all.at("column") == (FieldSpec{2, 12}));
  assert(all.at("bank") == (FieldSpec{30, 3}));

  // Fields never mentioned are absent, not zero-filled.
  assert(parse_mapping("Row bits 0-3\n").count("bank") == 0);
  return 0;
}
