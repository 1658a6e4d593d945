#include <cassert>
#include <string>

#include "mapping/parser.h"

int main() {
  const std::string report =
    "DRAMA report\n"
    "Row bits 17-32\n"
    "garbage line\n"
    "Column bits 0-12\n"
    "Bank bits 13-16\n"
    "Row bits 18-33\n";

  FieldMapping a = parse_mapping(report);
  FieldMapping b = parse_mapping(report);
  assert(a == b);
  assert(a.size() == 3);
  assert(a.at("row") == (FieldSpec{18, 16}));
  return 0;
}
