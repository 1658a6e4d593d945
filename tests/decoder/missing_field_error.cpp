#include <cassert>
#include <string>
#include <vector>

#include "mapping/decoder.h"
#include "mapping/parser.h"

// Strict policy: missing fields are reported by name, in declared order.

int main() {
  FieldMapping full = parse_mapping("Row bits 14-29\nColumn bits 2-13\nBank bits 30-32\n");
  AddressDecoder d;
  assert(make_decoder(full, d, MissingFieldPolicy::ERROR) == DecoderStatus::OK);
  const DRAMCoordinates before = d.decode(0x12345678);

  FieldMapping row_only = parse_mapping("Row bits 0-3\n");
  std::vector<std::string> missing;
  assert(make_decoder(row_only, d, MissingFieldPolicy::ERROR, default_field_order(), &missing)
         == DecoderStatus::MISSING_FIELD);
  assert((missing == std::vector<std::string>{"column", "bank"}));

  // The previous decoder is left untouched.
  assert(d.decode(0x12345678) == before);
  assert(d.fields()[0].second == (FieldSpec{14, 16}));

  // Reporting the names is optional.
  assert(make_decoder(FieldMapping{}, d, MissingFieldPolicy::ERROR) == DecoderStatus::MISSING_FIELD);
  return 0;
}
