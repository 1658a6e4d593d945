#include <cassert>
#include <cstdint>

#include "mapping/decoder.h"
#include "mapping/parser.h"

// Default policy: a field the report never mentioned decodes to 0.

int main() {
  FieldMapping m = parse_mapping("Row bits 16-31\nColumn bits 0-15\n");
  AddressDecoder d;
  assert(make_decoder(m, d) == DecoderStatus::OK);
  assert(make_decoder(m, d, MissingFieldPolicy::ZERO_FILL) == DecoderStatus::OK);

  const std::uint64_t addrs[] = {0, 1, 0xDEADBEEF, 0x8000000000000000ull, ~0ull};
  for (std::uint64_t a : addrs) {
    assert(d.decode(a).bank == 0);
  }
  assert(d.decode(0xDEADBEEF).row == 0xDEAD);
  assert(d.decode(0xDEADBEEF).column == 0xBEEF);

  // The missing field is still listed, as an empty range.
  assert(d.fields().size() == 3);
  assert(d.fields()[2].first == "bank");
  assert(d.fields()[2].second == (FieldSpec{0, 0}));

  // An empty mapping decodes everything to zero.
  AddressDecoder z;
  assert(make_decoder(FieldMapping{}, z) == DecoderStatus::OK);
  assert(z.decode(~0ull) == (DRAMCoordinates{0, 0, 0}));
  return 0;
}
