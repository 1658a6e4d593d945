#include <cassert>
#include <string>
#include <vector>

#include "mapping/decoder.h"
#include "mapping/parser.h"

// Results follow the declared field order, not the report order.

int main() {
  FieldMapping m = parse_mapping("Bank bits 0-1\nColumn bits 2-5\nRow bits 6-9\n");

  AddressDecoder d;
  assert(make_decoder(m, d) == DecoderStatus::OK);
  std::vector<DecodedField> f = d.decode_fields(0x3FF);
  assert(f.size() == 3);
  assert(f[0].name == "row");
  assert(f[1].name == "column");
  assert(f[2].name == "bank");

  // A custom order, without column.
  const std::vector<std::string> order{"bank", "row"};
  AddressDecoder e;
  assert(make_decoder(m, e, MissingFieldPolicy::ERROR, order) == DecoderStatus::OK);
  std::vector<DecodedField> g = e.decode_fields(0b1011'0110'11);
  assert(g.size() == 2);
  assert(g[0].name == "bank" && g[0].value == 0b11);
  assert(g[1].name == "row"  && g[1].value == 0b1011);
  // Fields that are not declared decode to 0 in the fixed-shape result.
  assert(e.decode(0x3FF).column == 0);
  assert(e.decode(0x3FF).row == 0xF);

  // Extra fields from a custom vocabulary.
  LabelVocabulary v;
  assert(parse_vocabulary("Rank=rank,Row=row", v));
  FieldMapping r = parse_mapping("Rank bits 12-12\nRow bits 13-20\n", v);
  AddressDecoder h;
  assert(make_decoder(r, h, MissingFieldPolicy::ERROR, {"rank", "row"}) == DecoderStatus::OK);
  assert(h.decode_fields(0x3000)[0].value == 1);
  assert(h.decode_fields(0x3000)[1].value == 1);
  return 0;
}
