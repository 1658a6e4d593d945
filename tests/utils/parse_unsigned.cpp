#include <cassert>
#include <stdexcept>
#include <string>

#include "utils/argparse.h"

static bool rejects(const std::string& s) {
  try {
    (void)parse_unsigned(s);
  } catch (const std::invalid_argument&) {
    return true;
  } catch (const std::out_of_range&) {
    return true;
  }
  return false;
}

int main() {
  assert(parse_unsigned("0") == 0);
  assert(parse_unsigned("42") == 42);
  assert(parse_unsigned("0x12345678") == 0x12345678ull);
  assert(parse_unsigned("0XFF") == 0xFF);
  assert(parse_unsigned("0xFFFFFFFFFFFFFFFF") == ~0ull);

  assert(rejects(""));
  assert(rejects("-1"));
  assert(rejects(" -1"));
  assert(rejects("12abc"));
  assert(rejects("0x"));
  assert(rejects("0x1FFFFFFFFFFFFFFFF"));
  return 0;
}
