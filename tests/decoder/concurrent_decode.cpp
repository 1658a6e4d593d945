#include <cassert>
#include <cstdint>
#include <thread>
#include <vector>

#include "mapping/decoder.h"
#include "mapping/parser.h"

// One decoder shared by many threads with no locking.

int main() {
  FieldMapping m = parse_mapping("Row bits 14-29\nColumn bits 2-13\nBank bits 30-32\n");
  AddressDecoder d;
  assert(make_decoder(m, d) == DecoderStatus::OK);
  const AddressDecoder& shared = d;

  constexpr int N_THREADS = 8;
  constexpr std::uint64_t N_ADDRS = 1 << 16;

  std::vector<int> ok(N_THREADS, 0);
  std::vector<std::thread> threads;
  for (int t = 0; t < N_THREADS; t++) {
    threads.emplace_back([&shared, &ok, t] {
      bool good = true;
      for (std::uint64_t i = 0; i < N_ADDRS; i++) {
        std::uint64_t a = (i * 0x9E3779B97F4A7C15ull) ^ static_cast<std::uint64_t>(t);
        DRAMCoordinates c = shared.decode(a);
        good &= c.row == ((a >> 14) & 0xFFFF);
        good &= c.column == ((a >> 2) & 0xFFF);
        good &= c.bank == ((a >> 30) & 0x7);
      }
      ok[t] = good ? 1 : 0;
    });
  }
  for (std::thread& th : threads) th.join();
  for (int r : ok) assert(r == 1);
  return 0;
}
