#ifndef TESTS_SCRATCH_h
#define TESTS_SCRATCH_h

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include <ftw.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dramap_test {
  // Fresh directory under $TMPDIR (or /tmp). Not removed afterwards.
  inline std::string make_scratch_dir() {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base ? base : "/tmp") + "/dramap-test-XXXXXX";
    char* d = mkdtemp(tmpl.data());
    assert(d != nullptr);
    return std::string(d);
  }

  // Removes a directory made by make_scratch_dir and everything under it.
  inline void remove_scratch_dir(const std::string& dir) {
    auto rm = [](const char* path, const struct stat*, int, struct FTW*) -> int {
      return ::remove(path);
    };
    int rc = nftw(dir.c_str(), rm, 16, FTW_DEPTH | FTW_PHYS);
    assert(rc == 0);
  }

  inline void write_file(const std::string& path, std::string_view data, mode_t mode = 0644) {
    FILE* f = std::fopen(path.c_str(), "wb");
    assert(f != nullptr);
    assert(std::fwrite(data.data(), 1, data.size(), f) == data.size());
    std::fclose(f);
    assert(chmod(path.c_str(), mode) == 0);
  }
}

#endif
