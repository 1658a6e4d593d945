#include <cassert>
#include <string>

#include "tool/drama.h"

int main() {
  assert(find_in_path("sh"));
  assert(find_in_path("/bin/sh"));
  assert(!find_in_path(""));
  assert(!find_in_path("dramap-no-such-program"));
  assert(!find_in_path("/nonexistent/dramap-no-such-program"));

  DRAMATool tool("/nonexistent");
  assert(tool.dependencies_.size() == 2);
  assert(tool.dependencies_[0] == "make");
  assert(tool.dependencies_[1] == "gcc");
  assert(tool.binary_ == "./drama_tool");

  tool.dependencies_ = {"sh"};
  assert(tool.check_dependencies() == AcquireStatus::OK);

  tool.dependencies_ = {"sh", "dramap-no-such-program"};
  assert(tool.check_dependencies() == AcquireStatus::MISSING_DEPENDENCY);

  // The pipeline stops at the first failing step.
  std::string report = "untouched";
  assert(tool.run_pipeline(report) == AcquireStatus::MISSING_DEPENDENCY);
  assert(report == "untouched");

  // Building in a directory that does not exist fails before make runs.
  tool.dependencies_ = {"sh"};
  assert(tool.run_make() == AcquireStatus::BUILD_FAILED);
  assert(tool.run_pipeline(report) == AcquireStatus::BUILD_FAILED);
  return 0;
}
