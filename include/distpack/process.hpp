#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace distpack {

struct ProcessResult {
  bool spawned = false;   // false: the executable could not be started at all
  bool timed_out = false; // killed after the deadline
  int exit_code = -1;     // valid when spawned && !timed_out; 128+N for signal N
  std::string output;     // combined stdout/stderr, truncated
  std::string error;      // spawn failure reason
};

// Run argv[0] (searched on PATH) with the given arguments and wait for it.
// timeout == 0 waits forever. Never throws for tool failures, only for misuse (empty argv).
auto run_process(const std::vector<std::string> &argv, std::chrono::seconds timeout)
    -> ProcessResult;

} // namespace distpack
