#ifndef COORDINATOR_CONFIG_HPP
#define COORDINATOR_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace coordinator {

// Platform-wide settings, fixed when the coordinator is created.
struct Config {
  int64_t max_timeout_millis = 60000;
  // Bytes kept per captured channel.
  size_t output_capacity = 1 << 20;
  // Bytes the child may write as its run report.
  size_t report_capacity = 64 << 20;
  // Concurrent runs; 0 means one per hardware thread.
  size_t workers = 0;
  int64_t grace_period_millis = 1000;
  // 0 uses the timeout of each request.
  int64_t cpu_limit_millis = 0;
  // 0 disables the memory ceiling.
  int64_t memory_limit_kb = 512 * 1024;

  static Config FromFlags();
  bool Validate(std::string* error_msg) const;
};

}  // namespace coordinator

#endif
