#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

// Process-wide settings, filled by the command line parser before anything
// else runs and read-only afterwards.
struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Run limits
  static int32_t max_timeout_millis;
  static int32_t output_capacity;
  static int32_t report_capacity;
  static int32_t workers;
  static int32_t grace_period_millis;
  static int32_t cpu_limit_millis;
  static int32_t memory_limit_kb;
};

#endif
