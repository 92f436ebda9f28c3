#include "coordinator/config.hpp"

#include "util/flags.hpp"

namespace coordinator {

Config Config::FromFlags() {
  // Negative sizes become 0, which Validate() rejects.
  auto size = [](int32_t value) -> size_t { return value < 0 ? 0 : value; };
  Config config;
  config.max_timeout_millis = Flags::max_timeout_millis;
  config.output_capacity = size(Flags::output_capacity);
  config.report_capacity = size(Flags::report_capacity);
  config.workers = size(Flags::workers);
  config.grace_period_millis = Flags::grace_period_millis;
  config.cpu_limit_millis = Flags::cpu_limit_millis;
  config.memory_limit_kb = Flags::memory_limit_kb;
  return config;
}

bool Config::Validate(std::string* error_msg) const {
  if (max_timeout_millis <= 0) {
    *error_msg = "the maximum timeout must be positive";
    return false;
  }
  if (output_capacity == 0) {
    *error_msg = "the output capacity must be positive";
    return false;
  }
  if (report_capacity < 1024) {
    *error_msg = "the report capacity must be at least 1024 bytes";
    return false;
  }
  if (grace_period_millis <= 0) {
    *error_msg = "the grace period must be positive";
    return false;
  }
  if (cpu_limit_millis < 0 || memory_limit_kb < 0) {
    *error_msg = "resource ceilings cannot be negative";
    return false;
  }
  return true;
}

}  // namespace coordinator
