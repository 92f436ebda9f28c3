#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

int32_t Flags::max_timeout_millis = 60000;
int32_t Flags::output_capacity = 1 << 20;
int32_t Flags::report_capacity = 64 << 20;
int32_t Flags::workers = 0;
int32_t Flags::grace_period_millis = 1000;
int32_t Flags::cpu_limit_millis = 0;
int32_t Flags::memory_limit_kb = 512 * 1024;
