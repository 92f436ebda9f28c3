#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include "backward.hpp"

namespace util {

// Routes kj logging and exceptions to stderr or to Flags::log_file. Install
// it after the flags are parsed.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool use_colors;
  std::mutex mutex;  // Runs log from several threads.
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
