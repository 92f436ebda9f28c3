#ifndef SCRIPT_OUTPUT_HPP
#define SCRIPT_OUTPUT_HPP

#include <string>

namespace script {

// Destination of a script's textual output (print, warn).
class OutputSink {
 public:
  virtual ~OutputSink() = default;
  virtual void Write(const std::string& data) = 0;
};

// Keeps everything in memory. Only suitable when the caller bounds the
// output some other way.
class StringSink : public OutputSink {
 public:
  void Write(const std::string& data) override { data_ += data; }
  const std::string& Data() const { return data_; }

 private:
  std::string data_;
};

}  // namespace script

#endif
