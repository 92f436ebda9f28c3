#ifndef RUNNER_MAIN_HPP
#define RUNNER_MAIN_HPP
#include <kj/main.h>
#include <string>
#include <vector>

#include "coordinator/execution.hpp"

namespace runner {

// `quantbox run`: executes one program and reports the outcome.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  bool ReadRequest(coordinator::ExecutionRequest* request,
                   std::string* error_msg);
  void PrintResult(const coordinator::ExecutionResult& result);

  kj::ProcessContext& context;
  bool read_binary = false;
  std::string code_file = "-";
  int32_t timeout_millis = 5000;
  std::string tier = "minimal";
  std::vector<std::string> bindings;
  std::vector<std::string> observe;
};

// `quantbox tiers`: lists what each capability tier exposes.
class TiersMain {
 public:
  explicit TiersMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string tier;
};
}  // namespace runner
#endif
