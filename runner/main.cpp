#include "runner/main.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

#include "capnp/execution.capnp.h"
#include "coordinator/coordinator.hpp"
#include "coordinator/wire.hpp"
#include "policy/capability_policy.hpp"
#include "script/errors.hpp"
#include "script/parser.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace runner {
namespace {
// Turns SIGINT and SIGTERM into cancellation of the run in flight, for as
// long as the watcher lives.
class SignalWatcher {
 public:
  explicit SignalWatcher(const coordinator::CancellationToken& cancellation) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    int err = pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
    if (err != 0) KJ_FAIL_SYSCALL("pthread_sigmask", err);
    thread_ = std::thread([this, cancellation]() {
      struct timespec timeout {
        0, 50 * 1000 * 1000
      };
      while (!done_) {
        int sig = sigtimedwait(&signals_, nullptr, &timeout);
        if (sig == SIGINT || sig == SIGTERM) {
          KJ_LOG(WARNING, "Cancelling the run", strsignal(sig));
          cancellation.Cancel();
        }
      }
    });
  }
  ~SignalWatcher() {
    done_ = true;
    thread_.join();
  }
  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

 private:
  sigset_t signals_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

bool ReadAll(std::istream& in, std::string* data) {
  std::stringstream ss;
  ss << in.rdbuf();
  *data = ss.str();
  return !in.bad();
}

void WriteAll(FILE* out, const std::string& data) {
  fwrite(data.data(), 1, data.size(), out);  // NOLINT
}
}  // namespace

bool Main::ReadRequest(coordinator::ExecutionRequest* request,
                       std::string* error_msg) {
  if (code_file == "-") {
    if (!ReadAll(std::cin, &request->code)) {
      *error_msg = "Failed to read the program from stdin";
      return false;
    }
  } else {
    std::ifstream in(code_file);
    if (!in || !ReadAll(in, &request->code)) {
      *error_msg = "Failed to read the program from " + code_file;
      return false;
    }
  }
  request->timeout_millis = timeout_millis;
  if (!policy::ParseTier(tier, &request->tier)) {
    *error_msg = "Unknown tier " + tier;
    return false;
  }
  for (const std::string& binding : bindings) {
    size_t eq = binding.find('=');
    if (eq == std::string::npos) {
      *error_msg = "Bindings must look like NAME=LITERAL: " + binding;
      return false;
    }
    std::string name = binding.substr(0, eq);
    try {
      request->bindings[name] = script::ParseLiteral(binding.substr(eq + 1));
    } catch (const script::SyntaxError& e) {
      *error_msg = "Invalid value for binding " + name + ": " + e.what();
      return false;
    }
  }
  for (const std::string& names : observe) {
    util::split(names, ',', std::back_inserter(request->observe));
  }
  return true;
}

void Main::PrintResult(const coordinator::ExecutionResult& result) {
  WriteAll(stdout, result.Stdout().data);
  WriteAll(stderr, result.Stderr().data);
  if (result.Stdout().truncated) {
    KJ_LOG(WARNING, "Standard output truncated",
           result.Stdout().data.size());
  }
  if (result.Stderr().truncated) {
    KJ_LOG(WARNING, "Standard error truncated", result.Stderr().data.size());
  }
  if (result.HasResult()) {
    printf("result = %s\n", result.Result().Repr().c_str());  // NOLINT
  }
  for (const auto& binding : result.UpdatedBindings()) {
    printf("%s = %s\n", binding.first.c_str(),  // NOLINT
           binding.second.Repr().c_str());
  }
  fflush(stdout);
  fflush(stderr);
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  kj::_::Debug::setLogLevel(Flags::verbose ? kj::LogSeverity::INFO
                                           : kj::LogSeverity::WARNING);
  coordinator::Config config = coordinator::Config::FromFlags();
  std::string error_msg;
  if (!config.Validate(&error_msg)) return kj::str(error_msg.c_str());

  coordinator::ExecutionRequest request;
  if (read_binary) {
    capnp::ReaderOptions options;
    options.traversalLimitInWords = 1ULL << 30;
    options.nestingLimit = coordinator::Wire::kNestingLimit;
    capnp::StreamFdMessageReader reader(STDIN_FILENO, options);
    request = coordinator::Wire::ReadRequest(
        reader.getRoot<capnproto::ExecutionRequest>());
  } else if (!ReadRequest(&request, &error_msg)) {
    return kj::str(error_msg.c_str());
  }

  coordinator::Coordinator coord(config);
  coordinator::CancellationToken cancellation;
  coordinator::ExecutionResult result;
  {
    SignalWatcher watcher(cancellation);
    result = coord.Run(request, cancellation);
  }
  const coordinator::ResourceUsage& usage = result.Usage();
  KJ_LOG(INFO, "Run finished", result.Succeeded(), usage.wall_millis,
         usage.cpu_millis, usage.sys_millis, usage.peak_memory_kb);

  if (read_binary) {
    capnp::MallocMessageBuilder message;
    coordinator::Wire::WriteResult(
        result, message.initRoot<capnproto::ExecutionResult>());
    capnp::writeMessageToFd(STDOUT_FILENO, message);
  } else {
    PrintResult(result);
  }
  if (!result.Succeeded()) {
    context.exitError(kj::str(result.Error().ToString().c_str()));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Quantbox (" + util::version + ")",
                         "Runs a strategy program in an isolated process")
      .addOptionWithArg({'c', "code"}, util::setString(&code_file), "<FILE>",
                        "Program to run, - for stdin")
      .addOptionWithArg({'t', "timeout-ms"}, util::setInt(&timeout_millis),
                        "<MILLIS>", "Time budget of the run")
      .addOptionWithArg({'T', "tier"}, util::setString(&tier), "<TIER>",
                        "Capability tier: minimal or analysis")
      .addOptionWithArg({'B', "bind"}, util::appendString(&bindings),
                        "<NAME=LITERAL>", "Bind a name to a literal value")
      .addOptionWithArg({'o', "observe"}, util::appendString(&observe),
                        "<NAMES>", "Comma separated names to copy back")
      .addOption({'b', "bin"}, util::setBool(&read_binary),
                 "Read the request and write the result in binary.")
      .addOptionWithArg({"max-timeout-ms"},
                        util::setInt(&Flags::max_timeout_millis), "<MILLIS>",
                        "Largest timeout a request may ask for")
      .addOptionWithArg({"output-capacity"},
                        util::setInt(&Flags::output_capacity), "<BYTES>",
                        "Bytes kept per output channel")
      .addOptionWithArg({"report-capacity"},
                        util::setInt(&Flags::report_capacity), "<BYTES>",
                        "Largest run report accepted from the child")
      .addOptionWithArg({"workers"}, util::setInt(&Flags::workers), "<N>",
                        "Concurrent runs, 0 for one per core")
      .addOptionWithArg({"grace-ms"},
                        util::setInt(&Flags::grace_period_millis), "<MILLIS>",
                        "How long a killed child may take to die")
      .addOptionWithArg({"cpu-limit-ms"},
                        util::setInt(&Flags::cpu_limit_millis), "<MILLIS>",
                        "CPU time ceiling, 0 to use the timeout")
      .addOptionWithArg({"memory-limit-kb"},
                        util::setInt(&Flags::memory_limit_kb), "<KB>",
                        "Address space ceiling, 0 to disable")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages too")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainBuilder::Validity TiersMain::Run() {
  std::vector<policy::Tier> tiers = policy::AllTiers();
  if (!tier.empty()) {
    policy::Tier selected;
    if (!policy::ParseTier(tier, &selected)) {
      return kj::str("Unknown tier ", tier.c_str());
    }
    tiers = {selected};
  }
  const policy::CapabilityPolicy& capabilities =
      policy::CapabilityPolicy::Get();
  for (policy::Tier t : tiers) {
    printf("%s:\n", policy::TierName(t).c_str());  // NOLINT
    for (const auto& entry : capabilities.Resolve(t)) {
      if (entry.second.IsModule()) {
        printf("  %s:", entry.first.c_str());  // NOLINT
        for (const auto& member : entry.second.AsModule().Members()) {
          printf(" %s", member.first.c_str());  // NOLINT
        }
        printf("\n");  // NOLINT
      } else {
        printf("  %s\n", entry.first.c_str());  // NOLINT
      }
    }
  }
  fflush(stdout);
  return true;
}

kj::MainFunc TiersMain::getMain() {
  return kj::MainBuilder(context, "Quantbox (" + util::version + ")",
                         "Lists the names each capability tier exposes")
      .addOptionWithArg({'T', "tier"}, util::setString(&tier), "<TIER>",
                        "Only list this tier")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace runner
