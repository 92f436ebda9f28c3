#include "coordinator/coordinator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <signal.h>
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using ::testing::HasSubstr;
using namespace coordinator;
using script::Value;

Config TestConfig() {
  Config config;
  config.max_timeout_millis = 10000;
  config.workers = 2;
  config.grace_period_millis = 1000;
  return config;
}

ExecutionRequest Request(const std::string& code,
                         int64_t timeout_millis = 5000) {
  ExecutionRequest request;
  request.code = code;
  request.timeout_millis = timeout_millis;
  return request;
}

// Returns a copy, results are usually temporaries.
ExecutionError ExpectFailure(const ExecutionResult& result, ErrorKind kind) {
  EXPECT_FALSE(result.Succeeded());
  EXPECT_TRUE(result.HasError());
  EXPECT_FALSE(result.HasResult());
  EXPECT_TRUE(result.UpdatedBindings().empty());
  EXPECT_EQ(ErrorKindName(result.Error().kind), ErrorKindName(kind))
      << result.Error().ToString();
  return result.Error();
}

class CoordinatorTest : public ::testing::Test {
 protected:
  CoordinatorTest() : coord(TestConfig()) {}

  Coordinator coord;
};

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, ReturnsTheResult) {
  ExecutionRequest request = Request(
      "total = 0\n"
      "for p in prices:\n"
      "    total += p\n"
      "state = {'avg': total / len(prices)}\n"
      "result = 'buy' if prices[-1] > state['avg'] else 'sell'\n");
  request.bindings["prices"] =
      Value::NewList({Value::Int(10), Value::Int(11), Value::Int(15)});
  request.observe = {"state", "missing"};
  ExecutionResult result = coord.Run(request);
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_FALSE(result.HasError());
  ASSERT_TRUE(result.HasResult());
  EXPECT_EQ(result.Result().AsStr(), "buy");
  ASSERT_EQ(result.UpdatedBindings().size(), 1u);
  EXPECT_EQ(result.UpdatedBindings().at("state").Repr(), "{'avg': 12.0}");
  EXPECT_GE(result.Usage().wall_millis, 0);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, SingleLinePrograms) {
  ExecutionResult result = coord.Run(Request("result = 2 + 2"));
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Result().AsInt(), 4);
  EXPECT_EQ(result.Stdout().data, "");
  EXPECT_FALSE(result.HasError());

  ExpectFailure(coord.Run(Request("while True: pass", 1000)),
                ErrorKind::TIMED_OUT);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, SameRequestSameOutcome) {
  ExecutionRequest request =
      Request("xs = sorted([3, 1, 2])\nprint(xs)\nresult = {'xs': xs}\n");
  ExecutionResult first = coord.Run(request);
  ExecutionResult second = coord.Run(request);
  ASSERT_TRUE(first.Succeeded());
  ASSERT_TRUE(second.Succeeded());
  EXPECT_TRUE(first.Result().Equals(second.Result()));
  EXPECT_EQ(first.Stdout().data, second.Stdout().data);
  EXPECT_EQ(first.Stdout().data, "[1, 2, 3]\n");
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, NoResultIsStillSuccess) {
  ExecutionResult result = coord.Run(Request("x = 1\n"));
  EXPECT_TRUE(result.Succeeded());
  EXPECT_FALSE(result.HasResult());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, CapturesOutput) {
  ExecutionResult result =
      coord.Run(Request("print('hello', 42)\nwarn('careful')\n"));
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Stdout().data, "hello 42\n");
  EXPECT_FALSE(result.Stdout().truncated);
  EXPECT_EQ(result.Stderr().data, "careful\n");
}

// NOLINTNEXTLINE
TEST(Coordinator, TruncatesOutput) {
  Config config = TestConfig();
  config.output_capacity = 16;
  Coordinator coord(config);
  ExecutionResult result =
      coord.Run(Request("for i in range(100):\n    print('x' * 50)\n"));
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Stdout().data, std::string(16, 'x'));
  EXPECT_TRUE(result.Stdout().truncated);
  EXPECT_FALSE(result.Stderr().truncated);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, OutputBeforeAFaultIsKept) {
  ExecutionResult result = coord.Run(Request("print('before')\nx = 1 / 0\n"));
  ExpectFailure(result, ErrorKind::RUNTIME_FAULT);
  EXPECT_EQ(result.Stdout().data, "before\n");
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, InvalidRequests) {
  const ExecutionError& zero = ExpectFailure(coord.Run(Request("x = 1\n", 0)),
                                             ErrorKind::INVALID_REQUEST);
  EXPECT_THAT(zero.message, HasSubstr("positive"));

  const ExecutionError& big = ExpectFailure(
      coord.Run(Request("x = 1\n", 20000)), ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(big.limit_millis, 10000);

  ExpectFailure(coord.Run(Request("  \n\t\n")), ErrorKind::INVALID_REQUEST);

  ExecutionRequest request = Request("x = 1\n");
  request.observe = {"not a name"};
  ExpectFailure(coord.Run(request), ErrorKind::INVALID_REQUEST);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, RejectedBindings) {
  ExecutionRequest request = Request("print('ran')\nwarn('ran')\nx = 1\n");
  // The program never starts, so nothing is captured.
  auto rejection = [this, &request]() {
    ExecutionResult result = coord.Run(request);
    EXPECT_EQ(result.Stdout().data, "");
    EXPECT_EQ(result.Stderr().data, "");
    return ExpectFailure(result, ErrorKind::REJECTED_BINDING).label;
  };
  request.bindings["2fast"] = Value::Int(1);
  EXPECT_EQ(rejection(), "InvalidName");

  request.bindings.clear();
  request.bindings["print"] = Value::Int(1);
  EXPECT_EQ(rejection(), "ReservedName");

  request.bindings.clear();
  request.bindings["result"] = Value::Int(1);
  EXPECT_EQ(rejection(), "ReservedName");

  request.bindings.clear();
  Value cyclic = Value::NewList();
  cyclic.AsList().push_back(cyclic);
  request.bindings["xs"] = cyclic;
  EXPECT_EQ(rejection(), "NotTransferable");
  cyclic.AsList().clear();
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, SyntaxFault) {
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("x = 1\nif x >:\n    pass\n")),
      ErrorKind::SYNTAX_FAULT);
  EXPECT_EQ(error.label, "SyntaxError");
  EXPECT_EQ(error.line, 2);
  EXPECT_GT(error.column, 0);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, ImportIsASyntaxFault) {
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("import os\nresult = os.getcwd()\n")),
      ErrorKind::SYNTAX_FAULT);
  EXPECT_EQ(error.line, 1);
  EXPECT_THAT(error.message, HasSubstr("import"));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, RuntimeFault) {
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("x = 1\ny = 2\nresult = x + undefined_name\n")),
      ErrorKind::RUNTIME_FAULT);
  EXPECT_EQ(error.label, "NameError");
  EXPECT_EQ(error.line, 3);
  EXPECT_THAT(error.message, HasSubstr("undefined_name"));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, NonDataResultIsAFault) {
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("def f():\n    return 1\nresult = f\n")),
      ErrorKind::RUNTIME_FAULT);
  EXPECT_EQ(error.label, "TypeError");
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, TierLimitsTheNames) {
  ExecutionRequest request = Request("result = math.sqrt(16)\n");
  request.tier = policy::Tier::MINIMAL;
  EXPECT_EQ(ExpectFailure(coord.Run(request), ErrorKind::RUNTIME_FAULT).label,
            "NameError");

  request.tier = policy::Tier::ANALYSIS;
  ExecutionResult result = coord.Run(request);
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Result().Repr(), "4.0");
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, RunsDoNotShareState) {
  Value prices = Value::NewList({Value::Int(1), Value::Int(2)});
  ExecutionRequest first = Request("prices.append(3)\nleftover = 1\n");
  first.bindings["prices"] = prices;
  first.observe = {"prices"};
  ExecutionResult result = coord.Run(first);
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.UpdatedBindings().at("prices").Repr(), "[1, 2, 3]");
  // The caller's value is untouched.
  EXPECT_EQ(prices.Repr(), "[1, 2]");

  ExpectFailure(coord.Run(Request("result = leftover\n")),
                ErrorKind::RUNTIME_FAULT);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, TimedOut) {
  auto start = std::chrono::steady_clock::now();
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("while True:\n    pass\n", 200)),
      ErrorKind::TIMED_OUT);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(error.limit_millis, 200);
  EXPECT_GE(error.elapsed_millis, 200);
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, OutputBeforeATimeoutIsKept) {
  ExecutionResult result =
      coord.Run(Request("print('started')\nwhile True:\n    pass\n", 200));
  ExpectFailure(result, ErrorKind::TIMED_OUT);
  EXPECT_EQ(result.Stdout().data, "started\n");
}

// NOLINTNEXTLINE
TEST(Coordinator, CpuLimit) {
  Config config = TestConfig();
  config.cpu_limit_millis = 500;
  Coordinator coord(config);
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("while True:\n    pass\n", 8000)),
      ErrorKind::RESOURCE_EXCEEDED);
  EXPECT_EQ(error.resource, "cpu");
  EXPECT_EQ(error.limit_millis, 500);
}

// NOLINTNEXTLINE
TEST(Coordinator, MemoryLimit) {
  Config config = TestConfig();
  config.memory_limit_kb = 192 * 1024;
  Coordinator coord(config);
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("xs = [0] * 100000000\nresult = len(xs)\n")),
      ErrorKind::RESOURCE_EXCEEDED);
  EXPECT_EQ(error.resource, "memory");
}

// NOLINTNEXTLINE
TEST(Coordinator, ReportLimit) {
  Config config = TestConfig();
  config.report_capacity = 1024;
  Coordinator coord(config);
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("result = 'x' * 100000\n")),
      ErrorKind::RESOURCE_EXCEEDED);
  EXPECT_EQ(error.resource, "report");
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, CancelledBeforeStart) {
  CancellationToken token;
  token.Cancel();
  const ExecutionError& error =
      ExpectFailure(coord.Run(Request("x = 1\n"), token), ErrorKind::CANCELLED);
  EXPECT_THAT(error.message, HasSubstr("before it started"));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, CancelledWhileRunning) {
  CancellationToken token;
  std::thread canceller([token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.Cancel();
  });
  ExecutionResult result =
      coord.Run(Request("while True:\n    pass\n", 8000), token);
  canceller.join();
  ExpectFailure(result, ErrorKind::CANCELLED);
  EXPECT_LT(result.Usage().wall_millis, 5000);
}

// NOLINTNEXTLINE
TEST(Coordinator, TerminationFault) {
  Config config = TestConfig();
  config.grace_period_millis = 100;
  Coordinator coord(config);
  std::atomic<pid_t> child{0};
  coord.SetKillFunction([&child](pid_t pid, int) {
    child = pid;
    return 0;
  });
  const ExecutionError& error = ExpectFailure(
      coord.Run(Request("while True:\n    pass\n", 100)),
      ErrorKind::TERMINATION_FAULT);
  EXPECT_TRUE(IsOperationalFault(error.kind));
  EXPECT_THAT(error.message, HasSubstr("still alive"));
  ASSERT_GT(child.load(), 0);
  EXPECT_EQ(kill(child.load(), SIGKILL), 0);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, ConcurrentRuns) {
  std::vector<ExecutionResult> results(6);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); i++) {
    threads.emplace_back([this, i, &results]() {
      ExecutionRequest request = Request(
          "mine = [n] * (n + 1)\nresult = n * n\nprint(n)\n");
      request.bindings["n"] = Value::Int(static_cast<int64_t>(i));
      request.observe = {"mine"};
      results[i] = coord.Run(request);
    });
  }
  for (std::thread& t : threads) t.join();
  for (size_t i = 0; i < results.size(); i++) {
    ASSERT_TRUE(results[i].Succeeded()) << results[i].Error().ToString();
    EXPECT_EQ(results[i].Result().AsInt(), static_cast<int64_t>(i * i));
    EXPECT_EQ(results[i].Stdout().data, std::to_string(i) + "\n");
    ASSERT_EQ(results[i].UpdatedBindings().size(), 1u);
    const Value& mine = results[i].UpdatedBindings().at("mine");
    ASSERT_EQ(mine.AsList().size(), i + 1);
    for (const Value& v : mine.AsList()) {
      EXPECT_EQ(v.AsInt(), static_cast<int64_t>(i));
    }
  }
  EXPECT_EQ(coord.Pool().Running(), 0u);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, DeeplyNestedDictsAreReturned) {
  // As deep as a value may be: 32 dicts around an int.
  ExecutionRequest request = Request(
      "v = 0\n"
      "for i in range(32):\n"
      "    v = {'k': v}\n"
      "result = v\n"
      "nested = v\n");
  request.observe = {"nested"};
  ExecutionResult result = coord.Run(request);
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  int depth = 0;
  Value v = result.Result();
  while (v.IsDict()) {
    Value next = *v.AsDict().Find(Value::Str("k"));
    v = next;
    depth++;
  }
  EXPECT_EQ(depth, 32);
  EXPECT_EQ(v.AsInt(), 0);
  EXPECT_TRUE(result.UpdatedBindings().at("nested").Equals(result.Result()));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorTest, DeepNestingIsTornDownInTheChild) {
  ExecutionResult result = coord.Run(Request(
      "a = []\n"
      "for i in range(200000):\n"
      "    a = [a]\n"
      "result = 1\n"));
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Result().AsInt(), 1);
}

// NOLINTNEXTLINE
TEST(Coordinator, LargeRangesRunInConstantMemory) {
  Config config = TestConfig();
  // Far less than a materialized list of two million ints needs.
  config.memory_limit_kb = 192 * 1024;
  Coordinator coord(config);
  ExecutionResult result = coord.Run(Request(
      "total = 0\n"
      "for i in range(2000000):\n"
      "    total += i\n"
      "result = total\n",
      10000));
  ASSERT_TRUE(result.Succeeded()) << result.Error().ToString();
  EXPECT_EQ(result.Result().AsInt(), 1999999000000LL);
}

// NOLINTNEXTLINE
TEST(CrashError, SignalsAreProgramFaults) {
  sandbox::RunInfo info;
  info.state = sandbox::RunState::CRASHED;
  info.signal = SIGSEGV;
  info.message = "killed by signal: Segmentation fault";
  ExecutionError error = CrashError(info);
  EXPECT_EQ(ErrorKindName(error.kind), ErrorKindName(ErrorKind::RUNTIME_FAULT));
  EXPECT_EQ(error.label, "Crashed");
  EXPECT_EQ(error.message, info.message);
}

// NOLINTNEXTLINE
TEST(CrashError, InternalExitIsAnInternalError) {
  sandbox::RunInfo info;
  info.state = sandbox::RunState::CRASHED;
  info.status_code = sandbox::Governor::kExitInternalError;
  info.message = "exited with status 4";
  ExecutionError error = CrashError(info);
  EXPECT_EQ(ErrorKindName(error.kind),
            ErrorKindName(ErrorKind::INTERNAL_ERROR));
  EXPECT_TRUE(IsOperationalFault(error.kind));
  EXPECT_THAT(error.message, HasSubstr("exited with status 4"));

  info.status_code = 7;
  info.message = "exited with status 7";
  EXPECT_EQ(ErrorKindName(CrashError(info).kind),
            ErrorKindName(ErrorKind::RUNTIME_FAULT));
}

// NOLINTNEXTLINE
TEST(ExecutionError, ToString) {
  ExecutionError error;
  error.kind = ErrorKind::RUNTIME_FAULT;
  error.label = "KeyError";
  error.message = "'k'";
  error.line = 4;
  EXPECT_THAT(error.ToString(), HasSubstr("RuntimeFault (KeyError): 'k'"));
  EXPECT_THAT(error.ToString(), HasSubstr("line 4"));
  EXPECT_FALSE(IsOperationalFault(error.kind));
  EXPECT_TRUE(IsOperationalFault(ErrorKind::INTERNAL_ERROR));
}

}  // namespace
