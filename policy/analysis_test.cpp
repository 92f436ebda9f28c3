#include "policy/analysis.hpp"

#include <cmath>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/parser.hpp"

namespace {

class AnalysisTest : public ::testing::Test {
 protected:
  AnalysisTest() : interpreter(&out, &out) {
    interpreter.Bind("math", script::Value::Library(policy::MathModule()));
    interpreter.Bind("stats", script::Value::Library(policy::StatsModule()));
    interpreter.Bind("ta", script::Value::Library(policy::TaModule()));
  }

  script::Value Eval(const std::string& expr) {
    interpreter.Run(script::Parse("_v = " + expr + "\n"));
    return *interpreter.Lookup("_v");
  }

  std::string Repr(const std::string& expr) { return Eval(expr).Repr(); }

  double Number(const std::string& expr) { return Eval(expr).ToDouble(); }

  std::string FaultLabel(const std::string& expr) {
    try {
      Eval(expr);
    } catch (const script::ScriptError& e) {
      return e.Label();
    }
    return "";
  }

  script::StringSink out;
  script::Interpreter interpreter;
};

// NOLINTNEXTLINE
TEST_F(AnalysisTest, Math) {
  EXPECT_DOUBLE_EQ(Number("math.sqrt(2)"), 1.4142135623730951);
  EXPECT_DOUBLE_EQ(Number("math.log(8, 2)"), 3.0);
  EXPECT_DOUBLE_EQ(Number("math.log10(1000)"), 3.0);
  EXPECT_DOUBLE_EQ(Number("math.pow(2, 0.5)"), 1.4142135623730951);
  EXPECT_EQ(Repr("math.floor(-1.5)"), "-2");
  EXPECT_EQ(Repr("math.ceil(1.2)"), "2");
  EXPECT_EQ(Repr("math.isnan(math.nan)"), "True");
  EXPECT_EQ(Repr("math.isinf(-math.inf)"), "True");
  EXPECT_DOUBLE_EQ(Number("math.pi"), M_PI);
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, MathErrors) {
  EXPECT_EQ(FaultLabel("math.sqrt(-1)"), "ValueError");
  EXPECT_EQ(FaultLabel("math.log(0)"), "ValueError");
  EXPECT_EQ(FaultLabel("math.exp(1000)"), "OverflowError");
  EXPECT_EQ(FaultLabel("math.sqrt('x')"), "TypeError");
  EXPECT_EQ(FaultLabel("math.system"), "AttributeError");
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, Stats) {
  EXPECT_DOUBLE_EQ(Number("stats.mean([1, 2, 3, 4])"), 2.5);
  EXPECT_DOUBLE_EQ(Number("stats.median([5, 1, 3])"), 3);
  EXPECT_DOUBLE_EQ(Number("stats.median([4, 1, 3, 2])"), 2.5);
  EXPECT_DOUBLE_EQ(Number("stats.variance([2, 4, 4, 4, 5, 5, 7, 9])"),
                   32.0 / 7);
  EXPECT_DOUBLE_EQ(Number("stats.pstdev([2, 4, 4, 4, 5, 5, 7, 9])"), 2.0);
  EXPECT_DOUBLE_EQ(Number("stats.correlation([1, 2, 3], [2, 4, 6])"), 1.0);
  EXPECT_DOUBLE_EQ(Number("stats.correlation([1, 2, 3], [3, 2, 1])"), -1.0);
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, StatsErrors) {
  EXPECT_EQ(FaultLabel("stats.mean([])"), "ValueError");
  EXPECT_EQ(FaultLabel("stats.stdev([1])"), "ValueError");
  EXPECT_EQ(FaultLabel("stats.correlation([1, 2], [1, 2, 3])"), "ValueError");
  EXPECT_EQ(FaultLabel("stats.correlation([1, 1], [1, 2])"), "ValueError");
  EXPECT_EQ(FaultLabel("stats.mean([1, 'a'])"), "TypeError");
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, MovingAverages) {
  EXPECT_EQ(Repr("ta.sma([1, 2, 3, 4, 5], 3)"),
            "[None, None, 2.0, 3.0, 4.0]");
  EXPECT_EQ(Repr("ta.sma([1, 2], window=5)"), "[None, None]");
  EXPECT_EQ(Repr("ta.ema([1, 2, 3], 3)"), "[1.0, 1.5, 2.25]");
  EXPECT_EQ(FaultLabel("ta.sma([1, 2], 0)"), "ValueError");
  EXPECT_EQ(FaultLabel("ta.sma([1, 2])"), "TypeError");
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, Differences) {
  EXPECT_EQ(Repr("ta.diff([1, 4, 9])"), "[None, 3.0, 5.0]");
  EXPECT_EQ(Repr("ta.pct_change([100, 110, 99])"), "[None, 0.1, -0.1]");
  EXPECT_EQ(Repr("ta.cumsum([1, 2, 3])"), "[1.0, 3.0, 6.0]");
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, Rolling) {
  EXPECT_EQ(Repr("ta.rolling_max([1, 3, 2, 5], 2)"), "[None, 3.0, 3.0, 5.0]");
  EXPECT_EQ(Repr("ta.rolling_min([1, 3, 2, 5], 2)"), "[None, 1.0, 2.0, 2.0]");
  EXPECT_EQ(Repr("ta.rolling_std([1, 1, 1], 1)"), "[None, None, None]");
  EXPECT_DOUBLE_EQ(Eval("ta.rolling_std([1, 3], 2)").AsList()[1].AsFloat(),
                   1.4142135623730951);
}

// NOLINTNEXTLINE
TEST_F(AnalysisTest, Rsi) {
  script::Value up = Eval("ta.rsi([1, 2, 3, 4, 5], 3)");
  ASSERT_EQ(up.AsList().size(), 5u);
  EXPECT_TRUE(up.AsList()[2].IsNone());
  EXPECT_DOUBLE_EQ(up.AsList()[3].AsFloat(), 100.0);
  EXPECT_DOUBLE_EQ(up.AsList()[4].AsFloat(), 100.0);
  EXPECT_EQ(Repr("ta.rsi([1, 1, 1], 2)"), "[None, None, 50.0]");
  EXPECT_EQ(Repr("ta.rsi([1, 2])"), "[None, None]");
}

}  // namespace
