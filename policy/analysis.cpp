#include "policy/analysis.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "script/errors.hpp"
#include "script/operators.hpp"

namespace policy {
namespace {

using script::CallArgs;
using script::Interpreter;
using script::List;
using script::Value;

using Series = std::vector<double>;

Series SeriesArg(const std::string& fn, const Value& v) {
  Series out;
  for (const Value& item : script::Iterate(v)) {
    out.push_back(script::NumberArg(fn, item));
  }
  return out;
}

int64_t WindowArg(const std::string& fn, const Value& v) {
  int64_t window = script::IntArg(fn, v);
  if (window < 1) {
    throw script::ValueError(fn + "() window must be a positive integer");
  }
  return window;
}

// Converts a computed series back into a list, with None where no value is
// defined yet.
Value ToList(const Series& values, size_t undefined_prefix) {
  List out;
  out.reserve(values.size());
  for (size_t i = 0; i < values.size(); i++) {
    out.push_back(i < undefined_prefix ? Value() : Value::Float(values[i]));
  }
  return Value::NewList(std::move(out));
}

/*
 * math
 */

[[noreturn]] void DomainError() { throw script::ValueError("math domain error"); }

double CheckRange(double result, double input) {
  if (std::isinf(result) && std::isfinite(input)) {
    throw script::OverflowError("math range error");
  }
  return result;
}

using UnaryMath = double (*)(const std::string& fn, double x);

double Sqrt(const std::string&, double x) {
  if (x < 0) DomainError();
  return std::sqrt(x);
}

double Exp(const std::string&, double x) { return CheckRange(std::exp(x), x); }

double Log10(const std::string&, double x) {
  if (x <= 0) DomainError();
  return std::log10(x);
}

double Fabs(const std::string&, double x) { return std::fabs(x); }

Value Log(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("math.log", args);
  script::ExpectArgs("math.log", args, 1, 2);
  double x = script::NumberArg("math.log", args.positional[0]);
  if (x <= 0) DomainError();
  if (args.positional.size() == 1) return Value::Float(std::log(x));
  double base = script::NumberArg("math.log", args.positional[1]);
  if (base <= 0) DomainError();
  if (base == 1) throw script::ZeroDivisionError("float division by zero");
  return Value::Float(std::log(x) / std::log(base));
}

Value Pow(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("math.pow", args);
  script::ExpectArgs("math.pow", args, 2, 2);
  double x = script::NumberArg("math.pow", args.positional[0]);
  double y = script::NumberArg("math.pow", args.positional[1]);
  if (x == 0 && y < 0) DomainError();
  if (x < 0 && std::isfinite(y) && y != std::floor(y)) DomainError();
  double r = std::pow(x, y);
  if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
    throw script::OverflowError("math range error");
  }
  return Value::Float(r);
}

// floor and ceil return ints; ints pass through unchanged.
Value Rounding(const std::string& fn, double (*op)(double), CallArgs& args) {
  script::ExpectNoKeywords(fn, args);
  script::ExpectArgs(fn, args, 1, 1);
  const Value& v = args.positional[0];
  if (!v.IsFloat()) return Value::Int(script::IntArg(fn, v));
  return Value::Int(script::FloatToInt(op(v.AsFloat())));
}

Value Classify(const std::string& fn, bool (*op)(double), CallArgs& args) {
  script::ExpectNoKeywords(fn, args);
  script::ExpectArgs(fn, args, 1, 1);
  return Value::Bool(op(script::NumberArg(fn, args.positional[0])));
}

/*
 * stats
 */

double Mean(const Series& xs) {
  double sum = 0;
  for (double x : xs) sum += x;
  return sum / xs.size();
}

// Sum of squared deviations from the mean.
double SumSquares(const Series& xs) {
  double mean = Mean(xs);
  double ss = 0;
  for (double x : xs) ss += (x - mean) * (x - mean);
  return ss;
}

Series StatsData(const std::string& fn, CallArgs& args, size_t min_points,
                 const char* requirement) {
  script::ExpectNoKeywords(fn, args);
  script::ExpectArgs(fn, args, 1, 1);
  Series xs = SeriesArg(fn, args.positional[0]);
  if (xs.size() < min_points) {
    throw script::ValueError(fn.substr(fn.find('.') + 1) + " requires " +
                             requirement);
  }
  return xs;
}

Value StatsMean(Interpreter*, CallArgs& args) {
  return Value::Float(
      Mean(StatsData("stats.mean", args, 1, "at least one data point")));
}

Value StatsMedian(Interpreter*, CallArgs& args) {
  Series xs = StatsData("stats.median", args, 1, "at least one data point");
  std::sort(xs.begin(), xs.end());
  size_t n = xs.size();
  if (n % 2 == 1) return Value::Float(xs[n / 2]);
  return Value::Float((xs[n / 2 - 1] + xs[n / 2]) / 2);
}

Value StatsVariance(Interpreter*, CallArgs& args) {
  Series xs = StatsData("stats.variance", args, 2, "at least two data points");
  return Value::Float(SumSquares(xs) / (xs.size() - 1));
}

Value StatsPvariance(Interpreter*, CallArgs& args) {
  Series xs = StatsData("stats.pvariance", args, 1, "at least one data point");
  return Value::Float(SumSquares(xs) / xs.size());
}

Value StatsStdev(Interpreter*, CallArgs& args) {
  Series xs = StatsData("stats.stdev", args, 2, "at least two data points");
  return Value::Float(std::sqrt(SumSquares(xs) / (xs.size() - 1)));
}

Value StatsPstdev(Interpreter*, CallArgs& args) {
  Series xs = StatsData("stats.pstdev", args, 1, "at least one data point");
  return Value::Float(std::sqrt(SumSquares(xs) / xs.size()));
}

Value StatsCorrelation(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("stats.correlation", args);
  script::ExpectArgs("stats.correlation", args, 2, 2);
  Series xs = SeriesArg("stats.correlation", args.positional[0]);
  Series ys = SeriesArg("stats.correlation", args.positional[1]);
  if (xs.size() != ys.size()) {
    throw script::ValueError(
        "correlation requires that both inputs have same number of data "
        "points");
  }
  if (xs.size() < 2) {
    throw script::ValueError("correlation requires at least two data points");
  }
  double mx = Mean(xs), my = Mean(ys);
  double sxy = 0, sxx = 0, syy = 0;
  for (size_t i = 0; i < xs.size(); i++) {
    sxy += (xs[i] - mx) * (ys[i] - my);
    sxx += (xs[i] - mx) * (xs[i] - mx);
    syy += (ys[i] - my) * (ys[i] - my);
  }
  if (sxx == 0 || syy == 0) {
    throw script::ValueError("at least one of the inputs is constant");
  }
  return Value::Float(sxy / std::sqrt(sxx * syy));
}

/*
 * ta
 */

// Parses (series, window) with an optional default window.
Series WindowedData(const std::string& fn, CallArgs& args, int64_t* window,
                    int64_t default_window = 0) {
  Value w = script::TakeKeyword(&args, "window");
  script::ExpectNoKeywords(fn, args);
  script::ExpectArgs(fn, args, default_window > 0 || !w.IsNone() ? 1 : 2, 2);
  if (args.positional.size() == 2) {
    if (!w.IsNone()) {
      throw script::TypeError(fn + "() got multiple values for argument "
                                   "'window'");
    }
    w = args.positional[1];
  }
  *window = w.IsNone() ? default_window : WindowArg(fn, w);
  return SeriesArg(fn, args.positional[0]);
}

Value TaSma(Interpreter*, CallArgs& args) {
  int64_t window;
  Series xs = WindowedData("ta.sma", args, &window);
  size_t w = window;
  Series out(xs.size());
  double sum = 0;
  for (size_t i = 0; i < xs.size(); i++) {
    sum += xs[i];
    if (i >= w) sum -= xs[i - w];
    out[i] = sum / w;
  }
  return ToList(out, w - 1);
}

// Exponential moving average with alpha = 2 / (span + 1), seeded with the
// first value.
Value TaEma(Interpreter*, CallArgs& args) {
  int64_t span;
  Series xs = WindowedData("ta.ema", args, &span);
  double alpha = 2.0 / (span + 1);
  Series out(xs.size());
  for (size_t i = 0; i < xs.size(); i++) {
    out[i] = i == 0 ? xs[0] : alpha * xs[i] + (1 - alpha) * out[i - 1];
  }
  return ToList(out, 0);
}

// Relative strength index with Wilder's smoothing. The first `period`
// entries are None.
Value TaRsi(Interpreter*, CallArgs& args) {
  int64_t window;
  Series xs = WindowedData("ta.rsi", args, &window, 14);
  size_t period = window;
  Series out(xs.size());
  if (xs.size() <= period) return ToList(out, xs.size());
  double gain = 0, loss = 0;
  for (size_t i = 1; i <= period; i++) {
    double change = xs[i] - xs[i - 1];
    if (change > 0) {
      gain += change;
    } else {
      loss -= change;
    }
  }
  gain /= period;
  loss /= period;
  auto rsi = [](double g, double l) {
    if (l == 0) return g == 0 ? 50.0 : 100.0;
    return 100.0 - 100.0 / (1.0 + g / l);
  };
  out[period] = rsi(gain, loss);
  for (size_t i = period + 1; i < xs.size(); i++) {
    double change = xs[i] - xs[i - 1];
    gain = (gain * (period - 1) + std::max(change, 0.0)) / period;
    loss = (loss * (period - 1) + std::max(-change, 0.0)) / period;
    out[i] = rsi(gain, loss);
  }
  return ToList(out, period);
}

Value TaPctChange(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("ta.pct_change", args);
  script::ExpectArgs("ta.pct_change", args, 1, 1);
  Series xs = SeriesArg("ta.pct_change", args.positional[0]);
  Series out(xs.size());
  for (size_t i = 1; i < xs.size(); i++) {
    out[i] = (xs[i] - xs[i - 1]) / xs[i - 1];
  }
  return ToList(out, 1);
}

Value TaDiff(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("ta.diff", args);
  script::ExpectArgs("ta.diff", args, 1, 1);
  Series xs = SeriesArg("ta.diff", args.positional[0]);
  Series out(xs.size());
  for (size_t i = 1; i < xs.size(); i++) out[i] = xs[i] - xs[i - 1];
  return ToList(out, 1);
}

Value TaCumsum(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("ta.cumsum", args);
  script::ExpectArgs("ta.cumsum", args, 1, 1);
  Series xs = SeriesArg("ta.cumsum", args.positional[0]);
  Series out(xs.size());
  double sum = 0;
  for (size_t i = 0; i < xs.size(); i++) {
    sum += xs[i];
    out[i] = sum;
  }
  return ToList(out, 0);
}

Value Rolling(const std::string& fn, CallArgs& args,
              double (*reduce)(Series::const_iterator, Series::const_iterator),
              size_t min_window) {
  int64_t window;
  Series xs = WindowedData(fn, args, &window);
  size_t w = window;
  Series out(xs.size());
  if (w < min_window) return ToList(out, xs.size());
  for (size_t i = w - 1; i < xs.size(); i++) {
    out[i] = reduce(xs.begin() + (i + 1 - w), xs.begin() + (i + 1));
  }
  return ToList(out, w - 1);
}

double RangeMax(Series::const_iterator begin, Series::const_iterator end) {
  return *std::max_element(begin, end);
}

double RangeMin(Series::const_iterator begin, Series::const_iterator end) {
  return *std::min_element(begin, end);
}

// Sample standard deviation of the window.
double RangeStd(Series::const_iterator begin, Series::const_iterator end) {
  Series window(begin, end);
  return std::sqrt(SumSquares(window) / (window.size() - 1));
}

Value TaRollingMax(Interpreter*, CallArgs& args) {
  return Rolling("ta.rolling_max", args, RangeMax, 1);
}

Value TaRollingMin(Interpreter*, CallArgs& args) {
  return Rolling("ta.rolling_min", args, RangeMin, 1);
}

Value TaRollingStd(Interpreter*, CallArgs& args) {
  return Rolling("ta.rolling_std", args, RangeStd, 2);
}

}  // namespace

std::shared_ptr<const script::Module> MathModule() {
  auto module = std::make_shared<script::Module>("math");
  const std::pair<const char*, UnaryMath> kUnary[] = {
      {"sqrt", Sqrt}, {"exp", Exp}, {"log10", Log10}, {"fabs", Fabs}};
  for (const auto& entry : kUnary) {
    std::string name = std::string("math.") + entry.first;
    UnaryMath op = entry.second;
    module->AddFunction(entry.first, [name, op](Interpreter*, CallArgs& args) {
      script::ExpectNoKeywords(name, args);
      script::ExpectArgs(name, args, 1, 1);
      return Value::Float(op(name, script::NumberArg(name, args.positional[0])));
    });
  }
  module->AddFunction("log", Log);
  module->AddFunction("pow", Pow);
  module->AddFunction("floor", [](Interpreter*, CallArgs& args) {
    return Rounding("math.floor", [](double d) { return std::floor(d); }, args);
  });
  module->AddFunction("ceil", [](Interpreter*, CallArgs& args) {
    return Rounding("math.ceil", [](double d) { return std::ceil(d); }, args);
  });
  module->AddFunction("isnan", [](Interpreter*, CallArgs& args) {
    return Classify("math.isnan", [](double d) { return std::isnan(d); }, args);
  });
  module->AddFunction("isinf", [](Interpreter*, CallArgs& args) {
    return Classify("math.isinf", [](double d) { return std::isinf(d); }, args);
  });
  module->Add("pi", Value::Float(M_PI));
  module->Add("e", Value::Float(M_E));
  module->Add("inf", Value::Float(std::numeric_limits<double>::infinity()));
  module->Add("nan", Value::Float(std::numeric_limits<double>::quiet_NaN()));
  return module;
}

std::shared_ptr<const script::Module> StatsModule() {
  auto module = std::make_shared<script::Module>("stats");
  module->AddFunction("mean", StatsMean);
  module->AddFunction("median", StatsMedian);
  module->AddFunction("variance", StatsVariance);
  module->AddFunction("pvariance", StatsPvariance);
  module->AddFunction("stdev", StatsStdev);
  module->AddFunction("pstdev", StatsPstdev);
  module->AddFunction("correlation", StatsCorrelation);
  return module;
}

std::shared_ptr<const script::Module> TaModule() {
  auto module = std::make_shared<script::Module>("ta");
  module->AddFunction("sma", TaSma);
  module->AddFunction("ema", TaEma);
  module->AddFunction("rsi", TaRsi);
  module->AddFunction("pct_change", TaPctChange);
  module->AddFunction("diff", TaDiff);
  module->AddFunction("cumsum", TaCumsum);
  module->AddFunction("rolling_max", TaRollingMax);
  module->AddFunction("rolling_min", TaRollingMin);
  module->AddFunction("rolling_std", TaRollingStd);
  return module;
}

}  // namespace policy
