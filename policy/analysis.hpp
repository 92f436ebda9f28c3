#ifndef POLICY_ANALYSIS_HPP
#define POLICY_ANALYSIS_HPP

#include <memory>

#include "script/callable.hpp"

namespace policy {

// Library handles of the analysis tier. Each exposes a reviewed set of
// functions over numbers and numeric series (lists of numbers).

// sqrt exp log log10 floor ceil fabs pow isnan isinf, pi e inf nan
std::shared_ptr<const script::Module> MathModule();

// mean median variance pvariance stdev pstdev correlation
std::shared_ptr<const script::Module> StatsModule();

// Technical analysis over series: sma ema rsi pct_change diff cumsum
// rolling_max rolling_min rolling_std. Results have the length of the input,
// with None where the window is not yet full.
std::shared_ptr<const script::Module> TaModule();

}  // namespace policy

#endif
