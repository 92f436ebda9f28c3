#include "policy/capability_policy.hpp"

#include "policy/analysis.hpp"
#include "policy/primitives.hpp"
#include "script/lexer.hpp"

namespace policy {

bool ParseTier(const std::string& name, Tier* tier) {
  for (Tier t : AllTiers()) {
    if (TierName(t) == name) {
      *tier = t;
      return true;
    }
  }
  return false;
}

std::string TierName(Tier tier) {
  switch (tier) {
    case Tier::MINIMAL:
      return "minimal";
    case Tier::ANALYSIS:
      return "analysis";
  }
  return "minimal";
}

std::vector<Tier> AllTiers() { return {Tier::MINIMAL, Tier::ANALYSIS}; }

Tier TierFromRaw(int raw_tier) {
  for (Tier t : AllTiers()) {
    if (static_cast<int>(t) == raw_tier) return t;
  }
  return Tier::MINIMAL;
}

const CapabilityPolicy& CapabilityPolicy::Get() {
  static const CapabilityPolicy policy;
  return policy;
}

CapabilityPolicy::CapabilityPolicy() {
  AddPrimitives(&minimal_);

  analysis_ = minimal_;
  analysis_["math"] = script::Value::Library(MathModule());
  analysis_["stats"] = script::Value::Library(StatsModule());
  // Also reachable under the standard library's name.
  analysis_["statistics"] = analysis_["stats"];
  analysis_["ta"] = script::Value::Library(TaModule());

  for (const Names* names : {&minimal_, &analysis_}) {
    for (const auto& entry : *names) reserved_.insert(entry.first);
  }
  reserved_.insert(kResultName);
}

const Names& CapabilityPolicy::Resolve(Tier tier) const {
  switch (tier) {
    case Tier::ANALYSIS:
      return analysis_;
    default:
      return minimal_;
  }
}


bool CapabilityPolicy::IsReserved(const std::string& name) const {
  return reserved_.count(name) != 0 || script::IsKeyword(name);
}

}  // namespace policy
