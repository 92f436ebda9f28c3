#ifndef POLICY_CAPABILITY_POLICY_HPP
#define POLICY_CAPABILITY_POLICY_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace policy {

// Closed enumeration of what a run may reference. Adding a tier or a name
// to a tier is a code change.
enum class Tier { MINIMAL = 0, ANALYSIS = 1 };

// Name bound by a program to hand its result back to the caller.
const constexpr char kResultName[] = "result";

using Names = std::map<std::string, script::Value>;

// Parses "minimal" or "analysis".
bool ParseTier(const std::string& name, Tier* tier);
std::string TierName(Tier tier);
std::vector<Tier> AllTiers();
// Maps a raw tier value, e.g. one read from the wire, onto the enumeration.
// Values outside it fail closed to the minimal tier.
Tier TierFromRaw(int raw_tier);

// Process-wide, immutable table mapping each tier to the names it exposes.
// Built on first use and never modified afterwards, so it can be shared by
// concurrent runs.
class CapabilityPolicy {
 public:
  static const CapabilityPolicy& Get();

  const Names& Resolve(Tier tier) const;
  const Names& Resolve(int raw_tier) const {
    return Resolve(TierFromRaw(raw_tier));
  }

  // Names a binding may never use: anything any tier exposes, the language
  // keywords and the result name.
  bool IsReserved(const std::string& name) const;

  CapabilityPolicy(const CapabilityPolicy&) = delete;
  CapabilityPolicy& operator=(const CapabilityPolicy&) = delete;

 private:
  CapabilityPolicy();

  Names minimal_;
  Names analysis_;
  std::set<std::string> reserved_;
};

}  // namespace policy

#endif
