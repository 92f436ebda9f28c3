#ifndef POLICY_PRIMITIVES_HPP
#define POLICY_PRIMITIVES_HPP

#include "policy/capability_policy.hpp"

namespace policy {

// Adds the built-in functions every tier exposes: print, warn, len, range,
// abs, min, max, sum, round, int, float, str, bool, list, dict, tuple, set,
// type, isinstance, sorted, reversed, enumerate, zip, map, filter, any, all.
void AddPrimitives(Names* names);

}  // namespace policy

#endif
