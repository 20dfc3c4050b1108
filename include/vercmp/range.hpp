#pragma once

#include <vercmp/compare.hpp>
#include <string>

namespace vercmp {

// Range predicates.
//
// Every predicate takes a reference version a (the bound written in a
// constraint) and a candidate b, and answers where b sits relative to a:
// is_greater_than(a, b) is true when b > a, not when a > b.

bool equals(const SemanticVersion& a, const SemanticVersion& b);
bool is_greater_than(const SemanticVersion& a, const SemanticVersion& b);
bool is_greater_than_or_equal_to(const SemanticVersion& a, const SemanticVersion& b);
bool is_less_than(const SemanticVersion& a, const SemanticVersion& b);
bool is_less_than_or_equal_to(const SemanticVersion& a, const SemanticVersion& b);

// !a: anything except a
bool avoid(const SemanticVersion& a, const SemanticVersion& b);

// ~a: b >= a and b below the next minor (a has a non-zero patch level) or
// the next major (otherwise).
//   ~1.2.3  ->  >=1.2.3, <1.3
//   ~1.2    ->  >=1.2,   <2.0
// A pre-release of the upper bound itself (1.3.0-beta for ~1.2.3) never
// matches.
bool is_approximately(const SemanticVersion& a, const SemanticVersion& b);

// ^a: b >= a and b < (a.major + 1).0, pre-releases of that bound excluded
bool is_compatible(const SemanticVersion& a, const SemanticVersion& b);

// @a: exact, case-sensitive match of opaque refs such as commit hashes
bool equal_non_version(const std::string& a, const std::string& b);

// Exclusive upper bounds used by is_approximately() and is_compatible().
// Throws std::logic_error if the bumped component does not fit in 64 bits.
SemanticVersion upper_bound_approximately(const SemanticVersion& a);
SemanticVersion upper_bound_compatible(const SemanticVersion& a);

} // namespace vercmp
