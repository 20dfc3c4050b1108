#pragma once

#include <vercmp/version.hpp>
#include <string>

namespace vercmp {

// Outcome of comparing a against b. The underlying values keep the usual
// sign convention: negative means a is the smaller version.
enum class Comparison : int {
    ALess = -1,
    Equal = 0,
    AGreater = 1,
};

inline int to_int(Comparison c) { return static_cast<int>(c); }

// Swap the roles of a and b
Comparison reverse(Comparison c);

const char* comparison_name(Comparison c);

// Compare major.minor.patch only; a missing patch level counts as 0
Comparison compare_core(const SemanticVersion& a, const SemanticVersion& b);

// Full semver.org precedence. A pre-release sorts below the release with
// the same major.minor.patch; build metadata is ignored.
Comparison compare(const SemanticVersion& a, const SemanticVersion& b);

// Compare two pre-release tags such as "alpha.1" and "alpha.beta".
//
// Identifiers are compared left to right. Numeric identifiers compare by
// value, alphanumeric ones by ASCII order, and a numeric identifier always
// sorts below an alphanumeric one. If every shared identifier is equal the
// tag with more identifiers is greater.
Comparison compare_pre_release(const std::string& a, const std::string& b);

// True if every character is an ASCII digit. The empty identifier is not
// numeric.
bool is_numeric_identifier(const std::string& id);

// Compare two digit strings by value, whatever their length
Comparison compare_numeric_identifiers(const std::string& a, const std::string& b);

inline bool operator==(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::Equal;
}
inline bool operator!=(const SemanticVersion& a, const SemanticVersion& b) {
    return !(a == b);
}
inline bool operator<(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::ALess;
}
inline bool operator>(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::AGreater;
}
inline bool operator<=(const SemanticVersion& a, const SemanticVersion& b) {
    return !(a > b);
}
inline bool operator>=(const SemanticVersion& a, const SemanticVersion& b) {
    return !(a < b);
}

} // namespace vercmp
