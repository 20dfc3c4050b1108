#include <vercmp/range.hpp>
#include <vercmp/log.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace vercmp {

// Decimal form of n + 1. For the largest uint64 this is one past what
// SemanticVersion can hold, so parsing the bound fails.
static std::string next_component(std::uint64_t n) {
    if (n == std::numeric_limits<std::uint64_t>::max()) {
        return "18446744073709551616";
    }
    return std::to_string(n + 1);
}

static SemanticVersion make_bound(const std::string& dotted) {
    SemanticVersion bound;
    auto st = bound.set_version(dotted);
    if (st.is_err()) {
        std::string msg = st.error().format();
        log::error("cannot build upper bound '%s': %s", dotted.c_str(), msg.c_str());
        throw std::logic_error(msg);
    }
    return bound;
}

static bool bound_by_minor(const SemanticVersion& a) {
    return a.effective_patch_level() > 0;
}

bool equals(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::Equal;
}

bool is_greater_than(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::ALess;
}

bool is_greater_than_or_equal_to(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) != Comparison::AGreater;
}

bool is_less_than(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) == Comparison::AGreater;
}

bool is_less_than_or_equal_to(const SemanticVersion& a, const SemanticVersion& b) {
    return compare(a, b) != Comparison::ALess;
}

bool avoid(const SemanticVersion& a, const SemanticVersion& b) {
    return !equals(a, b);
}

SemanticVersion upper_bound_approximately(const SemanticVersion& a) {
    if (bound_by_minor(a)) {
        return make_bound(std::to_string(a.major()) + "." + next_component(a.minor()));
    }
    return make_bound(next_component(a.major()) + ".0");
}

SemanticVersion upper_bound_compatible(const SemanticVersion& a) {
    return make_bound(next_component(a.major()) + ".0");
}

bool is_approximately(const SemanticVersion& a, const SemanticVersion& b) {
    if (!is_greater_than_or_equal_to(a, b)) return false;

    SemanticVersion upper = upper_bound_approximately(a);
    if (log::enabled(log::Trace)) {
        log::trace("~%s: upper bound %s", a.to_string().c_str(),
                   upper.to_string().c_str());
    }
    if (!is_less_than(upper, b)) return false;

    if (b.is_pre_release() && b.major() == upper.major() &&
        (!bound_by_minor(a) || b.minor() == upper.minor())) {
        log::trace("~%s: rejecting %s, a pre-release of the upper bound",
                   a.to_string().c_str(), b.to_string().c_str());
        return false;
    }
    return true;
}

bool is_compatible(const SemanticVersion& a, const SemanticVersion& b) {
    if (!is_greater_than_or_equal_to(a, b)) return false;

    SemanticVersion upper = upper_bound_compatible(a);
    if (log::enabled(log::Trace)) {
        log::trace("^%s: upper bound %s", a.to_string().c_str(),
                   upper.to_string().c_str());
    }
    if (!is_less_than(upper, b)) return false;

    if (b.is_pre_release() && b.major() == upper.major()) {
        log::trace("^%s: rejecting %s, a pre-release of the upper bound",
                   a.to_string().c_str(), b.to_string().c_str());
        return false;
    }
    return true;
}

bool equal_non_version(const std::string& a, const std::string& b) {
    return a == b;
}

} // namespace vercmp
