#include <catch2/catch.hpp>
#include <vercmp/range.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vercmp;

static SemanticVersion V(const std::string& s) {
    auto r = SemanticVersion::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Predicate polarity =====
//
// The first argument is the reference, the second the candidate.

TEST_CASE("is_greater_than asks whether the candidate is greater", "[range]") {
    REQUIRE(is_greater_than(V("1.0.0"), V("2.0.0")));
    REQUIRE_FALSE(is_greater_than(V("2.0.0"), V("1.0.0")));
    REQUIRE_FALSE(is_greater_than(V("1.0.0"), V("1.0.0")));
}

TEST_CASE("is_greater_than_or_equal_to", "[range]") {
    REQUIRE(is_greater_than_or_equal_to(V("1.0.0"), V("1.0.1")));
    REQUIRE(is_greater_than_or_equal_to(V("1.0.0"), V("1.0")));
    REQUIRE_FALSE(is_greater_than_or_equal_to(V("1.0.0"), V("1.0.0-rc.1")));
}

TEST_CASE("is_less_than asks whether the candidate is less", "[range]") {
    REQUIRE(is_less_than(V("2.0.0"), V("1.0.0")));
    REQUIRE(is_less_than(V("1.0.0"), V("1.0.0-rc.1")));
    REQUIRE_FALSE(is_less_than(V("1.0.0"), V("2.0.0")));
    REQUIRE_FALSE(is_less_than(V("1.0.0"), V("1.0.0")));
}

TEST_CASE("is_less_than_or_equal_to", "[range]") {
    REQUIRE(is_less_than_or_equal_to(V("2.0.0"), V("1.9.9")));
    REQUIRE(is_less_than_or_equal_to(V("2.0"), V("2.0.0")));
    REQUIRE_FALSE(is_less_than_or_equal_to(V("2.0.0"), V("2.0.1")));
}

TEST_CASE("equals and avoid", "[range]") {
    REQUIRE(equals(V("1.2"), V("1.2.0")));
    REQUIRE_FALSE(equals(V("1.2.0-alpha"), V("1.2.0")));

    std::vector<SemanticVersion> vs = {
        V("1.0"), V("1.0.0"), V("1.0.0-a"), V("1.0.1"), V("2.0.0+x"),
    };
    for (const auto& a : vs) {
        for (const auto& b : vs) {
            REQUIRE(avoid(a, b) == !equals(a, b));
        }
    }
}

// ===== ~ (approximately) =====

TEST_CASE("~1.2.3 allows patch updates only", "[range]") {
    REQUIRE(is_approximately(V("1.2.3"), V("1.2.3")));
    REQUIRE(is_approximately(V("1.2.3"), V("1.2.9")));
    REQUIRE_FALSE(is_approximately(V("1.2.3"), V("1.2.2")));
    REQUIRE_FALSE(is_approximately(V("1.2.3"), V("1.3.0")));
    REQUIRE_FALSE(is_approximately(V("1.2.3"), V("2.0.0")));
}

TEST_CASE("~1.2 allows minor updates", "[range]") {
    REQUIRE(is_approximately(V("1.2"), V("1.2.0")));
    REQUIRE(is_approximately(V("1.2"), V("1.9.9")));
    REQUIRE_FALSE(is_approximately(V("1.2"), V("2.0.0")));
    REQUIRE_FALSE(is_approximately(V("1.2"), V("1.1.9")));
}

TEST_CASE("~1.2.0 behaves like ~1.2", "[range]") {
    REQUIRE(is_approximately(V("1.2.0"), V("1.5.0")));
    REQUIRE_FALSE(is_approximately(V("1.2.0"), V("2.0.0")));
}

TEST_CASE("~ rejects pre-releases of the upper bound", "[range]") {
    REQUIRE_FALSE(is_approximately(V("1.2.3"), V("1.3.0-beta")));
    REQUIRE_FALSE(is_approximately(V("1.2"), V("2.0.0-alpha")));
    REQUIRE_FALSE(is_approximately(V("1.2"), V("2.0-rc.1")));
}

TEST_CASE("~ keeps pre-releases inside the range", "[range]") {
    REQUIRE(is_approximately(V("1.2.3"), V("1.2.5-beta")));
    REQUIRE(is_approximately(V("1.2"), V("1.4.0-beta")));
    REQUIRE(is_approximately(V("1.2.3-alpha"), V("1.2.3-beta")));
    REQUIRE_FALSE(is_approximately(V("1.2.3-beta"), V("1.2.3-alpha")));
}

TEST_CASE("upper_bound_approximately", "[range]") {
    REQUIRE(upper_bound_approximately(V("1.2.3")).to_string() == "1.3");
    REQUIRE(upper_bound_approximately(V("1.2")).to_string() == "2.0");
    REQUIRE(upper_bound_approximately(V("1.2.0-rc.1")).to_string() == "2.0");
    REQUIRE(upper_bound_approximately(V("0.0.1")).to_string() == "0.1");
}

// ===== ^ (compatible) =====

TEST_CASE("^1.2.3 allows anything below the next major", "[range]") {
    REQUIRE(is_compatible(V("1.2.3"), V("1.2.3")));
    REQUIRE(is_compatible(V("1.2.3"), V("1.9.9")));
    REQUIRE_FALSE(is_compatible(V("1.2.3"), V("1.2.2")));
    REQUIRE_FALSE(is_compatible(V("1.2.3"), V("2.0.0")));
}

TEST_CASE("^ rejects pre-releases of the next major", "[range]") {
    REQUIRE_FALSE(is_compatible(V("1.2.3"), V("2.0.0-beta")));
    REQUIRE_FALSE(is_compatible(V("0.1"), V("1.0.0-rc.1")));
}

TEST_CASE("^ keeps pre-releases inside the range", "[range]") {
    REQUIRE(is_compatible(V("1.2.3"), V("1.5.0-beta")));
}

TEST_CASE("^0.x uses the same major rule", "[range]") {
    REQUIRE(is_compatible(V("0.2.3"), V("0.9.0")));
    REQUIRE_FALSE(is_compatible(V("0.2.3"), V("1.0.0")));
}

TEST_CASE("upper_bound_compatible", "[range]") {
    REQUIRE(upper_bound_compatible(V("1.2.3")).to_string() == "2.0");
    REQUIRE(upper_bound_compatible(V("0.0")).to_string() == "1.0");
}

TEST_CASE("unrepresentable upper bound is an invariant violation", "[range]") {
    SemanticVersion top(18446744073709551615ULL, 0);
    REQUIRE_THROWS_AS(upper_bound_compatible(top), std::logic_error);
    REQUIRE_THROWS_AS(is_compatible(top, top), std::logic_error);

    SemanticVersion top_minor(1, 18446744073709551615ULL, 1);
    REQUIRE_THROWS_AS(is_approximately(top_minor, top_minor), std::logic_error);
}

// ===== @ (non-version refs) =====

TEST_CASE("equal_non_version is an exact string match", "[range]") {
    REQUIRE(equal_non_version("a1b2c3d", "a1b2c3d"));
    REQUIRE_FALSE(equal_non_version("a1b2c3d", "A1B2C3D"));
    REQUIRE_FALSE(equal_non_version("a1b2c3d", "a1b2c3"));
    REQUIRE_FALSE(equal_non_version("1.0", "1.0.0"));
    REQUIRE(equal_non_version("", ""));
}
