#pragma once

#include <vercmp/range.hpp>
#include <vercmp/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vercmp {

enum class ConstraintOp {
    Exact,          // =1.2.3 (also a bare 1.2.3)
    Avoid,          // !1.2.3
    Greater,        // >1.2.3
    GreaterEq,      // >=1.2.3
    Less,           // <1.2.3
    LessEq,         // <=1.2.3
    Approximately,  // ~1.2.3
    Compatible,     // ^1.2.3
    Pin,            // @<commit hash>
};

const char* constraint_op_prefix(ConstraintOp op);

struct Constraint {
    ConstraintOp op = ConstraintOp::Exact;
    SemanticVersion version;  // unused for Pin
    std::string ref;          // Pin only

    static Result<Constraint> parse(const std::string& s);

    // A Pin never matches a semantic version
    bool matches(const SemanticVersion& v) const;

    // Pins compare refs verbatim; other operators parse ref as a version
    // and reject it if that fails.
    bool matches_ref(const std::string& ref) const;

    std::string to_string() const;
};

// Comma-separated constraints that must all hold: ">=1.0, <2.0"
struct ConstraintSet {
    std::vector<Constraint> constraints;

    static Result<ConstraintSet> parse(const std::string& s);

    bool matches(const SemanticVersion& v) const;
    bool matches_ref(const std::string& ref) const;

    // Greatest candidate that matches, if any
    std::optional<SemanticVersion> max_satisfying(
        const std::vector<SemanticVersion>& candidates) const;

    std::string to_string() const;
};

} // namespace vercmp
