#include <vercmp/constraint.hpp>
#include <vercmp/log.hpp>
#include <algorithm>
#include <cctype>

namespace vercmp {

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Longest prefixes first so ">=" is not read as ">"
struct OpPrefix {
    const char* text;
    ConstraintOp op;
};

static const OpPrefix k_prefixes[] = {
    {">=", ConstraintOp::GreaterEq},
    {"<=", ConstraintOp::LessEq},
    {">",  ConstraintOp::Greater},
    {"<",  ConstraintOp::Less},
    {"=",  ConstraintOp::Exact},
    {"!",  ConstraintOp::Avoid},
    {"~",  ConstraintOp::Approximately},
    {"^",  ConstraintOp::Compatible},
    {"@",  ConstraintOp::Pin},
};

const char* constraint_op_prefix(ConstraintOp op) {
    switch (op) {
        case ConstraintOp::Exact:         return "=";
        case ConstraintOp::Avoid:         return "!";
        case ConstraintOp::Greater:       return ">";
        case ConstraintOp::GreaterEq:     return ">=";
        case ConstraintOp::Less:          return "<";
        case ConstraintOp::LessEq:        return "<=";
        case ConstraintOp::Approximately: return "~";
        case ConstraintOp::Compatible:    return "^";
        case ConstraintOp::Pin:           return "@";
    }
    return "";
}

// ---------------------------------------------------------------------------
// Constraint
// ---------------------------------------------------------------------------

Result<Constraint> Constraint::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return VercmpError{VercmpError::Constraint, "empty version constraint"};
    }

    Constraint c;
    size_t pos = 0;
    for (const auto& p : k_prefixes) {
        if (starts_with(text, p.text)) {
            c.op = p.op;
            pos = std::char_traits<char>::length(p.text);
            break;
        }
    }

    std::string operand = trim(text.substr(pos));
    if (operand.empty()) {
        return VercmpError{VercmpError::Constraint,
            "missing version in constraint '" + text + "'"};
    }

    if (c.op == ConstraintOp::Pin) {
        // The ref follows '@' directly; no whitespace anywhere in it
        std::string ref = text.substr(pos);
        auto ws = std::find_if(ref.begin(), ref.end(), [](char ch) {
            return std::isspace(static_cast<unsigned char>(ch));
        });
        if (ws != ref.end()) {
            return VercmpError{VercmpError::Constraint,
                "invalid pin '" + ref + "' in constraint '" + text + "'",
                "a pin is a single ref such as a commit hash, written as @<ref>"};
        }
        c.ref = std::move(ref);
        log::debug("parsed constraint %s", c.to_string().c_str());
        return Result<Constraint>::ok(std::move(c));
    }

    auto v = SemanticVersion::parse(operand);
    if (v.is_err()) {
        VercmpError err = std::move(v).error();
        return VercmpError{VercmpError::Constraint,
            "invalid version in constraint '" + text + "': " + err.message,
            err.hint};
    }
    c.version = std::move(v).value();
    log::debug("parsed constraint %s", c.to_string().c_str());
    return Result<Constraint>::ok(std::move(c));
}

bool Constraint::matches(const SemanticVersion& v) const {
    switch (op) {
        case ConstraintOp::Exact:         return equals(version, v);
        case ConstraintOp::Avoid:         return avoid(version, v);
        case ConstraintOp::Greater:       return is_greater_than(version, v);
        case ConstraintOp::GreaterEq:     return is_greater_than_or_equal_to(version, v);
        case ConstraintOp::Less:          return is_less_than(version, v);
        case ConstraintOp::LessEq:        return is_less_than_or_equal_to(version, v);
        case ConstraintOp::Approximately: return is_approximately(version, v);
        case ConstraintOp::Compatible:    return is_compatible(version, v);
        case ConstraintOp::Pin:           return false;
    }
    return false;
}

bool Constraint::matches_ref(const std::string& candidate) const {
    if (op == ConstraintOp::Pin) {
        return equal_non_version(ref, candidate);
    }
    auto v = SemanticVersion::parse(candidate);
    if (v.is_err()) {
        log::debug("'%s' is not a version, cannot satisfy %s",
                   candidate.c_str(), to_string().c_str());
        return false;
    }
    return matches(v.value());
}

std::string Constraint::to_string() const {
    if (op == ConstraintOp::Pin) {
        return constraint_op_prefix(op) + ref;
    }
    return constraint_op_prefix(op) + version.to_string();
}

// ---------------------------------------------------------------------------
// ConstraintSet
// ---------------------------------------------------------------------------

Result<ConstraintSet> ConstraintSet::parse(const std::string& s) {
    if (trim(s).empty()) {
        return VercmpError{VercmpError::Constraint, "empty version requirement"};
    }

    ConstraintSet set;
    size_t start = 0;
    for (;;) {
        size_t comma = s.find(',', start);
        auto c = Constraint::parse(s.substr(start, comma == std::string::npos
                                                       ? std::string::npos
                                                       : comma - start));
        if (c.is_err()) return std::move(c).error();
        set.constraints.push_back(std::move(c).value());
        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    return Result<ConstraintSet>::ok(std::move(set));
}

bool ConstraintSet::matches(const SemanticVersion& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const Constraint& c) { return c.matches(v); });
}

bool ConstraintSet::matches_ref(const std::string& ref) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const Constraint& c) { return c.matches_ref(ref); });
}

std::optional<SemanticVersion> ConstraintSet::max_satisfying(
    const std::vector<SemanticVersion>& candidates) const {
    std::optional<SemanticVersion> best;
    for (const auto& v : candidates) {
        if (!matches(v)) continue;
        if (!best || v > *best) best = v;
    }
    return best;
}

std::string ConstraintSet::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace vercmp
