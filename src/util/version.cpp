#include <vercmp/version.hpp>
#include <cctype>
#include <charconv>
#include <system_error>
#include <vector>

namespace vercmp {

static const char* k_version_format = "expected format: major.minor[.patch][-pre-release][+build]";

static std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
}

static Result<std::uint64_t> parse_component(const std::string& part, const char* what,
                                      const std::string& full) {
    if (part.empty()) {
        return VercmpError{VercmpError::Version,
            std::string("missing ") + what + " version in '" + full + "'",
            k_version_format};
    }
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return VercmpError{VercmpError::Version,
                std::string("invalid ") + what + " version in '" + full + "'",
                "version components must be unsigned decimal numbers"};
        }
    }

    std::uint64_t value = 0;
    auto res = std::from_chars(part.data(), part.data() + part.size(), value);
    if (res.ec == std::errc::result_out_of_range) {
        return VercmpError{VercmpError::Version,
            std::string(what) + " version too large in '" + full + "'"};
    }
    return Result<std::uint64_t>::ok(value);
}

// Dot-separated identifiers, each non-empty and made of [0-9A-Za-z-]
static Status check_identifiers(const std::string& ids, const char* what,
                         const std::string& full) {
    for (const auto& id : split_dots(ids)) {
        if (id.empty()) {
            return VercmpError{VercmpError::Version,
                std::string("empty ") + what + " identifier in '" + full + "'"};
        }
        for (char c : id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return VercmpError{VercmpError::Version,
                    "invalid character '" + std::string(1, c) + "' in " +
                    what + " of '" + full + "'",
                    "allowed: [0-9A-Za-z-]"};
            }
        }
    }
    return ok_status();
}

SemanticVersion::SemanticVersion(std::uint64_t major, std::uint64_t minor,
                                 std::optional<std::uint64_t> patch_level,
                                 std::optional<std::string> pre_release,
                                 std::optional<std::string> build_metadata)
    : major_(major), minor_(minor), patch_level_(patch_level),
      pre_release_(std::move(pre_release)),
      build_metadata_(std::move(build_metadata)) {}

Result<SemanticVersion> SemanticVersion::parse(const std::string& s) {
    if (s.empty()) {
        return VercmpError{VercmpError::Version, "empty version string"};
    }

    SemanticVersion v;
    std::string rest = s;

    // Build metadata may itself contain '-', so it is split off first
    size_t plus = rest.find('+');
    if (plus != std::string::npos) {
        std::string build = rest.substr(plus + 1);
        if (build.empty()) {
            return VercmpError{VercmpError::Version,
                "empty build metadata after '+' in '" + s + "'"};
        }
        VERCMP_TRY(check_identifiers(build, "build metadata", s));
        v.build_metadata_ = std::move(build);
        rest.erase(plus);
    }

    size_t dash = rest.find('-');
    if (dash != std::string::npos) {
        std::string pre = rest.substr(dash + 1);
        if (pre.empty()) {
            return VercmpError{VercmpError::Version,
                "empty pre-release after '-' in '" + s + "'"};
        }
        VERCMP_TRY(check_identifiers(pre, "pre-release", s));
        v.pre_release_ = std::move(pre);
        rest.erase(dash);
    }

    auto parts = split_dots(rest);
    if (parts.size() < 2 || parts.size() > 3) {
        return VercmpError{VercmpError::Version,
            "invalid version '" + s + "'", k_version_format};
    }

    auto major = parse_component(parts[0], "major", s);
    if (major.is_err()) return std::move(major).error();
    auto minor = parse_component(parts[1], "minor", s);
    if (minor.is_err()) return std::move(minor).error();
    v.major_ = major.value();
    v.minor_ = minor.value();

    if (parts.size() == 3) {
        auto patch = parse_component(parts[2], "patch", s);
        if (patch.is_err()) return std::move(patch).error();
        v.patch_level_ = patch.value();
    }

    return Result<SemanticVersion>::ok(std::move(v));
}

Status SemanticVersion::set_version(const std::string& s) {
    auto parsed = parse(s);
    if (parsed.is_err()) return std::move(parsed).error();
    *this = std::move(parsed).value();
    return ok_status();
}

std::string SemanticVersion::to_string() const {
    std::string s = std::to_string(major_) + "." + std::to_string(minor_);
    if (patch_level_) {
        s += "." + std::to_string(*patch_level_);
    }
    if (pre_release_) {
        s += "-" + *pre_release_;
    }
    if (build_metadata_) {
        s += "+" + *build_metadata_;
    }
    return s;
}

} // namespace vercmp
