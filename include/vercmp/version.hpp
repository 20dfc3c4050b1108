#pragma once

#include <vercmp/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Older glibc and FreeBSD define these macros in <sys/types.h>.
#ifdef major
#  undef major
#endif
#ifdef minor
#  undef minor
#endif

namespace vercmp {

// major.minor[.patch][-pre-release][+build]
//
// An absent patch level compares as 0. Build metadata is kept for display
// only and never takes part in ordering.
class SemanticVersion {
public:
    SemanticVersion() = default;
    SemanticVersion(std::uint64_t major, std::uint64_t minor,
                    std::optional<std::uint64_t> patch_level = std::nullopt,
                    std::optional<std::string> pre_release = std::nullopt,
                    std::optional<std::string> build_metadata = std::nullopt);

    static Result<SemanticVersion> parse(const std::string& s);

    // Replace this version with the parsed form of s. On error the
    // version is left unchanged.
    Status set_version(const std::string& s);

    std::uint64_t major() const { return major_; }
    std::uint64_t minor() const { return minor_; }
    const std::optional<std::uint64_t>& patch_level() const { return patch_level_; }
    std::uint64_t effective_patch_level() const { return patch_level_.value_or(0); }
    const std::optional<std::string>& pre_release() const { return pre_release_; }
    const std::optional<std::string>& build_metadata() const { return build_metadata_; }

    bool is_pre_release() const { return pre_release_.has_value(); }

    std::string to_string() const;

private:
    std::uint64_t major_ = 0;
    std::uint64_t minor_ = 0;
    std::optional<std::uint64_t> patch_level_;
    std::optional<std::string> pre_release_;
    std::optional<std::string> build_metadata_;
};

} // namespace vercmp
