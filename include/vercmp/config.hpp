#pragma once

#include <vercmp/constraint.hpp>
#include <vercmp/log.hpp>
#include <vercmp/result.hpp>
#include <map>
#include <optional>
#include <string>

namespace vercmp {

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
    // Track which fields were explicitly set (for merge)
    bool level_set = false;
    bool color_set = false;
};

// TOML configuration:
//
//   [log]
//   level = "debug"
//   color = false
//
//   [requirements]
//   libfoo = "^1.2.3"
//   libbar = ">=1.0, <2.0"
struct Config {
    LogConfig logging;
    std::map<std::string, ConstraintSet> requirements;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Layer other on top: its explicitly-set values win
    void merge(const Config& other);

    // Push the [log] settings into vercmp::log. Unset fields are left alone.
    void apply_logging() const;

    Result<ConstraintSet> requirement(const std::string& name) const;
};

} // namespace vercmp
