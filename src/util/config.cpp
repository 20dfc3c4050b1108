#include <vercmp/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace vercmp {

static Status parse_log_section(const toml::table& tbl, LogConfig& out) {
    if (auto node = tbl["level"]) {
        auto name = node.value_exact<std::string>();
        if (!name) {
            return VercmpError{VercmpError::Config,
                "log.level must be a string"};
        }
        auto lvl = log::parse_level(*name);
        if (lvl.is_err()) {
            return VercmpError{VercmpError::Config,
                "log.level: " + lvl.error().message, lvl.error().hint};
        }
        out.level = lvl.value();
        out.level_set = true;
    }

    if (auto node = tbl["color"]) {
        auto on = node.value_exact<bool>();
        if (!on) {
            return VercmpError{VercmpError::Config,
                "log.color must be a boolean"};
        }
        out.color = *on;
        out.color_set = true;
    }

    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VercmpError{VercmpError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"]) {
        auto tbl = section.as_table();
        if (!tbl) {
            return VercmpError{VercmpError::Config, "[log] must be a table"};
        }
        VERCMP_TRY(parse_log_section(*tbl, cfg.logging));
    }

    // [requirements] section
    if (auto section = doc["requirements"]) {
        auto tbl = section.as_table();
        if (!tbl) {
            return VercmpError{VercmpError::Config, "[requirements] must be a table"};
        }
        for (const auto& [key, val] : *tbl) {
            std::string name(key.str());
            auto expr = val.value_exact<std::string>();
            if (!expr) {
                return VercmpError{VercmpError::Config,
                    "requirement '" + name + "' must be a string",
                    "e.g. " + name + " = \"^1.2.3\""};
            }
            auto set = ConstraintSet::parse(*expr);
            if (set.is_err()) {
                return VercmpError{VercmpError::Config,
                    "requirement '" + name + "': " + set.error().message,
                    set.error().hint};
            }
            cfg.requirements[name] = std::move(set).value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VercmpError{VercmpError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loading config %s", path.c_str());
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.logging.level_set) {
        logging.level = other.logging.level;
        logging.level_set = true;
    }
    if (other.logging.color_set) {
        logging.color = other.logging.color;
        logging.color_set = true;
    }

    // Requirements: other overrides this per name
    for (const auto& [name, set] : other.requirements) {
        requirements[name] = set;
    }
}

void Config::apply_logging() const {
    if (logging.level_set) log::set_level(logging.level);
    if (logging.color_set) log::set_color_enabled(logging.color);
}

Result<ConstraintSet> Config::requirement(const std::string& name) const {
    auto it = requirements.find(name);
    if (it == requirements.end()) {
        return VercmpError{VercmpError::InvalidArg,
            "no requirement named '" + name + "'"};
    }
    return Result<ConstraintSet>::ok(it->second);
}

} // namespace vercmp
