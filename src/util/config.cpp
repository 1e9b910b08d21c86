#include <yyid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace yyid {

static constexpr int64_t max_count = 1000000;

static YyidError as_config_error(YyidError e) {
    e.code = YyidError::Config;
    return e;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return YyidError{YyidError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto v = (*output)["format"].value<std::string>()) {
            auto fmt = parse_format(*v).context("output.format");
            if (fmt.is_err()) {
                return as_config_error(std::move(fmt).error());
            }
            cfg.format = fmt.value();
            cfg.format_set = true;
        }
        if (auto v = (*output)["case"].value<std::string>()) {
            auto c = parse_case(*v).context("output.case");
            if (c.is_err()) {
                return as_config_error(std::move(c).error());
            }
            cfg.letter_case = c.value();
            cfg.case_set = true;
        }
        if (auto v = (*output)["count"].value<int64_t>()) {
            if (*v < 1 || *v > max_count) {
                return YyidError{YyidError::Config,
                    "output.count out of range: " + std::to_string(*v),
                    "count must be between 1 and " + std::to_string(max_count)};
            }
            cfg.count = static_cast<int>(*v);
            cfg.count_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v).context("log.level");
            if (lvl.is_err()) {
                return as_config_error(std::move(lvl).error());
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return YyidError{YyidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
    if (other.case_set) {
        letter_case = other.letter_case;
        case_set = true;
    }
    if (other.count_set) {
        count = other.count;
        count_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.yyid/config.toml";
}

} // namespace yyid
