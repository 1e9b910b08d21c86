#pragma once

#include <yyid/codec.hpp>
#include <yyid/log.hpp>
#include <yyid/result.hpp>
#include <optional>
#include <string>

namespace yyid {

// Settings for the generator tool, read from TOML:
//
//   [output]
//   format = "hyphenated"   # simple | hyphenated | braced | urn
//   case = "lower"          # lower | upper
//   count = 1
//
//   [log]
//   level = "warn"
//   color = true
//
// Layers: global (~/.yyid/config.toml) < local file < command line.
struct Config {
    Format format = Format::Hyphenated;
    Case letter_case = Case::Lower;
    int count = 1;
    log::Level log_level = log::Warn;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool format_set = false;
    bool case_set = false;
    bool count_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Explicitly-set fields of other override this
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.yyid/config.toml, or empty when no home directory is known
std::string global_config_path();

} // namespace yyid
