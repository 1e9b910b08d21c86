// yyid_gen.cpp
//
// Command-line YYID generator.
//
//     yyid-gen [-n COUNT] [-f simple|hyphenated|braced|urn] [-u] [-c FILE] [-v|-q]
//
// Settings come from ~/.yyid/config.toml, then the file given with -c, then
// the flags. Identifiers go to stdout, one per line.

#include <yyid/codec.hpp>
#include <yyid/config.hpp>
#include <yyid/log.hpp>
#include <yyid/result.hpp>
#include <yyid/yyid.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace yyid;

struct Options {
    Config overrides;
    std::string config_file;
    bool help = false;
};

static void usage(std::ostream& os) {
    os << "usage: yyid-gen [-n COUNT] [-f FORMAT] [-u] [-c FILE] [-v|-q]\n"
          "  -n COUNT   number of identifiers to print (default 1)\n"
          "  -f FORMAT  simple, hyphenated, braced or urn (default hyphenated)\n"
          "  -u         upper-case hex digits\n"
          "  -c FILE    extra TOML config layered over ~/.yyid/config.toml\n"
          "  -v         verbose logging\n"
          "  -q         errors only\n";
}

static Result<int> parse_count(const std::string& s) {
    char* end = nullptr;
    long n = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || n < 1 || n > 1000000) {
        return YyidError{YyidError::InvalidArg,
            "invalid count: '" + s + "'",
            "expected an integer between 1 and 1000000"};
    }
    return Result<int>::ok(static_cast<int>(n));
}

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&]() -> Result<std::string> {
            if (i + 1 >= argc) {
                return YyidError{YyidError::InvalidArg,
                    "missing value for " + arg, "run yyid-gen -h for usage"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-n") {
            auto v = need_value();
            YYID_TRY(v);
            auto n = parse_count(v.value());
            YYID_TRY(n);
            opts.overrides.count = n.value();
            opts.overrides.count_set = true;
        } else if (arg == "-f") {
            auto v = need_value();
            YYID_TRY(v);
            auto fmt = parse_format(v.value());
            YYID_TRY(fmt);
            opts.overrides.format = fmt.value();
            opts.overrides.format_set = true;
        } else if (arg == "-u") {
            opts.overrides.letter_case = Case::Upper;
            opts.overrides.case_set = true;
        } else if (arg == "-c") {
            auto v = need_value();
            YYID_TRY(v);
            opts.config_file = v.value();
        } else if (arg == "-v") {
            opts.overrides.log_level = log::Debug;
            opts.overrides.log_level_set = true;
        } else if (arg == "-q") {
            opts.overrides.log_level = log::Error;
            opts.overrides.log_level_set = true;
        } else {
            return YyidError{YyidError::InvalidArg,
                "unknown argument: " + arg, "run yyid-gen -h for usage"};
        }
    }
    return Result<Options>::ok(opts);
}

static Result<Config> resolve_config(const Options& opts) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        YYID_TRY(g);
        log::debug("loaded %s", global_path.c_str());
        global = g.value();
    }

    std::optional<Config> local;
    if (!opts.config_file.empty()) {
        auto l = Config::load(opts.config_file);
        YYID_TRY(l);
        log::debug("loaded %s", opts.config_file.c_str());
        local = l.value();
    }

    auto cfg = Config::effective(global, local);
    cfg.merge(opts.overrides);
    return Result<Config>::ok(cfg);
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().help) {
        usage(std::cout);
        return 0;
    }

    // Flags decide verbosity while config files are still being read
    if (opts.value().overrides.log_level_set) {
        log::set_level(opts.value().overrides.log_level);
    }

    auto cfg = resolve_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    const Config& c = cfg.value();
    log::set_level(c.log_level);
    if (c.log_color_set) log::set_color_enabled(c.log_color);

    log::debug("format=%s case=%s count=%d", format_name(c.format),
               c.letter_case == Case::Upper ? "upper" : "lower", c.count);

    for (int i = 0; i < c.count; ++i) {
        auto id = Yyid::generate(system_entropy());
        if (id.is_err()) {
            std::cerr << id.error().format() << "\n";
            return 1;
        }
        std::cout << encode(id.value(), c.format, c.letter_case) << '\n';
    }
    return 0;
}
