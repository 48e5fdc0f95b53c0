#include <shortid/cli.hpp>
#include <shortid/log.hpp>
#include <shortid/short_id.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <ostream>

namespace shortid::cli {

const char* usage() {
    return
        "usage: shortid [options] <command> [args]\n"
        "\n"
        "commands:\n"
        "  encode <uuid>       36-char uuid -> 22-char short id\n"
        "  decode <short-id>   strict decode -> 36-char uuid\n"
        "  parse <text>        accept either form, print both\n"
        "  new [-n N]          generate N short ids\n"
        "  help                show this message\n"
        "\n"
        "options:\n"
        "  --config <path>     read this file instead of ./shortid.toml\n"
        "  -v, --verbose       more log output (repeatable)\n"
        "  -q, --quiet         errors only\n";
}

static Result<int> parse_count(const std::string& s) {
    std::string range = std::to_string(kMinCount) + ".." + std::to_string(kMaxCount);
    // digit-count guard keeps std::stoi in range
    if (s.empty() || s.size() > 6 ||
        !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return ShortIdError(ShortIdError::InvalidArg,
            "-n expects an integer in " + range).with_input(s);
    }
    int n = std::stoi(s);
    if (n < kMinCount || n > kMaxCount) {
        return ShortIdError(ShortIdError::InvalidArg,
            "-n expects an integer in " + range).with_input(s);
    }
    return Result<int>::ok(n);
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& tok = args[i];
        if (tok == "--config") {
            if (i + 1 >= args.size()) {
                return ShortIdError(ShortIdError::InvalidArg, "missing value for --config");
            }
            opts.config_path = args[++i];
        } else if (tok == "-n" || tok == "--count") {
            if (i + 1 >= args.size()) {
                return ShortIdError(ShortIdError::InvalidArg, "missing value for " + tok);
            }
            auto n = parse_count(args[++i]);
            SHORTID_TRY(n);
            opts.count = n.value();
        } else if (tok == "-v" || tok == "--verbose") {
            ++opts.verbosity;
        } else if (tok == "-q" || tok == "--quiet") {
            --opts.verbosity;
        } else if (tok == "-h" || tok == "--help") {
            opts.command = Command::Help;
            return Result<Options>::ok(opts);
        } else if (tok.size() > 1 && tok[0] == '-' && positional.empty()) {
            // after the command, a leading '-' may start a short id
            return ShortIdError(ShortIdError::InvalidArg,
                "unknown option '" + tok + "'", "run 'shortid help' for usage");
        } else {
            positional.push_back(tok);
        }
    }

    if (positional.empty()) {
        return ShortIdError(ShortIdError::InvalidArg,
            "no command given", "run 'shortid help' for usage");
    }

    const std::string& cmd = positional[0];
    size_t expected_args = 1;
    if (cmd == "encode") {
        opts.command = Command::Encode;
    } else if (cmd == "decode") {
        opts.command = Command::Decode;
    } else if (cmd == "parse") {
        opts.command = Command::Parse;
    } else if (cmd == "new") {
        opts.command = Command::New;
        expected_args = 0;
    } else if (cmd == "help") {
        opts.command = Command::Help;
        expected_args = 0;
    } else {
        return ShortIdError(ShortIdError::InvalidArg,
            "unknown command '" + cmd + "'", "run 'shortid help' for usage");
    }

    if (positional.size() - 1 != expected_args) {
        return ShortIdError(ShortIdError::InvalidArg,
            "'" + cmd + "' takes " + std::to_string(expected_args) + " argument(s)",
            "run 'shortid help' for usage");
    }
    if (expected_args == 1) {
        opts.argument = positional[1];
    }
    if (opts.count != 0 && opts.command != Command::New) {
        return ShortIdError(ShortIdError::InvalidArg, "-n only applies to 'new'");
    }
    return Result<Options>::ok(opts);
}

static bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::optional<Config> local;

    std::string global_path = global_config_path();
    if (!global_path.empty() && file_exists(global_path)) {
        auto r = Config::load(global_path);
        SHORTID_TRY(r);
        global = std::move(r).value();
    }

    if (!opts.config_path.empty()) {
        auto r = Config::load(opts.config_path);
        SHORTID_TRY(r);
        local = std::move(r).value();
    } else if (file_exists(local_config_path())) {
        auto r = Config::load(local_config_path());
        SHORTID_TRY(r);
        local = std::move(r).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

void configure_logging(const Config& cfg, const Options& opts) {
    if (cfg.log_color_set) {
        log::set_color_enabled(cfg.log.color);
    }
    int lvl = static_cast<int>(cfg.log.level) - opts.verbosity;
    lvl = std::clamp(lvl, static_cast<int>(log::Trace), static_cast<int>(log::Error));
    log::set_level(static_cast<log::Level>(lvl));
}

static std::string format_uuid(const Uuid& id, UuidCase uuid_case) {
    std::string s = id.to_string();
    if (uuid_case == UuidCase::Upper) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }
    return s;
}

int run(const Options& opts, const Config& cfg, std::ostream& out) {
    switch (opts.command) {
        case Command::Help:
            out << usage();
            return kExitOk;

        case Command::Encode: {
            auto r = encode(opts.argument);
            if (r.is_err()) {
                log::error("%s", r.error().format().c_str());
                return kExitInvalidInput;
            }
            out << r.value() << "\n";
            return kExitOk;
        }

        case Command::Decode: {
            auto r = decode(opts.argument);
            if (r.is_err()) {
                log::error("%s", r.error().format().c_str());
                return kExitInvalidInput;
            }
            out << format_uuid(r.value(), cfg.output.uuid_case) << "\n";
            return kExitOk;
        }

        case Command::Parse: {
            ShortId sid;
            if (!try_parse(opts.argument, sid)) {
                log::error("'%s' is neither a short id nor a uuid", opts.argument.c_str());
                return kExitInvalidInput;
            }
            out << sid.text() << " " << format_uuid(sid.uuid(), cfg.output.uuid_case) << "\n";
            return kExitOk;
        }

        case Command::New: {
            int n = opts.count > 0 ? opts.count : cfg.output.count;
            log::debug("generating %d short id(s)", n);
            for (int i = 0; i < n; ++i) {
                out << ShortId::generate() << "\n";
            }
            return kExitOk;
        }
    }
    return kExitUsage;
}

} // namespace shortid::cli
