#pragma once

#include <shortid/config.hpp>
#include <shortid/result.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace shortid::cli {

enum class Command { Encode, Decode, Parse, New, Help };

struct Options {
    Command command = Command::Help;
    std::string argument;       // input text for encode/decode/parse
    int count = 0;              // -n for `new`; 0 means "use config"
    std::string config_path;    // --config, replaces the local layer
    int verbosity = 0;          // +1 per -v, -1 per -q
};

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitInvalidInput = 1;
constexpr int kExitUsage = 2;

// args excludes argv[0]
Result<Options> parse_args(const std::vector<std::string>& args);

// Reads the global config and either `opts.config_path` or ./shortid.toml.
// Missing files are skipped unless named explicitly with --config.
Result<Config> load_config(const Options& opts);

// Applies config and verbosity flags to the logger
void configure_logging(const Config& cfg, const Options& opts);

// Executes the command, writing results to `out`
int run(const Options& opts, const Config& cfg, std::ostream& out);

const char* usage();

} // namespace shortid::cli
