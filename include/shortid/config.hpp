#pragma once

#include <shortid/log.hpp>
#include <shortid/result.hpp>
#include <optional>
#include <string>

namespace shortid {

enum class UuidCase { Lower, Upper };

// Bounds for ids produced per `shortid new`, from -n or output.count
constexpr int kMinCount = 1;
constexpr int kMaxCount = 100000;

struct LogConfig {
    log::Level level = log::Warn;
    bool color = true;
};

struct OutputConfig {
    UuidCase uuid_case = UuidCase::Lower;  // 36-char form printed by the CLI
    int count = 1;                          // ids produced by `shortid new`
};

// Layered configuration: global > local
// Later layers override only the fields they set explicitly
struct Config {
    LogConfig log;
    OutputConfig output;
    bool log_level_set = false;
    bool log_color_set = false;
    bool output_uuid_case_set = false;
    bool output_count_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `origin` names the source in error messages
    static Result<Config> parse(const std::string& toml_str, const std::string& origin = "");

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.shortid/config.toml, or "" if no home directory is known
std::string global_config_path();

// ./shortid.toml
std::string local_config_path();

} // namespace shortid
