#include <shortid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace shortid {

static ShortIdError config_error(std::string msg, const std::string& origin, int line) {
    ShortIdError err(ShortIdError::Config, std::move(msg));
    if (!origin.empty()) err.at(origin, line);
    return err;
}

static int line_of(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        ShortIdError err(ShortIdError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()));
        if (!origin.empty()) err.at(origin, static_cast<int>(e.source().begin.line));
        return err;
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        for (const auto& [key, val] : *lg) {
            std::string k(key);
            if (k == "level") {
                auto s = val.value<std::string>();
                if (!s) {
                    return config_error("log.level must be a string", origin, line_of(val));
                }
                auto lvl = log::parse_level(*s);
                if (lvl.is_err()) {
                    auto err = std::move(lvl).error();
                    if (!origin.empty()) err.at(origin, line_of(val));
                    return err;
                }
                cfg.log.level = lvl.value();
                cfg.log_level_set = true;
            } else if (k == "color") {
                auto b = val.value<bool>();
                if (!b) {
                    return config_error("log.color must be a boolean", origin, line_of(val));
                }
                cfg.log.color = *b;
                cfg.log_color_set = true;
            } else {
                log::warn("ignoring unknown config key 'log.%s'", k.c_str());
            }
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        for (const auto& [key, val] : *out) {
            std::string k(key);
            if (k == "uuid-case") {
                auto s = val.value<std::string>();
                if (s && *s == "lower") {
                    cfg.output.uuid_case = UuidCase::Lower;
                } else if (s && *s == "upper") {
                    cfg.output.uuid_case = UuidCase::Upper;
                } else {
                    return config_error("output.uuid-case must be \"lower\" or \"upper\"",
                                        origin, line_of(val));
                }
                cfg.output_uuid_case_set = true;
            } else if (k == "count") {
                auto n = val.value<int64_t>();
                if (!n || *n < kMinCount || *n > kMaxCount) {
                    return config_error("output.count must be an integer in "
                                            + std::to_string(kMinCount) + ".."
                                            + std::to_string(kMaxCount),
                                        origin, line_of(val));
                }
                cfg.output.count = static_cast<int>(*n);
                cfg.output_count_set = true;
            } else {
                log::warn("ignoring unknown config key 'output.%s'", k.c_str());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ShortIdError{ShortIdError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loaded config from %s", path.c_str());
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }
    if (other.output_uuid_case_set) {
        output.uuid_case = other.output.uuid_case;
        output_uuid_case_set = true;
    }
    if (other.output_count_set) {
        output.count = other.output.count;
        output_count_set = true;
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
    return std::string(home) + "/.shortid/config.toml";
}

std::string local_config_path() {
    return "shortid.toml";
}

} // namespace shortid
