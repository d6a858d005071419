#include <seanet/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace seanet {

const char* output_kind_name(OutputKind kind) {
    switch (kind) {
        case OutputKind::Executable: return "executable";
        case OutputKind::Library:    return "library";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SeanetError{SeanetError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return SeanetError{SeanetError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.log.color = *v;
        }
    }

    // [output] section
    if (auto section = doc["output"].as_table()) {
        if (auto v = (*section)["kind"].value<std::string>()) {
            if (*v == "executable") {
                cfg.output_kind = OutputKind::Executable;
            } else if (*v == "library") {
                cfg.output_kind = OutputKind::Library;
            } else {
                return SeanetError{SeanetError::Config,
                    "unknown output kind '" + *v + "'",
                    "expected \"executable\" or \"library\""};
            }
            cfg.output_kind_set = true;
        }
    }

    // [dump] section
    if (auto section = doc["dump"].as_table()) {
        if (auto v = (*section)["tokens"].value<bool>()) {
            cfg.dump.tokens = *v;
            cfg.dump_tokens_set = true;
        }
        if (auto v = (*section)["comments"].value<bool>()) {
            cfg.dump.comments = *v;
            cfg.dump_comments_set = true;
        }
        if (auto v = (*section)["ast"].value<bool>()) {
            cfg.dump.ast = *v;
            cfg.dump_ast_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SeanetError{SeanetError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log.color.has_value()) {
        log.color = other.log.color;
    }

    if (other.output_kind_set) {
        output_kind = other.output_kind;
        output_kind_set = true;
    }

    if (other.dump_tokens_set) {
        dump.tokens = other.dump.tokens;
        dump_tokens_set = true;
    }
    if (other.dump_comments_set) {
        dump.comments = other.dump.comments;
        dump_comments_set = true;
    }
    if (other.dump_ast_set) {
        dump.ast = other.dump.ast;
        dump_ast_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.seanet/config.toml";
}

} // namespace seanet
