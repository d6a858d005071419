#pragma once

#include <seanet/log.hpp>
#include <seanet/result.hpp>
#include <string>
#include <optional>

namespace seanet {

enum class OutputKind {
    Executable,
    Library
};

struct LogConfig {
    log::Level level = log::Info;
    std::optional<bool> color;  // unset: auto-detect from the terminal
};

struct DumpConfig {
    bool tokens = false;
    bool comments = false;
    bool ast = true;
};

// Layered configuration: global > project
// Lower layers override higher layers (project wins over global)
struct Config {
    LogConfig log;
    OutputKind output_kind = OutputKind::Executable;
    DumpConfig dump;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool output_kind_set = false;
    bool dump_tokens_set = false;
    bool dump_comments_set = false;
    bool dump_ast_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

const char* output_kind_name(OutputKind kind);

// Discover the global config file path: ~/.seanet/config.toml
std::string global_config_path();

// Project-level config file name, looked up in the working directory
inline constexpr const char* kProjectConfigFile = "seanet.toml";

} // namespace seanet
