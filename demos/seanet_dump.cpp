// seanet_dump.cpp
//
// Scan and parse one Seanet source file, then print what the front end
// produced. Run it with:
//
//     ./seanet-dump ../tests/fixtures/fib.sn            # AST only
//     ./seanet-dump ../tests/fixtures/fib.sn --tokens   # tokens too
//     ./seanet-dump broken.sn                           # diagnostics on stderr
//
// Settings come from ~/.seanet/config.toml and ./seanet.toml (project wins);
// command-line flags override both. Exit status is 1 if anything was reported.

#include <seanet/config.hpp>
#include <seanet/log.hpp>
#include <seanet/result.hpp>
#include <seanet/source.hpp>
#include <seanet/lang/ast_dump.hpp>
#include <seanet/lang/parser.hpp>
#include <seanet/lang/scanner.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace seanet;

namespace {

struct Options {
    std::string path;
    std::optional<bool> tokens;
    std::optional<bool> ast;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            opts.tokens = true;
        } else if (arg == "--no-ast") {
            opts.ast = false;
        } else if (!arg.empty() && arg[0] == '-') {
            return SeanetError{SeanetError::InvalidArg,
                "unknown option: " + arg,
                "usage: seanet-dump <file.sn> [--tokens] [--no-ast]"};
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            return SeanetError{SeanetError::InvalidArg,
                "more than one input file given",
                "usage: seanet-dump <file.sn> [--tokens] [--no-ast]"};
        }
    }
    if (opts.path.empty()) {
        return SeanetError{SeanetError::InvalidArg,
            "no input file specified",
            "usage: seanet-dump <file.sn> [--tokens] [--no-ast]"};
    }
    return Result<Options>::ok(std::move(opts));
}

// A layer that does not exist is skipped; one that exists must be valid.
Result<std::optional<Config>> load_layer(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto r = Config::load(path);
    if (r.is_err()) return std::move(r).error();
    log::debug("loaded config layer %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(r).value());
}

Result<Config> load_config() {
    auto global = load_layer(global_config_path());
    if (global.is_err()) return std::move(global).error();
    auto project = load_layer(kProjectConfigFile);
    if (project.is_err()) return std::move(project).error();
    return Result<Config>::ok(Config::effective(global.value(), project.value()));
}

void print_tokens(const std::vector<Token>& tokens, bool with_comments) {
    std::cout << "-- Tokens --\n";
    for (const auto& t : tokens) {
        if (t.kind == TokenKind::Comment && !with_comments) continue;
        std::cout << "  " << t.pos.line << ":" << t.pos.col
                  << "  " << token_kind_name(t.kind)
                  << "  \"" << t.text() << "\"\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }
    const Options& opts = args.value();

    auto cfg_result = load_config();
    if (cfg_result.is_err()) {
        std::cerr << cfg_result.error().format() << "\n";
        return 1;
    }
    const Config& cfg = cfg_result.value();

    log::set_level(cfg.log.level);
    if (cfg.log.color) log::set_color_enabled(*cfg.log.color);
    log::debug("output kind: %s", output_kind_name(cfg.output_kind));

    auto src = SourceFile::load(opts.path);
    if (src.is_err()) {
        std::cerr << src.error().format() << "\n";
        return 1;
    }
    const SourceFile& file = src.value();

    Diagnostics diags;
    std::vector<Token> tokens = scan(file.name, file.view(), diags);
    Program program = parse(file.name, tokens, diags);

    std::cout << "--- " << file.name << " ---\n";
    std::cout << "Tokens: " << tokens.size()
              << "  Declarations: " << program.declarations.size() << "\n";

    if (opts.tokens.value_or(cfg.dump.tokens)) {
        std::cout << "\n";
        print_tokens(tokens, cfg.dump.comments);
    }

    if (opts.ast.value_or(cfg.dump.ast) && !program.empty()) {
        std::cout << "\n-- AST --\n" << dump(program) << "\n";
    }

    for (const auto& line : diags.formatted()) {
        std::cerr << line << "\n";
    }
    if (diags.has_errors()) {
        log::info("%zu diagnostic(s) in %s", diags.size(), file.name.c_str());
        return 1;
    }
    return 0;
}
