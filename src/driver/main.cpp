#include "ast/ast_printer.hpp"
#include "common/diagnostic.hpp"
#include "lexer/input_stream.hpp"
#include "lexer/token.hpp"
#include "lexer/tokenizer.hpp"
#include "parser/parser.hpp"

#include <fmt/format.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

void print_usage(std::string_view program) {
    fmt::print("Usage: {} [options] <source.lf>\n", program);
    fmt::print("\nOptions:\n");
    fmt::print("  --help          Show this help message\n");
    fmt::print("  --version       Show version information\n");
    fmt::print("  --dump-tokens   Dump tokens and exit\n");
    fmt::print("  --comments      Include comments in --dump-tokens output\n");
    fmt::print("  --dump-ast      Dump parsed AST and exit\n");
    fmt::print("  --check         Parse with error recovery and report every error\n");
}

void print_version() {
    fmt::print("loftc 0.1.0\n");
    fmt::print("loft language front end\n");
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

int dump_tokens(const std::string& source, const std::string& path, bool with_comments,
                loft::DiagnosticEngine& diag) {
    loft::Tokenizer tokenizer(loft::PositionedInputStream(source, path),
                              loft::TokenizerOptions{with_comments});
    for (const auto& tok : tokenizer.tokenize_all()) {
        fmt::print("{:20s} {}\n", loft::token_kind_to_string(tok.kind), tok.describe());
    }
    if (tokenizer.error()) {
        diag.report(*tokenizer.error());
    }
    return diag.has_errors() ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    bool dump_tokens_flag = false;
    bool with_comments = false;
    bool dump_ast = false;
    bool check_only = false;
    std::string source_file;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--dump-tokens") {
            dump_tokens_flag = true;
        } else if (arg == "--comments") {
            with_comments = true;
        } else if (arg == "--dump-ast") {
            dump_ast = true;
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg[0] == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", arg);
            return 1;
        } else {
            source_file = std::string(arg);
        }
    }

    if (source_file.empty()) {
        fmt::print(stderr, "error: no input file\n");
        return 1;
    }

    std::optional<std::string> source = read_file(source_file);
    if (!source) {
        fmt::print(stderr, "error: cannot open file '{}'\n", source_file);
        return 1;
    }

    loft::DiagnosticEngine diag;
    diag.set_handler([](const loft::Diagnostic& d) {
        fmt::print(stderr, "{}\n", loft::render_diagnostic(d));
    });

    if (!std::string_view(source_file).ends_with(".lf")) {
        diag.warning(loft::SourceLocation{source_file, {}, 0},
                     "input file does not have the '.lf' extension");
    }

    if (dump_tokens_flag) {
        return dump_tokens(*source, source_file, with_comments, diag);
    }

    loft::Parser parser(*source, source_file);

    if (check_only) {
        loft::RecoverableParse result = parser.parse_recoverable();
        for (auto& error : result.errors) {
            diag.report(std::move(error));
        }
        if (diag.has_errors()) {
            fmt::print(stderr, "parsing failed with {} error(s)\n", diag.error_count());
            return 1;
        }
        fmt::print("parsed {} statement(s)\n", result.stmts.size());
        return 0;
    }

    auto result = parser.parse();
    if (!result) {
        diag.report(std::move(result.error()));
        fmt::print(stderr, "parsing failed with {} error(s)\n", diag.error_count());
        return 1;
    }

    if (dump_ast) {
        loft::ast::AstPrinter printer;
        fmt::print("{}", printer.print(result.value()));
        return 0;
    }

    fmt::print("parsing succeeded\n");
    return 0;
}
