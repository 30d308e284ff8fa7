#pragma once

#include "ast/ast.hpp"
#include "common/arena_allocator.hpp"
#include "common/diagnostic.hpp"
#include "common/result.hpp"
#include "common/string_interner.hpp"
#include "lexer/token.hpp"
#include "lexer/token_cursor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loft {

/// Output of Parser::parse_recoverable: every statement that parsed, and
/// every error that was synchronized past, in source order.
struct RecoverableParse {
    std::vector<ast::Stmt*> stmts;
    std::vector<Diagnostic> errors;
};

/// Recursive descent parser for loft source code.
///
/// Statements are parsed by one-token-lookahead dispatch; expressions by
/// precedence climbing. The AST (nodes, lists and strings) is owned by the
/// parser and stays valid for its lifetime. `source` and `path` are borrowed
/// and must outlive the parser and the diagnostics it produces.
class Parser {
public:
    Parser(std::string_view source, std::string_view path);

    /// Parse the whole input, stopping at the first error.
    [[nodiscard]] Result<std::vector<ast::Stmt*>> parse();

    /// Parse the whole input, synchronizing to the next statement boundary
    /// after each error. A lexical error ends the parse.
    [[nodiscard]] RecoverableParse parse_recoverable();

    /// Take the most recent doc comment seen by the tokenizer.
    [[nodiscard]] std::optional<std::string> take_last_doc_comment() {
        return cursor_.take_last_doc_comment();
    }

private:
    static constexpr size_t kLambdaScanLimit = 100;

    TokenCursor cursor_;
    ArenaAllocator arena_;
    StringInterner interner_;
    std::optional<Diagnostic> error_; // first error of the current statement

    // How untyped parameters are treated.
    enum class ParamStyle : uint8_t {
        Function, // only `self` may omit its type (Named("Self"))
        Trait,    // any parameter may omit its type (Named(<param name>))
    };

    // ---- Token navigation ----
    [[nodiscard]] bool at_punct(std::string_view p);
    [[nodiscard]] bool at_op(std::string_view o);
    [[nodiscard]] bool at_keyword(std::string_view k);
    bool match_punct(std::string_view p);
    bool match_op(std::string_view o);
    bool expect_punct(std::string_view p);
    bool expect_op(std::string_view o);
    bool expect_keyword(std::string_view k);
    std::string_view expect_ident(std::string_view what); // empty on error
    void maybe_consume_semicolon();

    // ---- Error handling ----
    void error(std::string message);
    [[nodiscard]] Diagnostic take_error();
    void error_unexpected(std::string_view expected, std::optional<Token> got);
    void synchronize();

    // ---- Statements ----
    ast::Stmt* parse_statement();
    ast::Stmt* parse_attribute_statement();
    ast::Stmt* parse_var_decl(bool is_mutable);
    ast::Stmt* parse_const_decl();
    ast::Stmt* parse_function_decl(bool is_async, bool is_exported);
    ast::Stmt* parse_struct_decl();
    ast::Stmt* parse_enum_decl();
    ast::Stmt* parse_trait_decl();
    ast::Stmt* parse_impl_block();
    ast::Stmt* parse_import();
    ast::Stmt* parse_if();
    ast::Stmt* parse_while();
    ast::Stmt* parse_for();
    ast::Stmt* parse_match_statement();
    ast::Stmt* parse_return();
    ast::Stmt* parse_block_statement();
    ast::Stmt* parse_expr_statement();
    bool parse_block(std::vector<ast::Stmt*>& stmts);
    bool parse_params(ParamStyle style, std::vector<ast::TypedName>& params);

    // ---- Types ----
    ast::Type* parse_type();

    // ---- Expressions ----
    ast::Expr* parse_expression();
    ast::Expr* parse_binary_expr(int min_prec, bool allow_struct_literal);
    ast::Expr* parse_operand(bool allow_struct_literal);
    ast::Expr* parse_primary(bool allow_struct_literal);
    ast::Expr* parse_postfix(ast::Expr* expr, bool allow_struct_literal);
    ast::Expr* parse_call(ast::Expr* func);
    ast::Expr* parse_field_access(ast::Expr* object);
    ast::Expr* parse_index(ast::Expr* array);
    ast::Expr* parse_struct_literal(std::string_view name);
    ast::Expr* parse_array_literal();
    ast::Expr* parse_template_literal();
    ast::Expr* parse_match_expr();
    ast::Expr* parse_paren_or_lambda();
    ast::Expr* parse_lambda_params();
    ast::Expr* parse_lambda_body(std::vector<ast::LambdaParam> params);
    [[nodiscard]] bool scan_lambda_params();

    // Match patterns: literals, identifiers and parenthesized patterns,
    // folded with call/field/index postfixes and binary operators.
    ast::Expr* parse_pattern(int min_prec = 0);
    ast::Expr* parse_pattern_primary();

    // ---- AST node creation helpers ----
    template <typename T, typename... Args>
    T* alloc(Args&&... args) {
        return arena_.create<T>(std::forward<Args>(args)...);
    }

    template <typename T>
    ast::List<T> make_list(const std::vector<T>& vec) {
        return ast::make_list(arena_, vec);
    }

    [[nodiscard]] std::string_view intern(std::string_view text) { return interner_.intern(text); }

    ast::Expr* make_expr(ast::ExprKind kind);
    ast::Stmt* make_stmt(ast::StmtKind kind);
    ast::Type* make_type(ast::TypeKind kind);
    ast::Expr* make_ident(std::string_view name);
    ast::Expr* make_operand_expr(ast::ExprKind kind, ast::Expr* operand);
    ast::Expr* make_bin_op(std::string_view op, ast::Expr* left, ast::Expr* right);
};

} // namespace loft
