#pragma once

#include "ast/ast.hpp"

#include <span>
#include <string>

namespace loft {
namespace ast {

/// Pretty-prints an AST as an indented tree structure.
class AstPrinter {
public:
    [[nodiscard]] std::string print(std::span<Stmt* const> stmts);
    [[nodiscard]] std::string print(const Stmt* stmt);
    [[nodiscard]] std::string print(const Expr* expr);

private:
    std::string output_;
    int indent_ = 0;

    void print_stmt(const Stmt* stmt);
    void print_expr(const Expr* expr);
    void print_labeled(std::string_view label, const Expr* expr);
    void print_labeled(std::string_view label, const Stmt* stmt);
    [[nodiscard]] static std::string format_params(const List<TypedName>& params);

    void line(std::string_view text);
    void indent();
    void dedent();
};

} // namespace ast
} // namespace loft
