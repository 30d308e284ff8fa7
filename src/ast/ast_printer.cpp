#include "ast/ast_printer.hpp"

#include <fmt/format.h>

namespace loft {
namespace ast {

std::string AstPrinter::print(std::span<Stmt* const> stmts) {
    output_.clear();
    indent_ = 0;
    for (const auto* s : stmts) {
        print_stmt(s);
    }
    return output_;
}

std::string AstPrinter::print(const Stmt* stmt) {
    output_.clear();
    indent_ = 0;
    print_stmt(stmt);
    return output_;
}

std::string AstPrinter::print(const Expr* expr) {
    output_.clear();
    indent_ = 0;
    print_expr(expr);
    return output_;
}

void AstPrinter::line(std::string_view text) {
    for (int i = 0; i < indent_; ++i) {
        output_ += "  ";
    }
    output_ += text;
    output_ += '\n';
}

void AstPrinter::indent() { ++indent_; }
void AstPrinter::dedent() { --indent_; }

void AstPrinter::print_labeled(std::string_view label, const Expr* expr) {
    line(label);
    indent();
    print_expr(expr);
    dedent();
}

void AstPrinter::print_labeled(std::string_view label, const Stmt* stmt) {
    line(label);
    indent();
    print_stmt(stmt);
    dedent();
}

std::string AstPrinter::format_params(const List<TypedName>& params) {
    std::string out;
    for (uint32_t i = 0; i < params.count; ++i) {
        if (i > 0) out += ", ";
        out += fmt::format("{}: {}", params[i].name, type_to_string(params[i].type));
    }
    return out;
}

void AstPrinter::print_stmt(const Stmt* stmt) {
    if (!stmt) { line("nil"); return; }
    switch (stmt->kind) {
        case StmtKind::ImportDecl: {
            std::string path;
            for (uint32_t i = 0; i < stmt->import.path.count; ++i) {
                if (i > 0) path += "::";
                path += stmt->import.path[i];
            }
            line(fmt::format("ImportDecl: {}", path));
            break;
        }
        case StmtKind::VarDecl: {
            const auto& v = stmt->var_decl;
            line(fmt::format("VarDecl: {}{}", v.name, v.is_mutable ? " (mut)" : ""));
            indent();
            if (v.type) {
                line(fmt::format("Type: {}", type_to_string(v.type)));
            }
            if (v.value) {
                print_expr(v.value);
            }
            dedent();
            break;
        }
        case StmtKind::ConstDecl: {
            const auto& c = stmt->const_decl;
            line(fmt::format("ConstDecl: {}", c.name));
            indent();
            if (c.type) {
                line(fmt::format("Type: {}", type_to_string(c.type)));
            }
            print_expr(c.value);
            dedent();
            break;
        }
        case StmtKind::FunctionDecl: {
            const auto& f = stmt->function;
            std::string flags;
            if (f.is_async) flags += " async";
            if (f.is_exported) flags += " exported";
            line(fmt::format("FunctionDecl: {}{}", f.name, flags));
            indent();
            if (!f.type_params.empty()) {
                std::string names;
                for (uint32_t i = 0; i < f.type_params.count; ++i) {
                    if (i > 0) names += ", ";
                    names += f.type_params[i];
                }
                line(fmt::format("TypeParams: {}", names));
            }
            for (const auto& p : f.params) {
                line(fmt::format("Param: {}: {}", p.name, type_to_string(p.type)));
            }
            if (f.return_type) {
                line(fmt::format("Returns: {}", type_to_string(f.return_type)));
            }
            print_stmt(f.body);
            dedent();
            break;
        }
        case StmtKind::AttrStmt: {
            line(fmt::format("AttrStmt: {}", stmt->attr.attr.name));
            indent();
            for (const auto* arg : stmt->attr.attr.args) {
                print_labeled("Arg:", arg);
            }
            print_stmt(stmt->attr.stmt);
            dedent();
            break;
        }
        case StmtKind::StructDecl: {
            line(fmt::format("StructDecl: {}", stmt->struct_decl.name));
            indent();
            for (const auto& f : stmt->struct_decl.fields) {
                line(fmt::format("Field: {}: {}", f.name, type_to_string(f.type)));
            }
            dedent();
            break;
        }
        case StmtKind::ImplBlock: {
            const auto& impl = stmt->impl;
            if (impl.trait_name.empty()) {
                line(fmt::format("ImplBlock: {}", impl.type_name));
            } else {
                line(fmt::format("ImplBlock: {} for {}", impl.trait_name, impl.type_name));
            }
            indent();
            for (const auto* m : impl.methods) {
                print_stmt(m);
            }
            dedent();
            break;
        }
        case StmtKind::TraitDecl: {
            line(fmt::format("TraitDecl: {}", stmt->trait.name));
            indent();
            for (const auto& m : stmt->trait.methods) {
                bool is_default = m.kind == TraitMethodKind::Default;
                line(fmt::format("{}: {}({}) -> {}", is_default ? "Default" : "Signature", m.name,
                                 format_params(m.params), type_to_string(m.return_type)));
                if (is_default) {
                    indent();
                    print_stmt(m.body);
                    dedent();
                }
            }
            dedent();
            break;
        }
        case StmtKind::EnumDecl: {
            line(fmt::format("EnumDecl: {}", stmt->enum_decl.name));
            indent();
            for (const auto& v : stmt->enum_decl.variants) {
                if (!v.has_fields) {
                    line(fmt::format("Variant: {}", v.name));
                    continue;
                }
                std::string types;
                for (uint32_t i = 0; i < v.fields.count; ++i) {
                    if (i > 0) types += ", ";
                    types += type_to_string(v.fields[i]);
                }
                line(fmt::format("Variant: {}({})", v.name, types));
            }
            dedent();
            break;
        }
        case StmtKind::Assign:
            line(fmt::format("Assign: {}", stmt->assign.name));
            indent();
            print_expr(stmt->assign.value);
            dedent();
            break;
        case StmtKind::If:
            line("If");
            indent();
            print_labeled("Condition:", stmt->if_.condition);
            print_labeled("Then:", stmt->if_.then_branch);
            if (stmt->if_.else_branch) {
                print_labeled("Else:", stmt->if_.else_branch);
            }
            dedent();
            break;
        case StmtKind::While:
            line("While");
            indent();
            print_labeled("Condition:", stmt->while_.condition);
            print_stmt(stmt->while_.body);
            dedent();
            break;
        case StmtKind::For:
            line(fmt::format("For: {}", stmt->for_.var));
            indent();
            print_labeled("Iterable:", stmt->for_.iterable);
            print_stmt(stmt->for_.body);
            dedent();
            break;
        case StmtKind::Match:
            line("Match");
            indent();
            print_labeled("Subject:", stmt->match.subject);
            for (const auto& arm : stmt->match.arms) {
                line("Arm");
                indent();
                print_expr(arm.pattern);
                print_stmt(arm.body);
                dedent();
            }
            dedent();
            break;
        case StmtKind::Return:
            line("Return");
            if (stmt->return_.value) {
                indent();
                print_expr(stmt->return_.value);
                dedent();
            }
            break;
        case StmtKind::Break:
            line("Break");
            break;
        case StmtKind::Continue:
            line("Continue");
            break;
        case StmtKind::Expr:
            line("ExprStmt");
            indent();
            print_expr(stmt->expr.expr);
            dedent();
            break;
        case StmtKind::Block:
            line("Block");
            indent();
            for (const auto* s : stmt->block.stmts) {
                print_stmt(s);
            }
            dedent();
            break;
    }
}

void AstPrinter::print_expr(const Expr* expr) {
    if (!expr) { line("nil"); return; }
    switch (expr->kind) {
        case ExprKind::Number:
            line(fmt::format("Number: {}", expr->number.value.to_string()));
            break;
        case ExprKind::String:
            line(fmt::format("String: \"{}\"", expr->string.value));
            break;
        case ExprKind::Boolean:
            line(fmt::format("Boolean: {}", expr->boolean.value));
            break;
        case ExprKind::Ident:
            line(fmt::format("Ident: {}", expr->ident.name));
            break;
        case ExprKind::BinOp:
            line(fmt::format("BinOp: {}", expr->bin_op.op));
            indent();
            print_expr(expr->bin_op.left);
            print_expr(expr->bin_op.right);
            dedent();
            break;
        case ExprKind::UnaryOp:
            line(fmt::format("UnaryOp: {}", expr->unary_op.op));
            indent();
            print_expr(expr->unary_op.expr);
            dedent();
            break;
        case ExprKind::Call:
            line("Call");
            indent();
            print_expr(expr->call.func);
            for (const auto* arg : expr->call.args) {
                print_labeled("Arg:", arg);
            }
            dedent();
            break;
        case ExprKind::FieldAccess:
            line(fmt::format("FieldAccess: .{}", expr->field_access.field));
            indent();
            print_expr(expr->field_access.object);
            dedent();
            break;
        case ExprKind::Index:
            line("Index");
            indent();
            print_expr(expr->index.array);
            print_expr(expr->index.index);
            dedent();
            break;
        case ExprKind::ArrayLiteral:
            line(fmt::format("ArrayLiteral ({} elements)", expr->array_literal.elements.count));
            indent();
            for (const auto* e : expr->array_literal.elements) {
                print_expr(e);
            }
            dedent();
            break;
        case ExprKind::StructLiteral:
            line(fmt::format("StructLiteral: {}", expr->struct_literal.name));
            indent();
            for (const auto& f : expr->struct_literal.fields) {
                print_labeled(fmt::format("Field: {}", f.name), f.value);
            }
            dedent();
            break;
        case ExprKind::Lambda: {
            const auto& l = expr->lambda;
            std::string params;
            for (uint32_t i = 0; i < l.params.count; ++i) {
                if (i > 0) params += ", ";
                params += l.params[i].name;
                if (l.params[i].type) {
                    params += fmt::format(": {}", type_to_string(l.params[i].type));
                }
            }
            line(fmt::format("Lambda: ({})", params));
            indent();
            if (l.return_type) {
                line(fmt::format("Returns: {}", type_to_string(l.return_type)));
            }
            print_expr(l.body);
            dedent();
            break;
        }
        case ExprKind::Block:
            line("BlockExpr");
            indent();
            for (const auto* s : expr->block.stmts) {
                print_stmt(s);
            }
            dedent();
            break;
        case ExprKind::Await:
        case ExprKind::Async:
        case ExprKind::Lazy:
        case ExprKind::Try:
            line(to_string(expr->kind));
            indent();
            print_expr(expr->operand.expr);
            dedent();
            break;
        case ExprKind::TemplateLiteral:
            line("TemplateLiteral");
            indent();
            for (const auto& part : expr->template_literal.parts) {
                if (part.kind == TemplatePartKind::Text) {
                    line(fmt::format("Text: \"{}\"", part.text));
                } else {
                    print_expr(part.expr);
                }
            }
            dedent();
            break;
        case ExprKind::Match:
            line("MatchExpr");
            indent();
            print_labeled("Subject:", expr->match.subject);
            for (const auto& arm : expr->match.arms) {
                line("Arm");
                indent();
                print_expr(arm.pattern);
                print_expr(arm.body);
                dedent();
            }
            dedent();
            break;
    }
}

} // namespace ast
} // namespace loft
