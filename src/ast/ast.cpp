#include "ast/ast.hpp"

#include <fmt/format.h>

namespace loft {
namespace ast {

std::string_view to_string(TypeKind kind) {
    switch (kind) {
        case TypeKind::Named:    return "Named";
        case TypeKind::Generic:  return "Generic";
        case TypeKind::Function: return "Function";
    }
    return "Unknown";
}

std::string_view to_string(ExprKind kind) {
    switch (kind) {
        case ExprKind::Number:          return "Number";
        case ExprKind::String:          return "String";
        case ExprKind::Boolean:         return "Boolean";
        case ExprKind::Ident:           return "Ident";
        case ExprKind::BinOp:           return "BinOp";
        case ExprKind::UnaryOp:         return "UnaryOp";
        case ExprKind::Call:            return "Call";
        case ExprKind::FieldAccess:     return "FieldAccess";
        case ExprKind::Index:           return "Index";
        case ExprKind::ArrayLiteral:    return "ArrayLiteral";
        case ExprKind::StructLiteral:   return "StructLiteral";
        case ExprKind::Lambda:          return "Lambda";
        case ExprKind::Block:           return "Block";
        case ExprKind::Await:           return "Await";
        case ExprKind::Async:           return "Async";
        case ExprKind::Lazy:            return "Lazy";
        case ExprKind::TemplateLiteral: return "TemplateLiteral";
        case ExprKind::Match:           return "Match";
        case ExprKind::Try:             return "Try";
    }
    return "Unknown";
}

std::string_view to_string(StmtKind kind) {
    switch (kind) {
        case StmtKind::ImportDecl:   return "ImportDecl";
        case StmtKind::VarDecl:      return "VarDecl";
        case StmtKind::ConstDecl:    return "ConstDecl";
        case StmtKind::FunctionDecl: return "FunctionDecl";
        case StmtKind::AttrStmt:     return "AttrStmt";
        case StmtKind::StructDecl:   return "StructDecl";
        case StmtKind::ImplBlock:    return "ImplBlock";
        case StmtKind::TraitDecl:    return "TraitDecl";
        case StmtKind::EnumDecl:     return "EnumDecl";
        case StmtKind::Assign:       return "Assign";
        case StmtKind::If:           return "If";
        case StmtKind::While:        return "While";
        case StmtKind::For:          return "For";
        case StmtKind::Match:        return "Match";
        case StmtKind::Return:       return "Return";
        case StmtKind::Break:        return "Break";
        case StmtKind::Continue:     return "Continue";
        case StmtKind::Expr:         return "Expr";
        case StmtKind::Block:        return "Block";
    }
    return "Unknown";
}

std::string type_to_string(const Type* type) {
    if (!type) return "<nil>";
    switch (type->kind) {
        case TypeKind::Named:
            return std::string(type->named.name);
        case TypeKind::Generic: {
            std::string args;
            for (uint32_t i = 0; i < type->generic.type_args.count; ++i) {
                if (i > 0) args += ", ";
                args += type_to_string(type->generic.type_args[i]);
            }
            return fmt::format("{}<{}>", type->generic.base, args);
        }
        case TypeKind::Function: {
            std::string params;
            for (uint32_t i = 0; i < type->function.params.count; ++i) {
                if (i > 0) params += ", ";
                params += type_to_string(type->function.params[i]);
            }
            return fmt::format("fn({}) -> {}", params, type_to_string(type->function.return_type));
        }
    }
    return "<unknown>";
}

Type* make_function_type(ArenaAllocator& arena, const std::vector<Type*>& params,
                         Type* return_type) {
    auto* t = arena.create<Type>();
    t->kind = TypeKind::Function;
    t->function.params = make_list(arena, params);
    t->function.return_type = return_type;
    return t;
}

Type* make_named_type(ArenaAllocator& arena, std::string_view name) {
    auto* t = arena.create<Type>();
    t->kind = TypeKind::Named;
    t->named.name = name;
    return t;
}

} // namespace ast
} // namespace loft
