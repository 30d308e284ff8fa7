#pragma once

#include "common/arena_allocator.hpp"
#include "common/decimal.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace loft {
namespace ast {

// Forward declarations
struct Expr;
struct Stmt;
struct Type;

// ============================================================================
// Helper: Arena-allocated list (pointer + count)
// ============================================================================
template <typename T>
struct List {
    T* data    = nullptr;
    uint32_t count = 0;

    [[nodiscard]] std::span<T> span() { return {data, count}; }
    [[nodiscard]] std::span<const T> span() const { return {data, count}; }
    [[nodiscard]] bool empty() const { return count == 0; }
    [[nodiscard]] uint32_t size() const { return count; }
    [[nodiscard]] T& operator[](uint32_t i) { return data[i]; }
    [[nodiscard]] const T& operator[](uint32_t i) const { return data[i]; }
    [[nodiscard]] T* begin() { return data; }
    [[nodiscard]] T* end() { return data + count; }
    [[nodiscard]] const T* begin() const { return data; }
    [[nodiscard]] const T* end() const { return data + count; }
};

// ============================================================================
// Types
// ============================================================================

enum class TypeKind : uint8_t {
    Named,     // num, str, Point
    Generic,   // Array<num>, Map<str, num>
    Function,  // fn(num, num) -> num (synthetic only, see make_function_type)
};

struct NamedType {
    std::string_view name;
};

struct GenericType {
    std::string_view base;
    List<Type*> type_args;
};

struct FunctionType {
    List<Type*> params;
    Type* return_type;
};

struct Type {
    TypeKind kind;
    union {
        NamedType named;
        GenericType generic;
        FunctionType function;
    };

    Type() : kind(TypeKind::Named), named{} {}
};

// ============================================================================
// Expressions
// ============================================================================

enum class ExprKind : uint8_t {
    Number,          // 42, 3.14
    String,          // "hello"
    Boolean,         // true, false
    Ident,           // x
    BinOp,           // a + b
    UnaryOp,         // -a, !a, ~a
    Call,            // f(a, b)
    FieldAccess,     // a.b
    Index,           // a[i]
    ArrayLiteral,    // [a, b]
    StructLiteral,   // Point { x: 1, y: 2 }
    Lambda,          // v => v, (a: num, b) => { ... }
    Block,           // { stmts }
    Await,           // await e
    Async,           // async e
    Lazy,            // lazy e
    TemplateLiteral, // `a${b}c`
    Match,           // match e { p => e, ... }
    Try,             // e?
};

struct NumberExpr {
    Decimal value;
};

struct StringExpr {
    std::string_view value;
};

struct BooleanExpr {
    bool value;
};

struct IdentExpr {
    std::string_view name;
};

struct BinOpExpr {
    std::string_view op;
    Expr* left;
    Expr* right;
};

struct UnaryOpExpr {
    std::string_view op;
    Expr* expr;
};

struct CallExpr {
    Expr* func;
    List<Expr*> args;
};

struct FieldAccessExpr {
    Expr* object;
    std::string_view field;
};

struct IndexExpr {
    Expr* array;
    Expr* index;
};

struct ArrayLiteralExpr {
    List<Expr*> elements;
};

struct FieldInit {
    std::string_view name;
    Expr* value;
};

struct StructLiteralExpr {
    std::string_view name;
    List<FieldInit> fields;
};

struct LambdaParam {
    std::string_view name;
    Type* type;            // May be null
};

struct LambdaExpr {
    List<LambdaParam> params;
    Type* return_type;     // May be null
    Expr* body;            // Block or any expression
};

struct BlockExpr {
    List<Stmt*> stmts;
};

// Await, Async, Lazy and Try wrap a single operand.
struct OperandExpr {
    Expr* expr;
};

enum class TemplatePartKind : uint8_t {
    Text,
    Expression,
};

struct TemplatePart {
    TemplatePartKind kind;
    std::string_view text; // Text parts
    Expr* expr;            // Expression parts
};

struct TemplateLiteralExpr {
    List<TemplatePart> parts;
};

struct MatchExprArm {
    Expr* pattern;
    Expr* body;
};

struct MatchExpr {
    Expr* subject;
    List<MatchExprArm> arms;
};

struct Expr {
    ExprKind kind;
    union {
        NumberExpr number;
        StringExpr string;
        BooleanExpr boolean;
        IdentExpr ident;
        BinOpExpr bin_op;
        UnaryOpExpr unary_op;
        CallExpr call;
        FieldAccessExpr field_access;
        IndexExpr index;
        ArrayLiteralExpr array_literal;
        StructLiteralExpr struct_literal;
        LambdaExpr lambda;
        BlockExpr block;
        OperandExpr operand;   // Await, Async, Lazy, Try
        TemplateLiteralExpr template_literal;
        MatchExpr match;
    };

    Expr() : kind(ExprKind::Ident), ident{} {}
};

// ============================================================================
// Statements
// ============================================================================

enum class StmtKind : uint8_t {
    ImportDecl,    // learn "a::b";
    VarDecl,       // let x: T = e;  mut let x = e;
    ConstDecl,     // const X: T = e;
    FunctionDecl,  // fn f<T>(a: T) -> T { ... }
    AttrStmt,      // #[name(args)] stmt
    StructDecl,    // def Point { x: num }
    ImplBlock,     // impl [Trait for] Type { fns }
    TraitDecl,     // trait T { fn m(self) -> num; }
    EnumDecl,      // enum E { A, B(num) }
    Assign,        // x = e;
    If,            // if (c) s else s
    While,         // while (c) { ... }
    For,           // for x in e { ... }
    Match,         // match e { p => s, ... }
    Return,        // return [e];
    Break,         // break;
    Continue,      // continue;
    Expr,          // expression statement
    Block,         // { stmts }
};

// A `name: Type` pair (function parameters, struct fields).
struct TypedName {
    std::string_view name;
    Type* type;
};

struct ImportDeclStmt {
    List<std::string_view> path; // learn "a::b::c" -> [a, b, c]
};

struct VarDeclStmt {
    std::string_view name;
    Type* type;            // May be null
    bool is_mutable;
    Expr* value;           // May be null
};

struct ConstDeclStmt {
    std::string_view name;
    Type* type;            // May be null
    Expr* value;
};

struct FunctionDeclStmt {
    std::string_view name;
    List<std::string_view> type_params;
    List<TypedName> params;
    Type* return_type;     // May be null
    Stmt* body;            // Block
    bool is_async;
    bool is_exported;
};

struct Attribute {
    std::string_view name;
    List<Expr*> args;
};

struct AttrStmt {
    Attribute attr;
    Stmt* stmt;
};

struct StructDeclStmt {
    std::string_view name;
    List<TypedName> fields;
};

struct ImplBlockStmt {
    std::string_view type_name;
    std::string_view trait_name; // Empty for inherent impls
    List<Stmt*> methods;         // FunctionDecl
};

enum class TraitMethodKind : uint8_t {
    Signature, // fn m(self) -> T;
    Default,   // fn m(self) -> T { ... }
};

struct TraitMethod {
    TraitMethodKind kind;
    std::string_view name;
    List<TypedName> params;
    Type* return_type;
    Stmt* body;            // Block for Default, null for Signature
};

struct TraitDeclStmt {
    std::string_view name;
    List<TraitMethod> methods;
};

struct EnumVariant {
    std::string_view name;
    bool has_fields;       // True for A(...), even A()
    List<Type*> fields;
};

struct EnumDeclStmt {
    std::string_view name;
    List<EnumVariant> variants;
};

struct AssignStmt {
    std::string_view name;
    Expr* value;
};

struct IfStmt {
    Expr* condition;
    Stmt* then_branch;
    Stmt* else_branch;     // May be null
};

struct WhileStmt {
    Expr* condition;
    Stmt* body;            // Block
};

struct ForStmt {
    std::string_view var;
    Expr* iterable;
    Stmt* body;            // Block
};

struct MatchStmtArm {
    Expr* pattern;
    Stmt* body;
};

struct MatchStmt {
    Expr* subject;
    List<MatchStmtArm> arms;
};

struct ReturnStmt {
    Expr* value;           // May be null
};

struct EmptyStmt {
};

struct ExprStmt {
    Expr* expr;
};

struct BlockStmt {
    List<Stmt*> stmts;
};

struct Stmt {
    StmtKind kind;
    union {
        ImportDeclStmt import;
        VarDeclStmt var_decl;
        ConstDeclStmt const_decl;
        FunctionDeclStmt function;
        AttrStmt attr;
        StructDeclStmt struct_decl;
        ImplBlockStmt impl;
        TraitDeclStmt trait;
        EnumDeclStmt enum_decl;
        AssignStmt assign;
        IfStmt if_;
        WhileStmt while_;
        ForStmt for_;
        MatchStmt match;
        ReturnStmt return_;
        EmptyStmt empty;       // Break, Continue
        ExprStmt expr;
        BlockStmt block;
    };

    Stmt() : kind(StmtKind::Break), empty{} {}
};

// ============================================================================
// Names and display helpers
// ============================================================================

[[nodiscard]] std::string_view to_string(TypeKind kind);
[[nodiscard]] std::string_view to_string(ExprKind kind);
[[nodiscard]] std::string_view to_string(StmtKind kind);

/// Render a type the way it is written in source: `num`, `Map<str, num>`,
/// `fn(num) -> str`.
[[nodiscard]] std::string type_to_string(const Type* type);

// ============================================================================
// AST creation helpers (all arena-allocated)
// ============================================================================

// Create a list from a vector
template <typename T>
List<T> make_list(ArenaAllocator& arena, const std::vector<T>& vec) {
    return List<T>{arena.copy_array(vec), static_cast<uint32_t>(vec.size())};
}

/// Build a function type. The type parser never produces one; callers that
/// need `fn(params) -> ret` types construct them here.
[[nodiscard]] Type* make_function_type(ArenaAllocator& arena, const std::vector<Type*>& params,
                                       Type* return_type);

/// Build a named type. `name` must outlive the arena's contents.
[[nodiscard]] Type* make_named_type(ArenaAllocator& arena, std::string_view name);

} // namespace ast
} // namespace loft
