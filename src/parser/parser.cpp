#include "parser/parser.hpp"

#include <fmt/format.h>

namespace loft {

using namespace ast;

namespace {

// Keywords that start a statement; recovery stops in front of them.
bool is_sync_keyword(std::string_view word) {
    return word == "fn" || word == "let" || word == "const" || word == "if" ||
           word == "while" || word == "for" || word == "return" || word == "teach" ||
           word == "learn" || word == "def" || word == "impl" || word == "trait";
}

} // namespace

// ============================================================================
// Constructor & main entry points
// ============================================================================

Parser::Parser(std::string_view source, std::string_view path) : cursor_(source, path) {}

Result<std::vector<Stmt*>> Parser::parse() {
    using ParseResult = Result<std::vector<Stmt*>>;

    std::vector<Stmt*> stmts;
    error_.reset();
    while (!cursor_.at_end()) {
        Stmt* stmt = parse_statement();
        if (!stmt) {
            return ParseResult::err(take_error());
        }
        stmts.push_back(stmt);
    }
    if (cursor_.error()) {
        return ParseResult::err(*cursor_.error());
    }
    return ParseResult::ok(std::move(stmts));
}

RecoverableParse Parser::parse_recoverable() {
    RecoverableParse result;
    for (;;) {
        if (cursor_.at_end()) {
            if (cursor_.error()) {
                result.errors.push_back(*cursor_.error());
            }
            break;
        }

        error_.reset();
        Stmt* stmt = parse_statement();
        if (stmt) {
            result.stmts.push_back(stmt);
            continue;
        }

        result.errors.push_back(take_error());
        if (cursor_.error()) {
            // Lexical errors are fatal and already recorded.
            break;
        }
        synchronize();
    }
    return result;
}

// ============================================================================
// Token navigation
// ============================================================================

bool Parser::at_punct(std::string_view p) {
    const Token* tok = cursor_.peek();
    return tok && tok->is_punct(p);
}

bool Parser::at_op(std::string_view o) {
    const Token* tok = cursor_.peek();
    return tok && tok->is_op(o);
}

bool Parser::at_keyword(std::string_view k) {
    const Token* tok = cursor_.peek();
    return tok && tok->is_keyword(k);
}

bool Parser::match_punct(std::string_view p) {
    if (at_punct(p)) {
        cursor_.next();
        return true;
    }
    return false;
}

bool Parser::match_op(std::string_view o) {
    if (at_op(o)) {
        cursor_.next();
        return true;
    }
    return false;
}

bool Parser::expect_punct(std::string_view p) {
    std::optional<Token> tok = cursor_.next();
    if (tok && tok->is_punct(p)) {
        return true;
    }
    error_unexpected(fmt::format("'{}'", p), std::move(tok));
    return false;
}

bool Parser::expect_op(std::string_view o) {
    std::optional<Token> tok = cursor_.next();
    if (tok && tok->is_op(o)) {
        return true;
    }
    error_unexpected(fmt::format("operator '{}'", o), std::move(tok));
    return false;
}

bool Parser::expect_keyword(std::string_view k) {
    std::optional<Token> tok = cursor_.next();
    if (tok && tok->is_keyword(k)) {
        return true;
    }
    error_unexpected(fmt::format("keyword '{}'", k), std::move(tok));
    return false;
}

std::string_view Parser::expect_ident(std::string_view what) {
    std::optional<Token> tok = cursor_.next();
    if (tok && tok->is(TokenKind::Ident)) {
        return intern(tok->text);
    }
    error_unexpected(what, std::move(tok));
    return {};
}

void Parser::maybe_consume_semicolon() {
    match_punct(";");
}

// ============================================================================
// Error handling & recovery
// ============================================================================

void Parser::error(std::string message) {
    if (error_) {
        return;
    }
    // A lexical error stops the token stream; it is the real cause of
    // whatever the parser ran into.
    if (cursor_.error()) {
        error_ = *cursor_.error();
        return;
    }
    error_ = cursor_.croak(std::move(message));
}

void Parser::error_unexpected(std::string_view expected, std::optional<Token> got) {
    if (!got) {
        error(fmt::format("Expected {} but got EOF", expected));
        return;
    }
    error(fmt::format("Expected {} but got {}", expected, got->describe()));
    // Leave the offending token in front so recovery discards exactly it.
    cursor_.push_back(std::move(*got));
}

Diagnostic Parser::take_error() {
    if (!error_) {
        error("Unexpected end of input");
    }
    Diagnostic diag = std::move(*error_);
    error_.reset();
    return diag;
}

void Parser::synchronize() {
    cursor_.next(); // the token that caused the error

    while (const Token* tok = cursor_.peek()) {
        if (tok->is_punct(";")) {
            cursor_.next();
            return;
        }
        if (tok->is(TokenKind::Keyword) && is_sync_keyword(tok->text)) {
            return;
        }
        cursor_.next();
    }
}

// ============================================================================
// AST node creation helpers
// ============================================================================

Expr* Parser::make_expr(ExprKind kind) {
    auto* e = alloc<Expr>();
    e->kind = kind;
    return e;
}

Stmt* Parser::make_stmt(StmtKind kind) {
    auto* s = alloc<Stmt>();
    s->kind = kind;
    return s;
}

Type* Parser::make_type(TypeKind kind) {
    auto* t = alloc<Type>();
    t->kind = kind;
    return t;
}

Expr* Parser::make_ident(std::string_view name) {
    auto* e = make_expr(ExprKind::Ident);
    e->ident.name = name;
    return e;
}

Expr* Parser::make_operand_expr(ExprKind kind, Expr* operand) {
    auto* e = make_expr(kind);
    e->operand.expr = operand;
    return e;
}

Expr* Parser::make_bin_op(std::string_view op, Expr* left, Expr* right) {
    auto* e = make_expr(ExprKind::BinOp);
    e->bin_op.op = op;
    e->bin_op.left = left;
    e->bin_op.right = right;
    return e;
}

// ============================================================================
// Statements
// ============================================================================

Stmt* Parser::parse_statement() {
    const Token* tok = cursor_.peek();
    if (!tok) {
        error("Unexpected end of input");
        return nullptr;
    }

    if (tok->is_punct("#")) {
        cursor_.next();
        return parse_attribute_statement();
    }
    if (tok->is_punct("{")) {
        return parse_block_statement();
    }
    if (tok->is_not(TokenKind::Keyword)) {
        return parse_expr_statement();
    }

    // `tok` is invalidated by the next cursor operation.
    std::string keyword = tok->text;

    if (keyword == "let") return parse_var_decl(false);
    if (keyword == "mut") {
        cursor_.next();
        return parse_var_decl(true);
    }
    if (keyword == "const") return parse_const_decl();
    if (keyword == "fn") return parse_function_decl(false, false);
    if (keyword == "teach") {
        cursor_.next();
        return parse_function_decl(false, true);
    }
    if (keyword == "async") {
        cursor_.next();
        if (at_keyword("fn")) {
            return parse_function_decl(true, false);
        }
        // `async <expr>` as an expression statement.
        cursor_.push_back(Token::make(TokenKind::Keyword, "async"));
        return parse_expr_statement();
    }
    if (keyword == "def") return parse_struct_decl();
    if (keyword == "enum") return parse_enum_decl();
    if (keyword == "trait") return parse_trait_decl();
    if (keyword == "impl") return parse_impl_block();
    if (keyword == "learn") return parse_import();
    if (keyword == "if") return parse_if();
    if (keyword == "while") return parse_while();
    if (keyword == "for") return parse_for();
    if (keyword == "match") return parse_match_statement();
    if (keyword == "return") return parse_return();
    if (keyword == "break" || keyword == "continue") {
        cursor_.next();
        maybe_consume_semicolon();
        return make_stmt(keyword == "break" ? StmtKind::Break : StmtKind::Continue);
    }

    return parse_expr_statement();
}

Stmt* Parser::parse_expr_statement() {
    // `name = value` is an assignment; anything else starting with an
    // identifier is an expression.
    const Token* tok = cursor_.peek();
    if (tok && tok->is(TokenKind::Ident)) {
        Token name = *cursor_.next();
        if (match_op("=")) {
            Expr* value = parse_expression();
            if (!value) return nullptr;
            maybe_consume_semicolon();

            auto* s = make_stmt(StmtKind::Assign);
            s->assign.name = intern(name.text);
            s->assign.value = value;
            return s;
        }
        cursor_.push_back(std::move(name));
    }

    Expr* expr = parse_expression();
    if (!expr) return nullptr;
    maybe_consume_semicolon();

    auto* s = make_stmt(StmtKind::Expr);
    s->expr.expr = expr;
    return s;
}

Stmt* Parser::parse_attribute_statement() {
    // '#' already consumed
    if (!expect_punct("[")) return nullptr;

    std::string_view name = expect_ident("attribute name");
    if (name.empty()) return nullptr;

    std::vector<Expr*> args;
    if (match_punct("(")) {
        while (!match_punct(")")) {
            Expr* arg = parse_expression();
            if (!arg) return nullptr;
            args.push_back(arg);

            if (match_punct(",") || at_punct(")")) continue;
            error_unexpected("',' or ')' in attribute arguments", cursor_.next());
            return nullptr;
        }
    }

    if (!expect_punct("]")) return nullptr;

    Stmt* inner = parse_statement();
    if (!inner) return nullptr;

    auto* s = make_stmt(StmtKind::AttrStmt);
    s->attr.attr.name = name;
    s->attr.attr.args = make_list(args);
    s->attr.stmt = inner;
    return s;
}

Stmt* Parser::parse_var_decl(bool is_mutable) {
    if (!expect_keyword("let")) return nullptr;

    std::string_view name = expect_ident("identifier");
    if (name.empty()) return nullptr;

    Type* type = nullptr;
    if (match_punct(":")) {
        type = parse_type();
        if (!type) return nullptr;
    }

    Expr* value = nullptr;
    if (match_op("=")) {
        value = parse_expression();
        if (!value) return nullptr;
    }
    maybe_consume_semicolon();

    auto* s = make_stmt(StmtKind::VarDecl);
    s->var_decl.name = name;
    s->var_decl.type = type;
    s->var_decl.is_mutable = is_mutable;
    s->var_decl.value = value;
    return s;
}

Stmt* Parser::parse_const_decl() {
    if (!expect_keyword("const")) return nullptr;

    std::string_view name = expect_ident("identifier");
    if (name.empty()) return nullptr;

    Type* type = nullptr;
    if (match_punct(":")) {
        type = parse_type();
        if (!type) return nullptr;
    }

    if (!expect_op("=")) return nullptr;
    Expr* value = parse_expression();
    if (!value) return nullptr;
    maybe_consume_semicolon();

    auto* s = make_stmt(StmtKind::ConstDecl);
    s->const_decl.name = name;
    s->const_decl.type = type;
    s->const_decl.value = value;
    return s;
}

Stmt* Parser::parse_function_decl(bool is_async, bool is_exported) {
    if (!expect_keyword("fn")) return nullptr;

    std::string_view name = expect_ident("function name");
    if (name.empty()) return nullptr;

    std::vector<std::string_view> type_params;
    if (match_op("<")) {
        for (;;) {
            std::string_view param = expect_ident("type parameter name");
            if (param.empty()) return nullptr;
            type_params.push_back(param);

            if (match_punct(",")) continue;
            if (match_op(">")) break;
            error_unexpected("',' or '>' in type parameters", cursor_.next());
            return nullptr;
        }
    }

    if (!expect_punct("(")) return nullptr;
    std::vector<TypedName> params;
    if (!parse_params(ParamStyle::Function, params)) return nullptr;

    Type* return_type = nullptr;
    if (match_op("->")) {
        return_type = parse_type();
        if (!return_type) return nullptr;
    }

    Stmt* body = parse_block_statement();
    if (!body) return nullptr;

    auto* s = make_stmt(StmtKind::FunctionDecl);
    s->function.name = name;
    s->function.type_params = make_list(type_params);
    s->function.params = make_list(params);
    s->function.return_type = return_type;
    s->function.body = body;
    s->function.is_async = is_async;
    s->function.is_exported = is_exported;
    return s;
}

bool Parser::parse_params(ParamStyle style, std::vector<TypedName>& params) {
    // '(' already consumed; consumes the closing ')'.
    while (!match_punct(")")) {
        std::string_view name = expect_ident("parameter name");
        if (name.empty()) return false;

        Type* type = nullptr;
        if (match_punct(":")) {
            type = parse_type();
            if (!type) return false;
        } else if (style == ParamStyle::Trait) {
            type = make_named_type(arena_, name);
        } else if (name == "self") {
            type = make_named_type(arena_, intern("Self"));
        } else {
            error_unexpected("':'", cursor_.next());
            return false;
        }
        params.push_back(TypedName{name, type});

        if (match_punct(",") || at_punct(")")) continue;
        error_unexpected("',' or ')' in parameter list", cursor_.next());
        return false;
    }
    return true;
}

Stmt* Parser::parse_struct_decl() {
    if (!expect_keyword("def")) return nullptr;

    std::string_view name = expect_ident("struct name");
    if (name.empty()) return nullptr;
    if (!expect_punct("{")) return nullptr;

    std::vector<TypedName> fields;
    while (!match_punct("}")) {
        std::string_view field = expect_ident("field name");
        if (field.empty()) return nullptr;
        if (!expect_punct(":")) return nullptr;
        Type* type = parse_type();
        if (!type) return nullptr;
        fields.push_back(TypedName{field, type});
        match_punct(",");
    }

    auto* s = make_stmt(StmtKind::StructDecl);
    s->struct_decl.name = name;
    s->struct_decl.fields = make_list(fields);
    return s;
}

Stmt* Parser::parse_enum_decl() {
    if (!expect_keyword("enum")) return nullptr;

    std::string_view name = expect_ident("enum name");
    if (name.empty()) return nullptr;
    if (!expect_punct("{")) return nullptr;

    std::vector<EnumVariant> variants;
    while (!match_punct("}")) {
        EnumVariant variant{};
        variant.name = expect_ident("variant name");
        if (variant.name.empty()) return nullptr;

        if (match_punct("(")) {
            variant.has_fields = true;
            std::vector<Type*> types;
            while (!match_punct(")")) {
                Type* type = parse_type();
                if (!type) return nullptr;
                types.push_back(type);
                match_punct(",");
            }
            variant.fields = make_list(types);
        }

        variants.push_back(variant);
        match_punct(",");
    }

    auto* s = make_stmt(StmtKind::EnumDecl);
    s->enum_decl.name = name;
    s->enum_decl.variants = make_list(variants);
    return s;
}

Stmt* Parser::parse_trait_decl() {
    if (!expect_keyword("trait")) return nullptr;

    std::string_view name = expect_ident("trait name");
    if (name.empty()) return nullptr;
    if (!expect_punct("{")) return nullptr;

    std::vector<TraitMethod> methods;
    while (!match_punct("}")) {
        if (!expect_keyword("fn")) return nullptr;

        TraitMethod method{};
        method.name = expect_ident("method name");
        if (method.name.empty()) return nullptr;

        if (!expect_punct("(")) return nullptr;
        std::vector<TypedName> params;
        if (!parse_params(ParamStyle::Trait, params)) return nullptr;
        method.params = make_list(params);

        if (!expect_op("->")) return nullptr;
        method.return_type = parse_type();
        if (!method.return_type) return nullptr;

        if (match_punct(";")) {
            method.kind = TraitMethodKind::Signature;
        } else if (at_punct("{")) {
            method.kind = TraitMethodKind::Default;
            method.body = parse_block_statement();
            if (!method.body) return nullptr;
        } else {
            error_unexpected("';' or '{' after trait method signature", cursor_.next());
            return nullptr;
        }
        methods.push_back(method);
    }

    auto* s = make_stmt(StmtKind::TraitDecl);
    s->trait.name = name;
    s->trait.methods = make_list(methods);
    return s;
}

Stmt* Parser::parse_impl_block() {
    if (!expect_keyword("impl")) return nullptr;

    std::string_view first = expect_ident("type or trait name");
    if (first.empty()) return nullptr;

    std::string_view type_name = first;
    std::string_view trait_name;
    if (at_keyword("for")) {
        cursor_.next();
        trait_name = first;
        type_name = expect_ident("type name");
        if (type_name.empty()) return nullptr;
    }

    if (!expect_punct("{")) return nullptr;

    std::vector<Stmt*> methods;
    while (!match_punct("}")) {
        bool is_async = false;
        if (at_keyword("async")) {
            cursor_.next();
            is_async = true;
        }
        Stmt* method = parse_function_decl(is_async, false);
        if (!method) return nullptr;
        methods.push_back(method);
    }

    auto* s = make_stmt(StmtKind::ImplBlock);
    s->impl.type_name = type_name;
    s->impl.trait_name = trait_name;
    s->impl.methods = make_list(methods);
    return s;
}

Stmt* Parser::parse_import() {
    if (!expect_keyword("learn")) return nullptr;

    std::optional<Token> module = cursor_.next();
    if (!module || module->is_not(TokenKind::String)) {
        error_unexpected("string literal after 'learn'", std::move(module));
        return nullptr;
    }
    if (module->text.empty()) {
        error("Import path cannot be empty");
        cursor_.push_back(std::move(*module));
        return nullptr;
    }

    // "a::b::c" -> [a, b, c]
    std::vector<std::string_view> path;
    std::string_view rest = module->text;
    for (;;) {
        size_t sep = rest.find("::");
        path.push_back(intern(rest.substr(0, sep)));
        if (sep == std::string_view::npos) break;
        rest.remove_prefix(sep + 2);
    }
    maybe_consume_semicolon();

    auto* s = make_stmt(StmtKind::ImportDecl);
    s->import.path = make_list(path);
    return s;
}

Stmt* Parser::parse_if() {
    if (!expect_keyword("if")) return nullptr;
    if (!expect_punct("(")) return nullptr;
    Expr* condition = parse_expression();
    if (!condition) return nullptr;
    if (!expect_punct(")")) return nullptr;

    Stmt* then_branch = parse_statement();
    if (!then_branch) return nullptr;

    Stmt* else_branch = nullptr;
    if (at_keyword("else")) {
        cursor_.next();
        else_branch = parse_statement();
        if (!else_branch) return nullptr;
    }

    auto* s = make_stmt(StmtKind::If);
    s->if_.condition = condition;
    s->if_.then_branch = then_branch;
    s->if_.else_branch = else_branch;
    return s;
}

Stmt* Parser::parse_while() {
    if (!expect_keyword("while")) return nullptr;
    if (!expect_punct("(")) return nullptr;
    Expr* condition = parse_expression();
    if (!condition) return nullptr;
    if (!expect_punct(")")) return nullptr;

    Stmt* body = parse_block_statement();
    if (!body) return nullptr;

    auto* s = make_stmt(StmtKind::While);
    s->while_.condition = condition;
    s->while_.body = body;
    return s;
}

Stmt* Parser::parse_for() {
    if (!expect_keyword("for")) return nullptr;

    std::string_view var = expect_ident("variable name");
    if (var.empty()) return nullptr;
    if (!expect_keyword("in")) return nullptr;

    // The body's '{' must not be read as a struct literal.
    Expr* iterable = parse_binary_expr(0, false);
    if (!iterable) return nullptr;

    Stmt* body = parse_block_statement();
    if (!body) return nullptr;

    auto* s = make_stmt(StmtKind::For);
    s->for_.var = var;
    s->for_.iterable = iterable;
    s->for_.body = body;
    return s;
}

Stmt* Parser::parse_match_statement() {
    if (!expect_keyword("match")) return nullptr;

    Expr* subject = parse_binary_expr(0, false);
    if (!subject) return nullptr;
    if (!expect_punct("{")) return nullptr;

    std::vector<MatchStmtArm> arms;
    while (!match_punct("}")) {
        Expr* pattern = parse_pattern();
        if (!pattern) return nullptr;
        if (!expect_op("=>")) return nullptr;
        Stmt* body = parse_statement();
        if (!body) return nullptr;
        arms.push_back(MatchStmtArm{pattern, body});
        match_punct(",");
    }

    auto* s = make_stmt(StmtKind::Match);
    s->match.subject = subject;
    s->match.arms = make_list(arms);
    return s;
}

Stmt* Parser::parse_return() {
    if (!expect_keyword("return")) return nullptr;

    Expr* value = nullptr;
    const Token* tok = cursor_.peek();
    if (tok && !tok->is_punct(";") && !tok->is_punct("}")) {
        value = parse_expression();
        if (!value) return nullptr;
    }
    maybe_consume_semicolon();

    auto* s = make_stmt(StmtKind::Return);
    s->return_.value = value;
    return s;
}

Stmt* Parser::parse_block_statement() {
    std::vector<Stmt*> stmts;
    if (!parse_block(stmts)) return nullptr;

    auto* s = make_stmt(StmtKind::Block);
    s->block.stmts = make_list(stmts);
    return s;
}

bool Parser::parse_block(std::vector<Stmt*>& stmts) {
    if (!expect_punct("{")) return false;

    while (!match_punct("}")) {
        if (cursor_.at_end()) {
            error_unexpected("'}'", std::nullopt);
            return false;
        }
        Stmt* stmt = parse_statement();
        if (!stmt) return false;
        stmts.push_back(stmt);
    }
    return true;
}

// ============================================================================
// Types
// ============================================================================

Type* Parser::parse_type() {
    std::string_view name = expect_ident("type name");
    if (name.empty()) return nullptr;

    if (!match_op("<")) {
        auto* t = make_type(TypeKind::Named);
        t->named.name = name;
        return t;
    }

    std::vector<Type*> type_args;
    for (;;) {
        Type* arg = parse_type();
        if (!arg) return nullptr;
        type_args.push_back(arg);

        if (match_punct(",")) continue;
        if (match_op(">")) break;
        error_unexpected("',' or '>' in generic type", cursor_.next());
        return nullptr;
    }

    auto* t = make_type(TypeKind::Generic);
    t->generic.base = name;
    t->generic.type_args = make_list(type_args);
    return t;
}

// ============================================================================
// Expressions
// ============================================================================

Expr* Parser::parse_expression() {
    return parse_binary_expr(0, true);
}

Expr* Parser::parse_binary_expr(int min_prec, bool allow_struct_literal) {
    Expr* left = parse_operand(allow_struct_literal);
    if (!left) return nullptr;

    for (;;) {
        const Token* tok = cursor_.peek();
        if (!tok || tok->is_not(TokenKind::Op)) break;

        int prec = binary_precedence(tok->text);
        if (prec == 0 || prec < min_prec) break;

        std::string_view op = intern(tok->text);
        cursor_.next();

        Expr* right = parse_binary_expr(prec + 1, allow_struct_literal);
        if (!right) return nullptr;
        left = make_bin_op(op, left, right);
    }
    return left;
}

Expr* Parser::parse_operand(bool allow_struct_literal) {
    Expr* primary = parse_primary(allow_struct_literal);
    if (!primary) return nullptr;
    return parse_postfix(primary, allow_struct_literal);
}

Expr* Parser::parse_primary(bool allow_struct_literal) {
    std::optional<Token> tok = cursor_.next();
    if (!tok) {
        error("Unexpected end of input in expression");
        return nullptr;
    }

    switch (tok->kind) {
        case TokenKind::Number: {
            auto* e = make_expr(ExprKind::Number);
            e->number.value = tok->number;
            return e;
        }
        case TokenKind::String: {
            auto* e = make_expr(ExprKind::String);
            e->string.value = intern(tok->text);
            return e;
        }
        case TokenKind::TemplateStart:
            return parse_template_literal();
        case TokenKind::Ident: {
            std::string_view name = intern(tok->text);
            if (match_op("=>")) {
                return parse_lambda_body({LambdaParam{name, nullptr}});
            }
            return make_ident(name);
        }
        case TokenKind::Keyword: {
            if (tok->text == "true" || tok->text == "false") {
                auto* e = make_expr(ExprKind::Boolean);
                e->boolean.value = tok->text == "true";
                return e;
            }
            // Prefix forms take one primary plus its postfix chain, so
            // `await a + b` is `(await a) + b`.
            ExprKind prefix_kind;
            if (tok->text == "await") {
                prefix_kind = ExprKind::Await;
            } else if (tok->text == "async") {
                prefix_kind = ExprKind::Async;
            } else if (tok->text == "lazy") {
                prefix_kind = ExprKind::Lazy;
            } else if (tok->text == "match") {
                return parse_match_expr();
            } else {
                break;
            }
            Expr* operand = parse_operand(allow_struct_literal);
            if (!operand) return nullptr;
            return make_operand_expr(prefix_kind, operand);
        }
        case TokenKind::Punct:
            if (tok->text == "(") {
                return parse_paren_or_lambda();
            }
            if (tok->text == "[") {
                return parse_array_literal();
            }
            if (tok->text == "{") {
                cursor_.push_back(std::move(*tok));
                std::vector<Stmt*> stmts;
                if (!parse_block(stmts)) return nullptr;
                auto* e = make_expr(ExprKind::Block);
                e->block.stmts = make_list(stmts);
                return e;
            }
            break;
        case TokenKind::Op:
            if (tok->text == "-" || tok->text == "!" || tok->text == "~") {
                std::string_view op = intern(tok->text);
                Expr* operand = parse_operand(allow_struct_literal);
                if (!operand) return nullptr;
                auto* e = make_expr(ExprKind::UnaryOp);
                e->unary_op.op = op;
                e->unary_op.expr = operand;
                return e;
            }
            break;
        default:
            break;
    }

    error(fmt::format("Unexpected token in expression: {}", tok->describe()));
    cursor_.push_back(std::move(*tok));
    return nullptr;
}

Expr* Parser::parse_postfix(Expr* expr, bool allow_struct_literal) {
    for (;;) {
        const Token* tok = cursor_.peek();
        if (!tok) break;

        if (tok->is_punct("(")) {
            expr = parse_call(expr);
        } else if (tok->is_op(".")) {
            expr = parse_field_access(expr);
        } else if (tok->is_punct("[")) {
            expr = parse_index(expr);
        } else if (tok->is_punct("{") && allow_struct_literal && expr->kind == ExprKind::Ident) {
            // Only a bare identifier can name a struct literal; this keeps
            // `if (cond) { ... }` a block.
            expr = parse_struct_literal(expr->ident.name);
        } else if (tok->is_op("?")) {
            cursor_.next();
            expr = make_operand_expr(ExprKind::Try, expr);
        } else {
            break;
        }

        if (!expr) return nullptr;
    }
    return expr;
}

Expr* Parser::parse_call(Expr* func) {
    cursor_.next(); // '('

    std::vector<Expr*> args;
    while (!match_punct(")")) {
        Expr* arg = parse_expression();
        if (!arg) return nullptr;
        args.push_back(arg);

        if (match_punct(",") || at_punct(")")) continue;
        if (cursor_.at_end()) {
            error_unexpected("')'", std::nullopt);
        } else {
            error("Expected ',' or ')' in function call");
        }
        return nullptr;
    }

    auto* e = make_expr(ExprKind::Call);
    e->call.func = func;
    e->call.args = make_list(args);
    return e;
}

Expr* Parser::parse_field_access(Expr* object) {
    cursor_.next(); // '.'

    std::optional<Token> field = cursor_.next();
    if (!field || field->is_not(TokenKind::Ident)) {
        error("Expected field name after '.'");
        if (field) {
            cursor_.push_back(std::move(*field));
        }
        return nullptr;
    }

    auto* e = make_expr(ExprKind::FieldAccess);
    e->field_access.object = object;
    e->field_access.field = intern(field->text);
    return e;
}

Expr* Parser::parse_index(Expr* array) {
    cursor_.next(); // '['

    Expr* index = parse_expression();
    if (!index) return nullptr;
    if (!expect_punct("]")) return nullptr;

    auto* e = make_expr(ExprKind::Index);
    e->index.array = array;
    e->index.index = index;
    return e;
}

Expr* Parser::parse_struct_literal(std::string_view name) {
    cursor_.next(); // '{'

    std::vector<FieldInit> fields;
    while (!match_punct("}")) {
        std::string_view field = expect_ident("field name");
        if (field.empty()) return nullptr;
        if (!expect_punct(":")) return nullptr;

        // A field value is always followed by ',' or '}', so a nested
        // struct literal cannot swallow a body here.
        Expr* value = parse_expression();
        if (!value) return nullptr;
        fields.push_back(FieldInit{field, value});
        match_punct(",");
    }

    auto* e = make_expr(ExprKind::StructLiteral);
    e->struct_literal.name = name;
    e->struct_literal.fields = make_list(fields);
    return e;
}

Expr* Parser::parse_array_literal() {
    // '[' already consumed
    std::vector<Expr*> elements;
    while (!match_punct("]")) {
        Expr* element = parse_binary_expr(0, false);
        if (!element) return nullptr;
        elements.push_back(element);
        match_punct(",");
    }

    auto* e = make_expr(ExprKind::ArrayLiteral);
    e->array_literal.elements = make_list(elements);
    return e;
}

Expr* Parser::parse_template_literal() {
    // TemplateStart already consumed
    std::vector<TemplatePart> parts;
    for (;;) {
        std::optional<Token> tok = cursor_.next();
        if (!tok) {
            error("Unexpected end of input in template literal");
            return nullptr;
        }

        if (tok->is(TokenKind::TemplateString)) {
            parts.push_back(TemplatePart{TemplatePartKind::Text, intern(tok->text), nullptr});
            continue;
        }

        if (tok->is(TokenKind::TemplateExprStart)) {
            Expr* expr = parse_expression();
            if (!expr) return nullptr;

            std::optional<Token> end = cursor_.next();
            if (!end) {
                error("Unexpected end of input in template expression");
                return nullptr;
            }
            if (end->is_not(TokenKind::TemplateExprEnd)) {
                error(fmt::format("Expected '}}' after template expression, found {}",
                                  end->describe()));
                cursor_.push_back(std::move(*end));
                return nullptr;
            }
            parts.push_back(TemplatePart{TemplatePartKind::Expression, {}, expr});
            continue;
        }

        if (tok->is(TokenKind::TemplateEnd)) {
            break;
        }

        error(fmt::format("Unexpected token in template literal: {}", tok->describe()));
        cursor_.push_back(std::move(*tok));
        return nullptr;
    }

    auto* e = make_expr(ExprKind::TemplateLiteral);
    e->template_literal.parts = make_list(parts);
    return e;
}

Expr* Parser::parse_match_expr() {
    // 'match' already consumed
    Expr* subject = parse_binary_expr(0, false);
    if (!subject) return nullptr;
    if (!expect_punct("{")) return nullptr;

    std::vector<MatchExprArm> arms;
    while (!match_punct("}")) {
        Expr* pattern = parse_pattern();
        if (!pattern) return nullptr;
        if (!expect_op("=>")) return nullptr;
        Expr* body = parse_expression();
        if (!body) return nullptr;
        arms.push_back(MatchExprArm{pattern, body});
        match_punct(",");
    }

    auto* e = make_expr(ExprKind::Match);
    e->match.subject = subject;
    e->match.arms = make_list(arms);
    return e;
}

// ============================================================================
// Lambdas
// ============================================================================

Expr* Parser::parse_paren_or_lambda() {
    // '(' already consumed
    if (scan_lambda_params()) {
        return parse_lambda_params();
    }

    Expr* inner = parse_expression();
    if (!inner) return nullptr;
    if (!expect_punct(")")) return nullptr;
    return inner;
}

bool Parser::scan_lambda_params() {
    // Look for `)` at depth 0 followed by `=>`. Every token taken is pushed
    // back, whatever the outcome.
    std::vector<Token> scanned;
    int depth = 0;
    bool found_arrow = false;

    while (scanned.size() < kLambdaScanLimit) {
        std::optional<Token> tok = cursor_.next();
        if (!tok) break;

        bool closes_params = depth == 0 && tok->is_punct(")");
        if (tok->is_punct("(")) {
            ++depth;
        } else if (tok->is_punct(")")) {
            --depth;
        }
        scanned.push_back(std::move(*tok));

        if (closes_params) {
            if (scanned.size() < kLambdaScanLimit) {
                std::optional<Token> arrow = cursor_.next();
                if (arrow) {
                    found_arrow = arrow->is_op("=>");
                    scanned.push_back(std::move(*arrow));
                }
            }
            break;
        }
    }

    for (auto it = scanned.rbegin(); it != scanned.rend(); ++it) {
        cursor_.push_back(std::move(*it));
    }
    return found_arrow;
}

Expr* Parser::parse_lambda_params() {
    std::vector<LambdaParam> params;
    while (!match_punct(")")) {
        std::string_view name = expect_ident("parameter name");
        if (name.empty()) return nullptr;

        Type* type = nullptr;
        if (match_punct(":")) {
            type = parse_type();
            if (!type) return nullptr;
        }
        params.push_back(LambdaParam{name, type});
        match_punct(",");
    }

    if (!expect_op("=>")) return nullptr;
    return parse_lambda_body(std::move(params));
}

Expr* Parser::parse_lambda_body(std::vector<LambdaParam> params) {
    Expr* body = nullptr;
    if (at_punct("{")) {
        std::vector<Stmt*> stmts;
        if (!parse_block(stmts)) return nullptr;
        body = make_expr(ExprKind::Block);
        body->block.stmts = make_list(stmts);
    } else {
        body = parse_expression();
        if (!body) return nullptr;
    }

    auto* e = make_expr(ExprKind::Lambda);
    e->lambda.params = make_list(params);
    e->lambda.return_type = nullptr;
    e->lambda.body = body;
    return e;
}

// ============================================================================
// Match patterns
// ============================================================================

Expr* Parser::parse_pattern(int min_prec) {
    Expr* left = parse_pattern_primary();
    if (!left) return nullptr;

    // Postfix call/field/index; never a struct literal, since '{' after a
    // pattern can only open an arm body.
    for (;;) {
        const Token* tok = cursor_.peek();
        if (!tok) break;

        if (tok->is_punct("(")) {
            cursor_.next();
            std::vector<Expr*> args;
            while (!match_punct(")")) {
                Expr* arg = parse_pattern();
                if (!arg) return nullptr;
                args.push_back(arg);

                if (match_punct(",") || at_punct(")")) continue;
                error_unexpected("',' or ')' in pattern", cursor_.next());
                return nullptr;
            }
            auto* call = make_expr(ExprKind::Call);
            call->call.func = left;
            call->call.args = make_list(args);
            left = call;
        } else if (tok->is_op(".")) {
            left = parse_field_access(left);
        } else if (tok->is_punct("[")) {
            left = parse_index(left);
        } else {
            break;
        }

        if (!left) return nullptr;
    }

    for (;;) {
        const Token* tok = cursor_.peek();
        if (!tok || tok->is_not(TokenKind::Op)) break;

        int prec = binary_precedence(tok->text);
        if (prec == 0 || prec < min_prec) break;

        std::string_view op = intern(tok->text);
        cursor_.next();

        Expr* right = parse_pattern(prec + 1);
        if (!right) return nullptr;
        left = make_bin_op(op, left, right);
    }
    return left;
}

Expr* Parser::parse_pattern_primary() {
    std::optional<Token> tok = cursor_.next();
    if (!tok) {
        error("Unexpected end of input in pattern");
        return nullptr;
    }

    switch (tok->kind) {
        case TokenKind::Number: {
            auto* e = make_expr(ExprKind::Number);
            e->number.value = tok->number;
            return e;
        }
        case TokenKind::String: {
            auto* e = make_expr(ExprKind::String);
            e->string.value = intern(tok->text);
            return e;
        }
        case TokenKind::Ident:
            return make_ident(intern(tok->text));
        case TokenKind::Keyword:
            if (tok->text == "true" || tok->text == "false") {
                auto* e = make_expr(ExprKind::Boolean);
                e->boolean.value = tok->text == "true";
                return e;
            }
            break;
        case TokenKind::Punct:
            if (tok->text == "(") {
                Expr* inner = parse_pattern();
                if (!inner) return nullptr;
                if (!expect_punct(")")) return nullptr;
                return inner;
            }
            break;
        default:
            break;
    }

    error(fmt::format("Unexpected token in pattern: {}", tok->describe()));
    cursor_.push_back(std::move(*tok));
    return nullptr;
}

} // namespace loft
