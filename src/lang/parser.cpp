#include <seanet/lang/parser.hpp>
#include <seanet/log.hpp>
#include <seanet/result.hpp>
#include <initializer_list>

namespace seanet {

namespace {

using TK = TokenKind;
using ExprResult = Result<ExprPtr>;
using StmtResult = Result<StmtPtr>;
using TypeResult = Result<TypeInfoPtr>;

// ---------------------------------------------------------------------------
// Parser state machine
//
// Every rule returns a Result. A syntax error is reported once, at the point
// it is detected, and the SeanetError then unwinds through SEANET_TRY up to
// the public entry point. Nothing resynchronizes.
// ---------------------------------------------------------------------------

struct Parser {
    std::vector<Token> tokens;  // comments removed, always Eof-terminated
    const std::string& filename;
    Diagnostics& diags;
    std::size_t pos;

    int angle_depth;     // open fun<...> lists
    int pending_angles;  // '>' already consumed as the tail of a '>>'

    Parser(const std::vector<Token>& toks, const std::string& fname,
           Diagnostics& d)
        : filename(fname), diags(d), pos(0), angle_depth(0), pending_angles(0) {
        tokens.reserve(toks.size());
        for (const auto& t : toks) {
            if (t.kind != TK::Comment) tokens.push_back(t);
        }
        if (tokens.empty() || tokens.back().kind != TK::Eof) {
            Token eof;
            if (!tokens.empty()) {
                eof.source = tokens.back().source;
                eof.start = tokens.back().start + tokens.back().length;
                eof.pos = tokens.back().pos;
            }
            tokens.push_back(eof);
        }
    }

    // -- Navigation ---------------------------------------------------------

    bool at_end() const {
        return peek().kind == TK::Eof;
    }

    const Token& peek() const {
        return tokens[pos];
    }

    const Token& peek_at(std::size_t offset) const {
        std::size_t idx = pos + offset;
        if (idx >= tokens.size()) return tokens.back(); // Eof
        return tokens[idx];
    }

    const Token& advance() {
        const auto& tok = tokens[pos];
        if (tok.kind != TK::Eof) ++pos;
        return tok;
    }

    bool check(TK kind) const {
        return peek().kind == kind;
    }

    bool check_any(std::initializer_list<TK> kinds) const {
        for (auto k : kinds) {
            if (check(k)) return true;
        }
        return false;
    }

    bool match(TK kind) {
        if (check(kind)) {
            advance();
            return true;
        }
        return false;
    }

    Result<Token> expect(TK kind, const char* message) {
        if (check(kind)) return Result<Token>::ok(advance());
        return fail(message);
    }

    // -- Diagnostics --------------------------------------------------------

    SeanetError fail_at(const Token& tok, const std::string& message) {
        diags.report(filename, tok.pos.line, tok.pos.col, message);
        return SeanetError{SeanetError::Parse, message, "", filename, tok.pos.line};
    }

    SeanetError fail(const std::string& message) {
        return fail_at(peek(), message);
    }

    // -- Lookahead predicates -----------------------------------------------

    // Builtin type, ref, fun, `Name name` or `Name[]`
    bool is_declaration_start() const {
        TK k = peek().kind;
        if (is_builtin_type(k) || k == TK::KwRef || k == TK::KwFun) return true;
        if (k == TK::Identifier) {
            TK next = peek_at(1).kind;
            if (next == TK::Identifier) return true;
            if (next == TK::LBracket && peek_at(2).kind == TK::RBracket) return true;
        }
        return false;
    }

    bool is_type_start() const {
        TK k = peek().kind;
        return is_builtin_type(k) || k == TK::KwRef || k == TK::KwFun ||
               k == TK::Identifier;
    }

    // -- Top level ----------------------------------------------------------

    Result<Program> parse_program() {
        Program program;
        while (!at_end()) {
            if (check(TK::KwStruct)) {
                SEANET_TRY_ASSIGN(StmtPtr decl, parse_struct_declaration());
                program.declarations.push_back(std::move(decl));
            } else if (check(TK::KwVoid) || is_type_start()) {
                SEANET_TRY_ASSIGN(StmtPtr decl, parse_function_declaration());
                program.declarations.push_back(std::move(decl));
            } else {
                return fail("Expected a struct or function declaration.");
            }
        }
        return Result<Program>::ok(std::move(program));
    }

    StmtResult parse_struct_declaration() {
        Token kw = advance(); // struct
        SEANET_TRY_ASSIGN(Token name, expect(TK::Identifier, "Expected struct name after 'struct'."));
        SEANET_TRY(expect(TK::LBrace, "Expected '{' after struct name."));

        std::vector<VarDeclStmt> fields;
        while (!check(TK::RBrace) && !at_end()) {
            SEANET_TRY_ASSIGN(TypeInfoPtr type, parse_type());
            SEANET_TRY_ASSIGN(Token field, expect(TK::Identifier, "Expected field name."));
            if (check(TK::Assign)) {
                return fail("Struct fields cannot have initializers.");
            }
            SEANET_TRY(expect(TK::Semicolon, "Expected ';' after field declaration."));
            fields.push_back(VarDeclStmt{std::move(type), field});
        }
        SEANET_TRY(expect(TK::RBrace, "Expected '}' after struct body."));

        return StmtResult::ok(make_stmt(kw.pos, StructDeclStmt{name, std::move(fields)}));
    }

    StmtResult parse_function_declaration() {
        SourcePos p = peek().pos;
        TypeInfoPtr return_type;
        if (check(TK::KwVoid)) {
            return_type = make_named_type(advance());
        } else {
            SEANET_TRY_ASSIGN(return_type, parse_type());
        }

        SEANET_TRY_ASSIGN(Token name, expect(TK::Identifier, "Expected function name."));
        SEANET_TRY(expect(TK::LParen, "Expected '(' after function name."));

        std::vector<VarDeclStmt> params;
        if (!check(TK::RParen)) {
            do {
                SEANET_TRY_ASSIGN(TypeInfoPtr type, parse_type());
                SEANET_TRY_ASSIGN(Token param, expect(TK::Identifier, "Expected parameter name."));
                params.push_back(VarDeclStmt{std::move(type), param});
            } while (match(TK::Comma));
        }
        SEANET_TRY(expect(TK::RParen, "Expected ')' after parameters."));

        SEANET_TRY_ASSIGN(BlockStmt body, parse_block());

        return StmtResult::ok(make_stmt(p, FunctionDeclStmt{
            std::move(return_type), name, std::move(params), std::move(body)}));
    }

    // -- Blocks and declarations --------------------------------------------

    Result<BlockStmt> parse_block() {
        SEANET_TRY(expect(TK::LBrace, "Expected '{' to start a block."));
        BlockStmt block;
        while (!check(TK::RBrace) && !at_end()) {
            SEANET_TRY_ASSIGN(StmtPtr stmt, parse_declaration());
            block.statements.push_back(std::move(stmt));
        }
        SEANET_TRY(expect(TK::RBrace, "Expected '}' after block."));
        return Result<BlockStmt>::ok(std::move(block));
    }

    StmtResult parse_declaration() {
        if (check(TK::KwVar)) return parse_var_declaration();
        if (is_declaration_start()) return parse_typed_declaration();
        return parse_statement();
    }

    StmtResult parse_var_declaration() {
        Token var_tok = advance();
        SEANET_TRY_ASSIGN(Token name, expect(TK::Identifier, "Expected variable name after 'var'."));
        SEANET_TRY(expect(TK::Assign, "A 'var' declaration requires an initializer."));
        SEANET_TRY_ASSIGN(ExprPtr init, parse_expression());
        SEANET_TRY(expect(TK::Semicolon, "Expected ';' after variable declaration."));
        return StmtResult::ok(make_stmt(var_tok.pos, VarDeclAssignStmt{
            make_named_type(var_tok), name, std::move(init)}));
    }

    StmtResult parse_typed_declaration() {
        SourcePos p = peek().pos;
        SEANET_TRY_ASSIGN(TypeInfoPtr type, parse_type());
        SEANET_TRY_ASSIGN(Token name, expect(TK::Identifier, "Expected variable name."));

        if (match(TK::Assign)) {
            SEANET_TRY_ASSIGN(ExprPtr init, parse_expression());
            SEANET_TRY(expect(TK::Semicolon, "Expected ';' after variable declaration."));
            return StmtResult::ok(make_stmt(p, VarDeclAssignStmt{
                std::move(type), name, std::move(init)}));
        }

        SEANET_TRY(expect(TK::Semicolon, "Expected ';' after variable declaration."));
        return StmtResult::ok(make_stmt(p, VarDeclStmt{std::move(type), name}));
    }

    // -- Statements ---------------------------------------------------------

    StmtResult parse_statement() {
        if (check(TK::LBrace)) {
            SourcePos p = peek().pos;
            SEANET_TRY_ASSIGN(BlockStmt block, parse_block());
            return StmtResult::ok(make_stmt(p, std::move(block)));
        }
        if (check(TK::KwIf)) return parse_if();
        if (check(TK::KwWhile)) return parse_while();
        if (check(TK::KwFor)) return parse_for();
        if (check(TK::KwReturn)) return parse_return();
        return parse_expression_statement();
    }

    StmtResult parse_expression_statement() {
        SEANET_TRY_ASSIGN(ExprPtr expr, parse_expression());
        SEANET_TRY(expect(TK::Semicolon, "Expected ';' after expression."));
        SourcePos p = expr->pos;
        return StmtResult::ok(make_stmt(p, ExprStmt{std::move(expr)}));
    }

    StmtResult parse_if() {
        Token kw = advance(); // if
        SEANET_TRY(expect(TK::LParen, "Expected '(' after 'if'."));
        SEANET_TRY_ASSIGN(ExprPtr condition, parse_expression());
        SEANET_TRY(expect(TK::RParen, "Expected ')' after if condition."));
        SEANET_TRY_ASSIGN(BlockStmt then_block, parse_block());

        std::optional<BlockStmt> else_block;
        if (match(TK::KwElse)) {
            if (check(TK::KwIf)) {
                // else if: a synthetic block around the nested if
                SEANET_TRY_ASSIGN(StmtPtr nested, parse_if());
                BlockStmt wrapper;
                wrapper.statements.push_back(std::move(nested));
                else_block = std::move(wrapper);
            } else {
                SEANET_TRY_ASSIGN(BlockStmt block, parse_block());
                else_block = std::move(block);
            }
        }

        return StmtResult::ok(make_stmt(kw.pos, IfStmt{
            std::move(condition), std::move(then_block), std::move(else_block)}));
    }

    StmtResult parse_while() {
        Token kw = advance(); // while
        SEANET_TRY(expect(TK::LParen, "Expected '(' after 'while'."));
        SEANET_TRY_ASSIGN(ExprPtr condition, parse_expression());
        SEANET_TRY(expect(TK::RParen, "Expected ')' after while condition."));
        SEANET_TRY_ASSIGN(StmtPtr body, parse_statement());
        return StmtResult::ok(make_stmt(kw.pos, WhileStmt{std::move(condition), std::move(body)}));
    }

    // for (init; cond; incr) body  =>  { init; while (cond) { body...; incr; } }
    StmtResult parse_for() {
        Token kw = advance(); // for
        SEANET_TRY(expect(TK::LParen, "Expected '(' after 'for'."));

        StmtPtr init;
        if (match(TK::Semicolon)) {
            // no initializer
        } else if (check(TK::KwVar)) {
            SEANET_TRY_ASSIGN(init, parse_var_declaration());
        } else if (is_declaration_start()) {
            SEANET_TRY_ASSIGN(init, parse_typed_declaration());
        } else {
            SEANET_TRY_ASSIGN(init, parse_expression_statement());
        }

        ExprPtr condition;
        if (check(TK::Semicolon)) {
            Token always = peek();
            always.kind = TK::KwTrue;
            always.length = 0;
            always.value = {};
            condition = make_expr(always.pos, LiteralExpr{always});
        } else {
            SEANET_TRY_ASSIGN(condition, parse_expression());
        }
        SEANET_TRY(expect(TK::Semicolon, "Expected ';' after loop condition."));

        ExprPtr increment;
        if (!check(TK::RParen)) {
            SEANET_TRY_ASSIGN(increment, parse_expression());
        }
        SEANET_TRY(expect(TK::RParen, "Expected ')' after for clauses."));

        SourcePos body_pos = peek().pos;
        SEANET_TRY_ASSIGN(StmtPtr body, parse_statement());

        BlockStmt loop_body;
        if (auto* block = std::get_if<BlockStmt>(&body->value)) {
            loop_body = std::move(*block);
        } else {
            loop_body.statements.push_back(std::move(body));
        }
        if (increment) {
            SourcePos p = increment->pos;
            loop_body.statements.push_back(make_stmt(p, ExprStmt{std::move(increment)}));
        }

        BlockStmt outer;
        if (init) outer.statements.push_back(std::move(init));
        outer.statements.push_back(make_stmt(kw.pos, WhileStmt{
            std::move(condition), make_stmt(body_pos, std::move(loop_body))}));
        return StmtResult::ok(make_stmt(kw.pos, std::move(outer)));
    }

    StmtResult parse_return() {
        Token kw = advance(); // return
        if (match(TK::Semicolon)) {
            return StmtResult::ok(make_stmt(kw.pos, ReturnEmptyStmt{kw}));
        }
        SEANET_TRY_ASSIGN(ExprPtr value, parse_expression());
        SEANET_TRY(expect(TK::Semicolon, "Expected ';' after return value."));
        return StmtResult::ok(make_stmt(kw.pos, ReturnStmt{kw, std::move(value)}));
    }

    // -- Types --------------------------------------------------------------

    // ref? (builtin | Name | fun<...>) ([])*
    TypeResult parse_type() {
        bool is_ref = false;
        if (check(TK::KwRef)) {
            advance();
            if (check(TK::KwFun)) {
                return fail("ref cannot apply to a function-pointer type.");
            }
            is_ref = true;
        }

        TypeInfoPtr base;
        std::optional<Token> name;
        if (check(TK::KwFun)) {
            SEANET_TRY_ASSIGN(base, parse_function_type());
        } else if (is_builtin_type(peek().kind) || check(TK::Identifier)) {
            name = advance();
        } else {
            return fail("Expected type.");
        }

        std::size_t dims = 0;
        // A '>' still owed to an enclosing fun<...> ends this type
        while (pending_angles == 0 && check(TK::LBracket) &&
               peek_at(1).kind == TK::RBracket) {
            advance(); // [
            advance(); // ]
            ++dims;
        }

        // Only the outermost node carries the ref flag
        if (name) {
            base = make_named_type(*name, is_ref && dims == 0);
        }
        for (std::size_t i = 0; i < dims; ++i) {
            base = make_array_type(std::move(base), is_ref && i + 1 == dims);
        }
        return TypeResult::ok(std::move(base));
    }

    TypeResult parse_type_or_void() {
        if (check(TK::KwVoid)) {
            return TypeResult::ok(make_named_type(advance()));
        }
        return parse_type();
    }

    TypeResult parse_function_type() {
        Token fun_tok = advance(); // fun
        if (!check(TK::Less)) {
            Token void_tok = fun_tok;
            void_tok.kind = TK::KwVoid;
            void_tok.length = 0;
            return TypeResult::ok(make_function_type({}, make_named_type(void_tok)));
        }
        advance(); // <
        ++angle_depth;

        std::vector<TypeInfoPtr> entries;
        do {
            SEANET_TRY_ASSIGN(TypeInfoPtr entry, parse_type_or_void());
            entries.push_back(std::move(entry));
        } while (pending_angles == 0 && match(TK::Comma));

        if (pending_angles > 0) {
            --pending_angles;
        } else if (check(TK::RShift) && angle_depth > 1) {
            // fun<int, fun<bool>> closes this list and the enclosing one
            advance();
            ++pending_angles;
        } else {
            SEANET_TRY(expect(TK::Greater, "Expected '>' to close function type."));
        }
        --angle_depth;

        TypeInfoPtr return_type = std::move(entries.back());
        entries.pop_back();
        return TypeResult::ok(make_function_type(std::move(entries), std::move(return_type)));
    }

    // -- Expressions --------------------------------------------------------

    ExprResult parse_expression() {
        return parse_assignment();
    }

    // Right-associative; the target must be a variable or a property
    ExprResult parse_assignment() {
        SEANET_TRY_ASSIGN(ExprPtr target, parse_logical_or());

        if (check_any({TK::Assign, TK::PlusEq, TK::MinusEq, TK::StarEq, TK::SlashEq})) {
            Token op = advance();
            SEANET_TRY_ASSIGN(ExprPtr value, parse_assignment());
            SourcePos p = target->pos;

            if (auto* var = std::get_if<VariableExpr>(&target->value)) {
                return ExprResult::ok(make_expr(p, AssignExpr{var->name, op, std::move(value)}));
            }
            if (auto* prop = std::get_if<PropertyAccessExpr>(&target->value)) {
                return ExprResult::ok(make_expr(p, PropertyAssignExpr{
                    std::move(prop->object), prop->property, op, std::move(value)}));
            }
            return fail_at(op, "Invalid assignment target.");
        }
        return ExprResult::ok(std::move(target));
    }

    template<typename Node>
    ExprResult parse_left_assoc(std::initializer_list<TK> ops,
                                ExprResult (Parser::*operand)()) {
        SEANET_TRY_ASSIGN(ExprPtr left, (this->*operand)());
        while (check_any(ops)) {
            Token op = advance();
            SEANET_TRY_ASSIGN(ExprPtr right, (this->*operand)());
            SourcePos p = left->pos;
            left = make_expr(p, Node{op, std::move(left), std::move(right)});
        }
        return ExprResult::ok(std::move(left));
    }

    ExprResult parse_logical_or() {
        return parse_left_assoc<LogicalExpr>({TK::LogOr}, &Parser::parse_logical_and);
    }

    ExprResult parse_logical_and() {
        return parse_left_assoc<LogicalExpr>({TK::LogAnd}, &Parser::parse_bit_or);
    }

    ExprResult parse_bit_or() {
        return parse_left_assoc<BinaryExpr>({TK::Pipe}, &Parser::parse_bit_xor);
    }

    ExprResult parse_bit_xor() {
        return parse_left_assoc<BinaryExpr>({TK::Caret}, &Parser::parse_bit_and);
    }

    ExprResult parse_bit_and() {
        return parse_left_assoc<BinaryExpr>({TK::Ampersand}, &Parser::parse_equality);
    }

    ExprResult parse_equality() {
        return parse_left_assoc<BinaryExpr>({TK::EqEq, TK::NotEq}, &Parser::parse_relational);
    }

    ExprResult parse_relational() {
        return parse_left_assoc<BinaryExpr>(
            {TK::Less, TK::LessEq, TK::Greater, TK::GreaterEq}, &Parser::parse_shift);
    }

    ExprResult parse_shift() {
        return parse_left_assoc<BinaryExpr>({TK::LShift, TK::RShift}, &Parser::parse_additive);
    }

    ExprResult parse_additive() {
        return parse_left_assoc<BinaryExpr>({TK::Plus, TK::Minus}, &Parser::parse_multiplicative);
    }

    ExprResult parse_multiplicative() {
        return parse_left_assoc<BinaryExpr>(
            {TK::Star, TK::Slash, TK::Percent}, &Parser::parse_unary);
    }

    ExprResult parse_unary() {
        if (check_any({TK::Bang, TK::Minus, TK::Tilde, TK::PlusPlus, TK::MinusMinus})) {
            Token op = advance();
            SEANET_TRY_ASSIGN(ExprPtr operand, parse_unary());
            return ExprResult::ok(make_expr(op.pos, PrefixUnaryExpr{op, std::move(operand)}));
        }
        return parse_postfix();
    }

    // primary followed by any chain of (args), .name and [index]
    ExprResult parse_postfix() {
        SEANET_TRY_ASSIGN(ExprPtr expr, parse_primary());

        while (true) {
            SourcePos p = expr->pos;
            if (match(TK::LParen)) {
                SEANET_TRY_ASSIGN(std::vector<ExprPtr> args, parse_arguments());
                SEANET_TRY(expect(TK::RParen, "Expected ')' after arguments."));
                expr = make_expr(p, CallExpr{std::move(expr), std::move(args)});
            } else if (match(TK::Dot)) {
                SEANET_TRY_ASSIGN(Token property, expect(TK::Identifier, "Expected property name after '.'."));
                expr = make_expr(p, PropertyAccessExpr{std::move(expr), property});
            } else if (match(TK::LBracket)) {
                SEANET_TRY_ASSIGN(ExprPtr index, parse_expression());
                SEANET_TRY(expect(TK::RBracket, "Expected ']' after index."));
                expr = make_expr(p, IndexExpr{std::move(expr), std::move(index)});
            } else {
                break;
            }
        }
        return ExprResult::ok(std::move(expr));
    }

    Result<std::vector<ExprPtr>> parse_arguments() {
        std::vector<ExprPtr> args;
        if (check(TK::RParen)) {
            return Result<std::vector<ExprPtr>>::ok(std::move(args));
        }
        do {
            if (check(TK::KwRef)) {
                Token ref_tok = advance();
                SEANET_TRY_ASSIGN(Token name, expect(TK::Identifier, "Expected variable name after 'ref'."));
                args.push_back(make_expr(ref_tok.pos, VariableExpr{name, true}));
            } else {
                SEANET_TRY_ASSIGN(ExprPtr arg, parse_expression());
                args.push_back(std::move(arg));
            }
        } while (match(TK::Comma));
        return Result<std::vector<ExprPtr>>::ok(std::move(args));
    }

    ExprResult parse_primary() {
        if (is_literal(peek().kind)) {
            Token lit = advance();
            return ExprResult::ok(make_expr(lit.pos, LiteralExpr{lit}));
        }

        if (check(TK::LParen)) {
            Token paren = advance();
            SEANET_TRY_ASSIGN(ExprPtr inner, parse_expression());
            SEANET_TRY(expect(TK::RParen, "Expected ')' after expression."));
            return ExprResult::ok(make_expr(paren.pos, GroupExpr{std::move(inner)}));
        }

        if (check(TK::Identifier)) {
            Token name = advance();
            if (check(TK::PlusPlus) || check(TK::MinusMinus)) {
                Token op = advance();
                return ExprResult::ok(make_expr(name.pos, PostfixExpr{name, op}));
            }
            return ExprResult::ok(make_expr(name.pos, VariableExpr{name, false}));
        }

        if (check(TK::KwNew)) return parse_new();

        if (check(TK::KwFun)) {
            SourcePos p = peek().pos;
            SEANET_TRY_ASSIGN(TypeInfoPtr type, parse_function_type());
            return ExprResult::ok(make_expr(p, TypeLiteralExpr{std::move(type)}));
        }

        return fail("Expected expression.");
    }

    // new T[n][m]... or new T()
    ExprResult parse_new() {
        Token kw = advance(); // new
        if (!is_builtin_type(peek().kind) && !check(TK::Identifier)) {
            return fail("Expected type name after 'new'.");
        }
        Token element = advance();

        if (check(TK::LBracket)) {
            std::vector<ExprPtr> sizes;
            while (match(TK::LBracket)) {
                SEANET_TRY_ASSIGN(ExprPtr size, parse_expression());
                SEANET_TRY(expect(TK::RBracket, "Expected ']' after array size."));
                sizes.push_back(std::move(size));
            }
            TypeInfoPtr type = make_named_type(element);
            for (std::size_t i = 0; i < sizes.size(); ++i) {
                type = make_array_type(std::move(type));
            }
            return ExprResult::ok(make_expr(kw.pos, NewArrayExpr{std::move(type), std::move(sizes)}));
        }

        SEANET_TRY(expect(TK::LParen, "Expected '(' or '[' after type in 'new' expression."));
        SEANET_TRY(expect(TK::RParen, "Expected ')': struct construction takes no arguments."));
        return ExprResult::ok(make_expr(kw.pos, NewStructExpr{make_named_type(element)}));
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Program parse(const std::string& filename,
              const std::vector<Token>& tokens,
              Diagnostics& diags) {
    Parser parser(tokens, filename, diags);
    auto result = parser.parse_program();
    if (result.is_err()) {
        log::debug("parse of %s abandoned: %s",
                   filename.c_str(), result.error().message.c_str());
        return Program{};
    }
    log::trace("parsed %s: %zu top-level declarations",
               filename.c_str(), result.value().declarations.size());
    return std::move(result).value();
}

ExprPtr parse_expression(const std::string& filename,
                         const std::vector<Token>& tokens,
                         Diagnostics& diags) {
    Parser parser(tokens, filename, diags);
    auto result = parser.parse_expression();
    if (result.is_err()) return nullptr;
    if (!parser.at_end()) {
        parser.fail("Expected end of input after expression.");
        return nullptr;
    }
    return std::move(result).value();
}

TypeInfoPtr parse_type(const std::string& filename,
                       const std::vector<Token>& tokens,
                       Diagnostics& diags) {
    Parser parser(tokens, filename, diags);
    auto result = parser.parse_type_or_void();
    if (result.is_err()) return nullptr;
    if (!parser.at_end()) {
        parser.fail("Expected end of input after type.");
        return nullptr;
    }
    return std::move(result).value();
}

} // namespace seanet
