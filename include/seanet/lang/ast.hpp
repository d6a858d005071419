#pragma once

#include <seanet/lang/token.hpp>
#include <seanet/lang/type_info.hpp>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace seanet {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct LiteralExpr { Token literal; };
struct GroupExpr { ExprPtr inner; };
struct PrefixUnaryExpr { Token op; ExprPtr operand; };
struct BinaryExpr { Token op; ExprPtr left, right; };

// && and ||, kept apart from BinaryExpr because they short-circuit
struct LogicalExpr { Token op; ExprPtr left, right; };

// name op value, where op is one of = += -= *= /=
struct AssignExpr { Token name; Token op; ExprPtr value; };
struct PropertyAssignExpr { ExprPtr object; Token property; Token op; ExprPtr value; };

struct CallExpr { ExprPtr callee; std::vector<ExprPtr> args; };
struct PropertyAccessExpr { ExprPtr object; Token property; };

// by_ref marks a `ref x` call argument
struct VariableExpr { Token name; bool by_ref = false; };

// name++ or name--
struct PostfixExpr { Token name; Token op; };

struct IndexExpr { ExprPtr array; ExprPtr index; };

// new T[a][b]: type is the full array type, one size per dimension
struct NewArrayExpr { TypeInfoPtr type; std::vector<ExprPtr> sizes; };
struct NewStructExpr { TypeInfoPtr type; };

// A function-pointer type written in expression position
struct TypeLiteralExpr { TypeInfoPtr type; };

using ExprVariant = std::variant<
    LiteralExpr, GroupExpr, PrefixUnaryExpr, BinaryExpr, LogicalExpr,
    AssignExpr, PropertyAssignExpr, CallExpr, PropertyAccessExpr,
    VariableExpr, PostfixExpr, IndexExpr, NewArrayExpr, NewStructExpr,
    TypeLiteralExpr
>;

struct Expr {
    ExprVariant value;
    SourcePos pos;

    Expr(ExprVariant v, SourcePos p) : value(std::move(v)), pos(p) {}
};

template<typename T>
ExprPtr make_expr(SourcePos pos, T node) {
    return std::make_unique<Expr>(ExprVariant(std::move(node)), pos);
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct Program {
    std::vector<StmtPtr> declarations;

    bool empty() const { return declarations.empty(); }
};

struct BlockStmt { std::vector<StmtPtr> statements; };
struct ExprStmt { ExprPtr expr; };

// Also used for function parameters and struct fields
struct VarDeclStmt { TypeInfoPtr type; Token name; };

// `var x = e` carries a NamedType holding the `var` token
struct VarDeclAssignStmt { TypeInfoPtr type; Token name; ExprPtr init; };

// `else if` is an else_block holding exactly one IfStmt
struct IfStmt {
    ExprPtr condition;
    BlockStmt then_block;
    std::optional<BlockStmt> else_block;
};

struct WhileStmt { ExprPtr condition; StmtPtr body; };

struct FunctionDeclStmt {
    TypeInfoPtr return_type;
    Token name;
    std::vector<VarDeclStmt> params;
    BlockStmt body;
};

struct StructDeclStmt {
    Token name;
    std::vector<VarDeclStmt> fields;
};

struct ReturnStmt { Token keyword; ExprPtr value; };
struct ReturnEmptyStmt { Token keyword; };

using StmtVariant = std::variant<
    Program, BlockStmt, ExprStmt, VarDeclStmt, VarDeclAssignStmt, IfStmt,
    WhileStmt, FunctionDeclStmt, StructDeclStmt, ReturnStmt, ReturnEmptyStmt
>;

struct Stmt {
    StmtVariant value;
    SourcePos pos;

    Stmt(StmtVariant v, SourcePos p) : value(std::move(v)), pos(p) {}
};

template<typename T>
StmtPtr make_stmt(SourcePos pos, T node) {
    return std::make_unique<Stmt>(StmtVariant(std::move(node)), pos);
}

} // namespace seanet
