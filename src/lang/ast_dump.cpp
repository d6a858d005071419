#include <seanet/lang/ast_dump.hpp>

namespace seanet {

namespace {

// Lexeme of a token, falling back to the kind name for synthesized tokens
// (the implicit `true` of `for (;;)` and the implicit void of a bare `fun`)
std::string token_str(const Token& tok) {
    if (tok.length == 0 || tok.kind == TokenKind::KwTrue ||
        tok.kind == TokenKind::KwFalse) {
        return token_kind_name(tok.kind);
    }
    return std::string(tok.text());
}

struct TypePrinter {
    std::string& out;

    void print(const TypeInfo& type) {
        std::visit(*this, type.value);
    }

    void operator()(const NamedType& t) {
        if (t.is_ref) out += "ref ";
        out += token_str(t.name);
    }

    void operator()(const ArrayType& t) {
        if (t.is_ref) out += "ref ";
        print(*t.element);
        out += "[]";
    }

    void operator()(const FunctionType& t) {
        out += "fun<";
        for (const auto& param : t.params) {
            print(*param);
            out += ", ";
        }
        print(*t.return_type);
        out += ">";
    }
};

struct ExprPrinter {
    std::string& out;

    void print(const Expr& expr) {
        std::visit(*this, expr.value);
    }

    void type(const TypeInfo& t) {
        TypePrinter{out}.print(t);
    }

    void operator()(const LiteralExpr& e) {
        out += token_str(e.literal);
    }

    void operator()(const GroupExpr& e) {
        out += "(group ";
        print(*e.inner);
        out += ")";
    }

    void operator()(const PrefixUnaryExpr& e) {
        out += "(" + token_str(e.op) + " ";
        print(*e.operand);
        out += ")";
    }

    void operator()(const BinaryExpr& e) {
        out += "(" + token_str(e.op) + " ";
        print(*e.left);
        out += " ";
        print(*e.right);
        out += ")";
    }

    void operator()(const LogicalExpr& e) {
        out += "(" + token_str(e.op) + " ";
        print(*e.left);
        out += " ";
        print(*e.right);
        out += ")";
    }

    void operator()(const AssignExpr& e) {
        out += "(" + token_str(e.op) + " " + token_str(e.name) + " ";
        print(*e.value);
        out += ")";
    }

    void operator()(const PropertyAssignExpr& e) {
        out += "(" + token_str(e.op) + " (. ";
        print(*e.object);
        out += " " + token_str(e.property) + ") ";
        print(*e.value);
        out += ")";
    }

    void operator()(const CallExpr& e) {
        out += "(call ";
        print(*e.callee);
        for (const auto& arg : e.args) {
            out += " ";
            print(*arg);
        }
        out += ")";
    }

    void operator()(const PropertyAccessExpr& e) {
        out += "(. ";
        print(*e.object);
        out += " " + token_str(e.property) + ")";
    }

    void operator()(const VariableExpr& e) {
        if (e.by_ref) {
            out += "(ref " + token_str(e.name) + ")";
        } else {
            out += token_str(e.name);
        }
    }

    void operator()(const PostfixExpr& e) {
        out += "(post" + token_str(e.op) + " " + token_str(e.name) + ")";
    }

    void operator()(const IndexExpr& e) {
        out += "([] ";
        print(*e.array);
        out += " ";
        print(*e.index);
        out += ")";
    }

    void operator()(const NewArrayExpr& e) {
        out += "(new ";
        type(*e.type);
        for (const auto& size : e.sizes) {
            out += " ";
            print(*size);
        }
        out += ")";
    }

    void operator()(const NewStructExpr& e) {
        out += "(new ";
        type(*e.type);
        out += ")";
    }

    void operator()(const TypeLiteralExpr& e) {
        out += "(type ";
        type(*e.type);
        out += ")";
    }
};

struct StmtPrinter {
    std::string& out;

    void print(const Stmt& stmt) {
        std::visit(*this, stmt.value);
    }

    void expr(const Expr& e) {
        ExprPrinter{out}.print(e);
    }

    void type(const TypeInfo& t) {
        TypePrinter{out}.print(t);
    }

    void operator()(const Program& p) {
        for (std::size_t i = 0; i < p.declarations.size(); ++i) {
            if (i > 0) out += "\n";
            print(*p.declarations[i]);
        }
    }

    void operator()(const BlockStmt& s) {
        out += "(block";
        for (const auto& stmt : s.statements) {
            out += " ";
            print(*stmt);
        }
        out += ")";
    }

    void operator()(const ExprStmt& s) {
        out += "(expr ";
        expr(*s.expr);
        out += ")";
    }

    void operator()(const VarDeclStmt& s) {
        out += "(decl ";
        type(*s.type);
        out += " " + token_str(s.name) + ")";
    }

    void operator()(const VarDeclAssignStmt& s) {
        out += "(decl ";
        type(*s.type);
        out += " " + token_str(s.name) + " ";
        expr(*s.init);
        out += ")";
    }

    void operator()(const IfStmt& s) {
        out += "(if ";
        expr(*s.condition);
        out += " ";
        (*this)(s.then_block);
        if (s.else_block) {
            out += " ";
            (*this)(*s.else_block);
        }
        out += ")";
    }

    void operator()(const WhileStmt& s) {
        out += "(while ";
        expr(*s.condition);
        out += " ";
        print(*s.body);
        out += ")";
    }

    void operator()(const FunctionDeclStmt& s) {
        out += "(function ";
        type(*s.return_type);
        out += " " + token_str(s.name) + " (params";
        for (const auto& param : s.params) {
            out += " ";
            (*this)(param);
        }
        out += ") ";
        (*this)(s.body);
        out += ")";
    }

    void operator()(const StructDeclStmt& s) {
        out += "(struct " + token_str(s.name);
        for (const auto& field : s.fields) {
            out += " ";
            (*this)(field);
        }
        out += ")";
    }

    void operator()(const ReturnStmt& s) {
        out += "(return ";
        expr(*s.value);
        out += ")";
    }

    void operator()(const ReturnEmptyStmt&) {
        out += "(return)";
    }
};

} // anonymous namespace

std::string dump(const Program& program) {
    std::string out;
    StmtPrinter{out}(program);
    return out;
}

std::string dump(const Stmt& stmt) {
    std::string out;
    StmtPrinter{out}.print(stmt);
    return out;
}

std::string dump(const Expr& expr) {
    std::string out;
    ExprPrinter{out}.print(expr);
    return out;
}

std::string dump(const TypeInfo& type) {
    std::string out;
    TypePrinter{out}.print(type);
    return out;
}

} // namespace seanet
