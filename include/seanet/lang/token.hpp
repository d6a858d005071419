#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

namespace seanet {

enum class TokenKind {
    // Structural punctuation
    LBrace,
    RBrace,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Dot,
    Semicolon,

    // Operators
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Assign,
    Bang,
    Tilde,
    Less,
    Greater,
    Ampersand,
    Pipe,
    Caret,
    PlusPlus,
    MinusMinus,
    PlusEq,
    MinusEq,
    StarEq,
    SlashEq,
    EqEq,
    NotEq,
    LessEq,
    GreaterEq,
    LogAnd,
    LogOr,
    LShift,
    RShift,

    // Literals
    StringLiteral,
    IntLiteral,
    UIntLiteral,
    LongLiteral,
    ULongLiteral,
    FloatLiteral,
    DoubleLiteral,

    // Keywords
    KwTrue,
    KwFalse,
    KwIf,
    KwElse,
    KwReturn,
    KwFor,
    KwWhile,
    KwBreak,     // "continue" also maps here
    KwVar,
    KwRef,
    KwFun,
    KwNew,
    KwStruct,

    // Primitive type names
    KwByte,
    KwShort,
    KwUShort,
    KwInt,
    KwUInt,
    KwLong,
    KwULong,
    KwFloat,
    KwDouble,
    KwBool,
    KwVoid,
    KwString,

    Identifier,
    Comment,
    Eof
};

// Parsed value of a numeric literal; monostate for every other token
using LiteralValue = std::variant<std::monostate, int32_t, uint32_t,
                                  int64_t, uint64_t, float, double>;

// Source position for error reporting
struct SourcePos {
    int line = 1;
    int col = 1;
};

// A token is a view over the source buffer: it never copies its lexeme.
struct Token {
    TokenKind kind = TokenKind::Eof;
    std::size_t start = 0;
    std::size_t length = 0;
    std::string_view source;
    SourcePos pos;
    LiteralValue value;

    std::string_view text() const { return source.substr(start, length); }
};

const char* token_kind_name(TokenKind kind);

// Primitive type keywords usable as a declaration's type (void excluded)
bool is_builtin_type(TokenKind kind);

bool is_literal(TokenKind kind);

} // namespace seanet
