#include <seanet/lang/token.hpp>

namespace seanet {

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
    case TokenKind::LBrace:        return "LBrace";
    case TokenKind::RBrace:        return "RBrace";
    case TokenKind::LParen:        return "LParen";
    case TokenKind::RParen:        return "RParen";
    case TokenKind::LBracket:      return "LBracket";
    case TokenKind::RBracket:      return "RBracket";
    case TokenKind::Comma:         return "Comma";
    case TokenKind::Dot:           return "Dot";
    case TokenKind::Semicolon:     return "Semicolon";
    case TokenKind::Plus:          return "Plus";
    case TokenKind::Minus:         return "Minus";
    case TokenKind::Star:          return "Star";
    case TokenKind::Slash:         return "Slash";
    case TokenKind::Percent:       return "Percent";
    case TokenKind::Assign:        return "Assign";
    case TokenKind::Bang:          return "Bang";
    case TokenKind::Tilde:         return "Tilde";
    case TokenKind::Less:          return "Less";
    case TokenKind::Greater:       return "Greater";
    case TokenKind::Ampersand:     return "Ampersand";
    case TokenKind::Pipe:          return "Pipe";
    case TokenKind::Caret:         return "Caret";
    case TokenKind::PlusPlus:      return "PlusPlus";
    case TokenKind::MinusMinus:    return "MinusMinus";
    case TokenKind::PlusEq:        return "PlusEq";
    case TokenKind::MinusEq:       return "MinusEq";
    case TokenKind::StarEq:        return "StarEq";
    case TokenKind::SlashEq:       return "SlashEq";
    case TokenKind::EqEq:          return "EqEq";
    case TokenKind::NotEq:         return "NotEq";
    case TokenKind::LessEq:        return "LessEq";
    case TokenKind::GreaterEq:     return "GreaterEq";
    case TokenKind::LogAnd:        return "LogAnd";
    case TokenKind::LogOr:         return "LogOr";
    case TokenKind::LShift:        return "LShift";
    case TokenKind::RShift:        return "RShift";
    case TokenKind::StringLiteral: return "StringLiteral";
    case TokenKind::IntLiteral:    return "IntLiteral";
    case TokenKind::UIntLiteral:   return "UIntLiteral";
    case TokenKind::LongLiteral:   return "LongLiteral";
    case TokenKind::ULongLiteral:  return "ULongLiteral";
    case TokenKind::FloatLiteral:  return "FloatLiteral";
    case TokenKind::DoubleLiteral: return "DoubleLiteral";
    case TokenKind::KwTrue:        return "true";
    case TokenKind::KwFalse:       return "false";
    case TokenKind::KwIf:          return "if";
    case TokenKind::KwElse:        return "else";
    case TokenKind::KwReturn:      return "return";
    case TokenKind::KwFor:         return "for";
    case TokenKind::KwWhile:       return "while";
    case TokenKind::KwBreak:       return "break";
    case TokenKind::KwVar:         return "var";
    case TokenKind::KwRef:         return "ref";
    case TokenKind::KwFun:         return "fun";
    case TokenKind::KwNew:         return "new";
    case TokenKind::KwStruct:      return "struct";
    case TokenKind::KwByte:        return "byte";
    case TokenKind::KwShort:       return "short";
    case TokenKind::KwUShort:      return "ushort";
    case TokenKind::KwInt:         return "int";
    case TokenKind::KwUInt:        return "uint";
    case TokenKind::KwLong:        return "long";
    case TokenKind::KwULong:       return "ulong";
    case TokenKind::KwFloat:       return "float";
    case TokenKind::KwDouble:      return "double";
    case TokenKind::KwBool:        return "bool";
    case TokenKind::KwVoid:        return "void";
    case TokenKind::KwString:      return "string";
    case TokenKind::Identifier:    return "Identifier";
    case TokenKind::Comment:       return "Comment";
    case TokenKind::Eof:           return "Eof";
    }
    return "Unknown";
}

bool is_builtin_type(TokenKind kind) {
    switch (kind) {
    case TokenKind::KwByte:
    case TokenKind::KwShort:
    case TokenKind::KwUShort:
    case TokenKind::KwInt:
    case TokenKind::KwUInt:
    case TokenKind::KwLong:
    case TokenKind::KwULong:
    case TokenKind::KwFloat:
    case TokenKind::KwDouble:
    case TokenKind::KwBool:
    case TokenKind::KwString:
        return true;
    default:
        return false;
    }
}

bool is_literal(TokenKind kind) {
    switch (kind) {
    case TokenKind::StringLiteral:
    case TokenKind::IntLiteral:
    case TokenKind::UIntLiteral:
    case TokenKind::LongLiteral:
    case TokenKind::ULongLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::DoubleLiteral:
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
        return true;
    default:
        return false;
    }
}

} // namespace seanet
