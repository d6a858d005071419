#include <seanet/lang/scanner.hpp>
#include <seanet/log.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace seanet {

// ---------------------------------------------------------------------------
// Keyword table
// ---------------------------------------------------------------------------

const std::unordered_map<std::string_view, TokenKind>& keywords() {
    static const std::unordered_map<std::string_view, TokenKind> table = {
        {"true",     TokenKind::KwTrue},
        {"false",    TokenKind::KwFalse},
        {"if",       TokenKind::KwIf},
        {"else",     TokenKind::KwElse},
        {"return",   TokenKind::KwReturn},
        {"for",      TokenKind::KwFor},
        {"while",    TokenKind::KwWhile},
        {"break",    TokenKind::KwBreak},
        {"continue", TokenKind::KwBreak},
        {"var",      TokenKind::KwVar},
        {"ref",      TokenKind::KwRef},
        {"fun",      TokenKind::KwFun},
        {"new",      TokenKind::KwNew},
        {"struct",   TokenKind::KwStruct},
        // Primitive types
        {"byte",     TokenKind::KwByte},
        {"short",    TokenKind::KwShort},
        {"ushort",   TokenKind::KwUShort},
        {"int",      TokenKind::KwInt},
        {"uint",     TokenKind::KwUInt},
        {"long",     TokenKind::KwLong},
        {"ulong",    TokenKind::KwULong},
        {"float",    TokenKind::KwFloat},
        {"double",   TokenKind::KwDouble},
        {"bool",     TokenKind::KwBool},
        {"void",     TokenKind::KwVoid},
        {"string",   TokenKind::KwString},
    };
    return table;
}

// ---------------------------------------------------------------------------
// Scanner state machine
// ---------------------------------------------------------------------------

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_alnum(char c) { return is_digit(c) || is_alpha(c); }

// UTF-8 continuation byte (10xxxxxx)
bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

enum class IntWidth { Int, UInt, Long, ULong };

struct Scanner {
    const std::string& filename;
    std::string_view source;
    Diagnostics& diags;
    std::size_t pos;
    int line;
    int col;

    std::vector<Token> tokens;

    Scanner(const std::string& fname, std::string_view src, Diagnostics& d)
        : filename(fname), source(src), diags(d), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return at_end() ? '\0' : source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    // Columns count code points, so continuation bytes do not advance them
    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else if (!is_continuation(c)) {
            ++col;
        }
        return c;
    }

    bool match(char expected) {
        if (at_end() || source[pos] != expected) return false;
        advance();
        return true;
    }

    SourcePos current_pos() const {
        return {line, col};
    }

    void emit(TokenKind kind, std::size_t start, SourcePos p,
              LiteralValue value = {}) {
        Token tok;
        tok.kind = kind;
        tok.start = start;
        tok.length = pos - start;
        tok.source = source;
        tok.pos = p;
        tok.value = value;
        tokens.push_back(tok);
    }

    void error(SourcePos p, std::string message) {
        diags.report(filename, p.line, p.col, std::move(message));
    }

    std::vector<Token> run() {
        while (!at_end()) {
            scan_token();
        }

        emit(TokenKind::Eof, pos, current_pos());
        return std::move(tokens);
    }

    void scan_token() {
        auto p = current_pos();
        std::size_t start = pos;
        char c = advance();

        switch (c) {
        // Whitespace
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            break;

        // Single character tokens
        case '{': emit(TokenKind::LBrace, start, p); break;
        case '}': emit(TokenKind::RBrace, start, p); break;
        case '(': emit(TokenKind::LParen, start, p); break;
        case ')': emit(TokenKind::RParen, start, p); break;
        case '[': emit(TokenKind::LBracket, start, p); break;
        case ']': emit(TokenKind::RBracket, start, p); break;
        case ',': emit(TokenKind::Comma, start, p); break;
        case '.': emit(TokenKind::Dot, start, p); break;
        case ';': emit(TokenKind::Semicolon, start, p); break;
        case '%': emit(TokenKind::Percent, start, p); break;
        case '~': emit(TokenKind::Tilde, start, p); break;
        case '^': emit(TokenKind::Caret, start, p); break;

        // One or two character tokens
        case '+':
            if (match('+'))      emit(TokenKind::PlusPlus, start, p);
            else if (match('=')) emit(TokenKind::PlusEq, start, p);
            else                 emit(TokenKind::Plus, start, p);
            break;
        case '-':
            if (match('-'))      emit(TokenKind::MinusMinus, start, p);
            else if (match('=')) emit(TokenKind::MinusEq, start, p);
            else                 emit(TokenKind::Minus, start, p);
            break;
        case '*':
            if (match('=')) emit(TokenKind::StarEq, start, p);
            else            emit(TokenKind::Star, start, p);
            break;
        case '/':
            if (match('/'))      scan_line_comment(start, p);
            else if (match('*')) scan_block_comment(start, p);
            else if (match('=')) emit(TokenKind::SlashEq, start, p);
            else                 emit(TokenKind::Slash, start, p);
            break;
        case '!':
            if (match('=')) emit(TokenKind::NotEq, start, p);
            else            emit(TokenKind::Bang, start, p);
            break;
        case '=':
            if (match('=')) emit(TokenKind::EqEq, start, p);
            else            emit(TokenKind::Assign, start, p);
            break;
        case '<':
            if (match('='))      emit(TokenKind::LessEq, start, p);
            else if (match('<')) emit(TokenKind::LShift, start, p);
            else                 emit(TokenKind::Less, start, p);
            break;
        case '>':
            if (match('='))      emit(TokenKind::GreaterEq, start, p);
            else if (match('>')) emit(TokenKind::RShift, start, p);
            else                 emit(TokenKind::Greater, start, p);
            break;
        case '&':
            if (match('&')) emit(TokenKind::LogAnd, start, p);
            else            emit(TokenKind::Ampersand, start, p);
            break;
        case '|':
            if (match('|')) emit(TokenKind::LogOr, start, p);
            else            emit(TokenKind::Pipe, start, p);
            break;

        case '"':
            scan_string(start, p);
            break;

        default:
            if (is_digit(c)) {
                scan_number(start, p);
            } else if (is_alpha(c)) {
                scan_word(start, p);
            } else {
                // Swallow the rest of a multi-byte sequence so it is reported once
                while (!at_end() && is_continuation(peek())) advance();
                error(p, "Unexpected character \"" +
                         std::string(source.substr(start, pos - start)) + "\".");
            }
            break;
        }
    }

    // -- Comments -----------------------------------------------------------

    void scan_line_comment(std::size_t start, SourcePos p) {
        while (!at_end() && peek() != '\n') {
            advance();
        }
        emit(TokenKind::Comment, start, p);
    }

    void scan_block_comment(std::size_t start, SourcePos p) {
        while (!at_end()) {
            if (peek() == '*' && peek_next() == '/') {
                advance(); // *
                advance(); // /
                emit(TokenKind::Comment, start, p);
                return;
            }
            advance();
        }
        error(p, "Unterminated multi-line comment. Expected */, but reached end of file.");
    }

    // -- Strings ------------------------------------------------------------

    // Verbatim: no escape processing
    void scan_string(std::size_t start, SourcePos p) {
        while (!at_end() && peek() != '"') {
            advance();
        }
        if (!match('"')) {
            error(p, "Unterminated string. Expected \", but reached end of file.");
            return;
        }
        emit(TokenKind::StringLiteral, start, p);
    }

    // -- Identifiers and keywords -------------------------------------------

    void scan_word(std::size_t start, SourcePos p) {
        while (!at_end() && is_alnum(peek())) {
            advance();
        }
        auto word = source.substr(start, pos - start);
        auto& kws = keywords();
        auto it = kws.find(word);
        emit(it != kws.end() ? it->second : TokenKind::Identifier, start, p);
    }

    // -- Numbers ------------------------------------------------------------

    void scan_number(std::size_t start, SourcePos p) {
        // The first digit has already been consumed
        while (is_digit(peek())) advance();

        bool is_hex = false;
        if (peek() == 'x' || peek() == 'X') {
            advance();
            is_hex = true;
            while (is_hex_digit(peek())) advance();
        }

        bool has_fraction = !is_hex && peek() == '.' && is_digit(peek_next());
        bool has_exponent = !is_hex && (peek() == 'e' || peek() == 'E');
        if (has_fraction || has_exponent) {
            scan_floating(start, p);
            return;
        }

        std::size_t digits_end = pos;
        IntWidth width = IntWidth::Int;
        if (match('u') || match('U')) {
            width = (match('l') || match('L')) ? IntWidth::ULong : IntWidth::UInt;
        } else if (match('l') || match('L')) {
            width = IntWidth::Long;
        }

        std::size_t digits_start = is_hex ? start + 2 : start;
        auto digits = std::string(source.substr(digits_start, digits_end - digits_start));
        produce_integer(start, p, digits, is_hex ? 16 : 10, width);
    }

    void scan_floating(std::size_t start, SourcePos p) {
        bool well_formed = true;

        if (peek() == '.' && is_digit(peek_next())) {
            advance(); // .
            while (is_digit(peek())) advance();
        }

        if (peek() == 'e' || peek() == 'E') {
            advance();
            if (peek() == '+' || peek() == '-') advance();
            if (!is_digit(peek())) well_formed = false;
            while (is_digit(peek())) advance();
        }

        std::size_t number_end = pos;
        bool is_float = match('f') || match('F');
        auto text = std::string(source.substr(start, number_end - start));
        const char* kind_name = is_float ? "float" : "double";

        if (!well_formed) {
            report_bad_literal(p, kind_name, start);
            return;
        }

        try {
            std::size_t used = 0;
            if (is_float) {
                float v = std::stof(text, &used);
                if (used != text.size()) {
                    report_bad_literal(p, kind_name, start);
                    return;
                }
                emit(TokenKind::FloatLiteral, start, p, v);
            } else {
                double v = std::stod(text, &used);
                if (used != text.size()) {
                    report_bad_literal(p, kind_name, start);
                    return;
                }
                emit(TokenKind::DoubleLiteral, start, p, v);
            }
        } catch (const std::invalid_argument&) {
            report_bad_literal(p, kind_name, start);
        } catch (const std::out_of_range&) {
            report_bad_literal(p, kind_name, start);
        }
    }

    void produce_integer(std::size_t start, SourcePos p, const std::string& digits,
                         int base, IntWidth width) {
        // Hex literals may use the full unsigned range of their width and are
        // reinterpreted as two's complement for the signed kinds.
        uint64_t limit = 0;
        const char* kind_name = "";
        switch (width) {
        case IntWidth::Int:
            kind_name = "int";
            limit = base == 16 ? std::numeric_limits<uint32_t>::max()
                               : std::numeric_limits<int32_t>::max();
            break;
        case IntWidth::UInt:
            kind_name = "uint";
            limit = std::numeric_limits<uint32_t>::max();
            break;
        case IntWidth::Long:
            kind_name = "long";
            limit = base == 16 ? std::numeric_limits<uint64_t>::max()
                               : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            break;
        case IntWidth::ULong:
            kind_name = "ulong";
            limit = std::numeric_limits<uint64_t>::max();
            break;
        }

        if (digits.empty()) {
            report_bad_literal(p, kind_name, start);
            return;
        }

        uint64_t value = 0;
        try {
            std::size_t used = 0;
            unsigned long long parsed = std::stoull(digits, &used, base);
            if (used != digits.size()) {
                report_bad_literal(p, kind_name, start);
                return;
            }
            value = parsed;
        } catch (const std::invalid_argument&) {
            report_bad_literal(p, kind_name, start);
            return;
        } catch (const std::out_of_range&) {
            report_bad_literal(p, kind_name, start);
            return;
        }

        if (value > limit) {
            report_bad_literal(p, kind_name, start);
            return;
        }

        switch (width) {
        case IntWidth::Int:
            emit(TokenKind::IntLiteral, start, p,
                 static_cast<int32_t>(static_cast<uint32_t>(value)));
            break;
        case IntWidth::UInt:
            emit(TokenKind::UIntLiteral, start, p, static_cast<uint32_t>(value));
            break;
        case IntWidth::Long:
            emit(TokenKind::LongLiteral, start, p, static_cast<int64_t>(value));
            break;
        case IntWidth::ULong:
            emit(TokenKind::ULongLiteral, start, p, value);
            break;
        }
    }

    void report_bad_literal(SourcePos p, const char* kind_name, std::size_t start) {
        error(p, std::string("Failed to parse ") + kind_name + " " +
                 std::string(source.substr(start, pos - start)));
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::vector<Token> scan(const std::string& filename,
                        std::string_view source,
                        Diagnostics& diags) {
    std::size_t errors_before = diags.size();
    Scanner scanner(filename, source, diags);
    auto tokens = scanner.run();
    log::trace("scanned %s: %zu tokens, %zu lexical errors",
               filename.c_str(), tokens.size(), diags.size() - errors_before);
    return tokens;
}

} // namespace seanet
