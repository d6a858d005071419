#include <catch2/catch.hpp>
#include <seanet/lang/scanner.hpp>
#include <seanet/source.hpp>
#include <cstdlib>
#include <string>

using namespace seanet;

static std::string fixture_dir() {
    const char* src = std::getenv("SEANET_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::vector<Token> scan_ok(std::string_view source) {
    Diagnostics diags;
    auto tokens = scan("<input>", source, diags);
    INFO("diagnostics: " << diags.size());
    REQUIRE_FALSE(diags.has_errors());
    return tokens;
}

static std::vector<TokenKind> kinds_of(const std::vector<Token>& tokens) {
    std::vector<TokenKind> out;
    for (const auto& t : tokens) out.push_back(t.kind);
    return out;
}

// ===== Basic tokenization =====

TEST_CASE("scan empty string", "[scanner]") {
    auto toks = scan_ok("");
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].kind == TokenKind::Eof);
}

TEST_CASE("scan whitespace only", "[scanner]") {
    auto toks = scan_ok("  \t\r\n  \n");
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].kind == TokenKind::Eof);
}

TEST_CASE("token lexemes are views into the source", "[scanner]") {
    std::string source = "int main() { return a+b; } // done";
    auto toks = scan_ok(source);
    for (const auto& t : toks) {
        REQUIRE(t.start + t.length <= source.size());
        REQUIRE(t.text() == std::string_view(source).substr(t.start, t.length));
    }
    REQUIRE(toks[0].text() == "int");
    REQUIRE(toks[1].text() == "main");
    REQUIRE(toks[toks.size() - 2].kind == TokenKind::Comment);
    REQUIRE(toks[toks.size() - 2].text() == "// done");
}

TEST_CASE("scan always ends with exactly one Eof", "[scanner]") {
    const char* inputs[] = {"", "x", "\"open", "/* open", "@#$", "1 2 3", "}}}"};
    for (const char* input : inputs) {
        Diagnostics diags;
        auto toks = scan("<input>", input, diags);
        REQUIRE_FALSE(toks.empty());
        REQUIRE(toks.back().kind == TokenKind::Eof);
        std::size_t eofs = 0;
        for (const auto& t : toks) {
            if (t.kind == TokenKind::Eof) ++eofs;
        }
        REQUIRE(eofs == 1);
    }
}

// ===== Keywords and identifiers =====

TEST_CASE("keywords are exact matches", "[scanner]") {
    auto toks = scan_ok("if iffy else return for while var ref fun new struct");
    REQUIRE(toks[0].kind == TokenKind::KwIf);
    REQUIRE(toks[1].kind == TokenKind::Identifier);
    REQUIRE(toks[1].text() == "iffy");
    REQUIRE(toks[2].kind == TokenKind::KwElse);
    REQUIRE(toks[3].kind == TokenKind::KwReturn);
    REQUIRE(toks[4].kind == TokenKind::KwFor);
    REQUIRE(toks[5].kind == TokenKind::KwWhile);
    REQUIRE(toks[6].kind == TokenKind::KwVar);
    REQUIRE(toks[7].kind == TokenKind::KwRef);
    REQUIRE(toks[8].kind == TokenKind::KwFun);
    REQUIRE(toks[9].kind == TokenKind::KwNew);
    REQUIRE(toks[10].kind == TokenKind::KwStruct);
}

TEST_CASE("continue scans as the break kind", "[scanner]") {
    auto toks = scan_ok("break continue");
    REQUIRE(toks[0].kind == TokenKind::KwBreak);
    REQUIRE(toks[1].kind == TokenKind::KwBreak);
    REQUIRE(toks[1].text() == "continue");
}

TEST_CASE("primitive type keywords", "[scanner]") {
    auto toks = scan_ok("byte short ushort int uint long ulong float double bool void string");
    std::vector<TokenKind> expected = {
        TokenKind::KwByte, TokenKind::KwShort, TokenKind::KwUShort,
        TokenKind::KwInt, TokenKind::KwUInt, TokenKind::KwLong,
        TokenKind::KwULong, TokenKind::KwFloat, TokenKind::KwDouble,
        TokenKind::KwBool, TokenKind::KwVoid, TokenKind::KwString,
        TokenKind::Eof};
    REQUIRE(kinds_of(toks) == expected);
}

TEST_CASE("keyword table is exposed", "[scanner]") {
    auto& kws = keywords();
    REQUIRE(kws.at("true") == TokenKind::KwTrue);
    REQUIRE(kws.at("continue") == TokenKind::KwBreak);
    REQUIRE(kws.count("iffy") == 0);
}

TEST_CASE("identifiers mix letters and digits", "[scanner]") {
    auto toks = scan_ok("x1 Point3D abc");
    REQUIRE(toks[0].kind == TokenKind::Identifier);
    REQUIRE(toks[0].text() == "x1");
    REQUIRE(toks[1].text() == "Point3D");
    REQUIRE(toks[2].text() == "abc");
}

// ===== Operators =====

TEST_CASE("one and two character operators", "[scanner]") {
    auto toks = scan_ok("+ ++ += - -- -= * *= / /= ! != = == < <= << > >= >> & && | || ^ % ~");
    std::vector<TokenKind> expected = {
        TokenKind::Plus, TokenKind::PlusPlus, TokenKind::PlusEq,
        TokenKind::Minus, TokenKind::MinusMinus, TokenKind::MinusEq,
        TokenKind::Star, TokenKind::StarEq, TokenKind::Slash, TokenKind::SlashEq,
        TokenKind::Bang, TokenKind::NotEq, TokenKind::Assign, TokenKind::EqEq,
        TokenKind::Less, TokenKind::LessEq, TokenKind::LShift,
        TokenKind::Greater, TokenKind::GreaterEq, TokenKind::RShift,
        TokenKind::Ampersand, TokenKind::LogAnd, TokenKind::Pipe, TokenKind::LogOr,
        TokenKind::Caret, TokenKind::Percent, TokenKind::Tilde,
        TokenKind::Eof};
    REQUIRE(kinds_of(toks) == expected);
}

TEST_CASE("punctuation", "[scanner]") {
    auto toks = scan_ok("{}()[],.;");
    std::vector<TokenKind> expected = {
        TokenKind::LBrace, TokenKind::RBrace, TokenKind::LParen, TokenKind::RParen,
        TokenKind::LBracket, TokenKind::RBracket, TokenKind::Comma, TokenKind::Dot,
        TokenKind::Semicolon, TokenKind::Eof};
    REQUIRE(kinds_of(toks) == expected);
}

// ===== Numeric literals =====

TEST_CASE("integer literal suffixes", "[scanner]") {
    auto toks = scan_ok("123 123L 123u 123uL 123UL");
    REQUIRE(toks[0].kind == TokenKind::IntLiteral);
    REQUIRE(std::get<int32_t>(toks[0].value) == 123);
    REQUIRE(toks[1].kind == TokenKind::LongLiteral);
    REQUIRE(std::get<int64_t>(toks[1].value) == 123);
    REQUIRE(toks[2].kind == TokenKind::UIntLiteral);
    REQUIRE(std::get<uint32_t>(toks[2].value) == 123u);
    REQUIRE(toks[3].kind == TokenKind::ULongLiteral);
    REQUIRE(std::get<uint64_t>(toks[3].value) == 123u);
    REQUIRE(toks[4].kind == TokenKind::ULongLiteral);
    REQUIRE(toks[4].text() == "123UL");
}

TEST_CASE("floating literals", "[scanner]") {
    auto toks = scan_ok("1.5 1.5f 2e3 2.5E-1F");
    REQUIRE(toks[0].kind == TokenKind::DoubleLiteral);
    REQUIRE(std::get<double>(toks[0].value) == 1.5);
    REQUIRE(toks[1].kind == TokenKind::FloatLiteral);
    REQUIRE(std::get<float>(toks[1].value) == 1.5f);
    REQUIRE(toks[2].kind == TokenKind::DoubleLiteral);
    REQUIRE(std::get<double>(toks[2].value) == 2000.0);
    REQUIRE(toks[3].kind == TokenKind::FloatLiteral);
    REQUIRE(std::get<float>(toks[3].value) == 0.25f);
}

TEST_CASE("hex literals", "[scanner]") {
    auto toks = scan_ok("0x1F 0xffL 0X10u");
    REQUIRE(toks[0].kind == TokenKind::IntLiteral);
    REQUIRE(std::get<int32_t>(toks[0].value) == 31);
    REQUIRE(toks[1].kind == TokenKind::LongLiteral);
    REQUIRE(std::get<int64_t>(toks[1].value) == 255);
    REQUIRE(toks[2].kind == TokenKind::UIntLiteral);
    REQUIRE(std::get<uint32_t>(toks[2].value) == 16u);
}

TEST_CASE("hex literals wrap into the signed range", "[scanner]") {
    auto toks = scan_ok("0xFFFFFFFF 0xFFFFFFFFFFFFFFFFL");
    REQUIRE(std::get<int32_t>(toks[0].value) == -1);
    REQUIRE(std::get<int64_t>(toks[1].value) == -1);
}

TEST_CASE("dot after an integer is member access", "[scanner]") {
    auto toks = scan_ok("1.x");
    REQUIRE(toks[0].kind == TokenKind::IntLiteral);
    REQUIRE(toks[1].kind == TokenKind::Dot);
    REQUIRE(toks[2].kind == TokenKind::Identifier);
}

TEST_CASE("out of range integer is reported", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "2147483648 2147483647", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message == "Failed to parse int 2147483648");
    REQUIRE(toks.size() == 2);
    REQUIRE(std::get<int32_t>(toks[0].value) == 2147483647);
}

TEST_CASE("out of range unsigned and long are reported", "[scanner]") {
    Diagnostics diags;
    scan("<input>", "4294967296u 9223372036854775808L 18446744073709551616UL", diags);
    REQUIRE(diags.size() == 3);
    REQUIRE(diags.entries()[0].message == "Failed to parse uint 4294967296u");
    REQUIRE(diags.entries()[1].message == "Failed to parse long 9223372036854775808L");
    REQUIRE(diags.entries()[2].message.find("Failed to parse ulong") == 0);
}

TEST_CASE("exponent without digits is reported", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "1e+", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message == "Failed to parse double 1e+");
    REQUIRE(toks.size() == 1);
}

TEST_CASE("hex prefix without digits is reported", "[scanner]") {
    Diagnostics diags;
    scan("<input>", "0x", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message == "Failed to parse int 0x");
}

// ===== Strings and comments =====

TEST_CASE("string literal keeps its quotes and raw contents", "[scanner]") {
    auto toks = scan_ok(R"("a\nb" "multi
line")");
    REQUIRE(toks[0].kind == TokenKind::StringLiteral);
    REQUIRE(toks[0].text() == R"("a\nb")");
    REQUIRE(toks[1].kind == TokenKind::StringLiteral);
    REQUIRE(toks[1].pos.line == 1);
}

TEST_CASE("unterminated string", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "\"abc", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message ==
            "Unterminated string. Expected \", but reached end of file.");
    REQUIRE(diags.entries()[0].line == 1);
    REQUIRE(diags.entries()[0].col == 1);
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].kind == TokenKind::Eof);
}

TEST_CASE("line and block comments become tokens", "[scanner]") {
    auto toks = scan_ok("a // tail\n/* multi\nline */ b");
    REQUIRE(toks[1].kind == TokenKind::Comment);
    REQUIRE(toks[1].text() == "// tail");
    REQUIRE(toks[2].kind == TokenKind::Comment);
    REQUIRE(toks[2].text() == "/* multi\nline */");
    REQUIRE(toks[3].text() == "b");
    REQUIRE(toks[3].pos.line == 3);
}

TEST_CASE("unterminated block comment", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "x /* never ends", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message ==
            "Unterminated multi-line comment. Expected */, but reached end of file.");
    REQUIRE(diags.entries()[0].col == 3);
    REQUIRE(kinds_of(toks) == std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Eof});
}

// ===== Errors and positions =====

TEST_CASE("unexpected characters are reported and skipped", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("f.sn", "a @ b", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(diags.entries()[0].message == "Unexpected character \"@\".");
    REQUIRE(diags.formatted()[0] == "Parse error at f.sn:1,3 - Unexpected character \"@\".");
    REQUIRE(kinds_of(toks) == std::vector<TokenKind>{
        TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof});
}

TEST_CASE("underscore is not an identifier character", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "a_b", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(toks.size() == 3);
}

TEST_CASE("multi-byte characters are reported once", "[scanner]") {
    Diagnostics diags;
    auto toks = scan("<input>", "\xC3\xA9 x", diags);
    REQUIRE(diags.size() == 1);
    REQUIRE(toks[0].text() == "x");
    REQUIRE(toks[0].pos.col == 3);
}

TEST_CASE("positions track lines and columns", "[scanner]") {
    auto toks = scan_ok("int x;\n  return x;");
    REQUIRE(toks[0].pos.line == 1);
    REQUIRE(toks[0].pos.col == 1);
    REQUIRE(toks[1].pos.col == 5);
    REQUIRE(toks[3].pos.line == 2);
    REQUIRE(toks[3].pos.col == 3);
    REQUIRE(toks[4].pos.col == 10);
}

TEST_CASE("scan fixture with lexical errors keeps going", "[scanner]") {
    auto r = SourceFile::load(fixture_dir() + "/lex_errors.sn");
    REQUIRE(r.is_ok());
    auto& file = r.value();
    Diagnostics diags;
    auto toks = scan(file.name, file.view(), diags);
    REQUIRE(diags.size() == 2);
    REQUIRE(diags.entries()[0].line == 2);
    REQUIRE(diags.entries()[1].line == 3);
    REQUIRE(toks.back().kind == TokenKind::Eof);
}

TEST_CASE("token_kind_name", "[scanner]") {
    REQUIRE(std::string(token_kind_name(TokenKind::KwInt)) == "int");
    REQUIRE(std::string(token_kind_name(TokenKind::KwTrue)) == "true");
    REQUIRE(is_builtin_type(TokenKind::KwBool));
    REQUIRE_FALSE(is_builtin_type(TokenKind::KwVoid));
    REQUIRE(is_literal(TokenKind::KwFalse));
    REQUIRE(is_literal(TokenKind::StringLiteral));
    REQUIRE_FALSE(is_literal(TokenKind::Identifier));
}
